#ifndef CURRY_COMMON_HPP
#define CURRY_COMMON_HPP

#include <cstddef>
#include <exception>
#include <iostream>
#include <memory>
#include <utility>
#include <vector>
#undef assert

namespace curry {

  using std::size_t;

  // "Unreachable" mark.
  [[noreturn]] inline auto unreachable(char const* file, int line, char const* func) -> void {
    std::cerr << "\"Unreachable\" code was reached: " << file << ":" << line << ", at function " << func << std::endl;
    std::terminate();
  }

  // Assertion that remains present under non-debug configurations.
  inline auto assert(bool expr, char const* name, char const* file, int line, char const* func) -> void {
    if (!expr) {
      std::cerr << "Assertion failed: " << name << std::endl;
      unreachable(file, line, func);
    }
  }

  // A simple region-based memory allocator (uses larger blocks than `std::deque`).
  // This ensures that allocated objects stay in the same place, like in `std::deque`.
  template <typename T>
  class Allocator {
  public:
    static constexpr size_t defaultBlockSize = 1024uz;

    Allocator(size_t blockSize = defaultBlockSize):
        _blockSize(blockSize) {}

    ~Allocator() noexcept {
      _deallocateBlocks();
    }

    Allocator(Allocator const&) = delete;
    auto operator=(Allocator const&) -> Allocator& = delete;

    auto reset() -> void {
      _deallocateBlocks();
      _blocks.clear();
      _next = 0;
    }

    template <typename... Ts>
    auto make(Ts&&... args) -> T* {
      if (_next == 0)
        _blocks.push_back(_alloc.allocate(_blockSize));
      auto const res = _blocks.back() + _next;
      std::construct_at(res, std::forward<Ts>(args)...);
      _next++;
      if (_next >= _blockSize)
        _next = 0;
      return res;
    }

  private:
    size_t _blockSize;
    std::allocator<T> _alloc;
    std::vector<T*> _blocks;
    size_t _next = 0;

    auto _deallocateBlocks() -> void {
      for (auto i = 0uz; i < _blocks.size(); i++) {
        std::destroy_n(_blocks[i], (i + 1 == _blocks.size() && _next > 0) ? _next : _blockSize);
        _alloc.deallocate(_blocks[i], _blockSize);
      }
    }
  };

}

#endif // CURRY_COMMON_HPP
