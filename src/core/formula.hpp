// Core :: Formula, reify

#ifndef CURRY_CORE_FORMULA_HPP
#define CURRY_CORE_FORMULA_HPP

#include <cstdint>
#include <string>
#include <typeinfo>
#include <utility>
#include <nlohmann/json_fwd.hpp>
#include <common.hpp>
#include "prop.hpp"

namespace curry::core {
#include "macros_open.hpp"

  // Runtime mirror of a proposition type.
  // Immutable.
  // Pre (for all methods): there is no "cycle" throughout the tree / DAG
  // Pre & invariant (for all methods): all pointers (in the "active variant") are valid
  // Negation and biconditional have no tags of their own: `Not<P>` is `P -> false`, and `Equal<P, Q>`
  //   is `(P -> Q) and (Q -> P)`, exactly as in the connective layer.
  class Formula {
  public:
    // clang-format off
    enum class Tag: std::uint32_t { Literal, Atom, And, Or, Implies }; using enum Tag;

    Tag const tag;
    union {
      struct { bool const value; } literal; // Literal, Atom
      struct { Formula const *l, *r; } binary; // And, Or, Implies
    };
    // Kept outside the union, so the implicit destructor handles it (no hand-written union destructor needed).
    std::string const name; // Atom
    // clang-format on

    explicit Formula(bool value):
        tag(Literal),
        literal{value} {}

    Formula(std::string name, bool value):
        tag(Atom),
        literal{value},
        name(std::move(name)) {}

    Formula(Tag tag, Formula const* l, Formula const* r):
        tag(tag),
        binary{l, r} {
      switch (tag) {
        case And:
        case Or:
        case Implies:
          return;
        default:
          unreachable;
      }
    }

    Formula(Formula const&) = delete;
    Formula(Formula&&) = delete;
    auto operator=(Formula const&) -> Formula& = delete;
    auto operator=(Formula&&) -> Formula& = delete;

    // Structural evaluation.
    // O(size)
    auto truth() const noexcept -> bool;

    // Syntactical equality.
    // O(size)
    auto operator==(Formula const& rhs) const noexcept -> bool;
    auto operator!=(Formula const& rhs) const noexcept -> bool {
      return !(*this == rhs);
    }

    // Returns the number of nodes.
    auto size() const noexcept -> size_t;

    // `P -> false`
    auto isNegation() const noexcept -> bool;

    // `(P -> Q) and (Q -> P)`
    auto isBiconditional() const noexcept -> bool;

    // Print, using `not` and `<->` where the shape allows.
    // O(size)
    auto toString() const -> std::string;

    // Serialise as a tree of JSON objects, keyed by "tag".
    auto toJson() const -> nlohmann::json;
  };

  // A thread-local temporary allocator instance for `Formula`
  // Should be cleared only by outermost level code
  inline auto temp() -> Allocator<Formula>& {
    thread_local Allocator<Formula> pool;
    return pool;
  }

  // Name of a user-supplied atomic proposition: `P::name()` if it exists, otherwise the type name.
  template <typename P>
  auto atomName() -> std::string {
    if constexpr (requires { { P::name() } -> std::convertible_to<std::string>; })
      return P::name();
    else
      return typeid(P).name();
  }

  // Builds formulas for proposition types (lifetime bounded by `pool`).
  // Does not construct evidence.
  template <typename P>
  struct Reify {
    static auto make(Allocator<Formula>& pool) -> Formula const* {
      return pool.make(atomName<P>(), P::truth());
    }
  };

  template <bool B>
  struct Reify<Bool<B>> {
    static auto make(Allocator<Formula>& pool) -> Formula const* {
      return pool.make(B);
    }
  };

  template <Prop A, Prop B>
  struct Reify<And<A, B>> {
    static auto make(Allocator<Formula>& pool) -> Formula const* {
      using enum Formula::Tag; // These are needed to avoid ICE on gcc...
      return pool.make(And, Reify<A>::make(pool), Reify<B>::make(pool));
    }
  };

  template <Prop L, Prop R>
  struct Reify<Or<L, R>> {
    static auto make(Allocator<Formula>& pool) -> Formula const* {
      using enum Formula::Tag; // These are needed to avoid ICE on gcc...
      return pool.make(Or, Reify<L>::make(pool), Reify<R>::make(pool));
    }
  };

  template <Prop P, Prop Q>
  struct Reify<Imply<P, Q>> {
    static auto make(Allocator<Formula>& pool) -> Formula const* {
      using enum Formula::Tag; // These are needed to avoid ICE on gcc...
      return pool.make(Implies, Reify<P>::make(pool), Reify<Q>::make(pool));
    }
  };

  template <Prop P>
  auto reify(Allocator<Formula>& pool) -> Formula const* {
    return Reify<P>::make(pool);
  }

#include "macros_close.hpp"
}

#endif // CURRY_CORE_FORMULA_HPP
