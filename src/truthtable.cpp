#include <iostream>
#include <span>
#include <string>
#include <nlohmann/json.hpp>
#include <check/truthtable.hpp>
#include <core/formula.hpp>

using std::cout, std::cerr, std::endl;
using namespace curry;

// Usage: `truthtable [indent]`
// Prints the truth table of every connective as a JSON object.
auto main(int argc, char* argv[]) -> int {
  auto const args = std::span(argv, static_cast<size_t>(argc));
  auto indent = 2;
  if (args.size() > 1) {
    try {
      indent = std::stoi(args[1]);
    } catch (std::exception const& e) {
      cerr << "Invalid indent \"" << args[1] << "\": " << e.what() << endl;
      return 1;
    }
  }

  auto pool = Allocator<core::Formula>();
  cout << check::tables(pool).dump(indent) << endl;
  return 0;
}
