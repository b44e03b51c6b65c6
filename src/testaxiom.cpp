#include <cstdlib>
#include <exception>
#include <functional>
#include <iostream>
#include <map>
#include <span>
#include <string>
#include "core.hpp"

using std::string;
using std::cout, std::cerr, std::endl;
using namespace curry;
using namespace curry::core;

// Executing a postulate must terminate with an identifiable cause.
// Usage: `testaxiom <case> <expected axiom>`
// Runs one case per process; the terminate handler exits with 0 only if `AxiomInvoked` for the expected
//   axiom is being handled.

namespace {
  string expected;

  [[noreturn]] auto onTerminate() -> void {
    if (auto const e = std::current_exception()) {
      try {
        std::rethrow_exception(e);
      } catch (AxiomInvoked const& ex) {
        cout << "Terminated by: " << ex.what() << " (line " << ex.location().line() << ")" << endl;
        if (ex.axiom() == expected) {
          cout << "Passed" << endl;
          std::_Exit(EXIT_SUCCESS);
        }
        cerr << "Expected axiom \"" << expected << "\", got \"" << ex.axiom() << "\"" << endl;
      } catch (std::exception const& ex) {
        cerr << "Terminated by an unrelated exception: " << ex.what() << endl;
      }
    } else {
      cerr << "Terminated without an active exception" << endl;
    }
    std::_Exit(EXIT_FAILURE);
  }

  struct Raining {
    static constexpr auto truth() noexcept -> bool {
      return true;
    }
    static auto name() -> string {
      return "raining";
    }
  };

  // A proof of `not true` can only come from a postulate.
  auto notTrue() -> Not<True> {
    return [](True) -> False { return axiom<False>(); };
  }

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
  auto const cases = std::map<string, std::function<void()>>{
    {"axiom", [] { (void)axiom<True>(); }},
    {"axiom_false", [] { (void)axiom<False>(); }},
    {"sorry", [] { (void)sorry<Raining>(); }},
    {"excluded_middle", [] { (void)excludedMiddle<Raining>(); }},
    {"exfalso", [] { (void)exfalso<Raining>(False()); }},
    {"exfalso_nested", [] { (void)exfalso<Raining>(axiom<False>()); }},
    {"double_negation_elimination",
     [] { (void)doubleNegationElimination<Raining>(doubleNegationIntroduction(Raining())); }},
    {"double_negation", [] { (void)doubleNegation<True>().right()(doubleNegationIntroduction(True())); }},
    {"contraposition_reverse",
     [] {
       auto const h = Imply<Not<Raining>, Not<True>>([](Not<Raining>) { return notTrue(); });
       (void)contrapositionReverse(h)(True());
     }},
    {"material_implication_forward",
     [] { (void)materialImplicationForward(Imply<Raining, Raining>([](Raining x) { return x; })); }},
    {"material_implication_reverse", [] { (void)materialImplicationReverse(Or<Not<True>, Raining>::inl(notTrue()))(True()); }},
  };
#pragma GCC diagnostic pop
}

auto main(int argc, char* argv[]) -> int {
  auto const args = std::span(argv, static_cast<size_t>(argc));
  if (args.size() != 3) {
    cerr << "Usage: testaxiom <case> <expected axiom>" << endl;
    return EXIT_FAILURE;
  }
  auto const it = cases.find(args[1]);
  if (it == cases.end()) {
    cerr << "Unknown case \"" << args[1] << "\"" << endl;
    return EXIT_FAILURE;
  }
  expected = args[2];
  std::set_terminate(onTerminate);

  // Constructing the statement of a classical theorem is harmless; only running it reaches a postulate.
  (void)contraposition<Raining, True>();
  (void)materialImplication<True, Raining>();

  it->second();
  cerr << "Case \"" << args[1] << "\" returned a value" << endl;
  return EXIT_FAILURE;
}
