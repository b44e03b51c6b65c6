// Core :: AxiomInvoked, axiom, sorry, exfalso, excludedMiddle

#ifndef CURRY_CORE_AXIOM_HPP
#define CURRY_CORE_AXIOM_HPP

#include <source_location>
#include <stdexcept>
#include <string>
#include "formula.hpp"
#include "prop.hpp"

namespace curry::core {

  // Raised (and immediately handed to `std::terminate()`) when a postulate is executed.
  // Axioms only certify that a derivation is well-typed; running one would fabricate a witness.
  // Nothing catches this to recover: it exists so that a terminate handler can tell
  //   "a postulate was executed" apart from other failures.
  class AxiomInvoked: public std::logic_error {
  public:
    AxiomInvoked(std::string axiom, std::string proposition, std::source_location const& location);

    auto axiom() const -> std::string const& {
      return _axiom;
    }
    auto proposition() const -> std::string const& {
      return _proposition;
    }
    auto location() const -> std::source_location const& {
      return _location;
    }

  private:
    std::string _axiom;
    std::string _proposition;
    std::source_location _location;
  };

  // Writes the diagnostic to `std::cerr`, then terminates with `AxiomInvoked` being handled.
  [[noreturn]] auto invokeAxiom(char const* axiom, std::string const& proposition, std::source_location const& location)
    -> void;

  namespace detail {
    template <Prop P>
    [[noreturn]] auto postulate(char const* axiom, std::source_location const& location) -> P {
      auto const proposition = reify<P>(temp())->toString();
      invokeAxiom(axiom, proposition, location);
    }
  }

  // The foundational postulate: evidence of anything.
  // Fatal if executed.
  template <Prop P>
  [[noreturn]] auto axiom(std::source_location const& location = std::source_location::current()) -> P {
    detail::postulate<P>("axiom", location);
  }

  // Marks a proof obligation as accepted without proof.
  template <Prop P>
  [[deprecated("proof obligation accepted without proof"), noreturn]] auto
  sorry(std::source_location const& location = std::source_location::current()) -> P {
    axiom<P>(location);
  }

  // Principle of explosion.
  template <Prop P>
  [[noreturn]] auto exfalso(False, std::source_location const& location = std::source_location::current()) -> P {
    detail::postulate<P>("exfalso", location);
  }

  // Law of excluded middle. This is what makes the classical theorems type-check.
  template <Prop P>
  [[noreturn]] auto excludedMiddle(std::source_location const& location = std::source_location::current())
    -> Or<P, Not<P>> {
    detail::postulate<Or<P, Not<P>>>("excludedMiddle", location);
  }

}

#endif // CURRY_CORE_AXIOM_HPP
