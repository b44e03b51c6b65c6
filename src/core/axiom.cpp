#include "axiom.hpp"
#include <exception>
#include <iostream>

using std::string;

namespace curry::core {

  AxiomInvoked::AxiomInvoked(string axiom, string proposition, std::source_location const& location):
      std::logic_error("Axiom \"" + axiom + "\" was invoked for " + proposition),
      _axiom(std::move(axiom)),
      _proposition(std::move(proposition)),
      _location(location) {}

  auto invokeAxiom(char const* axiom, string const& proposition, std::source_location const& location) -> void {
    std::cerr << "Axiom \"" << axiom << "\" was invoked for " << proposition << ": " << location.file_name() << ":"
              << location.line() << ", at function " << location.function_name() << std::endl;
    // Terminate from inside the handler, so that `std::current_exception()` identifies the cause.
    try {
      throw AxiomInvoked(axiom, proposition, location);
    } catch (AxiomInvoked const&) {
      std::terminate();
    }
  }

}
