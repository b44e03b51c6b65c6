#ifndef CURRY_CORE_HPP
#define CURRY_CORE_HPP

// The `core` folder contains the propositions-as-types proof system:

#include "core/prop.hpp"    // Prop, Bool, True, False, And, Or, Imply, Not, Equal
#include "core/formula.hpp" // Formula, reify, temp
#include "core/axiom.hpp"   // AxiomInvoked, axiom, sorry, exfalso, excludedMiddle
#include "core/theorem.hpp" // andComm, orComm, doubleNegation*, contraposition*, materialImplication*

#endif // CURRY_CORE_HPP
