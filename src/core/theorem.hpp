// Core :: andComm, orComm, doubleNegation*, contraposition*, materialImplication*

#ifndef CURRY_CORE_THEOREM_HPP
#define CURRY_CORE_THEOREM_HPP

#include "axiom.hpp"
#include "prop.hpp"

// Each theorem is a function whose signature is the statement and whose body is the proof.
// The classical ones rely on `excludedMiddle`, and so are valid only as type-checked certificates:
//   executing them terminates through the postulate.
namespace curry::core {

  template <Prop A, Prop B>
  auto andComm(And<A, B> const& h) -> And<B, A> {
    return {h.right(), h.left()};
  }

  template <Prop L, Prop R>
  auto orComm(Or<L, R> const& h) -> Or<R, L> {
    using Res = Or<R, L>;
    return h.match([](L const& l) { return Res::inr(l); }, [](R const& r) { return Res::inl(r); });
  }

  template <Prop P>
  auto doubleNegationIntroduction(P p) -> Not<Not<P>> {
    return [p](Not<P> np) -> False { return np(p); };
  }

  template <Prop P>
  auto doubleNegationElimination(Not<Not<P>> nnp) -> P {
    return excludedMiddle<P>().match(
      [](P const& p) -> P { return p; },
      [&nnp](Not<P> const& np) -> P { return exfalso<P>(nnp(np)); }
    );
  }

  template <Prop P>
  auto doubleNegation() -> Equal<P, Not<Not<P>>> {
    return {
      [](P p) { return doubleNegationIntroduction<P>(std::move(p)); },
      [](Not<Not<P>> nnp) { return doubleNegationElimination<P>(std::move(nnp)); },
    };
  }

  // (P -> Q) -> (not Q -> not P)
  template <Prop P, Prop Q>
  auto contrapositionForward(Imply<P, Q> h) -> Imply<Not<Q>, Not<P>> {
    return [h](Not<Q> nq) -> Not<P> {
      return [h, nq](P p) -> False { return nq(h(std::move(p))); };
    };
  }

  // (not Q -> not P) -> (P -> Q)
  template <Prop P, Prop Q>
  auto contrapositionReverse(Imply<Not<Q>, Not<P>> h) -> Imply<P, Q> {
    return [h](P p) -> Q {
      return excludedMiddle<Q>().match(
        [](Q const& q) -> Q { return q; },
        [&h, &p](Not<Q> const& nq) -> Q { return exfalso<Q>(h(nq)(p)); }
      );
    };
  }

  template <Prop P, Prop Q>
  auto contraposition() -> Equal<Imply<P, Q>, Imply<Not<Q>, Not<P>>> {
    return {
      [](Imply<P, Q> h) { return contrapositionForward<P, Q>(std::move(h)); },
      [](Imply<Not<Q>, Not<P>> h) { return contrapositionReverse<P, Q>(std::move(h)); },
    };
  }

  // (P -> Q) -> (not P or Q)
  template <Prop P, Prop Q>
  auto materialImplicationForward(Imply<P, Q> h) -> Or<Not<P>, Q> {
    using Res = Or<Not<P>, Q>;
    return excludedMiddle<P>().match(
      [&h](P const& p) { return Res::inr(h(p)); },
      [](Not<P> const& np) { return Res::inl(np); }
    );
  }

  // (not P or Q) -> (P -> Q)
  // Constructive when the disjunction holds `Q`.
  template <Prop P, Prop Q>
  auto materialImplicationReverse(Or<Not<P>, Q> h) -> Imply<P, Q> {
    return [h](P p) -> Q {
      return h.match(
        [&p](Not<P> const& np) -> Q { return exfalso<Q>(np(p)); },
        [](Q const& q) -> Q { return q; }
      );
    };
  }

  template <Prop P, Prop Q>
  auto materialImplication() -> Equal<Imply<P, Q>, Or<Not<P>, Q>> {
    return {
      [](Imply<P, Q> h) { return materialImplicationForward<P, Q>(std::move(h)); },
      [](Or<Not<P>, Q> h) { return materialImplicationReverse<P, Q>(std::move(h)); },
    };
  }

}

#endif // CURRY_CORE_THEOREM_HPP
