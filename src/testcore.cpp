#include <iostream>
#include <string>
#include <type_traits>
#include <utility>
#include <nlohmann/json.hpp>
#include "core.hpp"

using std::string;
using std::cout, std::endl;
using nlohmann::json;
using namespace curry;
using namespace curry::core;

#include "macros_open.hpp"

// A user-supplied atomic proposition, with a proof.
struct Raining {
  static constexpr auto truth() noexcept -> bool {
    return true;
  }
  static auto name() -> string {
    return "raining";
  }
};

// An atomic proposition without a name.
struct Opaque {
  static constexpr auto truth() noexcept -> bool {
    return false;
  }
};

// Identity on `false`.
auto const notFalse = Not<False>([](False f) { return f; });

// Evidence can only take the shape its proposition claims.
static_assert(Prop<True> && Prop<False> && Prop<Raining> && Prop<Opaque>);
static_assert(Prop<Equal<Or<True, Raining>, Not<And<False, Opaque>>>>);
static_assert(!Prop<int> && !Prop<string>);
static_assert(std::is_default_constructible_v<True>);
static_assert(std::is_default_constructible_v<False>);
static_assert(std::is_same_v<decltype(exfalso<Raining>(False())), Raining>);
static_assert(!std::is_constructible_v<And<True, True>, True>);
static_assert(!std::is_constructible_v<And<True, Raining>, Raining, True>);
static_assert(!std::is_constructible_v<Or<True, Raining>, True>);
static_assert(!std::is_constructible_v<Or<True, Raining>, Raining>);
static_assert(std::is_constructible_v<Imply<True, True>, decltype([](True t) { return t; })>);
static_assert(!std::is_constructible_v<Imply<True, False>, decltype([](True t) { return t; })>);
static_assert(!std::is_constructible_v<Imply<True, True>, decltype([](Raining) { return True(); })>);
static_assert(!std::is_constructible_v<Imply<True, True>, int>);

// Theorem statements.
static_assert(std::is_same_v<decltype(andComm(std::declval<And<True, Raining>>())), And<Raining, True>>);
static_assert(std::is_same_v<decltype(orComm(std::declval<Or<True, Raining>>())), Or<Raining, True>>);
static_assert(std::is_same_v<decltype(doubleNegation<Raining>()), Equal<Raining, Not<Not<Raining>>>>);
static_assert(std::is_same_v<
              decltype(contraposition<True, Opaque>()),
              Equal<Imply<True, Opaque>, Imply<Not<Opaque>, Not<True>>>>);
static_assert(std::is_same_v<
              decltype(materialImplication<True, Opaque>()),
              Equal<Imply<True, Opaque>, Or<Not<True>, Opaque>>>);

// Double negation round trip: introduction then elimination gives back the original proposition.
template <Prop P>
using RoundTrip = decltype(doubleNegationElimination<P>(doubleNegationIntroduction(std::declval<P>())));
static_assert(std::is_same_v<RoundTrip<True>, True> && std::is_same_v<RoundTrip<False>, False>);
static_assert(std::is_same_v<RoundTrip<Or<Raining, Opaque>>, Or<Raining, Opaque>>);
static_assert(RoundTrip<Opaque>::truth() == Opaque::truth());

// Every theorem states a tautology.
static_assert(Equal<Raining, Not<Not<Raining>>>::truth() && Equal<Opaque, Not<Not<Opaque>>>::truth());
static_assert(Equal<Imply<True, Opaque>, Imply<Not<Opaque>, Not<True>>>::truth());
static_assert(Equal<Imply<Opaque, False>, Or<Not<Opaque>, False>>::truth());

auto testConnectives() -> void {
  cout << "Connectives" << endl;

  auto const rt = And<Raining, True>(Raining(), True());
  auto const tr = andComm(rt);
  auto const rt1 = andComm(tr);
  static_assert(std::is_same_v<decltype(rt1), And<Raining, True> const>);
  assert(decltype(tr)::truth() == decltype(rt)::truth());

  // Nested conjunctions keep their components.
  auto const nested = And<And<True, Raining>, Not<False>>(And<True, Raining>(True(), Raining()), notFalse);
  auto const swapped = andComm(nested);
  auto const inner = andComm(swapped.right());
  static_assert(std::is_same_v<decltype(inner), And<Raining, True> const>);

  // A disjunction holds exactly one side.
  auto const l = Or<True, Raining>::inl(True());
  auto const r = Or<True, Raining>::inr(Raining());
  assert(l.isLeft() && !l.isRight());
  assert(r.isRight() && !r.isLeft());

  // Sides are told apart by position, not by type.
  auto const same = Or<True, True>::inr(True());
  assert(same.isRight() && !same.isLeft());
  assert(same.match([](True) { return 0; }, [](True) { return 1; }) == 1);

  auto const l1 = orComm(l);
  assert(l1.isRight());
  assert(orComm(l1).isLeft());
  auto const r1 = orComm(r);
  assert(r1.isLeft());
  assert(orComm(r1).isRight());
  assert(decltype(l1)::truth() == decltype(l)::truth());

  // Implications are ordinary function calls.
  auto const f = Imply<Raining, And<Raining, Raining>>([](Raining x) { return And<Raining, Raining>(x, x); });
  auto const rr = f(Raining());
  static_assert(std::is_same_v<decltype(rr), And<Raining, Raining> const>);
  auto const g = f;
  (void)g(Raining()).left();
  auto const ff = notFalse;
  static_assert(std::is_same_v<decltype(ff), Not<False> const>);
}

auto testConstructiveTheorems() -> void {
  cout << "Constructive theorems" << endl;

  // Double negation introduction runs without postulates.
  auto const nnt = doubleNegationIntroduction(True());
  static_assert(std::is_same_v<decltype(nnt), Not<Not<True>> const>);
  assert(decltype(nnt)::truth());
  auto const nnnf = doubleNegationIntroduction(notFalse);
  assert(decltype(nnnf)::truth());

  auto const dn = doubleNegation<True>();
  auto const nnt1 = dn.left()(True());
  assert(decltype(nnt1)::truth());

  // Contraposition of the identity on `false`, applied to a proof of `not false`.
  auto const id = Imply<False, False>([](False f) { return f; });
  auto const cf = contrapositionForward(id);
  static_assert(std::is_same_v<decltype(cf), Imply<Not<False>, Not<False>> const>);
  auto const nf = cf(notFalse);
  static_assert(std::is_same_v<decltype(nf), Not<False> const>);
  auto const nf1 = contraposition<False, False>().left()(id)(notFalse);
  assert(decltype(nf1)::truth());

  // Contraposition with a proof of `true -> raining`.
  auto const h = Imply<True, Raining>([](True) { return Raining(); });
  auto const ch = contrapositionForward(h);
  static_assert(std::is_same_v<decltype(ch), Imply<Not<Raining>, Not<True>> const>);
  assert(decltype(ch)::truth());

  // Material implication in reverse only needs the right side to be proven.
  auto const mir = materialImplicationReverse(Or<Not<True>, Raining>::inr(Raining()));
  auto const rain = mir(True());
  static_assert(std::is_same_v<decltype(rain), Raining const>);

  auto const mi = materialImplication<True, True>();
  auto const tt = mi.right()(Or<Not<True>, True>::inr(True()));
  (void)tt(True());
  assert(decltype(mi)::truth());
}

auto testFormula() -> void {
  cout << "Formula" << endl;
  auto pool = Allocator<Formula>();

  auto const p = reify<Or<Raining, Not<Raining>>>(pool);
  cout << p->toString() << endl;
  assert(p->toString() == "raining or (not raining)");
  assert(p->tag == Formula::Or);
  assert(p->binary.r->isNegation());
  assert(!p->binary.l->isNegation());
  assert(p->size() == 5);
  assert(p->truth());

  auto const q = reify<Equal<True, False>>(pool);
  cout << q->toString() << endl;
  assert(q->isBiconditional());
  assert(q->toString() == "true <-> false");
  assert(!q->truth());

  auto const r = reify<Imply<And<True, False>, Or<False, True>>>(pool);
  assert(r->toString() == "(true and false) -> (false or true)");
  assert(!r->isNegation() && !r->isBiconditional());

  // A conjunction of implications that do not mirror each other is not a biconditional.
  auto const s = reify<And<Imply<True, False>, Imply<True, False>>>(pool);
  assert(!s->isBiconditional());
  assert(s->toString() == "(not true) and (not true)");

  auto const e = reify<Equal<Raining, Not<Not<Raining>>>>(pool);
  assert(e->toString() == "raining <-> (not (not raining))");
  assert(e->truth());

  // Unnamed atoms still print.
  assert(!reify<Opaque>(pool)->toString().empty());
  assert(!reify<Opaque>(pool)->truth());

  // Structural equality
  assert((*reify<Not<Raining>>(pool) == *reify<Imply<Raining, False>>(pool)));
  assert(*reify<Not<Raining>>(pool) != *reify<Not<True>>(pool));
  assert((*reify<And<True, False>>(pool) != *reify<Or<True, False>>(pool)));

  auto const j = reify<Not<True>>(pool)->toJson();
  cout << j.dump() << endl;
  assert(j == json::parse(R"({"tag": "implies", "left": {"tag": "literal", "value": true}, "right": {"tag": "literal", "value": false}})"));
  auto const k = reify<And<Raining, Opaque>>(pool)->toJson();
  assert(k["tag"] == "and");
  assert(k["left"] == json::parse(R"({"tag": "atom", "name": "raining", "value": true})"));
  assert(k["right"]["tag"] == "atom" && k["right"]["value"] == false);
}

// Structural evaluation agrees with the truth value of the type.
template <Prop P>
auto agrees() -> bool {
  return reify<P>(temp())->truth() == P::truth();
}

auto testAgreement() -> void {
  cout << "Agreement" << endl;
  assert(agrees<Raining>() && agrees<Opaque>());
  assert((agrees<And<Raining, Opaque>>()));
  assert((agrees<Or<Opaque, Not<Raining>>>()));
  assert((agrees<Imply<Or<True, Opaque>, And<Opaque, False>>>()));
  assert((agrees<Equal<Not<Opaque>, Imply<Raining, Or<Opaque, Not<Not<Raining>>>>>>()));
  assert((agrees<Equal<Imply<True, Opaque>, Or<Not<True>, Opaque>>>()));
  assert((agrees<Or<Raining, Not<Raining>>>()));
  temp().reset();
}

auto main() -> int {
  testConnectives();
  testConstructiveTheorems();
  testFormula();
  testAgreement();
  cout << "All passed" << endl;
  return 0;
}
