// Core :: Prop, Bool, True, False, And, Or, Imply, Not, Equal

#ifndef CURRY_CORE_PROP_HPP
#define CURRY_CORE_PROP_HPP

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>
#include <variant>
#include <common.hpp>

namespace curry::core {

  // A proposition is a type with a compile-time truth value.
  // Values of the type are evidence (proofs) of the proposition.
  // `truth()` must be declared with an explicit `bool` return type, so that checking this concept
  // does not instantiate the body (truth values of nested propositions are only computed when queried).
  template <typename P>
  concept Prop = requires {
    { P::truth() } -> std::same_as<bool>;
  };

  // Literal propositions.
  // Both are constructible, so that postulates taking `False` can be called directly.
  template <bool B>
  class Bool {
  public:
    static constexpr auto truth() noexcept -> bool {
      return B;
    }
  };

  using True = Bool<true>;
  using False = Bool<false>;

  // Conjunction: evidence of both sides.
  template <Prop A, Prop B>
  class And {
  public:
    static constexpr auto truth() noexcept -> bool {
      return A::truth() && B::truth();
    }

    And(A a, B b):
        _a(std::move(a)),
        _b(std::move(b)) {}

    auto left() const -> A const& {
      return _a;
    }
    auto right() const -> B const& {
      return _b;
    }

  private:
    A _a;
    B _b;
  };

  // Disjunction: evidence of exactly one side, tagged by position (so `Or<P, P>` is fine).
  // Values are built only by `inl` and `inr`.
  template <Prop L, Prop R>
  class Or {
  public:
    static constexpr auto truth() noexcept -> bool {
      return L::truth() || R::truth();
    }

    static auto inl(L l) -> Or {
      return Or(std::in_place_index<0>, std::move(l));
    }
    static auto inr(R r) -> Or {
      return Or(std::in_place_index<1>, std::move(r));
    }

    auto isLeft() const noexcept -> bool {
      return _v.index() == 0;
    }
    auto isRight() const noexcept -> bool {
      return _v.index() == 1;
    }

    // Case analysis. Both branches must produce the same type.
    template <typename FL, typename FR>
    auto match(FL&& onLeft, FR&& onRight) const -> std::invoke_result_t<FL&, L const&> {
      static_assert(
        std::is_same_v<std::invoke_result_t<FL&, L const&>, std::invoke_result_t<FR&, R const&>>,
        "both branches of a disjunction must produce the same type"
      );
      if (_v.index() == 0)
        return std::invoke(onLeft, std::get<0>(_v));
      return std::invoke(onRight, std::get<1>(_v));
    }

  private:
    std::variant<L, R> _v;

    template <size_t I, typename T>
    Or(std::in_place_index_t<I> i, T&& x):
        _v(i, std::forward<T>(x)) {}
  };

  // Implication: a transformer from evidence of `P` to evidence of `Q`.
  // This is the only connective whose evidence is a procedure rather than passive data.
  // Any copyable callable works, provided that invoking it with `P` yields exactly `Q`.
  template <Prop P, Prop Q>
  class Imply {
  public:
    static constexpr auto truth() noexcept -> bool {
      return !P::truth() || Q::truth();
    }

    template <typename F>
      requires(!std::is_same_v<std::remove_cvref_t<F>, Imply>) && std::copy_constructible<F> &&
              std::is_same_v<std::invoke_result_t<F&, P>, Q>
    Imply(F f):
        _f(std::move(f)) {}

    auto operator()(P p) const -> Q {
      return _f(std::move(p));
    }

  private:
    std::function<Q(P)> _f;
  };

  // Negation: `P` implies `False`.
  template <Prop P>
  using Not = Imply<P, False>;

  // Biconditional: implications in both directions.
  template <Prop P, Prop Q>
  using Equal = And<Imply<P, Q>, Imply<Q, P>>;

}

#endif // CURRY_CORE_PROP_HPP
