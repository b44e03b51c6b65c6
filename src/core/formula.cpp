#include "formula.hpp"
#include <nlohmann/json.hpp>

using std::string;
using nlohmann::json;

namespace curry::core {
#include "macros_open.hpp"

  auto Formula::truth() const noexcept -> bool {
    switch (tag) {
      case Literal:
      case Atom:
        return literal.value;
      case And:
        return binary.l->truth() && binary.r->truth();
      case Or:
        return binary.l->truth() || binary.r->truth();
      case Implies:
        return !binary.l->truth() || binary.r->truth();
    }
    unreachable;
  }

  auto Formula::operator==(Formula const& rhs) const noexcept -> bool {
    if (this == &rhs)
      return true;
    if (tag != rhs.tag)
      return false;
    switch (tag) {
      case Literal:
        return literal.value == rhs.literal.value;
      case Atom:
        return literal.value == rhs.literal.value && name == rhs.name;
      case And:
      case Or:
      case Implies:
        return *binary.l == *rhs.binary.l && *binary.r == *rhs.binary.r;
    }
    unreachable;
  }

  auto Formula::size() const noexcept -> size_t {
    switch (tag) {
      case Literal:
      case Atom:
        return 1;
      case And:
      case Or:
      case Implies:
        return binary.l->size() + binary.r->size() + 1;
    }
    unreachable;
  }

  auto Formula::isNegation() const noexcept -> bool {
    return tag == Implies && binary.r->tag == Literal && !binary.r->literal.value;
  }

  auto Formula::isBiconditional() const noexcept -> bool {
    if (tag != And || binary.l->tag != Implies || binary.r->tag != Implies)
      return false;
    auto const fwd = binary.l, bwd = binary.r;
    return *fwd->binary.l == *bwd->binary.r && *fwd->binary.r == *bwd->binary.l;
  }

  auto Formula::toString() const -> string {
    // Compound subformulas are always parenthesised.
    auto const sub = [](Formula const* e) -> string {
      if (e->tag == Literal || e->tag == Atom)
        return e->toString();
      return "(" + e->toString() + ")";
    };
    switch (tag) {
      case Literal:
        return literal.value ? "true" : "false";
      case Atom:
        return name;
      case And:
        if (isBiconditional())
          return sub(binary.l->binary.l) + " <-> " + sub(binary.l->binary.r);
        return sub(binary.l) + " and " + sub(binary.r);
      case Or:
        return sub(binary.l) + " or " + sub(binary.r);
      case Implies:
        if (isNegation())
          return "not " + sub(binary.l);
        return sub(binary.l) + " -> " + sub(binary.r);
    }
    unreachable;
  }

  auto Formula::toJson() const -> json {
    switch (tag) {
      case Literal:
        return {{"tag", "literal"}, {"value", literal.value}};
      case Atom:
        return {{"tag", "atom"}, {"name", name}, {"value", literal.value}};
      case And:
        return {{"tag", "and"}, {"left", binary.l->toJson()}, {"right", binary.r->toJson()}};
      case Or:
        return {{"tag", "or"}, {"left", binary.l->toJson()}, {"right", binary.r->toJson()}};
      case Implies:
        return {{"tag", "implies"}, {"left", binary.l->toJson()}, {"right", binary.r->toJson()}};
    }
    unreachable;
  }

#include "macros_close.hpp"
}
