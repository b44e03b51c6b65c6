#include <functional>
#include <iostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <check/truthtable.hpp>
#include <core/formula.hpp>
#include <core/prop.hpp>

using std::string;
using std::cout, std::endl;
using nlohmann::json;
using namespace curry;
using namespace curry::core;

#include "macros_open.hpp"

// The concrete table.
static_assert(True::truth() && !False::truth());
static_assert(And<True, True>::truth() && !And<True, False>::truth());
static_assert(!And<False, True>::truth() && !And<False, False>::truth());
static_assert(Or<True, True>::truth() && Or<True, False>::truth());
static_assert(Or<False, True>::truth() && !Or<False, False>::truth());
static_assert(Imply<True, True>::truth() && !Imply<True, False>::truth());
static_assert(Imply<False, True>::truth() && Imply<False, False>::truth());
static_assert(!Not<True>::truth() && Not<False>::truth());
static_assert(Equal<True, True>::truth() && !Equal<True, False>::truth());
static_assert(!Equal<False, True>::truth() && Equal<False, False>::truth());

// Deeper nesting.
static_assert(And<Or<Imply<False, False>, False>, Not<And<True, False>>>::truth());
static_assert(!Or<And<Not<True>, True>, Imply<Or<True, False>, Not<Not<False>>>>::truth());
static_assert(Equal<Equal<True, False>, Equal<False, True>>::truth());

// Checks every row against the classical definition of the connective.
auto verify(string const& name, std::vector<check::Row> const& rows, std::function<bool(std::vector<bool> const&)> const& def)
  -> void {
  cout << name << endl;
  for (auto const& [inputs, formula, value]: rows) {
    cout << "  " << formula->toString() << " = " << (value ? "true" : "false") << endl;
    assert(value == def(inputs));
    // Structural evaluation must agree with the type.
    assert(formula->truth() == value);
  }
}

auto main() -> int {
  auto pool = Allocator<Formula>();

  auto const t = std::vector<check::Row>{check::row<True>(pool, {true}), check::row<False>(pool, {false})};
  verify("Bool", t, [](auto const& x) { return x[0]; });

  auto const a = check::binaryTable<And>(pool);
  assert(a.size() == 4);
  verify("And", a, [](auto const& x) { return x[0] && x[1]; });

  auto const o = check::binaryTable<Or>(pool);
  verify("Or", o, [](auto const& x) { return x[0] || x[1]; });

  auto const i = check::binaryTable<Imply>(pool);
  verify("Imply", i, [](auto const& x) { return !x[0] || x[1]; });

  auto const n = check::unaryTable<Not>(pool);
  assert(n.size() == 2);
  verify("Not", n, [](auto const& x) { return !x[0]; });

  auto const e = check::binaryTable<Equal>(pool);
  verify("Equal", e, [](auto const& x) { return x[0] == x[1]; });

  // Exact values, in row order (T, T), (T, F), (F, T), (F, F).
  auto const values = [](std::vector<check::Row> const& rows) {
    auto res = std::vector<bool>();
    for (auto const& row: rows)
      res.push_back(row.value);
    return res;
  };
  assert((values(a) == std::vector<bool>{true, false, false, false}));
  assert((values(o) == std::vector<bool>{true, true, true, false}));
  assert((values(i) == std::vector<bool>{true, false, true, true}));
  assert((values(n) == std::vector<bool>{false, true}));
  assert((values(e) == std::vector<bool>{true, false, false, true}));

  // Printed forms.
  assert(a[1].formula->toString() == "true and false");
  assert(i[2].formula->toString() == "false -> true");
  assert(n[0].formula->toString() == "not true");
  assert(e[3].formula->toString() == "false <-> false");

  // JSON rows.
  auto const res = check::tables(pool);
  assert(res.size() == 5);
  for (auto const key: {"and", "or", "imply", "equal"})
    assert(res.at(key).size() == 4);
  assert(res.at("not").size() == 2);
  for (auto const& [key, rows]: res.items()) {
    for (auto const& r: rows) {
      assert(r.size() == 4);
      assert(r.contains("inputs") && r.contains("formula") && r.contains("tree") && r.contains("value"));
      assert(r["inputs"].is_array() && r["formula"].is_string() && r["tree"].is_object() && r["value"].is_boolean());
      assert(r["inputs"].size() == (key == "not" ? 1uz : 2uz));
    }
  }
  auto const t1 = json{{"tag", "literal"}, {"value", true}};
  auto const f1 = json{{"tag", "literal"}, {"value", false}};
  assert((
    res["imply"][1] ==
    json{
      {"inputs", json::array({true, false})},
      {"formula", "true -> false"},
      {"tree", {{"tag", "implies"}, {"left", t1}, {"right", f1}}},
      {"value", false},
    }
  ));
  assert((
    res["not"][1] ==
    json{
      {"inputs", json::array({false})},
      {"formula", "not false"},
      {"tree", {{"tag", "implies"}, {"left", f1}, {"right", f1}}},
      {"value", true},
    }
  ));
  assert(res["and"][0]["tree"]["tag"] == "and" && res["or"][3]["tree"]["tag"] == "or");
  assert(res["equal"][3]["formula"] == "false <-> false" && res["equal"][3]["value"] == true);
  // Row values agree with the enumerated tables.
  for (auto k = 0uz; k < 4; k++) {
    assert(res["and"][k]["value"] == a[k].value);
    assert(res["or"][k]["value"] == o[k].value);
    assert(res["imply"][k]["value"] == i[k].value);
    assert(res["equal"][k]["value"] == e[k].value);
  }

  cout << "All passed" << endl;
  return 0;
}
