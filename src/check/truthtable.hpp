// Check :: Row, unaryTable, binaryTable, toJson, tables

#ifndef CURRY_CHECK_TRUTHTABLE_HPP
#define CURRY_CHECK_TRUTHTABLE_HPP

#include <vector>
#include <nlohmann/json_fwd.hpp>
#include <common.hpp>
#include <core/formula.hpp>
#include <core/prop.hpp>

// Truth-table enumeration over literal inputs.
// Everything here is computed from `truth()` and `reify`: no evidence is constructed, no postulate is reached.
namespace curry::check {

  struct Row {
    std::vector<bool> inputs;
    core::Formula const* formula; // Lifetime bounded by the pool passed to the table functions
    bool value;
  };

  template <core::Prop P>
  auto row(Allocator<core::Formula>& pool, std::vector<bool> inputs) -> Row {
    return {std::move(inputs), core::reify<P>(pool), P::truth()};
  }

  // Rows in the order (T), (F).
  template <template <core::Prop> typename Conn>
  auto unaryTable(Allocator<core::Formula>& pool) -> std::vector<Row> {
    using core::True, core::False;
    return {
      row<Conn<True>>(pool, {true}),
      row<Conn<False>>(pool, {false}),
    };
  }

  // Rows in the order (T, T), (T, F), (F, T), (F, F).
  template <template <core::Prop, core::Prop> typename Conn>
  auto binaryTable(Allocator<core::Formula>& pool) -> std::vector<Row> {
    using core::True, core::False;
    return {
      row<Conn<True, True>>(pool, {true, true}),
      row<Conn<True, False>>(pool, {true, false}),
      row<Conn<False, True>>(pool, {false, true}),
      row<Conn<False, False>>(pool, {false, false}),
    };
  }

  // One object per row: `{"inputs", "formula", "tree", "value"}`, where "formula" is the printed form
  //   and "tree" the structural form of the reified formula.
  auto toJson(std::vector<Row> const& rows) -> nlohmann::json;

  // Tables of all connectives, keyed by "and", "or", "imply", "not", "equal".
  auto tables(Allocator<core::Formula>& pool) -> nlohmann::json;

}

#endif // CURRY_CHECK_TRUTHTABLE_HPP
