#include "truthtable.hpp"
#include <nlohmann/json.hpp>

using nlohmann::json;

namespace curry::check {

  auto toJson(std::vector<Row> const& rows) -> json {
    auto res = json::array();
    for (auto const& [inputs, formula, value]: rows)
      res.push_back({{"inputs", inputs}, {"formula", formula->toString()}, {"tree", formula->toJson()}, {"value", value}});
    return res;
  }

  auto tables(Allocator<core::Formula>& pool) -> json {
    return {
      {"and", toJson(binaryTable<core::And>(pool))},
      {"or", toJson(binaryTable<core::Or>(pool))},
      {"imply", toJson(binaryTable<core::Imply>(pool))},
      {"not", toJson(unaryTable<core::Not>(pool))},
      {"equal", toJson(binaryTable<core::Equal>(pool))},
    };
  }

}
