#pragma once

#include <string>

#include "filter_ast.hpp"
#include "internal/db/sql/sql_params.hpp"

namespace flowstore::filter {

/*
  A filter lowered to a WHERE-clause fragment over flow_view.

  Placeholders are positional '?' and appear in the fragment in the same
  order as `params`.
*/
struct CompiledPredicate {
  std::string fragment;
  db::sql::Params params;

  bool operator==(const CompiledPredicate&) const = default;
};

// Pure and deterministic: the same tree always yields the same fragment and
// params. Throws std::invalid_argument for codes missing from the field
// table, a code used with the wrong node type, or an empty And/Or.
CompiledPredicate Compile(const FilterNode& node);

} // namespace flowstore::filter
