#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace flowstore::db::sql {

/*
  Parameter abstraction for positional '?' placeholders.

  Compiled filter predicates carry their bound values as Params in the same
  order as the placeholders appear in the SQL text.
*/

using Param = std::variant<
    std::nullptr_t,
    int64_t,
    std::string
>;

using Params = std::vector<Param>;

}
