#pragma once

#include <string_view>

#include "filter_ast.hpp"

namespace flowstore::filter {

/*
  Filter expression parser.

    expr    := and ('|' and)*
    and     := not (['&'] not)*          adjacency is an implicit '&'
    not     := '!' not | primary
    primary := '(' expr ')' | '~' code [argument] | argument

  A bare argument is a URL regex. Arguments are a quoted string ('...' or
  "...", backslash escapes) or a word running up to whitespace, a paren,
  '~' or a quote.

  Throws util::ParseError with the offending position.
*/
FilterNodePtr Parse(std::string_view text);

} // namespace flowstore::filter
