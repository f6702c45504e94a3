#pragma once

#include <string_view>
#include <vector>

namespace flowstore::filter {

enum class FieldKind {
  kUnary, // no argument
  kRegex, // one regex argument
  kInt,   // one integer argument
};

/*
  One ~code of the filter language and the SQL it compiles to.

  `sql` is a boolean expression over flow_view columns. Regex and integer
  fields contain exactly one `?` placeholder for their argument.
*/
struct FieldSpec {
  std::string_view code;
  FieldKind kind;
  std::string_view help;
  std::string_view sql;
};

// Every field, in the order they are listed in help output.
const std::vector<FieldSpec>& Fields();

// nullptr when the code is unknown
const FieldSpec* FindField(std::string_view code);

// Codes ordered longest first, so prefix matching picks "replayq" over
// "replay" and "bq" over "b".
const std::vector<std::string_view>& CodesLongestFirst();

} // namespace flowstore::filter
