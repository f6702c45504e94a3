#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace flowstore::filter {

/*
  Filter expression AST.

  Nodes are immutable once built and shared by pointer, so a parsed filter
  can be kept around and compiled repeatedly.
*/

class FilterNode;
using FilterNodePtr = std::shared_ptr<const FilterNode>;

// ~code with no argument (~e, ~marked, ~http)
struct Unary {
  std::string code;

  bool operator==(const Unary&) const = default;
};

// ~code <regex>; a bare regex is RegexMatch{"u", ...}
struct RegexMatch {
  std::string code;
  std::string pattern;

  bool operator==(const RegexMatch&) const = default;
};

// ~code <int>
struct IntCompare {
  std::string code;
  std::int64_t value = 0;

  bool operator==(const IntCompare&) const = default;
};

struct And {
  std::vector<FilterNodePtr> children;
};

struct Or {
  std::vector<FilterNodePtr> children;
};

struct Not {
  FilterNodePtr child;
};

class FilterNode {
 public:
  using Variant = std::variant<Unary, RegexMatch, IntCompare, And, Or, Not>;

  explicit FilterNode(Variant node) : node_(std::move(node)) {}

  const Variant& Get() const {
    return node_;
  }

  // Structural equality, children compared by value
  bool operator==(const FilterNode& other) const;

 private:
  Variant node_;
};

FilterNodePtr MakeUnary(std::string code);
FilterNodePtr MakeRegex(std::string code, std::string pattern);
FilterNodePtr MakeInt(std::string code, std::int64_t value);
FilterNodePtr MakeAnd(std::vector<FilterNodePtr> children);
FilterNodePtr MakeOr(std::vector<FilterNodePtr> children);
FilterNodePtr MakeNot(FilterNodePtr child);

// Compact rendering for logs and diagnostics, e.g. (and ~marked (~c 200))
std::string ToString(const FilterNode& node);

} // namespace flowstore::filter
