#include "filter_ast.hpp"

#include <type_traits>

namespace flowstore::filter {
namespace {

bool SameChildren(const std::vector<FilterNodePtr>& a, const std::vector<FilterNodePtr>& b) {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (!(*a[i] == *b[i])) return false;
  }
  return true;
}

} // namespace

bool FilterNode::operator==(const FilterNode& other) const {
  if (node_.index() != other.node_.index()) return false;

  return std::visit(
      [&](const auto& lhs) -> bool {
        using T        = std::decay_t<decltype(lhs)>;
        const auto& rhs = std::get<T>(other.node_);
        if constexpr (std::is_same_v<T, And> || std::is_same_v<T, Or>) {
          return SameChildren(lhs.children, rhs.children);
        } else if constexpr (std::is_same_v<T, Not>) {
          return *lhs.child == *rhs.child;
        } else {
          return lhs == rhs;
        }
      },
      node_);
}

FilterNodePtr MakeUnary(std::string code) {
  return std::make_shared<const FilterNode>(Unary{std::move(code)});
}

FilterNodePtr MakeRegex(std::string code, std::string pattern) {
  return std::make_shared<const FilterNode>(RegexMatch{std::move(code), std::move(pattern)});
}

FilterNodePtr MakeInt(std::string code, std::int64_t value) {
  return std::make_shared<const FilterNode>(IntCompare{std::move(code), value});
}

FilterNodePtr MakeAnd(std::vector<FilterNodePtr> children) {
  return std::make_shared<const FilterNode>(And{std::move(children)});
}

FilterNodePtr MakeOr(std::vector<FilterNodePtr> children) {
  return std::make_shared<const FilterNode>(Or{std::move(children)});
}

FilterNodePtr MakeNot(FilterNodePtr child) {
  return std::make_shared<const FilterNode>(Not{std::move(child)});
}

std::string ToString(const FilterNode& node) {
  return std::visit(
      [](const auto& n) -> std::string {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, Unary>) {
          return "~" + n.code;
        } else if constexpr (std::is_same_v<T, RegexMatch>) {
          return "(~" + n.code + " '" + n.pattern + "')";
        } else if constexpr (std::is_same_v<T, IntCompare>) {
          return "(~" + n.code + " " + std::to_string(n.value) + ")";
        } else if constexpr (std::is_same_v<T, Not>) {
          return "(not " + ToString(*n.child) + ")";
        } else {
          std::string out = std::is_same_v<T, And> ? "(and" : "(or";
          for (const auto& child : n.children) {
            out += " " + ToString(*child);
          }
          return out + ")";
        }
      },
      node.Get());
}

} // namespace flowstore::filter
