#include "filter_compiler.hpp"

#include <stdexcept>

#include "filter_fields.hpp"

namespace flowstore::filter {
namespace {

const FieldSpec& RequireField(const std::string& code, FieldKind kind) {
  const FieldSpec* field = FindField(code);
  if (!field) {
    throw std::invalid_argument("unknown filter code '~" + code + "'");
  }
  if (field->kind != kind) {
    throw std::invalid_argument("filter code '~" + code + "' used with the wrong argument type");
  }
  return *field;
}

class Compiler {
 public:
  CompiledPredicate Run(const FilterNode& node) {
    CompiledPredicate out;
    out.fragment = Visit(node, out.params);
    return out;
  }

 private:
  std::string Visit(const FilterNode& node, db::sql::Params& params) {
    return std::visit([&](const auto& n) { return Emit(n, params); }, node.Get());
  }

  std::string Emit(const Unary& n, db::sql::Params&) {
    return std::string(RequireField(n.code, FieldKind::kUnary).sql);
  }

  std::string Emit(const RegexMatch& n, db::sql::Params& params) {
    const auto& field = RequireField(n.code, FieldKind::kRegex);
    params.emplace_back(n.pattern);
    return std::string(field.sql);
  }

  std::string Emit(const IntCompare& n, db::sql::Params& params) {
    const auto& field = RequireField(n.code, FieldKind::kInt);
    params.emplace_back(static_cast<int64_t>(n.value));
    return std::string(field.sql);
  }

  std::string Emit(const And& n, db::sql::Params& params) {
    return Join(n.children, " AND ", params);
  }

  std::string Emit(const Or& n, db::sql::Params& params) {
    return Join(n.children, " OR ", params);
  }

  std::string Emit(const Not& n, db::sql::Params& params) {
    if (!n.child) {
      throw std::invalid_argument("negation without an operand");
    }
    return "NOT (" + Visit(*n.child, params) + ")";
  }

  // children left to right, so params follow the placeholders
  std::string Join(const std::vector<FilterNodePtr>& children, const char* op, db::sql::Params& params) {
    if (children.empty()) {
      throw std::invalid_argument(std::string("empty") + op + "group");
    }
    std::string out;
    for (std::size_t i = 0; i < children.size(); ++i) {
      if (!children[i]) {
        throw std::invalid_argument("null filter node");
      }
      if (i > 0) out += op;
      out += "(" + Visit(*children[i], params) + ")";
    }
    return out;
  }
};

} // namespace

CompiledPredicate Compile(const FilterNode& node) {
  return Compiler().Run(node);
}

} // namespace flowstore::filter
