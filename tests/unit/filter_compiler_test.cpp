#include "internal/filter/filter_compiler.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/filter/filter_fields.hpp"
#include "internal/filter/filter_parser.hpp"

namespace {

using namespace flowstore::filter;
using flowstore::db::sql::Params;

template <typename Fn>
bool ThrowsInvalidArgument(Fn&& fn) {
  try {
    fn();
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}

std::size_t Placeholders(const std::string& fragment) {
  return static_cast<std::size_t>(std::count(fragment.begin(), fragment.end(), '?'));
}

void TestMarkedAndStatusExample() {
  const auto compiled = Compile(*Parse("~marked ~c 200"));
  assert(compiled.fragment == "(marked != '') AND (coalesce(status_code = ?, 0))");
  assert(compiled.params == Params{int64_t{200}});
}

void TestParamsFollowPlaceholderOrder() {
  const auto compiled = Compile(*Parse("~d foo | ~m GET ~c 404"));
  assert(compiled.fragment == "(search(?, host, 2)) OR ((search(?, method, 2)) AND (coalesce(status_code = ?, 0)))");
  assert((compiled.params == Params{std::string("foo"), std::string("GET"), int64_t{404}}));
}

void TestNegation() {
  const auto compiled = Compile(*Parse("!~e"));
  assert(compiled.fragment == "NOT (has_error)");
  assert(compiled.params.empty());

  // fields that can be absent compare with IS / coalesce so NOT flips them
  assert(Compile(*Parse("!~replayq")).fragment == "NOT (is_replay IS 'request')");
  assert(Compile(*Parse("!~c 200")).fragment == "NOT (coalesce(status_code = ?, 0))");

  const auto nested = Compile(*Parse("!(~q | ~u /api)"));
  assert(nested.fragment == "NOT ((NOT has_response) OR (search(?, url, 2)))");
  assert(nested.params == Params{std::string("/api")});
}

void TestCompileIsDeterministic() {
  const auto tree = Parse("~h 'x-trace' & !~bs secret | ~t json ~c 500");
  const auto a    = Compile(*tree);
  const auto b    = Compile(*tree);
  const auto c    = Compile(*Parse("~h 'x-trace' & !~bs secret | ~t json ~c 500"));
  assert(a == b);
  assert(a == c);
}

void TestEveryFieldBindsOneParamPerPlaceholder() {
  for (const auto& field : Fields()) {
    const std::string code(field.code);
    FilterNodePtr node;
    switch (field.kind) {
      case FieldKind::kUnary:
        node = MakeUnary(code);
        break;
      case FieldKind::kRegex:
        node = MakeRegex(code, "x");
        break;
      case FieldKind::kInt:
        node = MakeInt(code, 1);
        break;
    }
    const auto compiled = Compile(*node);
    assert(Placeholders(compiled.fragment) == compiled.params.size());
    assert(compiled.params.size() == (field.kind == FieldKind::kUnary ? 0u : 1u));
  }
}

void TestHandBuiltTreesAreChecked() {
  assert(ThrowsInvalidArgument([] { Compile(*MakeUnary("bogus")); }));
  assert(ThrowsInvalidArgument([] { Compile(*MakeRegex("c", "200")); }));
  assert(ThrowsInvalidArgument([] { Compile(*MakeInt("d", 1)); }));
  assert(ThrowsInvalidArgument([] { Compile(*MakeAnd({})); }));
  assert(ThrowsInvalidArgument([] { Compile(*MakeOr({MakeUnary("e"), MakeUnary("nope")})); }));
}

} // namespace

int main() {
  TestMarkedAndStatusExample();
  TestParamsFollowPlaceholderOrder();
  TestNegation();
  TestCompileIsDeterministic();
  TestEveryFieldBindsOneParamPerPlaceholder();
  TestHandBuiltTreesAreChecked();

  std::cout << "flowstore_unit_filter_compiler: pass\n";
  return 0;
}
