#include "search_function.hpp"

#include <re2/re2.h>

#include <memory>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace flowstore::db::sqlite {
namespace {

struct CompiledPattern {
  int flags = 0;
  std::unique_ptr<RE2> re;
};

RE2::Options MakeOptions(int flags) {
  RE2::Options options;
  options.set_log_errors(false);
  options.set_case_sensitive((flags & kSearchIgnoreCase) == 0);
  options.set_dot_nl((flags & kSearchDotAll) != 0);
  return options;
}

std::unique_ptr<RE2> Compile(const std::string& pattern, int flags) {
  // RE2 only honours multi-line anchors through the inline flag
  const std::string text = (flags & kSearchMultiline) ? "(?m)" + pattern : pattern;
  return std::make_unique<RE2>(text, MakeOptions(flags));
}

void SearchFunc(sqlite3_context* ctx, int argc, sqlite3_value** argv) {
  if (argc != 3) {
    sqlite3_result_error(ctx, "search() takes (pattern, text, flags)", -1);
    return;
  }
  if (sqlite3_value_type(argv[0]) == SQLITE_NULL || sqlite3_value_type(argv[1]) == SQLITE_NULL) {
    sqlite3_result_int(ctx, 0);
    return;
  }

  const int flags = sqlite3_value_int(argv[2]);

  // Patterns are bound once per statement; keep the compiled form for
  // every row instead of recompiling.
  auto* cached = static_cast<CompiledPattern*>(sqlite3_get_auxdata(ctx, 0));
  std::unique_ptr<CompiledPattern> fresh;
  if (!cached || cached->flags != flags) {
    const auto* p = reinterpret_cast<const char*>(sqlite3_value_text(argv[0]));
    std::string pattern(p, sqlite3_value_bytes(argv[0]));

    fresh        = std::make_unique<CompiledPattern>();
    fresh->flags = flags;
    fresh->re    = Compile(pattern, flags);
    if (!fresh->re->ok()) {
      const std::string msg = "invalid regular expression: " + fresh->re->error();
      sqlite3_result_error(ctx, msg.c_str(), -1);
      return;
    }
    cached = fresh.get();
  }

  // blob or text; both are just bytes to RE2
  const auto* text = static_cast<const char*>(sqlite3_value_blob(argv[1]));
  const int   len  = sqlite3_value_bytes(argv[1]);
  const bool  hit  = text && RE2::PartialMatch(re2::StringPiece(text, len), *cached->re);
  sqlite3_result_int(ctx, hit ? 1 : 0);

  // sqlite may destroy the aux data right away, so nothing touches
  // `cached` after this point
  if (fresh) {
    sqlite3_set_auxdata(ctx, 0, fresh.release(), [](void* p) { delete static_cast<CompiledPattern*>(p); });
  }
}

} // namespace

void RegisterSearchFunction(SqliteDB& db) {
  int rc = sqlite3_create_function_v2(db.Handle(), "search", 3, SQLITE_UTF8 | SQLITE_DETERMINISTIC, nullptr, &SearchFunc,
                                      nullptr, nullptr, nullptr);
  if (rc != SQLITE_OK) {
    throw util::StoreError(std::string("register search(): ") + sqlite3_errmsg(db.Handle()));
  }
}

bool Search(const std::string& pattern, std::string_view text, int flags) {
  auto re = Compile(pattern, flags);
  if (!re->ok()) {
    throw std::invalid_argument("invalid regular expression: " + re->error());
  }
  return RE2::PartialMatch(re2::StringPiece(text.data(), text.size()), *re);
}

std::string PatternError(const std::string& pattern) {
  RE2::Options options;
  options.set_log_errors(false);
  RE2 re(pattern, options);
  return re.ok() ? std::string() : re.error();
}

} // namespace flowstore::db::sqlite
