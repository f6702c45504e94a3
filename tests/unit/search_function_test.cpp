#include "internal/db/sqlite/search_function.hpp"

#include <cassert>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

using flowstore::db::sqlite::SqliteDB;
using flowstore::db::sqlite::SqliteOptions;

// First column of the first row as an integer; nullopt when sqlite
// reports an error while stepping.
std::optional<int> Eval(SqliteDB& db, const std::string& expr) {
  auto stmt = db.Prepare("SELECT " + expr + ";");
  if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
    return std::nullopt;
  }
  return sqlite3_column_int(stmt.get(), 0);
}

void TestPlainAndCaseInsensitiveMatch() {
  SqliteDB db(SqliteOptions{});
  flowstore::db::sqlite::RegisterSearchFunction(db);

  assert(Eval(db, "search('exam.le', 'www.example.com', 0)") == 1);
  assert(Eval(db, "search('EXAMPLE', 'www.example.com', 0)") == 0);
  assert(Eval(db, "search('EXAMPLE', 'www.example.com', 2)") == 1);
  assert(Eval(db, "search('^www', 'www.example.com', 0)") == 1);
  assert(Eval(db, "search('^example', 'www.example.com', 0)") == 0);
}

void TestMultilineAndDotAll() {
  SqliteDB db(SqliteOptions{});
  flowstore::db::sqlite::RegisterSearchFunction(db);

  assert(Eval(db, "search('^b$', 'a' || char(10) || 'b', 0)") == 0);
  assert(Eval(db, "search('^b$', 'a' || char(10) || 'b', 8)") == 1);
  assert(Eval(db, "search('a.b', 'a' || char(10) || 'b', 0)") == 0);
  assert(Eval(db, "search('a.b', 'a' || char(10) || 'b', 16)") == 1);
  assert(Eval(db, "search('^B$', 'a' || char(10) || 'b', 10)") == 1);
}

void TestNullAndBinaryText() {
  SqliteDB db(SqliteOptions{});
  flowstore::db::sqlite::RegisterSearchFunction(db);

  assert(Eval(db, "search('.*', NULL, 0)") == 0);
  assert(Eval(db, "search('ab', x'00616200', 0)") == 1);
  assert(Eval(db, "search('zz', x'00616200', 0)") == 0);
}

void TestInvalidPatternIsAnError() {
  SqliteDB db(SqliteOptions{});
  flowstore::db::sqlite::RegisterSearchFunction(db);

  assert(!Eval(db, "search('(', 'text', 0)").has_value());
  assert(!flowstore::db::sqlite::PatternError("(").empty());
  assert(flowstore::db::sqlite::PatternError("a+b").empty());

  bool threw = false;
  try {
    (void)flowstore::db::sqlite::Search("[", "text", 0);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestCachedPatternAcrossRows() {
  SqliteDB db(SqliteOptions{});
  flowstore::db::sqlite::RegisterSearchFunction(db);

  db.Exec("CREATE TABLE t(v TEXT);");
  db.Exec("INSERT INTO t VALUES ('alpha'), ('ALPHA'), ('beta'), (NULL), ('alphabet');");

  auto stmt = db.Prepare("SELECT count(*) FROM t WHERE search(?, v, 0);");
  sqlite3_bind_text(stmt.get(), 1, "^alpha", -1, SQLITE_TRANSIENT);
  const int rc = sqlite3_step(stmt.get());
  assert(rc == SQLITE_ROW);
  assert(sqlite3_column_int(stmt.get(), 0) == 2);

  // same call site, different flags per statement run
  assert(Eval(db, "(SELECT count(*) FROM t WHERE search('^alpha', v, 2))") == 3);
}

void TestStandaloneMatcher() {
  assert(flowstore::db::sqlite::Search("^Content-Type=text/", "Host=a\nContent-Type=text/html\n",
                                       flowstore::db::sqlite::kSearchMultiline));
  assert(!flowstore::db::sqlite::Search("^Content-Type=text/", "Host=a\nContent-Type=text/html\n", 0));
}

} // namespace

int main() {
  TestPlainAndCaseInsensitiveMatch();
  TestMultilineAndDotAll();
  TestNullAndBinaryText();
  TestInvalidPatternIsAnError();
  TestCachedPatternAcrossRows();
  TestStandaloneMatcher();

  std::cout << "flowstore_unit_search_function: pass\n";
  return 0;
}
