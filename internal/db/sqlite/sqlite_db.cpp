#include "sqlite_db.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>
#include <type_traits>
#include <variant>

#include "internal/util/errors.hpp"

namespace flowstore::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw util::StoreError(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

template <std::size_t N>
static std::string PragmaKeyword(const char* pragma, std::string value, const std::array<std::string_view, N>& allowed) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return std::toupper(c); });
  if (std::find(allowed.begin(), allowed.end(), value) == allowed.end()) {
    throw util::StoreError(std::string("invalid value for PRAGMA ") + pragma + ": " + value);
  }
  return value;
}

static void RequireIdentifier(const std::string& name) {
  const bool ok = !name.empty() && !std::isdigit(static_cast<unsigned char>(name.front())) &&
                  std::all_of(name.begin(), name.end(), [](unsigned char c) { return std::isalnum(c) || c == '_'; });
  if (!ok) {
    throw util::StoreError("invalid schema name: " + name);
  }
}

void BindParams(sqlite3_stmt* stmt, const sql::Params& params, int first) {
  int index = first;
  for (const auto& param : params) {
    int rc = std::visit(
        [&](const auto& v) -> int {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return sqlite3_bind_null(stmt, index);
          } else if constexpr (std::is_same_v<T, int64_t>) {
            return sqlite3_bind_int64(stmt, index, v);
          } else {
            return sqlite3_bind_text(stmt, index, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
          }
        },
        param);
    ThrowIf(rc, sqlite3_db_handle(stmt), "sqlite bind");
    ++index;
  }
}

SqliteDB::SqliteDB(SqliteOptions options) : options_(std::move(options)) {
  int rc = sqlite3_open_v2(options_.path.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::StoreError("cannot open " + options_.path + ": " + msg);
  }

  try {
    Configure();
  } catch (const util::StoreError&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close_v2(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw util::StoreError(msg);
  }
}

Statement SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  return Statement(stmt);
}

int SqliteDB::UserVersion() {
  auto stmt = Prepare("PRAGMA main.user_version;");
  int  rc   = sqlite3_step(stmt.get());
  if (rc != SQLITE_ROW) {
    throw util::StoreError(std::string("read user_version: ") + sqlite3_errmsg(db_));
  }
  return sqlite3_column_int(stmt.get(), 0);
}

void SqliteDB::SetUserVersion(int version) {
  Exec("PRAGMA main.user_version=" + std::to_string(version) + ";");
}

void SqliteDB::Attach(const std::string& path, const std::string& schema) {
  RequireIdentifier(schema);

  auto stmt = Prepare("ATTACH DATABASE ? AS " + schema + ";");
  sqlite3_bind_text(stmt.get(), 1, path.c_str(), -1, SQLITE_TRANSIENT);

  int rc = sqlite3_step(stmt.get());
  if (rc != SQLITE_DONE) {
    throw util::StoreError("attach " + path + ": " + sqlite3_errmsg(db_));
  }
}

void SqliteDB::Detach(const std::string& schema) {
  RequireIdentifier(schema);
  Exec("DETACH DATABASE " + schema + ";");
}

void SqliteDB::Configure() {
  static constexpr std::array<std::string_view, 6> kJournalModes = {"DELETE", "TRUNCATE", "PERSIST", "MEMORY", "WAL", "OFF"};
  static constexpr std::array<std::string_view, 4> kSynchronous  = {"OFF", "NORMAL", "FULL", "EXTRA"};
  static constexpr std::array<std::string_view, 3> kTempStore    = {"DEFAULT", "FILE", "MEMORY"};

  // WAL lets readers proceed while the capture hooks write
  Exec("PRAGMA journal_mode=" + PragmaKeyword("journal_mode", options_.journal_mode, kJournalModes) + ";");

  // OFF trades the last few flows on power loss for insert speed
  Exec("PRAGMA synchronous=" + PragmaKeyword("synchronous", options_.synchronous, kSynchronous) + ";");

  Exec("PRAGMA temp_store=" + PragmaKeyword("temp_store", options_.temp_store, kTempStore) + ";");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, options_.busy_timeout_ms), db_, "busy_timeout");

  Exec("PRAGMA cache_size=-" + std::to_string(options_.cache_size_kib) + ";"); // negative means KiB
  Exec("PRAGMA mmap_size=" + std::to_string(options_.mmap_size_bytes) + ";");
}

} // namespace flowstore::db::sqlite
