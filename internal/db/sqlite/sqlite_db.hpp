#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/sql/sql_params.hpp"

namespace flowstore::db::sqlite {

/*
  Connection settings. Pragma values are validated against the keywords
  sqlite accepts before they are spliced into PRAGMA statements.
*/
struct SqliteOptions {
  std::string path = ":memory:";

  std::string journal_mode = "WAL";
  std::string synchronous  = "NORMAL";
  std::string temp_store   = "MEMORY";

  int           busy_timeout_ms = 5000;
  int           cache_size_kib  = 20000;
  std::uint64_t mmap_size_bytes = 0;
};

struct StatementDeleter {
  void operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

// Bind params to placeholders first, first+1, ... in order.
void BindParams(sqlite3_stmt* stmt, const sql::Params& params, int first = 1);

/*
  Thin RAII wrapper around sqlite3*.

  Every failure is reported as util::StoreError.
*/
class SqliteDB {
 public:
  explicit SqliteDB(SqliteOptions options);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const SqliteOptions& Options() const {
    return options_;
  }

  // Execute a SQL string (pragmas, DDL, transaction control)
  void Exec(const std::string& sql);

  Statement Prepare(const std::string& sql);

  // PRAGMA user_version of the main schema
  int  UserVersion();
  void SetUserVersion(int version);

  // ATTACH/DETACH another database file under `schema`.
  // Not allowed while a transaction is open.
  void Attach(const std::string& path, const std::string& schema);
  void Detach(const std::string& schema);

 private:
  // Apply the PRAGMAs from options_
  void Configure();

  sqlite3*      db_ = nullptr;
  SqliteOptions options_;
};

} // namespace flowstore::db::sqlite
