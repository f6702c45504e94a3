#include "query_executor.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace flowstore::query {
namespace {

std::string_view SortColumn(SortField field) {
  switch (field) {
    case SortField::kTime:
      return "timestamp_created";
    case SortField::kMethod:
      return "method";
    case SortField::kUrl:
      return "url";
    case SortField::kStatus:
      return "status_code";
    case SortField::kSize:
      return "total_size";
    case SortField::kDuration:
      return "duration";
  }
  throw std::invalid_argument("unknown sort field");
}

[[noreturn]] void ThrowStep(sqlite3* db, const char* what) {
  throw util::StoreError(std::string(what) + ": " + sqlite3_errmsg(db));
}

} // namespace

// ------------------------------------------------------------
// Sort keys
// ------------------------------------------------------------

std::string_view ToString(SortField field) {
  switch (field) {
    case SortField::kTime:
      return "time";
    case SortField::kMethod:
      return "method";
    case SortField::kUrl:
      return "url";
    case SortField::kStatus:
      return "status";
    case SortField::kSize:
      return "size";
    case SortField::kDuration:
      return "duration";
  }
  return "unknown";
}

SortOrder ParseSortOrder(std::string_view text) {
  SortOrder order;
  if (!text.empty() && text.front() == '-') {
    order.descending = true;
    text.remove_prefix(1);
  }

  for (auto field : {SortField::kTime, SortField::kMethod, SortField::kUrl, SortField::kStatus, SortField::kSize,
                     SortField::kDuration}) {
    if (ToString(field) == text) {
      order.field = field;
      return order;
    }
  }
  throw std::invalid_argument("unknown sort key '" + std::string(text) + "'");
}

// ------------------------------------------------------------
// QueryExecutor
// ------------------------------------------------------------

QueryExecutor::QueryExecutor(std::shared_ptr<db::sqlite::SqliteDB> db) : db_(std::move(db)) {
}

std::vector<std::string> QueryExecutor::SelectIds(const filter::CompiledPredicate& predicate, const PageRequest& page) {
  const std::string sql = "SELECT flow_id FROM flow_view WHERE " + predicate.fragment + " ORDER BY " +
                          std::string(SortColumn(page.sort.field)) + (page.sort.descending ? " DESC" : "") +
                          ", seq LIMIT ? OFFSET ?;";

  auto stmt = db_->Prepare(sql);
  db::sqlite::BindParams(stmt.get(), predicate.params);

  const int next = static_cast<int>(predicate.params.size()) + 1;
  sqlite3_bind_int64(stmt.get(), next, page.limit);
  sqlite3_bind_int64(stmt.get(), next + 1, page.offset);

  std::vector<std::string> ids;
  int rc;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 0));
    ids.emplace_back(text, sqlite3_column_bytes(stmt.get(), 0));
  }
  if (rc != SQLITE_DONE) {
    ThrowStep(db_->Handle(), "select flows");
  }
  return ids;
}

std::int64_t QueryExecutor::Count(const filter::CompiledPredicate& predicate) {
  auto stmt = db_->Prepare("SELECT count(*) FROM flow_view WHERE " + predicate.fragment + ";");
  db::sqlite::BindParams(stmt.get(), predicate.params);

  if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
    ThrowStep(db_->Handle(), "count flows");
  }
  return sqlite3_column_int64(stmt.get(), 0);
}

std::int64_t QueryExecutor::CopyMatching(const filter::CompiledPredicate& predicate, const std::string& schema) {
  // schema names were validated by SqliteDB::Attach
  auto stmt = db_->Prepare("INSERT INTO " + schema +
                           ".chunk(flow_id, kind, payload) "
                           "SELECT flow_id, kind, payload FROM main.chunk WHERE flow_id IN "
                           "(SELECT flow_id FROM flow_view WHERE " +
                           predicate.fragment + ") ORDER BY id;");
  db::sqlite::BindParams(stmt.get(), predicate.params);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    ThrowStep(db_->Handle(), "copy flows");
  }
  return sqlite3_changes(db_->Handle());
}

} // namespace flowstore::query
