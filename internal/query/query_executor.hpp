#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/filter/filter_compiler.hpp"

namespace flowstore::query {

enum class SortField {
  kTime,
  kMethod,
  kUrl,
  kStatus,
  kSize,
  kDuration,
};

struct SortOrder {
  SortField field = SortField::kTime;
  bool descending = false;

  bool operator==(const SortOrder&) const = default;
};

// "time", "-status", ... Throws std::invalid_argument for unknown keys.
SortOrder ParseSortOrder(std::string_view text);

std::string_view ToString(SortField field);

struct PageRequest {
  SortOrder sort;
  std::uint32_t limit = 100;
  std::uint32_t offset = 0;
};

/*
  Runs compiled predicates against flow_view.

  Only ids come back; decoding is left to the caller so that nothing beyond
  the visible page is ever reconstructed. Ties are broken by insertion
  order (seq).
*/
class QueryExecutor {
 public:
  explicit QueryExecutor(std::shared_ptr<db::sqlite::SqliteDB> db);

  std::vector<std::string> SelectIds(const filter::CompiledPredicate& predicate, const PageRequest& page);

  std::int64_t Count(const filter::CompiledPredicate& predicate);

  // Copies every chunk of every matching flow into <schema>.chunk.
  // Runs inside the caller's transaction. Returns the number of rows copied.
  std::int64_t CopyMatching(const filter::CompiledPredicate& predicate, const std::string& schema);

 private:
  std::shared_ptr<db::sqlite::SqliteDB> db_;
};

} // namespace flowstore::query
