#pragma once

#include <memory>

#include "internal/db/sqlite/sqlite_db.hpp"

namespace flowstore::view {

/*
  Derived schema objects.

  Everything except the chunk table is computed from chunk rows and can be
  thrown away at any time:

    flow_header   one merged "name=value\n..." string per direction per flow,
                  maintained by triggers on chunk
    flow_view     one row per http_flow chunk with the fields filters and
                  sorting need, extracted from JSON
    flow_*        expression indexes over chunk for the common sort/filter keys

  The set is tagged with PRAGMA user_version. Bump the version whenever any
  of the statements below change.
*/

inline constexpr int kDerivedSchemaVersion = 1;

// Creates the chunk table if needed and rebuilds the derived objects when
// the stored version differs. Returns true when a rebuild happened.
// Must run before the connection is shared.
bool EnsureSchema(const std::shared_ptr<db::sqlite::SqliteDB>& db);

// Drop every non-chunk object, recreate the current set and write the
// version marker, all in one transaction.
void RebuildDerivedObjects(const std::shared_ptr<db::sqlite::SqliteDB>& db);

} // namespace flowstore::view
