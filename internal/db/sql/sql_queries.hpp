#pragma once

#include <string>

namespace flowstore::db::sql {

/*
  Canonical chunk SQL.

  The chunk table is the only permanent schema object. Its layout never
  changes; everything else is derived and disposable (see view/derived_schema).
*/

inline std::string CreateChunkTable(const std::string& schema = "main", bool if_not_exists = true) {
  return std::string("CREATE TABLE ") + (if_not_exists ? "IF NOT EXISTS " : "") + schema +
         ".chunk ("
         "id INTEGER PRIMARY KEY, "
         "flow_id TEXT NOT NULL CHECK (flow_id <> ''), "
         "kind TEXT NOT NULL CHECK (kind <> ''), "
         "payload BLOB, "
         "UNIQUE (flow_id, kind));";
}

// Update in place keeps the row id, so insertion order survives re-puts.
static constexpr const char* UPSERT_CHUNK =
    "INSERT INTO chunk(flow_id,kind,payload) VALUES(?,?,?)"
    " ON CONFLICT(flow_id,kind) DO UPDATE SET payload=excluded.payload;";

static constexpr const char* SELECT_CHUNKS =
    "SELECT flow_id,kind,payload FROM chunk WHERE flow_id=? ORDER BY id;";

static constexpr const char* DELETE_FLOW =
    "DELETE FROM chunk WHERE flow_id=?;";

static constexpr const char* DELETE_ALL =
    "DELETE FROM chunk;";

}
