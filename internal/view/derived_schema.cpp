#include "derived_schema.hpp"

#include <string>
#include <utility>
#include <vector>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace flowstore::view {
namespace {

using db::sqlite::SqliteDB;

// ------------------------------------------------------------
// Header flattening
// ------------------------------------------------------------

// Headers that are not valid UTF-8 only have raw_name/raw_value and
// flatten to an empty name or value.
std::string MergedHeaders(const std::string& payload_expr, const std::string& direction) {
  return "(SELECT coalesce(group_concat("
         "coalesce(json_extract(h.value, '$.name'), '') || '=' || "
         "coalesce(json_extract(h.value, '$.value'), '') || char(10), ''), '') "
         "FROM json_each(" +
         payload_expr + ", '$." + direction + ".headers') AS h)";
}

std::string CreateFlowHeaderTable() {
  return "CREATE TABLE flow_header ("
         "flow_id TEXT PRIMARY KEY, "
         "request TEXT NOT NULL, "
         "response TEXT NOT NULL);";
}

// Inside a trigger the outer statement's conflict policy wins over
// OR REPLACE, and the chunk upsert runs with ABORT, so the old row is
// deleted first instead.
std::string CreateFlowHeaderTriggers() {
  const std::string upsert = "DELETE FROM flow_header WHERE flow_id = NEW.flow_id; "
                             "INSERT INTO flow_header(flow_id, request, response) VALUES (NEW.flow_id, " +
                             MergedHeaders("NEW.payload", "request") + ", " + MergedHeaders("NEW.payload", "response") +
                             ");";

  return "CREATE TRIGGER flow_header_insert AFTER INSERT ON chunk WHEN NEW.kind = 'http_flow' BEGIN " + upsert +
         " END;"
         "CREATE TRIGGER flow_header_update AFTER UPDATE OF payload ON chunk WHEN NEW.kind = 'http_flow' BEGIN " +
         upsert +
         " END;"
         "CREATE TRIGGER flow_header_delete AFTER DELETE ON chunk WHEN OLD.kind = 'http_flow' BEGIN "
         "DELETE FROM flow_header WHERE flow_id = OLD.flow_id; END;";
}

std::string PopulateFlowHeader() {
  return "INSERT INTO flow_header(flow_id, request, response) SELECT flow_id, " +
         MergedHeaders("payload", "request") + ", " + MergedHeaders("payload", "response") +
         " FROM chunk WHERE kind = 'http_flow';";
}

// ------------------------------------------------------------
// flow_view
// ------------------------------------------------------------

std::string ContentType(const std::string& direction) {
  return "(SELECT json_extract(h.value, '$.value') FROM json_each(c.payload, '$." + direction +
         ".headers') AS h WHERE lower(json_extract(h.value, '$.name')) = 'content-type' LIMIT 1)";
}

std::string ContentSize(const std::string& kind) {
  return "coalesce((SELECT length(b.payload) FROM chunk AS b WHERE b.flow_id = c.flow_id AND b.kind = '" + kind +
         "'), 0)";
}

std::string PeerAddress(const std::string& kind, const std::string& field) {
  return "(SELECT json_extract(k.payload, '$." + field + ".host') || ':' || coalesce(json_extract(k.payload, '$." +
         field + ".port'), 0) FROM chunk AS k WHERE k.flow_id = c.flow_id AND k.kind = '" + kind +
         "' AND json_type(k.payload, '$." + field + "') IS NOT NULL)";
}

// json_extract() expressions here must stay textually identical to the
// index expressions below, or the planner will not use the indexes.
std::string CreateFlowView() {
  const std::string scheme = "coalesce(json_extract(c.payload, '$.request.scheme'), '')";
  const std::string host   = "coalesce(json_extract(c.payload, '$.request.host'), '')";
  const std::string port   = "coalesce(json_extract(c.payload, '$.request.port'), 0)";
  const std::string path   = "coalesce(json_extract(c.payload, '$.request.path'), '')";

  const std::string url = scheme + " || '://' || " + host + " || CASE WHEN (" + scheme + " = 'http' AND " + port +
                          " = 80) OR (" + scheme + " = 'https' AND " + port + " = 443) THEN '' ELSE ':' || " + port +
                          " END || " + path;

  return "CREATE VIEW flow_view AS SELECT "
         "c.flow_id AS flow_id, "
         "c.id AS seq, "
         "coalesce(json_extract(c.payload, '$.type'), 'http') AS flow_type, "
         "json_extract(c.payload, '$.timestamp_created') AS timestamp_created, "
         "json_extract(c.payload, '$.request.method') AS method, " +
         scheme + " AS scheme, " + host + " AS host, " + port + " AS port, " + path + " AS path, " + url +
         " AS url, "
         "json_extract(c.payload, '$.response.status_code') AS status_code, "
         "json_extract(c.payload, '$.response.reason') AS reason, " +
         ContentType("request") + " AS request_content_type, " + ContentType("response") +
         " AS response_content_type, " + ContentSize("request_content") + " AS request_size, " +
         ContentSize("response_content") + " AS response_size, " + ContentSize("request_content") + " + " +
         ContentSize("response_content") +
         " AS total_size, "
         "coalesce(json_extract(c.payload, '$.response.timestamp_end'), json_extract(c.payload, "
         "'$.request.timestamp_end')) - coalesce(json_extract(c.payload, '$.request.timestamp_start'), 0) AS duration, "
         "coalesce(json_extract(c.payload, '$.marked'), '') AS marked, "
         "coalesce(json_extract(c.payload, '$.comment'), '') AS comment, "
         "json_extract(c.payload, '$.is_replay') AS is_replay, "
         "json_type(c.payload, '$.response') IS NOT NULL AS has_response, "
         "json_type(c.payload, '$.error') IS NOT NULL AS has_error, "
         "json_extract(c.payload, '$.error.msg') AS error_msg, " +
         PeerAddress("client_conn", "peername") + " AS client_address, " + PeerAddress("server_conn", "address") +
         " AS server_address, "
         "json_extract(c.payload, '$.metadata') AS metadata "
         "FROM chunk AS c WHERE c.kind = 'http_flow';";
}

constexpr const char* kCreateIndexes =
    "CREATE INDEX flow_status_code ON chunk(json_extract(payload, '$.response.status_code')) "
    "WHERE kind = 'http_flow';"
    "CREATE INDEX flow_method ON chunk(json_extract(payload, '$.request.method')) "
    "WHERE kind = 'http_flow';"
    "CREATE INDEX flow_timestamp_created ON chunk(json_extract(payload, '$.timestamp_created')) "
    "WHERE kind = 'http_flow';"
    "CREATE INDEX flow_marked ON chunk(coalesce(json_extract(payload, '$.marked'), '')) "
    "WHERE kind = 'http_flow';";

// ------------------------------------------------------------
// Teardown
// ------------------------------------------------------------

std::string QuoteIdentifier(const std::string& name) {
  std::string quoted = "\"";
  for (char c : name) {
    if (c == '"') quoted += '"';
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

int DropOrder(const std::string& type) {
  if (type == "view" || type == "trigger") return 0;
  if (type == "index") return 1;
  return 2;
}

// Whatever is in sqlite_master besides the chunk table: ours from an older
// version, or something nobody should have put there.
std::vector<std::pair<std::string, std::string>> DerivedObjects(SqliteDB& db) {
  auto stmt = db.Prepare(
      "SELECT type, name FROM main.sqlite_master "
      "WHERE name <> 'chunk' AND name NOT LIKE 'sqlite\\_%' ESCAPE '\\' "
      "AND type IN ('view', 'trigger', 'index', 'table');");

  std::vector<std::pair<std::string, std::string>> objects;
  int rc;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    objects.emplace_back(reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 0)),
                         reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 1)));
  }
  if (rc != SQLITE_DONE) {
    throw util::StoreError(std::string("list schema objects: ") + sqlite3_errmsg(db.Handle()));
  }
  return objects;
}

void DropDerivedObjects(SqliteDB& db) {
  auto objects = DerivedObjects(db);
  for (int pass = 0; pass <= 2; ++pass) {
    for (const auto& [type, name] : objects) {
      if (DropOrder(type) != pass) continue;
      std::string keyword = type == "view" ? "VIEW" : type == "trigger" ? "TRIGGER" : type == "index" ? "INDEX" : "TABLE";
      // dropping a table takes its triggers and indexes with it
      db.Exec("DROP " + keyword + " IF EXISTS main." + QuoteIdentifier(name) + ";");
    }
  }
}

} // namespace

void RebuildDerivedObjects(const std::shared_ptr<db::sqlite::SqliteDB>& db) {
  db::sqlite::SqliteTransaction tx(db);

  DropDerivedObjects(*db);

  db->Exec(CreateFlowHeaderTable());
  db->Exec(CreateFlowHeaderTriggers());
  db->Exec(CreateFlowView());
  db->Exec(kCreateIndexes);
  db->Exec(PopulateFlowHeader());
  db->SetUserVersion(kDerivedSchemaVersion);

  tx.Commit();
}

bool EnsureSchema(const std::shared_ptr<db::sqlite::SqliteDB>& db) {
  db->Exec(db::sql::CreateChunkTable());

  const int stored = db->UserVersion();
  if (stored == kDerivedSchemaVersion) {
    return false;
  }

  FLOWSTORE_LOG_INFO("rebuilding derived schema",
                     {observability::StringField("path", db->Options().path),
                      observability::IntField("stored_version", stored),
                      observability::IntField("expected_version", kDerivedSchemaVersion)});

  RebuildDerivedObjects(db);
  return true;
}

} // namespace flowstore::view
