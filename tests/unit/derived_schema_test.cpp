#include "internal/view/derived_schema.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <tuple>
#include <vector>

#include "internal/codec/chunk_codec.hpp"
#include "internal/db/sqlite/search_function.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "test_flows.hpp"

namespace {

using flowstore::db::sqlite::SqliteDB;
using flowstore::db::sqlite::SqliteOptions;
using flowstore::db::sqlite::SqliteRepository;
using flowstore::testing::MakeHttpFlow;

using ChunkRow = std::tuple<std::int64_t, std::string, std::string, std::string>;

std::shared_ptr<SqliteDB> OpenDb(const std::string& path) {
  SqliteOptions options;
  options.path = path;
  auto db      = std::make_shared<SqliteDB>(options);
  flowstore::db::sqlite::RegisterSearchFunction(*db);
  return db;
}

std::string Text(SqliteDB& db, const std::string& sql) {
  auto stmt = db.Prepare(sql);
  const int rc = sqlite3_step(stmt.get());
  assert(rc == SQLITE_ROW);
  const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 0));
  return text ? std::string(text, sqlite3_column_bytes(stmt.get(), 0)) : std::string("<null>");
}

std::int64_t Int(SqliteDB& db, const std::string& sql) {
  auto stmt = db.Prepare(sql);
  const int rc = sqlite3_step(stmt.get());
  assert(rc == SQLITE_ROW);
  return sqlite3_column_int64(stmt.get(), 0);
}

std::vector<ChunkRow> ChunkRows(SqliteDB& db) {
  auto stmt = db.Prepare("SELECT id, flow_id, kind, payload FROM chunk ORDER BY id;");
  std::vector<ChunkRow> rows;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    const auto* payload = static_cast<const char*>(sqlite3_column_blob(stmt.get(), 3));
    rows.emplace_back(sqlite3_column_int64(stmt.get(), 0), reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 1)),
                      reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 2)),
                      payload ? std::string(payload, sqlite3_column_bytes(stmt.get(), 3)) : std::string());
  }
  return rows;
}

void PutFlow(const std::shared_ptr<SqliteDB>& db, const flowstore::model::HttpFlow& flow) {
  SqliteRepository repository(db);
  auto tx = repository.Begin();
  for (const auto& chunk : flowstore::codec::EncodeHttpFlow(flow)) {
    const auto result = repository.UpsertChunk(*tx, chunk);
    assert(result);
  }
  tx->Commit();
}

bool Exists(SqliteDB& db, const std::string& name) {
  return Int(db, "SELECT count(*) FROM sqlite_master WHERE name = '" + name + "';") == 1;
}

void TestFreshDatabaseGetsDerivedObjects() {
  auto db = OpenDb(":memory:");

  assert(flowstore::view::EnsureSchema(db));
  assert(db->UserVersion() == flowstore::view::kDerivedSchemaVersion);

  for (const char* name : {"chunk", "flow_header", "flow_view", "flow_header_insert", "flow_header_update",
                           "flow_header_delete", "flow_status_code", "flow_method", "flow_timestamp_created",
                           "flow_marked"}) {
    assert(Exists(*db, name));
  }

  // second open finds the marker and leaves everything alone
  assert(!flowstore::view::EnsureSchema(db));
}

void TestStaleSchemaIsRebuiltWithoutTouchingChunks() {
  const auto path = flowstore::testing::TempPath("derived_schema", "stale.db").string();

  std::vector<ChunkRow> before;
  {
    auto db = OpenDb(path);
    flowstore::view::EnsureSchema(db);
    PutFlow(db, MakeHttpFlow("flow-a", 1700000001.0));
    PutFlow(db, MakeHttpFlow("flow-b", 1700000002.0));
    before = ChunkRows(*db);

    // simulate an older build: different view, leftovers, old marker
    db->Exec("DROP VIEW flow_view;");
    db->Exec("CREATE VIEW flow_view AS SELECT 'bogus' AS flow_id;");
    db->Exec("CREATE TABLE scratch (x INTEGER);");
    db->Exec("CREATE INDEX scratch_x ON scratch(x);");
    db->Exec("DELETE FROM flow_header;");
    db->SetUserVersion(0);
  }

  auto db = OpenDb(path);
  assert(flowstore::view::EnsureSchema(db));
  assert(db->UserVersion() == flowstore::view::kDerivedSchemaVersion);

  assert(!Exists(*db, "scratch"));
  assert(!Exists(*db, "scratch_x"));
  assert(Int(*db, "SELECT count(*) FROM flow_view;") == 2);
  assert(Int(*db, "SELECT count(*) FROM flow_view WHERE flow_id = 'bogus';") == 0);
  assert(Int(*db, "SELECT count(*) FROM flow_header;") == 2);

  assert(ChunkRows(*db) == before);
}

void TestTriggersMaintainFlowHeader() {
  auto db = OpenDb(":memory:");
  flowstore::view::EnsureSchema(db);

  auto flow = MakeHttpFlow("flow-h");
  flow.request.headers.push_back({"X-Trace", "one"});
  PutFlow(db, flow);

  assert(Text(*db, "SELECT request FROM flow_header WHERE flow_id = 'flow-h';") ==
         "Host=example.com\nAccept=*/*\nX-Trace=one\n");
  assert(Text(*db, "SELECT response FROM flow_header WHERE flow_id = 'flow-h';") ==
         "Content-Type=text/html\nContent-Length=11\n");

  flow.request.headers.back().value = "two";
  PutFlow(db, flow);
  assert(Text(*db, "SELECT request FROM flow_header WHERE flow_id = 'flow-h';").find("X-Trace=two\n") != std::string::npos);
  assert(Int(*db, "SELECT count(*) FROM flow_header;") == 1);

  db->Exec("DELETE FROM chunk WHERE flow_id = 'flow-h';");
  assert(Int(*db, "SELECT count(*) FROM flow_header;") == 0);
}

void TestViewExtractsFields() {
  auto db = OpenDb(":memory:");
  flowstore::view::EnsureSchema(db);

  auto flow    = MakeHttpFlow("flow-v", 1700000000.0);
  flow.marked  = ":star:";
  flow.comment = "look here";
  PutFlow(db, flow);

  auto other               = MakeHttpFlow("flow-w", 1700000005.0);
  other.request.port       = 8443;
  other.request.method     = "POST";
  other.request.content    = std::string("{\"k\":1}");
  other.response->status_code = 404;
  other.error              = flowstore::model::Error{"timeout", 1700000006.0};
  other.is_replay          = "request";
  PutFlow(db, other);

  const std::string where = " FROM flow_view WHERE flow_id = 'flow-v';";
  assert(Text(*db, "SELECT flow_type" + where) == "http");
  assert(Text(*db, "SELECT method" + where) == "GET");
  assert(Text(*db, "SELECT url" + where) == "https://example.com/index.html");
  assert(Int(*db, "SELECT status_code" + where) == 200);
  assert(Text(*db, "SELECT response_content_type" + where) == "text/html");
  assert(Text(*db, "SELECT request_content_type" + where) == "<null>");
  assert(Int(*db, "SELECT request_size" + where) == 0);
  assert(Int(*db, "SELECT response_size" + where) == 11);
  assert(Int(*db, "SELECT total_size" + where) == 11);
  assert(Text(*db, "SELECT duration" + where) == "1.5");
  assert(Text(*db, "SELECT marked" + where) == ":star:");
  assert(Text(*db, "SELECT comment" + where) == "look here");
  assert(Int(*db, "SELECT has_response" + where) == 1);
  assert(Int(*db, "SELECT has_error" + where) == 0);
  assert(Text(*db, "SELECT is_replay" + where) == "<null>");
  assert(Text(*db, "SELECT client_address" + where) == "10.0.0.1:51000");
  assert(Text(*db, "SELECT server_address" + where) == "example.com:443");

  const std::string other_where = " FROM flow_view WHERE flow_id = 'flow-w';";
  assert(Text(*db, "SELECT url" + other_where) == "https://example.com:8443/index.html");
  assert(Text(*db, "SELECT method" + other_where) == "POST");
  assert(Int(*db, "SELECT status_code" + other_where) == 404);
  assert(Int(*db, "SELECT request_size" + other_where) == 7);
  assert(Int(*db, "SELECT total_size" + other_where) == 18);
  assert(Int(*db, "SELECT has_error" + other_where) == 1);
  assert(Text(*db, "SELECT error_msg" + other_where) == "timeout");
  assert(Text(*db, "SELECT is_replay" + other_where) == "request");
  assert(Text(*db, "SELECT marked" + other_where) == "");

  // insertion order breaks ties
  assert(Int(*db, "SELECT count(*) FROM flow_view AS a JOIN flow_view AS b ON a.seq < b.seq "
                  "WHERE a.flow_id = 'flow-v' AND b.flow_id = 'flow-w';") == 1);
}

} // namespace

int main() {
  TestFreshDatabaseGetsDerivedObjects();
  TestStaleSchemaIsRebuiltWithoutTouchingChunks();
  TestTriggersMaintainFlowHeader();
  TestViewExtractsFields();

  std::cout << "flowstore_unit_derived_schema: pass\n";
  return 0;
}
