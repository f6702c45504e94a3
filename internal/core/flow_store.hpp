#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/chunk_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/filter/filter_ast.hpp"
#include "internal/filter/filter_compiler.hpp"
#include "internal/model/flow.hpp"
#include "internal/query/query_executor.hpp"

namespace flowstore::core {

/*
  FlowStore

  The handle everything else goes through: writes chunk sets, answers
  filter queries against the derived views and reconstructs flows for the
  visible page.

  Built by factory::OpenFlowStore, which registers search() and brings the
  derived schema up to date before the handle is returned.

  One connection, no internal parallelism; calls are serialized. Every
  operation after Close() throws util::StoreError.
*/
class FlowStore {
 public:
  FlowStore(std::shared_ptr<db::sqlite::SqliteDB> db, std::shared_ptr<db::ChunkRepository> repository);
  ~FlowStore();

  FlowStore(const FlowStore&)            = delete;
  FlowStore& operator=(const FlowStore&) = delete;

  // Upserts all rows in one transaction: all or nothing.
  void Put(const std::vector<db::model::ChunkRecord>& rows);

  // Encode + Put. Throws util::EncodeError (UnsupportedFlowType for non-HTTP
  // flows) when the snapshot cannot be written.
  void Record(const model::Flow& flow);

  // nullopt when the store holds nothing for flow_id.
  // Throws util::DecodeError when the chunk set does not decode.
  std::optional<model::HttpFlow> Load(const std::string& flow_id);

  // Decodes flows in the given order. Unknown ids and flows that fail to
  // decode are skipped and logged.
  std::vector<model::HttpFlow> LoadPage(const std::vector<std::string>& flow_ids);

  // Matching ids, sorted and paged. Blank filter text matches every flow.
  std::vector<std::string> Query(std::string_view filter, const query::PageRequest& page = {});
  std::vector<std::string> Query(const filter::FilterNode& filter, const query::PageRequest& page = {});

  std::int64_t Count(std::string_view filter);
  std::int64_t Count(const filter::FilterNode& filter);

  // Parse + compile without touching the database.
  static filter::CompiledPredicate Compile(std::string_view filter);

  // false when the flow was not stored
  bool Remove(const std::string& flow_id);

  // Drops every flow.
  void Clear();

  // Copies the chunks of every matching flow into a new store at `path`.
  // The target must not already contain a chunk table. Either every row is
  // copied or the target is left untouched; a target file created by a
  // failed copy is removed again. Returns the number of chunk rows.
  std::int64_t CopyTo(std::string_view filter, const std::string& path);
  std::int64_t CopyTo(const filter::FilterNode& filter, const std::string& path);

  void Close();
  bool IsOpen() const;

 private:
  void RequireOpen() const;
  void PutLocked(const std::vector<db::model::ChunkRecord>& rows);
  std::int64_t CopyLocked(const filter::CompiledPredicate& predicate, const std::string& path);

  mutable std::mutex mutex_;

  std::shared_ptr<db::sqlite::SqliteDB>  db_;
  std::shared_ptr<db::ChunkRepository>   repository_;
  std::unique_ptr<query::QueryExecutor>  executor_;
};

} // namespace flowstore::core
