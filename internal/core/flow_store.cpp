#include "flow_store.hpp"

#include <filesystem>
#include <stdexcept>
#include <system_error>

#include "internal/codec/chunk_codec.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/filter/filter_parser.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace flowstore::core {
namespace {

// attach name for the target of CopyTo
constexpr const char* kCopySchema = "flowstore_copy";

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  std::string message = context + ": " + std::string(db::ToString(result.code));
  if (!result.message.empty()) {
    message += ": " + result.message;
  }
  throw util::StoreError(message);
}

bool IsBlank(std::string_view text) {
  return text.find_first_not_of(" \t\r\n\f\v") == std::string_view::npos;
}

} // namespace

FlowStore::FlowStore(std::shared_ptr<db::sqlite::SqliteDB> db, std::shared_ptr<db::ChunkRepository> repository)
    : db_(std::move(db)), repository_(std::move(repository)), executor_(std::make_unique<query::QueryExecutor>(db_)) {
}

FlowStore::~FlowStore() = default;

void FlowStore::RequireOpen() const {
  if (!db_) {
    throw util::StoreError("flow store is closed");
  }
}

// ------------------------------------------------------------
// Writes
// ------------------------------------------------------------

void FlowStore::PutLocked(const std::vector<db::model::ChunkRecord>& rows) {
  if (rows.empty()) {
    return;
  }

  auto tx = repository_->Begin();
  for (const auto& row : rows) {
    ThrowIfDbError(repository_->UpsertChunk(*tx, row), "put " + row.kind + " chunk of flow " + row.flow_id);
  }
  tx->Commit();
}

void FlowStore::Put(const std::vector<db::model::ChunkRecord>& rows) {
  std::lock_guard<std::mutex> lock(mutex_);
  RequireOpen();
  PutLocked(rows);
}

void FlowStore::Record(const model::Flow& flow) {
  auto rows = codec::Encode(flow);

  std::lock_guard<std::mutex> lock(mutex_);
  RequireOpen();
  PutLocked(rows);
}

bool FlowStore::Remove(const std::string& flow_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  RequireOpen();

  auto tx     = repository_->Begin();
  auto result = repository_->DeleteFlow(*tx, flow_id);
  if (result.code == db::ErrorCode::NotFound) {
    tx->Rollback();
    return false;
  }
  ThrowIfDbError(result, "remove flow " + flow_id);
  tx->Commit();
  return true;
}

void FlowStore::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  RequireOpen();

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->DeleteAll(*tx), "clear flows");
  tx->Commit();

  FLOWSTORE_LOG_INFO("cleared flow store", {observability::StringField("path", db_->Options().path)});
}

// ------------------------------------------------------------
// Reads
// ------------------------------------------------------------

std::optional<model::HttpFlow> FlowStore::Load(const std::string& flow_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  RequireOpen();

  auto tx     = repository_->Begin();
  auto chunks = repository_->GetChunks(*tx, flow_id);
  tx->Commit();

  if (chunks.empty()) {
    return std::nullopt;
  }
  return codec::Decode(chunks);
}

std::vector<model::HttpFlow> FlowStore::LoadPage(const std::vector<std::string>& flow_ids) {
  std::lock_guard<std::mutex> lock(mutex_);
  RequireOpen();

  std::vector<std::vector<db::model::ChunkRecord>> chunk_sets;
  chunk_sets.reserve(flow_ids.size());
  {
    auto tx = repository_->Begin();
    for (const auto& id : flow_ids) {
      chunk_sets.push_back(repository_->GetChunks(*tx, id));
    }
    tx->Commit();
  }

  std::vector<model::HttpFlow> flows;
  flows.reserve(flow_ids.size());
  for (std::size_t i = 0; i < flow_ids.size(); ++i) {
    if (chunk_sets[i].empty()) {
      FLOWSTORE_LOG_DEBUG("flow vanished before load", {observability::StringField("flow_id", flow_ids[i])});
      continue;
    }
    try {
      flows.push_back(codec::Decode(chunk_sets[i]));
    } catch (const util::DecodeError& e) {
      FLOWSTORE_LOG_WARN("skipping undecodable flow",
                         {observability::StringField("flow_id", flow_ids[i]), observability::StringField("error", e.what())});
    }
  }
  return flows;
}

filter::CompiledPredicate FlowStore::Compile(std::string_view filter) {
  if (IsBlank(filter)) {
    return filter::Compile(*filter::MakeUnary("all"));
  }
  return filter::Compile(*filter::Parse(filter));
}

std::vector<std::string> FlowStore::Query(std::string_view filter, const query::PageRequest& page) {
  auto predicate = Compile(filter);

  std::lock_guard<std::mutex> lock(mutex_);
  RequireOpen();
  return executor_->SelectIds(predicate, page);
}

std::vector<std::string> FlowStore::Query(const filter::FilterNode& filter, const query::PageRequest& page) {
  auto predicate = filter::Compile(filter);

  std::lock_guard<std::mutex> lock(mutex_);
  RequireOpen();
  return executor_->SelectIds(predicate, page);
}

std::int64_t FlowStore::Count(std::string_view filter) {
  auto predicate = Compile(filter);

  std::lock_guard<std::mutex> lock(mutex_);
  RequireOpen();
  return executor_->Count(predicate);
}

std::int64_t FlowStore::Count(const filter::FilterNode& filter) {
  auto predicate = filter::Compile(filter);

  std::lock_guard<std::mutex> lock(mutex_);
  RequireOpen();
  return executor_->Count(predicate);
}

// ------------------------------------------------------------
// Copy-out
// ------------------------------------------------------------

std::int64_t FlowStore::CopyTo(std::string_view filter, const std::string& path) {
  auto predicate = Compile(filter);

  std::lock_guard<std::mutex> lock(mutex_);
  RequireOpen();
  return CopyLocked(predicate, path);
}

std::int64_t FlowStore::CopyTo(const filter::FilterNode& filter, const std::string& path) {
  auto predicate = filter::Compile(filter);

  std::lock_guard<std::mutex> lock(mutex_);
  RequireOpen();
  return CopyLocked(predicate, path);
}

std::int64_t FlowStore::CopyLocked(const filter::CompiledPredicate& predicate, const std::string& path) {
  std::error_code exists_error;
  const bool      created = !std::filesystem::exists(path, exists_error) && !exists_error;

  // ATTACH is not allowed inside a transaction
  db_->Attach(path, kCopySchema);

  std::int64_t copied = 0;
  try {
    db::sqlite::SqliteTransaction tx(db_);
    db_->Exec(db::sql::CreateChunkTable(kCopySchema, /*if_not_exists=*/false));
    copied = executor_->CopyMatching(predicate, kCopySchema);
    tx.Commit();
  } catch (const std::exception& e) {
    FLOWSTORE_LOG_ERROR("copy-out failed",
                        {observability::StringField("target", path), observability::StringField("error", e.what())});
    bool detached = true;
    try {
      db_->Detach(kCopySchema);
    } catch (const util::StoreError& detach_error) {
      detached = false;
      FLOWSTORE_LOG_WARN("detach after failed copy-out failed",
                         {observability::StringField("target", path), observability::StringField("error", detach_error.what())});
    }
    // still attached: the file stays until the connection lets go of it
    if (created && detached) {
      std::error_code remove_error;
      std::filesystem::remove(path, remove_error);
      if (remove_error) {
        FLOWSTORE_LOG_WARN("could not remove target of failed copy-out",
                           {observability::StringField("target", path),
                            observability::StringField("error", remove_error.message())});
      }
    }
    throw;
  }

  db_->Detach(kCopySchema);

  FLOWSTORE_LOG_INFO("copied flows", {observability::StringField("target", path), observability::IntField("chunks", copied)});
  return copied;
}

// ------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------

void FlowStore::Close() {
  std::lock_guard<std::mutex> lock(mutex_);
  executor_.reset();
  repository_.reset();
  db_.reset();
}

bool FlowStore::IsOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return db_ != nullptr;
}

} // namespace flowstore::core
