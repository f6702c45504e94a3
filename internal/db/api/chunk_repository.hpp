#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/chunk_record.hpp"

namespace flowstore::db {

/*
  Chunk repository.

  GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - (flow_id, kind) is unique; UpsertChunk replaces the payload in place

  Filtering and sorting never come through here; they run against the
  derived views.
*/

class ChunkRepository {
 public:
  virtual ~ChunkRepository() = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  virtual Result UpsertChunk(Transaction&, const model::ChunkRecord&) = 0;

  // All chunks of one flow, in no particular order. Empty if unknown.
  virtual std::vector<model::ChunkRecord> GetChunks(Transaction&, const std::string& flow_id) = 0;

  // NotFound when the flow has no chunks.
  virtual Result DeleteFlow(Transaction&, const std::string& flow_id) = 0;

  virtual Result DeleteAll(Transaction&) = 0;
};

} // namespace flowstore::db
