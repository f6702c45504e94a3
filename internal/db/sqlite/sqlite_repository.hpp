#pragma once

#include <memory>

#include "internal/db/api/chunk_repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace flowstore::db::sqlite {

class SqliteRepository final : public db::ChunkRepository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertChunk(Transaction&, const model::ChunkRecord&) override;
  std::vector<model::ChunkRecord> GetChunks(Transaction&, const std::string& flow_id) override;
  Result DeleteFlow(Transaction&, const std::string& flow_id) override;
  Result DeleteAll(Transaction&) override;

  static Result Translate(sqlite3* db, int rc);

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
};

}
