#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/model/chunk_kind.hpp"
#include "internal/util/errors.hpp"

namespace flowstore::db::sqlite {

using flowstore::db::ErrorCode;
using flowstore::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

static void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? std::string(reinterpret_cast<const char*>(t), sqlite3_column_bytes(st, col)) : "";
}

static std::string ColBytes(sqlite3_stmt* st, int col) {
    const void* b = sqlite3_column_blob(st, col);
    return b ? std::string(static_cast<const char*>(b), sqlite3_column_bytes(st, col)) : "";
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_FULL:
            return Result::Err(ErrorCode::Full, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        case SQLITE_READONLY:
            return Result::Err(ErrorCode::ReadOnly, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Chunks
// ------------------------------------------------------------------

Result SqliteRepository::UpsertChunk(Transaction& t, const model::ChunkRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::UPSERT_CHUNK, -1, &st, nullptr) != SQLITE_OK)
        return Translate(db, sqlite3_errcode(db));

    BindText(st, 1, r.flow_id);
    BindText(st, 2, r.kind);

    // JSON must stay TEXT so json_extract() reads it; bodies stay BLOB.
    const auto kind = flowstore::model::ChunkKindFromString(r.kind);
    if (kind && flowstore::model::IsContentKind(*kind)) {
        BindBlob(st, 3, r.payload);
    } else {
        BindText(st, 3, r.payload);
    }

    // translate before finalize resets the connection's error state
    auto result = Translate(db, sqlite3_step(st));
    sqlite3_finalize(st);

    return result;
}

std::vector<model::ChunkRecord>
SqliteRepository::GetChunks(Transaction& t, const std::string& flow_id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::SELECT_CHUNKS, -1, &st, nullptr) != SQLITE_OK)
        throw util::StoreError(std::string("select chunks: ") + sqlite3_errmsg(db));

    BindText(st, 1, flow_id);

    std::vector<model::ChunkRecord> out;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        model::ChunkRecord r;
        r.flow_id = ColText(st, 0);
        r.kind = ColText(st, 1);
        r.payload = ColBytes(st, 2);
        out.push_back(std::move(r));
    }
    sqlite3_finalize(st);

    if (rc != SQLITE_DONE)
        throw util::StoreError(std::string("select chunks: ") + sqlite3_errmsg(db));
    return out;
}

Result SqliteRepository::DeleteFlow(Transaction& t, const std::string& flow_id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::DELETE_FLOW, -1, &st, nullptr) != SQLITE_OK)
        return Translate(db, sqlite3_errcode(db));

    BindText(st, 1, flow_id);
    auto result = Translate(db, sqlite3_step(st));
    sqlite3_finalize(st);

    if (result && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "no chunks for flow " + flow_id);
    return result;
}

Result SqliteRepository::DeleteAll(Transaction& t) {
    auto* db = TX(t).Handle();

    char* err = nullptr;
    int rc = sqlite3_exec(db, sql::DELETE_ALL, nullptr, nullptr, &err);
    sqlite3_free(err);

    return Translate(db, rc);
}

}
