#pragma once

#include <string>

namespace flowstore::db::model {

/*
  One row of the chunk table.

  kind is kept as text so that rows written by newer versions with kinds
  this build does not know can still be read, copied and deleted.
  payload is JSON text for metadata kinds and raw bytes for content kinds.
*/

struct ChunkRecord {
  std::string flow_id;
  std::string kind;
  std::string payload;

  bool operator==(const ChunkRecord&) const = default;
};

} // namespace flowstore::db::model
