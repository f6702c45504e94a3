#pragma once

#include <cstdint>
#include <vector>

#include "internal/db/model/chunk_record.hpp"
#include "internal/model/flow.hpp"

namespace flowstore::codec {

/*
  Chunk codec.

  A flow is persisted as a handful of independently keyed chunks:

    http_flow         JSON  request/response/error metadata, flags, headers
    client_conn       JSON  client connection
    server_conn       JSON  server connection
    request_content   bytes request body    (only when present)
    response_content  bytes response body   (only when present)

  Both directions are pure transforms; storage is somebody else's problem.
*/

// Written into every metadata payload as "schema_version".
// Payloads without it are legacy (version 1) and get upgraded on decode.
inline constexpr std::uint32_t kPayloadSchemaVersion = 2;

// Throws util::UnsupportedFlowType for anything but an HTTP flow.
std::vector<db::model::ChunkRecord> Encode(const model::Flow& flow);

// Request/status line parts, headers and ALPN may be arbitrary bytes. Other
// text fields must be valid UTF-8 or util::EncodeError is thrown.
std::vector<db::model::ChunkRecord> EncodeHttpFlow(const model::HttpFlow& flow);

// Chunks may arrive in any order. Throws util::DecodeError when the set is
// incomplete, mixes flows, repeats a kind, names an unknown kind, or holds
// a payload that does not validate.
model::HttpFlow Decode(const std::vector<db::model::ChunkRecord>& chunks);

} // namespace flowstore::codec
