#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "internal/model/chunk_kind.hpp"

namespace flowstore::codec {

/*
  Payload upgrades.

  The chunk table never migrates; old payload shapes are rewritten on read.
  Version 1 is the shape written before payloads had a schema:

    - headers as [name, value] arrays
    - addresses as [host, port] arrays
    - certificates as PEM text instead of base64 bytes
    - explicit nulls for absent values
    - content chunks implied by the presence of request/response
*/

// schema_version of a metadata payload; 1 when the field is absent.
// Throws util::DecodeError when the payload is not a JSON object.
std::uint32_t PayloadSchemaVersion(std::string_view json);

// Returns the payload rewritten to the current schema version.
// Throws util::DecodeError for malformed JSON or versions newer than this build.
std::string UpgradePayload(model::ChunkKind kind, std::string_view json);

} // namespace flowstore::codec
