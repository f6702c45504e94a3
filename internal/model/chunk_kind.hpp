#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace flowstore::model {

/*
  Kinds of chunk a flow is split into.

  The string form is what the chunk table stores; new kinds may be added
  but existing names never change.
*/
enum class ChunkKind : std::uint8_t {
  kHttpFlow = 0,
  kClientConn = 1,
  kServerConn = 2,
  kRequestContent = 3,
  kResponseContent = 4,
};

constexpr std::string_view ToString(ChunkKind kind) {
  switch (kind) {
    case ChunkKind::kHttpFlow:
      return "http_flow";
    case ChunkKind::kClientConn:
      return "client_conn";
    case ChunkKind::kServerConn:
      return "server_conn";
    case ChunkKind::kRequestContent:
      return "request_content";
    case ChunkKind::kResponseContent:
      return "response_content";
  }
  return "unknown";
}

constexpr std::optional<ChunkKind> ChunkKindFromString(std::string_view name) {
  if (name == "http_flow") return ChunkKind::kHttpFlow;
  if (name == "client_conn") return ChunkKind::kClientConn;
  if (name == "server_conn") return ChunkKind::kServerConn;
  if (name == "request_content") return ChunkKind::kRequestContent;
  if (name == "response_content") return ChunkKind::kResponseContent;
  return std::nullopt;
}

// Content chunks carry raw bytes; all other kinds carry JSON text.
constexpr bool IsContentKind(ChunkKind kind) {
  return kind == ChunkKind::kRequestContent || kind == ChunkKind::kResponseContent;
}

} // namespace flowstore::model
