#include "internal/codec/chunk_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>

#include "flowstore/v1.hpp"
#include "internal/codec/payload_compat.hpp"
#include "internal/model/chunk_kind.hpp"
#include "internal/util/encoding.hpp"
#include "internal/util/errors.hpp"

namespace flowstore::codec {
namespace {

using db::model::ChunkRecord;
using model::ChunkKind;

// ------------------------------------------------------------------
// JSON <-> message
// ------------------------------------------------------------------

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize " + message.GetTypeName() + ": " + std::string(status.message()));
  }
  return json;
}

template <typename Message>
Message ParsePayload(ChunkKind kind, const ChunkRecord& chunk) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  std::string json = chunk.payload;
  if (PayloadSchemaVersion(chunk.payload) != kPayloadSchemaVersion) {
    // Older shape: upgrade, then validate leniently since legacy writers
    // stored fields the schema never adopted. Newer versions throw here.
    json                          = UpgradePayload(kind, chunk.payload);
    options.ignore_unknown_fields = true;
  }

  Message message;
  auto    status = google::protobuf::util::JsonStringToMessage(json, &message, options);
  if (!status.ok()) {
    throw util::DecodeError("invalid " + chunk.kind + " payload for flow " + chunk.flow_id + ": " +
                            std::string(status.message()));
  }
  return message;
}

// ------------------------------------------------------------------
// model -> proto
// ------------------------------------------------------------------

// Fields the SQL views match on as text; anything else cannot be stored.
const std::string& RequireText(const std::string& value, const char* field, const std::string& flow_id) {
  if (!util::IsValidUtf8(value)) {
    throw util::EncodeError(std::string(field) + " of flow " + flow_id + " is not valid UTF-8");
  }
  return value;
}

// Text when it is valid UTF-8, raw bytes otherwise.
template <typename SetText, typename SetRaw>
void SetBytes(const model::Bytes& value, SetText set_text, SetRaw set_raw) {
  if (util::IsValidUtf8(value)) {
    set_text(value);
  } else {
    set_raw(value);
  }
}

void ToProto(const model::Header& header, v1::Header* out) {
  if (util::IsValidUtf8(header.name)) {
    out->set_name(header.name);
  } else {
    out->set_raw_name(header.name);
  }
  if (util::IsValidUtf8(header.value)) {
    out->set_value(header.value);
  } else {
    out->set_raw_value(header.value);
  }
}

void ToProto(const model::Address& address, const std::string& flow_id, v1::Address* out) {
  out->set_host(RequireText(address.host, "address host", flow_id));
  out->set_port(address.port);
}

v1::ConnectionChunk ToProto(const model::Connection& conn, const std::string& flow_id) {
  v1::ConnectionChunk out;
  out.set_schema_version(kPayloadSchemaVersion);
  out.set_id(RequireText(conn.id, "connection id", flow_id));
  if (conn.peername) ToProto(*conn.peername, flow_id, out.mutable_peername());
  if (conn.sockname) ToProto(*conn.sockname, flow_id, out.mutable_sockname());
  if (conn.address) ToProto(*conn.address, flow_id, out.mutable_address());
  out.set_tls_established(conn.tls_established);
  out.set_sni(RequireText(conn.sni, "sni", flow_id));
  SetBytes(
      conn.alpn, [&](const auto& v) { out.set_alpn(v); }, [&](const auto& v) { out.set_raw_alpn(v); });
  out.set_tls_version(RequireText(conn.tls_version, "tls_version", flow_id));
  out.set_cipher(RequireText(conn.cipher, "cipher", flow_id));
  for (const auto& cert : conn.certificate_list) {
    out.add_certificate_list(cert);
  }
  out.set_timestamp_start(conn.timestamp_start);
  if (conn.timestamp_end) out.set_timestamp_end(*conn.timestamp_end);
  return out;
}

void ToProto(const model::Request& request, const std::string& flow_id, v1::Request* out) {
  out->set_host(RequireText(request.host, "request host", flow_id));
  out->set_port(request.port);
  SetBytes(
      request.method, [&](const auto& v) { out->set_method(v); }, [&](const auto& v) { out->set_raw_method(v); });
  out->set_scheme(RequireText(request.scheme, "request scheme", flow_id));
  SetBytes(
      request.authority, [&](const auto& v) { out->set_authority(v); },
      [&](const auto& v) { out->set_raw_authority(v); });
  SetBytes(
      request.path, [&](const auto& v) { out->set_path(v); }, [&](const auto& v) { out->set_raw_path(v); });
  SetBytes(
      request.http_version, [&](const auto& v) { out->set_http_version(v); },
      [&](const auto& v) { out->set_raw_http_version(v); });
  for (const auto& h : request.headers) ToProto(h, out->add_headers());
  for (const auto& h : request.trailers) ToProto(h, out->add_trailers());
  out->set_timestamp_start(request.timestamp_start);
  if (request.timestamp_end) out->set_timestamp_end(*request.timestamp_end);
  out->set_has_content(request.content.has_value());
}

void ToProto(const model::Response& response, v1::Response* out) {
  SetBytes(
      response.http_version, [&](const auto& v) { out->set_http_version(v); },
      [&](const auto& v) { out->set_raw_http_version(v); });
  out->set_status_code(response.status_code);
  SetBytes(
      response.reason, [&](const auto& v) { out->set_reason(v); }, [&](const auto& v) { out->set_raw_reason(v); });
  for (const auto& h : response.headers) ToProto(h, out->add_headers());
  for (const auto& h : response.trailers) ToProto(h, out->add_trailers());
  out->set_timestamp_start(response.timestamp_start);
  if (response.timestamp_end) out->set_timestamp_end(*response.timestamp_end);
  out->set_has_content(response.content.has_value());
}

v1::HttpFlowChunk ToProto(const model::HttpFlow& flow) {
  v1::HttpFlowChunk out;
  out.set_schema_version(kPayloadSchemaVersion);
  out.set_id(flow.id);
  out.set_type("http");
  ToProto(flow.request, flow.id, out.mutable_request());
  if (flow.response) ToProto(*flow.response, out.mutable_response());
  if (flow.error) {
    out.mutable_error()->set_msg(RequireText(flow.error->msg, "error message", flow.id));
    out.mutable_error()->set_timestamp(flow.error->timestamp);
  }
  out.set_marked(RequireText(flow.marked, "marker", flow.id));
  out.set_comment(RequireText(flow.comment, "comment", flow.id));
  if (flow.is_replay) out.set_is_replay(RequireText(*flow.is_replay, "is_replay", flow.id));
  out.set_intercepted(flow.intercepted);
  out.set_timestamp_created(flow.timestamp_created);
  for (const auto& [key, value] : flow.metadata) {
    (*out.mutable_metadata())[RequireText(key, "metadata key", flow.id)] = RequireText(value, "metadata value", flow.id);
  }
  return out;
}

// ------------------------------------------------------------------
// proto -> model
// ------------------------------------------------------------------

model::Header FromProto(const v1::Header& header) {
  model::Header out;
  switch (header.name_field_case()) {
    case v1::Header::kName:
      out.name = header.name();
      break;
    case v1::Header::kRawName:
      out.name = header.raw_name();
      break;
    case v1::Header::NAME_FIELD_NOT_SET:
      break;
  }
  switch (header.value_field_case()) {
    case v1::Header::kValue:
      out.value = header.value();
      break;
    case v1::Header::kRawValue:
      out.value = header.raw_value();
      break;
    case v1::Header::VALUE_FIELD_NOT_SET:
      break;
  }
  return out;
}

model::Headers FromProto(const google::protobuf::RepeatedPtrField<v1::Header>& headers) {
  model::Headers out;
  out.reserve(headers.size());
  for (const auto& h : headers) out.push_back(FromProto(h));
  return out;
}

model::Address FromProto(const v1::Address& address) {
  return model::Address{address.host(), address.port()};
}

model::Connection FromProto(const v1::ConnectionChunk& conn) {
  model::Connection out;
  out.id = conn.id();
  if (conn.has_peername()) out.peername = FromProto(conn.peername());
  if (conn.has_sockname()) out.sockname = FromProto(conn.sockname());
  if (conn.has_address()) out.address = FromProto(conn.address());
  out.tls_established = conn.tls_established();
  out.sni             = conn.sni();
  out.alpn            = conn.alpn_field_case() == v1::ConnectionChunk::kRawAlpn ? conn.raw_alpn() : conn.alpn();
  out.tls_version     = conn.tls_version();
  out.cipher          = conn.cipher();
  out.certificate_list.assign(conn.certificate_list().begin(), conn.certificate_list().end());
  out.timestamp_start = conn.timestamp_start();
  if (conn.has_timestamp_end()) out.timestamp_end = conn.timestamp_end();
  return out;
}

model::Request FromProto(const v1::Request& request) {
  model::Request out;
  out.host            = request.host();
  out.port            = request.port();
  out.method          = request.method_field_case() == v1::Request::kRawMethod ? request.raw_method() : request.method();
  out.scheme          = request.scheme();
  out.authority =
      request.authority_field_case() == v1::Request::kRawAuthority ? request.raw_authority() : request.authority();
  out.path = request.path_field_case() == v1::Request::kRawPath ? request.raw_path() : request.path();
  out.http_version = request.http_version_field_case() == v1::Request::kRawHttpVersion ? request.raw_http_version()
                                                                                       : request.http_version();
  out.headers         = FromProto(request.headers());
  out.trailers        = FromProto(request.trailers());
  out.timestamp_start = request.timestamp_start();
  if (request.has_timestamp_end()) out.timestamp_end = request.timestamp_end();
  return out;
}

model::Response FromProto(const v1::Response& response) {
  model::Response out;
  out.http_version = response.http_version_field_case() == v1::Response::kRawHttpVersion ? response.raw_http_version()
                                                                                         : response.http_version();
  out.status_code = response.status_code();
  out.reason      = response.reason_field_case() == v1::Response::kRawReason ? response.raw_reason() : response.reason();
  out.headers         = FromProto(response.headers());
  out.trailers        = FromProto(response.trailers());
  out.timestamp_start = response.timestamp_start();
  if (response.has_timestamp_end()) out.timestamp_end = response.timestamp_end();
  return out;
}

// ------------------------------------------------------------------
// Reconstruction
// ------------------------------------------------------------------

/*
  Everything seen so far for one flow. Chunks are only parsed here; the
  model is assembled in Finish() once the owning http_flow chunk is known,
  so arrival order does not matter.
*/
struct DecodeContext {
  std::optional<std::string> flow_id;

  std::optional<v1::HttpFlowChunk>   http;
  std::optional<v1::ConnectionChunk> client_conn;
  std::optional<v1::ConnectionChunk> server_conn;
  std::optional<std::string>         request_content;
  std::optional<std::string>         response_content;
};

template <typename T>
void SetOnce(std::optional<T>& slot, T value, const ChunkRecord& chunk) {
  if (slot) {
    throw util::DecodeError("duplicate " + chunk.kind + " chunk for flow " + chunk.flow_id);
  }
  slot = std::move(value);
}

void Absorb(DecodeContext& ctx, const ChunkRecord& chunk) {
  if (!ctx.flow_id) {
    ctx.flow_id = chunk.flow_id;
  } else if (*ctx.flow_id != chunk.flow_id) {
    throw util::DecodeError("chunks of flows " + *ctx.flow_id + " and " + chunk.flow_id + " cannot be decoded together");
  }

  const auto kind = model::ChunkKindFromString(chunk.kind);
  if (!kind) {
    throw util::DecodeError("unknown chunk kind '" + chunk.kind + "' for flow " + chunk.flow_id);
  }

  switch (*kind) {
    case ChunkKind::kHttpFlow:
      SetOnce(ctx.http, ParsePayload<v1::HttpFlowChunk>(*kind, chunk), chunk);
      break;
    case ChunkKind::kClientConn:
      SetOnce(ctx.client_conn, ParsePayload<v1::ConnectionChunk>(*kind, chunk), chunk);
      break;
    case ChunkKind::kServerConn:
      SetOnce(ctx.server_conn, ParsePayload<v1::ConnectionChunk>(*kind, chunk), chunk);
      break;
    case ChunkKind::kRequestContent:
      SetOnce(ctx.request_content, chunk.payload, chunk);
      break;
    case ChunkKind::kResponseContent:
      SetOnce(ctx.response_content, chunk.payload, chunk);
      break;
  }
}

std::optional<model::Bytes> TakeContent(bool expected, std::optional<std::string>& chunk, const std::string& flow_id,
                                        ChunkKind kind) {
  if (!expected) return std::nullopt;
  if (!chunk) {
    throw util::DecodeError("flow " + flow_id + " is missing its " + std::string(model::ToString(kind)) + " chunk");
  }
  return std::move(*chunk);
}

model::HttpFlow Finish(DecodeContext& ctx) {
  if (!ctx.http) {
    throw util::DecodeError(ctx.flow_id ? "flow " + *ctx.flow_id + " has no http_flow chunk" : "no chunks to decode");
  }
  const auto& state = *ctx.http;
  if (!state.type().empty() && state.type() != "http") {
    throw util::DecodeError("flow " + *ctx.flow_id + " has unsupported type '" + state.type() + "'");
  }
  if (!state.id().empty() && state.id() != *ctx.flow_id) {
    throw util::DecodeError("http_flow chunk of " + *ctx.flow_id + " belongs to flow " + state.id());
  }

  model::HttpFlow flow;
  flow.id      = *ctx.flow_id;
  flow.request = FromProto(state.request());
  flow.request.content =
      TakeContent(state.request().has_content(), ctx.request_content, flow.id, ChunkKind::kRequestContent);

  if (state.has_response()) {
    flow.response = FromProto(state.response());
    flow.response->content =
        TakeContent(state.response().has_content(), ctx.response_content, flow.id, ChunkKind::kResponseContent);
  }
  if (state.has_error()) {
    flow.error = model::Error{state.error().msg(), state.error().timestamp()};
  }

  if (ctx.client_conn) flow.client_conn = FromProto(*ctx.client_conn);
  if (ctx.server_conn) flow.server_conn = FromProto(*ctx.server_conn);

  flow.marked  = state.marked();
  flow.comment = state.comment();
  if (state.has_is_replay()) flow.is_replay = state.is_replay();
  flow.intercepted       = state.intercepted();
  flow.timestamp_created = state.timestamp_created();
  for (const auto& entry : state.metadata()) {
    flow.metadata.emplace(entry.first, entry.second);
  }
  return flow;
}

ChunkRecord MakeChunk(const std::string& flow_id, ChunkKind kind, std::string payload) {
  return ChunkRecord{flow_id, std::string(model::ToString(kind)), std::move(payload)};
}

} // namespace

std::vector<ChunkRecord> EncodeHttpFlow(const model::HttpFlow& flow) {
  RequireText(flow.id, "id", flow.id);

  std::vector<ChunkRecord> chunks;
  chunks.reserve(5);

  // bodies travel as BLOBs, never inside JSON
  if (flow.request.content) {
    chunks.push_back(MakeChunk(flow.id, ChunkKind::kRequestContent, *flow.request.content));
  }
  if (flow.response && flow.response->content) {
    chunks.push_back(MakeChunk(flow.id, ChunkKind::kResponseContent, *flow.response->content));
  }

  chunks.push_back(MakeChunk(flow.id, ChunkKind::kClientConn, ToJson(ToProto(flow.client_conn, flow.id))));
  chunks.push_back(MakeChunk(flow.id, ChunkKind::kServerConn, ToJson(ToProto(flow.server_conn, flow.id))));
  chunks.push_back(MakeChunk(flow.id, ChunkKind::kHttpFlow, ToJson(ToProto(flow))));
  return chunks;
}

std::vector<ChunkRecord> Encode(const model::Flow& flow) {
  return std::visit(
      [&flow](const auto& f) -> std::vector<ChunkRecord> {
        using T = std::decay_t<decltype(f)>;
        if constexpr (std::is_same_v<T, model::HttpFlow>) {
          return EncodeHttpFlow(f);
        } else {
          throw util::UnsupportedFlowType("cannot serialize " + std::string(model::TypeName(flow)) + " flow " + f.id);
        }
      },
      flow);
}

model::HttpFlow Decode(const std::vector<ChunkRecord>& chunks) {
  DecodeContext ctx;
  for (const auto& chunk : chunks) {
    Absorb(ctx, chunk);
  }
  return Finish(ctx);
}

} // namespace flowstore::codec
