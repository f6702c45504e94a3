#include "internal/codec/payload_compat.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <google/protobuf/wrappers.pb.h>

#include <string>

#include "internal/codec/chunk_codec.hpp"
#include "internal/util/errors.hpp"

namespace flowstore::codec {
namespace {

using google::protobuf::ListValue;
using google::protobuf::Struct;
using google::protobuf::Value;

constexpr const char* kVersionField = "schema_version";

Value ParseJson(std::string_view json) {
  Value value;
  auto  status = google::protobuf::util::JsonStringToMessage(std::string(json), &value);
  if (!status.ok()) {
    throw util::DecodeError("malformed payload JSON: " + std::string(status.message()));
  }
  return value;
}

std::string ToJson(const Value& value) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(value, &json);
  if (!status.ok()) {
    throw util::DecodeError("failed to re-serialize upgraded payload: " + std::string(status.message()));
  }
  return json;
}

std::uint32_t VersionOf(const Struct& document) {
  const auto& fields = document.fields();
  auto        it     = fields.find(kVersionField);
  if (it == fields.end()) return 1;
  if (it->second.kind_case() != Value::kNumberValue || it->second.number_value() < 1) {
    throw util::DecodeError("payload schema_version is not a positive number");
  }
  return static_cast<std::uint32_t>(it->second.number_value());
}

// JSON form of a bytes field: BytesValue renders as a bare base64 string.
Value BytesAsJson(const std::string& bytes) {
  google::protobuf::BytesValue wrapped;
  wrapped.set_value(bytes);

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(wrapped, &json);
  if (!status.ok()) {
    throw util::DecodeError("failed to encode legacy bytes: " + std::string(status.message()));
  }
  return ParseJson(json);
}

// Absent and null mean the same thing to the current schema.
void StripNulls(Value* value) {
  if (value->kind_case() == Value::kStructValue) {
    auto& fields = *value->mutable_struct_value()->mutable_fields();
    for (auto it = fields.begin(); it != fields.end();) {
      if (it->second.kind_case() == Value::kNullValue) {
        it = fields.erase(it);
      } else {
        StripNulls(&it->second);
        ++it;
      }
    }
  } else if (value->kind_case() == Value::kListValue) {
    for (auto& element : *value->mutable_list_value()->mutable_values()) {
      StripNulls(&element);
    }
  }
}

Struct* MutableObject(Struct* parent, const std::string& key) {
  auto& fields = *parent->mutable_fields();
  auto  it     = fields.find(key);
  if (it == fields.end() || it->second.kind_case() != Value::kStructValue) return nullptr;
  return it->second.mutable_struct_value();
}

// [[name, value], ...] -> [{"name": name, "value": value}, ...]
void UpgradeHeaders(Struct* message, const std::string& key) {
  auto& fields = *message->mutable_fields();
  auto  it     = fields.find(key);
  if (it == fields.end() || it->second.kind_case() != Value::kListValue) return;

  ListValue upgraded;
  for (const auto& entry : it->second.list_value().values()) {
    if (entry.kind_case() != Value::kListValue || entry.list_value().values_size() != 2) {
      throw util::DecodeError("legacy " + key + " entry is not a [name, value] pair");
    }
    Struct header;
    (*header.mutable_fields())["name"]  = entry.list_value().values(0);
    (*header.mutable_fields())["value"] = entry.list_value().values(1);
    *upgraded.add_values()->mutable_struct_value() = std::move(header);
  }
  *it->second.mutable_list_value() = std::move(upgraded);
}

// Legacy rows wrote a content chunk for every request and every response.
void UpgradeMessage(Struct* message) {
  UpgradeHeaders(message, "headers");
  UpgradeHeaders(message, "trailers");
  message->mutable_fields()->erase("content");
  (*message->mutable_fields())["has_content"].set_bool_value(true);
}

// [host, port] -> {"host": host, "port": port}
void UpgradeAddress(Struct* connection, const std::string& key) {
  auto& fields = *connection->mutable_fields();
  auto  it     = fields.find(key);
  if (it == fields.end() || it->second.kind_case() != Value::kListValue) return;

  const auto& pair = it->second.list_value();
  if (pair.values_size() < 2) {
    throw util::DecodeError("legacy " + key + " is not a [host, port] pair");
  }
  Struct address;
  (*address.mutable_fields())["host"] = pair.values(0);
  (*address.mutable_fields())["port"] = pair.values(1);
  *it->second.mutable_struct_value() = std::move(address);
}

void UpgradeHttpFlowV1(Struct* flow) {
  if (auto* request = MutableObject(flow, "request")) {
    UpgradeMessage(request);
  }
  if (auto* response = MutableObject(flow, "response")) {
    UpgradeMessage(response);
  }

  auto& fields = *flow->mutable_fields();

  // marked used to be a boolean
  auto marked = fields.find("marked");
  if (marked != fields.end() && marked->second.kind_case() == Value::kBoolValue) {
    const bool was_marked = marked->second.bool_value();
    marked->second.set_string_value(was_marked ? ":default:" : "");
  }

  // metadata values could be anything; the schema keeps text
  if (auto* metadata = MutableObject(flow, "metadata")) {
    for (auto& entry : *metadata->mutable_fields()) {
      if (entry.second.kind_case() != Value::kStringValue) {
        entry.second.set_string_value(ToJson(entry.second));
      }
    }
  }

  // the prototype stored the capture engine's own format version here
  fields.erase("version");
}

void UpgradeConnectionV1(Struct* connection) {
  UpgradeAddress(connection, "peername");
  UpgradeAddress(connection, "sockname");
  UpgradeAddress(connection, "address");

  auto& fields = *connection->mutable_fields();
  auto  certs  = fields.find("certificate_list");
  if (certs != fields.end() && certs->second.kind_case() == Value::kListValue) {
    for (auto& cert : *certs->second.mutable_list_value()->mutable_values()) {
      if (cert.kind_case() != Value::kStringValue) {
        throw util::DecodeError("legacy certificate is not text");
      }
      cert = BytesAsJson(cert.string_value());
    }
  }
}

} // namespace

std::uint32_t PayloadSchemaVersion(std::string_view json) {
  auto document = ParseJson(json);
  if (document.kind_case() != Value::kStructValue) {
    throw util::DecodeError("payload is not a JSON object");
  }
  return VersionOf(document.struct_value());
}

std::string UpgradePayload(model::ChunkKind kind, std::string_view json) {
  auto document = ParseJson(json);
  if (document.kind_case() != Value::kStructValue) {
    throw util::DecodeError("payload is not a JSON object");
  }

  const auto version = VersionOf(document.struct_value());
  if (version > kPayloadSchemaVersion) {
    throw util::DecodeError("payload schema version " + std::to_string(version) + " is newer than supported version " +
                            std::to_string(kPayloadSchemaVersion));
  }

  if (version < 2) {
    StripNulls(&document);
    auto* object = document.mutable_struct_value();
    switch (kind) {
      case model::ChunkKind::kHttpFlow:
        UpgradeHttpFlowV1(object);
        break;
      case model::ChunkKind::kClientConn:
      case model::ChunkKind::kServerConn:
        UpgradeConnectionV1(object);
        break;
      case model::ChunkKind::kRequestContent:
      case model::ChunkKind::kResponseContent:
        throw util::DecodeError("content chunks carry no schema");
    }
  }

  (*document.mutable_struct_value()->mutable_fields())[kVersionField].set_number_value(kPayloadSchemaVersion);
  return ToJson(document);
}

} // namespace flowstore::codec
