#include "internal/codec/chunk_codec.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "test_flows.hpp"

namespace {

using flowstore::codec::Decode;
using flowstore::codec::Encode;
using flowstore::codec::EncodeHttpFlow;
using flowstore::db::model::ChunkRecord;
using flowstore::testing::MakeHttpFlow;
using flowstore::testing::MakePendingFlow;

std::vector<std::string> Kinds(const std::vector<ChunkRecord>& chunks) {
  std::vector<std::string> kinds;
  for (const auto& chunk : chunks) kinds.push_back(chunk.kind);
  return kinds;
}

template <typename Fn>
bool ThrowsDecodeError(Fn&& fn) {
  try {
    fn();
  } catch (const flowstore::util::DecodeError&) {
    return true;
  }
  return false;
}

void TestFullFlowRoundTrip() {
  auto flow = MakeHttpFlow("flow-1");
  flow.request.headers.push_back({"X-Binary", std::string("\xff\xfe\x00", 3)});
  flow.request.trailers = {{"X-Checksum", "abc"}};
  flow.error            = flowstore::model::Error{"connection reset", 1700000002.0};
  flow.marked           = ":star:";
  flow.comment          = "interesting";
  flow.is_replay        = "request";
  flow.intercepted      = true;
  flow.metadata         = {{"source", "unit-test"}, {"note", "{\"a\":1}"}};

  const auto chunks = Encode(flow);

  const std::vector<std::string> expected = {"request_content", "response_content", "client_conn", "server_conn", "http_flow"};
  assert(Kinds(chunks) == expected);
  for (const auto& chunk : chunks) assert(chunk.flow_id == "flow-1");
  assert(chunks[1].payload == "hello world");

  const auto decoded = Decode(chunks);
  assert(decoded == flow);
  assert(decoded.server_conn.certificate_list.front().size() == 6);
}

void TestPendingRequestHasNoResponse() {
  auto flow            = MakePendingFlow("flow-2");
  flow.request.content = std::nullopt;

  const auto chunks = Encode(flow);
  const std::vector<std::string> expected = {"client_conn", "server_conn", "http_flow"};
  assert(Kinds(chunks) == expected);

  const auto decoded = Decode(chunks);
  assert(!decoded.response.has_value());
  assert(!decoded.request.content.has_value());
  assert(decoded == flow);
}

void TestEmptyBodyIsNotAbsentBody() {
  auto flow = MakeHttpFlow("flow-3");
  assert(flow.request.content.has_value() && flow.request.content->empty());

  const auto decoded = Decode(Encode(flow));
  assert(decoded.request.content.has_value());
  assert(decoded.request.content->empty());
}

void TestDecodeIgnoresChunkOrder() {
  const auto flow = MakeHttpFlow("flow-4");
  auto chunks     = Encode(flow);

  std::reverse(chunks.begin(), chunks.end());
  assert(Decode(chunks) == flow);

  std::rotate(chunks.begin(), chunks.begin() + 2, chunks.end());
  assert(Decode(chunks) == flow);
}

void TestDecodeRejectsBrokenChunkSets() {
  const auto chunks = Encode(MakeHttpFlow("flow-5"));

  // no http_flow chunk
  auto missing_primary = chunks;
  missing_primary.pop_back();
  assert(ThrowsDecodeError([&] { Decode(missing_primary); }));

  // nothing at all
  assert(ThrowsDecodeError([] { Decode({}); }));

  // chunks of two flows
  auto mixed = chunks;
  mixed.front().flow_id = "other-flow";
  assert(ThrowsDecodeError([&] { Decode(mixed); }));

  // the same kind twice
  auto duplicated = chunks;
  duplicated.push_back(chunks.back());
  assert(ThrowsDecodeError([&] { Decode(duplicated); }));

  // a kind nobody knows how to apply
  auto unknown = chunks;
  unknown.push_back(ChunkRecord{"flow-5", "websocket_messages", "[]"});
  assert(ThrowsDecodeError([&] { Decode(unknown); }));

  // metadata that does not match the schema
  auto invalid = chunks;
  invalid.back().payload = R"({"request":5})";
  assert(ThrowsDecodeError([&] { Decode(invalid); }));

  // has_content promises a body that is not there
  auto no_body = chunks;
  no_body.erase(no_body.begin() + 1);
  assert(ThrowsDecodeError([&] { Decode(no_body); }));
}

void TestNonHttpFlowsAreRejected() {
  flowstore::model::TcpFlow tcp;
  tcp.id = "tcp-1";

  bool threw = false;
  try {
    (void)Encode(flowstore::model::Flow{tcp});
  } catch (const flowstore::util::UnsupportedFlowType&) {
    threw = true;
  }
  assert(threw && "Encode must reject TCP flows.");
}

void TestLegacyPayloadsAreUpgraded() {
  const std::string http_flow = R"({
    "id": "legacy-1", "type": "http", "version": 19,
    "marked": true, "comment": "", "is_replay": null, "intercepted": false,
    "timestamp_created": 1700000000.5,
    "metadata": {"retries": 1, "owner": "ops"},
    "request": {
      "host": "example.com", "port": 443, "method": "GET", "scheme": "https",
      "authority": "", "path": "/legacy", "http_version": "HTTP/1.1",
      "headers": [["Host", "example.com"], ["Accept", "*/*"]],
      "trailers": null, "content": null,
      "timestamp_start": 1700000000.5, "timestamp_end": 1700000001.0
    },
    "response": null,
    "error": null
  })";

  const std::string client_conn = R"({
    "id": "legacy-client", "peername": ["10.0.0.1", 51000], "sockname": ["127.0.0.1", 8080],
    "address": null, "tls_established": true, "sni": "example.com",
    "certificate_list": [], "timestamp_start": 1700000000.0, "timestamp_end": null
  })";

  const std::string server_conn = R"({
    "id": "legacy-server", "address": ["example.com", 443], "tls_established": true,
    "certificate_list": ["-----BEGIN CERTIFICATE-----\nMIIB\n-----END CERTIFICATE-----\n"],
    "timestamp_start": 1700000000.0
  })";

  const std::vector<ChunkRecord> chunks = {
      {"legacy-1", "http_flow", http_flow},
      {"legacy-1", "client_conn", client_conn},
      {"legacy-1", "server_conn", server_conn},
      {"legacy-1", "request_content", ""},
  };

  const auto flow = Decode(chunks);
  assert(flow.id == "legacy-1");
  assert(flow.marked == ":default:");
  assert(!flow.is_replay.has_value());
  assert(flow.request.path == "/legacy");
  assert(flow.request.headers.size() == 2);
  assert(flow.request.headers[0].name == "Host");
  assert(flow.request.headers[0].value == "example.com");
  assert(flow.request.content.has_value() && flow.request.content->empty());
  assert(!flow.response.has_value());
  assert(!flow.error.has_value());
  assert(flow.metadata.at("retries") == "1");
  assert(flow.metadata.at("owner") == "ops");

  assert(flow.client_conn.peername.has_value());
  assert(flow.client_conn.peername->host == "10.0.0.1");
  assert(flow.client_conn.peername->port == 51000);
  assert(!flow.client_conn.address.has_value());

  assert(flow.server_conn.address->port == 443);
  assert(flow.server_conn.certificate_list.size() == 1);
  assert(flow.server_conn.certificate_list[0] == "-----BEGIN CERTIFICATE-----\nMIIB\n-----END CERTIFICATE-----\n");
}

void TestNewerPayloadVersionIsRejected() {
  auto chunks = EncodeHttpFlow(MakeHttpFlow("flow-6"));

  auto& primary  = chunks.back();
  const auto pos = primary.payload.find("\"schema_version\":2");
  assert(pos != std::string::npos);
  primary.payload.replace(pos, 18, "\"schema_version\":3");

  assert(ThrowsDecodeError([&] { Decode(chunks); }));
}

void TestNonUtf8RequestLineRoundTrips() {
  auto flow                   = MakeHttpFlow("flow-7");
  flow.request.path           = std::string("/a\xff\xfe", 4);
  flow.request.method         = std::string("G\xc0T", 3);
  flow.request.authority      = std::string("\xfe", 1);
  flow.request.http_version   = std::string("HTTP/1.1\x80", 9);
  flow.response->reason       = std::string("O\xffK", 3);
  flow.response->http_version = std::string("\x81", 1);
  flow.server_conn.alpn       = std::string("h2\xff", 3);

  const auto chunks  = EncodeHttpFlow(flow);
  const auto decoded = Decode(chunks);
  assert(decoded.request.path.size() == 4);
  assert(decoded.request.path == flow.request.path);
  assert(decoded == flow);

  // the text form is what SQL sees; bytes go to raw_*
  assert(chunks.back().payload.find("\"raw_path\"") != std::string::npos);
  assert(chunks.back().payload.find("\"path\"") == std::string::npos);
}

void TestNonUtf8TextFieldsAreRejected() {
  auto flow    = MakeHttpFlow("flow-8");
  flow.comment = std::string("bad \xff", 5);

  bool threw = false;
  try {
    (void)EncodeHttpFlow(flow);
  } catch (const flowstore::util::EncodeError& e) {
    threw = std::string(e.what()).find("comment") != std::string::npos;
  }
  assert(threw);
}

void TestCurrentPayloadWithUnknownFieldIsRejected() {
  auto chunks = EncodeHttpFlow(MakeHttpFlow("flow-9"));

  // current schema_version, misspelled field
  auto& primary = chunks.back();
  assert(primary.payload.back() == '}');
  primary.payload.insert(primary.payload.size() - 1, ",\"markd\":\"x\"");

  assert(ThrowsDecodeError([&] { Decode(chunks); }));
}

} // namespace

int main() {
  TestFullFlowRoundTrip();
  TestPendingRequestHasNoResponse();
  TestEmptyBodyIsNotAbsentBody();
  TestDecodeIgnoresChunkOrder();
  TestDecodeRejectsBrokenChunkSets();
  TestNonHttpFlowsAreRejected();
  TestLegacyPayloadsAreUpgraded();
  TestNewerPayloadVersionIsRejected();
  TestNonUtf8RequestLineRoundTrips();
  TestNonUtf8TextFieldsAreRejected();
  TestCurrentPayloadWithUnknownFieldIsRejected();

  std::cout << "flowstore_unit_chunk_codec: pass\n";
  return 0;
}
