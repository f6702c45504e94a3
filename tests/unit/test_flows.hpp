#pragma once

#include <filesystem>
#include <string>

#include "internal/model/flow.hpp"

namespace flowstore::testing {

inline model::Connection MakeClientConn(const std::string& id) {
  model::Connection conn;
  conn.id              = id;
  conn.peername        = model::Address{"10.0.0.1", 51000};
  conn.sockname        = model::Address{"127.0.0.1", 8080};
  conn.tls_established = true;
  conn.sni             = "example.com";
  conn.timestamp_start = 1700000000.0;
  return conn;
}

inline model::Connection MakeServerConn(const std::string& id) {
  model::Connection conn;
  conn.id              = id;
  conn.address         = model::Address{"example.com", 443};
  conn.peername        = model::Address{"93.184.216.34", 443};
  conn.tls_established = true;
  conn.sni             = "example.com";
  conn.alpn            = "http/1.1";
  conn.tls_version     = "TLSv1.3";
  conn.cipher          = "TLS_AES_128_GCM_SHA256";
  conn.certificate_list.push_back(std::string("\x30\x82\x01\x0a\x00\xff", 6));
  conn.timestamp_start = 1700000000.125;
  conn.timestamp_end   = 1700000009.5;
  return conn;
}

// GET https://example.com/index.html -> 200 text/html "hello world"
inline model::HttpFlow MakeHttpFlow(const std::string& id, double created = 1700000000.0) {
  model::HttpFlow flow;
  flow.id = id;

  flow.request.host         = "example.com";
  flow.request.port         = 443;
  flow.request.method       = "GET";
  flow.request.scheme       = "https";
  flow.request.path         = "/index.html";
  flow.request.http_version = "HTTP/1.1";
  flow.request.headers      = {{"Host", "example.com"}, {"Accept", "*/*"}};
  flow.request.content      = std::string();
  flow.request.timestamp_start = created;
  flow.request.timestamp_end   = created + 0.25;

  model::Response response;
  response.http_version    = "HTTP/1.1";
  response.status_code     = 200;
  response.reason          = "OK";
  response.headers         = {{"Content-Type", "text/html"}, {"Content-Length", "11"}};
  response.content         = std::string("hello world");
  response.timestamp_start = created + 0.5;
  response.timestamp_end   = created + 1.5;
  flow.response            = response;

  flow.client_conn       = MakeClientConn(id + "-client");
  flow.server_conn       = MakeServerConn(id + "-server");
  flow.timestamp_created = created;
  return flow;
}

// A request that is still waiting for its response.
inline model::HttpFlow MakePendingFlow(const std::string& id, double created = 1700000000.0) {
  auto flow     = MakeHttpFlow(id, created);
  flow.response = std::nullopt;
  return flow;
}

inline std::filesystem::path TempPath(const std::string& test_name, const std::string& file_name) {
  const auto base_dir = std::filesystem::temp_directory_path() / "flowstore_tests" / test_name;
  std::filesystem::remove_all(base_dir);
  std::filesystem::create_directories(base_dir);
  return base_dir / file_name;
}

} // namespace flowstore::testing
