#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace flowstore::model {

// Raw octets, not required to be UTF-8.
// Bytes-valued: headers, bodies, certificates, method, authority, path,
// http_version, reason and alpn. Other strings are UTF-8 text.
using Bytes = std::string;

struct Header {
  Bytes name;
  Bytes value;

  bool operator==(const Header&) const = default;
};

using Headers = std::vector<Header>;

struct Address {
  std::string host;
  std::uint32_t port = 0;

  bool operator==(const Address&) const = default;
};

struct Connection {
  std::string id;

  std::optional<Address> peername;
  std::optional<Address> sockname;
  // server side only: the address the proxy connects to
  std::optional<Address> address;

  bool tls_established = false;
  std::string sni;
  Bytes alpn;
  std::string tls_version;
  std::string cipher;
  std::vector<Bytes> certificate_list;

  double timestamp_start = 0;
  std::optional<double> timestamp_end;

  bool operator==(const Connection&) const = default;
};

struct Request {
  std::string host;
  std::uint32_t port = 0;
  Bytes method;
  std::string scheme;
  Bytes authority;
  Bytes path;
  Bytes http_version;

  Headers headers;
  Headers trailers;

  // nullopt while the body is still streaming or was not captured
  std::optional<Bytes> content;

  double timestamp_start = 0;
  std::optional<double> timestamp_end;

  bool operator==(const Request&) const = default;
};

struct Response {
  Bytes http_version;
  std::int32_t status_code = 0;
  Bytes reason;

  Headers headers;
  Headers trailers;

  std::optional<Bytes> content;

  double timestamp_start = 0;
  std::optional<double> timestamp_end;

  bool operator==(const Response&) const = default;
};

struct Error {
  std::string msg;
  double timestamp = 0;

  bool operator==(const Error&) const = default;
};

struct HttpFlow {
  std::string id;

  Request request;
  std::optional<Response> response;
  std::optional<Error> error;

  Connection client_conn;
  Connection server_conn;

  // empty = not marked; otherwise the marker glyph
  std::string marked;
  std::string comment;
  // "request" or "response" for replayed flows
  std::optional<std::string> is_replay;
  bool intercepted = false;
  double timestamp_created = 0;

  std::map<std::string, std::string> metadata;

  bool operator==(const HttpFlow&) const = default;
};

struct TcpFlow {
  std::string id;
  Connection client_conn;
  Connection server_conn;
};

struct UdpFlow {
  std::string id;
  Connection client_conn;
  Connection server_conn;
};

struct DnsFlow {
  std::string id;
  Connection client_conn;
  Connection server_conn;
};

/*
  Flow snapshot delivered by the capture engine.

  Only HttpFlow is persisted; the other alternatives exist so that encoders
  must decide what to do with them.
*/
using Flow = std::variant<HttpFlow, TcpFlow, UdpFlow, DnsFlow>;

constexpr std::string_view TypeName(const Flow& flow) {
  switch (flow.index()) {
    case 0:
      return "http";
    case 1:
      return "tcp";
    case 2:
      return "udp";
    case 3:
      return "dns";
    default:
      return "unknown";
  }
}

const std::string& FlowId(const Flow& flow);

} // namespace flowstore::model
