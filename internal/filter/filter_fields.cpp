#include "filter_fields.hpp"

#include <algorithm>

namespace flowstore::filter {

// search() flag values: 2 ignore case, 8 multiline, 16 dot matches newline.
// Every template is 0 or 1, never NULL, so NOT (x) is the exact complement.
const std::vector<FieldSpec>& Fields() {
  static const std::vector<FieldSpec> kFields = {
      {"all", FieldKind::kUnary, "Match all flows", "1"},
      {"a", FieldKind::kUnary, "Match asset in response: CSS, JavaScript, images, fonts.",
       "search('^(text/javascript|application/x-javascript|application/javascript|text/css|image/.*|font/.*|"
       "application/font.*)', response_content_type, 2)"},
      {"e", FieldKind::kUnary, "Match error", "has_error"},
      {"q", FieldKind::kUnary, "Match request with no response", "NOT has_response"},
      {"s", FieldKind::kUnary, "Match response", "has_response"},
      {"marked", FieldKind::kUnary, "Match marked flows", "marked != ''"},
      {"replay", FieldKind::kUnary, "Match replayed flows", "is_replay IS NOT NULL"},
      {"replayq", FieldKind::kUnary, "Match replayed client request", "is_replay IS 'request'"},
      {"replays", FieldKind::kUnary, "Match replayed server response", "is_replay IS 'response'"},
      {"http", FieldKind::kUnary, "Match HTTP flows", "flow_type = 'http'"},
      {"tcp", FieldKind::kUnary, "Match TCP flows", "flow_type = 'tcp'"},
      {"udp", FieldKind::kUnary, "Match UDP flows", "flow_type = 'udp'"},
      {"dns", FieldKind::kUnary, "Match DNS flows", "flow_type = 'dns'"},

      {"b", FieldKind::kRegex, "Body",
       "flow_id IN (SELECT flow_id FROM chunk WHERE kind IN ('request_content', 'response_content') "
       "AND search(?, payload, 16))"},
      {"bq", FieldKind::kRegex, "Request body",
       "flow_id IN (SELECT flow_id FROM chunk WHERE kind IN ('request_content') AND search(?, payload, 16))"},
      {"bs", FieldKind::kRegex, "Response body",
       "flow_id IN (SELECT flow_id FROM chunk WHERE kind IN ('response_content') AND search(?, payload, 16))"},
      {"c", FieldKind::kInt, "HTTP response code", "coalesce(status_code = ?, 0)"},
      {"comment", FieldKind::kRegex, "Flow comment", "search(?, comment, 0)"},
      {"d", FieldKind::kRegex, "Domain", "search(?, host, 2)"},
      {"dst", FieldKind::kRegex, "Match destination address", "search(?, server_address, 0)"},
      {"src", FieldKind::kRegex, "Match source address", "search(?, client_address, 0)"},
      {"h", FieldKind::kRegex, "Header",
       "flow_id IN (SELECT flow_id FROM flow_header WHERE search(?, request || char(10) || response, 8))"},
      {"hq", FieldKind::kRegex, "Request header",
       "flow_id IN (SELECT flow_id FROM flow_header WHERE search(?, request, 8))"},
      {"hs", FieldKind::kRegex, "Response header",
       "flow_id IN (SELECT flow_id FROM flow_header WHERE search(?, response, 8))"},
      {"m", FieldKind::kRegex, "Method", "search(?, method, 2)"},
      {"marker", FieldKind::kRegex, "Match marked flows with specified marker", "search(?, marked, 0)"},
      {"meta", FieldKind::kRegex, "Flow metadata", "search(?, metadata, 0)"},
      {"t", FieldKind::kRegex, "Content-type header",
       "search(?, coalesce(request_content_type, '') || char(10) || coalesce(response_content_type, ''), 10)"},
      {"tq", FieldKind::kRegex, "Request Content-Type header", "search(?, request_content_type, 2)"},
      {"ts", FieldKind::kRegex, "Response Content-Type header", "search(?, response_content_type, 2)"},
      {"u", FieldKind::kRegex, "URL", "search(?, url, 2)"},
  };
  return kFields;
}

const FieldSpec* FindField(std::string_view code) {
  const auto& fields = Fields();
  auto it = std::find_if(fields.begin(), fields.end(), [&](const FieldSpec& f) { return f.code == code; });
  return it == fields.end() ? nullptr : &*it;
}

const std::vector<std::string_view>& CodesLongestFirst() {
  static const std::vector<std::string_view> kCodes = [] {
    std::vector<std::string_view> codes;
    for (const auto& field : Fields()) {
      codes.push_back(field.code);
    }
    std::stable_sort(codes.begin(), codes.end(),
                     [](std::string_view a, std::string_view b) { return a.size() > b.size(); });
    return codes;
  }();
  return kCodes;
}

} // namespace flowstore::filter
