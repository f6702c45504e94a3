#include <iostream>
#include <string>
#include <vector>

#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace {

flowstore::model::HttpFlow MakeFlow(const std::string& id, const std::string& path, int status, double created) {
  flowstore::model::HttpFlow flow;
  flow.id                   = id;
  flow.timestamp_created    = created;
  flow.request.host         = "example.com";
  flow.request.port         = 443;
  flow.request.scheme       = "https";
  flow.request.method       = "GET";
  flow.request.path         = path;
  flow.request.http_version = "HTTP/1.1";
  flow.request.headers      = {{"Host", "example.com"}};
  flow.request.timestamp_start = created;

  flowstore::model::Response response;
  response.http_version    = "HTTP/1.1";
  response.status_code     = status;
  response.headers         = {{"Content-Type", "application/json"}};
  response.content         = std::string("{}");
  response.timestamp_start = created + 0.1;
  response.timestamp_end   = created + 0.2;
  flow.response            = response;
  return flow;
}

} // namespace

int main(int argc, char** argv) {
  // In-memory by default; pass a path to keep the flows around.
  flowstore::runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_sqlite()->set_path(argc > 1 ? argv[1] : ":memory:");
  config.mutable_capture()->set_verify_round_trip(true);

  flowstore::observability::InitializeLogging(config);

  try {
    auto deps = flowstore::factory::Build(config);

    // What a capture engine would do as flows progress
    deps.recorder->Response({MakeFlow("f1", "/api/users", 200, 1700000000.0)});
    deps.recorder->Response({MakeFlow("f2", "/api/orders", 500, 1700000001.0)});
    deps.recorder->Response({MakeFlow("f3", "/static/app.js", 200, 1700000002.0)});

    const std::string filter = argc > 2 ? argv[2] : "~u /api/ & !~c 500";
    auto              ids    = deps.store->Query(filter, deps.default_page);

    std::cout << deps.store->Count(filter) << " flow(s) match '" << filter << "'\n";
    for (const auto& flow : deps.store->LoadPage(ids)) {
      std::cout << "  " << flow.id << " " << flow.request.method << " " << flow.request.path << " -> "
                << flow.response->status_code << "\n";
    }

    deps.store->Close();
  } catch (const flowstore::util::ParseError& e) {
    std::cerr << "bad filter: " << e.what() << '\n';
    return 1;
  } catch (const std::exception& e) {
    std::cerr << e.what() << '\n';
    return 1;
  }

  flowstore::observability::ShutdownLogging();
  return 0;
}
