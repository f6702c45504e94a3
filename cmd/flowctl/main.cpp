#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

using flowstore::factory::Build;

static void Usage() {
  std::cerr << "Usage:\n"
            << "  flowctl --config <config.yaml> query [filter] [--sort <key>] [--limit <n>] [--offset <n>]\n"
            << "  flowctl --config <config.yaml> count [filter]\n"
            << "  flowctl --config <config.yaml> compile <filter>\n"
            << "  flowctl --config <config.yaml> show <flow_id>\n"
            << "  flowctl --config <config.yaml> copy <filter> <target.db>\n"
            << "  flowctl --config <config.yaml> remove <flow_id>\n"
            << "  flowctl --config <config.yaml> clear\n"
            << "\n"
            << "sort keys: time, method, url, status, size, duration (prefix '-' for descending)\n";
}

static std::string FormatUrl(const flowstore::model::Request& request) {
  std::string url = request.scheme + "://" + request.host;
  const bool default_port = (request.scheme == "http" && request.port == 80) || (request.scheme == "https" && request.port == 443);
  if (!default_port) {
    url += ":" + std::to_string(request.port);
  }
  return url + request.path;
}

static void PrintSummary(const flowstore::model::HttpFlow& flow) {
  std::cout << flow.id << "  " << flow.request.method << "  ";
  if (flow.response) {
    std::cout << flow.response->status_code;
  } else if (flow.error) {
    std::cout << "ERR";
  } else {
    std::cout << "...";
  }
  std::cout << "  " << FormatUrl(flow.request);
  if (!flow.marked.empty()) {
    std::cout << "  [" << flow.marked << "]";
  }
  std::cout << "\n";
}

static void PrintHeaders(const flowstore::model::Headers& headers) {
  for (const auto& header : headers) {
    std::cout << "  " << header.name << ": " << header.value << "\n";
  }
}

static void PrintFlow(const flowstore::model::HttpFlow& flow) {
  PrintSummary(flow);

  std::cout << "request " << flow.request.http_version << "\n";
  PrintHeaders(flow.request.headers);
  if (flow.request.content) {
    std::cout << "  (" << flow.request.content->size() << " bytes)\n";
  }

  if (flow.response) {
    std::cout << "response " << flow.response->http_version << " " << flow.response->status_code << " " << flow.response->reason << "\n";
    PrintHeaders(flow.response->headers);
    if (flow.response->content) {
      std::cout << "  (" << flow.response->content->size() << " bytes)\n";
    }
  }

  if (flow.error) {
    std::cout << "error " << flow.error->msg << "\n";
  }
  if (!flow.comment.empty()) {
    std::cout << "comment " << flow.comment << "\n";
  }
}

static std::string ParamText(const flowstore::db::sql::Param& param) {
  if (std::holds_alternative<std::nullptr_t>(param)) {
    return "NULL";
  }
  if (const auto* value = std::get_if<int64_t>(&param)) {
    return std::to_string(*value);
  }
  return "'" + std::get<std::string>(param) + "'";
}

static std::optional<std::uint32_t> ParseCount(const std::string& text) {
  char* end   = nullptr;
  auto  value = std::strtoul(text.c_str(), &end, 10);
  if (text.empty() || *end != '\0') {
    return std::nullopt;
  }
  return static_cast<std::uint32_t>(value);
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string config_path = argv[2];
  const std::string cmd         = argv[3];
  std::vector<std::string> args(argv + 4, argv + argc);

  try {
    // ------------------------------------------------------------
    // Commands that do not open the store
    // ------------------------------------------------------------
    if (cmd == "compile") {
      if (args.size() != 1) {
        Usage();
        return 1;
      }
      auto predicate = flowstore::core::FlowStore::Compile(args[0]);
      std::cout << predicate.fragment << "\n";
      for (const auto& param : predicate.params) {
        std::cout << "  ? = " << ParamText(param) << "\n";
      }
      return 0;
    }

    auto config = flowstore::config::ConfigLoader::LoadFromYaml(config_path);
    flowstore::observability::InitializeLogging(config);

    auto deps = Build(config);

    // ------------------------------------------------------------

    if (cmd == "query") {
      std::string filter;
      auto        page = deps.default_page;
      for (std::size_t i = 0; i < args.size(); ++i) {
        if ((args[i] == "--sort" || args[i] == "--limit" || args[i] == "--offset") && i + 1 < args.size()) {
          const auto& value = args[++i];
          if (args[i - 1] == "--sort") {
            page.sort = flowstore::query::ParseSortOrder(value);
            continue;
          }
          auto n = ParseCount(value);
          if (!n) {
            std::cerr << "not a number: " << value << "\n";
            return 1;
          }
          (args[i - 1] == "--limit" ? page.limit : page.offset) = *n;
        } else if (filter.empty()) {
          filter = args[i];
        } else {
          Usage();
          return 1;
        }
      }

      auto ids = deps.store->Query(filter, page);
      for (const auto& flow : deps.store->LoadPage(ids)) {
        PrintSummary(flow);
      }
    } else if (cmd == "count") {
      if (args.size() > 1) {
        Usage();
        return 1;
      }
      std::cout << deps.store->Count(args.empty() ? std::string() : args[0]) << "\n";
    } else if (cmd == "show") {
      if (args.size() != 1) {
        Usage();
        return 1;
      }
      auto flow = deps.store->Load(args[0]);
      if (!flow) {
        std::cerr << "no such flow: " << args[0] << "\n";
        return 2;
      }
      PrintFlow(*flow);
    } else if (cmd == "copy") {
      if (args.size() != 2) {
        Usage();
        return 1;
      }
      std::cout << "copied " << deps.store->CopyTo(args[0], args[1]) << " chunks\n";
    } else if (cmd == "remove") {
      if (args.size() != 1) {
        Usage();
        return 1;
      }
      if (!deps.store->Remove(args[0])) {
        std::cerr << "no such flow: " << args[0] << "\n";
        return 2;
      }
      std::cout << "removed\n";
    } else if (cmd == "clear") {
      deps.store->Clear();
      std::cout << "cleared\n";
    } else {
      Usage();
      return 1;
    }

    deps.store->Close();
    flowstore::observability::ShutdownLogging();
  } catch (const flowstore::util::ParseError& e) {
    std::cerr << "filter error: " << e.what() << "\n";
    return 3;
  } catch (const std::exception& e) {
    FLOWSTORE_LOG_ERROR("flowctl failed", {flowstore::observability::StringField("command", cmd),
                                           flowstore::observability::StringField("error", e.what())});
    std::cerr << e.what() << "\n";
    flowstore::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
