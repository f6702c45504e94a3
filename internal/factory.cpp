#include "factory.hpp"

#include <memory>
#include <string>

#include "internal/db/sqlite/search_function.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/view/derived_schema.hpp"

namespace flowstore::factory {

db::sqlite::SqliteOptions SqliteOptionsFromConfig(const flowstore::runtime::config::RuntimeConfig& config) {
  db::sqlite::SqliteOptions options;
  const auto&               sqlite = config.database().sqlite();

  if (!sqlite.path().empty()) options.path = sqlite.path();
  if (!sqlite.journal_mode().empty()) options.journal_mode = sqlite.journal_mode();
  if (!sqlite.synchronous().empty()) options.synchronous = sqlite.synchronous();
  if (!sqlite.temp_store().empty()) options.temp_store = sqlite.temp_store();
  if (sqlite.busy_timeout_ms() != 0) options.busy_timeout_ms = static_cast<int>(sqlite.busy_timeout_ms());
  if (sqlite.cache_size_kib() != 0) options.cache_size_kib = static_cast<int>(sqlite.cache_size_kib());
  options.mmap_size_bytes = sqlite.mmap_size_bytes();

  return options;
}

query::PageRequest DefaultPageFromConfig(const flowstore::runtime::config::RuntimeConfig& config) {
  query::PageRequest page;
  if (config.query().default_limit() != 0) page.limit = config.query().default_limit();
  if (!config.query().default_sort().empty()) page.sort = query::ParseSortOrder(config.query().default_sort());
  return page;
}

std::shared_ptr<core::FlowStore> OpenFlowStore(const db::sqlite::SqliteOptions& options) {
  auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(options);

  db::sqlite::RegisterSearchFunction(*sqlite_db);
  view::EnsureSchema(sqlite_db);

  auto repository = std::make_shared<db::sqlite::SqliteRepository>(sqlite_db);

  FLOWSTORE_LOG_DEBUG("flow store open", {observability::StringField("path", options.path),
                                          observability::StringField("journal_mode", options.journal_mode)});

  return std::make_shared<core::FlowStore>(std::move(sqlite_db), std::move(repository));
}

RuntimeDependencies Build(const flowstore::runtime::config::RuntimeConfig& config) {
  RuntimeDependencies deps;

  deps.default_page = DefaultPageFromConfig(config);
  deps.store        = OpenFlowStore(SqliteOptionsFromConfig(config));
  deps.recorder     = std::make_shared<capture::FlowRecorder>(deps.store, config.capture().verify_round_trip());

  return deps;
}

} // namespace flowstore::factory
