#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/capture/flow_recorder.hpp"
#include "internal/core/flow_store.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/query/query_executor.hpp"

namespace flowstore::factory {

/*
  RuntimeDependencies

  Owns the long-lived objects a flowstore process works with.
*/
struct RuntimeDependencies {
  std::shared_ptr<core::FlowStore>       store;
  std::shared_ptr<capture::FlowRecorder> recorder;

  // from query.default_limit / query.default_sort
  query::PageRequest default_page;
};

// Config values with the built-in defaults filled in for anything unset.
db::sqlite::SqliteOptions SqliteOptionsFromConfig(const flowstore::runtime::config::RuntimeConfig& config);

query::PageRequest DefaultPageFromConfig(const flowstore::runtime::config::RuntimeConfig& config);

/*
  OpenFlowStore

  Opens the database, registers search() on the connection and brings the
  derived schema up to date. The returned store is ready for queries.
*/
std::shared_ptr<core::FlowStore> OpenFlowStore(const db::sqlite::SqliteOptions& options);

/*
  Build

  Composition root: the only place that knows the concrete repository type.
*/
RuntimeDependencies Build(const flowstore::runtime::config::RuntimeConfig& config);

} // namespace flowstore::factory
