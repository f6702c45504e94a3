#pragma once

#include <cstddef>
#include <memory>
#include <string_view>
#include <vector>

#include "internal/core/flow_store.hpp"
#include "internal/model/flow.hpp"

namespace flowstore::capture {

/*
  Capture engine hooks.

  The engine calls these with the current snapshot of each flow it touched.
  Every snapshot replaces what was stored for that flow, in its own
  transaction. Flow types the store cannot serialize are logged and
  dropped; store failures propagate to the engine.

  Each hook returns how many flows were written.
*/
class FlowRecorder {
 public:
  explicit FlowRecorder(std::shared_ptr<core::FlowStore> store, bool verify_round_trip = false);

  std::size_t Request(const std::vector<model::Flow>& flows);
  std::size_t Response(const std::vector<model::Flow>& flows);
  std::size_t Update(const std::vector<model::Flow>& flows);
  std::size_t Error(const std::vector<model::Flow>& flows);

 private:
  std::size_t Persist(std::string_view hook, const std::vector<model::Flow>& flows);
  void        VerifyRoundTrip(const model::HttpFlow& flow, const std::vector<db::model::ChunkRecord>& rows);

  std::shared_ptr<core::FlowStore> store_;
  bool                             verify_round_trip_;
};

} // namespace flowstore::capture
