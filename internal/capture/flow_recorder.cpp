#include "flow_recorder.hpp"

#include <string>

#include "internal/codec/chunk_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace flowstore::capture {

FlowRecorder::FlowRecorder(std::shared_ptr<core::FlowStore> store, bool verify_round_trip)
    : store_(std::move(store)), verify_round_trip_(verify_round_trip) {
}

std::size_t FlowRecorder::Request(const std::vector<model::Flow>& flows) {
  return Persist("request", flows);
}

std::size_t FlowRecorder::Response(const std::vector<model::Flow>& flows) {
  return Persist("response", flows);
}

std::size_t FlowRecorder::Update(const std::vector<model::Flow>& flows) {
  return Persist("update", flows);
}

std::size_t FlowRecorder::Error(const std::vector<model::Flow>& flows) {
  return Persist("error", flows);
}

std::size_t FlowRecorder::Persist(std::string_view hook, const std::vector<model::Flow>& flows) {
  std::size_t written = 0;
  for (const auto& flow : flows) {
    std::vector<db::model::ChunkRecord> rows;
    try {
      rows = codec::Encode(flow);
    } catch (const util::EncodeError& e) {
      FLOWSTORE_LOG_WARN("dropping flow the store cannot serialize",
                         {observability::StringField("hook", hook), observability::StringField("flow_id", model::FlowId(flow)),
                          observability::StringField("type", model::TypeName(flow)),
                          observability::StringField("error", e.what())});
      continue;
    }

    store_->Put(rows);
    ++written;

    if (verify_round_trip_) {
      VerifyRoundTrip(std::get<model::HttpFlow>(flow), rows);
    }
  }
  return written;
}

void FlowRecorder::VerifyRoundTrip(const model::HttpFlow& flow, const std::vector<db::model::ChunkRecord>& rows) {
  try {
    if (codec::Decode(rows) != flow) {
      FLOWSTORE_LOG_WARN("flow does not survive a round trip", {observability::StringField("flow_id", flow.id)});
    }
  } catch (const util::DecodeError& e) {
    FLOWSTORE_LOG_WARN("encoded flow does not decode",
                       {observability::StringField("flow_id", flow.id), observability::StringField("error", e.what())});
  }
}

} // namespace flowstore::capture
