#include "internal/capture/flow_recorder.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/factory.hpp"
#include "internal/util/errors.hpp"
#include "test_flows.hpp"

namespace {

using flowstore::capture::FlowRecorder;
using flowstore::model::Flow;
using flowstore::testing::MakeHttpFlow;
using flowstore::testing::MakePendingFlow;

std::shared_ptr<flowstore::core::FlowStore> OpenMemoryStore() {
  return flowstore::factory::OpenFlowStore(flowstore::db::sqlite::SqliteOptions{});
}

void TestHooksFollowTheFlowLifecycle() {
  auto store = OpenMemoryStore();
  FlowRecorder recorder(store, /*verify_round_trip=*/true);

  auto flow = MakePendingFlow("flow-1");
  const auto request_written = recorder.Request({flow});
  assert(request_written == 1);
  assert(store->Count("~q") == 1);

  flow.response = MakeHttpFlow("flow-1").response;
  const auto response_written = recorder.Response({flow});
  assert(response_written == 1);
  assert(store->Count("~q") == 0);
  assert(store->Count("~s") == 1);

  flow.marked = ":default:";
  const auto update_written = recorder.Update({flow});
  assert(update_written == 1);
  assert(store->Count("~marked") == 1);

  flow.error = flowstore::model::Error{"client disconnected", 1700000003.0};
  const auto error_written = recorder.Error({flow});
  assert(error_written == 1);
  assert(store->Count("~e") == 1);

  assert(store->Load("flow-1") == flow);
  assert(store->Count("") == 1);
}

// flow_header is rewritten on every put of the same flow
void TestHeaderFiltersFollowNewestSnapshot() {
  auto store = OpenMemoryStore();
  FlowRecorder recorder(store);

  auto flow = MakePendingFlow("flow-h");
  flow.request.headers.push_back({"X-Stage", "request"});
  const auto request_written = recorder.Request({flow});
  assert(request_written == 1);
  assert(store->Count("~hq X-Stage=request") == 1);
  assert(store->Count("~hs Content-Type") == 0);

  flow.response = MakeHttpFlow("flow-h").response;
  flow.request.headers.back().value = "response";
  const auto response_written = recorder.Response({flow});
  assert(response_written == 1);
  assert(store->Count("~hq X-Stage=request") == 0);
  assert(store->Count("~hq X-Stage=response") == 1);
  assert(store->Count("~hs Content-Type=text/html") == 1);

  flow.request.headers.pop_back();
  flow.response->headers.push_back({"X-Cache", "hit"});
  const auto update_written = recorder.Update({flow});
  assert(update_written == 1);
  assert(store->Count("~h X-Stage") == 0);
  assert(store->Count("~h X-Cache=hit") == 1);
  assert(store->Count("~hq X-Cache") == 0);
  assert(store->Count("") == 1);
}

void TestUnsupportedFlowsAreDropped() {
  auto store = OpenMemoryStore();
  FlowRecorder recorder(store);

  flowstore::model::TcpFlow tcp;
  tcp.id = "tcp-1";
  flowstore::model::DnsFlow dns;
  dns.id = "dns-1";

  const std::vector<Flow> batch = {tcp, MakeHttpFlow("http-1"), dns, MakeHttpFlow("http-2")};
  const auto update_written = recorder.Update(batch);
  assert(update_written == 2);

  assert(store->Count("") == 2);
  assert(!store->Load("tcp-1").has_value());
  assert(!store->Load("dns-1").has_value());
  assert(store->Load("http-2").has_value());

  // text fields that are not UTF-8 cannot be encoded either
  auto bad    = MakeHttpFlow("http-3");
  bad.comment = std::string("\xff\xfe", 2);
  const auto bad_written = recorder.Response({bad, MakeHttpFlow("http-4")});
  assert(bad_written == 1);
  assert(!store->Load("http-3").has_value());
  assert(store->Load("http-4").has_value());
}

void TestStoreFailuresPropagate() {
  auto store = OpenMemoryStore();
  FlowRecorder recorder(store);

  store->Close();

  bool threw = false;
  try {
    recorder.Request({MakeHttpFlow("flow-x")});
  } catch (const flowstore::util::StoreError&) {
    threw = true;
  }
  assert(threw && "recorder must not swallow store errors");
}

} // namespace

int main() {
  TestHooksFollowTheFlowLifecycle();
  TestHeaderFiltersFollowNewestSnapshot();
  TestUnsupportedFlowsAreDropped();
  TestStoreFailuresPropagate();

  std::cout << "flowstore_unit_flow_recorder: pass\n";
  return 0;
}
