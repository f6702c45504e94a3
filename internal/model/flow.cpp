#include "internal/model/flow.hpp"

namespace flowstore::model {

const std::string& FlowId(const Flow& flow) {
  return std::visit([](const auto& f) -> const std::string& { return f.id; }, flow);
}

} // namespace flowstore::model
