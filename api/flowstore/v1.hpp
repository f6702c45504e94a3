#pragma once

#include "flowstore/flow/v1/flow.pb.h"

namespace flowstore::v1 {
using namespace ::flowstore::flow::v1;
}
