#pragma once

#include "netmap/graph/v1/graph.pb.h"

namespace netmap::v1 {
using namespace ::netmap::graph::v1;
}
