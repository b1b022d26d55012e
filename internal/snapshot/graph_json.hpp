#pragma once

#include <string>

#include "internal/core/graph_view.hpp"
#include "netmap/v1.hpp"

namespace netmap::snapshot {

/*
  Node-link JSON form of a GraphSnapshot, written through the
  netmap.graph.v1.Graph message so the text format is the wire schema.

  Links carry their host projection (host_a / host_b) for readers that only
  care about hosts; on import the projection is recomputed by the store.
*/

v1::Graph           ToProto(const core::GraphSnapshot& snapshot);
core::GraphSnapshot FromProto(const v1::Graph& graph);

std::string         ToJson(const core::GraphSnapshot& snapshot);
core::GraphSnapshot FromJson(const std::string& json);

void                WriteJsonFile(const std::string& path, const core::GraphSnapshot& snapshot);
core::GraphSnapshot ReadJsonFile(const std::string& path);

} // namespace netmap::snapshot
