#pragma once

#include <cstdint>
#include <string>

#include "internal/db/model/provenance.hpp"
#include "internal/model/edge_state.hpp"

namespace netmap::db::model {

/*
  Persistent edge row.

  Endpoints are interface ids, which never change under host merges; the
  host-level view is projected at query time.

    Adjacency: endpoint_a < endpoint_b (undirected, normalized order)
    Route:     endpoint_a = reporting interface,
               endpoint_b = current owner of gateway_ip, or a placeholder id
*/
struct LinkRecord {
  std::string id;

  netmap::model::LinkKind kind = netmap::model::LinkKind::kUnspecified;

  std::string endpoint_a;
  std::string endpoint_b;
  bool        target_is_placeholder = false;

  // Route only.
  std::string   destination;
  std::string   gateway_ip;
  std::uint32_t metric = 0;

  double                    confidence = 0.0;
  netmap::model::EdgeStatus status     = netmap::model::EdgeStatus::kUnspecified;
  bool                      trusted    = false;

  SeenWindow seen;
  IdList     observation_ids;

  bool operator==(const LinkRecord&) const = default;
};

} // namespace netmap::db::model
