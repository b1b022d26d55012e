#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <set>
#include <string>

#include "internal/db/model/link_record.hpp"
#include "internal/model/edge_state.hpp"

namespace netmap::fusion {

/*
  Scoring knobs.

  Adjacency and route confidence are separate scales: an adjacency of 0.75
  and a route of 0.75 say nothing about each other.
*/
struct FusionPolicy {
  double                    adjacency_base_confidence = 0.5;
  double                    route_base_confidence     = 0.3;
  std::chrono::milliseconds staleness_window          = std::chrono::hours(24);
  std::set<std::string>     trusted_sources;

  bool IsTrusted(const std::string& source_host_id) const {
    return trusted_sources.contains(source_host_id);
  }
};

// 1 - (1 - base)^support. Monotone in support, bounded by 1.
double Confidence(model::LinkKind kind, std::size_t support, const FusionPolicy& policy);

/*
  Status as a function of evidence and the clock:

    proposed   one supporting observation, untrusted
    confirmed  two or more, or any from a trusted source
    stale      confirmed, but last corroborated longer ago than the window
*/
model::EdgeStatus DeriveStatus(const db::model::LinkRecord& link, std::uint64_t now_ms, const FusionPolicy& policy);

} // namespace netmap::fusion
