#pragma once

#include <cstdint>
#include <string_view>

namespace netmap::model {

enum class LinkKind : std::uint8_t {
  kUnspecified = 0,
  kAdjacency   = 1,  // L2, undirected, ARP evidence
  kRoute       = 2,  // L3, directed, routing evidence
};

enum class EdgeStatus : std::uint8_t {
  kUnspecified = 0,
  kProposed    = 1,
  kConfirmed   = 2,
  kStale       = 3,
};

/*
  proposed -> confirmed -> stale -> confirmed ...

  Nothing leaves the graph. Stale only exits through fresh corroboration,
  and an edge never drops back to proposed once it has been corroborated.
*/
constexpr bool CanTransition(EdgeStatus from, EdgeStatus to) {
  if (from == to) {
    return true;
  }
  if (to == EdgeStatus::kUnspecified) {
    return false;
  }
  switch (from) {
    case EdgeStatus::kUnspecified:
      return to == EdgeStatus::kProposed || to == EdgeStatus::kConfirmed;
    case EdgeStatus::kProposed:
      return to == EdgeStatus::kConfirmed;
    case EdgeStatus::kConfirmed:
      return to == EdgeStatus::kStale;
    case EdgeStatus::kStale:
      return to == EdgeStatus::kConfirmed;
  }
  return false;
}

constexpr std::string_view ToString(LinkKind kind) {
  switch (kind) {
    case LinkKind::kAdjacency:
      return "adjacency";
    case LinkKind::kRoute:
      return "route";
    default:
      return "unspecified";
  }
}

constexpr std::string_view ToString(EdgeStatus status) {
  switch (status) {
    case EdgeStatus::kProposed:
      return "proposed";
    case EdgeStatus::kConfirmed:
      return "confirmed";
    case EdgeStatus::kStale:
      return "stale";
    default:
      return "unspecified";
  }
}

} // namespace netmap::model
