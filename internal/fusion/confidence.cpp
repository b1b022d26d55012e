#include "confidence.hpp"

#include <algorithm>
#include <cmath>

namespace netmap::fusion {

double Confidence(model::LinkKind kind, std::size_t support, const FusionPolicy& policy) {
  if (support == 0) return 0.0;
  double base = kind == model::LinkKind::kRoute ? policy.route_base_confidence : policy.adjacency_base_confidence;
  base        = std::clamp(base, 0.0, 1.0);
  return 1.0 - std::pow(1.0 - base, static_cast<double>(support));
}

model::EdgeStatus DeriveStatus(const db::model::LinkRecord& link, std::uint64_t now_ms, const FusionPolicy& policy) {
  if (link.observation_ids.empty()) return model::EdgeStatus::kUnspecified;

  const bool corroborated = link.observation_ids.size() >= 2 || link.trusted;
  if (!corroborated) return model::EdgeStatus::kProposed;

  const auto window = static_cast<std::uint64_t>(policy.staleness_window.count());
  if (now_ms > link.seen.last_seen_ms && now_ms - link.seen.last_seen_ms > window) {
    return model::EdgeStatus::kStale;
  }
  return model::EdgeStatus::kConfirmed;
}

} // namespace netmap::fusion
