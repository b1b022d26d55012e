#include "internal/fusion/confidence.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

#include "support/graph_fixtures.hpp"

namespace {

using netmap::db::model::LinkRecord;
using netmap::fusion::Confidence;
using netmap::fusion::DeriveStatus;
using netmap::fusion::FusionPolicy;
using netmap::model::CanTransition;
using netmap::model::EdgeStatus;
using netmap::model::LinkKind;
using netmap::testing::kHour;
using netmap::testing::kT0;

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

void TestConfidenceIsMonotone() {
  FusionPolicy policy;
  assert(Confidence(LinkKind::kAdjacency, 0, policy) == 0.0);
  assert(Near(Confidence(LinkKind::kAdjacency, 1, policy), 0.5));
  assert(Near(Confidence(LinkKind::kAdjacency, 2, policy), 0.75));
  assert(Near(Confidence(LinkKind::kRoute, 1, policy), 0.3));
  assert(Near(Confidence(LinkKind::kRoute, 2, policy), 0.51));

  double previous = 0.0;
  for (std::size_t n = 1; n < 64; ++n) {
    const double c = Confidence(LinkKind::kAdjacency, n, policy);
    assert(c >= previous);
    assert(c <= 1.0);
    previous = c;
  }
}

LinkRecord Link(std::size_t support, std::uint64_t last_seen, bool trusted = false) {
  LinkRecord link;
  link.kind = LinkKind::kAdjacency;
  for (std::size_t i = 0; i < support; ++i) link.observation_ids.push_back("obs-" + std::to_string(i));
  link.seen.first_seen_ms = last_seen;
  link.seen.last_seen_ms  = last_seen;
  link.trusted            = trusted;
  return link;
}

void TestDerivedStatus() {
  FusionPolicy policy;
  policy.staleness_window = std::chrono::hours(1);

  assert(DeriveStatus(Link(0, kT0), kT0, policy) == EdgeStatus::kUnspecified);
  assert(DeriveStatus(Link(1, kT0), kT0, policy) == EdgeStatus::kProposed);
  assert(DeriveStatus(Link(2, kT0), kT0, policy) == EdgeStatus::kConfirmed);
  assert(DeriveStatus(Link(1, kT0, true), kT0, policy) == EdgeStatus::kConfirmed);

  // a proposed edge never goes stale, a confirmed one does
  assert(DeriveStatus(Link(1, kT0), kT0 + 3 * kHour, policy) == EdgeStatus::kProposed);
  assert(DeriveStatus(Link(2, kT0), kT0 + kHour, policy) == EdgeStatus::kConfirmed);
  assert(DeriveStatus(Link(2, kT0), kT0 + kHour + 1, policy) == EdgeStatus::kStale);

  // clock behind the evidence
  assert(DeriveStatus(Link(2, kT0), kT0 - kHour, policy) == EdgeStatus::kConfirmed);
}

void TestTransitions() {
  assert(CanTransition(EdgeStatus::kProposed, EdgeStatus::kConfirmed));
  assert(CanTransition(EdgeStatus::kConfirmed, EdgeStatus::kStale));
  assert(CanTransition(EdgeStatus::kStale, EdgeStatus::kConfirmed));
  assert(!CanTransition(EdgeStatus::kConfirmed, EdgeStatus::kProposed));
  assert(!CanTransition(EdgeStatus::kStale, EdgeStatus::kProposed));
  assert(!CanTransition(EdgeStatus::kProposed, EdgeStatus::kStale));
  assert(!CanTransition(EdgeStatus::kConfirmed, EdgeStatus::kUnspecified));
  static_assert(CanTransition(EdgeStatus::kUnspecified, EdgeStatus::kProposed));
}

void TestTrustedSources() {
  FusionPolicy policy;
  policy.trusted_sources = {"core-router"};
  assert(policy.IsTrusted("core-router"));
  assert(!policy.IsTrusted("laptop"));
}

} // namespace

int main() {
  TestConfidenceIsMonotone();
  TestDerivedStatus();
  TestTransitions();
  TestTrustedSources();

  std::cout << "netmap_unit_confidence: pass\n";
  return 0;
}
