#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/db/model/conflict_record.hpp"
#include "internal/db/model/host_merge_record.hpp"
#include "internal/db/model/host_record.hpp"
#include "internal/db/model/interface_record.hpp"
#include "internal/db/model/link_record.hpp"
#include "internal/db/model/observation_row.hpp"
#include "internal/db/model/placeholder_record.hpp"

namespace netmap::core {

struct GraphFilter {
  bool   include_stale  = true;
  double min_confidence = 0.0;
};

// A link with its endpoints projected onto hosts. host_b is empty while a
// route still targets a placeholder.
struct LinkView {
  db::model::LinkRecord link;
  std::string           host_a;
  std::string           host_b;

  bool operator==(const LinkView&) const = default;
};

/*
  Consistent point-in-time view of the graph, read in one transaction.

  GetGraph() fills the live graph only (absorbed host stubs, merge history
  and observations are left out); Export() fills everything.
*/
struct GraphSnapshot {
  std::uint64_t generated_at_ms = 0;

  std::vector<db::model::HostRecord>        hosts;
  std::vector<db::model::InterfaceRecord>   interfaces;
  std::vector<LinkView>                     links;
  std::vector<db::model::PlaceholderRecord> placeholders;
  std::vector<db::model::ConflictRecord>    conflicts;
  std::vector<db::model::HostMergeRecord>   host_merges;
  std::vector<db::model::ObservationRow>    observations;
};

} // namespace netmap::core
