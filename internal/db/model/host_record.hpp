#pragma once

#include <string>
#include <vector>

#include "internal/db/model/provenance.hpp"

namespace netmap::db::model {

// Display name for a host with the observations that reported it.
struct HostLabel {
  std::string value;
  IdList      observation_ids;

  bool operator==(const HostLabel&) const = default;
};

/*
  Persistent host row.

  A host absorbed by a merge keeps only its id and merged_into; everything
  it carried is folded into the survivor.
*/
struct HostRecord {
  std::string id;

  IdList                 interface_ids;
  std::vector<HostLabel> labels;  // sorted by value

  SeenWindow seen;
  IdList     observation_ids;

  std::string merged_into;

  bool IsAbsorbed() const {
    return !merged_into.empty();
  }

  bool operator==(const HostRecord&) const = default;
};

} // namespace netmap::db::model
