#pragma once

#include <cstdint>
#include <string>

#include "internal/db/model/provenance.hpp"

namespace netmap::db::model {

// Append-only: survivor absorbed `absorbed` because of `reason`.
struct HostMergeRecord {
  std::string id;
  std::string survivor_id;
  std::string absorbed_id;
  std::string reason;

  uint64_t merged_at_ms = 0;
  IdList   observation_ids;

  bool operator==(const HostMergeRecord&) const = default;
};

} // namespace netmap::db::model
