#pragma once

#include <string>

#include "internal/db/model/provenance.hpp"

namespace netmap::db::model {

// One IP claimed by two link-address interfaces. interface_a < interface_b.
struct ConflictRecord {
  std::string id;
  std::string ip;
  std::string interface_a;
  std::string interface_b;

  SeenWindow seen;
  IdList     observation_ids;

  bool operator==(const ConflictRecord&) const = default;
};

} // namespace netmap::db::model
