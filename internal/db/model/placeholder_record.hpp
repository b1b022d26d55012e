#pragma once

#include <string>

#include "internal/db/model/provenance.hpp"

namespace netmap::db::model {

/*
  "Networks reachable via gateway X", kept while X has no known owner.

  Once an interface claims X, resolved_interface_id is set and routes
  through X are re-aimed at that interface. The row itself stays.
*/
struct PlaceholderRecord {
  std::string id;
  std::string gateway_ip;
  IdList      destinations;

  std::string resolved_interface_id;

  SeenWindow seen;
  IdList     observation_ids;

  bool IsResolved() const {
    return !resolved_interface_id.empty();
  }

  bool operator==(const PlaceholderRecord&) const = default;
};

} // namespace netmap::db::model
