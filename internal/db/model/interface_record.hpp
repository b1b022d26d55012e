#pragma once

#include <string>
#include <vector>

#include "internal/db/model/provenance.hpp"

namespace netmap::db::model {

// Evidence that an interface held an IP during the seen window.
struct AddressClaim {
  std::string ip;  // canonical text
  SeenWindow  seen;
  IdList      observation_ids;

  bool operator==(const AddressClaim&) const = default;
};

// Destination reachable on-link from this interface (gateway-less route).
struct ConnectedNetwork {
  std::string cidr;
  IdList      observation_ids;

  bool operator==(const ConnectedNetwork&) const = default;
};

/*
  Persistent interface row.

  Identity is either a link address (link_addresses has exactly that one
  entry) or a (source_host_id, local_name) pair reported by a vantage host.
  seed_host_ids is the identity evidence; host_id is the current canonical
  host of the interface's cluster.
*/
struct InterfaceRecord {
  std::string id;
  std::string host_id;
  IdList      seed_host_ids;

  std::string source_host_id;
  std::string local_name;
  IdList      link_addresses;

  std::vector<AddressClaim>     addresses;  // sorted by ip
  std::vector<ConnectedNetwork> connected_networks;  // sorted by cidr
  IdList                        conflicting_ips;

  SeenWindow seen;
  IdList     observation_ids;

  bool HasLinkAddress() const {
    return !link_addresses.empty();
  }

  const AddressClaim* FindClaim(const std::string& ip) const {
    for (const auto& claim : addresses) {
      if (claim.ip == ip) return &claim;
    }
    return nullptr;
  }

  bool operator==(const InterfaceRecord&) const = default;
};

} // namespace netmap::db::model
