#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "internal/identity/disjoint_set.hpp"

namespace netmap::identity {

// A cluster's canonical host id changed: `absorbed` now lives on as `survivor`.
struct MergeEvent {
  std::string survivor;
  std::string absorbed;
  std::string reason;
  std::string observation_id;
};

/*
  Interface clusters.

  Every interface carries one or more seed host ids. Interfaces sharing a
  seed are one cluster; explicit evidence can union clusters directly. The
  canonical host of a cluster is the smallest seed in it, so the surviving
  id does not depend on the order in which clusters met.
*/
class ClusterState {
 public:
  // Registers the interface if needed and attaches the seed.
  std::vector<MergeEvent> AddSeed(const std::string& interface_id, const std::string& seed, std::string_view reason,
                                  const std::string& observation_id);

  std::optional<MergeEvent> Union(const std::string& a, const std::string& b, std::string_view reason,
                                  const std::string& observation_id);

  bool Contains(const std::string& interface_id) const {
    return index_.contains(interface_id);
  }

  // Canonical host of the interface's cluster; empty when unknown.
  std::string HostOf(const std::string& interface_id) const;

  std::vector<std::string> Members(const std::string& interface_id);

  std::size_t InterfaceCount() const {
    return ids_.size();
  }

 private:
  DisjointSet::Index Ensure(const std::string& interface_id);

  std::optional<MergeEvent> Join(DisjointSet::Index a, DisjointSet::Index b, std::string_view reason,
                                 const std::string& observation_id);

  DisjointSet                                         sets_;
  std::vector<std::string>                            ids_;
  std::unordered_map<std::string, DisjointSet::Index> index_;
  std::vector<std::string>                            min_seed_;  // valid at roots
  std::unordered_map<std::string, DisjointSet::Index> seed_owner_;
};

} // namespace netmap::identity
