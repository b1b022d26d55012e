#include "cluster_state.hpp"

namespace netmap::identity {

DisjointSet::Index ClusterState::Ensure(const std::string& interface_id) {
  if (auto it = index_.find(interface_id); it != index_.end()) return it->second;
  const auto index = sets_.Add();
  ids_.push_back(interface_id);
  min_seed_.emplace_back();
  index_.emplace(interface_id, index);
  return index;
}

std::optional<MergeEvent> ClusterState::Join(DisjointSet::Index a, DisjointSet::Index b, std::string_view reason,
                                             const std::string& observation_id) {
  const auto ra = sets_.Find(a);
  const auto rb = sets_.Find(b);
  if (ra == rb) return std::nullopt;

  const std::string ha = min_seed_[ra];
  const std::string hb = min_seed_[rb];
  const auto        root = sets_.Union(ra, rb);

  std::string survivor = ha;
  std::string absorbed = hb;
  if (survivor.empty() || (!absorbed.empty() && absorbed < survivor)) std::swap(survivor, absorbed);
  min_seed_[root] = survivor;

  if (absorbed.empty() || absorbed == survivor) return std::nullopt;
  return MergeEvent{survivor, absorbed, std::string(reason), observation_id};
}

std::vector<MergeEvent> ClusterState::AddSeed(const std::string& interface_id, const std::string& seed, std::string_view reason,
                                              const std::string& observation_id) {
  std::vector<MergeEvent> events;
  const auto              index = Ensure(interface_id);

  if (auto owner = seed_owner_.find(seed); owner != seed_owner_.end()) {
    if (auto event = Join(index, owner->second, reason, observation_id)) events.push_back(std::move(*event));
    return events;
  }
  seed_owner_.emplace(seed, index);

  // a new, smaller seed renames the cluster
  const auto root    = sets_.Find(index);
  auto&      current = min_seed_[root];
  if (current.empty()) {
    current = seed;
  } else if (seed < current) {
    events.push_back(MergeEvent{seed, current, std::string(reason), observation_id});
    current = seed;
  }
  return events;
}

std::optional<MergeEvent> ClusterState::Union(const std::string& a, const std::string& b, std::string_view reason,
                                              const std::string& observation_id) {
  return Join(Ensure(a), Ensure(b), reason, observation_id);
}

std::string ClusterState::HostOf(const std::string& interface_id) const {
  auto it = index_.find(interface_id);
  if (it == index_.end()) return {};
  return min_seed_[sets_.FindConst(it->second)];
}

std::vector<std::string> ClusterState::Members(const std::string& interface_id) {
  std::vector<std::string> out;
  auto                     it = index_.find(interface_id);
  if (it == index_.end()) return out;
  for (auto member : sets_.Members(it->second)) {
    out.push_back(ids_[member]);
  }
  return out;
}

} // namespace netmap::identity
