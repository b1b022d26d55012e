#include "identity_resolver.hpp"

#include <map>
#include <mutex>

#include "internal/observability/logging.hpp"
#include "internal/util/ids.hpp"

namespace netmap::identity {

std::string SourceHostId(std::string_view source_host_id) {
  return util::IdBuilder("host").Add("src").Add(source_host_id).Build();
}

std::string LinkHostId(const model::LinkAddress& link) {
  return util::IdBuilder("host").Add("lnk").Add(link.ToString()).Build();
}

std::string LinkInterfaceId(const model::LinkAddress& link) {
  return util::IdBuilder("if").Add("lnk").Add(link.ToString()).Build();
}

std::string LocalInterfaceId(std::string_view source_host_id, std::string_view local_name) {
  return util::IdBuilder("if").Add("loc").Add(source_host_id).Add(local_name).Build();
}

// ------------------------------------------------------------------
// Session
// ------------------------------------------------------------------

std::vector<MergeEvent> IdentityResolver::Session::AddSeed(const std::string& interface_id, const std::string& seed,
                                                           std::string_view reason, const std::string& observation_id) {
  ops_.push_back(Op{Op::Kind::kSeed, interface_id, seed});
  return state_.AddSeed(interface_id, seed, reason, observation_id);
}

std::optional<MergeEvent> IdentityResolver::Session::Union(const std::string& a, const std::string& b, std::string_view reason,
                                                           const std::string& observation_id) {
  ops_.push_back(Op{Op::Kind::kUnion, a, b});
  return state_.Union(a, b, reason, observation_id);
}

void IdentityResolver::Session::Reset() {
  state_ = ClusterState{};
  ops_.clear();
  reset_ = true;
}

// ------------------------------------------------------------------
// Resolver
// ------------------------------------------------------------------

IdentityResolver::Session IdentityResolver::BeginSession() const {
  std::shared_lock lock(mutex_);
  Session          session;
  session.state_        = committed_;  // snapshot copy
  session.base_version_ = version_;
  return session;
}

bool IdentityResolver::IsCurrent(const Session& session) const {
  std::shared_lock lock(mutex_);
  return session.base_version_ == version_;
}

void IdentityResolver::Publish(const Session& session) {
  std::unique_lock lock(mutex_);
  ++version_;
  if (session.reset_) {
    committed_ = ClusterState{};
  }
  // replay rather than copy: other batches may have published since the
  // session was taken
  for (const auto& op : session.ops_) {
    switch (op.kind) {
      case Session::Op::Kind::kSeed:
        committed_.AddSeed(op.a, op.b, {}, {});
        break;
      case Session::Op::Kind::kUnion:
        committed_.Union(op.a, op.b, {}, {});
        break;
    }
  }
}

void IdentityResolver::Hydrate(const std::vector<db::model::InterfaceRecord>& interfaces) {
  ClusterState                       state;
  std::map<std::string, std::string> first_by_host;

  for (const auto& row : interfaces) {
    for (const auto& seed : row.seed_host_ids) {
      state.AddSeed(row.id, seed, {}, {});
    }
    if (row.host_id.empty()) continue;
    // direct unions (link aliasing) only survive in host_id
    auto [it, inserted] = first_by_host.emplace(row.host_id, row.id);
    if (!inserted) state.Union(it->second, row.id, {}, {});
  }

  std::unique_lock lock(mutex_);
  committed_ = std::move(state);
  ++version_;
  NETMAP_LOG_INFO("identity clusters hydrated", {observability::IntField("interfaces", static_cast<std::int64_t>(committed_.InterfaceCount())),
                                                 observability::IntField("hosts", static_cast<std::int64_t>(first_by_host.size()))});
}

std::string IdentityResolver::HostOf(const std::string& interface_id) const {
  std::shared_lock lock(mutex_);
  return committed_.HostOf(interface_id);
}

std::size_t IdentityResolver::InterfaceCount() const {
  std::shared_lock lock(mutex_);
  return committed_.InterfaceCount();
}

} // namespace netmap::identity
