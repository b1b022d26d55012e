#include "topology_engine.hpp"

#include <algorithm>
#include <tuple>
#include <variant>

#include "internal/db/api/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/ids.hpp"

namespace netmap::fusion {

using db::ThrowIfDbError;
using db::model::AddId;
using db::model::AddIds;

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

std::string AdjacencyId(const std::string& lo, const std::string& hi) {
  return util::IdBuilder("ln").Add("adj").Add(lo).Add(hi).Build();
}

std::string RouteId(const std::string& from, const std::string& destination, const std::string& gateway) {
  return util::IdBuilder("ln").Add("route").Add(from).Add(destination).Add(gateway).Build();
}

std::string ConflictId(const std::string& ip, const std::string& a, const std::string& b) {
  return util::IdBuilder("cf").Add(ip).Add(a).Add(b).Build();
}

std::string HostMergeId(const std::string& survivor, const std::string& absorbed) {
  return util::IdBuilder("merge").Add(survivor).Add(absorbed).Build();
}

template <typename T, typename Key>
T& FindOrInsertSorted(std::vector<T>& items, const std::string& value, Key key) {
  auto it = std::lower_bound(items.begin(), items.end(), value, [&](const T& item, const std::string& v) { return key(item) < v; });
  if (it == items.end() || key(*it) != value) {
    T fresh{};
    key(fresh) = value;
    it         = items.insert(it, std::move(fresh));
  }
  return *it;
}

} // namespace

std::string PlaceholderId(const std::string& gateway_ip) {
  return util::IdBuilder("net").Add(gateway_ip).Build();
}

std::optional<db::model::InterfaceRecord> PickOwner(const std::vector<db::model::InterfaceRecord>& claimers, const std::string& ip) {
  const db::model::InterfaceRecord* best = nullptr;
  auto                              rank = [&](const db::model::InterfaceRecord& row) {
    const auto* claim = row.FindClaim(ip);
    return std::make_tuple(claim ? claim->seen.last_seen_ms : 0, row.HasLinkAddress());
  };
  for (const auto& row : claimers) {
    if (row.FindClaim(ip) == nullptr) continue;
    if (best == nullptr || rank(row) > rank(*best) || (rank(row) == rank(*best) && row.id < best->id)) {
      best = &row;
    }
  }
  if (best == nullptr) return std::nullopt;
  return *best;
}

TopologyEngine::TopologyEngine(db::Repository& repository, db::Transaction& tx, identity::IdentityResolver::Session& session,
                               const FusionPolicy& policy, std::uint64_t now_ms)
    : repository_(repository), tx_(tx), session_(session), policy_(policy), now_ms_(now_ms) {
}

bool TopologyEngine::Apply(const model::ObservationRecord& record) {
  const auto inserted = repository_.InsertObservation(tx_, db::model::ToRow(record, now_ms_));
  if (inserted.code == db::ErrorCode::AlreadyExists) {
    ++effects_.duplicates;
    return false;
  }
  ThrowIfDbError(inserted, "insert observation");

  std::visit(Overloaded{
                 [&](const model::ArpEntry& arp) { ApplyArp(arp, record); },
                 [&](const model::RouteEntry& route) { ApplyRoute(route, record); },
                 [&](const model::AliasEntry& alias) { ApplyAlias(alias, record); },
             },
             record.payload());
  ++effects_.applied;
  return true;
}

// ------------------------------------------------------------------
// Interfaces and address claims
// ------------------------------------------------------------------

db::model::InterfaceRecord TopologyEngine::LoadInterface(const std::string& id, bool* created) {
  if (auto row = repository_.GetInterface(tx_, id)) {
    if (created) *created = false;
    return std::move(*row);
  }
  if (created) *created = true;
  db::model::InterfaceRecord row;
  row.id = id;
  return row;
}

void TopologyEngine::SaveInterface(const db::model::InterfaceRecord& row) {
  ThrowIfDbError(repository_.UpsertInterface(tx_, row), "upsert interface " + row.id);
}

std::string TopologyEngine::TouchInterface(db::model::InterfaceRecord row, const std::vector<Seed>& seeds, const model::ObservationRecord& record) {
  row.seen.Extend(record.observed_at_ms());
  AddId(row.observation_ids, record.id());
  for (const auto& seed : seeds) {
    AddId(row.seed_host_ids, seed.host_id);
    NoteMerges(session_.AddSeed(row.id, seed.host_id, seed.reason, record.id()));
  }
  if (row.host_id.empty()) row.host_id = session_.HostOf(row.id);
  SaveInterface(row);
  touched_.insert(row.id);
  return row.id;
}

std::string TopologyEngine::ResolveInterface(const model::InterfaceRef& ref, const model::ObservationRecord& record, const std::string& reason) {
  const auto& source  = record.source_host_id();
  bool        created = false;

  if (ref.link) {
    auto row = LoadInterface(identity::LinkInterfaceId(*ref.link), &created);
    AddId(row.link_addresses, ref.link->ToString());
    if (created) effects_.created.push_back({"interface", row.id});
    return TouchInterface(std::move(row), {{identity::LinkHostId(*ref.link), "link address"}, {identity::SourceHostId(source), reason}}, record);
  }

  auto row = LoadInterface(identity::LocalInterfaceId(source, ref.name), &created);
  if (created) {
    row.source_host_id = source;
    row.local_name     = ref.name;
    effects_.created.push_back({"interface", row.id});
  }
  const auto id = TouchInterface(std::move(row), {{identity::SourceHostId(source), "local interface of " + source}}, record);
  if (ref.ip) Claim(id, *ref.ip, record);
  return id;
}

std::string TopologyEngine::ResolveNeighbor(const model::LinkAddress& link, const model::ObservationRecord& record) {
  bool created = false;
  auto row     = LoadInterface(identity::LinkInterfaceId(link), &created);
  AddId(row.link_addresses, link.ToString());
  if (created) effects_.created.push_back({"interface", row.id});
  return TouchInterface(std::move(row), {{identity::LinkHostId(link), "link address"}}, record);
}

void TopologyEngine::Claim(const std::string& interface_id, const model::IpAddress& ip, const model::ObservationRecord& record) {
  const auto text = ip.ToString();
  auto       row  = LoadInterface(interface_id, nullptr);

  auto& claim = FindOrInsertSorted(row.addresses, text, [](auto& c) -> auto& { return c.ip; });
  claim.seen.Extend(record.observed_at_ms());
  AddId(claim.observation_ids, record.id());
  SaveInterface(row);

  ReconcileIp(text);
}

void TopologyEngine::RecordConflict(const std::string& ip, db::model::InterfaceRecord& a, db::model::InterfaceRecord& b) {
  const auto* claim_a = a.FindClaim(ip);
  const auto* claim_b = b.FindClaim(ip);
  if (claim_a == nullptr || claim_b == nullptr) return;

  const auto id       = ConflictId(ip, a.id, b.id);
  auto       existing = repository_.GetConflict(tx_, id);
  const bool created  = !existing.has_value();

  db::model::ConflictRecord conflict = existing ? std::move(*existing) : db::model::ConflictRecord{};
  conflict.id          = id;
  conflict.ip          = ip;
  conflict.interface_a = a.id;
  conflict.interface_b = b.id;

  bool changed = created;
  changed      = AddIds(conflict.observation_ids, claim_a->observation_ids) || changed;
  changed      = AddIds(conflict.observation_ids, claim_b->observation_ids) || changed;
  changed      = conflict.seen.Extend(claim_a->seen) || changed;
  changed      = conflict.seen.Extend(claim_b->seen) || changed;
  if (changed) ThrowIfDbError(repository_.UpsertConflict(tx_, conflict), "upsert conflict " + id);

  for (auto* row : {&a, &b}) {
    if (AddId(row->conflicting_ips, ip)) SaveInterface(*row);
  }

  if (created) {
    effects_.created.push_back({"conflict", id});
    effects_.conflicts.push_back({id, ip, a.id, b.id});
    NETMAP_LOG_WARN("identity conflict", {observability::StringField("ip", ip), observability::StringField("interface_a", a.id),
                                          observability::StringField("interface_b", b.id)});
  }
}

void TopologyEngine::ReconcileIp(const std::string& ip) {
  auto claimers = repository_.FindInterfacesByIp(tx_, ip);
  std::sort(claimers.begin(), claimers.end(), [](const auto& l, const auto& r) { return l.id < r.id; });

  // only two distinct link addresses make a conflict; a host-local name
  // claiming the same IP is not identity evidence either way
  for (std::size_t i = 0; i < claimers.size(); ++i) {
    if (!claimers[i].HasLinkAddress()) continue;
    for (std::size_t j = i + 1; j < claimers.size(); ++j) {
      if (!claimers[j].HasLinkAddress()) continue;
      RecordConflict(ip, claimers[i], claimers[j]);
    }
  }

  const auto owner = PickOwner(claimers, ip);
  if (!owner) return;

  if (auto placeholder = repository_.GetPlaceholder(tx_, PlaceholderId(ip))) {
    if (placeholder->resolved_interface_id != owner->id) {
      placeholder->resolved_interface_id = owner->id;
      ThrowIfDbError(repository_.UpsertPlaceholder(tx_, *placeholder), "resolve placeholder " + placeholder->id);
    }
  }

  for (auto& route : repository_.FindRoutesByGateway(tx_, ip)) {
    if (route.endpoint_b == owner->id && !route.target_is_placeholder) continue;
    route.endpoint_b            = owner->id;
    route.target_is_placeholder = false;
    ThrowIfDbError(repository_.UpsertLink(tx_, route), "re-aim route " + route.id);
    NETMAP_LOG_DEBUG("route re-aimed", {observability::StringField("link", route.id), observability::StringField("gateway", ip),
                                        observability::StringField("target", owner->id)});
  }
}

// ------------------------------------------------------------------
// Records
// ------------------------------------------------------------------

void TopologyEngine::ApplyArp(const model::ArpEntry& arp, const model::ObservationRecord& record) {
  const auto local    = ResolveInterface(arp.local_interface, record, "reported as own interface by " + record.source_host_id());
  const auto neighbor = ResolveNeighbor(arp.neighbor_link, record);
  Claim(neighbor, arp.neighbor_ip, record);

  // the vantage host's own ARP row (BSD "permanent l"): identity only
  if (local != neighbor) UpsertAdjacency(local, neighbor, record);
}

void TopologyEngine::ApplyRoute(const model::RouteEntry& route, const model::ObservationRecord& record) {
  const auto from        = ResolveInterface(route.out_interface, record, "reported as own interface by " + record.source_host_id());
  const auto destination = route.destination.ToString();

  if (!route.gateway) {
    auto  row     = LoadInterface(from, nullptr);
    auto& network = FindOrInsertSorted(row.connected_networks, destination, [](auto& n) -> auto& { return n.cidr; });
    AddId(network.observation_ids, record.id());
    SaveInterface(row);
    return;
  }

  const auto gateway = route.gateway->ToString();
  const auto owner   = PickOwner(repository_.FindInterfacesByIp(tx_, gateway), gateway);

  // every gateway gets a placeholder row, resolved or not, so the set of
  // placeholders does not depend on whether the route or the claim came first
  const auto placeholder_id = PlaceholderId(gateway);
  auto       placeholder    = repository_.GetPlaceholder(tx_, placeholder_id);
  if (!placeholder) {
    placeholder             = db::model::PlaceholderRecord{};
    placeholder->id         = placeholder_id;
    placeholder->gateway_ip = gateway;
    effects_.created.push_back({"placeholder", placeholder_id});
  }
  AddId(placeholder->destinations, destination);
  AddId(placeholder->observation_ids, record.id());
  placeholder->seen.Extend(record.observed_at_ms());
  placeholder->resolved_interface_id = owner ? owner->id : std::string();
  ThrowIfDbError(repository_.UpsertPlaceholder(tx_, *placeholder), "upsert placeholder " + placeholder_id);

  const auto id   = RouteId(from, destination, gateway);
  auto       link = repository_.GetLink(tx_, id);
  if (!link) {
    link              = db::model::LinkRecord{};
    link->id          = id;
    link->kind        = model::LinkKind::kRoute;
    link->endpoint_a  = from;
    link->destination = destination;
    link->gateway_ip  = gateway;
    link->metric      = route.metric;
    effects_.created.push_back({"link", id});
  } else if (record.observed_at_ms() > link->seen.last_seen_ms) {
    link->metric = route.metric;
  } else if (record.observed_at_ms() == link->seen.last_seen_ms) {
    link->metric = std::min(link->metric, route.metric);
  }
  link->endpoint_b            = owner ? owner->id : placeholder_id;
  link->target_is_placeholder = !owner.has_value();
  MergeEvidence(*link, record);
  ThrowIfDbError(repository_.UpsertLink(tx_, *link), "upsert route " + id);
}

void TopologyEngine::ApplyAlias(const model::AliasEntry& alias, const model::ObservationRecord& record) {
  if (!alias.peer_link) {
    ResolveInterface(model::InterfaceRef::FromLink(alias.link), record, "aliased to " + record.source_host_id());
    return;
  }
  const auto a = ResolveNeighbor(alias.link, record);
  const auto b = ResolveNeighbor(*alias.peer_link, record);
  if (auto event = session_.Union(a, b, "link addresses aliased", record.id())) {
    NoteMerges({*event});
  }
}

// ------------------------------------------------------------------
// Edges
// ------------------------------------------------------------------

void TopologyEngine::UpsertAdjacency(const std::string& a, const std::string& b, const model::ObservationRecord& record) {
  const auto& lo   = std::min(a, b);
  const auto& hi   = std::max(a, b);
  const auto  id   = AdjacencyId(lo, hi);
  auto        link = repository_.GetLink(tx_, id);
  if (!link) {
    link             = db::model::LinkRecord{};
    link->id         = id;
    link->kind       = model::LinkKind::kAdjacency;
    link->endpoint_a = lo;
    link->endpoint_b = hi;
    effects_.created.push_back({"link", id});
  }
  MergeEvidence(*link, record);
  ThrowIfDbError(repository_.UpsertLink(tx_, *link), "upsert adjacency " + id);
}

void TopologyEngine::MergeEvidence(db::model::LinkRecord& link, const model::ObservationRecord& record) {
  AddId(link.observation_ids, record.id());
  link.seen.Extend(record.observed_at_ms());
  link.trusted    = link.trusted || policy_.IsTrusted(record.source_host_id());
  link.confidence = Confidence(link.kind, link.observation_ids.size(), policy_);

  const auto status = DeriveStatus(link, now_ms_, policy_);
  if (status != link.status && link.status != model::EdgeStatus::kUnspecified) {
    NETMAP_LOG_DEBUG("edge status changed", {observability::StringField("link", link.id), observability::StringField("kind", model::ToString(link.kind)),
                                             observability::StringField("from", model::ToString(link.status)),
                                             observability::StringField("to", model::ToString(status)),
                                             observability::DoubleField("confidence", link.confidence)});
  }
  link.status = status;
}

// ------------------------------------------------------------------
// Hosts
// ------------------------------------------------------------------

void TopologyEngine::NoteMerges(const std::vector<identity::MergeEvent>& events) {
  for (const auto& event : events) {
    merge_events_.emplace(event.absorbed, event);
  }
}

void TopologyEngine::Finish() {
  std::set<std::string> settled;
  for (const auto& interface_id : touched_) {
    SettleHost(interface_id, settled);
  }
}

void TopologyEngine::SettleHost(const std::string& interface_id, std::set<std::string>& settled) {
  const auto host_id = session_.HostOf(interface_id);
  if (host_id.empty() || !settled.insert(host_id).second) return;

  auto members = session_.Members(interface_id);
  std::sort(members.begin(), members.end());

  auto       existing = repository_.GetHost(tx_, host_id);
  const bool created  = !existing.has_value();

  // rebuilt from the members every time, never patched
  db::model::HostRecord host;
  host.id = host_id;

  std::map<std::string, db::model::IdList> labels;
  std::set<std::string>                    absorbed;

  for (const auto& member_id : members) {
    auto row = repository_.GetInterface(tx_, member_id);
    if (!row) {
      throw util::StoreCorruptionError("interface " + member_id + " of host " + host_id + " is missing from the store");
    }
    if (row->host_id != host_id) {
      if (!row->host_id.empty()) absorbed.insert(row->host_id);
      row->host_id = host_id;
      SaveInterface(*row);
    }
    AddId(host.interface_ids, row->id);
    host.seen.Extend(row->seen);
    AddIds(host.observation_ids, row->observation_ids);
    if (!row->source_host_id.empty()) AddIds(labels[row->source_host_id], row->observation_ids);
  }
  for (auto& [value, observation_ids] : labels) {
    host.labels.push_back(db::model::HostLabel{value, std::move(observation_ids)});
  }

  if (created) {
    effects_.created.push_back({"host", host_id});
  }
  if (created || *existing != host) {
    ThrowIfDbError(repository_.UpsertHost(tx_, host), "upsert host " + host_id);
  }

  for (const auto& old_id : absorbed) {
    auto stub = repository_.GetHost(tx_, old_id);
    if (stub && stub->merged_into == host_id) continue;

    db::model::HostRecord absorbed_row;
    absorbed_row.id          = old_id;
    absorbed_row.merged_into = host_id;
    ThrowIfDbError(repository_.UpsertHost(tx_, absorbed_row), "absorb host " + old_id);

    db::model::HostMergeRecord merge;
    merge.id           = HostMergeId(host_id, old_id);
    merge.survivor_id  = host_id;
    merge.absorbed_id  = old_id;
    merge.merged_at_ms = now_ms_;
    merge.reason       = "identity evidence";
    if (auto event = merge_events_.find(old_id); event != merge_events_.end()) {
      merge.reason = event->second.reason;
      if (!event->second.observation_id.empty()) AddId(merge.observation_ids, event->second.observation_id);
    }
    const auto inserted = repository_.InsertHostMerge(tx_, merge);
    if (inserted.code != db::ErrorCode::AlreadyExists) ThrowIfDbError(inserted, "record host merge " + merge.id);

    effects_.merges.push_back({host_id, old_id, merge.reason});
    NETMAP_LOG_INFO("hosts merged", {observability::StringField("survivor", host_id), observability::StringField("absorbed", old_id),
                                     observability::StringField("reason", merge.reason)});
  }
}

} // namespace netmap::fusion
