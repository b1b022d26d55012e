#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace netmap::db::memory {

namespace {

std::string Key(char collection, const std::string& id) {
  std::string key;
  key.reserve(id.size() + 2);
  key.push_back(collection);
  key.push_back('/');
  key += id;
  return key;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

template <typename Map>
static std::optional<typename Map::mapped_type> Lookup(MemoryTransaction& tx, const Map& map, char collection, const std::string& id) {
  tx.MarkRead(Key(collection, id));
  auto it = map.find(id);
  if (it == map.end()) return std::nullopt;
  return it->second;
}

template <typename Map>
static std::vector<typename Map::mapped_type> Values(MemoryTransaction& tx, const Map& map, char collection) {
  std::vector<typename Map::mapped_type> out;
  out.reserve(map.size());
  for (const auto& [id, row] : map) {
    tx.MarkRead(Key(collection, id));
    out.push_back(row);
  }
  return out;
}

Result MemoryRepository::Reset(Transaction& t) {
  auto& tx = TX(t);
  tx.Mutable() = State{};
  tx.MarkReset();
  return Result::Ok();
}

// ------------------------------------------------------------------
// Hosts
// ------------------------------------------------------------------

Result MemoryRepository::UpsertHost(Transaction& t, const model::HostRecord& r) {
  if (r.id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "host id is empty");
  auto& tx = TX(t);
  tx.Mutable().hosts[r.id] = r;
  tx.MarkWrite(Key('h', r.id));
  return Result::Ok();
}

std::optional<model::HostRecord> MemoryRepository::GetHost(Transaction& t, const std::string& id) {
  auto& tx = TX(t);
  return Lookup(tx, tx.View().hosts, 'h', id);
}

std::vector<model::HostRecord> MemoryRepository::ListHosts(Transaction& t) {
  auto& tx = TX(t);
  return Values(tx, tx.View().hosts, 'h');
}

// ------------------------------------------------------------------
// Interfaces
// ------------------------------------------------------------------

Result MemoryRepository::UpsertInterface(Transaction& t, const model::InterfaceRecord& r) {
  if (r.id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "interface id is empty");
  auto& tx = TX(t);
  auto& s  = tx.Mutable();

  // keep the ip index in step with the claims on the row
  if (auto existing = s.interfaces.find(r.id); existing != s.interfaces.end()) {
    for (const auto& claim : existing->second.addresses) {
      if (r.FindClaim(claim.ip) == nullptr) {
        s.ip_index[claim.ip].erase(r.id);
        tx.MarkWrite(Key('x', claim.ip));
      }
    }
  }
  for (const auto& claim : r.addresses) {
    if (s.ip_index[claim.ip].insert(r.id).second) {
      tx.MarkWrite(Key('x', claim.ip));
    }
  }

  s.interfaces[r.id] = r;
  tx.MarkWrite(Key('i', r.id));
  return Result::Ok();
}

std::optional<model::InterfaceRecord> MemoryRepository::GetInterface(Transaction& t, const std::string& id) {
  auto& tx = TX(t);
  return Lookup(tx, tx.View().interfaces, 'i', id);
}

std::vector<model::InterfaceRecord> MemoryRepository::ListInterfaces(Transaction& t) {
  auto& tx = TX(t);
  return Values(tx, tx.View().interfaces, 'i');
}

std::vector<model::InterfaceRecord> MemoryRepository::FindInterfacesByIp(Transaction& t, const std::string& ip) {
  auto&       tx = TX(t);
  const auto& s  = tx.View();
  tx.MarkRead(Key('x', ip));

  std::vector<model::InterfaceRecord> out;
  auto                                it = s.ip_index.find(ip);
  if (it == s.ip_index.end()) return out;
  for (const auto& id : it->second) {
    if (auto row = Lookup(tx, s.interfaces, 'i', id)) out.push_back(std::move(*row));
  }
  return out;
}

// ------------------------------------------------------------------
// Links
// ------------------------------------------------------------------

Result MemoryRepository::UpsertLink(Transaction& t, const model::LinkRecord& r) {
  if (r.id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "link id is empty");
  auto& tx = TX(t);
  auto& s  = tx.Mutable();

  if (auto existing = s.links.find(r.id); existing != s.links.end() && existing->second.gateway_ip != r.gateway_ip) {
    s.gateway_index[existing->second.gateway_ip].erase(r.id);
    tx.MarkWrite(Key('g', existing->second.gateway_ip));
  }
  if (r.kind == netmap::model::LinkKind::kRoute && !r.gateway_ip.empty()) {
    if (s.gateway_index[r.gateway_ip].insert(r.id).second) {
      tx.MarkWrite(Key('g', r.gateway_ip));
    }
  }

  s.links[r.id] = r;
  tx.MarkWrite(Key('l', r.id));
  return Result::Ok();
}

std::optional<model::LinkRecord> MemoryRepository::GetLink(Transaction& t, const std::string& id) {
  auto& tx = TX(t);
  return Lookup(tx, tx.View().links, 'l', id);
}

std::vector<model::LinkRecord> MemoryRepository::ListLinks(Transaction& t) {
  auto& tx = TX(t);
  return Values(tx, tx.View().links, 'l');
}

std::vector<model::LinkRecord> MemoryRepository::FindRoutesByGateway(Transaction& t, const std::string& ip) {
  auto&       tx = TX(t);
  const auto& s  = tx.View();
  tx.MarkRead(Key('g', ip));

  std::vector<model::LinkRecord> out;
  auto                           it = s.gateway_index.find(ip);
  if (it == s.gateway_index.end()) return out;
  for (const auto& id : it->second) {
    if (auto row = Lookup(tx, s.links, 'l', id)) out.push_back(std::move(*row));
  }
  return out;
}

// ------------------------------------------------------------------
// Observations
// ------------------------------------------------------------------

Result MemoryRepository::InsertObservation(Transaction& t, const model::ObservationRow& r) {
  auto& tx = TX(t);
  auto& s  = tx.Mutable();
  tx.MarkRead(Key('o', r.id));
  if (s.observations.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "observation " + r.id);
  s.observations[r.id] = r;
  tx.MarkWrite(Key('o', r.id));
  return Result::Ok();
}

std::optional<model::ObservationRow> MemoryRepository::GetObservation(Transaction& t, const std::string& id) {
  auto& tx = TX(t);
  return Lookup(tx, tx.View().observations, 'o', id);
}

std::vector<model::ObservationRow> MemoryRepository::ListObservations(Transaction& t) {
  auto& tx = TX(t);
  return Values(tx, tx.View().observations, 'o');
}

// ------------------------------------------------------------------
// Placeholders, conflicts, merges
// ------------------------------------------------------------------

Result MemoryRepository::UpsertPlaceholder(Transaction& t, const model::PlaceholderRecord& r) {
  auto& tx                        = TX(t);
  tx.Mutable().placeholders[r.id] = r;
  tx.MarkWrite(Key('p', r.id));
  return Result::Ok();
}

std::optional<model::PlaceholderRecord> MemoryRepository::GetPlaceholder(Transaction& t, const std::string& id) {
  auto& tx = TX(t);
  return Lookup(tx, tx.View().placeholders, 'p', id);
}

std::vector<model::PlaceholderRecord> MemoryRepository::ListPlaceholders(Transaction& t) {
  auto& tx = TX(t);
  return Values(tx, tx.View().placeholders, 'p');
}

Result MemoryRepository::UpsertConflict(Transaction& t, const model::ConflictRecord& r) {
  auto& tx                     = TX(t);
  tx.Mutable().conflicts[r.id] = r;
  tx.MarkWrite(Key('c', r.id));
  return Result::Ok();
}

std::optional<model::ConflictRecord> MemoryRepository::GetConflict(Transaction& t, const std::string& id) {
  auto& tx = TX(t);
  return Lookup(tx, tx.View().conflicts, 'c', id);
}

std::vector<model::ConflictRecord> MemoryRepository::ListConflicts(Transaction& t) {
  auto& tx = TX(t);
  return Values(tx, tx.View().conflicts, 'c');
}

Result MemoryRepository::InsertHostMerge(Transaction& t, const model::HostMergeRecord& r) {
  auto& tx = TX(t);
  auto& s  = tx.Mutable();
  if (s.host_merges.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "host merge " + r.id);
  s.host_merges[r.id] = r;
  tx.MarkWrite(Key('m', r.id));
  return Result::Ok();
}

std::vector<model::HostMergeRecord> MemoryRepository::ListHostMerges(Transaction& t) {
  auto& tx = TX(t);
  return Values(tx, tx.View().host_merges, 'm');
}

} // namespace netmap::db::memory
