#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/fusion/confidence.hpp"
#include "internal/identity/identity_resolver.hpp"
#include "internal/model/observation.hpp"

namespace netmap::fusion {

struct CreatedEntity {
  std::string kind;  // "host", "interface", "link", "placeholder", "conflict"
  std::string id;

  bool operator==(const CreatedEntity&) const = default;
};

struct ConflictRaised {
  std::string conflict_id;
  std::string ip;
  std::string interface_a;
  std::string interface_b;
};

struct HostMerged {
  std::string survivor_id;
  std::string absorbed_id;
  std::string reason;
};

// What one batch did to the graph.
struct BatchEffects {
  std::size_t                 applied    = 0;
  std::size_t                 duplicates = 0;
  std::vector<CreatedEntity>  created;
  std::vector<ConflictRaised> conflicts;
  std::vector<HostMerged>     merges;
};

/*
  TopologyEngine

  Applies observations to the graph inside one store transaction and one
  resolver session. Every mutation is a merge (set union, window extension,
  max-by-timestamp) so the result does not depend on the order records
  arrive in, or on how they are split into batches.

  Per record:
    arp    local interface <-> neighbor link-address interface (adjacency),
           neighbor claims the neighbor IP
    route  reporting interface -> current owner of the gateway IP, or the
           gateway's placeholder; on-link routes become connected networks
    alias  link address tied to the source host, or two link addresses
           tied to one machine

  Host clusters touched by the batch are settled once, in Finish().
*/
class TopologyEngine {
 public:
  TopologyEngine(db::Repository& repository, db::Transaction& tx, identity::IdentityResolver::Session& session, const FusionPolicy& policy,
                 std::uint64_t now_ms);

  // Returns false if the observation was already in the store.
  bool Apply(const model::ObservationRecord& record);

  void Finish();

  const BatchEffects& Effects() const {
    return effects_;
  }

 private:
  struct Seed {
    std::string host_id;
    std::string reason;
  };

  std::string ResolveInterface(const model::InterfaceRef& ref, const model::ObservationRecord& record, const std::string& reason);
  std::string ResolveNeighbor(const model::LinkAddress& link, const model::ObservationRecord& record);
  std::string TouchInterface(db::model::InterfaceRecord row, const std::vector<Seed>& seeds, const model::ObservationRecord& record);

  void Claim(const std::string& interface_id, const model::IpAddress& ip, const model::ObservationRecord& record);
  void ReconcileIp(const std::string& ip);
  void RecordConflict(const std::string& ip, db::model::InterfaceRecord& a, db::model::InterfaceRecord& b);

  void ApplyArp(const model::ArpEntry& arp, const model::ObservationRecord& record);
  void ApplyRoute(const model::RouteEntry& route, const model::ObservationRecord& record);
  void ApplyAlias(const model::AliasEntry& alias, const model::ObservationRecord& record);

  void UpsertAdjacency(const std::string& a, const std::string& b, const model::ObservationRecord& record);
  void MergeEvidence(db::model::LinkRecord& link, const model::ObservationRecord& record);

  void NoteMerges(const std::vector<identity::MergeEvent>& events);
  void SettleHost(const std::string& interface_id, std::set<std::string>& settled);

  db::model::InterfaceRecord LoadInterface(const std::string& id, bool* created);
  void                       SaveInterface(const db::model::InterfaceRecord& row);

  db::Repository&                      repository_;
  db::Transaction&                     tx_;
  identity::IdentityResolver::Session& session_;
  const FusionPolicy&                  policy_;
  std::uint64_t                        now_ms_;

  std::set<std::string>                        touched_;
  std::map<std::string, identity::MergeEvent> merge_events_;  // by absorbed host
  BatchEffects                                 effects_;
};

std::string PlaceholderId(const std::string& gateway_ip);

// Interface holding `ip` now: latest claim wins; ties go to link-address
// interfaces, then to the lowest id.
std::optional<db::model::InterfaceRecord> PickOwner(const std::vector<db::model::InterfaceRecord>& claimers, const std::string& ip);

} // namespace netmap::fusion
