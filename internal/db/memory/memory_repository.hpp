#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace netmap::db::memory {

class MemoryTransaction;

/*
  In-process graph store.

  Transactions work on a private snapshot. Every row and index entry a
  transaction reads or writes is tracked by key; Commit() rejects the
  transaction with Busy if any of those keys changed after the snapshot was
  taken. Transactions over disjoint entities therefore both commit.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;
  Result Reset(Transaction&) override;

  Result UpsertHost(Transaction&, const model::HostRecord&) override;
  std::optional<model::HostRecord> GetHost(Transaction&, const std::string&) override;
  std::vector<model::HostRecord> ListHosts(Transaction&) override;

  Result UpsertInterface(Transaction&, const model::InterfaceRecord&) override;
  std::optional<model::InterfaceRecord> GetInterface(Transaction&, const std::string&) override;
  std::vector<model::InterfaceRecord> ListInterfaces(Transaction&) override;
  std::vector<model::InterfaceRecord> FindInterfacesByIp(Transaction&, const std::string& ip) override;

  Result UpsertLink(Transaction&, const model::LinkRecord&) override;
  std::optional<model::LinkRecord> GetLink(Transaction&, const std::string&) override;
  std::vector<model::LinkRecord> ListLinks(Transaction&) override;
  std::vector<model::LinkRecord> FindRoutesByGateway(Transaction&, const std::string& ip) override;

  Result InsertObservation(Transaction&, const model::ObservationRow&) override;
  std::optional<model::ObservationRow> GetObservation(Transaction&, const std::string&) override;
  std::vector<model::ObservationRow> ListObservations(Transaction&) override;

  Result UpsertPlaceholder(Transaction&, const model::PlaceholderRecord&) override;
  std::optional<model::PlaceholderRecord> GetPlaceholder(Transaction&, const std::string&) override;
  std::vector<model::PlaceholderRecord> ListPlaceholders(Transaction&) override;

  Result UpsertConflict(Transaction&, const model::ConflictRecord&) override;
  std::optional<model::ConflictRecord> GetConflict(Transaction&, const std::string&) override;
  std::vector<model::ConflictRecord> ListConflicts(Transaction&) override;

  Result InsertHostMerge(Transaction&, const model::HostMergeRecord&) override;
  std::vector<model::HostMergeRecord> ListHostMerges(Transaction&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, model::HostRecord> hosts;
    std::map<std::string, model::InterfaceRecord> interfaces;
    std::map<std::string, model::LinkRecord> links;
    std::map<std::string, model::ObservationRow> observations;
    std::map<std::string, model::PlaceholderRecord> placeholders;
    std::map<std::string, model::ConflictRecord> conflicts;
    std::map<std::string, model::HostMergeRecord> host_merges;

    // ip -> interfaces claiming it; gateway ip -> route links through it
    std::unordered_map<std::string, std::set<std::string>> ip_index;
    std::unordered_map<std::string, std::set<std::string>> gateway_index;
  };

  std::mutex mutex_;
  State committed_;

  // commit counter; key_versions_[key] is the counter value of the last
  // commit that wrote the key
  uint64_t committed_version_ = 0;
  uint64_t reset_version_ = 0;
  std::unordered_map<std::string, uint64_t> key_versions_;
};

}
