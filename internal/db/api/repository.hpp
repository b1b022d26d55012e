#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/conflict_record.hpp"
#include "internal/db/model/host_merge_record.hpp"
#include "internal/db/model/host_record.hpp"
#include "internal/db/model/interface_record.hpp"
#include "internal/db/model/link_record.hpp"
#include "internal/db/model/observation_row.hpp"
#include "internal/db/model/placeholder_record.hpp"

namespace netmap::db {

/*
  Graph store abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes happen inside a Transaction
  - Reads inside a transaction see its writes
  - A batch commits all of its rows or none of them
  - Concurrent transactions touching the same rows cannot both commit

  Collections:
    hosts, interfaces, links, observations     (the persisted graph schema)
    placeholders, conflicts, host_merges       (derived/provenance rows)

  Every row carries its own id and its provenance list.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // Drops every row in every collection.
  virtual Result Reset(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Hosts
  // ---------------------------------------------------------------------

  virtual Result UpsertHost(Transaction&, const model::HostRecord&) = 0;

  virtual std::optional<model::HostRecord> GetHost(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::HostRecord> ListHosts(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Interfaces
  // ---------------------------------------------------------------------

  virtual Result UpsertInterface(Transaction&, const model::InterfaceRecord&) = 0;

  virtual std::optional<model::InterfaceRecord> GetInterface(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::InterfaceRecord> ListInterfaces(Transaction&) = 0;

  // Every interface holding a claim on `ip` (canonical text).
  virtual std::vector<model::InterfaceRecord> FindInterfacesByIp(Transaction&, const std::string& ip) = 0;

  // ---------------------------------------------------------------------
  // Links
  // ---------------------------------------------------------------------

  virtual Result UpsertLink(Transaction&, const model::LinkRecord&) = 0;

  virtual std::optional<model::LinkRecord> GetLink(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::LinkRecord> ListLinks(Transaction&) = 0;

  // Route links whose gateway is `ip`, whatever they currently point at.
  virtual std::vector<model::LinkRecord> FindRoutesByGateway(Transaction&, const std::string& ip) = 0;

  // ---------------------------------------------------------------------
  // Observations (append-only history)
  // ---------------------------------------------------------------------

  // AlreadyExists when the id is known.
  virtual Result InsertObservation(Transaction&, const model::ObservationRow&) = 0;

  virtual std::optional<model::ObservationRow> GetObservation(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::ObservationRow> ListObservations(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Placeholders, conflicts, merges
  // ---------------------------------------------------------------------

  virtual Result UpsertPlaceholder(Transaction&, const model::PlaceholderRecord&) = 0;

  virtual std::optional<model::PlaceholderRecord> GetPlaceholder(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::PlaceholderRecord> ListPlaceholders(Transaction&) = 0;

  virtual Result UpsertConflict(Transaction&, const model::ConflictRecord&) = 0;

  virtual std::optional<model::ConflictRecord> GetConflict(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::ConflictRecord> ListConflicts(Transaction&) = 0;

  virtual Result InsertHostMerge(Transaction&, const model::HostMergeRecord&) = 0;

  virtual std::vector<model::HostMergeRecord> ListHostMerges(Transaction&) = 0;
};

} // namespace netmap::db
