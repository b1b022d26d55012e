#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace netmap::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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

  static Result Translate(sqlite3* db, int rc);

private:
  static SqliteTransaction& TX(Transaction& t);

  std::shared_ptr<SqliteDB> db_;
};

}
