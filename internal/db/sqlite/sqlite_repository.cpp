#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/api/db_error.hpp"
#include "internal/db/codec/record_codec.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace netmap::db::sqlite {

using netmap::db::ErrorCode;
using netmap::db::Result;

namespace {

/*
  Finalizes on scope exit so early returns cannot leak statements.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) {
    rc_ = sqlite3_prepare_v2(db, sql, -1, &st_, nullptr);
  }
  ~Statement() {
    if (st_) sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  bool Ok() const {
    return rc_ == SQLITE_OK && st_ != nullptr;
  }
  int PrepareCode() const {
    return rc_;
  }
  sqlite3_stmt* get() const {
    return st_;
  }

 private:
  sqlite3_stmt* st_ = nullptr;
  int           rc_ = SQLITE_OK;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

template <typename Message>
void BindBody(sqlite3_stmt* st, int idx, const Message& message) {
  const std::string bytes = message.SerializeAsString();
  sqlite3_bind_blob(st, idx, bytes.data(), static_cast<int>(bytes.size()), SQLITE_TRANSIENT);
}

template <typename Message>
Message ColBody(sqlite3_stmt* st, int col) {
  Message     message;
  const void* data = sqlite3_column_blob(st, col);
  const int   size = sqlite3_column_bytes(st, col);
  if (size > 0 && !message.ParseFromArray(data, size)) {
    throw util::StoreCorruptionError("sqlite: unreadable row body");
  }
  return message;
}

// Runs a single-row lookup keyed by id.
template <typename Message, typename Record>
std::optional<Record> SelectOne(sqlite3* db, const char* sql, const std::string& id) {
  Statement st(db, sql);
  if (!st.Ok()) ThrowIfDbError(SqliteRepository::Translate(db, st.PrepareCode()), "sqlite prepare");

  BindText(st.get(), 1, id);
  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) ThrowIfDbError(SqliteRepository::Translate(db, rc), "sqlite select");
  return codec::FromProto(ColBody<Message>(st.get(), 0));
}

// Runs a multi-row query; `bind` fills the statement parameters.
template <typename Message, typename Record, typename Bind>
std::vector<Record> SelectMany(sqlite3* db, const char* sql, Bind bind) {
  Statement st(db, sql);
  if (!st.Ok()) ThrowIfDbError(SqliteRepository::Translate(db, st.PrepareCode()), "sqlite prepare");
  bind(st.get());

  std::vector<Record> out;
  for (;;) {
    const int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) break;
    if (rc != SQLITE_ROW) ThrowIfDbError(SqliteRepository::Translate(db, rc), "sqlite select");
    out.push_back(codec::FromProto(ColBody<Message>(st.get(), 0)));
  }
  return out;
}

template <typename Message, typename Record>
std::vector<Record> SelectAll(sqlite3* db, const char* sql) {
  return SelectMany<Message, Record>(db, sql, [](sqlite3_stmt*) {});
}

Result Step(sqlite3* db, Statement& st) {
  return SqliteRepository::Translate(db, sqlite3_step(st.get()));
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

Result SqliteRepository::Reset(Transaction& t) {
    auto* db = TX(t).Handle();
    for (const char* sql : sql::RESET_TABLES) {
        Statement st(db, sql);
        if (!st.Ok()) return Translate(db, st.PrepareCode());
        if (auto r = Step(db, st); !r) return r;
    }
    return Result::Ok();
}

// ------------------------------------------------------------------
// Hosts
// ------------------------------------------------------------------

Result SqliteRepository::UpsertHost(Transaction& t, const model::HostRecord& r) {
    if (r.id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "host id is empty");
    auto* db = TX(t).Handle();

    Statement st(db, sql::UPSERT_HOST);
    if (!st.Ok()) return Translate(db, st.PrepareCode());

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.merged_into);
    BindU64(st.get(), 3, r.seen.last_seen_ms);
    BindBody(st.get(), 4, codec::ToProto(r));
    return Step(db, st);
}

std::optional<model::HostRecord> SqliteRepository::GetHost(Transaction& t, const std::string& id) {
    return SelectOne<v1::Host, model::HostRecord>(TX(t).Handle(), sql::SELECT_HOST, id);
}

std::vector<model::HostRecord> SqliteRepository::ListHosts(Transaction& t) {
    return SelectAll<v1::Host, model::HostRecord>(TX(t).Handle(), sql::LIST_HOSTS);
}

// ------------------------------------------------------------------
// Interfaces
// ------------------------------------------------------------------

Result SqliteRepository::UpsertInterface(Transaction& t, const model::InterfaceRecord& r) {
    if (r.id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "interface id is empty");
    auto* db = TX(t).Handle();

    {
        Statement st(db, sql::UPSERT_INTERFACE);
        if (!st.Ok()) return Translate(db, st.PrepareCode());
        BindText(st.get(), 1, r.id);
        BindText(st.get(), 2, r.host_id);
        BindText(st.get(), 3, r.source_host_id);
        BindText(st.get(), 4, r.local_name);
        BindU64(st.get(), 5, r.seen.last_seen_ms);
        BindBody(st.get(), 6, codec::ToProto(r));
        if (auto res = Step(db, st); !res) return res;
    }

    // the ip lookup table mirrors the claims on the row
    {
        Statement st(db, sql::DELETE_INTERFACE_ADDRESSES);
        if (!st.Ok()) return Translate(db, st.PrepareCode());
        BindText(st.get(), 1, r.id);
        if (auto res = Step(db, st); !res) return res;
    }
    for (const auto& claim : r.addresses) {
        Statement st(db, sql::INSERT_INTERFACE_ADDRESS);
        if (!st.Ok()) return Translate(db, st.PrepareCode());
        BindText(st.get(), 1, claim.ip);
        BindText(st.get(), 2, r.id);
        if (auto res = Step(db, st); !res) return res;
    }
    return Result::Ok();
}

std::optional<model::InterfaceRecord> SqliteRepository::GetInterface(Transaction& t, const std::string& id) {
    return SelectOne<v1::Interface, model::InterfaceRecord>(TX(t).Handle(), sql::SELECT_INTERFACE, id);
}

std::vector<model::InterfaceRecord> SqliteRepository::ListInterfaces(Transaction& t) {
    return SelectAll<v1::Interface, model::InterfaceRecord>(TX(t).Handle(), sql::LIST_INTERFACES);
}

std::vector<model::InterfaceRecord> SqliteRepository::FindInterfacesByIp(Transaction& t, const std::string& ip) {
    return SelectMany<v1::Interface, model::InterfaceRecord>(TX(t).Handle(), sql::SELECT_INTERFACES_BY_IP,
                                                             [&](sqlite3_stmt* st) { BindText(st, 1, ip); });
}

// ------------------------------------------------------------------
// Links
// ------------------------------------------------------------------

Result SqliteRepository::UpsertLink(Transaction& t, const model::LinkRecord& r) {
    if (r.id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "link id is empty");
    auto* db = TX(t).Handle();

    Statement st(db, sql::UPSERT_LINK);
    if (!st.Ok()) return Translate(db, st.PrepareCode());

    BindText(st.get(), 1, r.id);
    BindI32(st.get(), 2, static_cast<int>(r.kind));
    BindText(st.get(), 3, r.endpoint_a);
    BindText(st.get(), 4, r.endpoint_b);
    BindText(st.get(), 5, r.gateway_ip);
    BindI32(st.get(), 6, static_cast<int>(r.status));
    BindDouble(st.get(), 7, r.confidence);
    BindU64(st.get(), 8, r.seen.last_seen_ms);
    BindBody(st.get(), 9, codec::ToProto(r));
    return Step(db, st);
}

std::optional<model::LinkRecord> SqliteRepository::GetLink(Transaction& t, const std::string& id) {
    return SelectOne<v1::Link, model::LinkRecord>(TX(t).Handle(), sql::SELECT_LINK, id);
}

std::vector<model::LinkRecord> SqliteRepository::ListLinks(Transaction& t) {
    return SelectAll<v1::Link, model::LinkRecord>(TX(t).Handle(), sql::LIST_LINKS);
}

std::vector<model::LinkRecord> SqliteRepository::FindRoutesByGateway(Transaction& t, const std::string& ip) {
    return SelectMany<v1::Link, model::LinkRecord>(TX(t).Handle(), sql::SELECT_ROUTES_BY_GATEWAY, [&](sqlite3_stmt* st) {
        BindText(st, 1, ip);
        BindI32(st, 2, static_cast<int>(netmap::model::LinkKind::kRoute));
    });
}

// ------------------------------------------------------------------
// Observations
// ------------------------------------------------------------------

Result SqliteRepository::InsertObservation(Transaction& t, const model::ObservationRow& r) {
    if (r.id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "observation id is empty");
    auto* db = TX(t).Handle();

    Statement st(db, sql::INSERT_OBSERVATION);
    if (!st.Ok()) return Translate(db, st.PrepareCode());

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.source_host_id);
    BindU64(st.get(), 3, r.observed_at_ms);
    BindI32(st.get(), 4, static_cast<int>(r.kind));
    BindU64(st.get(), 5, r.ingested_at_ms);
    BindBody(st.get(), 6, codec::ToProto(r));
    if (auto res = Step(db, st); !res) return res;

    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::AlreadyExists, "observation " + r.id);
    return Result::Ok();
}

std::optional<model::ObservationRow> SqliteRepository::GetObservation(Transaction& t, const std::string& id) {
    return SelectOne<v1::Observation, model::ObservationRow>(TX(t).Handle(), sql::SELECT_OBSERVATION, id);
}

std::vector<model::ObservationRow> SqliteRepository::ListObservations(Transaction& t) {
    return SelectAll<v1::Observation, model::ObservationRow>(TX(t).Handle(), sql::LIST_OBSERVATIONS);
}

// ------------------------------------------------------------------
// Placeholders
// ------------------------------------------------------------------

Result SqliteRepository::UpsertPlaceholder(Transaction& t, const model::PlaceholderRecord& r) {
    if (r.id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "placeholder id is empty");
    auto* db = TX(t).Handle();

    Statement st(db, sql::UPSERT_PLACEHOLDER);
    if (!st.Ok()) return Translate(db, st.PrepareCode());

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.gateway_ip);
    BindText(st.get(), 3, r.resolved_interface_id);
    BindBody(st.get(), 4, codec::ToProto(r));
    return Step(db, st);
}

std::optional<model::PlaceholderRecord> SqliteRepository::GetPlaceholder(Transaction& t, const std::string& id) {
    return SelectOne<v1::Placeholder, model::PlaceholderRecord>(TX(t).Handle(), sql::SELECT_PLACEHOLDER, id);
}

std::vector<model::PlaceholderRecord> SqliteRepository::ListPlaceholders(Transaction& t) {
    return SelectAll<v1::Placeholder, model::PlaceholderRecord>(TX(t).Handle(), sql::LIST_PLACEHOLDERS);
}

// ------------------------------------------------------------------
// Conflicts
// ------------------------------------------------------------------

Result SqliteRepository::UpsertConflict(Transaction& t, const model::ConflictRecord& r) {
    if (r.id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "conflict id is empty");
    auto* db = TX(t).Handle();

    Statement st(db, sql::UPSERT_CONFLICT);
    if (!st.Ok()) return Translate(db, st.PrepareCode());

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.ip);
    BindText(st.get(), 3, r.interface_a);
    BindText(st.get(), 4, r.interface_b);
    BindBody(st.get(), 5, codec::ToProto(r));
    return Step(db, st);
}

std::optional<model::ConflictRecord> SqliteRepository::GetConflict(Transaction& t, const std::string& id) {
    return SelectOne<v1::Conflict, model::ConflictRecord>(TX(t).Handle(), sql::SELECT_CONFLICT, id);
}

std::vector<model::ConflictRecord> SqliteRepository::ListConflicts(Transaction& t) {
    return SelectAll<v1::Conflict, model::ConflictRecord>(TX(t).Handle(), sql::LIST_CONFLICTS);
}

// ------------------------------------------------------------------
// Host merges
// ------------------------------------------------------------------

Result SqliteRepository::InsertHostMerge(Transaction& t, const model::HostMergeRecord& r) {
    if (r.id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "host merge id is empty");
    auto* db = TX(t).Handle();

    Statement st(db, sql::INSERT_HOST_MERGE);
    if (!st.Ok()) return Translate(db, st.PrepareCode());

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.survivor_id);
    BindText(st.get(), 3, r.absorbed_id);
    BindU64(st.get(), 4, r.merged_at_ms);
    BindBody(st.get(), 5, codec::ToProto(r));
    if (auto res = Step(db, st); !res) return res;

    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::AlreadyExists, "host merge " + r.id);
    return Result::Ok();
}

std::vector<model::HostMergeRecord> SqliteRepository::ListHostMerges(Transaction& t) {
    return SelectAll<v1::HostMerge, model::HostMergeRecord>(TX(t).Handle(), sql::LIST_HOST_MERGES);
}

} // namespace netmap::db::sqlite
