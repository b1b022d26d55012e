#pragma once

namespace netmap::db::sql {

/*
  Canonical SQL for the graph tables (SQLite dialect).

  Upserts replace the whole row; merge logic lives above the store.
*/

// hosts

static constexpr const char* UPSERT_HOST =
    "INSERT INTO hosts(id,merged_into,last_seen_ms,body) VALUES(?,?,?,?)"
    " ON CONFLICT(id) DO UPDATE SET"
    " merged_into=excluded.merged_into,"
    " last_seen_ms=excluded.last_seen_ms,"
    " body=excluded.body;";

static constexpr const char* SELECT_HOST = "SELECT body FROM hosts WHERE id=?;";

static constexpr const char* LIST_HOSTS = "SELECT body FROM hosts ORDER BY id;";

// interfaces

static constexpr const char* UPSERT_INTERFACE =
    "INSERT INTO interfaces(id,host_id,source_host_id,local_name,last_seen_ms,body) VALUES(?,?,?,?,?,?)"
    " ON CONFLICT(id) DO UPDATE SET"
    " host_id=excluded.host_id,"
    " source_host_id=excluded.source_host_id,"
    " local_name=excluded.local_name,"
    " last_seen_ms=excluded.last_seen_ms,"
    " body=excluded.body;";

static constexpr const char* DELETE_INTERFACE_ADDRESSES = "DELETE FROM interface_addresses WHERE interface_id=?;";

static constexpr const char* INSERT_INTERFACE_ADDRESS =
    "INSERT OR IGNORE INTO interface_addresses(ip,interface_id) VALUES(?,?);";

static constexpr const char* SELECT_INTERFACE = "SELECT body FROM interfaces WHERE id=?;";

static constexpr const char* LIST_INTERFACES = "SELECT body FROM interfaces ORDER BY id;";

static constexpr const char* SELECT_INTERFACES_BY_IP =
    "SELECT i.body FROM interfaces i JOIN interface_addresses a ON a.interface_id=i.id"
    " WHERE a.ip=? ORDER BY i.id;";

// links

static constexpr const char* UPSERT_LINK =
    "INSERT INTO links(id,kind,endpoint_a,endpoint_b,gateway_ip,status,confidence,last_seen_ms,body)"
    " VALUES(?,?,?,?,?,?,?,?,?)"
    " ON CONFLICT(id) DO UPDATE SET"
    " kind=excluded.kind,"
    " endpoint_a=excluded.endpoint_a,"
    " endpoint_b=excluded.endpoint_b,"
    " gateway_ip=excluded.gateway_ip,"
    " status=excluded.status,"
    " confidence=excluded.confidence,"
    " last_seen_ms=excluded.last_seen_ms,"
    " body=excluded.body;";

static constexpr const char* SELECT_LINK = "SELECT body FROM links WHERE id=?;";

static constexpr const char* LIST_LINKS = "SELECT body FROM links ORDER BY id;";

static constexpr const char* SELECT_ROUTES_BY_GATEWAY =
    "SELECT body FROM links WHERE gateway_ip=? AND kind=? ORDER BY id;";

// observations

static constexpr const char* INSERT_OBSERVATION =
    "INSERT OR IGNORE INTO observations(id,source_host_id,observed_at_ms,kind,ingested_at_ms,body)"
    " VALUES(?,?,?,?,?,?);";

static constexpr const char* SELECT_OBSERVATION = "SELECT body FROM observations WHERE id=?;";

static constexpr const char* LIST_OBSERVATIONS = "SELECT body FROM observations ORDER BY id;";

// placeholders

static constexpr const char* UPSERT_PLACEHOLDER =
    "INSERT INTO placeholders(id,gateway_ip,resolved_interface_id,body) VALUES(?,?,?,?)"
    " ON CONFLICT(id) DO UPDATE SET"
    " gateway_ip=excluded.gateway_ip,"
    " resolved_interface_id=excluded.resolved_interface_id,"
    " body=excluded.body;";

static constexpr const char* SELECT_PLACEHOLDER = "SELECT body FROM placeholders WHERE id=?;";

static constexpr const char* LIST_PLACEHOLDERS = "SELECT body FROM placeholders ORDER BY id;";

// conflicts

static constexpr const char* UPSERT_CONFLICT =
    "INSERT INTO conflicts(id,ip,interface_a,interface_b,body) VALUES(?,?,?,?,?)"
    " ON CONFLICT(id) DO UPDATE SET"
    " ip=excluded.ip,"
    " interface_a=excluded.interface_a,"
    " interface_b=excluded.interface_b,"
    " body=excluded.body;";

static constexpr const char* SELECT_CONFLICT = "SELECT body FROM conflicts WHERE id=?;";

static constexpr const char* LIST_CONFLICTS = "SELECT body FROM conflicts ORDER BY id;";

// host merges

static constexpr const char* INSERT_HOST_MERGE =
    "INSERT OR IGNORE INTO host_merges(id,survivor_id,absorbed_id,merged_at_ms,body) VALUES(?,?,?,?,?);";

static constexpr const char* LIST_HOST_MERGES = "SELECT body FROM host_merges ORDER BY id;";

// reset

static constexpr const char* const RESET_TABLES[] = {
    "DELETE FROM hosts;",
    "DELETE FROM interfaces;",
    "DELETE FROM interface_addresses;",
    "DELETE FROM links;",
    "DELETE FROM observations;",
    "DELETE FROM placeholders;",
    "DELETE FROM conflicts;",
    "DELETE FROM host_merges;",
};

} // namespace netmap::db::sql
