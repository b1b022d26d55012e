#include "migrations.hpp"

namespace netmap::db::sql {

const std::vector<std::string>& GraphSchema() {
  // body columns hold the serialized netmap.graph.v1 message for the row;
  // the other columns exist for lookups only.
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS hosts (id TEXT PRIMARY KEY, merged_into TEXT NOT NULL, last_seen_ms INTEGER NOT NULL, body BLOB NOT NULL);",
      "CREATE TABLE IF NOT EXISTS interfaces (id TEXT PRIMARY KEY, host_id TEXT NOT NULL, source_host_id TEXT NOT NULL, local_name TEXT NOT NULL, last_seen_ms INTEGER NOT NULL, body BLOB NOT NULL);",
      "CREATE TABLE IF NOT EXISTS interface_addresses (ip TEXT NOT NULL, interface_id TEXT NOT NULL, PRIMARY KEY (ip, interface_id));",
      "CREATE TABLE IF NOT EXISTS links (id TEXT PRIMARY KEY, kind INTEGER NOT NULL, endpoint_a TEXT NOT NULL, endpoint_b TEXT NOT NULL, gateway_ip TEXT NOT NULL, status INTEGER NOT NULL, confidence REAL NOT NULL, last_seen_ms INTEGER NOT NULL, body BLOB NOT NULL);",
      "CREATE TABLE IF NOT EXISTS observations (id TEXT PRIMARY KEY, source_host_id TEXT NOT NULL, observed_at_ms INTEGER NOT NULL, kind INTEGER NOT NULL, ingested_at_ms INTEGER NOT NULL, body BLOB NOT NULL);",
      "CREATE TABLE IF NOT EXISTS placeholders (id TEXT PRIMARY KEY, gateway_ip TEXT NOT NULL, resolved_interface_id TEXT NOT NULL, body BLOB NOT NULL);",
      "CREATE TABLE IF NOT EXISTS conflicts (id TEXT PRIMARY KEY, ip TEXT NOT NULL, interface_a TEXT NOT NULL, interface_b TEXT NOT NULL, body BLOB NOT NULL);",
      "CREATE TABLE IF NOT EXISTS host_merges (id TEXT PRIMARY KEY, survivor_id TEXT NOT NULL, absorbed_id TEXT NOT NULL, merged_at_ms INTEGER NOT NULL, body BLOB NOT NULL);",
      "CREATE INDEX IF NOT EXISTS interfaces_host ON interfaces(host_id);",
      "CREATE INDEX IF NOT EXISTS interface_addresses_iface ON interface_addresses(interface_id);",
      "CREATE INDEX IF NOT EXISTS links_gateway ON links(gateway_ip);",
      "CREATE INDEX IF NOT EXISTS observations_source ON observations(source_host_id);",
      "CREATE TABLE IF NOT EXISTS netmap_schema_migrations (version INTEGER PRIMARY KEY);",
      "INSERT OR IGNORE INTO netmap_schema_migrations(version) VALUES(1);"};
  return kSchema;
}

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

} // namespace netmap::db::sql
