#include "observation_row.hpp"

namespace netmap::db::model {

ObservationRow ToRow(const netmap::model::ObservationRecord& record, std::uint64_t ingested_at_ms) {
  ObservationRow row;
  row.id             = record.id();
  row.source_host_id = record.source_host_id();
  row.observed_at_ms = record.observed_at_ms();
  row.kind           = record.kind();
  row.ingested_at_ms = ingested_at_ms;

  if (const auto* arp = record.arp()) {
    row.local_interface = arp->local_interface.name;
    row.neighbor_ip     = arp->neighbor_ip.ToString();
    row.neighbor_link   = arp->neighbor_link.ToString();
  } else if (const auto* route = record.route()) {
    row.local_interface = route->out_interface.name;
    row.destination     = route->destination.ToString();
    row.gateway_ip      = route->gateway ? route->gateway->ToString() : std::string();
    row.metric          = route->metric;
  } else if (const auto* alias = record.alias()) {
    row.link_address      = alias->link.ToString();
    row.peer_link_address = alias->peer_link ? alias->peer_link->ToString() : std::string();
  }
  return row;
}

} // namespace netmap::db::model
