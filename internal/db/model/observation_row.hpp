#pragma once

#include <cstdint>
#include <string>

#include "internal/model/observation.hpp"

namespace netmap::db::model {

/*
  Persisted observation: the normalized record in canonical text fields so
  that the graph can be replayed from history.
*/
struct ObservationRow {
  std::string   id;
  std::string   source_host_id;
  std::uint64_t observed_at_ms = 0;

  netmap::model::ObservationKind kind = netmap::model::ObservationKind::kUnspecified;

  std::string   local_interface;  // arp local side / route out interface
  std::string   neighbor_ip;
  std::string   neighbor_link;
  std::string   destination;
  std::string   gateway_ip;
  std::uint32_t metric = 0;
  std::string   link_address;
  std::string   peer_link_address;

  std::uint64_t ingested_at_ms = 0;

  bool operator==(const ObservationRow&) const = default;
};

ObservationRow ToRow(const netmap::model::ObservationRecord& record, std::uint64_t ingested_at_ms);

} // namespace netmap::db::model
