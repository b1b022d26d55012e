#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace netmap::normalize {

/*
  Loosely-typed record as produced by a dump parser or supplied by a caller.

  Every field is the raw text from the source; nothing is validated until
  the normalizer turns it into an ObservationRecord.

    kind            "arp" | "route" | "alias"
    observed_at     RFC 3339 or epoch milliseconds

    arp:    local_interface, neighbor_ip, neighbor_link
    route:  destination (CIDR, or address + netmask), gateway, out_interface, metric
    alias:  link, peer_link
*/
struct RawRecord {
  std::string                kind;
  std::optional<std::string> source_host_id;
  std::optional<std::string> observed_at;

  std::optional<std::string> local_interface;
  std::optional<std::string> neighbor_ip;
  std::optional<std::string> neighbor_link;

  std::optional<std::string> destination;
  std::optional<std::string> netmask;
  std::optional<std::string> gateway;
  std::optional<std::string> out_interface;
  std::optional<std::string> metric;

  std::optional<std::string> link;
  std::optional<std::string> peer_link;
};

// Why a record was skipped. index is the record's position in its batch.
struct NormalizationError {
  std::size_t index = 0;
  std::string field;
  std::string reason;

  std::string ToString() const {
    return "record " + std::to_string(index) + ": " + field + ": " + reason;
  }

  bool operator==(const NormalizationError&) const = default;
};

} // namespace netmap::normalize
