#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "internal/model/address.hpp"

namespace netmap::model {

enum class ObservationKind : std::uint8_t {
  kUnspecified = 0,
  kArp         = 1,
  kRoute       = 2,
  kAlias       = 3,
};

std::string_view                ToString(ObservationKind kind);
std::optional<ObservationKind> ParseObservationKind(std::string_view text);

/*
  A host-local interface identifier as it appears in a dump.

  Dumps name the local side of an entry in three ways: by link address
  (BSD), by the interface's own IP (windows "Interface: 10.0.0.2 --- 0x11"),
  or by a local name (linux "eth0"). Each maps to a different identity rule.
*/
struct InterfaceRef {
  enum class Type : std::uint8_t {
    kName = 0,
    kIp   = 1,
    kLink = 2,
  };

  Type                       type = Type::kName;
  std::string                name;  // canonical text for every type
  std::optional<IpAddress>   ip;
  std::optional<LinkAddress> link;

  static InterfaceRef FromName(std::string name);
  static InterfaceRef FromIp(const IpAddress& ip);
  static InterfaceRef FromLink(const LinkAddress& link);

  bool operator==(const InterfaceRef& other) const {
    return type == other.type && name == other.name;
  }
};

struct ArpEntry {
  InterfaceRef local_interface;
  IpAddress    neighbor_ip;
  LinkAddress  neighbor_link;
};

struct RouteEntry {
  Cidr                     destination;
  std::optional<IpAddress> gateway;  // empty for on-link routes
  InterfaceRef             out_interface;
  std::uint32_t            metric = 0;
};

// Operator-supplied identity evidence. Without a peer the link address is an
// interface of the record's source host; with a peer both link addresses
// belong to one machine.
struct AliasEntry {
  LinkAddress                link;
  std::optional<LinkAddress> peer_link;
};

/*
  Normalized, immutable observation.

  The id is a digest of the full content, so re-ingesting the same dump line
  reproduces the same id and deduplicates instead of double counting.
*/
class ObservationRecord {
 public:
  using Payload = std::variant<ArpEntry, RouteEntry, AliasEntry>;

  ObservationRecord(std::string source_host_id, std::uint64_t observed_at_ms, Payload payload);

  const std::string& id() const {
    return id_;
  }
  const std::string& source_host_id() const {
    return source_host_id_;
  }
  std::uint64_t observed_at_ms() const {
    return observed_at_ms_;
  }
  const Payload& payload() const {
    return payload_;
  }

  ObservationKind kind() const;

  const ArpEntry* arp() const {
    return std::get_if<ArpEntry>(&payload_);
  }
  const RouteEntry* route() const {
    return std::get_if<RouteEntry>(&payload_);
  }
  const AliasEntry* alias() const {
    return std::get_if<AliasEntry>(&payload_);
  }

 private:
  std::string   id_;
  std::string   source_host_id_;
  std::uint64_t observed_at_ms_ = 0;
  Payload       payload_;
};

} // namespace netmap::model
