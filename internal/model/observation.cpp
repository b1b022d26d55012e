#include "observation.hpp"

#include "internal/util/ids.hpp"

namespace netmap::model {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

std::string ComputeId(const std::string& source_host_id, std::uint64_t observed_at_ms, const ObservationRecord::Payload& payload) {
  util::IdBuilder builder("obs");
  builder.Add(source_host_id).Add(observed_at_ms);

  std::visit(Overloaded{
                 [&](const ArpEntry& e) {
                   builder.Add("arp").Add(static_cast<uint64_t>(e.local_interface.type)).Add(e.local_interface.name);
                   builder.Add(e.neighbor_ip.ToString()).Add(e.neighbor_link.ToString());
                 },
                 [&](const RouteEntry& e) {
                   builder.Add("route").Add(e.destination.ToString()).Add(e.gateway ? e.gateway->ToString() : std::string());
                   builder.Add(static_cast<uint64_t>(e.out_interface.type)).Add(e.out_interface.name).Add(e.metric);
                 },
                 [&](const AliasEntry& e) {
                   builder.Add("alias").Add(e.link.ToString()).Add(e.peer_link ? e.peer_link->ToString() : std::string());
                 },
             },
             payload);

  return builder.Build();
}

} // namespace

std::string_view ToString(ObservationKind kind) {
  switch (kind) {
    case ObservationKind::kArp:
      return "arp";
    case ObservationKind::kRoute:
      return "route";
    case ObservationKind::kAlias:
      return "alias";
    default:
      return "unspecified";
  }
}

std::optional<ObservationKind> ParseObservationKind(std::string_view text) {
  if (text == "arp") return ObservationKind::kArp;
  if (text == "route") return ObservationKind::kRoute;
  if (text == "alias") return ObservationKind::kAlias;
  return std::nullopt;
}

InterfaceRef InterfaceRef::FromName(std::string name) {
  InterfaceRef ref;
  ref.type = Type::kName;
  ref.name = std::move(name);
  return ref;
}

InterfaceRef InterfaceRef::FromIp(const IpAddress& ip) {
  InterfaceRef ref;
  ref.type = Type::kIp;
  ref.name = ip.ToString();
  ref.ip   = ip;
  return ref;
}

InterfaceRef InterfaceRef::FromLink(const LinkAddress& link) {
  InterfaceRef ref;
  ref.type = Type::kLink;
  ref.name = link.ToString();
  ref.link = link;
  return ref;
}

ObservationRecord::ObservationRecord(std::string source_host_id, std::uint64_t observed_at_ms, Payload payload)
    : source_host_id_(std::move(source_host_id)), observed_at_ms_(observed_at_ms), payload_(std::move(payload)) {
  id_ = ComputeId(source_host_id_, observed_at_ms_, payload_);
}

ObservationKind ObservationRecord::kind() const {
  switch (payload_.index()) {
    case 0:
      return ObservationKind::kArp;
    case 1:
      return ObservationKind::kRoute;
    case 2:
      return ObservationKind::kAlias;
    default:
      return ObservationKind::kUnspecified;
  }
}

} // namespace netmap::model
