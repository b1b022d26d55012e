#include "record_codec.hpp"

#include "internal/util/time.hpp"

namespace netmap::db::codec {

namespace {

template <typename Repeated>
void CopyIds(const model::IdList& ids, Repeated* out) {
  out->Reserve(static_cast<int>(ids.size()));
  for (const auto& id : ids) {
    out->Add(std::string(id));
  }
}

template <typename Repeated>
model::IdList ReadIds(const Repeated& in) {
  model::IdList ids;
  for (const auto& id : in) {
    model::AddId(ids, id);
  }
  return ids;
}

google::protobuf::Timestamp TimestampOrEmpty(uint64_t ms) {
  return ms == 0 ? google::protobuf::Timestamp{} : util::ToProto(ms);
}

} // namespace

v1::SeenWindow ToProto(const model::SeenWindow& seen) {
  v1::SeenWindow out;
  if (seen.Empty()) return out;
  *out.mutable_first_seen() = TimestampOrEmpty(seen.first_seen_ms);
  *out.mutable_last_seen()  = TimestampOrEmpty(seen.last_seen_ms);
  return out;
}

model::SeenWindow FromProto(const v1::SeenWindow& seen) {
  model::SeenWindow out;
  if (seen.has_first_seen()) out.first_seen_ms = util::FromProto(seen.first_seen());
  if (seen.has_last_seen()) out.last_seen_ms = util::FromProto(seen.last_seen());
  return out;
}

// ------------------------------------------------------------------
// Hosts
// ------------------------------------------------------------------

v1::Host ToProto(const model::HostRecord& record) {
  v1::Host out;
  out.set_id(record.id);
  CopyIds(record.interface_ids, out.mutable_interface_ids());
  for (const auto& label : record.labels) {
    auto* l = out.add_labels();
    l->set_value(label.value);
    CopyIds(label.observation_ids, l->mutable_observation_ids());
  }
  if (!record.seen.Empty()) *out.mutable_seen() = ToProto(record.seen);
  CopyIds(record.observation_ids, out.mutable_observation_ids());
  out.set_merged_into(record.merged_into);
  return out;
}

model::HostRecord FromProto(const v1::Host& host) {
  model::HostRecord out;
  out.id            = host.id();
  out.interface_ids = ReadIds(host.interface_ids());
  for (const auto& l : host.labels()) {
    out.labels.push_back(model::HostLabel{.value = l.value(), .observation_ids = ReadIds(l.observation_ids())});
  }
  out.seen            = FromProto(host.seen());
  out.observation_ids = ReadIds(host.observation_ids());
  out.merged_into     = host.merged_into();
  return out;
}

// ------------------------------------------------------------------
// Interfaces
// ------------------------------------------------------------------

v1::Interface ToProto(const model::InterfaceRecord& record) {
  v1::Interface out;
  out.set_id(record.id);
  out.set_host_id(record.host_id);
  CopyIds(record.seed_host_ids, out.mutable_seed_host_ids());
  out.set_source_host_id(record.source_host_id);
  out.set_local_name(record.local_name);
  CopyIds(record.link_addresses, out.mutable_link_addresses());
  for (const auto& claim : record.addresses) {
    auto* c = out.add_addresses();
    c->set_ip(claim.ip);
    if (!claim.seen.Empty()) *c->mutable_seen() = ToProto(claim.seen);
    CopyIds(claim.observation_ids, c->mutable_observation_ids());
  }
  for (const auto& network : record.connected_networks) {
    auto* n = out.add_connected_networks();
    n->set_cidr(network.cidr);
    CopyIds(network.observation_ids, n->mutable_observation_ids());
  }
  CopyIds(record.conflicting_ips, out.mutable_conflicting_ips());
  if (!record.seen.Empty()) *out.mutable_seen() = ToProto(record.seen);
  CopyIds(record.observation_ids, out.mutable_observation_ids());
  return out;
}

model::InterfaceRecord FromProto(const v1::Interface& iface) {
  model::InterfaceRecord out;
  out.id             = iface.id();
  out.host_id        = iface.host_id();
  out.seed_host_ids  = ReadIds(iface.seed_host_ids());
  out.source_host_id = iface.source_host_id();
  out.local_name     = iface.local_name();
  out.link_addresses = ReadIds(iface.link_addresses());
  for (const auto& c : iface.addresses()) {
    out.addresses.push_back(
        model::AddressClaim{.ip = c.ip(), .seen = FromProto(c.seen()), .observation_ids = ReadIds(c.observation_ids())});
  }
  for (const auto& n : iface.connected_networks()) {
    out.connected_networks.push_back(model::ConnectedNetwork{.cidr = n.cidr(), .observation_ids = ReadIds(n.observation_ids())});
  }
  out.conflicting_ips = ReadIds(iface.conflicting_ips());
  out.seen            = FromProto(iface.seen());
  out.observation_ids = ReadIds(iface.observation_ids());
  return out;
}

// ------------------------------------------------------------------
// Links
// ------------------------------------------------------------------

v1::Link ToProto(const model::LinkRecord& record) {
  v1::Link out;
  out.set_id(record.id);
  out.set_kind(static_cast<v1::LinkKind>(record.kind));
  out.set_endpoint_a(record.endpoint_a);
  out.set_endpoint_b(record.endpoint_b);
  out.set_target_is_placeholder(record.target_is_placeholder);
  out.set_destination(record.destination);
  out.set_gateway_ip(record.gateway_ip);
  out.set_metric(record.metric);
  out.set_confidence(record.confidence);
  out.set_status(static_cast<v1::EdgeStatus>(record.status));
  out.set_trusted(record.trusted);
  if (!record.seen.Empty()) *out.mutable_seen() = ToProto(record.seen);
  CopyIds(record.observation_ids, out.mutable_observation_ids());
  return out;
}

model::LinkRecord FromProto(const v1::Link& link) {
  model::LinkRecord out;
  out.id                    = link.id();
  out.kind                  = static_cast<netmap::model::LinkKind>(link.kind());
  out.endpoint_a            = link.endpoint_a();
  out.endpoint_b            = link.endpoint_b();
  out.target_is_placeholder = link.target_is_placeholder();
  out.destination           = link.destination();
  out.gateway_ip            = link.gateway_ip();
  out.metric                = link.metric();
  out.confidence            = link.confidence();
  out.status                = static_cast<netmap::model::EdgeStatus>(link.status());
  out.trusted               = link.trusted();
  out.seen                  = FromProto(link.seen());
  out.observation_ids       = ReadIds(link.observation_ids());
  return out;
}

// ------------------------------------------------------------------
// Placeholders, conflicts, merges
// ------------------------------------------------------------------

v1::Placeholder ToProto(const model::PlaceholderRecord& record) {
  v1::Placeholder out;
  out.set_id(record.id);
  out.set_gateway_ip(record.gateway_ip);
  CopyIds(record.destinations, out.mutable_destinations());
  out.set_resolved_interface_id(record.resolved_interface_id);
  if (!record.seen.Empty()) *out.mutable_seen() = ToProto(record.seen);
  CopyIds(record.observation_ids, out.mutable_observation_ids());
  return out;
}

model::PlaceholderRecord FromProto(const v1::Placeholder& placeholder) {
  model::PlaceholderRecord out;
  out.id                    = placeholder.id();
  out.gateway_ip            = placeholder.gateway_ip();
  out.destinations          = ReadIds(placeholder.destinations());
  out.resolved_interface_id = placeholder.resolved_interface_id();
  out.seen                  = FromProto(placeholder.seen());
  out.observation_ids       = ReadIds(placeholder.observation_ids());
  return out;
}

v1::Conflict ToProto(const model::ConflictRecord& record) {
  v1::Conflict out;
  out.set_id(record.id);
  out.set_ip(record.ip);
  out.set_interface_a(record.interface_a);
  out.set_interface_b(record.interface_b);
  if (!record.seen.Empty()) *out.mutable_seen() = ToProto(record.seen);
  CopyIds(record.observation_ids, out.mutable_observation_ids());
  return out;
}

model::ConflictRecord FromProto(const v1::Conflict& conflict) {
  model::ConflictRecord out;
  out.id              = conflict.id();
  out.ip              = conflict.ip();
  out.interface_a     = conflict.interface_a();
  out.interface_b     = conflict.interface_b();
  out.seen            = FromProto(conflict.seen());
  out.observation_ids = ReadIds(conflict.observation_ids());
  return out;
}

v1::HostMerge ToProto(const model::HostMergeRecord& record) {
  v1::HostMerge out;
  out.set_id(record.id);
  out.set_survivor_id(record.survivor_id);
  out.set_absorbed_id(record.absorbed_id);
  out.set_reason(record.reason);
  if (record.merged_at_ms != 0) *out.mutable_merged_at() = util::ToProto(record.merged_at_ms);
  CopyIds(record.observation_ids, out.mutable_observation_ids());
  return out;
}

model::HostMergeRecord FromProto(const v1::HostMerge& merge) {
  model::HostMergeRecord out;
  out.id              = merge.id();
  out.survivor_id     = merge.survivor_id();
  out.absorbed_id     = merge.absorbed_id();
  out.reason          = merge.reason();
  out.merged_at_ms    = merge.has_merged_at() ? util::FromProto(merge.merged_at()) : 0;
  out.observation_ids = ReadIds(merge.observation_ids());
  return out;
}

// ------------------------------------------------------------------
// Observations
// ------------------------------------------------------------------

v1::Observation ToProto(const model::ObservationRow& row) {
  v1::Observation out;
  out.set_id(row.id);
  out.set_source_host_id(row.source_host_id);
  *out.mutable_observed_at() = util::ToProto(row.observed_at_ms);
  out.set_kind(static_cast<v1::ObservationKind>(row.kind));
  out.set_local_interface(row.local_interface);
  out.set_neighbor_ip(row.neighbor_ip);
  out.set_neighbor_link(row.neighbor_link);
  out.set_destination(row.destination);
  out.set_gateway_ip(row.gateway_ip);
  out.set_metric(row.metric);
  out.set_link_address(row.link_address);
  out.set_peer_link_address(row.peer_link_address);
  if (row.ingested_at_ms != 0) *out.mutable_ingested_at() = util::ToProto(row.ingested_at_ms);
  return out;
}

model::ObservationRow FromProto(const v1::Observation& observation) {
  model::ObservationRow out;
  out.id                = observation.id();
  out.source_host_id    = observation.source_host_id();
  out.observed_at_ms    = util::FromProto(observation.observed_at());
  out.kind              = static_cast<netmap::model::ObservationKind>(observation.kind());
  out.local_interface   = observation.local_interface();
  out.neighbor_ip       = observation.neighbor_ip();
  out.neighbor_link     = observation.neighbor_link();
  out.destination       = observation.destination();
  out.gateway_ip        = observation.gateway_ip();
  out.metric            = observation.metric();
  out.link_address      = observation.link_address();
  out.peer_link_address = observation.peer_link_address();
  out.ingested_at_ms    = observation.has_ingested_at() ? util::FromProto(observation.ingested_at()) : 0;
  return out;
}

} // namespace netmap::db::codec
