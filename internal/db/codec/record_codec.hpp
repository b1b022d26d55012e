#pragma once

#include "internal/db/model/conflict_record.hpp"
#include "internal/db/model/host_merge_record.hpp"
#include "internal/db/model/host_record.hpp"
#include "internal/db/model/interface_record.hpp"
#include "internal/db/model/link_record.hpp"
#include "internal/db/model/observation_row.hpp"
#include "internal/db/model/placeholder_record.hpp"
#include "netmap/v1.hpp"

namespace netmap::db::codec {

/*
  Row <-> wire conversion.

  The SQLite backend stores each row's message as its body; the JSON
  snapshot uses the same messages. Every conversion is lossless so a
  reloaded graph compares equal to the one that was written.
*/

v1::SeenWindow   ToProto(const model::SeenWindow& seen);
model::SeenWindow FromProto(const v1::SeenWindow& seen);

v1::Host          ToProto(const model::HostRecord& record);
model::HostRecord FromProto(const v1::Host& host);

v1::Interface          ToProto(const model::InterfaceRecord& record);
model::InterfaceRecord FromProto(const v1::Interface& iface);

v1::Link          ToProto(const model::LinkRecord& record);
model::LinkRecord FromProto(const v1::Link& link);

v1::Placeholder          ToProto(const model::PlaceholderRecord& record);
model::PlaceholderRecord FromProto(const v1::Placeholder& placeholder);

v1::Conflict          ToProto(const model::ConflictRecord& record);
model::ConflictRecord FromProto(const v1::Conflict& conflict);

v1::HostMerge          ToProto(const model::HostMergeRecord& record);
model::HostMergeRecord FromProto(const v1::HostMerge& merge);

v1::Observation       ToProto(const model::ObservationRow& row);
model::ObservationRow FromProto(const v1::Observation& observation);

} // namespace netmap::db::codec
