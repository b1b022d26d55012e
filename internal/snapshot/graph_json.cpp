#include "graph_json.hpp"

#include <google/protobuf/util/json_util.h>

#include <fstream>
#include <sstream>

#include "internal/db/codec/record_codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace netmap::snapshot {

namespace codec = db::codec;

v1::Graph ToProto(const core::GraphSnapshot& snapshot) {
  v1::Graph graph;
  *graph.mutable_generated_at() = util::ToProto(snapshot.generated_at_ms);

  for (const auto& row : snapshot.hosts) *graph.add_hosts() = codec::ToProto(row);
  for (const auto& row : snapshot.interfaces) *graph.add_interfaces() = codec::ToProto(row);
  for (const auto& view : snapshot.links) {
    auto* link = graph.add_links();
    *link      = codec::ToProto(view.link);
    link->set_host_a(view.host_a);
    link->set_host_b(view.host_b);
  }
  for (const auto& row : snapshot.placeholders) *graph.add_placeholders() = codec::ToProto(row);
  for (const auto& row : snapshot.conflicts) *graph.add_conflicts() = codec::ToProto(row);
  for (const auto& row : snapshot.host_merges) *graph.add_host_merges() = codec::ToProto(row);
  for (const auto& row : snapshot.observations) *graph.add_observations() = codec::ToProto(row);
  return graph;
}

core::GraphSnapshot FromProto(const v1::Graph& graph) {
  core::GraphSnapshot snapshot;
  if (graph.has_generated_at()) snapshot.generated_at_ms = util::FromProto(graph.generated_at());

  for (const auto& host : graph.hosts()) snapshot.hosts.push_back(codec::FromProto(host));
  for (const auto& iface : graph.interfaces()) snapshot.interfaces.push_back(codec::FromProto(iface));
  for (const auto& link : graph.links()) {
    snapshot.links.push_back(core::LinkView{codec::FromProto(link), link.host_a(), link.host_b()});
  }
  for (const auto& placeholder : graph.placeholders()) snapshot.placeholders.push_back(codec::FromProto(placeholder));
  for (const auto& conflict : graph.conflicts()) snapshot.conflicts.push_back(codec::FromProto(conflict));
  for (const auto& merge : graph.host_merges()) snapshot.host_merges.push_back(codec::FromProto(merge));
  for (const auto& observation : graph.observations()) snapshot.observations.push_back(codec::FromProto(observation));
  return snapshot;
}

std::string ToJson(const core::GraphSnapshot& snapshot) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = true;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(ToProto(snapshot), &json, options);
  if (!status.ok()) {
    throw util::InvalidArgument("graph export: " + std::string(status.message()));
  }
  return json;
}

core::GraphSnapshot FromJson(const std::string& json) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  v1::Graph graph;
  auto      status = google::protobuf::util::JsonStringToMessage(json, &graph, options);
  if (!status.ok()) {
    throw util::InvalidArgument("graph import: " + std::string(status.message()));
  }
  return FromProto(graph);
}

void WriteJsonFile(const std::string& path, const core::GraphSnapshot& snapshot) {
  const auto    json = ToJson(snapshot);
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) throw util::InvalidArgument("graph export: cannot open " + path);
  out << json << '\n';
  if (!out) throw util::InvalidArgument("graph export: failed writing " + path);
}

core::GraphSnapshot ReadJsonFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw util::NotFound("graph import: cannot open " + path);
  std::stringstream buffer;
  buffer << in.rdbuf();
  return FromJson(buffer.str());
}

} // namespace netmap::snapshot
