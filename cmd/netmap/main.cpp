#include <google/protobuf/util/json_util.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/db/codec/record_codec.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/parse/dump_parser.hpp"
#include "internal/snapshot/graph_json.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using netmap::runtime::config::RuntimeConfig;

namespace {

constexpr int kExitUsage = 1;
constexpr int kExitFatal = 2;

void Usage() {
  std::cout << "Usage:\n"
            << "  netmap [--config <cfg.yaml>] ingest <dumpfile> [--type arp|route] [--os linux|windows|openbsd]\n"
            << "                                      [--host <id>] [--time <rfc3339|epoch_ms>] [--link <iface>=<mac>]...\n"
            << "                                      [--force] [--dry-run]\n"
            << "  netmap [--config <cfg.yaml>] show [--include-stale] [--min-confidence <x>] [--out <file.json>]\n"
            << "  netmap [--config <cfg.yaml>] host <id>\n"
            << "  netmap [--config <cfg.yaml>] owner <ip>\n"
            << "  netmap [--config <cfg.yaml>] sweep\n"
            << "  netmap [--config <cfg.yaml>] export <file.json>\n"
            << "  netmap [--config <cfg.yaml>] import <file.json>\n"
            << "\n"
            << "Without --config, $NETMAP_CONFIG is used, else a SQLite store at ./netmap.db.\n";
}

struct UsageError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

class Args {
 public:
  Args(int argc, char** argv) : args_(argv + 1, argv + argc) {
  }

  bool Empty() const {
    return pos_ >= args_.size();
  }

  std::string Next(const std::string& what) {
    if (Empty()) throw UsageError("missing " + what);
    return args_[pos_++];
  }

  std::optional<std::string> Peek() const {
    if (Empty()) return std::nullopt;
    return args_[pos_];
  }

 private:
  std::vector<std::string> args_;
  std::size_t              pos_ = 0;
};

RuntimeConfig LoadConfig(const std::optional<std::string>& path) {
  if (path) return netmap::config::ConfigLoader::LoadFromYaml(*path);
  if (const char* env = std::getenv("NETMAP_CONFIG"); env != nullptr && *env != '\0') {
    return netmap::config::ConfigLoader::LoadFromYaml(env);
  }
  RuntimeConfig config;
  config.mutable_database()->mutable_sqlite()->set_path("netmap.db");
  return config;
}

std::string ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw netmap::util::NotFound("cannot open " + path);
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

// Re-ingesting the same file must reproduce the same observation ids, so
// the default observation time is the file's, not the clock's.
std::string FileTime(const std::string& path) {
  const auto written = std::filesystem::last_write_time(path);
  const auto system  = std::chrono::file_clock::to_sys(written);
  return netmap::util::FormatTimestampMillis(netmap::util::ToUnixMillis(std::chrono::time_point_cast<netmap::util::Clock::duration>(system)));
}

template <typename Message>
std::string ToJson(const Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = true;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) throw netmap::util::InvalidArgument(std::string(status.message()));
  return json;
}

// ------------------------------------------------------------
// Commands
// ------------------------------------------------------------

int Ingest(netmap::factory::Application& app, Args& args) {
  const auto                                path = args.Next("<dumpfile>");
  std::optional<netmap::parse::DumpType>    type;
  std::optional<netmap::parse::DumpOs>      os;
  std::optional<std::string>                host;
  std::optional<std::string>                observed_at;
  netmap::parse::LocalLinks                 local_links;
  netmap::core::IngestOptions               options;

  while (!args.Empty()) {
    const auto flag = args.Next("flag");
    if (flag == "--type") {
      type = netmap::parse::ParseDumpType(args.Next("--type value"));
      if (!type) throw UsageError("unsupported dump type");
    } else if (flag == "--os") {
      os = netmap::parse::ParseDumpOs(args.Next("--os value"));
      if (!os) throw UsageError("unsupported os");
    } else if (flag == "--host") {
      host = args.Next("--host value");
    } else if (flag == "--time") {
      observed_at = args.Next("--time value");
    } else if (flag == "--link") {
      const auto value = args.Next("--link value");
      const auto eq    = value.find('=');
      if (eq == std::string::npos || eq == 0 || eq + 1 == value.size()) throw UsageError("--link takes <iface>=<mac>");
      local_links[value.substr(0, eq)] = value.substr(eq + 1);
    } else if (flag == "--force") {
      options.force_recreate = true;
    } else if (flag == "--dry-run") {
      options.dry_run = true;
    } else {
      throw UsageError("unknown flag " + flag);
    }
  }

  const auto text = ReadFile(path);

  auto format = netmap::parse::GuessFormat(text);
  if (type || os) {
    if (!type || !os) {
      if (!format) throw UsageError("cannot guess the dump format; pass both --type and --os");
      if (!type) type = format->type;
      if (!os) os = format->os;
    }
    format = netmap::parse::DumpFormat{*type, *os};
  }
  if (!format) throw UsageError("cannot guess the dump format; pass --type and --os");

  if (!observed_at) observed_at = FileTime(path);

  auto parsed = netmap::parse::ParseDump(text, *format, host.value_or(""), *observed_at, local_links);
  if (!host) {
    if (parsed.source_hint.empty()) throw UsageError("this dump does not name its host; pass --host");
    // records without a source inherit the batch's
    host = parsed.source_hint;
  }

  NETMAP_LOG_INFO("dump parsed", {netmap::observability::StringField("file", path),
                                  netmap::observability::StringField("type", netmap::parse::ToString(parsed.format.type)),
                                  netmap::observability::StringField("os", netmap::parse::ToString(parsed.format.os)),
                                  netmap::observability::IntField("records", static_cast<std::int64_t>(parsed.records.size())),
                                  netmap::observability::IntField("skipped_lines", static_cast<std::int64_t>(parsed.skipped_lines))});

  const auto report = app.manager->Ingest(*host, parsed.records, options);

  for (const auto& error : report.errors) {
    std::cout << "rejected " << error.ToString() << "\n";
  }
  for (const auto& conflict : report.conflicts) {
    std::cout << "conflict ip=" << conflict.ip << " " << conflict.interface_a << " " << conflict.interface_b << "\n";
  }
  for (const auto& merge : report.merges) {
    std::cout << "merged " << merge.absorbed_id << " into " << merge.survivor_id << " (" << merge.reason << ")\n";
  }
  std::cout << (report.dry_run ? "dry-run " : "") << "source=" << report.source_host_id << " accepted=" << report.accepted
            << " rejected=" << report.rejected << " duplicates=" << report.duplicates << " created=" << report.created.size()
            << " conflicts=" << report.conflicts.size() << " merges=" << report.merges.size() << " attempts=" << report.attempts << "\n";
  return 0;
}

int Show(netmap::factory::Application& app, Args& args) {
  netmap::core::GraphFilter  filter;
  std::optional<std::string> out;
  filter.include_stale = false;

  while (!args.Empty()) {
    const auto flag = args.Next("flag");
    if (flag == "--include-stale") {
      filter.include_stale = true;
    } else if (flag == "--min-confidence") {
      const auto value = args.Next("--min-confidence value");
      try {
        filter.min_confidence = std::stod(value);
      } catch (const std::exception&) {
        throw UsageError("--min-confidence expects a number, got " + value);
      }
    } else if (flag == "--out") {
      out = args.Next("--out value");
    } else {
      throw UsageError("unknown flag " + flag);
    }
  }

  const auto snapshot = app.manager->GetGraph(filter);
  if (out) {
    netmap::snapshot::WriteJsonFile(*out, snapshot);
    std::cout << "wrote " << snapshot.hosts.size() << " hosts, " << snapshot.links.size() << " links to " << *out << "\n";
  } else {
    std::cout << netmap::snapshot::ToJson(snapshot) << "\n";
  }
  return 0;
}

int Host(netmap::factory::Application& app, Args& args) {
  const auto id = args.Next("<id>");
  try {
    std::cout << ToJson(netmap::db::codec::ToProto(app.manager->GetHost(id))) << "\n";
  } catch (const netmap::util::NotFound& e) {
    std::cerr << e.what() << "\n";
    return kExitUsage;
  }
  return 0;
}

int Owner(netmap::factory::Application& app, Args& args) {
  const auto ip    = args.Next("<ip>");
  const auto owner = app.manager->CurrentOwner(ip);
  if (!owner) {
    std::cerr << "no interface claims " << ip << "\n";
    return kExitUsage;
  }
  std::cout << ToJson(netmap::db::codec::ToProto(*owner)) << "\n";
  return 0;
}

int Sweep(netmap::factory::Application& app) {
  const auto report = app.manager->Sweep();
  std::cout << "examined=" << report.examined << " changed=" << report.changed << "\n";
  return 0;
}

int Export(netmap::factory::Application& app, Args& args) {
  const auto path     = args.Next("<file.json>");
  const auto snapshot = app.manager->Export();
  netmap::snapshot::WriteJsonFile(path, snapshot);
  std::cout << "exported " << snapshot.observations.size() << " observations to " << path << "\n";
  return 0;
}

int Import(netmap::factory::Application& app, Args& args) {
  const auto path     = args.Next("<file.json>");
  const auto snapshot = netmap::snapshot::ReadJsonFile(path);
  app.manager->Import(snapshot);
  std::cout << "imported " << snapshot.observations.size() << " observations from " << path << "\n";
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  Args                       args(argc, argv);
  std::optional<std::string> config_path;
  std::string                command;

  try {
    if (args.Peek() == "--config") {
      args.Next("--config");
      config_path = args.Next("--config value");
    }
    command = args.Next("command");
  } catch (const UsageError& e) {
    std::cerr << e.what() << "\n";
    Usage();
    return kExitUsage;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = LoadConfig(config_path);
    netmap::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = netmap::factory::Build(config);

    int code = kExitUsage;
    if (command == "ingest") {
      code = Ingest(app, args);
    } else if (command == "show") {
      code = Show(app, args);
    } else if (command == "host") {
      code = Host(app, args);
    } else if (command == "owner") {
      code = Owner(app, args);
    } else if (command == "sweep") {
      code = Sweep(app);
    } else if (command == "export") {
      code = Export(app, args);
    } else if (command == "import") {
      code = Import(app, args);
    } else {
      std::cerr << "unknown command: " << command << "\n";
      Usage();
    }

    netmap::observability::ShutdownLogging();
    return code;
  } catch (const UsageError& e) {
    std::cerr << e.what() << "\n";
    Usage();
    netmap::observability::ShutdownLogging();
    return kExitUsage;
  } catch (const std::exception& e) {
    NETMAP_LOG_ERROR("Fatal error", {netmap::observability::StringField("command", command), netmap::observability::StringField("error", e.what())});
    netmap::observability::ShutdownLogging();
    return kExitFatal;
  }
}
