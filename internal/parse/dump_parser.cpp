#include "dump_parser.hpp"

#include <regex>
#include <sstream>

#include "internal/normalize/record_normalizer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace netmap::parse {

namespace {

struct GuessRule {
  DumpFormat format;
  std::regex pattern;
};

// Applied to every line until one matches; more than one rule may exist
// for a format.
const std::vector<GuessRule>& GuessRules() {
  static const std::vector<GuessRule> kRules = {
      {{DumpType::kArp, DumpOs::kWindows}, std::regex(R"(^Interface:\s+)")},
      {{DumpType::kArp, DumpOs::kLinux}, std::regex(R"(^Address\s+HWtype\s+HWaddress\s+Flags\s+Mask\s+Iface$)")},
      {{DumpType::kArp, DumpOs::kOpenBsd}, std::regex(R"(^Host\s+Ethernet\s+Address\s+Netif\s+Expire\s+Flags$)")},
      {{DumpType::kTraceroute, DumpOs::kLinux}, std::regex(R"(^traceroute to .+ \([\d.]+\), \d+ hops max, \d+ byte packets$)")},
      {{DumpType::kRoute, DumpOs::kLinux}, std::regex(R"(^Kernel IP routing table$)")},
      {{DumpType::kRoute, DumpOs::kLinux}, std::regex(R"(^Destination\s+Gateway\s+Genmask\s+Flags\s+Metric\s+Ref\s+Use\s+Iface$)")},
      {{DumpType::kRoute, DumpOs::kWindows}, std::regex(R"(^={20,}$)")},
  };
  return kRules;
}

std::vector<std::string> SplitLines(std::string_view text) {
  std::vector<std::string> lines;
  std::size_t              start = 0;
  while (start <= text.size()) {
    auto end = text.find('\n', start);
    if (end == std::string_view::npos) end = text.size();
    std::string line(text.substr(start, end - start));
    if (!line.empty() && line.back() == '\r') line.pop_back();
    lines.push_back(std::move(line));
    start = end + 1;
  }
  return lines;
}

std::vector<std::string> Tokens(const std::string& line) {
  std::istringstream       in(line);
  std::vector<std::string> out;
  std::string              token;
  while (in >> token) out.push_back(token);
  return out;
}

const std::string& LocalSide(const std::string& local, const LocalLinks& links) {
  auto it = links.find(local);
  return it == links.end() ? local : it->second;
}

normalize::RawRecord NewRecord(const char* kind, const std::string& source_host_id, const std::string& observed_at) {
  normalize::RawRecord raw;
  raw.kind = kind;
  if (!source_host_id.empty()) raw.source_host_id = source_host_id;
  raw.observed_at = observed_at;
  return raw;
}

// Address HWtype HWaddress Flags Mask Iface
// 10.137.1.8 ether 00:16:3e:5e:6c:06 C vif2.0
void ParseLinuxArp(const std::vector<std::string>& lines, const std::string& source, const std::string& at, const LocalLinks& links,
                   ParsedDump& out) {
  static const std::regex kEntry(R"(^([\w.:]+)\s+\w+\s+(([0-9a-fA-F]{2}:){5}[0-9a-fA-F]{2})\s)");
  for (const auto& line : lines) {
    std::smatch m;
    if (!std::regex_search(line, m, kEntry)) {
      if (!normalize::Trim(line).empty()) ++out.skipped_lines;
      continue;
    }
    auto raw            = NewRecord("arp", source, at);
    raw.neighbor_ip     = m[1].str();
    raw.neighbor_link   = m[2].str();
    raw.local_interface = LocalSide(Tokens(line).back(), links);
    out.records.push_back(std::move(raw));
  }
}

// Interface: 10.137.2.16 --- 0x11
//   Internet Address      Physical Address      Type
//   10.137.2.1            fe-ff-ff-ff-ff-ff     dynamic
//
// A known link address for the interface also yields a row for the host's
// own address, the same identity evidence an openbsd 'l' row carries.
void ParseWindowsArp(const std::vector<std::string>& lines, const std::string& source, const std::string& at, const LocalLinks& links,
                     ParsedDump& out) {
  static const std::regex kInterface(R"(^Interface: (.+) ---)");
  static const std::regex kEntry(R"(^  ([\w.:]+)\s+(([0-9a-fA-F]{2}-){5}[0-9a-fA-F]{2}))");

  std::string local_ip;
  for (const auto& line : lines) {
    std::smatch m;
    if (std::regex_search(line, m, kInterface)) {
      local_ip = std::string(normalize::Trim(m[1].str()));
      if (out.source_hint.empty()) out.source_hint = local_ip;
      if (auto own = links.find(local_ip); own != links.end()) {
        auto raw            = NewRecord("arp", source, at);
        raw.local_interface = own->second;
        raw.neighbor_ip     = local_ip;
        raw.neighbor_link   = own->second;
        out.records.push_back(std::move(raw));
      }
      continue;
    }
    if (std::regex_search(line, m, kEntry) && !local_ip.empty()) {
      auto raw            = NewRecord("arp", source, at);
      raw.local_interface = LocalSide(local_ip, links);
      raw.neighbor_ip     = m[1].str();
      raw.neighbor_link   = m[2].str();
      out.records.push_back(std::move(raw));
      continue;
    }
    if (!normalize::Trim(line).empty()) ++out.skipped_lines;
  }
}

// Host        Ethernet Address   Netif Expire    Flags
// 10.0.0.1    00:0d:b9:41:2c:30  em0   19m58s
// 10.0.0.7    00:0c:29:aa:bb:cc  em0   permanent l
//
// Rows flagged 'l' are the vantage host's own addresses: the local side is
// the link address itself, which ties it to the source host. The other rows
// on that netif are local to the same link address.
void ParseOpenBsdArp(const std::vector<std::string>& lines, const std::string& source, const std::string& at, const LocalLinks& links,
                     ParsedDump& out) {
  static const std::regex kEntry(R"(^([\w.:]+)\s+(([0-9a-fA-F]{1,2}:){5}[0-9a-fA-F]{1,2})\s+(\S+)(\s+(\S+))?(\s+(\S+))?)");

  struct Row {
    std::string ip;
    std::string link;
    std::string netif;
    bool        local = false;
  };
  std::vector<Row> rows;
  LocalLinks       own = links;
  for (const auto& line : lines) {
    std::smatch m;
    if (!std::regex_search(line, m, kEntry)) {
      if (!normalize::Trim(line).empty()) ++out.skipped_lines;
      continue;
    }
    const std::string flags = m[8].matched ? m[8].str() : std::string();
    Row               row{m[1].str(), m[2].str(), m[4].str(), flags.find('l') != std::string::npos};
    if (row.local) own.emplace(row.netif, row.link);
    rows.push_back(std::move(row));
  }

  for (auto& row : rows) {
    auto raw            = NewRecord("arp", source, at);
    raw.neighbor_ip     = std::move(row.ip);
    raw.local_interface = row.local ? row.link : LocalSide(row.netif, own);
    raw.neighbor_link   = std::move(row.link);
    out.records.push_back(std::move(raw));
  }
}

// Destination     Gateway         Genmask         Flags Metric Ref    Use Iface
// 0.0.0.0         10.137.1.1      0.0.0.0         UG    100    0        0 eth0
void ParseLinuxRoute(const std::vector<std::string>& lines, const std::string& source, const std::string& at, const LocalLinks& links,
                     ParsedDump& out) {
  for (const auto& line : lines) {
    const auto tokens = Tokens(line);
    if (tokens.size() != 8 || tokens[0] == "Destination") {
      if (!tokens.empty()) ++out.skipped_lines;
      continue;
    }
    auto raw          = NewRecord("route", source, at);
    raw.destination   = tokens[0];
    raw.gateway       = tokens[1];
    raw.netmask       = tokens[2];
    raw.metric        = tokens[4];
    raw.out_interface = LocalSide(tokens[7], links);
    out.records.push_back(std::move(raw));
  }
}

// IPv4 Route Table
// ===========================================================================
// Active Routes:
// Network Destination        Netmask          Gateway       Interface  Metric
//           0.0.0.0          0.0.0.0      10.137.2.1    10.137.2.16     10
//        10.137.2.0    255.255.255.0         On-link     10.137.2.16    266
// ===========================================================================
void ParseWindowsRoute(const std::vector<std::string>& lines, const std::string& source, const std::string& at, const LocalLinks& links,
                       ParsedDump& out) {
  static const std::regex kRule(R"(^={20,}$)");

  bool ipv4   = true;
  bool active = false;
  for (const auto& line : lines) {
    const auto trimmed = normalize::Trim(line);
    if (trimmed.starts_with("IPv4 Route Table")) {
      ipv4 = true;
      continue;
    }
    if (trimmed.starts_with("IPv6 Route Table")) {
      ipv4 = false;
      continue;
    }
    if (trimmed.starts_with("Active Routes:")) {
      active = true;
      continue;
    }
    if (std::regex_match(std::string(trimmed), kRule) || trimmed.starts_with("Persistent Routes:")) {
      active = false;
      continue;
    }

    const auto tokens = Tokens(line);
    if (!active || !ipv4 || tokens.size() != 5 || tokens[0] == "Network") {
      if (!tokens.empty()) ++out.skipped_lines;
      continue;
    }
    auto raw          = NewRecord("route", source, at);
    raw.destination   = tokens[0];
    raw.netmask       = tokens[1];
    raw.gateway       = tokens[2];
    raw.out_interface = LocalSide(tokens[3], links);
    raw.metric        = tokens[4];
    out.records.push_back(std::move(raw));
  }
}

} // namespace

std::string_view ToString(DumpType type) {
  switch (type) {
    case DumpType::kArp:
      return "arp";
    case DumpType::kRoute:
      return "route";
    case DumpType::kTraceroute:
      return "traceroute";
  }
  return "unknown";
}

std::string_view ToString(DumpOs os) {
  switch (os) {
    case DumpOs::kLinux:
      return "linux";
    case DumpOs::kWindows:
      return "windows";
    case DumpOs::kOpenBsd:
      return "openbsd";
  }
  return "unknown";
}

std::optional<DumpType> ParseDumpType(std::string_view text) {
  if (text == "arp") return DumpType::kArp;
  if (text == "route") return DumpType::kRoute;
  if (text == "traceroute") return DumpType::kTraceroute;
  return std::nullopt;
}

std::optional<DumpOs> ParseDumpOs(std::string_view text) {
  if (text == "linux") return DumpOs::kLinux;
  if (text == "windows") return DumpOs::kWindows;
  if (text == "openbsd") return DumpOs::kOpenBsd;
  return std::nullopt;
}

std::optional<DumpFormat> GuessFormat(std::string_view text) {
  for (const auto& line : SplitLines(text)) {
    for (const auto& rule : GuessRules()) {
      if (std::regex_search(line, rule.pattern)) {
        NETMAP_LOG_DEBUG("dump format guessed",
                         {observability::StringField("type", ToString(rule.format.type)), observability::StringField("os", ToString(rule.format.os))});
        return rule.format;
      }
    }
  }
  return std::nullopt;
}

ParsedDump ParseDump(std::string_view text, DumpFormat format, const std::string& source_host_id, const std::string& observed_at,
                     const LocalLinks& local_links) {
  ParsedDump out;
  out.format       = format;
  const auto lines = SplitLines(text);

  switch (format.type) {
    case DumpType::kArp:
      switch (format.os) {
        case DumpOs::kLinux:
          ParseLinuxArp(lines, source_host_id, observed_at, local_links, out);
          return out;
        case DumpOs::kWindows:
          ParseWindowsArp(lines, source_host_id, observed_at, local_links, out);
          return out;
        case DumpOs::kOpenBsd:
          ParseOpenBsdArp(lines, source_host_id, observed_at, local_links, out);
          return out;
      }
      break;
    case DumpType::kRoute:
      switch (format.os) {
        case DumpOs::kLinux:
          ParseLinuxRoute(lines, source_host_id, observed_at, local_links, out);
          return out;
        case DumpOs::kWindows:
          ParseWindowsRoute(lines, source_host_id, observed_at, local_links, out);
          return out;
        case DumpOs::kOpenBsd:
          break;
      }
      break;
    case DumpType::kTraceroute:
      throw util::InvalidArgument("traceroute dumps are not supported");
  }
  throw util::InvalidArgument("no parser for " + std::string(ToString(format.type)) + " dumps from " + std::string(ToString(format.os)));
}

} // namespace netmap::parse
