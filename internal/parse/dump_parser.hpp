#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/normalize/raw_record.hpp"

namespace netmap::parse {

enum class DumpType {
  kArp,
  kRoute,
  kTraceroute,  // recognized so it can be refused; never parsed
};

enum class DumpOs {
  kLinux,
  kWindows,
  kOpenBsd,
};

struct DumpFormat {
  DumpType type;
  DumpOs   os;

  bool operator==(const DumpFormat&) const = default;
};

std::string_view ToString(DumpType type);
std::string_view ToString(DumpOs os);

std::optional<DumpType> ParseDumpType(std::string_view text);
std::optional<DumpOs>   ParseDumpOs(std::string_view text);

/*
  Guesses type and OS from the first line that matches a known header.

    windows arp     "Interface: 10.0.0.2 --- 0x11"
    linux arp       "Address  HWtype  HWaddress  Flags Mask  Iface"
    openbsd arp     "Host  Ethernet Address  Netif Expire Flags"
    linux route     "Kernel IP routing table" / "Destination Gateway Genmask ..."
    windows route   a line of '=' characters
*/
std::optional<DumpFormat> GuessFormat(std::string_view text);

struct ParsedDump {
  DumpFormat                          format{DumpType::kArp, DumpOs::kLinux};
  // Vantage identity the dump itself names (windows "Interface:" line),
  // empty when the format carries none.
  std::string                         source_hint;
  std::vector<normalize::RawRecord>   records;
  std::size_t                         skipped_lines = 0;
};

// The vantage host's own link address per local interface, keyed by the
// name or address the dump uses for it ("eth0", "10.137.2.16").
using LocalLinks = std::map<std::string, std::string>;

/*
  Splits a dump into raw records. Lines that are not entries (headers,
  incomplete ARP rows, IPv6 sections) are skipped and counted. Field
  validation is left to the normalizer.

  When a local interface's link address is known, from local_links or from
  the host's own rows of an openbsd dump, records name the local side by it.
  Two hosts that list each other then describe the same adjacency.

  Throws util::InvalidArgument for formats that cannot be parsed.
*/
ParsedDump ParseDump(std::string_view text, DumpFormat format, const std::string& source_host_id, const std::string& observed_at,
                     const LocalLinks& local_links = {});

} // namespace netmap::parse
