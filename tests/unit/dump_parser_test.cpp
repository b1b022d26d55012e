#include "internal/parse/dump_parser.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/normalize/record_normalizer.hpp"
#include "internal/util/errors.hpp"
#include "support/graph_fixtures.hpp"

namespace {

using netmap::parse::DumpFormat;
using netmap::parse::DumpOs;
using netmap::parse::DumpType;
using netmap::parse::GuessFormat;
using netmap::parse::ParseDump;

constexpr const char* kAt = "2024-05-01T10:00:00Z";

const std::string kLinuxArp = R"(Address                  HWtype  HWaddress           Flags Mask            Iface
10.137.1.8               ether   00:16:3e:5e:6c:06   C                     vif2.0
10.137.1.1               ether   fe:ff:ff:ff:ff:ff   C                     eth0
10.137.1.99                      (incomplete)                              eth0
)";

const std::string kWindowsArp = "\r\nInterface: 10.137.2.16 --- 0x11\r\n"
                                "  Internet Address      Physical Address      Type\r\n"
                                "  10.137.2.1            fe-ff-ff-ff-ff-ff     dynamic\r\n"
                                "  10.137.2.255          ff-ff-ff-ff-ff-ff     static\r\n"
                                "  224.0.0.22            01-00-5e-00-00-16     static\r\n";

const std::string kOpenBsdArp = R"(Host                                 Ethernet Address   Netif Expire    Flags
10.0.0.1                             00:0d:b9:41:2c:30  em0   19m58s
10.0.0.7                             00:0c:29:aa:bb:cc  em0   permanent l
)";

const std::string kLinuxRoute = R"(Kernel IP routing table
Destination     Gateway         Genmask         Flags Metric Ref    Use Iface
0.0.0.0         10.137.1.1      0.0.0.0         UG    100    0        0 eth0
10.137.1.0      0.0.0.0         255.255.255.0   U     100    0        0 eth0
192.168.50.0    10.137.1.254    255.255.255.0   UG    20     0        0 eth0
)";

const std::string kWindowsRoute = R"(===========================================================================
Interface List
 17...00 15 5d 01 02 03 ......Microsoft Hyper-V Network Adapter
===========================================================================

IPv4 Route Table
===========================================================================
Active Routes:
Network Destination        Netmask          Gateway       Interface  Metric
          0.0.0.0          0.0.0.0      10.137.2.1    10.137.2.16     10
       10.137.2.0    255.255.255.0         On-link     10.137.2.16    266
===========================================================================
Persistent Routes:
  None

IPv6 Route Table
===========================================================================
Active Routes:
 If Metric Network Destination      Gateway
  1    331 ::1/128                  On-link
===========================================================================
)";

void TestGuessFormat() {
  assert((GuessFormat(kLinuxArp) == DumpFormat{DumpType::kArp, DumpOs::kLinux}));
  assert((GuessFormat(kWindowsArp) == DumpFormat{DumpType::kArp, DumpOs::kWindows}));
  assert((GuessFormat(kOpenBsdArp) == DumpFormat{DumpType::kArp, DumpOs::kOpenBsd}));
  assert((GuessFormat(kLinuxRoute) == DumpFormat{DumpType::kRoute, DumpOs::kLinux}));
  assert((GuessFormat(kWindowsRoute) == DumpFormat{DumpType::kRoute, DumpOs::kWindows}));
  assert((GuessFormat("traceroute to example.org (93.184.216.34), 30 hops max, 60 byte packets\n") ==
          DumpFormat{DumpType::kTraceroute, DumpOs::kLinux}));
  assert(!GuessFormat("hello\nworld\n").has_value());
}

void TestLinuxArp() {
  auto dump = ParseDump(kLinuxArp, {DumpType::kArp, DumpOs::kLinux}, "alpha", kAt);
  assert(dump.records.size() == 2);
  assert(dump.records[0].kind == "arp");
  assert(dump.records[0].neighbor_ip == "10.137.1.8");
  assert(dump.records[0].neighbor_link == "00:16:3e:5e:6c:06");
  assert(dump.records[0].local_interface == "vif2.0");
  assert(dump.records[0].source_host_id == "alpha");
  assert(dump.skipped_lines == 2);  // header and incomplete row
  assert(dump.source_hint.empty());
}

void TestWindowsArpNamesItsHost() {
  auto dump = ParseDump(kWindowsArp, {DumpType::kArp, DumpOs::kWindows}, "", kAt);
  assert(dump.source_hint == "10.137.2.16");
  assert(dump.records.size() == 3);
  assert(dump.records[0].local_interface == "10.137.2.16");
  assert(!dump.records[0].source_host_id.has_value());

  // broadcast and multicast rows parse but do not survive normalization
  netmap::normalize::RecordNormalizer normalizer(dump.source_hint);
  std::size_t                         accepted = 0;
  for (std::size_t i = 0; i < dump.records.size(); ++i) {
    if (std::holds_alternative<netmap::model::ObservationRecord>(normalizer.Normalize(dump.records[i], i))) ++accepted;
  }
  assert(accepted == 1);
}

void TestOpenBsdLocalFlag() {
  auto dump = ParseDump(kOpenBsdArp, {DumpType::kArp, DumpOs::kOpenBsd}, "gw", kAt);
  assert(dump.records.size() == 2);
  // em0's own row names its link address, later in the dump or not
  assert(dump.records[0].local_interface == "00:0c:29:aa:bb:cc");
  assert(dump.records[0].neighbor_link == "00:0d:b9:41:2c:30");
  // the host's own address: local side is the link address itself
  assert(dump.records[1].local_interface == "00:0c:29:aa:bb:cc");
  assert(dump.records[1].neighbor_link == "00:0c:29:aa:bb:cc");

  const std::string no_own_row = "10.0.0.1   00:0d:b9:41:2c:30  em1   19m58s\n";
  assert(ParseDump(no_own_row, {DumpType::kArp, DumpOs::kOpenBsd}, "gw", kAt).records[0].local_interface == "em1");
}

void TestKnownLocalLinksNameTheLocalSide() {
  const netmap::parse::LocalLinks linux_links{{"eth0", "02:00:00:00:00:01"}};
  auto arp = ParseDump(kLinuxArp, {DumpType::kArp, DumpOs::kLinux}, "alpha", kAt, linux_links);
  assert(arp.records.size() == 2);
  assert(arp.records[0].local_interface == "vif2.0");
  assert(arp.records[1].local_interface == "02:00:00:00:00:01");

  auto route = ParseDump(kLinuxRoute, {DumpType::kRoute, DumpOs::kLinux}, "alpha", kAt, linux_links);
  for (const auto& record : route.records) assert(record.out_interface == "02:00:00:00:00:01");

  // windows keys interfaces by address; the interface's own row comes first
  const netmap::parse::LocalLinks windows_links{{"10.137.2.16", "00-15-5d-01-02-03"}};
  auto win = ParseDump(kWindowsArp, {DumpType::kArp, DumpOs::kWindows}, "", kAt, windows_links);
  assert(win.records.size() == 4);
  assert(win.records[0].local_interface == "00-15-5d-01-02-03");
  assert(win.records[0].neighbor_link == "00-15-5d-01-02-03");
  assert(win.records[0].neighbor_ip == "10.137.2.16");
  assert(win.records[1].local_interface == "00-15-5d-01-02-03");
  assert(win.records[1].neighbor_ip == "10.137.2.1");
}

void TestMutualDumpsConfirmOneEdge() {
  using namespace netmap::testing;

  const std::string gw_dump = R"(Host                                 Ethernet Address   Netif Expire    Flags
10.0.0.1                             00:0d:b9:41:2c:30  em0   19m58s
10.0.0.7                             00:0c:29:aa:bb:cc  em0   permanent l
)";
  const std::string peer_dump = R"(Host                                 Ethernet Address   Netif Expire    Flags
10.0.0.1                             00:0d:b9:41:2c:30  em0   permanent l
10.0.0.7                             00:0c:29:aa:bb:cc  em0   3m12s
)";

  TestClock clock;
  auto      manager = MakeManager(std::make_shared<netmap::db::memory::MemoryRepository>(), clock);
  const DumpFormat format{DumpType::kArp, DumpOs::kOpenBsd};
  manager->Ingest("gw", ParseDump(gw_dump, format, "gw", kAt).records);
  manager->Ingest("peer", ParseDump(peer_dump, format, "peer", kAt).records);

  const auto graph = manager->GetGraph();
  assert(graph.links.size() == 1);
  assert(graph.links[0].link.status == netmap::model::EdgeStatus::kConfirmed);
  assert(graph.links[0].link.observation_ids.size() == 2);
  assert(graph.links[0].host_a != graph.links[0].host_b);
  assert(graph.hosts.size() == 2);
}

void TestLinuxRoute() {
  auto dump = ParseDump(kLinuxRoute, {DumpType::kRoute, DumpOs::kLinux}, "alpha", kAt);
  assert(dump.records.size() == 3);
  assert(dump.records[0].destination == "0.0.0.0");
  assert(dump.records[0].netmask == "0.0.0.0");
  assert(dump.records[0].gateway == "10.137.1.1");
  assert(dump.records[0].metric == "100");
  assert(dump.records[0].out_interface == "eth0");

  netmap::normalize::RecordNormalizer normalizer("alpha");
  auto on_link = std::get<netmap::model::ObservationRecord>(normalizer.Normalize(dump.records[1], 1));
  assert(!on_link.route()->gateway.has_value());
  assert(on_link.route()->destination.ToString() == "10.137.1.0/24");

  auto via = std::get<netmap::model::ObservationRecord>(normalizer.Normalize(dump.records[2], 2));
  assert(via.route()->gateway->ToString() == "10.137.1.254");
  assert(via.route()->metric == 20);
}

void TestWindowsRouteIgnoresIpv6() {
  auto dump = ParseDump(kWindowsRoute, {DumpType::kRoute, DumpOs::kWindows}, "10.137.2.16", kAt);
  assert(dump.records.size() == 2);
  assert(dump.records[0].destination == "0.0.0.0");
  assert(dump.records[0].gateway == "10.137.2.1");
  assert(dump.records[0].out_interface == "10.137.2.16");
  assert(dump.records[1].gateway == "On-link");
  assert(dump.records[1].metric == "266");
}

void TestUnsupportedFormats() {
  bool threw = false;
  try {
    ParseDump("traceroute to x (1.2.3.4), 30 hops max, 60 byte packets\n", {DumpType::kTraceroute, DumpOs::kLinux}, "a", kAt);
  } catch (const netmap::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    ParseDump("", {DumpType::kRoute, DumpOs::kOpenBsd}, "a", kAt);
  } catch (const netmap::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestGuessFormat();
  TestLinuxArp();
  TestWindowsArpNamesItsHost();
  TestOpenBsdLocalFlag();
  TestKnownLocalLinksNameTheLocalSide();
  TestMutualDumpsConfirmOneEdge();
  TestLinuxRoute();
  TestWindowsRouteIgnoresIpv6();
  TestUnsupportedFormats();

  std::cout << "netmap_unit_dump_parser: pass\n";
  return 0;
}
