#include "address.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <cctype>
#include <cstring>
#include <vector>

namespace netmap::model {

namespace {

int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

bool HostBitsClear(const IpAddress& address, std::uint8_t prefix_len) {
  return NetworkPrefix(address, prefix_len) == address;
}

} // namespace

std::optional<IpAddress> IpAddress::Parse(std::string_view text) {
  if (text.empty() || text.size() > INET6_ADDRSTRLEN) return std::nullopt;

  // inet_pton needs a terminated buffer; zone ids ("fe80::1%eth0") are not accepted.
  const std::string buf(text);
  IpAddress         out;

  struct in_addr v4;
  if (inet_pton(AF_INET, buf.c_str(), &v4) == 1) {
    out.family = AddressFamily::kIPv4;
    std::memcpy(out.bytes.data(), &v4.s_addr, 4);
    return out;
  }

  struct in6_addr v6;
  if (inet_pton(AF_INET6, buf.c_str(), &v6) == 1) {
    out.family = AddressFamily::kIPv6;
    std::memcpy(out.bytes.data(), v6.s6_addr, 16);
    return out;
  }

  return std::nullopt;
}

std::string IpAddress::ToString() const {
  char buf[INET6_ADDRSTRLEN] = {0};
  if (family == AddressFamily::kIPv4) {
    struct in_addr v4;
    std::memcpy(&v4.s_addr, bytes.data(), 4);
    inet_ntop(AF_INET, &v4, buf, sizeof(buf));
  } else {
    struct in6_addr v6;
    std::memcpy(v6.s6_addr, bytes.data(), 16);
    inet_ntop(AF_INET6, &v6, buf, sizeof(buf));
  }
  return buf;
}

bool IpAddress::IsUnspecified() const {
  for (auto b : bytes) {
    if (b != 0) return false;
  }
  return true;
}

IpAddress NetworkPrefix(const IpAddress& address, std::uint8_t prefix_len) {
  IpAddress out   = address;
  const int total = address.BitLength();
  for (int bit = prefix_len; bit < total; ++bit) {
    out.bytes[bit / 8] &= static_cast<std::uint8_t>(~(0x80u >> (bit % 8)));
  }
  return out;
}

std::optional<std::uint8_t> PrefixLengthFromMask(const IpAddress& mask) {
  const int total = mask.BitLength();
  int       len   = 0;
  while (len < total && (mask.bytes[len / 8] & (0x80u >> (len % 8)))) {
    ++len;
  }
  for (int bit = len; bit < total; ++bit) {
    if (mask.bytes[bit / 8] & (0x80u >> (bit % 8))) return std::nullopt;
  }
  return static_cast<std::uint8_t>(len);
}

std::optional<Cidr> Cidr::Parse(std::string_view text, std::string* reason) {
  const auto slash = text.find('/');
  const auto addr  = IpAddress::Parse(text.substr(0, slash));
  if (!addr) {
    if (reason) *reason = "invalid network address";
    return std::nullopt;
  }

  std::uint8_t prefix_len = addr->BitLength();
  if (slash != std::string_view::npos) {
    const auto len_text = text.substr(slash + 1);
    if (len_text.empty() || len_text.size() > 3) {
      if (reason) *reason = "invalid prefix length";
      return std::nullopt;
    }
    int len = 0;
    for (char c : len_text) {
      if (!std::isdigit(static_cast<unsigned char>(c))) {
        if (reason) *reason = "invalid prefix length";
        return std::nullopt;
      }
      len = len * 10 + (c - '0');
    }
    if (len > addr->BitLength()) {
      if (reason) *reason = "prefix length out of range";
      return std::nullopt;
    }
    prefix_len = static_cast<std::uint8_t>(len);
  }

  if (!HostBitsClear(*addr, prefix_len)) {
    if (reason) *reason = "host bits set";
    return std::nullopt;
  }
  return Cidr{*addr, prefix_len};
}

std::optional<Cidr> Cidr::FromAddressAndMask(const IpAddress& address, const IpAddress& mask, std::string* reason) {
  if (address.family != mask.family) {
    if (reason) *reason = "netmask family mismatch";
    return std::nullopt;
  }
  const auto prefix_len = PrefixLengthFromMask(mask);
  if (!prefix_len) {
    if (reason) *reason = "non-contiguous netmask";
    return std::nullopt;
  }
  if (!HostBitsClear(address, *prefix_len)) {
    if (reason) *reason = "host bits set";
    return std::nullopt;
  }
  return Cidr{address, *prefix_len};
}

std::string Cidr::ToString() const {
  return network.ToString() + "/" + std::to_string(prefix_len);
}

std::optional<LinkAddress> LinkAddress::Parse(std::string_view text) {
  // Split on any separator; remember group widths to reject mixed garbage.
  std::vector<std::string_view> groups;
  std::size_t                   start = 0;
  char                          sep   = 0;
  for (std::size_t i = 0; i <= text.size(); ++i) {
    if (i == text.size() || text[i] == ':' || text[i] == '-' || text[i] == '.') {
      if (i < text.size()) {
        if (sep != 0 && text[i] != sep) return std::nullopt;
        sep = text[i];
      }
      groups.push_back(text.substr(start, i - start));
      start = i + 1;
    }
  }

  std::string hex;
  if (groups.size() == 6 && sep != '.') {
    for (auto g : groups) {
      if (g.empty() || g.size() > 2) return std::nullopt;
      if (g.size() == 1) hex.push_back('0');
      hex.append(g.data(), g.size());
    }
  } else if (groups.size() == 3 && sep == '.') {
    for (auto g : groups) {
      if (g.size() != 4) return std::nullopt;
      hex.append(g.data(), g.size());
    }
  } else if (groups.size() == 1 && text.size() == 12) {
    hex.assign(text.data(), text.size());
  } else {
    return std::nullopt;
  }

  LinkAddress out;
  for (std::size_t i = 0; i < 6; ++i) {
    const int hi = HexNibble(hex[2 * i]);
    const int lo = HexNibble(hex[2 * i + 1]);
    if (hi < 0 || lo < 0) return std::nullopt;
    out.bytes[i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  return out;
}

std::string LinkAddress::ToString() const {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(12);
  for (auto b : bytes) {
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

std::string LinkAddress::ToDisplayString() const {
  const auto  flat = ToString();
  std::string out;
  out.reserve(17);
  for (std::size_t i = 0; i < flat.size(); i += 2) {
    if (i) out.push_back(':');
    out.append(flat, i, 2);
  }
  return out;
}

bool LinkAddress::IsZero() const {
  for (auto b : bytes) {
    if (b != 0) return false;
  }
  return true;
}

bool LinkAddress::IsBroadcast() const {
  for (auto b : bytes) {
    if (b != 0xFF) return false;
  }
  return true;
}

bool LinkAddress::IsMulticast() const {
  return (bytes[0] & 0x01) != 0;
}

} // namespace netmap::model
