#pragma once

#include <array>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace netmap::model {

enum class AddressFamily : std::uint8_t {
  kIPv4 = 4,
  kIPv6 = 6,
};

/*
  IP address in binary form (network byte order).

  IPv4 occupies bytes[0..3]; the remaining bytes stay zero so that the
  defaulted comparison orders addresses within a family numerically.
*/
struct IpAddress {
  AddressFamily                family = AddressFamily::kIPv4;
  std::array<std::uint8_t, 16> bytes{};

  static std::optional<IpAddress> Parse(std::string_view text);

  // Canonical text form (inet_ntop): "10.0.0.5", "fe80::1".
  std::string ToString() const;

  std::uint8_t BitLength() const {
    return family == AddressFamily::kIPv4 ? 32 : 128;
  }

  bool IsUnspecified() const;

  auto operator<=>(const IpAddress&) const = default;
};

/*
  Network prefix: address + prefix length, host bits always zero.
*/
struct Cidr {
  IpAddress    network;
  std::uint8_t prefix_len = 0;

  // "10.0.0.0/8", "fe80::/64". A bare address is a host route (/32, /128).
  // Host bits set is an error, not silently masked.
  static std::optional<Cidr> Parse(std::string_view text, std::string* reason = nullptr);

  static std::optional<Cidr> FromAddressAndMask(const IpAddress& address, const IpAddress& mask, std::string* reason = nullptr);

  std::string ToString() const;

  auto operator<=>(const Cidr&) const = default;
};

// Prefix length of a contiguous netmask ("255.255.255.0" -> 24).
std::optional<std::uint8_t> PrefixLengthFromMask(const IpAddress& mask);

IpAddress NetworkPrefix(const IpAddress& address, std::uint8_t prefix_len);

/*
  EUI-48 link-layer address.

  Accepted spellings: 00:16:3e:5e:6c:06, 0:16:3e:5e:6c:6, 00-16-3E-5E-6C-06,
  0016.3e5e.6c06, 00163e5e6c06. Canonical form is 12 lowercase hex digits
  without separators.
*/
struct LinkAddress {
  std::array<std::uint8_t, 6> bytes{};

  static std::optional<LinkAddress> Parse(std::string_view text);

  std::string ToString() const;

  // Colon-separated form for operator-facing output.
  std::string ToDisplayString() const;

  bool IsZero() const;
  bool IsBroadcast() const;
  // Group bit set (01:00:5e:..., 33:33:..., and broadcast).
  bool IsMulticast() const;

  auto operator<=>(const LinkAddress&) const = default;
};

} // namespace netmap::model
