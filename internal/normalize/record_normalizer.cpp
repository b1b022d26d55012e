#include "record_normalizer.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>

#include "internal/util/time.hpp"

namespace netmap::normalize {

namespace {

constexpr std::string_view kWhitespace = " \t\r\n";

std::string Lower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

/*
  Collects the first failure while the record is walked. Each Require*
  helper returns nullopt once an error has been recorded so the caller can
  bail out with a single check.
*/
class FieldReader {
 public:
  explicit FieldReader(std::size_t index) : index_(index) {
  }

  bool Failed() const {
    return error_.has_value();
  }
  const NormalizationError& Error() const {
    return *error_;
  }

  void Fail(std::string field, std::string reason) {
    if (!error_) error_ = NormalizationError{index_, std::move(field), std::move(reason)};
  }

  std::optional<std::string_view> Require(const std::optional<std::string>& value, const char* field) {
    if (Failed()) return std::nullopt;
    if (!value || Trim(*value).empty()) {
      Fail(field, "missing");
      return std::nullopt;
    }
    return Trim(*value);
  }

  std::optional<model::IpAddress> RequireIp(const std::optional<std::string>& value, const char* field) {
    auto text = Require(value, field);
    if (!text) return std::nullopt;
    auto ip = model::IpAddress::Parse(*text);
    if (!ip) Fail(field, "invalid IP address '" + std::string(*text) + "'");
    return ip;
  }

  std::optional<model::LinkAddress> RequireLink(const std::optional<std::string>& value, const char* field) {
    auto text = Require(value, field);
    if (!text) return std::nullopt;
    auto link = model::LinkAddress::Parse(*text);
    if (!link) Fail(field, "invalid link address '" + std::string(*text) + "'");
    return link;
  }

  // Identity-bearing link address: zero, broadcast and group addresses
  // name no single interface.
  std::optional<model::LinkAddress> RequireUnicastLink(const std::optional<std::string>& value, const char* field) {
    auto link = RequireLink(value, field);
    if (!link) return std::nullopt;
    if (link->IsZero()) {
      Fail(field, "incomplete (all-zero) link address");
      return std::nullopt;
    }
    if (link->IsBroadcast()) {
      Fail(field, "broadcast link address");
      return std::nullopt;
    }
    if (link->IsMulticast()) {
      Fail(field, "multicast link address");
      return std::nullopt;
    }
    return link;
  }

  std::optional<model::InterfaceRef> RequireInterface(const std::optional<std::string>& value, const char* field) {
    auto text = Require(value, field);
    if (!text) return std::nullopt;
    auto ref = ParseInterfaceRef(*text);
    if (!ref) {
      Fail(field, "invalid interface identifier");
      return std::nullopt;
    }
    if (ref->link && (ref->link->IsZero() || ref->link->IsMulticast())) {
      Fail(field, "link address cannot identify an interface");
      return std::nullopt;
    }
    return ref;
  }

 private:
  std::size_t                       index_;
  std::optional<NormalizationError> error_;
};

bool IsOnLinkGateway(std::string_view text) {
  const auto lower = Lower(text);
  return lower == "*" || lower == "on-link" || lower == "0.0.0.0" || lower == "::" || lower == "link";
}

std::optional<model::Cidr> ParseDestination(FieldReader& reader, const RawRecord& raw) {
  auto text = reader.Require(raw.destination, "destination");
  if (!text) return std::nullopt;

  const bool  has_mask = raw.netmask && !Trim(*raw.netmask).empty();
  std::string destination(*text);
  if (Lower(destination) == "default") {
    destination = has_mask ? "0.0.0.0" : "0.0.0.0/0";
  }

  std::string reason;
  if (has_mask) {
    const auto address = model::IpAddress::Parse(destination);
    if (!address) {
      reader.Fail("destination", "invalid IP address '" + destination + "'");
      return std::nullopt;
    }
    const auto mask = model::IpAddress::Parse(Trim(*raw.netmask));
    if (!mask) {
      reader.Fail("netmask", "invalid netmask '" + std::string(Trim(*raw.netmask)) + "'");
      return std::nullopt;
    }
    auto cidr = model::Cidr::FromAddressAndMask(*address, *mask, &reason);
    if (!cidr) reader.Fail("destination", reason);
    return cidr;
  }

  auto cidr = model::Cidr::Parse(destination, &reason);
  if (!cidr) reader.Fail("destination", reason.empty() ? "invalid CIDR '" + destination + "'" : reason);
  return cidr;
}

std::optional<std::uint32_t> ParseMetric(FieldReader& reader, const std::optional<std::string>& value) {
  if (!value || Trim(*value).empty()) return 0u;
  const auto    text = Trim(*value);
  std::uint32_t out  = 0;
  auto [ptr, ec]     = std::from_chars(text.data(), text.data() + text.size(), out);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    reader.Fail("metric", "not a non-negative integer '" + std::string(text) + "'");
    return std::nullopt;
  }
  return out;
}

} // namespace

std::string_view Trim(std::string_view text) {
  const auto begin = text.find_first_not_of(kWhitespace);
  if (begin == std::string_view::npos) return {};
  const auto end = text.find_last_not_of(kWhitespace);
  return text.substr(begin, end - begin + 1);
}

std::optional<model::InterfaceRef> ParseInterfaceRef(std::string_view text) {
  text = Trim(text);
  if (text.empty()) return std::nullopt;
  if (auto link = model::LinkAddress::Parse(text)) {
    return model::InterfaceRef::FromLink(*link);
  }
  if (auto ip = model::IpAddress::Parse(text)) {
    return model::InterfaceRef::FromIp(*ip);
  }
  for (char c : text) {
    if (std::isspace(static_cast<unsigned char>(c)) || std::iscntrl(static_cast<unsigned char>(c))) return std::nullopt;
  }
  return model::InterfaceRef::FromName(std::string(text));
}

RecordNormalizer::RecordNormalizer(std::string batch_source) : batch_source_(std::move(batch_source)) {
}

NormalizeResult RecordNormalizer::Normalize(const RawRecord& raw, std::size_t index) const {
  FieldReader reader(index);

  const auto kind = model::ParseObservationKind(Lower(Trim(raw.kind)));
  if (!kind) {
    reader.Fail("kind", raw.kind.empty() ? "missing" : "unknown record kind '" + raw.kind + "'");
    return reader.Error();
  }

  std::string source = batch_source_;
  if (raw.source_host_id && !Trim(*raw.source_host_id).empty()) {
    const std::string named(Trim(*raw.source_host_id));
    if (!batch_source_.empty() && named != batch_source_) {
      reader.Fail("source_host_id", "'" + named + "' disagrees with batch source '" + batch_source_ + "'");
      return reader.Error();
    }
    source = named;
  }
  if (source.empty()) {
    reader.Fail("source_host_id", "missing");
    return reader.Error();
  }

  const auto observed_text = reader.Require(raw.observed_at, "observed_at");
  if (!observed_text) return reader.Error();
  const auto observed_at = util::ParseTimestampMillis(*observed_text);
  if (!observed_at) {
    reader.Fail("observed_at", "unparseable timestamp '" + std::string(*observed_text) + "'");
    return reader.Error();
  }

  switch (*kind) {
    case model::ObservationKind::kArp: {
      auto local = reader.RequireInterface(raw.local_interface, "local_interface");
      auto ip    = reader.RequireIp(raw.neighbor_ip, "neighbor_ip");
      auto link  = reader.RequireUnicastLink(raw.neighbor_link, "neighbor_link");
      if (reader.Failed()) return reader.Error();
      if (ip->IsUnspecified()) {
        reader.Fail("neighbor_ip", "unspecified address");
        return reader.Error();
      }
      return model::ObservationRecord(source, *observed_at, model::ArpEntry{*local, *ip, *link});
    }

    case model::ObservationKind::kRoute: {
      auto destination = ParseDestination(reader, raw);
      auto out         = reader.RequireInterface(raw.out_interface, "out_interface");
      auto metric      = ParseMetric(reader, raw.metric);
      if (reader.Failed()) return reader.Error();

      std::optional<model::IpAddress> gateway;
      if (raw.gateway && !Trim(*raw.gateway).empty() && !IsOnLinkGateway(Trim(*raw.gateway))) {
        gateway = reader.RequireIp(raw.gateway, "gateway");
        if (reader.Failed()) return reader.Error();
        if (gateway->family != destination->network.family) {
          reader.Fail("gateway", "address family differs from destination");
          return reader.Error();
        }
      }
      return model::ObservationRecord(source, *observed_at, model::RouteEntry{*destination, gateway, *out, *metric});
    }

    case model::ObservationKind::kAlias: {
      auto link = reader.RequireUnicastLink(raw.link, "link");
      if (reader.Failed()) return reader.Error();
      std::optional<model::LinkAddress> peer;
      if (raw.peer_link && !Trim(*raw.peer_link).empty()) {
        peer = reader.RequireUnicastLink(raw.peer_link, "peer_link");
        if (reader.Failed()) return reader.Error();
      }
      return model::ObservationRecord(source, *observed_at, model::AliasEntry{*link, peer});
    }

    default:
      break;
  }

  reader.Fail("kind", "unsupported record kind");
  return reader.Error();
}

} // namespace netmap::normalize
