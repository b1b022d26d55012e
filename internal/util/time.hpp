#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "google/protobuf/timestamp.pb.h"

namespace netmap::util {

/*
  Time utilities. Single place to control the clock source.

  All persisted timestamps are unix epoch milliseconds (uint64).
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Injected wherever "now" matters (staleness checks) so tests can pin it.
using NowFn = std::function<uint64_t()>;

TimePoint Now();
uint64_t  NowMillis();
NowFn     SystemNow();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

google::protobuf::Timestamp ToProto(uint64_t ms);
uint64_t                    FromProto(const google::protobuf::Timestamp& ts);

// Accepts RFC 3339 ("2024-05-01T10:00:00Z", "2024-05-01T12:00:00.250+02:00")
// or a bare integer of epoch milliseconds.
std::optional<uint64_t> ParseTimestampMillis(std::string_view text);
std::string             FormatTimestampMillis(uint64_t ms);

// "250ms", "30s", "15m", "24h", "7d". A bare integer is seconds.
std::optional<std::chrono::milliseconds> ParseDuration(std::string_view text);

} // namespace netmap::util
