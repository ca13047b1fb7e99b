#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace trustchain {

using Identity = std::string;
using ProjectId = std::uint64_t;
using AppId = std::uint64_t;
using Timestamp = std::chrono::system_clock::time_point;
using Digest = std::array<std::uint8_t, 32>;

std::string digest_to_string(const Digest& digest);
std::optional<Digest> digest_from_string(const std::string& text);

std::int64_t to_unix_seconds(Timestamp time);
Timestamp from_unix_seconds(std::int64_t seconds);

// Days since 1970-01-01 in UTC; negative for earlier instants.
std::int64_t utc_day_index(Timestamp time);

// ISO-8601 with a trailing Z, second precision.
std::string format_timestamp(Timestamp time);

// Accepts "YYYY-MM-DD", "YYYY-MM-DDTHH:MM:SS" and the same with a trailing "Z".
std::optional<Timestamp> parse_timestamp(std::string_view text);

}  // namespace trustchain
