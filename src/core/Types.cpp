#include "trustchain/Types.hpp"

#include <cctype>
#include <charconv>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <system_error>

namespace trustchain {

namespace {
std::string to_hex(const std::uint8_t value) {
    std::ostringstream oss;
    oss << std::hex << std::nouppercase << std::setw(2) << std::setfill('0') << static_cast<int>(value);
    return oss.str();
}

constexpr std::int64_t kSecondsPerDay = 86400;

// Howard Hinnant's days_from_civil.
std::int64_t days_from_civil(std::int64_t year, unsigned month, unsigned day) {
    year -= month <= 2 ? 1 : 0;
    const std::int64_t era = (year >= 0 ? year : year - 399) / 400;
    const auto yoe = static_cast<unsigned>(year - era * 400);
    const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

bool parse_fixed_digits(std::string_view text, std::size_t offset, std::size_t count, int& value) {
    if (offset + count > text.size()) {
        return false;
    }
    value = 0;
    for (std::size_t i = 0; i < count; ++i) {
        const char ch = text[offset + i];
        if (ch < '0' || ch > '9') {
            return false;
        }
        value = value * 10 + (ch - '0');
    }
    return true;
}

}  // namespace

std::string digest_to_string(const Digest& digest) {
    std::ostringstream oss;
    for (const auto byte : digest) {
        oss << to_hex(byte);
    }
    return oss.str();
}

std::optional<Digest> digest_from_string(const std::string& text) {
    if (text.size() != Digest{}.size() * 2) {
        return std::nullopt;
    }

    Digest digest{};
    for (std::size_t index = 0; index < digest.size(); ++index) {
        const char* begin = text.data() + index * 2;
        if (!std::isxdigit(static_cast<unsigned char>(begin[0])) ||
            !std::isxdigit(static_cast<unsigned char>(begin[1]))) {
            return std::nullopt;
        }
        unsigned value = 0;
        const auto result = std::from_chars(begin, begin + 2, value, 16);
        if (result.ec != std::errc{} || result.ptr != begin + 2) {
            return std::nullopt;
        }
        digest[index] = static_cast<std::uint8_t>(value);
    }
    return digest;
}

std::int64_t to_unix_seconds(Timestamp time) {
    return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
}

Timestamp from_unix_seconds(std::int64_t seconds) {
    return Timestamp{std::chrono::seconds{seconds}};
}

std::int64_t utc_day_index(Timestamp time) {
    const auto seconds = to_unix_seconds(time);
    auto days = seconds / kSecondsPerDay;
    if (seconds % kSecondsPerDay < 0) {
        --days;
    }
    return days;
}

std::string format_timestamp(Timestamp time) {
    const std::time_t seconds = static_cast<std::time_t>(to_unix_seconds(time));
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &seconds);
#else
    gmtime_r(&seconds, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << 'Z';
    return oss.str();
}

std::optional<Timestamp> parse_timestamp(std::string_view text) {
    if (!text.empty() && (text.back() == 'Z' || text.back() == 'z')) {
        text.remove_suffix(1);
    }
    if (text.size() != 10 && text.size() != 19) {
        return std::nullopt;
    }

    int year = 0;
    int month = 0;
    int day = 0;
    if (!parse_fixed_digits(text, 0, 4, year) || text[4] != '-' || !parse_fixed_digits(text, 5, 2, month) ||
        text[7] != '-' || !parse_fixed_digits(text, 8, 2, day)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31) {
        return std::nullopt;
    }

    int hour = 0;
    int minute = 0;
    int second = 0;
    if (text.size() == 19) {
        if ((text[10] != 'T' && text[10] != ' ') || !parse_fixed_digits(text, 11, 2, hour) || text[13] != ':' ||
            !parse_fixed_digits(text, 14, 2, minute) || text[16] != ':' || !parse_fixed_digits(text, 17, 2, second)) {
            return std::nullopt;
        }
        if (hour > 23 || minute > 59 || second > 60) {
            return std::nullopt;
        }
    }

    const auto days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    return from_unix_seconds(days * kSecondsPerDay + hour * 3600 + minute * 60 + second);
}

}  // namespace trustchain
