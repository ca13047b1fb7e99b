#include "trustchain/log/StructuredLogger.hpp"

#include "trustchain/Types.hpp"
#include "trustchain/util/Json.hpp"

#include <chrono>
#include <cstdio>
#include <iostream>

namespace trustchain::log {

namespace {

std::string_view level_name(StructuredLogger::Level level) {
    switch (level) {
        case StructuredLogger::Level::Info:
            return "info";
        case StructuredLogger::Level::Warning:
            return "warning";
        case StructuredLogger::Level::Error:
            return "error";
    }
    return "info";
}

// format_timestamp() with milliseconds spliced in before the trailing Z.
std::string timestamp_now() {
    const auto now = std::chrono::system_clock::now();
    const auto whole = std::chrono::floor<std::chrono::seconds>(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now - whole).count();

    auto text = format_timestamp(whole);
    char fraction[8];
    std::snprintf(fraction, sizeof(fraction), ".%03d", static_cast<int>(millis));
    text.insert(text.size() - 1, fraction);
    return text;
}

}  // namespace

StructuredLogger& StructuredLogger::instance() {
    static StructuredLogger logger;
    return logger;
}

void StructuredLogger::log(Level level, std::string_view event, FieldList fields) {
    std::string line;
    line.reserve(96 + fields.size() * 32);
    line += "{\"ts\":";
    line += json::quote(timestamp_now());
    line += ",\"level\":";
    line += json::quote(level_name(level));
    line += ",\"event\":";
    line += json::quote(event);
    if (!fields.empty()) {
        line += ",\"fields\":{";
        bool first = true;
        for (const auto& [key, value] : fields) {
            if (!first) {
                line += ',';
            }
            first = false;
            line += json::quote(key);
            line += ':';
            line += json::quote(value);
        }
        line += '}';
    }
    line += "}\n";

    std::scoped_lock lock(mutex_);
    if (!enabled_) {
        return;
    }
    std::ostream& out = sink_ != nullptr ? *sink_ : std::clog;
    out << line;
    out.flush();
}

void StructuredLogger::set_enabled(bool enabled) {
    std::scoped_lock lock(mutex_);
    enabled_ = enabled;
}

bool StructuredLogger::enabled() const noexcept {
    std::scoped_lock lock(mutex_);
    return enabled_;
}

void StructuredLogger::set_sink(std::ostream* sink) {
    std::scoped_lock lock(mutex_);
    sink_ = sink;
}

}  // namespace trustchain::log
