#pragma once

#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace trustchain::log {

// Process-wide JSON-lines logger:
// {"ts":"2024-03-18T00:00:00.000Z","level":"info","event":"vote.accepted","fields":{...}}
class StructuredLogger {
public:
    enum class Level {
        Info,
        Warning,
        Error
    };

    using Field = std::pair<std::string, std::string>;
    using FieldList = std::vector<Field>;

    static StructuredLogger& instance();

    void log(Level level, std::string_view event, FieldList fields = {});

    void info(std::string_view event, FieldList fields = {}) {
        log(Level::Info, event, std::move(fields));
    }

    void warning(std::string_view event, FieldList fields = {}) {
        log(Level::Warning, event, std::move(fields));
    }

    void error(std::string_view event, FieldList fields = {}) {
        log(Level::Error, event, std::move(fields));
    }

    void set_enabled(bool enabled);
    [[nodiscard]] bool enabled() const noexcept;

    // nullptr restores std::clog.
    void set_sink(std::ostream* sink);

private:
    StructuredLogger() = default;

    StructuredLogger(const StructuredLogger&) = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    bool enabled_{true};
    std::ostream* sink_{nullptr};
    mutable std::mutex mutex_;
};

}  // namespace trustchain::log
