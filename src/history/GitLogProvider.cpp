#include "trustchain/history/HistoryProvider.hpp"

#include "trustchain/log/StructuredLogger.hpp"

#include <array>
#include <charconv>
#include <cstdio>
#include <sstream>
#include <system_error>
#include <utility>

#if !defined(_WIN32)
#include <sys/wait.h>
#endif

namespace trustchain::history {

namespace {

constexpr char kRecordSeparator = '\x1e';
constexpr char kFieldSeparator = '\x1f';

std::vector<std::string_view> split(std::string_view text, char separator) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        const auto pos = text.find(separator, start);
        if (pos == std::string_view::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::string_view trim_line(std::string_view line) {
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n' || line.back() == ' ')) {
        line.remove_suffix(1);
    }
    while (!line.empty() && (line.front() == '\n' || line.front() == ' ')) {
        line.remove_prefix(1);
    }
    return line;
}

// Binary files report "-" for both counts.
std::uint64_t parse_count(std::string_view token) {
    std::uint64_t value = 0;
    const auto result = std::from_chars(token.data(), token.data() + token.size(), value);
    if (result.ec != std::errc{} || result.ptr != token.data() + token.size()) {
        return 0;
    }
    return value;
}

std::string shell_quote(const std::string& value) {
    std::string quoted = "'";
    for (const char ch : value) {
        if (ch == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(ch);
        }
    }
    quoted.push_back('\'');
    return quoted;
}

struct CommandResult {
    int exit_code{-1};
    std::string output;
};

CommandResult run_command(const std::string& command) {
#if defined(_WIN32)
    FILE* pipe = _popen(command.c_str(), "r");
#else
    FILE* pipe = popen(command.c_str(), "r");
#endif
    if (!pipe) {
        throw HistoryUnavailable("E_HISTORY_SPAWN", "Failed to open a pipe to git");
    }

    CommandResult result;
    std::array<char, 4096> buffer{};
    std::size_t read = 0;
    while ((read = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        result.output.append(buffer.data(), read);
    }

#if defined(_WIN32)
    result.exit_code = _pclose(pipe);
#else
    const int status = pclose(pipe);
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    }
#endif
    return result;
}

}  // namespace

GitLogProvider::GitLogProvider(std::string git_executable) : git_executable_(std::move(git_executable)) {}

std::string GitLogProvider::build_command(const std::string& repository, const scoring::AnalysisWindow& window) const {
    std::ostringstream command;
    command << shell_quote(git_executable_) << " -C " << shell_quote(repository)
            << " log --no-color --numstat --date=unix"
            << " --format=" << shell_quote(std::string(kGitLogFormat))
            << " --since=" << shell_quote(format_timestamp(window.since))
            << " --until=" << shell_quote(format_timestamp(window.until)) << " 2>/dev/null";
    return command.str();
}

std::vector<scoring::CommitRecord> GitLogProvider::commits(const std::string& repository,
                                                           const scoring::AnalysisWindow& window) {
    if (repository.empty()) {
        throw HistoryUnavailable("E_HISTORY_NO_REPO", "No repository reference set");
    }

    const auto result = run_command(build_command(repository, window));
    if (result.exit_code != 0) {
        log::StructuredLogger::instance().warning(
            "history.git_failed",
            {{"repository", repository}, {"exit_code", std::to_string(result.exit_code)}});
        throw HistoryUnavailable("E_HISTORY_GIT",
                                 "git log failed for " + repository,
                                 "Verify the path is a readable git clone");
    }

    auto parsed = parse_git_log(result.output);
    log::StructuredLogger::instance().info(
        "history.loaded", {{"repository", repository}, {"commits", std::to_string(parsed.size())}});
    return parsed;
}

std::vector<scoring::CommitRecord> parse_git_log(std::string_view output) {
    std::vector<scoring::CommitRecord> commits;
    for (const auto record : split(output, kRecordSeparator)) {
        if (trim_line(record).empty()) {
            continue;
        }

        const auto newline = record.find('\n');
        const auto header = trim_line(record.substr(0, newline));
        const auto fields = split(header, kFieldSeparator);
        if (fields.size() < 5) {
            continue;
        }

        scoring::CommitRecord commit;
        const auto parents = trim_line(fields[1]);
        commit.parent_count = 0;
        for (const auto parent : split(parents, ' ')) {
            if (!parent.empty()) {
                ++commit.parent_count;
            }
        }
        commit.author = std::string(!fields[2].empty() ? fields[2] : fields[3]);

        std::int64_t seconds = 0;
        const auto time_field = trim_line(fields[4]);
        const auto parsed = std::from_chars(time_field.data(), time_field.data() + time_field.size(), seconds);
        if (parsed.ec != std::errc{}) {
            continue;
        }
        commit.timestamp = from_unix_seconds(seconds);

        if (newline != std::string_view::npos) {
            for (const auto raw_line : split(record.substr(newline + 1), '\n')) {
                const auto line = trim_line(raw_line);
                if (line.empty()) {
                    continue;
                }
                const auto columns = split(line, '\t');
                if (columns.size() < 3) {
                    continue;
                }
                scoring::FileChange change;
                change.insertions = parse_count(columns[0]);
                change.deletions = parse_count(columns[1]);
                change.path = std::string(columns[2]);
                commit.files.push_back(std::move(change));
            }
        }

        commits.push_back(std::move(commit));
    }
    return commits;
}

}  // namespace trustchain::history
