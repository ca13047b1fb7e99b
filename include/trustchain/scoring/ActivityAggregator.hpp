#pragma once

#include "trustchain/Types.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace trustchain::scoring {

struct FileChange {
    std::string path;
    std::uint64_t insertions{0};
    std::uint64_t deletions{0};
};

struct CommitRecord {
    std::string author;
    Timestamp timestamp{};
    std::vector<FileChange> files;
    std::uint32_t parent_count{1};

    std::uint64_t insertions() const;
    std::uint64_t deletions() const;
};

// Half-open [since, until).
struct AnalysisWindow {
    Timestamp since{};
    Timestamp until{};

    static AnalysisWindow trailing(Timestamp until, std::chrono::hours length);

    bool contains(Timestamp time) const noexcept { return time >= since && time < until; }
    std::uint32_t total_days() const;
    std::int64_t last_day_index() const;
};

struct ActivityStats {
    std::uint64_t commits{0};
    std::uint64_t lines_added{0};
    std::uint64_t lines_removed{0};
    std::uint64_t files_modified{0};
    std::uint32_t active_days{0};
    std::uint32_t total_days{1};
    std::uint64_t last_day_commits{0};
};

using ActivityByAuthor = std::map<std::string, ActivityStats>;

// Merge commits, commits with no line changes and commits outside the window are skipped.
ActivityByAuthor aggregate_activity(const std::vector<CommitRecord>& commits, const AnalysisWindow& window);

}  // namespace trustchain::scoring
