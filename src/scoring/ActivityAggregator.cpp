#include "trustchain/scoring/ActivityAggregator.hpp"

#include <algorithm>
#include <set>
#include <unordered_map>

namespace trustchain::scoring {

namespace {

struct AuthorAccumulator {
    ActivityStats stats;
    std::set<std::string> files;
    std::set<std::int64_t> days;
};

}  // namespace

std::uint64_t CommitRecord::insertions() const {
    std::uint64_t total = 0;
    for (const auto& file : files) {
        total += file.insertions;
    }
    return total;
}

std::uint64_t CommitRecord::deletions() const {
    std::uint64_t total = 0;
    for (const auto& file : files) {
        total += file.deletions;
    }
    return total;
}

AnalysisWindow AnalysisWindow::trailing(Timestamp until, std::chrono::hours length) {
    return AnalysisWindow{until - length, until};
}

std::uint32_t AnalysisWindow::total_days() const {
    if (until <= since) {
        return 1;
    }
    const auto days = std::chrono::duration_cast<std::chrono::hours>(until - since).count() / 24;
    return static_cast<std::uint32_t>(std::max<std::int64_t>(1, days));
}

std::int64_t AnalysisWindow::last_day_index() const {
    return utc_day_index(until - std::chrono::seconds(1));
}

ActivityByAuthor aggregate_activity(const std::vector<CommitRecord>& commits, const AnalysisWindow& window) {
    std::unordered_map<std::string, AuthorAccumulator> accumulators;
    const auto total_days = window.total_days();
    const auto last_day = window.last_day_index();

    for (const auto& commit : commits) {
        if (commit.parent_count > 1) {
            continue;
        }
        if (!window.contains(commit.timestamp)) {
            continue;
        }
        const auto added = commit.insertions();
        const auto removed = commit.deletions();
        if (added == 0 && removed == 0) {
            continue;
        }

        const std::string author = commit.author.empty() ? std::string{"unknown"} : commit.author;
        auto& entry = accumulators[author];
        entry.stats.commits += 1;
        entry.stats.lines_added += added;
        entry.stats.lines_removed += removed;
        for (const auto& file : commit.files) {
            entry.files.insert(file.path);
        }

        const auto day = utc_day_index(commit.timestamp);
        entry.days.insert(day);
        if (day == last_day) {
            entry.stats.last_day_commits += 1;
        }
    }

    ActivityByAuthor result;
    for (auto& [author, entry] : accumulators) {
        entry.stats.files_modified = entry.files.size();
        entry.stats.active_days = static_cast<std::uint32_t>(entry.days.size());
        entry.stats.total_days = total_days;
        result.emplace(author, entry.stats);
    }
    return result;
}

}  // namespace trustchain::scoring
