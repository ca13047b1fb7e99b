#include "trustchain/scoring/Scoring.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <numeric>

namespace trustchain::scoring {

namespace {

constexpr double kCommitShareWeight = 0.3;
constexpr double kLineShareWeight = 0.4;
constexpr double kFileShareWeight = 0.3;

// Many commits averaging only a handful of lines is treated as count inflation.
constexpr std::uint64_t kSpamCommitThreshold = 10;
constexpr double kSpamLinesPerCommit = 5.0;
constexpr double kSpamPenalty = 0.7;

constexpr double kLastDayBurstRatio = 0.3;
constexpr double kLastDayPenalty = 0.7;

double share(std::uint64_t part, std::uint64_t total) {
    if (total == 0) {
        return 0.0;
    }
    return static_cast<double>(part) / static_cast<double>(total);
}

}  // namespace

double finish_score(double value) {
    if (!std::isfinite(value)) {
        return kMinScore;
    }
    const double clamped = std::clamp(value, kMinScore, kMaxScore);
    // Same rounding as the "%.2f" commitment payload.
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.2f", clamped);
    return std::strtod(buffer, nullptr);
}

bool weights_valid(const Weights& weights, double tolerance) {
    for (const double weight : {weights.code, weights.time, weights.vote}) {
        if (!std::isfinite(weight) || weight < 0.0 || weight > 1.0) {
            return false;
        }
    }
    return std::abs(weights.total() - 1.0) <= tolerance;
}

double compute_code_score(const ActivityStats& author, const std::vector<ActivityStats>& cohort) {
    if (cohort.empty()) {
        return 0.0;
    }

    std::uint64_t total_commits = 0;
    std::uint64_t total_added = 0;
    std::uint64_t total_removed = 0;
    std::uint64_t total_files = 0;
    for (const auto& stats : cohort) {
        total_commits += stats.commits;
        total_added += stats.lines_added;
        total_removed += stats.lines_removed;
        total_files += stats.files_modified;
    }
    if (total_commits == 0) {
        return 0.0;
    }

    const double commit_share = share(author.commits, total_commits);
    const double add_share = share(author.lines_added, total_added);
    const double rem_share = share(author.lines_removed, total_removed);
    const double file_share = share(author.files_modified, total_files);

    const double blended =
        kCommitShareWeight * commit_share + kLineShareWeight * (add_share + rem_share) / 2.0 + kFileShareWeight * file_share;
    double raw = std::min(1.0, blended) * 100.0;

    if (author.commits > kSpamCommitThreshold) {
        const double lines_per_commit =
            static_cast<double>(author.lines_added + author.lines_removed) / static_cast<double>(author.commits);
        if (lines_per_commit < kSpamLinesPerCommit) {
            raw *= kSpamPenalty;
        }
    }

    return finish_score(raw);
}

double compute_time_consistency_score(std::uint32_t active_days,
                                      std::uint32_t total_days,
                                      std::uint64_t last_day_commits,
                                      std::uint64_t total_commits) {
    const auto days = std::max<std::uint32_t>(total_days, 1);
    double base = 100.0 * static_cast<double>(active_days) / static_cast<double>(days);
    if (total_commits > 0 &&
        static_cast<double>(last_day_commits) / static_cast<double>(total_commits) > kLastDayBurstRatio) {
        base *= kLastDayPenalty;
    }
    return finish_score(base);
}

double compute_peer_vote_score(const std::vector<int>& votes) {
    if (votes.empty()) {
        return 0.0;
    }
    const double sum = std::accumulate(votes.begin(), votes.end(), 0.0);
    const double mean = sum / static_cast<double>(votes.size());
    const double span = static_cast<double>(kMaxVote - kMinVote);
    return finish_score(100.0 * (mean - kMinVote) / span);
}

double combine_final_score(double code, double time, double peer, const Weights& weights) {
    double total = weights.total();
    if (!(total > 0.0)) {
        total = 1.0;
    }
    const double blended = (weights.code * code + weights.time * time + weights.vote * peer) / total;
    return finish_score(blended);
}

}  // namespace trustchain::scoring
