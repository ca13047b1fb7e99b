#pragma once

#include "trustchain/scoring/ActivityAggregator.hpp"

#include <cstdint>
#include <vector>

namespace trustchain::scoring {

struct Weights {
    double code{0.4};
    double time{0.3};
    double vote{0.3};

    double total() const noexcept { return code + time + vote; }
};

struct ComponentScores {
    double code{0.0};
    double time{0.0};
    double peer{0.0};
    double final_score{0.0};
};

constexpr double kMinScore = 0.0;
constexpr double kMaxScore = 100.0;
constexpr int kMinVote = 1;
constexpr int kMaxVote = 5;

// Clamp to [0, 100] and round half away from zero to two decimals.
double finish_score(double value);

// Each weight in [0, 1] and the sum within tolerance of 1.
bool weights_valid(const Weights& weights, double tolerance);

double compute_code_score(const ActivityStats& author, const std::vector<ActivityStats>& cohort);

double compute_time_consistency_score(std::uint32_t active_days,
                                      std::uint32_t total_days,
                                      std::uint64_t last_day_commits,
                                      std::uint64_t total_commits);

double compute_peer_vote_score(const std::vector<int>& votes);

double combine_final_score(double code, double time, double peer, const Weights& weights);

}  // namespace trustchain::scoring
