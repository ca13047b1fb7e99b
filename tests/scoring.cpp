#include "trustchain/scoring/ReputationTier.hpp"
#include "trustchain/scoring/Scoring.hpp"

#include <cassert>
#include <cmath>
#include <vector>

using namespace trustchain::scoring;

namespace {

bool near(double a, double b) {
    return std::abs(a - b) < 1e-9;
}

ActivityStats make_stats(std::uint64_t commits, std::uint64_t added, std::uint64_t removed, std::uint64_t files) {
    ActivityStats stats{};
    stats.commits = commits;
    stats.lines_added = added;
    stats.lines_removed = removed;
    stats.files_modified = files;
    stats.active_days = 1;
    stats.total_days = 1;
    return stats;
}

void test_final_score() {
    const Weights defaults{};
    assert(near(combine_final_score(80.0, 60.0, 50.0, defaults), 65.0));
    assert(near(combine_final_score(100.0, 100.0, 100.0, defaults), 100.0));
    assert(near(combine_final_score(0.0, 0.0, 0.0, defaults), 0.0));

    // Weights that do not sum to one are renormalized.
    assert(near(combine_final_score(60.0, 60.0, 60.0, Weights{0.5, 0.5, 0.5}), 60.0));
    assert(near(combine_final_score(90.0, 10.0, 10.0, Weights{1.0, 0.0, 0.0}), 90.0));

    // A zero weight total falls back to a divisor of one.
    assert(near(combine_final_score(80.0, 80.0, 80.0, Weights{0.0, 0.0, 0.0}), 0.0));

    for (double code = 0.0; code <= 100.0; code += 12.5) {
        for (double peer = 0.0; peer <= 100.0; peer += 25.0) {
            const double final_score = combine_final_score(code, 100.0 - code, peer, defaults);
            assert(final_score >= 0.0 && final_score <= 100.0);
        }
    }
}

void test_weights() {
    assert(weights_valid(Weights{0.4, 0.3, 0.3}, 0.01));
    assert(weights_valid(Weights{0.4, 0.3, 0.305}, 0.01));
    assert(weights_valid(Weights{1.0, 0.0, 0.0}, 0.01));
    assert(!weights_valid(Weights{0.5, 0.5, 0.1}, 0.01));
    assert(!weights_valid(Weights{1.2, -0.1, -0.1}, 0.01));
}

void test_peer_votes() {
    assert(near(compute_peer_vote_score({}), 0.0));
    assert(near(compute_peer_vote_score({5}), 100.0));
    assert(near(compute_peer_vote_score({1}), 0.0));
    assert(near(compute_peer_vote_score({3}), 50.0));
    assert(near(compute_peer_vote_score({4, 5}), 87.5));
    assert(near(compute_peer_vote_score({1, 2, 2}), 16.67));
    // 25 / 8 = 3.125 exactly; the tie rounds to even.
    assert(near(compute_peer_vote_score({1, 1, 1, 1, 1, 1, 1, 2}), 3.12));
}

void test_rounding() {
    assert(finish_score(0.125) == 0.12);
    assert(finish_score(0.375) == 0.38);
    assert(finish_score(16.666666) == 16.67);
    assert(finish_score(-3.0) == 0.0);
    assert(finish_score(250.0) == 100.0);
    assert(finish_score(std::nan("")) == 0.0);
}

void test_time_consistency() {
    assert(near(compute_time_consistency_score(10, 10, 0, 10), 100.0));
    assert(near(compute_time_consistency_score(10, 10, 4, 10), 70.0));
    // Exactly 30% on the final day is not a burst.
    assert(near(compute_time_consistency_score(10, 10, 3, 10), 100.0));
    assert(near(compute_time_consistency_score(5, 10, 0, 8), 50.0));
    assert(near(compute_time_consistency_score(0, 0, 0, 0), 0.0));
    assert(near(compute_time_consistency_score(1, 3, 0, 1), 33.33));
    assert(near(compute_time_consistency_score(1, 32, 0, 1), 3.12));
}

void test_code_score() {
    assert(near(compute_code_score(make_stats(5, 10, 0, 1), {}), 0.0));
    assert(near(compute_code_score(make_stats(0, 0, 0, 0), {make_stats(0, 0, 0, 0)}), 0.0));

    const auto solo = make_stats(5, 100, 20, 4);
    assert(near(compute_code_score(solo, {solo}), 100.0));

    // With no deletions in the cohort the removal share contributes nothing.
    const auto eleven_small = make_stats(11, 54, 0, 3);
    assert(near(compute_code_score(eleven_small, {eleven_small}), 56.0));

    const auto ten_small = make_stats(10, 49, 0, 3);
    assert(near(compute_code_score(ten_small, {ten_small}), 80.0));

    const auto eleven_even = make_stats(11, 55, 0, 3);
    assert(near(compute_code_score(eleven_even, {eleven_even}), 80.0));

    const auto hundred = make_stats(100, 499, 0, 3);
    assert(near(compute_code_score(hundred, {hundred}), 56.0));

    // 4.99 lines per commit is still below the floor; 5.00 is not.
    const auto just_below = make_stats(110, 549, 0, 3);
    assert(near(compute_code_score(just_below, {just_below}), 56.0));
    const auto at_floor = make_stats(110, 550, 0, 3);
    assert(near(compute_code_score(at_floor, {at_floor}), 80.0));

    const auto peer = make_stats(5, 50, 10, 3);
    const auto even = make_stats(5, 50, 10, 3);
    assert(near(compute_code_score(even, {even, peer}), 50.0));

    const auto more_lines = make_stats(5, 100, 10, 3);
    const double larger = compute_code_score(more_lines, {more_lines, peer});
    assert(near(larger, 53.33));
    assert(larger > 50.0);

    // Shifting lines and files toward one author, cohort totals unchanged, never lowers the score.
    double previous = -1.0;
    for (std::uint64_t added = 0; added <= 200; added += 20) {
        const auto author = make_stats(5, added, 0, added / 20);
        const auto rest = make_stats(5, 200 - added, 0, 10 - added / 20);
        const double score = compute_code_score(author, {author, rest});
        assert(score >= previous);
        previous = score;
    }
    assert(near(previous, 65.0));
}

void test_tiers() {
    assert(reputation_for_score(100.0) == 100);
    assert(reputation_for_score(90.0) == 100);
    assert(reputation_for_score(89.99) == 80);
    assert(reputation_for_score(80.0) == 80);
    assert(reputation_for_score(70.0) == 60);
    assert(reputation_for_score(60.0) == 40);
    assert(reputation_for_score(50.0) == 20);
    assert(reputation_for_score(49.99) == 0);
    assert(reputation_tier_for(75.0) == ReputationTier::Silver);
    assert(reputation_tier_to_string(ReputationTier::Contributor) == "contributor");
}

}  // namespace

int main() {
    test_final_score();
    test_weights();
    test_peer_votes();
    test_rounding();
    test_time_consistency();
    test_code_score();
    test_tiers();
    return 0;
}
