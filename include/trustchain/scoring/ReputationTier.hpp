#pragma once

#include <cstdint>
#include <string_view>

namespace trustchain::scoring {

enum class ReputationTier {
    None,
    Contributor,
    Bronze,
    Silver,
    Gold,
    Platinum
};

ReputationTier reputation_tier_for(double final_score);

// Non-transferable award units: 100, 80, 60, 40, 20 or 0.
std::int64_t reputation_amount(ReputationTier tier);
std::int64_t reputation_for_score(double final_score);

std::string_view reputation_tier_to_string(ReputationTier tier);

}  // namespace trustchain::scoring
