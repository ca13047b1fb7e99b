#include "trustchain/scoring/ReputationTier.hpp"

namespace trustchain::scoring {

ReputationTier reputation_tier_for(double final_score) {
    if (final_score >= 90.0) {
        return ReputationTier::Platinum;
    }
    if (final_score >= 80.0) {
        return ReputationTier::Gold;
    }
    if (final_score >= 70.0) {
        return ReputationTier::Silver;
    }
    if (final_score >= 60.0) {
        return ReputationTier::Bronze;
    }
    if (final_score >= 50.0) {
        return ReputationTier::Contributor;
    }
    return ReputationTier::None;
}

std::int64_t reputation_amount(ReputationTier tier) {
    switch (tier) {
        case ReputationTier::Platinum:
            return 100;
        case ReputationTier::Gold:
            return 80;
        case ReputationTier::Silver:
            return 60;
        case ReputationTier::Bronze:
            return 40;
        case ReputationTier::Contributor:
            return 20;
        case ReputationTier::None:
            return 0;
    }
    return 0;
}

std::int64_t reputation_for_score(double final_score) {
    return reputation_amount(reputation_tier_for(final_score));
}

std::string_view reputation_tier_to_string(ReputationTier tier) {
    switch (tier) {
        case ReputationTier::Platinum:
            return "platinum";
        case ReputationTier::Gold:
            return "gold";
        case ReputationTier::Silver:
            return "silver";
        case ReputationTier::Bronze:
            return "bronze";
        case ReputationTier::Contributor:
            return "contributor";
        case ReputationTier::None:
            return "none";
    }
    return "none";
}

}  // namespace trustchain::scoring
