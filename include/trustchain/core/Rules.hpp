#pragma once

#include "trustchain/Types.hpp"
#include "trustchain/core/Errors.hpp"

namespace trustchain {

// Peer voting rules shared by the off-ledger lifecycle and the ledger contract.
// The two implementations are independent trust domains; neither calls the other.
class VotingRules {
public:
    virtual ~VotingRules() = default;

    virtual Decision cast_vote(const Identity& voter, const Identity& target, int score, Timestamp now) = 0;
    virtual bool has_voted_for(const Identity& voter, const Identity& target) const = 0;
    virtual std::size_t recorded_votes() const = 0;
};

class FinalizationRules {
public:
    virtual ~FinalizationRules() = default;

    // A repeat call reports RejectReason::AlreadyFinalized and leaves state unchanged.
    virtual Decision finalize(const Identity& sender, Timestamp now) = 0;
    virtual bool finalized() const = 0;
};

}  // namespace trustchain
