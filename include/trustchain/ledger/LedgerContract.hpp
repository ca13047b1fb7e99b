#pragma once

#include "trustchain/core/Rules.hpp"
#include "trustchain/ledger/Operation.hpp"

namespace trustchain::ledger {

// Ledger-resident copy of the voting and finalization rules. State changes only
// through apply(); a rejected operation leaves the state untouched.
class LedgerContract : public VotingRules, public FinalizationRules {
public:
    // Initializes global state from a Create operation.
    LedgerContract(AppId app_id, const LedgerOperation& create);

    Decision apply(const LedgerOperation& operation, Timestamp now);

    Decision opt_in(const Identity& sender, Timestamp now);
    Decision cast_vote(const Identity& voter, const Identity& target, int score, Timestamp now) override;
    Decision anchor_commitment(const Identity& sender, const Identity& member, const std::string& commitment, Timestamp now);
    Decision finalize(const Identity& sender, Timestamp now) override;
    Decision mint_reputation(const Identity& sender, const Identity& recipient, std::int64_t amount);

    bool has_voted_for(const Identity& voter, const Identity& target) const override;
    std::size_t recorded_votes() const override;
    bool finalized() const override { return state_.finalized; }

    const LedgerState& state() const noexcept { return state_; }

private:
    bool opted_in(const Identity& account) const;

    LedgerState state_;
};

}  // namespace trustchain::ledger
