#include "trustchain/ledger/LedgerContract.hpp"

#include "trustchain/scoring/Scoring.hpp"

namespace trustchain::ledger {

LedgerContract::LedgerContract(AppId app_id, const LedgerOperation& create) {
    state_.app_id = app_id;
    state_.project_id = create.project_id;
    state_.creator = create.sender;
    state_.deadline_contribution = create.deadline_contribution;
    state_.deadline_voting = create.deadline_voting;
    state_.weight_code = create.weight_code;
    state_.weight_time = create.weight_time;
    state_.weight_vote = create.weight_vote;
    state_.reputation_asset_id = create.reputation_asset_id;
    state_.finalized = false;
}

Decision LedgerContract::apply(const LedgerOperation& operation, Timestamp now) {
    if (operation.app_id != state_.app_id) {
        return Decision::reject(RejectReason::UnknownApplication, "operation addressed to another application");
    }

    switch (operation.kind) {
        case OperationKind::OptIn:
            return opt_in(operation.sender, now);
        case OperationKind::Vote: {
            if (operation.value < scoring::kMinVote || operation.value > scoring::kMaxVote) {
                return Decision::reject(RejectReason::InvalidScore, "score must be within 1..5");
            }
            return cast_vote(operation.sender, operation.target, static_cast<int>(operation.value), now);
        }
        case OperationKind::AnchorCommitment:
            return anchor_commitment(operation.sender, operation.target, operation.commitment, now);
        case OperationKind::Finalize:
            return finalize(operation.sender, now);
        case OperationKind::MintReputation:
            return mint_reputation(operation.sender, operation.target, operation.value);
        case OperationKind::Create:
            return Decision::reject(RejectReason::Unsupported, "application already exists");
        case OperationKind::Update:
        case OperationKind::Delete:
        case OperationKind::CloseOut:
            return Decision::reject(RejectReason::Unsupported,
                                    std::string(operation_kind_to_string(operation.kind)) + " is not permitted");
    }
    return Decision::reject(RejectReason::Unsupported, "unknown operation");
}

Decision LedgerContract::opt_in(const Identity& sender, Timestamp now) {
    if (to_unix_seconds(now) >= state_.deadline_voting) {
        return Decision::reject(RejectReason::RegistrationClosed, "opt-in closes at the voting deadline");
    }
    if (opted_in(sender)) {
        return Decision::reject(RejectReason::AlreadyMember, sender + " already opted in");
    }
    state_.accounts.emplace(sender, AccountState{});
    return Decision::accept();
}

Decision LedgerContract::cast_vote(const Identity& voter, const Identity& target, int score, Timestamp now) {
    if (voter == target) {
        return Decision::reject(RejectReason::SelfVote, "cannot vote for yourself");
    }
    const auto seconds = to_unix_seconds(now);
    if (seconds < state_.deadline_contribution) {
        return Decision::reject(RejectReason::VotingNotOpen, "voting opens at the contribution deadline");
    }
    if (seconds >= state_.deadline_voting) {
        return Decision::reject(RejectReason::VotingClosed, "voting period has ended");
    }
    const auto voter_it = state_.accounts.find(voter);
    if (voter_it == state_.accounts.end()) {
        return Decision::reject(RejectReason::VoterNotMember, voter + " has not opted in");
    }
    if (!opted_in(target)) {
        return Decision::reject(RejectReason::TargetNotMember, target + " has not opted in");
    }
    if (voter_it->second.has_voted) {
        return Decision::reject(RejectReason::DuplicateVote, voter + " already voted");
    }
    if (score < scoring::kMinVote || score > scoring::kMaxVote) {
        return Decision::reject(RejectReason::InvalidScore, "score must be within 1..5");
    }

    voter_it->second.has_voted = true;
    voter_it->second.vote_score = score;
    voter_it->second.vote_target = target;
    return Decision::accept();
}

Decision LedgerContract::anchor_commitment(const Identity& sender,
                                           const Identity& member,
                                           const std::string& commitment,
                                           Timestamp now) {
    if (sender != state_.creator) {
        return Decision::reject(RejectReason::NotCreator, "only the creator may anchor scores");
    }
    if (state_.finalized) {
        return Decision::reject(RejectReason::AlreadyFinalized, "application is finalized");
    }
    if (to_unix_seconds(now) < state_.deadline_voting) {
        return Decision::reject(RejectReason::BeforeVotingDeadline, "voting period still running");
    }
    if (!opted_in(member)) {
        return Decision::reject(RejectReason::TargetNotMember, member + " has not opted in");
    }
    if (commitment.empty()) {
        return Decision::reject(RejectReason::InvalidAmount, "empty commitment");
    }
    if (state_.commitments.contains(member)) {
        return Decision::reject(RejectReason::AlreadyAnchored, "commitment already anchored for " + member);
    }
    state_.commitments.emplace(member, commitment);
    return Decision::accept();
}

Decision LedgerContract::finalize(const Identity& sender, Timestamp now) {
    if (sender != state_.creator) {
        return Decision::reject(RejectReason::NotCreator, "only the creator may finalize");
    }
    if (state_.finalized) {
        return Decision::reject(RejectReason::AlreadyFinalized, "application already finalized");
    }
    if (to_unix_seconds(now) < state_.deadline_voting) {
        return Decision::reject(RejectReason::BeforeVotingDeadline, "voting period still running");
    }
    state_.finalized = true;
    return Decision::accept();
}

Decision LedgerContract::mint_reputation(const Identity& sender, const Identity& recipient, std::int64_t amount) {
    if (!state_.finalized) {
        return Decision::reject(RejectReason::NotFinalized, "reputation is minted after finalization");
    }
    if (sender != state_.creator) {
        return Decision::reject(RejectReason::NotCreator, "only the creator may mint");
    }
    const auto it = state_.accounts.find(recipient);
    if (it == state_.accounts.end()) {
        return Decision::reject(RejectReason::TargetNotMember, recipient + " has not opted in");
    }
    if (amount <= 0) {
        return Decision::reject(RejectReason::InvalidAmount, "amount must be positive");
    }
    if (it->second.reputation_earned != 0) {
        return Decision::reject(RejectReason::AlreadyMinted, "reputation already minted for " + recipient);
    }
    it->second.reputation_earned = amount;
    return Decision::accept();
}

bool LedgerContract::has_voted_for(const Identity& voter, const Identity& target) const {
    const auto it = state_.accounts.find(voter);
    return it != state_.accounts.end() && it->second.has_voted && it->second.vote_target == target;
}

std::size_t LedgerContract::recorded_votes() const {
    std::size_t count = 0;
    for (const auto& [identity, account] : state_.accounts) {
        if (account.has_voted) {
            ++count;
        }
    }
    return count;
}

bool LedgerContract::opted_in(const Identity& account) const {
    return state_.accounts.contains(account);
}

}  // namespace trustchain::ledger
