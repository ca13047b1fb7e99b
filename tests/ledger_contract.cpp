#include "trustchain/ledger/LedgerContract.hpp"

#include <cassert>

using namespace trustchain;
using namespace trustchain::ledger;

namespace {

constexpr std::int64_t kContributionDeadline = 1'700'000'000;
constexpr std::int64_t kVotingDeadline = 1'700'600'000;
constexpr AppId kApp = 1001;

LedgerOperation make_create() {
    LedgerOperation create;
    create.kind = OperationKind::Create;
    create.sender = "owner";
    create.project_id = 7;
    create.deadline_contribution = kContributionDeadline;
    create.deadline_voting = kVotingDeadline;
    create.weight_code = 40;
    create.weight_time = 30;
    create.weight_vote = 30;
    create.reputation_asset_id = 55;
    return create;
}

Timestamp before_contribution() {
    return from_unix_seconds(kContributionDeadline - 60);
}

Timestamp voting_open() {
    return from_unix_seconds(kContributionDeadline + 60);
}

Timestamp after_voting() {
    return from_unix_seconds(kVotingDeadline);
}

LedgerOperation make_op(OperationKind kind, const Identity& sender, const Identity& target = {}, std::int64_t value = 0) {
    LedgerOperation operation;
    operation.kind = kind;
    operation.app_id = kApp;
    operation.sender = sender;
    operation.target = target;
    operation.value = value;
    return operation;
}

void test_create_and_opt_in() {
    LedgerContract contract(kApp, make_create());
    assert(contract.state().creator == "owner");
    assert(contract.state().weight_code == 40);
    assert(contract.state().reputation_asset_id == 55);
    assert(!contract.finalized());

    assert(contract.opt_in("alice", before_contribution()).accepted);
    assert(contract.opt_in("bob", voting_open()).accepted);
    assert(contract.state().accounts.at("alice").reputation_earned == 0);
    assert(!contract.state().accounts.at("alice").has_voted);

    const auto twice = contract.opt_in("alice", voting_open());
    assert(!twice.accepted && twice.reason == RejectReason::AlreadyMember);

    const auto late = contract.opt_in("carol", after_voting());
    assert(!late.accepted && late.reason == RejectReason::RegistrationClosed);
}

void test_votes() {
    LedgerContract contract(kApp, make_create());
    for (const auto* who : {"alice", "bob", "carol"}) {
        assert(contract.opt_in(who, before_contribution()).accepted);
    }

    auto decision = contract.cast_vote("alice", "bob", 4, before_contribution());
    assert(!decision.accepted && decision.reason == RejectReason::VotingNotOpen);

    decision = contract.cast_vote("alice", "alice", 4, voting_open());
    assert(!decision.accepted && decision.reason == RejectReason::SelfVote);

    decision = contract.cast_vote("mallory", "bob", 4, voting_open());
    assert(!decision.accepted && decision.reason == RejectReason::VoterNotMember);

    decision = contract.cast_vote("alice", "mallory", 4, voting_open());
    assert(!decision.accepted && decision.reason == RejectReason::TargetNotMember);

    decision = contract.cast_vote("alice", "bob", 6, voting_open());
    assert(!decision.accepted && decision.reason == RejectReason::InvalidScore);

    decision = contract.cast_vote("alice", "bob", 4, voting_open());
    assert(decision.accepted);
    assert(contract.has_voted_for("alice", "bob"));
    assert(!contract.has_voted_for("alice", "carol"));
    assert(contract.state().accounts.at("alice").vote_score == 4);
    assert(contract.state().accounts.at("alice").vote_target == "bob");

    // One vote per sender, whatever the target.
    decision = contract.cast_vote("alice", "carol", 5, voting_open());
    assert(!decision.accepted && decision.reason == RejectReason::DuplicateVote);
    assert(contract.recorded_votes() == 1);

    decision = contract.cast_vote("bob", "alice", 3, after_voting());
    assert(!decision.accepted && decision.reason == RejectReason::VotingClosed);

    decision = contract.apply(make_op(OperationKind::Vote, "bob", "alice", 0), voting_open());
    assert(!decision.accepted && decision.reason == RejectReason::InvalidScore);
    decision = contract.apply(make_op(OperationKind::Vote, "bob", "alice", 5), voting_open());
    assert(decision.accepted);
    assert(contract.recorded_votes() == 2);
}

void test_anchor_finalize_mint() {
    LedgerContract contract(kApp, make_create());
    assert(contract.opt_in("alice", before_contribution()).accepted);

    auto decision = contract.anchor_commitment("owner", "alice", "abcd", voting_open());
    assert(!decision.accepted && decision.reason == RejectReason::BeforeVotingDeadline);
    decision = contract.anchor_commitment("alice", "alice", "abcd", after_voting());
    assert(!decision.accepted && decision.reason == RejectReason::NotCreator);
    decision = contract.anchor_commitment("owner", "bob", "abcd", after_voting());
    assert(!decision.accepted && decision.reason == RejectReason::TargetNotMember);
    decision = contract.anchor_commitment("owner", "alice", "", after_voting());
    assert(!decision.accepted && decision.reason == RejectReason::InvalidAmount);
    assert(contract.anchor_commitment("owner", "alice", "abcd", after_voting()).accepted);
    decision = contract.anchor_commitment("owner", "alice", "ef01", after_voting());
    assert(!decision.accepted && decision.reason == RejectReason::AlreadyAnchored);
    assert(contract.state().commitments.at("alice") == "abcd");

    decision = contract.mint_reputation("owner", "alice", 80);
    assert(!decision.accepted && decision.reason == RejectReason::NotFinalized);

    decision = contract.finalize("owner", voting_open());
    assert(!decision.accepted && decision.reason == RejectReason::BeforeVotingDeadline);
    decision = contract.finalize("alice", after_voting());
    assert(!decision.accepted && decision.reason == RejectReason::NotCreator);
    assert(contract.finalize("owner", after_voting()).accepted);
    assert(contract.finalized());
    decision = contract.finalize("owner", after_voting());
    assert(!decision.accepted && decision.reason == RejectReason::AlreadyFinalized);

    decision = contract.anchor_commitment("owner", "alice", "ef01", after_voting());
    assert(!decision.accepted && decision.reason == RejectReason::AlreadyFinalized);

    decision = contract.mint_reputation("alice", "alice", 80);
    assert(!decision.accepted && decision.reason == RejectReason::NotCreator);
    decision = contract.mint_reputation("owner", "bob", 80);
    assert(!decision.accepted && decision.reason == RejectReason::TargetNotMember);
    decision = contract.mint_reputation("owner", "alice", 0);
    assert(!decision.accepted && decision.reason == RejectReason::InvalidAmount);
    assert(contract.mint_reputation("owner", "alice", 80).accepted);
    decision = contract.mint_reputation("owner", "alice", 80);
    assert(!decision.accepted && decision.reason == RejectReason::AlreadyMinted);
    assert(contract.state().accounts.at("alice").reputation_earned == 80);
}

void test_unsupported() {
    LedgerContract contract(kApp, make_create());
    for (const auto kind : {OperationKind::Create, OperationKind::Update, OperationKind::Delete, OperationKind::CloseOut}) {
        const auto decision = contract.apply(make_op(kind, "owner"), voting_open());
        assert(!decision.accepted && decision.reason == RejectReason::Unsupported);
    }

    auto stray = make_op(OperationKind::OptIn, "alice");
    stray.app_id = kApp + 1;
    const auto decision = contract.apply(stray, voting_open());
    assert(!decision.accepted && decision.reason == RejectReason::UnknownApplication);
    assert(contract.state().accounts.empty());
}

}  // namespace

int main() {
    test_create_and_opt_in();
    test_votes();
    test_anchor_finalize_mint();
    test_unsupported();
    return 0;
}
