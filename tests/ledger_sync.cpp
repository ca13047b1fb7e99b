#include "trustchain/core/ProjectLifecycle.hpp"
#include "trustchain/ledger/LedgerClient.hpp"
#include "trustchain/log/StructuredLogger.hpp"
#include "trustchain/storage/ProjectStore.hpp"

#include "test_support.hpp"

#include <algorithm>
#include <cassert>
#include <sstream>

using namespace trustchain;
using trustchain::test::at;

namespace {

ledger::LedgerOperation member_opt_in(AppId app, const Identity& member, std::string_view key) {
    ledger::LedgerOperation operation;
    operation.kind = ledger::OperationKind::OptIn;
    operation.app_id = app;
    operation.sender = member;
    ledger::sign_operation(operation, key);
    return operation;
}

bool anchored(const std::vector<FinalScore>& rows, const Identity& member) {
    return std::any_of(rows.begin(), rows.end(), [&](const FinalScore& row) {
        return row.member == member && row.ledger_anchored;
    });
}

}  // namespace

int main() {
    std::ostringstream sink;
    log::StructuredLogger::instance().set_sink(&sink);

    Timestamp ledger_now = at("2024-03-01T00:00:00Z");
    auto chain = std::make_shared<ledger::InMemoryLedger>([&ledger_now] { return ledger_now; });
    chain->register_account("owner", "owner-key");
    chain->register_account("alice", "alice-key");
    chain->register_account("bob", "bob-key");
    auto gateway = std::make_shared<test::FlakyLedger>(chain);

    Config config;
    config.ledger_enabled = true;
    config.ledger_account = "owner";
    config.ledger_signing_key = "owner-key";
    config.reputation_asset_id = 77;

    auto store = std::make_shared<storage::MemoryProjectStore>();
    ProjectLifecycle lifecycle(config, store, std::make_shared<test::StaticHistory>(), gateway);

    CreateProjectRequest request;
    request.name = "ledger-lab";
    request.repository = "/srv/repos/ledger-lab";
    request.creator = "owner";
    request.weights = scoring::Weights{0.0, 0.0, 1.0};
    request.deadline_contribution = at("2024-03-11T00:00:00Z");
    request.deadline_voting = at("2024-03-18T00:00:00Z");
    request.members = {"alice", "bob"};

    const auto project = lifecycle.create_project(request, ledger_now);
    assert(project.status == ProjectStatus::Active);
    assert(project.ledger_app_id.has_value());
    assert(project.ledger_address == ledger::application_address(*project.ledger_app_id));
    const auto app = *project.ledger_app_id;

    auto state = chain->read_state(app);
    assert(state.has_value());
    assert(state->creator == "owner");
    assert(state->weight_vote == 100);
    assert(state->reputation_asset_id == 77);
    assert(state->deadline_voting == to_unix_seconds(request.deadline_voting));

    // A project created during an outage stays a draft until deployed again.
    gateway->offline = true;
    auto deferred_request = request;
    deferred_request.name = "deferred";
    const auto deferred = lifecycle.create_project(deferred_request, ledger_now);
    assert(deferred.status == ProjectStatus::Draft);
    assert(!deferred.ledger_app_id);
    assert(sink.str().find("\"event\":\"project.deploy_deferred\"") != std::string::npos);
    gateway->offline = false;
    auto decision = lifecycle.deploy_contract(deferred.id, "alice", ledger_now);
    assert(!decision.accepted && decision.reason == RejectReason::NotCreator);
    assert(lifecycle.deploy_contract(deferred.id, "owner", ledger_now).accepted);
    assert(lifecycle.project(deferred.id).status == ProjectStatus::Active);
    decision = lifecycle.deploy_contract(deferred.id, "owner", ledger_now);
    assert(decision.accepted && !decision.message.empty());

    assert(lifecycle.ledger_opt_in(project.id, member_opt_in(app, "alice", "alice-key")).accepted);
    assert(lifecycle.ledger_opt_in(project.id, member_opt_in(app, "bob", "bob-key")).accepted);
    assert(store->member(project.id, "alice")->ledger_opted_in);
    decision = lifecycle.ledger_opt_in(project.id, member_opt_in(app, "mallory", "mallory-key"));
    assert(!decision.accepted && decision.reason == RejectReason::VoterNotMember);
    decision = lifecycle.ledger_opt_in(project.id, member_opt_in(app + 5, "alice", "alice-key"));
    assert(!decision.accepted && decision.reason == RejectReason::UnknownApplication);
    auto forged = member_opt_in(app, "alice", "wrong-key");
    forged.kind = ledger::OperationKind::Vote;
    decision = lifecycle.ledger_opt_in(project.id, forged);
    assert(!decision.accepted && decision.reason == RejectReason::Unsupported);

    const auto open = at("2024-03-12T09:00:00Z");
    assert(lifecycle.submit_vote(project.id, "bob", "alice", 5, open).accepted);
    assert(lifecycle.project(project.id).status == ProjectStatus::Voting);
    assert(lifecycle.submit_vote(project.id, "alice", "bob", 3, open).accepted);

    // The gateway is down at finalize: off-ledger results stand, the ledger is pending.
    const auto deadline = at("2024-03-18T00:00:00Z");
    ledger_now = deadline;
    gateway->offline = true;
    auto result = lifecycle.finalize(project.id, "owner", deadline);
    assert(result.decision.accepted);
    assert(result.ledger == LedgerSyncStatus::Pending);
    assert(!result.warnings.empty());
    assert(result.scores.size() == 3);
    assert(lifecycle.project(project.id).status == ProjectStatus::Finalized);
    assert(!lifecycle.project(project.id).ledger_finalized);
    assert(ledger_sync_status_to_string(result.ledger) == "ledger_pending");

    assert(lifecycle.retry_ledger_sync(project.id, deadline) == LedgerSyncStatus::Pending);

    auto minted = lifecycle.mint_reputation(project.id, "owner");
    assert(minted.decision.accepted && minted.minted.empty());
    assert(!minted.warnings.empty());

    gateway->offline = false;
    assert(lifecycle.retry_ledger_sync(project.id, deadline) == LedgerSyncStatus::Synced);
    assert(lifecycle.project(project.id).ledger_finalized);

    state = chain->read_state(app);
    assert(state->finalized);
    assert(state->commitments.size() == 2);
    const auto rows = store->final_scores(project.id);
    assert(anchored(rows, "alice") && anchored(rows, "bob"));
    // The owner never opted in, so its commitment stays off-ledger.
    assert(!anchored(rows, "owner"));

    const auto verification = lifecycle.verify_member_score(project.id, "alice");
    assert(verification.ledger_match == true);
    assert(verification.anchored == verification.stored);
    assert(verification.verified());

    assert(lifecycle.retry_ledger_sync(project.id, deadline) == LedgerSyncStatus::Synced);
    result = lifecycle.finalize(project.id, "owner", deadline);
    assert(result.decision.reason == RejectReason::AlreadyFinalized);
    assert(result.ledger == LedgerSyncStatus::Synced);

    minted = lifecycle.mint_reputation(project.id, "owner");
    assert(minted.decision.accepted);
    assert(minted.minted.at("alice") == 100);
    assert(minted.minted.at("bob") == 20);
    state = chain->read_state(app);
    assert(state->accounts.at("alice").reputation_earned == 100);
    assert(state->accounts.at("bob").reputation_earned == 20);

    minted = lifecycle.mint_reputation(project.id, "owner");
    assert(minted.minted.empty());

    // Every confirmed transaction sits in one unbroken chain.
    assert(chain->verify_journal());
    const auto journal = chain->journal();
    const auto mints = std::count_if(journal.begin(), journal.end(), [](const auto& entry) {
        return entry.operation.kind == ledger::OperationKind::MintReputation;
    });
    assert(mints == 2);

    log::StructuredLogger::instance().set_sink(nullptr);
    return 0;
}
