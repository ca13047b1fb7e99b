#include "trustchain/core/ProjectLifecycle.hpp"
#include "trustchain/log/StructuredLogger.hpp"
#include "trustchain/scoring/ScoreCommitment.hpp"
#include "trustchain/storage/ProjectStore.hpp"

#include "test_support.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <sstream>

using namespace trustchain;
using trustchain::test::at;
using trustchain::test::commit;

namespace {

bool near(double a, double b) {
    return std::abs(a - b) < 1e-9;
}

const FinalScore& score_of(const std::vector<FinalScore>& rows, const Identity& member) {
    const auto it = std::find_if(rows.begin(), rows.end(), [&](const FinalScore& row) { return row.member == member; });
    assert(it != rows.end());
    return *it;
}

const ActivitySummary& summary_of(const std::vector<ActivitySummary>& rows, const Identity& member) {
    const auto it =
        std::find_if(rows.begin(), rows.end(), [&](const ActivitySummary& row) { return row.member == member; });
    assert(it != rows.end());
    return *it;
}

}  // namespace

int main() {
    std::ostringstream sink;
    log::StructuredLogger::instance().set_sink(&sink);

    Config config;
    config.analysis_window = std::chrono::hours(24 * 10);

    auto store = std::make_shared<storage::MemoryProjectStore>();
    auto history = std::make_shared<test::StaticHistory>();
    auto mirror = std::make_shared<test::RecordingMirror>();
    ProjectLifecycle lifecycle(config, store, history, nullptr, mirror);

    CreateProjectRequest request;
    request.name = "storage-engine";
    request.repository = "/srv/repos/storage-engine";
    request.creator = "owner";
    request.weights = scoring::Weights{0.2, 0.2, 0.6};
    request.deadline_contribution = at("2024-03-11T00:00:00Z");
    request.deadline_voting = at("2024-03-18T00:00:00Z");
    request.members = {"alice"};
    const auto project = lifecycle.create_project(request, at("2024-02-20T00:00:00Z"));
    assert(lifecycle.add_member(project.id, "owner", "bob", {"R.Builder@corp.example"}, at("2024-02-21T00:00:00Z"))
               .accepted);
    assert(lifecycle.add_member(project.id, "owner", "carol", {}, at("2024-02-21T00:00:00Z")).accepted);

    history->records = {
        commit("alice@example.com", "2024-03-01T10:00:00Z", "src/a.cpp", 30, 10),
        commit("ALICE@example.com", "2024-03-05T10:00:00Z", "src/b.cpp", 20, 0),
        commit("r.builder@Corp.Example", "2024-03-10T15:00:00Z", "src/c.cpp", 50, 10),
        commit("stranger@x.org", "2024-03-03T10:00:00Z", "src/d.cpp", 100, 0),
    };

    const auto analysis_time = at("2024-03-12T00:00:00Z");
    auto report = lifecycle.analyze(project.id, "alice", analysis_time);
    assert(!report.decision.accepted && report.decision.reason == RejectReason::NotCreator);

    report = lifecycle.analyze(project.id, "owner", analysis_time);
    assert(report.decision.accepted);
    assert(history->last_repository == "/srv/repos/storage-engine");
    assert(report.window.until == at("2024-03-11T00:00:00Z"));
    assert(report.window.since == at("2024-03-01T00:00:00Z"));
    assert(report.commits_read == 4);
    assert(report.unmatched_authors == std::vector<std::string>{"stranger@x.org"});
    assert(report.summaries.size() == 4);
    assert(mirror->summaries == 4);

    const auto& alice_summary = summary_of(report.summaries, "alice");
    assert(alice_summary.stats.commits == 2);
    assert(alice_summary.stats.files_modified == 2);
    assert(alice_summary.stats.active_days == 2);
    assert(near(alice_summary.code_score, 45.0));
    assert(near(alice_summary.time_score, 20.0));

    // A single commit on the last day of the window is a burst.
    const auto& bob_summary = summary_of(report.summaries, "bob");
    assert(bob_summary.stats.last_day_commits == 1);
    assert(near(bob_summary.code_score, 30.0));
    assert(near(bob_summary.time_score, 7.0));

    const auto& owner_summary = summary_of(report.summaries, "owner");
    assert(owner_summary.stats.commits == 0);
    assert(owner_summary.stats.total_days == 10);
    assert(near(owner_summary.code_score, 0.0));

    // An outage keeps the previous summaries.
    history->fail = true;
    bool unavailable = false;
    try {
        (void)lifecycle.analyze(project.id, "owner", analysis_time);
    } catch (const HistoryUnavailable&) {
        unavailable = true;
    }
    assert(unavailable);
    assert(store->summaries(project.id).size() == 4);
    assert(sink.str().find("\"event\":\"analysis.failed\"") != std::string::npos);
    history->fail = false;

    const auto open = at("2024-03-12T09:00:00Z");
    assert(lifecycle.submit_vote(project.id, "alice", "bob", 5, open).accepted);
    assert(lifecycle.submit_vote(project.id, "owner", "bob", 3, open).accepted);
    assert(lifecycle.submit_vote(project.id, "bob", "alice", 4, open).accepted);
    assert(lifecycle.submit_vote(project.id, "carol", "alice", 5, open).accepted);

    auto result = lifecycle.finalize(project.id, "owner", at("2024-03-17T23:59:59Z"));
    assert(!result.decision.accepted && result.decision.reason == RejectReason::BeforeVotingDeadline);
    result = lifecycle.finalize(project.id, "alice", at("2024-03-18T00:00:00Z"));
    assert(!result.decision.accepted && result.decision.reason == RejectReason::NotCreator);
    assert(store->final_scores(project.id).empty());

    auto minted = lifecycle.mint_reputation(project.id, "owner");
    assert(!minted.decision.accepted && minted.decision.reason == RejectReason::NotFinalized);

    const auto deadline = at("2024-03-18T00:00:00Z");
    result = lifecycle.finalize(project.id, "owner", deadline);
    assert(result.decision.accepted && result.decision.reason == RejectReason::None);
    assert(result.ledger == LedgerSyncStatus::NotConfigured);
    assert(result.scores.size() == 4);
    assert(lifecycle.project(project.id).status == ProjectStatus::Finalized);
    assert(mirror->final_scores == 4);

    const auto& alice = score_of(result.scores, "alice");
    assert(near(alice.scores.code, 45.0));
    assert(near(alice.scores.time, 20.0));
    assert(near(alice.scores.peer, 87.5));
    assert(near(alice.scores.final_score, 65.5));
    assert(alice.commitment == scoring::commitment_hex(scoring::ComponentScores{45.0, 20.0, 87.5, 65.5}));

    const auto& bob = score_of(result.scores, "bob");
    assert(near(bob.scores.peer, 75.0));
    assert(near(bob.scores.final_score, 52.4));

    const auto& owner = score_of(result.scores, "owner");
    assert(near(owner.scores.final_score, 0.0));

    // Finalizing again reports success with no new rows.
    const auto repeat = lifecycle.finalize(project.id, "owner", deadline);
    assert(repeat.decision.accepted && repeat.decision.reason == RejectReason::AlreadyFinalized);
    assert(repeat.scores.empty());
    assert(store->final_scores(project.id).size() == 4);

    auto decision = lifecycle.submit_vote(project.id, "alice", "carol", 4, open);
    assert(!decision.accepted && decision.reason == RejectReason::VotingClosed);
    report = lifecycle.analyze(project.id, "owner", deadline);
    assert(!report.decision.accepted && report.decision.reason == RejectReason::AlreadyFinalized);
    decision = lifecycle.add_member(project.id, "owner", "erin", {}, open);
    assert(!decision.accepted && decision.reason == RejectReason::AlreadyFinalized);

    const auto board = lifecycle.leaderboard(project.id);
    assert(board.size() == 4);
    assert(board[0].member == "alice" && board[0].rank == 1);
    assert(board[0].tier == scoring::ReputationTier::Bronze);
    assert(board[1].member == "bob");
    assert(board[2].member == "carol" && board[3].member == "owner");

    minted = lifecycle.mint_reputation(project.id, "alice");
    assert(!minted.decision.accepted && minted.decision.reason == RejectReason::NotCreator);
    minted = lifecycle.mint_reputation(project.id, "owner");
    assert(minted.decision.accepted);
    assert(minted.minted.size() == 2);
    assert(minted.minted.at("alice") == 40);
    assert(minted.minted.at("bob") == 20);
    assert(sink.str().find("\"event\":\"reputation.recorded_off_ledger\"") != std::string::npos);

    minted = lifecycle.mint_reputation(project.id, "owner");
    assert(minted.decision.accepted && minted.minted.empty());
    assert(score_of(store->final_scores(project.id), "alice").reputation_minted == 40);
    assert(!score_of(store->final_scores(project.id), "carol").reputation_minted.has_value());

    const auto verification = lifecycle.verify_member_score(project.id, "alice");
    assert(verification.stored_match);
    assert(verification.recomputed == verification.stored);
    assert(!verification.ledger_match.has_value());
    assert(verification.verified());

    bool missing = false;
    try {
        (void)lifecycle.verify_member_score(project.id, "mallory");
    } catch (const NotFoundError& ex) {
        missing = ex.code() == "E_SCORE_NOT_FOUND";
    }
    assert(missing);

    assert(store->delete_project(project.id));
    assert(store->members(project.id).empty());
    assert(store->final_scores(project.id).empty());

    log::StructuredLogger::instance().set_sink(nullptr);
    return 0;
}
