#include "trustchain/core/ProjectLifecycle.hpp"

#include "trustchain/log/StructuredLogger.hpp"
#include "trustchain/scoring/ScoreCommitment.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <set>
#include <utility>

namespace trustchain {

namespace {

std::string to_lower(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return lowered;
}

std::string local_part(const std::string& email) {
    const auto at = email.find('@');
    return at == std::string::npos ? email : email.substr(0, at);
}

std::uint32_t weight_percent(double weight) {
    return static_cast<std::uint32_t>(std::lround(weight * 100.0));
}

std::string format_score(double value) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.2f", value);
    return buffer;
}

log::StructuredLogger& logger() {
    return log::StructuredLogger::instance();
}

}  // namespace

std::string_view ledger_sync_status_to_string(LedgerSyncStatus status) {
    switch (status) {
        case LedgerSyncStatus::NotConfigured:
            return "not_configured";
        case LedgerSyncStatus::Synced:
            return "synced";
        case LedgerSyncStatus::Pending:
            return "ledger_pending";
    }
    return "not_configured";
}

ProjectLifecycle::ProjectLifecycle(Config config,
                                   std::shared_ptr<storage::ProjectStore> store,
                                   std::shared_ptr<history::HistoryProvider> history,
                                   std::shared_ptr<ledger::LedgerClient> ledger,
                                   std::shared_ptr<MirrorHook> mirror)
    : config_(std::move(config)),
      store_(std::move(store)),
      history_(std::move(history)),
      ledger_(std::move(ledger)),
      mirror_(std::move(mirror)) {}

template <typename Fn>
void ProjectLifecycle::mirror(const char* what, Fn&& fn) {
    if (!mirror_) {
        return;
    }
    try {
        fn(*mirror_);
    } catch (const std::exception& ex) {
        logger().warning("mirror.failed", {{"record", what}, {"error", ex.what()}});
    }
}

Project ProjectLifecycle::create_project(const CreateProjectRequest& request, Timestamp now) {
    const auto weights = request.weights.value_or(
        scoring::Weights{config_.default_weight_code, config_.default_weight_time, config_.default_weight_vote});
    if (!scoring::weights_valid(weights, config_.weight_tolerance)) {
        throw ValidationError("E_INVALID_WEIGHTS",
                              "Weights must each lie in [0, 1] and sum to 1",
                              "Example: --weights 0.4,0.3,0.3");
    }
    if (request.deadline_contribution >= request.deadline_voting) {
        throw ValidationError("E_DEADLINE_ORDER", "Contribution deadline must precede the voting deadline");
    }
    if (request.creator.empty()) {
        throw ValidationError("E_INVALID_CREATOR", "Project creator identity is required");
    }

    Project project;
    project.id = store_->next_project_id();
    project.name = request.name;
    project.repository = request.repository;
    project.creator = request.creator;
    project.weights = weights;
    project.deadline_contribution = request.deadline_contribution;
    project.deadline_voting = request.deadline_voting;
    project.status = ProjectStatus::Draft;
    project.created_at = now;

    std::scoped_lock lock(project_mutex(project.id));
    store_->insert_project(project);
    store_->insert_member(Member{project.id, project.creator, MemberRole::Owner, {}, false});
    for (const auto& identity : request.members) {
        if (identity.empty() || identity == project.creator) {
            continue;
        }
        store_->insert_member(Member{project.id, identity, MemberRole::Member, {}, false});
    }

    logger().info("project.created",
                  {{"project_id", std::to_string(project.id)},
                   {"creator", project.creator},
                   {"members", std::to_string(store_->members(project.id).size())}});

    if (ledger_ && !deploy_locked(project).accepted) {
        logger().info("project.deploy_deferred", {{"project_id", std::to_string(project.id)}});
    }
    mirror("project", [&](MirrorHook& hook) { hook.project_saved(project); });
    return project;
}

Decision ProjectLifecycle::deploy_contract(ProjectId project_id, const Identity& sender, Timestamp) {
    std::scoped_lock lock(project_mutex(project_id));
    auto project = require_project(project_id);
    if (sender != project.creator) {
        return Decision::reject(RejectReason::NotCreator, "only the creator may deploy the contract");
    }
    if (project.status != ProjectStatus::Draft || project.ledger_app_id) {
        return Decision::accept_with(RejectReason::None, "contract already deployed");
    }
    const auto decision = deploy_locked(project);
    if (decision.accepted) {
        mirror("project", [&](MirrorHook& hook) { hook.project_saved(project); });
    }
    return decision;
}

Decision ProjectLifecycle::deploy_locked(Project& project) {
    if (!ledger_) {
        return Decision::reject(RejectReason::LedgerUnavailable, "ledger not configured");
    }

    auto operation = make_operation(ledger::OperationKind::Create, project);
    operation.project_id = project.id;
    operation.deadline_contribution = to_unix_seconds(project.deadline_contribution);
    operation.deadline_voting = to_unix_seconds(project.deadline_voting);
    operation.weight_code = weight_percent(project.weights.code);
    operation.weight_time = weight_percent(project.weights.time);
    operation.weight_vote = weight_percent(project.weights.vote);
    operation.reputation_asset_id = config_.reputation_asset_id;

    const auto receipt = submit(std::move(operation));
    if (!receipt.confirmed()) {
        logger().warning("contract.deploy_failed",
                         {{"project_id", std::to_string(project.id)},
                          {"reason", std::string(reject_reason_to_string(receipt.reason))},
                          {"message", receipt.message}});
        const auto reason =
            receipt.status == ledger::ReceiptStatus::Unavailable ? RejectReason::LedgerUnavailable : receipt.reason;
        return Decision::reject(reason, "contract deployment failed: " + receipt.message);
    }

    project.ledger_app_id = receipt.app_id;
    project.ledger_address = ledger::application_address(receipt.app_id);
    project.status = ProjectStatus::Active;
    store_->update_project(project);
    logger().info("contract.deployed",
                  {{"project_id", std::to_string(project.id)},
                   {"app_id", std::to_string(receipt.app_id)},
                   {"txid", receipt.txid}});
    return Decision::accept();
}

Decision ProjectLifecycle::add_member(ProjectId project_id,
                                      const Identity& sender,
                                      const Identity& identity,
                                      std::vector<std::string> aliases,
                                      Timestamp now) {
    if (identity.empty()) {
        throw ValidationError("E_INVALID_MEMBER", "Member identity is required");
    }

    std::scoped_lock lock(project_mutex(project_id));
    const auto project = require_project(project_id);
    if (sender != project.creator) {
        return Decision::reject(RejectReason::NotCreator, "only the creator may add members");
    }
    if (project.status == ProjectStatus::Finalized) {
        return Decision::reject(RejectReason::AlreadyFinalized, "project is finalized");
    }
    if (now >= project.deadline_voting) {
        return Decision::reject(RejectReason::RegistrationClosed, "membership closes at the voting deadline");
    }
    if (!store_->insert_member(Member{project_id, identity, MemberRole::Member, std::move(aliases), false})) {
        return Decision::reject(RejectReason::AlreadyMember, identity + " is already a member");
    }
    logger().info("member.added", {{"project_id", std::to_string(project_id)}, {"member", identity}});
    return Decision::accept();
}

Decision ProjectLifecycle::ledger_opt_in(ProjectId project_id, const ledger::LedgerOperation& signed_opt_in) {
    std::scoped_lock lock(project_mutex(project_id));
    const auto project = require_project(project_id);
    if (!ledger_ || !project.ledger_app_id) {
        return Decision::reject(RejectReason::LedgerUnavailable, "project has no deployed contract");
    }
    if (signed_opt_in.kind != ledger::OperationKind::OptIn) {
        return Decision::reject(RejectReason::Unsupported, "expected an opt-in operation");
    }
    if (signed_opt_in.app_id != *project.ledger_app_id) {
        return Decision::reject(RejectReason::UnknownApplication, "opt-in addressed to another application");
    }
    if (!store_->member(project_id, signed_opt_in.sender)) {
        return Decision::reject(RejectReason::VoterNotMember, signed_opt_in.sender + " is not a project member");
    }

    const auto receipt = ledger_->submit(signed_opt_in);
    if (receipt.confirmed() ||
        (receipt.status == ledger::ReceiptStatus::Rejected && receipt.reason == RejectReason::AlreadyMember)) {
        store_->set_member_opted_in(project_id, signed_opt_in.sender);
        logger().info("member.opted_in",
                      {{"project_id", std::to_string(project_id)}, {"member", signed_opt_in.sender}});
        return Decision::accept();
    }
    logger().warning("member.opt_in_failed",
                     {{"project_id", std::to_string(project_id)},
                      {"member", signed_opt_in.sender},
                      {"reason", std::string(reject_reason_to_string(receipt.reason))}});
    return Decision::reject(receipt.status == ledger::ReceiptStatus::Unavailable ? RejectReason::LedgerUnavailable
                                                                                : receipt.reason,
                            receipt.message);
}

AnalysisReport ProjectLifecycle::analyze(ProjectId project_id,
                                         const Identity& sender,
                                         Timestamp now,
                                         std::optional<Timestamp> since) {
    std::scoped_lock lock(project_mutex(project_id));
    const auto project = require_project(project_id);

    AnalysisReport report;
    if (sender != project.creator) {
        report.decision = Decision::reject(RejectReason::NotCreator, "only the creator may run analysis");
        return report;
    }
    if (project.status == ProjectStatus::Finalized) {
        report.decision = Decision::reject(RejectReason::AlreadyFinalized, "scores are frozen after finalization");
        return report;
    }

    const auto until = std::min(now, project.deadline_contribution);
    report.window.until = until;
    report.window.since = since.value_or(until - config_.analysis_window);

    std::vector<scoring::CommitRecord> commits;
    try {
        commits = history_->commits(project.repository, report.window);
    } catch (const HistoryUnavailable& ex) {
        logger().warning("analysis.failed",
                         {{"project_id", std::to_string(project_id)}, {"code", ex.code()}, {"error", ex.message()}});
        throw;
    }
    report.commits_read = commits.size();

    const auto members = store_->members(project_id);
    std::set<std::string> unmatched;
    for (auto& commit : commits) {
        if (const auto identity = match_member(commit.author, members)) {
            commit.author = *identity;
        } else {
            unmatched.insert(commit.author);
        }
    }
    report.unmatched_authors.assign(unmatched.begin(), unmatched.end());

    const auto activity = scoring::aggregate_activity(commits, report.window);
    std::vector<scoring::ActivityStats> cohort;
    cohort.reserve(activity.size());
    for (const auto& [author, stats] : activity) {
        cohort.push_back(stats);
    }

    for (const auto& member : members) {
        ActivitySummary summary;
        summary.project = project_id;
        summary.member = member.identity;
        summary.analyzed_at = now;
        if (const auto it = activity.find(member.identity); it != activity.end()) {
            summary.stats = it->second;
        } else {
            summary.stats.total_days = report.window.total_days();
        }
        summary.code_score = scoring::compute_code_score(summary.stats, cohort);
        summary.time_score = scoring::compute_time_consistency_score(summary.stats.active_days,
                                                                     summary.stats.total_days,
                                                                     summary.stats.last_day_commits,
                                                                     summary.stats.commits);
        report.summaries.push_back(std::move(summary));
    }

    store_->replace_summaries(project_id, report.summaries);
    logger().info("analysis.completed",
                  {{"project_id", std::to_string(project_id)},
                   {"commits", std::to_string(report.commits_read)},
                   {"authors", std::to_string(activity.size())},
                   {"unmatched", std::to_string(report.unmatched_authors.size())}});
    mirror("summaries", [&](MirrorHook& hook) { hook.summaries_saved(project_id, report.summaries); });
    report.decision = Decision::accept();
    return report;
}

std::optional<Identity> ProjectLifecycle::match_member(const std::string& author,
                                                       const std::vector<Member>& members) const {
    const auto lowered = to_lower(author);
    const auto local = local_part(lowered);
    for (const auto& member : members) {
        std::vector<std::string> candidates{member.identity};
        candidates.insert(candidates.end(), member.aliases.begin(), member.aliases.end());
        for (const auto& candidate : candidates) {
            const auto value = to_lower(candidate);
            if (value == lowered || value == local) {
                return member.identity;
            }
        }
    }
    return std::nullopt;
}

Decision ProjectLifecycle::submit_vote(ProjectId project_id,
                                       const Identity& voter,
                                       const Identity& target,
                                       int score,
                                       Timestamp now) {
    if (score < scoring::kMinVote || score > scoring::kMaxVote) {
        throw ValidationError("E_VOTE_SCORE", "Vote score must be an integer between 1 and 5");
    }

    std::scoped_lock lock(project_mutex(project_id));
    auto project = require_project(project_id);

    const auto rejected = [&](RejectReason reason, std::string message) {
        logger().info("vote.rejected",
                      {{"project_id", std::to_string(project_id)},
                       {"voter", voter},
                       {"target", target},
                       {"reason", std::string(reject_reason_to_string(reason))}});
        return Decision::reject(reason, std::move(message));
    };

    if (voter == target) {
        return rejected(RejectReason::SelfVote, "cannot vote for yourself");
    }
    if (now < project.deadline_contribution) {
        return rejected(RejectReason::VotingNotOpen, "voting opens at the contribution deadline");
    }
    if (now >= project.deadline_voting || project.status == ProjectStatus::Finalized) {
        return rejected(RejectReason::VotingClosed, "voting period has ended");
    }
    if (!store_->member(project_id, voter)) {
        return rejected(RejectReason::VoterNotMember, voter + " is not a project member");
    }
    if (!store_->member(project_id, target)) {
        return rejected(RejectReason::TargetNotMember, target + " is not a project member");
    }

    const Vote vote{project_id, voter, target, score, now};
    if (!store_->insert_vote(vote)) {
        return rejected(RejectReason::DuplicateVote, voter + " already voted for " + target);
    }
    if (project.status == ProjectStatus::Active) {
        project.status = ProjectStatus::Voting;
        store_->update_project(project);
    }

    logger().info("vote.accepted",
                  {{"project_id", std::to_string(project_id)}, {"voter", voter}, {"target", target}});
    mirror("vote", [&](MirrorHook& hook) { hook.vote_saved(vote); });
    return Decision::accept();
}

FinalizeResult ProjectLifecycle::finalize(ProjectId project_id, const Identity& sender, Timestamp now) {
    std::scoped_lock lock(project_mutex(project_id));
    const auto project = require_project(project_id);

    FinalizeResult result;
    if (sender != project.creator) {
        logger().info("finalize.rejected", {{"project_id", std::to_string(project_id)}, {"sender", sender}});
        result.decision = Decision::reject(RejectReason::NotCreator, "only the creator may finalize");
        return result;
    }
    if (project.status == ProjectStatus::Finalized) {
        result.decision = Decision::accept_with(RejectReason::AlreadyFinalized, "already_finalized");
        if (ledger_ && project.ledger_app_id) {
            result.ledger = project.ledger_finalized ? LedgerSyncStatus::Synced : LedgerSyncStatus::Pending;
        }
        return result;
    }
    if (now < project.deadline_voting) {
        logger().info("finalize.rejected",
                      {{"project_id", std::to_string(project_id)}, {"reason", "before_voting_deadline"}});
        result.decision = Decision::reject(RejectReason::BeforeVotingDeadline, "voting period still running");
        return result;
    }

    std::map<Identity, ActivitySummary> summaries;
    for (auto& summary : store_->summaries(project_id)) {
        summaries.emplace(summary.member, std::move(summary));
    }
    std::map<Identity, std::vector<int>> received;
    for (const auto& vote : store_->votes(project_id)) {
        received[vote.target].push_back(vote.score);
    }

    for (const auto& member : store_->members(project_id)) {
        FinalScore row;
        row.project = project_id;
        row.member = member.identity;
        row.finalized_at = now;
        if (const auto it = summaries.find(member.identity); it != summaries.end()) {
            row.scores.code = it->second.code_score;
            row.scores.time = it->second.time_score;
        }
        row.scores.peer = scoring::compute_peer_vote_score(received[member.identity]);
        row.scores.final_score =
            scoring::combine_final_score(row.scores.code, row.scores.time, row.scores.peer, project.weights);
        row.commitment = scoring::commitment_hex(row.scores);
        result.scores.push_back(std::move(row));
    }

    if (!store_->commit_finalization(project_id, result.scores)) {
        result.scores.clear();
        result.decision = Decision::accept_with(RejectReason::AlreadyFinalized, "already_finalized");
        return result;
    }
    result.decision = Decision::accept();
    logger().info("finalize.completed",
                  {{"project_id", std::to_string(project_id)}, {"scores", std::to_string(result.scores.size())}});
    mirror("final_scores", [&](MirrorHook& hook) { hook.final_scores_saved(project_id, result.scores); });

    if (ledger_ && project.ledger_app_id) {
        result.ledger = sync_ledger_locked(require_project(project_id), now, result.warnings);
    }
    return result;
}

LedgerSyncStatus ProjectLifecycle::retry_ledger_sync(ProjectId project_id, Timestamp now) {
    std::scoped_lock lock(project_mutex(project_id));
    const auto project = require_project(project_id);
    if (!ledger_ || !project.ledger_app_id) {
        return LedgerSyncStatus::NotConfigured;
    }
    if (project.status != ProjectStatus::Finalized) {
        return LedgerSyncStatus::Pending;
    }
    if (project.ledger_finalized) {
        return LedgerSyncStatus::Synced;
    }
    std::vector<std::string> warnings;
    return sync_ledger_locked(project, now, warnings);
}

LedgerSyncStatus ProjectLifecycle::sync_ledger_locked(const Project& project,
                                                      Timestamp,
                                                      std::vector<std::string>& warnings) {
    const auto project_field = std::pair<std::string, std::string>{"project_id", std::to_string(project.id)};
    const auto state = ledger_->read_state(*project.ledger_app_id);
    if (!state) {
        warnings.push_back("ledger state unavailable; scores kept off-ledger until retry");
        logger().warning("ledger.sync_pending", {project_field, {"step", "read_state"}});
        return LedgerSyncStatus::Pending;
    }

    bool pending = false;
    for (const auto& score : store_->final_scores(project.id)) {
        if (score.ledger_anchored) {
            continue;
        }
        if (const auto anchored = state->commitments.find(score.member); anchored != state->commitments.end()) {
            if (anchored->second == score.commitment) {
                store_->mark_anchored(project.id, score.member);
            } else {
                warnings.push_back("ledger commitment for " + score.member + " differs from the stored score");
                logger().error("ledger.commitment_mismatch", {project_field, {"member", score.member}});
            }
            continue;
        }
        if (state->finalized) {
            warnings.push_back("ledger finalized before the commitment of " + score.member + " was anchored");
            continue;
        }
        if (!state->accounts.contains(score.member)) {
            warnings.push_back(score.member + " has not opted in; commitment kept off-ledger");
            continue;
        }

        auto operation = make_operation(ledger::OperationKind::AnchorCommitment, project);
        operation.target = score.member;
        operation.commitment = score.commitment;
        const auto receipt = submit(std::move(operation));
        if (receipt.confirmed() ||
            (receipt.status == ledger::ReceiptStatus::Rejected && receipt.reason == RejectReason::AlreadyAnchored)) {
            store_->mark_anchored(project.id, score.member);
        } else {
            pending = true;
            warnings.push_back("anchoring " + score.member + " failed: " + receipt.message);
        }
    }

    bool ledger_finalized = state->finalized;
    if (!ledger_finalized && !pending) {
        const auto receipt = submit(make_operation(ledger::OperationKind::Finalize, project));
        if (receipt.confirmed() ||
            (receipt.status == ledger::ReceiptStatus::Rejected && receipt.reason == RejectReason::AlreadyFinalized)) {
            ledger_finalized = true;
        } else {
            warnings.push_back("ledger finalize failed: " + receipt.message);
        }
    }

    if (!ledger_finalized) {
        logger().warning("ledger.sync_pending", {project_field, {"step", "finalize"}});
        return LedgerSyncStatus::Pending;
    }

    auto updated = project;
    updated.ledger_finalized = true;
    store_->update_project(updated);
    logger().info("ledger.synced", {project_field, {"app_id", std::to_string(*project.ledger_app_id)}});
    return LedgerSyncStatus::Synced;
}

MintResult ProjectLifecycle::mint_reputation(ProjectId project_id, const Identity& sender) {
    std::scoped_lock lock(project_mutex(project_id));
    const auto project = require_project(project_id);

    MintResult result;
    if (sender != project.creator) {
        result.decision = Decision::reject(RejectReason::NotCreator, "only the creator may mint reputation");
        return result;
    }
    if (project.status != ProjectStatus::Finalized) {
        result.decision = Decision::reject(RejectReason::NotFinalized, "reputation is minted after finalization");
        return result;
    }

    const bool on_ledger = ledger_ && project.ledger_app_id;
    std::optional<ledger::LedgerState> state;
    if (on_ledger) {
        state = ledger_->read_state(*project.ledger_app_id);
        if (!state) {
            result.warnings.push_back("ledger state unavailable; minting deferred");
        }
    }

    for (const auto& score : store_->final_scores(project_id)) {
        const auto amount = scoring::reputation_for_score(score.scores.final_score);
        if (amount <= 0 || score.reputation_minted) {
            continue;
        }
        if (!on_ledger) {
            if (store_->record_reputation(project_id, score.member, amount)) {
                result.minted.emplace(score.member, amount);
                logger().warning("reputation.recorded_off_ledger",
                                 {{"project_id", std::to_string(project_id)},
                                  {"member", score.member},
                                  {"amount", std::to_string(amount)}});
            }
            continue;
        }
        if (!state) {
            continue;
        }

        const auto account = state->accounts.find(score.member);
        if (account == state->accounts.end()) {
            result.warnings.push_back(score.member + " has not opted in; reputation not minted");
            continue;
        }
        if (account->second.reputation_earned != 0) {
            // Minted by an earlier attempt whose local record was lost.
            if (store_->record_reputation(project_id, score.member, account->second.reputation_earned)) {
                result.minted.emplace(score.member, account->second.reputation_earned);
            }
            continue;
        }
        if (!state->finalized) {
            result.warnings.push_back("ledger not finalized; run retry_ledger_sync before minting for " +
                                      score.member);
            continue;
        }

        auto operation = make_operation(ledger::OperationKind::MintReputation, project);
        operation.target = score.member;
        operation.value = amount;
        const auto receipt = submit(std::move(operation));
        if (!receipt.confirmed()) {
            result.warnings.push_back("minting for " + score.member + " failed: " + receipt.message);
            continue;
        }
        if (store_->record_reputation(project_id, score.member, amount)) {
            result.minted.emplace(score.member, amount);
            logger().info("reputation.minted",
                          {{"project_id", std::to_string(project_id)},
                           {"member", score.member},
                           {"amount", std::to_string(amount)},
                           {"txid", receipt.txid}});
        }
    }

    result.decision = Decision::accept();
    return result;
}

std::vector<LeaderboardEntry> ProjectLifecycle::leaderboard(ProjectId project_id) const {
    require_project(project_id);
    auto scores = store_->final_scores(project_id);
    std::sort(scores.begin(), scores.end(), [](const FinalScore& lhs, const FinalScore& rhs) {
        if (lhs.scores.final_score != rhs.scores.final_score) {
            return lhs.scores.final_score > rhs.scores.final_score;
        }
        return lhs.member < rhs.member;
    });

    std::vector<LeaderboardEntry> entries;
    entries.reserve(scores.size());
    for (std::size_t i = 0; i < scores.size(); ++i) {
        LeaderboardEntry entry;
        entry.rank = i + 1;
        entry.member = scores[i].member;
        entry.scores = scores[i].scores;
        entry.tier = scoring::reputation_tier_for(scores[i].scores.final_score);
        entry.reputation_minted = scores[i].reputation_minted;
        entries.push_back(std::move(entry));
    }
    return entries;
}

ScoreVerification ProjectLifecycle::verify_member_score(ProjectId project_id, const Identity& member) {
    const auto project = require_project(project_id);
    const auto scores = store_->final_scores(project_id);
    const auto it = std::find_if(scores.begin(), scores.end(), [&](const FinalScore& score) {
        return score.member == member;
    });
    if (it == scores.end()) {
        throw NotFoundError("E_SCORE_NOT_FOUND", "No final score for " + member + " in project " +
                                                     std::to_string(project_id));
    }

    ScoreVerification verification;
    verification.recomputed = scoring::commitment_hex(it->scores);
    verification.stored = it->commitment;
    verification.stored_match = scoring::verify_commitment(it->scores, it->commitment);

    if (ledger_ && project.ledger_app_id) {
        if (const auto state = ledger_->read_state(*project.ledger_app_id)) {
            if (const auto anchored = state->commitments.find(member); anchored != state->commitments.end()) {
                verification.anchored = anchored->second;
                verification.ledger_match = scoring::verify_commitment(it->scores, anchored->second);
            }
        }
    }

    logger().info("score.verified",
                  {{"project_id", std::to_string(project_id)},
                   {"member", member},
                   {"final", format_score(it->scores.final_score)},
                   {"verified", verification.verified() ? "true" : "false"}});
    return verification;
}

ProjectPhase ProjectLifecycle::phase(ProjectId project_id, Timestamp now) const {
    const auto project = require_project(project_id);
    if (project.status == ProjectStatus::Finalized) {
        return ProjectPhase::Finalized;
    }
    if (now >= project.deadline_voting) {
        return ProjectPhase::Closed;
    }
    if (now >= project.deadline_contribution) {
        return ProjectPhase::Voting;
    }
    return project.status == ProjectStatus::Draft ? ProjectPhase::Draft : ProjectPhase::Active;
}

Project ProjectLifecycle::project(ProjectId project_id) const {
    return require_project(project_id);
}

ProjectLifecycle::ProjectRules ProjectLifecycle::rules(ProjectId project_id) {
    require_project(project_id);
    return ProjectRules(*this, project_id);
}

std::mutex& ProjectLifecycle::project_mutex(ProjectId project_id) {
    std::scoped_lock lock(locks_mutex_);
    auto& slot = project_locks_[project_id];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

Project ProjectLifecycle::require_project(ProjectId project_id) const {
    auto project = store_->project(project_id);
    if (!project) {
        throw NotFoundError("E_PROJECT_NOT_FOUND", "Unknown project " + std::to_string(project_id));
    }
    return *project;
}

ledger::LedgerOperation ProjectLifecycle::make_operation(ledger::OperationKind kind, const Project& project) const {
    ledger::LedgerOperation operation;
    operation.kind = kind;
    operation.app_id = project.ledger_app_id.value_or(0);
    operation.sender = config_.ledger_account;
    return operation;
}

ledger::LedgerReceipt ProjectLifecycle::submit(ledger::LedgerOperation operation) {
    ledger::sign_operation(operation, config_.ledger_signing_key);
    const auto kind = std::string(ledger::operation_kind_to_string(operation.kind));
    auto receipt = ledger_->submit(operation);
    if (receipt.confirmed()) {
        logger().info("ledger.submitted", {{"kind", kind}, {"txid", receipt.txid}});
    } else {
        logger().warning("ledger.submit_failed",
                         {{"kind", kind},
                          {"status", receipt.status == ledger::ReceiptStatus::Rejected ? "rejected" : "unavailable"},
                          {"reason", std::string(reject_reason_to_string(receipt.reason))}});
    }
    return receipt;
}

ProjectLifecycle::ProjectRules::ProjectRules(ProjectLifecycle& lifecycle, ProjectId project_id)
    : lifecycle_(lifecycle), project_id_(project_id) {}

Decision ProjectLifecycle::ProjectRules::cast_vote(const Identity& voter,
                                                   const Identity& target,
                                                   int score,
                                                   Timestamp now) {
    try {
        return lifecycle_.submit_vote(project_id_, voter, target, score, now);
    } catch (const ValidationError& ex) {
        return Decision::reject(RejectReason::InvalidScore, ex.message());
    }
}

bool ProjectLifecycle::ProjectRules::has_voted_for(const Identity& voter, const Identity& target) const {
    const auto votes = lifecycle_.store_->votes(project_id_);
    return std::any_of(votes.begin(), votes.end(), [&](const Vote& vote) {
        return vote.voter == voter && vote.target == target;
    });
}

std::size_t ProjectLifecycle::ProjectRules::recorded_votes() const {
    return lifecycle_.store_->votes(project_id_).size();
}

Decision ProjectLifecycle::ProjectRules::finalize(const Identity& sender, Timestamp now) {
    return lifecycle_.finalize(project_id_, sender, now).decision;
}

bool ProjectLifecycle::ProjectRules::finalized() const {
    return lifecycle_.project(project_id_).status == ProjectStatus::Finalized;
}

}  // namespace trustchain
