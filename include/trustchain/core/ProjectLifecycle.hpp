#pragma once

#include "trustchain/Config.hpp"
#include "trustchain/core/MirrorHook.hpp"
#include "trustchain/core/Project.hpp"
#include "trustchain/core/Rules.hpp"
#include "trustchain/history/HistoryProvider.hpp"
#include "trustchain/ledger/LedgerClient.hpp"
#include "trustchain/scoring/ReputationTier.hpp"
#include "trustchain/storage/ProjectStore.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace trustchain {

struct CreateProjectRequest {
    std::string name;
    std::string repository;
    Identity creator;
    std::optional<scoring::Weights> weights;
    Timestamp deadline_contribution{};
    Timestamp deadline_voting{};
    std::vector<Identity> members;
};

enum class LedgerSyncStatus {
    NotConfigured,
    Synced,
    Pending
};

std::string_view ledger_sync_status_to_string(LedgerSyncStatus status);

struct AnalysisReport {
    Decision decision;
    scoring::AnalysisWindow window{};
    std::size_t commits_read{0};
    std::vector<ActivitySummary> summaries;
    // Commit authors that matched no member; they still count towards the cohort.
    std::vector<std::string> unmatched_authors;
};

struct FinalizeResult {
    Decision decision;
    // Rows created by this call; empty on a repeat.
    std::vector<FinalScore> scores;
    LedgerSyncStatus ledger{LedgerSyncStatus::NotConfigured};
    std::vector<std::string> warnings;
};

struct MintResult {
    Decision decision;
    std::map<Identity, std::int64_t> minted;
    std::vector<std::string> warnings;
};

struct LeaderboardEntry {
    std::size_t rank{0};
    Identity member;
    scoring::ComponentScores scores{};
    scoring::ReputationTier tier{scoring::ReputationTier::None};
    std::optional<std::int64_t> reputation_minted;
};

struct ScoreVerification {
    std::string recomputed;
    std::string stored;
    std::optional<std::string> anchored;
    bool stored_match{false};
    std::optional<bool> ledger_match;

    bool verified() const noexcept { return stored_match && ledger_match.value_or(true); }
};

// Drives a project from creation to finalization. Mutations of one project are
// serialized by a per-project mutex; different projects never share a lock.
class ProjectLifecycle {
public:
    ProjectLifecycle(Config config,
                     std::shared_ptr<storage::ProjectStore> store,
                     std::shared_ptr<history::HistoryProvider> history,
                     std::shared_ptr<ledger::LedgerClient> ledger = nullptr,
                     std::shared_ptr<MirrorHook> mirror = nullptr);

    // Throws ValidationError for bad weights or deadline order.
    Project create_project(const CreateProjectRequest& request, Timestamp now);
    Decision deploy_contract(ProjectId project_id, const Identity& sender, Timestamp now);
    Decision add_member(ProjectId project_id,
                        const Identity& sender,
                        const Identity& identity,
                        std::vector<std::string> aliases,
                        Timestamp now);
    // Forwards a member-signed opt-in to the project's application.
    Decision ledger_opt_in(ProjectId project_id, const ledger::LedgerOperation& signed_opt_in);

    // Throws HistoryUnavailable; stored summaries stay untouched in that case.
    AnalysisReport analyze(ProjectId project_id,
                           const Identity& sender,
                           Timestamp now,
                           std::optional<Timestamp> since = std::nullopt);

    // Throws ValidationError when the score is outside 1..5.
    Decision submit_vote(ProjectId project_id, const Identity& voter, const Identity& target, int score, Timestamp now);

    FinalizeResult finalize(ProjectId project_id, const Identity& sender, Timestamp now);
    LedgerSyncStatus retry_ledger_sync(ProjectId project_id, Timestamp now);
    MintResult mint_reputation(ProjectId project_id, const Identity& sender);

    std::vector<LeaderboardEntry> leaderboard(ProjectId project_id) const;
    ScoreVerification verify_member_score(ProjectId project_id, const Identity& member);
    ProjectPhase phase(ProjectId project_id, Timestamp now) const;

    // Throws NotFoundError.
    Project project(ProjectId project_id) const;

    // Rule view of a single project, acting through this lifecycle.
    class ProjectRules : public VotingRules, public FinalizationRules {
    public:
        ProjectRules(ProjectLifecycle& lifecycle, ProjectId project_id);

        Decision cast_vote(const Identity& voter, const Identity& target, int score, Timestamp now) override;
        bool has_voted_for(const Identity& voter, const Identity& target) const override;
        std::size_t recorded_votes() const override;
        Decision finalize(const Identity& sender, Timestamp now) override;
        bool finalized() const override;

    private:
        ProjectLifecycle& lifecycle_;
        ProjectId project_id_;
    };

    ProjectRules rules(ProjectId project_id);

private:
    std::mutex& project_mutex(ProjectId project_id);
    Project require_project(ProjectId project_id) const;
    std::optional<Identity> match_member(const std::string& author, const std::vector<Member>& members) const;

    Decision deploy_locked(Project& project);
    LedgerSyncStatus sync_ledger_locked(const Project& project, Timestamp now, std::vector<std::string>& warnings);
    ledger::LedgerOperation make_operation(ledger::OperationKind kind, const Project& project) const;
    ledger::LedgerReceipt submit(ledger::LedgerOperation operation);

    template <typename Fn>
    void mirror(const char* what, Fn&& fn);

    Config config_;
    std::shared_ptr<storage::ProjectStore> store_;
    std::shared_ptr<history::HistoryProvider> history_;
    std::shared_ptr<ledger::LedgerClient> ledger_;
    std::shared_ptr<MirrorHook> mirror_;

    std::mutex locks_mutex_;
    std::map<ProjectId, std::unique_ptr<std::mutex>> project_locks_;
};

}  // namespace trustchain
