#pragma once

#include "trustchain/core/Project.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <tuple>
#include <utility>
#include <vector>

namespace trustchain::storage {

// Persisted lifecycle state. Every mutating call is atomic on its own; uniqueness
// constraints are checked and applied under the same lock.
class ProjectStore {
public:
    virtual ~ProjectStore() = default;

    virtual ProjectId next_project_id() = 0;
    virtual void insert_project(const Project& project) = 0;
    virtual std::optional<Project> project(ProjectId id) const = 0;
    virtual std::vector<Project> projects() const = 0;
    virtual void update_project(const Project& project) = 0;
    // Cascades to members, summaries, votes and final scores.
    virtual bool delete_project(ProjectId id) = 0;

    // false when (project, identity) already exists.
    virtual bool insert_member(const Member& member) = 0;
    virtual std::optional<Member> member(ProjectId project, const Identity& identity) const = 0;
    virtual std::vector<Member> members(ProjectId project) const = 0;
    virtual bool set_member_opted_in(ProjectId project, const Identity& identity) = 0;

    // Replaces every summary of the project at once.
    virtual void replace_summaries(ProjectId project, const std::vector<ActivitySummary>& summaries) = 0;
    virtual std::vector<ActivitySummary> summaries(ProjectId project) const = 0;

    // false when (project, voter, target) already exists.
    virtual bool insert_vote(const Vote& vote) = 0;
    virtual std::vector<Vote> votes(ProjectId project) const = 0;

    // Inserts all rows and marks the project finalized in one step. false when the
    // project is already finalized or already holds final scores.
    virtual bool commit_finalization(ProjectId project, const std::vector<FinalScore>& scores) = 0;
    virtual std::vector<FinalScore> final_scores(ProjectId project) const = 0;
    // Records the minted amount once; false when an amount is already present.
    virtual bool record_reputation(ProjectId project, const Identity& member, std::int64_t amount) = 0;
    virtual bool mark_anchored(ProjectId project, const Identity& member) = 0;
};

class MemoryProjectStore : public ProjectStore {
public:
    ProjectId next_project_id() override;
    void insert_project(const Project& project) override;
    std::optional<Project> project(ProjectId id) const override;
    std::vector<Project> projects() const override;
    void update_project(const Project& project) override;
    bool delete_project(ProjectId id) override;

    bool insert_member(const Member& member) override;
    std::optional<Member> member(ProjectId project, const Identity& identity) const override;
    std::vector<Member> members(ProjectId project) const override;
    bool set_member_opted_in(ProjectId project, const Identity& identity) override;

    void replace_summaries(ProjectId project, const std::vector<ActivitySummary>& summaries) override;
    std::vector<ActivitySummary> summaries(ProjectId project) const override;

    bool insert_vote(const Vote& vote) override;
    std::vector<Vote> votes(ProjectId project) const override;

    bool commit_finalization(ProjectId project, const std::vector<FinalScore>& scores) override;
    std::vector<FinalScore> final_scores(ProjectId project) const override;
    bool record_reputation(ProjectId project, const Identity& member, std::int64_t amount) override;
    bool mark_anchored(ProjectId project, const Identity& member) override;

private:
    using MemberKey = std::pair<ProjectId, Identity>;
    using VoteKey = std::tuple<ProjectId, Identity, Identity>;

    ProjectId next_id_{1};
    std::map<ProjectId, Project> projects_;
    std::map<MemberKey, Member> members_;
    std::map<ProjectId, std::vector<ActivitySummary>> summaries_;
    std::map<VoteKey, Vote> votes_;
    std::map<MemberKey, FinalScore> final_scores_;
    mutable std::mutex mutex_;
};

}  // namespace trustchain::storage
