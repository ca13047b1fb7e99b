#include "trustchain/storage/ProjectStore.hpp"

#include <algorithm>

namespace trustchain::storage {

ProjectId MemoryProjectStore::next_project_id() {
    std::scoped_lock lock(mutex_);
    return next_id_++;
}

void MemoryProjectStore::insert_project(const Project& project) {
    std::scoped_lock lock(mutex_);
    projects_.insert_or_assign(project.id, project);
    next_id_ = std::max(next_id_, project.id + 1);
}

std::optional<Project> MemoryProjectStore::project(ProjectId id) const {
    std::scoped_lock lock(mutex_);
    const auto it = projects_.find(id);
    if (it == projects_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Project> MemoryProjectStore::projects() const {
    std::scoped_lock lock(mutex_);
    std::vector<Project> result;
    result.reserve(projects_.size());
    for (const auto& [id, project] : projects_) {
        result.push_back(project);
    }
    return result;
}

void MemoryProjectStore::update_project(const Project& project) {
    std::scoped_lock lock(mutex_);
    const auto it = projects_.find(project.id);
    if (it != projects_.end()) {
        it->second = project;
    }
}

bool MemoryProjectStore::delete_project(ProjectId id) {
    std::scoped_lock lock(mutex_);
    if (projects_.erase(id) == 0) {
        return false;
    }
    std::erase_if(members_, [id](const auto& entry) { return entry.first.first == id; });
    std::erase_if(final_scores_, [id](const auto& entry) { return entry.first.first == id; });
    std::erase_if(votes_, [id](const auto& entry) { return std::get<0>(entry.first) == id; });
    summaries_.erase(id);
    return true;
}

bool MemoryProjectStore::insert_member(const Member& member) {
    std::scoped_lock lock(mutex_);
    return members_.emplace(MemberKey{member.project, member.identity}, member).second;
}

std::optional<Member> MemoryProjectStore::member(ProjectId project, const Identity& identity) const {
    std::scoped_lock lock(mutex_);
    const auto it = members_.find(MemberKey{project, identity});
    if (it == members_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Member> MemoryProjectStore::members(ProjectId project) const {
    std::scoped_lock lock(mutex_);
    std::vector<Member> result;
    for (auto it = members_.lower_bound(MemberKey{project, Identity{}});
         it != members_.end() && it->first.first == project;
         ++it) {
        result.push_back(it->second);
    }
    return result;
}

bool MemoryProjectStore::set_member_opted_in(ProjectId project, const Identity& identity) {
    std::scoped_lock lock(mutex_);
    const auto it = members_.find(MemberKey{project, identity});
    if (it == members_.end()) {
        return false;
    }
    it->second.ledger_opted_in = true;
    return true;
}

void MemoryProjectStore::replace_summaries(ProjectId project, const std::vector<ActivitySummary>& summaries) {
    std::scoped_lock lock(mutex_);
    summaries_[project] = summaries;
}

std::vector<ActivitySummary> MemoryProjectStore::summaries(ProjectId project) const {
    std::scoped_lock lock(mutex_);
    const auto it = summaries_.find(project);
    if (it == summaries_.end()) {
        return {};
    }
    return it->second;
}

bool MemoryProjectStore::insert_vote(const Vote& vote) {
    std::scoped_lock lock(mutex_);
    return votes_.emplace(VoteKey{vote.project, vote.voter, vote.target}, vote).second;
}

std::vector<Vote> MemoryProjectStore::votes(ProjectId project) const {
    std::scoped_lock lock(mutex_);
    std::vector<Vote> result;
    for (auto it = votes_.lower_bound(VoteKey{project, Identity{}, Identity{}});
         it != votes_.end() && std::get<0>(it->first) == project;
         ++it) {
        result.push_back(it->second);
    }
    return result;
}

bool MemoryProjectStore::commit_finalization(ProjectId project, const std::vector<FinalScore>& scores) {
    std::scoped_lock lock(mutex_);
    const auto it = projects_.find(project);
    if (it == projects_.end() || it->second.status == ProjectStatus::Finalized) {
        return false;
    }
    for (const auto& score : scores) {
        if (final_scores_.contains(MemberKey{project, score.member})) {
            return false;
        }
    }
    for (const auto& score : scores) {
        final_scores_.emplace(MemberKey{project, score.member}, score);
    }
    it->second.status = ProjectStatus::Finalized;
    return true;
}

std::vector<FinalScore> MemoryProjectStore::final_scores(ProjectId project) const {
    std::scoped_lock lock(mutex_);
    std::vector<FinalScore> result;
    for (auto it = final_scores_.lower_bound(MemberKey{project, Identity{}});
         it != final_scores_.end() && it->first.first == project;
         ++it) {
        result.push_back(it->second);
    }
    return result;
}

bool MemoryProjectStore::record_reputation(ProjectId project, const Identity& member, std::int64_t amount) {
    std::scoped_lock lock(mutex_);
    const auto it = final_scores_.find(MemberKey{project, member});
    if (it == final_scores_.end() || it->second.reputation_minted.has_value()) {
        return false;
    }
    it->second.reputation_minted = amount;
    return true;
}

bool MemoryProjectStore::mark_anchored(ProjectId project, const Identity& member) {
    std::scoped_lock lock(mutex_);
    const auto it = final_scores_.find(MemberKey{project, member});
    if (it == final_scores_.end()) {
        return false;
    }
    it->second.ledger_anchored = true;
    return true;
}

}  // namespace trustchain::storage
