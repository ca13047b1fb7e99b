#pragma once

#include "trustchain/Types.hpp"
#include "trustchain/scoring/Scoring.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace trustchain {

enum class ProjectStatus {
    Draft,
    Active,
    Voting,
    Finalized
};

std::string_view project_status_to_string(ProjectStatus status);

// Derived display phase; Closed means the voting deadline passed without finalization.
enum class ProjectPhase {
    Draft,
    Active,
    Voting,
    Closed,
    Finalized
};

std::string_view project_phase_to_string(ProjectPhase phase);

enum class MemberRole {
    Owner,
    Member
};

std::string_view member_role_to_string(MemberRole role);

struct Project {
    ProjectId id{0};
    std::string name;
    std::string repository;
    Identity creator;
    scoring::Weights weights{};
    Timestamp deadline_contribution{};
    Timestamp deadline_voting{};
    ProjectStatus status{ProjectStatus::Draft};
    std::optional<AppId> ledger_app_id;
    std::optional<std::string> ledger_address;
    bool ledger_finalized{false};
    Timestamp created_at{};
};

struct Member {
    ProjectId project{0};
    Identity identity;
    MemberRole role{MemberRole::Member};
    // Commit author emails or names attributed to this member.
    std::vector<std::string> aliases;
    bool ledger_opted_in{false};
};

struct ActivitySummary {
    ProjectId project{0};
    Identity member;
    scoring::ActivityStats stats{};
    double code_score{0.0};
    double time_score{0.0};
    Timestamp analyzed_at{};
};

struct Vote {
    ProjectId project{0};
    Identity voter;
    Identity target;
    int score{0};
    Timestamp cast_at{};
};

struct FinalScore {
    ProjectId project{0};
    Identity member;
    scoring::ComponentScores scores{};
    std::string commitment;
    std::optional<std::int64_t> reputation_minted;
    bool ledger_anchored{false};
    Timestamp finalized_at{};
};

}  // namespace trustchain
