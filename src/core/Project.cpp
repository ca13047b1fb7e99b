#include "trustchain/core/Project.hpp"

namespace trustchain {

std::string_view project_status_to_string(ProjectStatus status) {
    switch (status) {
        case ProjectStatus::Draft:
            return "draft";
        case ProjectStatus::Active:
            return "active";
        case ProjectStatus::Voting:
            return "voting";
        case ProjectStatus::Finalized:
            return "finalized";
    }
    return "draft";
}

std::string_view project_phase_to_string(ProjectPhase phase) {
    switch (phase) {
        case ProjectPhase::Draft:
            return "draft";
        case ProjectPhase::Active:
            return "active";
        case ProjectPhase::Voting:
            return "voting";
        case ProjectPhase::Closed:
            return "closed";
        case ProjectPhase::Finalized:
            return "finalized";
    }
    return "draft";
}

std::string_view member_role_to_string(MemberRole role) {
    return role == MemberRole::Owner ? "owner" : "member";
}

}  // namespace trustchain
