#include "trustchain/core/Errors.hpp"

namespace trustchain {

std::string_view reject_reason_to_string(RejectReason reason) {
    switch (reason) {
        case RejectReason::None:
            return "none";
        case RejectReason::DuplicateVote:
            return "duplicate_vote";
        case RejectReason::SelfVote:
            return "self_vote";
        case RejectReason::VoterNotMember:
            return "voter_not_member";
        case RejectReason::TargetNotMember:
            return "target_not_member";
        case RejectReason::VotingNotOpen:
            return "voting_not_open";
        case RejectReason::VotingClosed:
            return "voting_closed";
        case RejectReason::InvalidScore:
            return "invalid_score";
        case RejectReason::NotCreator:
            return "not_creator";
        case RejectReason::BeforeVotingDeadline:
            return "before_voting_deadline";
        case RejectReason::AlreadyFinalized:
            return "already_finalized";
        case RejectReason::NotFinalized:
            return "not_finalized";
        case RejectReason::AlreadyMinted:
            return "already_minted";
        case RejectReason::AlreadyAnchored:
            return "already_anchored";
        case RejectReason::AlreadyMember:
            return "already_member";
        case RejectReason::RegistrationClosed:
            return "registration_closed";
        case RejectReason::InvalidAmount:
            return "invalid_amount";
        case RejectReason::UnknownApplication:
            return "unknown_application";
        case RejectReason::Unauthorized:
            return "unauthorized";
        case RejectReason::BadSignature:
            return "bad_signature";
        case RejectReason::Unsupported:
            return "unsupported";
        case RejectReason::LedgerUnavailable:
            return "ledger_unavailable";
    }
    return "none";
}

}  // namespace trustchain
