#pragma once

#include <exception>
#include <string>
#include <string_view>
#include <utility>

namespace trustchain {

class Error : public std::exception {
public:
    Error(std::string code, std::string message, std::string hint = {})
        : code_(std::move(code)), message_(std::move(message)), hint_(std::move(hint)) {
        formatted_ = code_.empty() ? message_ : ("[" + code_ + "] " + message_);
    }

    const char* what() const noexcept override {
        return formatted_.c_str();
    }

    const std::string& code() const& {
        return code_;
    }

    const std::string& message() const& {
        return message_;
    }

    const std::string& hint() const& {
        return hint_;
    }

private:
    std::string code_;
    std::string message_;
    std::string hint_;
    std::string formatted_;
};

// Malformed input: weights, vote score range, deadline ordering.
class ValidationError : public Error {
public:
    using Error::Error;
};

class NotFoundError : public Error {
public:
    using Error::Error;
};

// Collaborator outage that the caller may retry.
class HistoryUnavailable : public Error {
public:
    using Error::Error;
};

class ConfigError : public Error {
public:
    using Error::Error;
};

enum class RejectReason {
    None,
    DuplicateVote,
    SelfVote,
    VoterNotMember,
    TargetNotMember,
    VotingNotOpen,
    VotingClosed,
    InvalidScore,
    NotCreator,
    BeforeVotingDeadline,
    AlreadyFinalized,
    NotFinalized,
    AlreadyMinted,
    AlreadyAnchored,
    AlreadyMember,
    RegistrationClosed,
    InvalidAmount,
    UnknownApplication,
    Unauthorized,
    BadSignature,
    Unsupported,
    LedgerUnavailable
};

std::string_view reject_reason_to_string(RejectReason reason);

struct Decision {
    bool accepted{false};
    RejectReason reason{RejectReason::None};
    std::string message;

    static Decision accept() {
        return Decision{true, RejectReason::None, {}};
    }

    static Decision accept_with(RejectReason reason, std::string message) {
        return Decision{true, reason, std::move(message)};
    }

    static Decision reject(RejectReason reason, std::string message) {
        return Decision{false, reason, std::move(message)};
    }
};

}  // namespace trustchain
