#pragma once

#include "trustchain/Types.hpp"
#include "trustchain/core/Errors.hpp"
#include "trustchain/util/Json.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace trustchain::ledger {

enum class OperationKind {
    Create,
    OptIn,
    Vote,
    AnchorCommitment,
    Finalize,
    MintReputation,
    Update,
    Delete,
    CloseOut
};

std::string_view operation_kind_to_string(OperationKind kind);
std::optional<OperationKind> operation_kind_from_string(std::string_view text);

struct LedgerOperation {
    OperationKind kind{OperationKind::Create};
    AppId app_id{0};
    Identity sender;

    // Create arguments. Deadlines are unix seconds, weights integer percent.
    std::uint64_t project_id{0};
    std::int64_t deadline_contribution{0};
    std::int64_t deadline_voting{0};
    std::uint32_t weight_code{0};
    std::uint32_t weight_time{0};
    std::uint32_t weight_vote{0};
    std::uint64_t reputation_asset_id{0};

    // Vote target, anchored member or mint recipient.
    Identity target;
    // Vote score or minted amount.
    std::int64_t value{0};
    std::string commitment;

    // Hex HMAC-SHA256 over canonical_bytes() with the sender's ledger key.
    std::string signature;
};

std::vector<std::uint8_t> canonical_bytes(const LedgerOperation& operation);
void sign_operation(LedgerOperation& operation, std::string_view key);
bool verify_operation(const LedgerOperation& operation, std::string_view key);

json::Value operation_to_json(const LedgerOperation& operation);
std::optional<LedgerOperation> operation_from_json(const json::Value& value);

enum class ReceiptStatus {
    Confirmed,
    Rejected,
    Unavailable
};

struct LedgerReceipt {
    ReceiptStatus status{ReceiptStatus::Unavailable};
    std::string txid;
    AppId app_id{0};
    RejectReason reason{RejectReason::None};
    std::string message;

    bool confirmed() const noexcept { return status == ReceiptStatus::Confirmed; }
};

struct AccountState {
    bool has_voted{false};
    std::int64_t vote_score{0};
    Identity vote_target;
    std::int64_t reputation_earned{0};
};

struct LedgerState {
    AppId app_id{0};
    std::uint64_t project_id{0};
    Identity creator;
    std::int64_t deadline_contribution{0};
    std::int64_t deadline_voting{0};
    std::uint32_t weight_code{0};
    std::uint32_t weight_time{0};
    std::uint32_t weight_vote{0};
    std::uint64_t reputation_asset_id{0};
    bool finalized{false};
    std::map<Identity, AccountState> accounts;
    std::map<Identity, std::string> commitments;
};

json::Value state_to_json(const LedgerState& state);
std::optional<LedgerState> state_from_json(const json::Value& value);

// Deterministic address derived from the application id.
std::string application_address(AppId app_id);

}  // namespace trustchain::ledger
