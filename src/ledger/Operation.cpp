#include "trustchain/ledger/Operation.hpp"

#include "trustchain/crypto/HmacSha256.hpp"
#include "trustchain/crypto/Sha256.hpp"

#include <array>

namespace trustchain::ledger {

namespace {

constexpr std::array<std::string_view, 9> kKindNames{
    "create", "opt_in", "vote", "anchor_commitment", "finalize", "mint_reputation", "update", "delete", "close_out"};

void append_be64(std::vector<std::uint8_t>& out, std::uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFFu));
    }
}

void append_length_prefixed(std::vector<std::uint8_t>& out, std::string_view text) {
    append_be64(out, static_cast<std::uint64_t>(text.size()));
    out.insert(out.end(), text.begin(), text.end());
}

std::int64_t int_or(const json::Value& object, std::string_view key, std::int64_t fallback = 0) {
    return json::get_int64(object, key).value_or(fallback);
}

std::string string_or(const json::Value& object, std::string_view key) {
    return json::get_string(object, key).value_or(std::string{});
}

}  // namespace

std::string_view operation_kind_to_string(OperationKind kind) {
    return kKindNames[static_cast<std::size_t>(kind)];
}

std::optional<OperationKind> operation_kind_from_string(std::string_view text) {
    for (std::size_t i = 0; i < kKindNames.size(); ++i) {
        if (kKindNames[i] == text) {
            return static_cast<OperationKind>(i);
        }
    }
    return std::nullopt;
}

std::vector<std::uint8_t> canonical_bytes(const LedgerOperation& operation) {
    std::vector<std::uint8_t> out;
    out.reserve(256);
    append_length_prefixed(out, "trustchain.op.v1");
    append_length_prefixed(out, operation_kind_to_string(operation.kind));
    append_be64(out, operation.app_id);
    append_length_prefixed(out, operation.sender);
    append_be64(out, operation.project_id);
    append_be64(out, static_cast<std::uint64_t>(operation.deadline_contribution));
    append_be64(out, static_cast<std::uint64_t>(operation.deadline_voting));
    append_be64(out, operation.weight_code);
    append_be64(out, operation.weight_time);
    append_be64(out, operation.weight_vote);
    append_be64(out, operation.reputation_asset_id);
    append_length_prefixed(out, operation.target);
    append_be64(out, static_cast<std::uint64_t>(operation.value));
    append_length_prefixed(out, operation.commitment);
    return out;
}

void sign_operation(LedgerOperation& operation, std::string_view key) {
    const auto bytes = canonical_bytes(operation);
    operation.signature = digest_to_string(crypto::HmacSha256::compute(key, bytes));
}

bool verify_operation(const LedgerOperation& operation, std::string_view key) {
    const auto mac = digest_from_string(operation.signature);
    if (!mac) {
        return false;
    }
    const auto bytes = canonical_bytes(operation);
    return crypto::HmacSha256::verify(key, bytes, *mac);
}

json::Value operation_to_json(const LedgerOperation& operation) {
    auto value = json::Value::make_object();
    auto& fields = value.as_object();
    fields["kind"] = json::Value(std::string(operation_kind_to_string(operation.kind)));
    fields["app_id"] = json::Value(static_cast<std::int64_t>(operation.app_id));
    fields["sender"] = json::Value(operation.sender);
    if (operation.kind == OperationKind::Create) {
        fields["project_id"] = json::Value(static_cast<std::int64_t>(operation.project_id));
        fields["deadline_contribution"] = json::Value(operation.deadline_contribution);
        fields["deadline_voting"] = json::Value(operation.deadline_voting);
        fields["weight_code"] = json::Value(static_cast<std::int64_t>(operation.weight_code));
        fields["weight_time"] = json::Value(static_cast<std::int64_t>(operation.weight_time));
        fields["weight_vote"] = json::Value(static_cast<std::int64_t>(operation.weight_vote));
        fields["reputation_asset_id"] = json::Value(static_cast<std::int64_t>(operation.reputation_asset_id));
    }
    if (!operation.target.empty()) {
        fields["target"] = json::Value(operation.target);
    }
    if (operation.value != 0) {
        fields["value"] = json::Value(operation.value);
    }
    if (!operation.commitment.empty()) {
        fields["commitment"] = json::Value(operation.commitment);
    }
    fields["signature"] = json::Value(operation.signature);
    return value;
}

std::optional<LedgerOperation> operation_from_json(const json::Value& value) {
    if (!value.is_object()) {
        return std::nullopt;
    }
    const auto kind_text = json::get_string(value, "kind");
    if (!kind_text) {
        return std::nullopt;
    }
    const auto kind = operation_kind_from_string(*kind_text);
    if (!kind) {
        return std::nullopt;
    }

    LedgerOperation operation;
    operation.kind = *kind;
    operation.app_id = static_cast<AppId>(int_or(value, "app_id"));
    operation.sender = string_or(value, "sender");
    operation.project_id = static_cast<std::uint64_t>(int_or(value, "project_id"));
    operation.deadline_contribution = int_or(value, "deadline_contribution");
    operation.deadline_voting = int_or(value, "deadline_voting");
    operation.weight_code = static_cast<std::uint32_t>(int_or(value, "weight_code"));
    operation.weight_time = static_cast<std::uint32_t>(int_or(value, "weight_time"));
    operation.weight_vote = static_cast<std::uint32_t>(int_or(value, "weight_vote"));
    operation.reputation_asset_id = static_cast<std::uint64_t>(int_or(value, "reputation_asset_id"));
    operation.target = string_or(value, "target");
    operation.value = int_or(value, "value");
    operation.commitment = string_or(value, "commitment");
    operation.signature = string_or(value, "signature");
    return operation;
}

json::Value state_to_json(const LedgerState& state) {
    auto value = json::Value::make_object();
    auto& fields = value.as_object();
    fields["app_id"] = json::Value(static_cast<std::int64_t>(state.app_id));
    fields["project_id"] = json::Value(static_cast<std::int64_t>(state.project_id));
    fields["creator"] = json::Value(state.creator);
    fields["deadline_contribution"] = json::Value(state.deadline_contribution);
    fields["deadline_voting"] = json::Value(state.deadline_voting);
    fields["weight_code"] = json::Value(static_cast<std::int64_t>(state.weight_code));
    fields["weight_time"] = json::Value(static_cast<std::int64_t>(state.weight_time));
    fields["weight_vote"] = json::Value(static_cast<std::int64_t>(state.weight_vote));
    fields["reputation_asset_id"] = json::Value(static_cast<std::int64_t>(state.reputation_asset_id));
    fields["finalized"] = json::Value(state.finalized);

    auto accounts = json::Value::make_object();
    for (const auto& [identity, account] : state.accounts) {
        auto entry = json::Value::make_object();
        entry.as_object()["has_voted"] = json::Value(account.has_voted);
        entry.as_object()["vote_score"] = json::Value(account.vote_score);
        entry.as_object()["vote_target"] = json::Value(account.vote_target);
        entry.as_object()["reputation_earned"] = json::Value(account.reputation_earned);
        accounts.as_object()[identity] = std::move(entry);
    }
    fields["accounts"] = std::move(accounts);

    auto commitments = json::Value::make_object();
    for (const auto& [identity, hash] : state.commitments) {
        commitments.as_object()[identity] = json::Value(hash);
    }
    fields["commitments"] = std::move(commitments);
    return value;
}

std::optional<LedgerState> state_from_json(const json::Value& value) {
    if (!value.is_object() || !json::get_int64(value, "app_id")) {
        return std::nullopt;
    }

    LedgerState state;
    state.app_id = static_cast<AppId>(int_or(value, "app_id"));
    state.project_id = static_cast<std::uint64_t>(int_or(value, "project_id"));
    state.creator = string_or(value, "creator");
    state.deadline_contribution = int_or(value, "deadline_contribution");
    state.deadline_voting = int_or(value, "deadline_voting");
    state.weight_code = static_cast<std::uint32_t>(int_or(value, "weight_code"));
    state.weight_time = static_cast<std::uint32_t>(int_or(value, "weight_time"));
    state.weight_vote = static_cast<std::uint32_t>(int_or(value, "weight_vote"));
    state.reputation_asset_id = static_cast<std::uint64_t>(int_or(value, "reputation_asset_id"));
    state.finalized = json::get_bool(value, "finalized").value_or(false);

    if (const auto* accounts = value.find("accounts")) {
        for (const auto& [identity, entry] : accounts->as_object()) {
            AccountState account;
            account.has_voted = json::get_bool(entry, "has_voted").value_or(false);
            account.vote_score = int_or(entry, "vote_score");
            account.vote_target = string_or(entry, "vote_target");
            account.reputation_earned = int_or(entry, "reputation_earned");
            state.accounts.emplace(identity, std::move(account));
        }
    }
    if (const auto* commitments = value.find("commitments")) {
        for (const auto& [identity, hash] : commitments->as_object()) {
            if (hash.is_string()) {
                state.commitments.emplace(identity, hash.string_value);
            }
        }
    }
    return state;
}

std::string application_address(AppId app_id) {
    std::vector<std::uint8_t> seed;
    append_length_prefixed(seed, "trustchain.app");
    append_be64(seed, app_id);
    return digest_to_string(crypto::Sha256::digest(seed));
}

}  // namespace trustchain::ledger
