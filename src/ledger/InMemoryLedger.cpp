#include "trustchain/ledger/LedgerClient.hpp"

#include "trustchain/crypto/Sha256.hpp"
#include "trustchain/log/StructuredLogger.hpp"

#include <array>
#include <utility>

namespace trustchain::ledger {

namespace {

constexpr std::string_view kGenesis = "0000000000000000000000000000000000000000000000000000000000000000";

std::string chain_txid(const std::string& previous, std::uint64_t sequence, const LedgerOperation& operation) {
    crypto::Sha256 hasher;
    hasher.update(previous);
    std::array<std::uint8_t, 8> seq{};
    for (std::size_t i = 0; i < seq.size(); ++i) {
        seq[i] = static_cast<std::uint8_t>((sequence >> (56 - 8 * i)) & 0xFFu);
    }
    hasher.update(seq);
    const auto bytes = canonical_bytes(operation);
    hasher.update(bytes);
    hasher.update(operation.signature);
    return digest_to_string(hasher.finalize());
}

}  // namespace

InMemoryLedger::InMemoryLedger(ClockFn clock) : clock_(std::move(clock)) {}

void InMemoryLedger::register_account(const Identity& account, std::string key) {
    std::scoped_lock lock(mutex_);
    keys_[account] = std::move(key);
}

LedgerReceipt InMemoryLedger::submit(const LedgerOperation& operation) {
    std::scoped_lock lock(mutex_);

    const auto key = keys_.find(operation.sender);
    if (key == keys_.end()) {
        return reject(operation, RejectReason::Unauthorized, "unknown sender " + operation.sender);
    }
    if (!verify_operation(operation, key->second)) {
        return reject(operation, RejectReason::BadSignature, "signature does not match sender key");
    }

    LedgerReceipt receipt;
    if (operation.kind == OperationKind::Create) {
        const auto app_id = next_app_id_++;
        applications_.emplace(app_id, std::make_unique<LedgerContract>(app_id, operation));
        receipt.status = ReceiptStatus::Confirmed;
        receipt.app_id = app_id;
        receipt.txid = append_journal(operation);
        log::StructuredLogger::instance().info(
            "ledger.app_created",
            {{"app_id", std::to_string(app_id)}, {"project_id", std::to_string(operation.project_id)}});
        return receipt;
    }

    const auto app = applications_.find(operation.app_id);
    if (app == applications_.end()) {
        return reject(operation, RejectReason::UnknownApplication,
                      "no application " + std::to_string(operation.app_id));
    }

    const auto decision = app->second->apply(operation, now());
    if (!decision.accepted) {
        return reject(operation, decision.reason, decision.message);
    }
    receipt.status = ReceiptStatus::Confirmed;
    receipt.app_id = operation.app_id;
    receipt.txid = append_journal(operation);
    return receipt;
}

std::optional<LedgerState> InMemoryLedger::read_state(AppId app_id) {
    std::scoped_lock lock(mutex_);
    const auto it = applications_.find(app_id);
    if (it == applications_.end()) {
        return std::nullopt;
    }
    return it->second->state();
}

std::vector<InMemoryLedger::JournalEntry> InMemoryLedger::journal() const {
    std::scoped_lock lock(mutex_);
    return journal_;
}

bool InMemoryLedger::verify_journal() const {
    std::scoped_lock lock(mutex_);
    std::string previous(kGenesis);
    for (const auto& entry : journal_) {
        if (entry.previous != previous) {
            return false;
        }
        if (chain_txid(previous, entry.sequence, entry.operation) != entry.txid) {
            return false;
        }
        previous = entry.txid;
    }
    return true;
}

Timestamp InMemoryLedger::now() const {
    return clock_ ? clock_() : std::chrono::system_clock::now();
}

LedgerReceipt InMemoryLedger::reject(const LedgerOperation& operation, RejectReason reason, std::string message) {
    log::StructuredLogger::instance().warning(
        "ledger.rejected",
        {{"kind", std::string(operation_kind_to_string(operation.kind))},
         {"app_id", std::to_string(operation.app_id)},
         {"sender", operation.sender},
         {"reason", std::string(reject_reason_to_string(reason))}});
    LedgerReceipt receipt;
    receipt.status = ReceiptStatus::Rejected;
    receipt.app_id = operation.app_id;
    receipt.reason = reason;
    receipt.message = std::move(message);
    return receipt;
}

std::string InMemoryLedger::append_journal(const LedgerOperation& operation) {
    JournalEntry entry;
    entry.sequence = journal_.size();
    entry.previous = journal_.empty() ? std::string(kGenesis) : journal_.back().txid;
    entry.operation = operation;
    entry.txid = chain_txid(entry.previous, entry.sequence, operation);
    journal_.push_back(entry);
    return entry.txid;
}

}  // namespace trustchain::ledger
