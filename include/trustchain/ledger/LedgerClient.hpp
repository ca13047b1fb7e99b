#pragma once

#include "trustchain/Config.hpp"
#include "trustchain/ledger/LedgerContract.hpp"
#include "trustchain/ledger/Operation.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace trustchain::ledger {

class LedgerClient {
public:
    virtual ~LedgerClient() = default;

    // Never throws for transport problems; they come back as ReceiptStatus::Unavailable.
    virtual LedgerReceipt submit(const LedgerOperation& operation) = 0;

    // std::nullopt when the application is unknown or the ledger cannot be reached.
    virtual std::optional<LedgerState> read_state(AppId app_id) = 0;
};

// Sequenced in-process ledger. Every submitted operation is authenticated against the
// sender's registered key, executed against its application contract under a single
// total order, and confirmed operations are appended to a hash-chained journal.
class InMemoryLedger : public LedgerClient {
public:
    using ClockFn = std::function<Timestamp()>;

    struct JournalEntry {
        std::uint64_t sequence{0};
        std::string txid;
        std::string previous;
        LedgerOperation operation;
    };

    explicit InMemoryLedger(ClockFn clock = {});

    void register_account(const Identity& account, std::string key);

    LedgerReceipt submit(const LedgerOperation& operation) override;
    std::optional<LedgerState> read_state(AppId app_id) override;

    std::vector<JournalEntry> journal() const;
    // Recomputes the hash chain from the genesis entry.
    bool verify_journal() const;

private:
    Timestamp now() const;
    LedgerReceipt reject(const LedgerOperation& operation, RejectReason reason, std::string message);
    std::string append_journal(const LedgerOperation& operation);

    ClockFn clock_;
    std::map<Identity, std::string> keys_;
    std::map<AppId, std::unique_ptr<LedgerContract>> applications_;
    std::vector<JournalEntry> journal_;
    AppId next_app_id_{1001};
    mutable std::mutex mutex_;
};

// Gateway client: POST {endpoint}/v1/operations, GET {endpoint}/v1/apps/{id}.
class HttpLedgerClient : public LedgerClient {
public:
    explicit HttpLedgerClient(const Config& config);

    LedgerReceipt submit(const LedgerOperation& operation) override;
    std::optional<LedgerState> read_state(AppId app_id) override;

private:
    struct Response {
        long status{0};
        std::string body;
    };

    bool perform(const std::string& url, const std::string* post_body, Response& response, std::string& error) const;

    std::string endpoint_;
    std::optional<std::string> token_;
    long timeout_seconds_{10};
    long connect_timeout_seconds_{5};
};

// Gateway receipt encoding: {"status":"confirmed|rejected|unavailable","txid":...,"app_id":...,"reason":...,"message":...}
json::Value receipt_to_json(const LedgerReceipt& receipt);
std::optional<LedgerReceipt> receipt_from_json(const json::Value& value);

// Builds the ledger client selected by the configuration; nullptr when the ledger is disabled.
std::shared_ptr<LedgerClient> make_ledger_client(const Config& config);

}  // namespace trustchain::ledger
