#include "trustchain/ledger/LedgerClient.hpp"

#include "trustchain/log/StructuredLogger.hpp"

#include <curl/curl.h>

#include <utility>

namespace trustchain::ledger {

namespace {

size_t curl_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* buffer = static_cast<std::string*>(userdata);
    buffer->append(ptr, size * nmemb);
    return size * nmemb;
}

std::string_view receipt_status_to_string(ReceiptStatus status) {
    switch (status) {
        case ReceiptStatus::Confirmed:
            return "confirmed";
        case ReceiptStatus::Rejected:
            return "rejected";
        case ReceiptStatus::Unavailable:
            return "unavailable";
    }
    return "unavailable";
}

RejectReason reject_reason_from_string(std::string_view text) {
    for (int i = static_cast<int>(RejectReason::None); i <= static_cast<int>(RejectReason::LedgerUnavailable); ++i) {
        const auto reason = static_cast<RejectReason>(i);
        if (reject_reason_to_string(reason) == text) {
            return reason;
        }
    }
    return RejectReason::None;
}

LedgerReceipt unavailable(std::string message) {
    LedgerReceipt receipt;
    receipt.status = ReceiptStatus::Unavailable;
    receipt.reason = RejectReason::LedgerUnavailable;
    receipt.message = std::move(message);
    return receipt;
}

std::string trim_trailing_slash(std::string endpoint) {
    while (!endpoint.empty() && endpoint.back() == '/') {
        endpoint.pop_back();
    }
    return endpoint;
}

}  // namespace

json::Value receipt_to_json(const LedgerReceipt& receipt) {
    auto value = json::Value::make_object();
    auto& fields = value.as_object();
    fields["status"] = json::Value(std::string(receipt_status_to_string(receipt.status)));
    fields["txid"] = json::Value(receipt.txid);
    fields["app_id"] = json::Value(static_cast<std::int64_t>(receipt.app_id));
    fields["reason"] = json::Value(std::string(reject_reason_to_string(receipt.reason)));
    fields["message"] = json::Value(receipt.message);
    return value;
}

std::optional<LedgerReceipt> receipt_from_json(const json::Value& value) {
    if (!value.is_object()) {
        return std::nullopt;
    }
    const auto status = json::get_string(value, "status");
    if (!status) {
        return std::nullopt;
    }

    LedgerReceipt receipt;
    if (*status == "confirmed") {
        receipt.status = ReceiptStatus::Confirmed;
    } else if (*status == "rejected") {
        receipt.status = ReceiptStatus::Rejected;
    } else if (*status == "unavailable") {
        receipt.status = ReceiptStatus::Unavailable;
    } else {
        return std::nullopt;
    }
    receipt.txid = json::get_string(value, "txid").value_or(std::string{});
    receipt.app_id = static_cast<AppId>(json::get_int64(value, "app_id").value_or(0));
    receipt.reason = reject_reason_from_string(json::get_string(value, "reason").value_or(std::string{}));
    receipt.message = json::get_string(value, "message").value_or(std::string{});
    return receipt;
}

HttpLedgerClient::HttpLedgerClient(const Config& config)
    : endpoint_(trim_trailing_slash(config.ledger_endpoint)),
      token_(config.ledger_token),
      timeout_seconds_(static_cast<long>(config.ledger_timeout.count())),
      connect_timeout_seconds_(static_cast<long>(config.ledger_connect_timeout.count())) {}

LedgerReceipt HttpLedgerClient::submit(const LedgerOperation& operation) {
    const auto body = json::serialize(operation_to_json(operation));
    Response response;
    std::string error;
    if (!perform(endpoint_ + "/v1/operations", &body, response, error)) {
        log::StructuredLogger::instance().warning(
            "ledger.submit_failed",
            {{"kind", std::string(operation_kind_to_string(operation.kind))}, {"error", error}});
        return unavailable(error);
    }
    if (response.status >= 500) {
        log::StructuredLogger::instance().warning(
            "ledger.submit_failed",
            {{"kind", std::string(operation_kind_to_string(operation.kind))},
             {"http_status", std::to_string(response.status)}});
        return unavailable("HTTP status " + std::to_string(response.status));
    }

    try {
        if (auto receipt = receipt_from_json(json::parse(response.body))) {
            return *receipt;
        }
    } catch (const json::ParseError& ex) {
        log::StructuredLogger::instance().warning("ledger.bad_response", {{"error", ex.what()}});
        return unavailable(ex.what());
    }
    return unavailable("malformed receipt");
}

std::optional<LedgerState> HttpLedgerClient::read_state(AppId app_id) {
    Response response;
    std::string error;
    if (!perform(endpoint_ + "/v1/apps/" + std::to_string(app_id), nullptr, response, error)) {
        log::StructuredLogger::instance().warning(
            "ledger.read_failed", {{"app_id", std::to_string(app_id)}, {"error", error}});
        return std::nullopt;
    }
    if (response.status >= 400) {
        log::StructuredLogger::instance().warning(
            "ledger.read_failed",
            {{"app_id", std::to_string(app_id)}, {"http_status", std::to_string(response.status)}});
        return std::nullopt;
    }
    try {
        return state_from_json(json::parse(response.body));
    } catch (const json::ParseError& ex) {
        log::StructuredLogger::instance().warning("ledger.bad_response", {{"error", ex.what()}});
        return std::nullopt;
    }
}

bool HttpLedgerClient::perform(const std::string& url,
                               const std::string* post_body,
                               Response& response,
                               std::string& error) const {
    static bool curl_ready = [] {
        return curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
    }();
    if (!curl_ready) {
        error = "Unable to initialize libcurl";
        return false;
    }
    if (endpoint_.empty()) {
        error = "No ledger endpoint configured";
        return false;
    }
    CURL* curl = curl_easy_init();
    if (!curl) {
        error = "Unable to allocate curl handle";
        return false;
    }

    curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/json");
    if (post_body) {
        headers = curl_slist_append(headers, "Content-Type: application/json");
    }
    std::string authorization;
    if (token_) {
        authorization = "Authorization: Bearer " + *token_;
        headers = curl_slist_append(headers, authorization.c_str());
    }

    response.body.clear();
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, connect_timeout_seconds_);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "trustchain/1.0");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curl_write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    if (post_body) {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, post_body->c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(post_body->size()));
    }

    const CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
        error = curl_easy_strerror(rc);
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);
        return false;
    }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    return true;
}

std::shared_ptr<LedgerClient> make_ledger_client(const Config& config) {
    if (!config.ledger_enabled) {
        return nullptr;
    }
    if (config.ledger_endpoint.empty()) {
        auto ledger = std::make_shared<InMemoryLedger>();
        if (!config.ledger_account.empty()) {
            ledger->register_account(config.ledger_account, config.ledger_signing_key);
        }
        return ledger;
    }
    return std::make_shared<HttpLedgerClient>(config);
}

}  // namespace trustchain::ledger
