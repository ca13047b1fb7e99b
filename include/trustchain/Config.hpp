#pragma once

#include "trustchain/Types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace trustchain {

struct Config {
    double default_weight_code{0.4};
    double default_weight_time{0.3};
    double default_weight_vote{0.3};
    double weight_tolerance{0.01};

    std::chrono::hours analysis_window{std::chrono::hours(24 * 90)};
    std::string git_executable{"git"};

    bool ledger_enabled{false};
    // Empty endpoint selects the in-process ledger supplied by the embedding application.
    std::string ledger_endpoint{};
    std::optional<std::string> ledger_token{};
    Identity ledger_account{};
    std::string ledger_signing_key{};
    std::uint64_t reputation_asset_id{0};
    std::chrono::seconds ledger_timeout{std::chrono::seconds(10)};
    std::chrono::seconds ledger_connect_timeout{std::chrono::seconds(5)};

    bool logging_enabled{true};
};

}  // namespace trustchain
