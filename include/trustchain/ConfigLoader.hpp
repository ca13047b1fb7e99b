#pragma once

#include "trustchain/Config.hpp"
#include "trustchain/util/Json.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace trustchain {

using EnvironmentLookup = std::function<std::optional<std::string>(const char*)>;

// Parses a JSON document, or the YAML subset (two-space indentation, mappings,
// sequences, scalars) when the text does not start with '{'.
json::Value parse_config_text(std::string_view text, bool force_json = false);

// Applies the base document, then the selected profile (argument first, then the
// document's top-level "profile" key) resolved through its "extends" chain.
Config config_from_document(const json::Value& document, const std::optional<std::string>& profile = std::nullopt);

// TRUSTCHAIN_LEDGER_ENDPOINT, TRUSTCHAIN_LEDGER_TOKEN, TRUSTCHAIN_LEDGER_KEY.
void apply_environment_overrides(Config& config, const EnvironmentLookup& lookup = {});

// Throws ConfigError.
Config load_config_file(const std::filesystem::path& path, const std::optional<std::string>& profile = std::nullopt);

}  // namespace trustchain
