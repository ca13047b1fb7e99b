#include "trustchain/Config.hpp"
#include "trustchain/ConfigLoader.hpp"
#include "trustchain/core/Errors.hpp"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>

using namespace trustchain;

namespace {

template <typename Fn>
std::string config_error_code(Fn&& fn) {
    try {
        fn();
    } catch (const ConfigError& ex) {
        return ex.code();
    }
    return {};
}

constexpr const char* kYaml = R"(# course defaults
scoring:
  weights:
    code: 0.5
    time: 0.25
    vote: 0.25
  tolerance: 0.02
analysis:
  window_days: 30
  git: "/usr/bin/git"
ledger:
  enabled: false
  account: 'course-owner'
  reputation_asset_id: 4242
  timeout_seconds: 20
logging:
  enabled: off
profiles:
  staging:
    ledger:
      enabled: true
      endpoint: https://ledger.staging.example
  production:
    extends: staging
    ledger:
      endpoint: https://ledger.example
      connect_timeout_seconds: 2
    scoring:
      weights:
        code: 0.4
        time: 0.3
        vote: 0.3
)";

}  // namespace

int main() {
    const auto defaults = config_from_document(parse_config_text("{}"));
    assert(defaults.default_weight_code == 0.4);
    assert(defaults.analysis_window == std::chrono::hours(24 * 90));
    assert(!defaults.ledger_enabled);
    assert(defaults.logging_enabled);

    const auto document = parse_config_text(kYaml);
    const auto base = config_from_document(document);
    assert(base.default_weight_code == 0.5);
    assert(base.default_weight_vote == 0.25);
    assert(std::abs(base.weight_tolerance - 0.02) < 1e-12);
    assert(base.analysis_window == std::chrono::hours(24 * 30));
    assert(base.git_executable == "/usr/bin/git");
    assert(base.ledger_account == "course-owner");
    assert(base.reputation_asset_id == 4242);
    assert(base.ledger_timeout == std::chrono::seconds(20));
    assert(!base.ledger_enabled);
    assert(!base.logging_enabled);

    const auto staging = config_from_document(document, std::string("staging"));
    assert(staging.ledger_enabled);
    assert(staging.ledger_endpoint == "https://ledger.staging.example");
    assert(staging.default_weight_code == 0.5);

    const auto production = config_from_document(document, std::string("production"));
    assert(production.ledger_enabled);
    assert(production.ledger_endpoint == "https://ledger.example");
    assert(production.ledger_connect_timeout == std::chrono::seconds(2));
    assert(production.default_weight_code == 0.4);
    assert(production.ledger_account == "course-owner");

    const auto selected = config_from_document(parse_config_text(
        R"({"profile":"local","profiles":{"local":{"analysis":{"window_days":7}}}})"));
    assert(selected.analysis_window == std::chrono::hours(24 * 7));

    assert(config_error_code([&] { config_from_document(document, std::string("qa")); }) == "E_CONFIG_PROFILE");
    assert(config_error_code([] {
               config_from_document(parse_config_text(
                   R"({"profiles":{"a":{"extends":"b"},"b":{"extends":"a"}}})"), std::string("a"));
           }) == "E_CONFIG_PROFILE");
    assert(config_error_code([] { parse_config_text("{\"scoring\": "); }) == "E_CONFIG_PARSE");
    assert(config_error_code([] { parse_config_text("scoring:\n   weights: 1\n"); }) == "E_CONFIG_PARSE");
    assert(config_error_code([] { parse_config_text("just a sentence\n"); }) == "E_CONFIG_PARSE");
    assert(config_error_code([] {
               config_from_document(parse_config_text("ledger:\n  enabled: maybe\n"));
           }) == "E_CONFIG_TYPE");
    assert(config_error_code([] {
               config_from_document(parse_config_text("analysis:\n  window_days: 2.5\n"));
           }) == "E_CONFIG_TYPE");
    assert(config_error_code([] {
               config_from_document(parse_config_text("analysis:\n  window_days: 0\n"));
           }) == "E_CONFIG_VALUE");
    assert(config_error_code([] {
               config_from_document(parse_config_text("scoring:\n  weights:\n    code: 0.9\n"));
           }) == "E_CONFIG_VALUE");

    std::map<std::string, std::string> environment{
        {"TRUSTCHAIN_LEDGER_ENDPOINT", "http://127.0.0.1:8700"},
        {"TRUSTCHAIN_LEDGER_KEY", "from-env"},
    };
    Config overridden;
    apply_environment_overrides(overridden, [&](const char* name) -> std::optional<std::string> {
        const auto it = environment.find(name);
        if (it == environment.end()) {
            return std::nullopt;
        }
        return it->second;
    });
    assert(overridden.ledger_enabled);
    assert(overridden.ledger_endpoint == "http://127.0.0.1:8700");
    assert(overridden.ledger_signing_key == "from-env");
    assert(!overridden.ledger_token.has_value());

    const auto directory = std::filesystem::temp_directory_path() / "trustchain-config-test";
    std::filesystem::create_directories(directory);
    const auto json_path = directory / "settings.json";
    {
        std::ofstream out(json_path);
        out << R"({"scoring":{"weights":{"code":0.6,"time":0.2,"vote":0.2}},"logging":{"enabled":true}})";
    }
    const auto loaded = load_config_file(json_path);
    assert(loaded.default_weight_code == 0.6);

    const auto yaml_path = directory / "settings.yaml";
    {
        std::ofstream out(yaml_path);
        out << kYaml;
    }
    const auto from_yaml = load_config_file(yaml_path, std::string("production"));
    assert(from_yaml.default_weight_code == 0.4);
    assert(from_yaml.ledger_connect_timeout == std::chrono::seconds(2));

    assert(config_error_code([&] { load_config_file(directory / "missing.yaml"); }) == "E_CONFIG_NOT_FOUND");
    std::filesystem::remove_all(directory);
    return 0;
}
