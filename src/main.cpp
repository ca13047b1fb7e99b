#include "trustchain/Config.hpp"
#include "trustchain/ConfigLoader.hpp"
#include "trustchain/Types.hpp"
#include "trustchain/core/Errors.hpp"
#include "trustchain/history/HistoryProvider.hpp"
#include "trustchain/log/StructuredLogger.hpp"
#include "trustchain/scoring/ActivityAggregator.hpp"
#include "trustchain/scoring/ReputationTier.hpp"
#include "trustchain/scoring/ScoreCommitment.hpp"
#include "trustchain/scoring/Scoring.hpp"
#include "trustchain/util/Json.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <initializer_list>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#ifndef TRUSTCHAIN_VERSION
#define TRUSTCHAIN_VERSION "v0.3.0"
#endif

namespace {

constexpr std::string_view kTrustchainVersion = TRUSTCHAIN_VERSION;

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitIo = 2;
constexpr int kExitMismatch = 3;

struct GlobalOptions {
    std::optional<std::string> config_path{};
    std::optional<std::string> profile_name{};
    bool quiet{false};
};

class CliException : public std::exception {
public:
    CliException(std::string code, std::string message, std::string hint = {})
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

[[noreturn]] void throw_cli_error(std::string code, std::string message, std::string hint = {}) {
    throw CliException(std::move(code), std::move(message), std::move(hint));
}

void print_error(const std::string& what, const std::string& hint) {
    std::cerr << what << std::endl;
    if (!hint.empty()) {
        std::cerr << "Hint: " << hint << std::endl;
    }
}

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

std::string format_fixed(double value) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.2f", value);
    return buffer;
}

bool parse_floating_token(const std::string& text, double& value) {
    if (text.empty()) {
        return false;
    }
    char* end = nullptr;
    value = std::strtod(text.c_str(), &end);
    return end == text.c_str() + text.size() && std::isfinite(value);
}

double parse_score_argument(const std::string& text, const char* name) {
    double value = 0.0;
    if (!parse_floating_token(text, value)) {
        throw_cli_error("E_INVALID_NUMBER", std::string(name) + " must be a number: " + text);
    }
    if (value < trustchain::scoring::kMinScore || value > trustchain::scoring::kMaxScore) {
        throw_cli_error("E_SCORE_RANGE", std::string(name) + " must lie within 0..100");
    }
    return value;
}

trustchain::Timestamp parse_time_argument(const std::string& text, const char* name) {
    const auto parsed = trustchain::parse_timestamp(text);
    if (!parsed) {
        throw_cli_error("E_INVALID_TIME",
                        std::string(name) + " is not a valid timestamp: " + text,
                        "Use YYYY-MM-DD or YYYY-MM-DDTHH:MM:SSZ");
    }
    return *parsed;
}

trustchain::scoring::Weights parse_weights_argument(const std::string& text) {
    std::vector<double> parts;
    std::size_t start = 0;
    while (start <= text.size()) {
        const auto comma = text.find(',', start);
        const auto token = text.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
        double value = 0.0;
        if (!parse_floating_token(token, value)) {
            throw_cli_error("E_INVALID_WEIGHTS", "Invalid weight: " + token, "Example: --weights 0.4,0.3,0.3");
        }
        parts.push_back(value);
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    if (parts.size() != 3) {
        throw_cli_error("E_INVALID_WEIGHTS", "Expected three comma separated weights", "Example: --weights 0.4,0.3,0.3");
    }
    return trustchain::scoring::Weights{parts[0], parts[1], parts[2]};
}

trustchain::scoring::ComponentScores parse_score_tuple(const std::vector<std::string>& positional) {
    trustchain::scoring::ComponentScores scores;
    scores.code = parse_score_argument(positional[0], "CODE");
    scores.time = parse_score_argument(positional[1], "TIME");
    scores.peer = parse_score_argument(positional[2], "PEER");
    scores.final_score = parse_score_argument(positional[3], "FINAL");
    return scores;
}

void print_usage() {
    std::cout << "TrustChain CLI" << std::endl;
    std::cout << "Usage: trustchain [options] <command> [args]\n\n";
    std::cout << "Global options:\n"
              << "  --config <file>           YAML or JSON configuration file\n"
              << "  --profile <name>          Profile selected from the configuration file\n"
              << "  --quiet                   Suppress structured log output\n"
              << "  --version                 Print the version and exit\n\n";
    std::cout << "Commands:\n"
              << "  analyze --repo <path> [--since <time>] [--until <time>]\n"
              << "                            Per-author activity and raw scores as JSON lines\n"
              << "  score --code <x> --time <y> --peer <z> [--weights a,b,c]\n"
              << "                            Final score, reputation tier and commitment\n"
              << "  commit <code> <time> <peer> <final>\n"
              << "                            Commitment hash of a score tuple\n"
              << "  verify <code> <time> <peer> <final> <hex>\n"
              << "                            Exit 0 when the commitment matches, 3 otherwise\n"
              << "  tier <score>              Reputation tier and award for a final score\n"
              << "  help                      Show this message\n";
}

struct CommandArgs {
    std::vector<std::string> positional;
    std::vector<std::pair<std::string, std::string>> options;

    std::optional<std::string> option(std::string_view name) const {
        for (const auto& [key, value] : options) {
            if (key == name) {
                return value;
            }
        }
        return std::nullopt;
    }
};

CommandArgs parse_command_args(const std::vector<std::string_view>& args,
                               std::size_t index,
                               std::initializer_list<std::string_view> known_options) {
    CommandArgs parsed;
    while (index < args.size()) {
        const auto arg = args[index++];
        if (arg.starts_with("--") && arg.size() > 2) {
            if (std::find(known_options.begin(), known_options.end(), arg) == known_options.end()) {
                throw_cli_error("E_UNKNOWN_OPTION",
                                "Unknown option: " + std::string(arg),
                                "Run 'trustchain help' to view available options");
            }
            if (index >= args.size()) {
                throw_cli_error("E_MISSING_VALUE",
                                std::string(arg) + " requires a value",
                                "Provide an argument immediately after " + std::string(arg));
            }
            parsed.options.emplace_back(std::string(arg), std::string(args[index++]));
            continue;
        }
        parsed.positional.emplace_back(arg);
    }
    return parsed;
}

trustchain::Config load_configuration(const GlobalOptions& options) {
    if (options.config_path) {
        return trustchain::load_config_file(*options.config_path, options.profile_name);
    }
    if (options.profile_name) {
        throw_cli_error("E_CONFIG_PROFILE", "--profile requires --config");
    }
    trustchain::Config config;
    trustchain::apply_environment_overrides(config);
    return config;
}

int run_analyze(const trustchain::Config& config, const CommandArgs& args) {
    const auto repository = args.option("--repo");
    if (!repository) {
        throw_cli_error("E_MISSING_REPO", "analyze requires --repo <path>");
    }

    trustchain::scoring::AnalysisWindow window;
    window.until = args.option("--until") ? parse_time_argument(*args.option("--until"), "--until")
                                          : std::chrono::system_clock::now();
    window.since = args.option("--since") ? parse_time_argument(*args.option("--since"), "--since")
                                          : window.until - config.analysis_window;
    if (window.since >= window.until) {
        throw_cli_error("E_WINDOW_ORDER", "--since must precede --until");
    }

    trustchain::history::GitLogProvider provider(config.git_executable);
    const auto commits = provider.commits(*repository, window);
    const auto activity = trustchain::scoring::aggregate_activity(commits, window);

    std::vector<trustchain::scoring::ActivityStats> cohort;
    for (const auto& [author, stats] : activity) {
        cohort.push_back(stats);
    }

    for (const auto& [author, stats] : activity) {
        const auto code = trustchain::scoring::compute_code_score(stats, cohort);
        const auto time = trustchain::scoring::compute_time_consistency_score(
            stats.active_days, stats.total_days, stats.last_day_commits, stats.commits);

        auto line = trustchain::json::Value::make_object();
        auto& fields = line.as_object();
        fields["author"] = trustchain::json::Value(author);
        fields["commits"] = trustchain::json::Value(static_cast<std::int64_t>(stats.commits));
        fields["lines_added"] = trustchain::json::Value(static_cast<std::int64_t>(stats.lines_added));
        fields["lines_removed"] = trustchain::json::Value(static_cast<std::int64_t>(stats.lines_removed));
        fields["files_modified"] = trustchain::json::Value(static_cast<std::int64_t>(stats.files_modified));
        fields["active_days"] = trustchain::json::Value(static_cast<std::int64_t>(stats.active_days));
        fields["total_days"] = trustchain::json::Value(static_cast<std::int64_t>(stats.total_days));
        fields["last_day_commits"] = trustchain::json::Value(static_cast<std::int64_t>(stats.last_day_commits));
        fields["code_score"] = trustchain::json::Value(code);
        fields["time_score"] = trustchain::json::Value(time);
        std::cout << trustchain::json::serialize(line) << '\n';
    }
    std::cout.flush();
    return kExitOk;
}

int run_score(const trustchain::Config& config, const CommandArgs& args) {
    const auto code = args.option("--code");
    const auto time = args.option("--time");
    const auto peer = args.option("--peer");
    if (!code || !time || !peer) {
        throw_cli_error("E_MISSING_SCORE", "score requires --code, --time and --peer");
    }

    trustchain::scoring::Weights weights{config.default_weight_code,
                                         config.default_weight_time,
                                         config.default_weight_vote};
    if (const auto text = args.option("--weights")) {
        weights = parse_weights_argument(*text);
    }
    if (!trustchain::scoring::weights_valid(weights, config.weight_tolerance)) {
        throw trustchain::ValidationError("E_INVALID_WEIGHTS",
                                          "Weights must each lie in [0, 1] and sum to 1",
                                          "Example: --weights 0.4,0.3,0.3");
    }

    trustchain::scoring::ComponentScores scores;
    scores.code = parse_score_argument(*code, "--code");
    scores.time = parse_score_argument(*time, "--time");
    scores.peer = parse_score_argument(*peer, "--peer");
    scores.final_score = trustchain::scoring::combine_final_score(scores.code, scores.time, scores.peer, weights);

    const auto tier = trustchain::scoring::reputation_tier_for(scores.final_score);
    std::cout << "final: " << format_fixed(scores.final_score) << '\n'
              << "tier: " << trustchain::scoring::reputation_tier_to_string(tier) << '\n'
              << "reputation: " << trustchain::scoring::reputation_amount(tier) << '\n'
              << "commitment: " << trustchain::scoring::commitment_hex(scores) << std::endl;
    return kExitOk;
}

int run_commit(const CommandArgs& args) {
    if (args.positional.size() != 4) {
        throw_cli_error("E_USAGE", "commit expects <code> <time> <peer> <final>");
    }
    std::cout << trustchain::scoring::commitment_hex(parse_score_tuple(args.positional)) << std::endl;
    return kExitOk;
}

int run_verify(const CommandArgs& args) {
    if (args.positional.size() != 5) {
        throw_cli_error("E_USAGE", "verify expects <code> <time> <peer> <final> <hex>");
    }
    const auto scores = parse_score_tuple(args.positional);
    if (trustchain::scoring::verify_commitment(scores, args.positional[4])) {
        std::cout << "verified" << std::endl;
        return kExitOk;
    }
    std::cout << "mismatch: expected " << trustchain::scoring::commitment_hex(scores) << std::endl;
    return kExitMismatch;
}

int run_tier(const CommandArgs& args) {
    if (args.positional.size() != 1) {
        throw_cli_error("E_USAGE", "tier expects <score>");
    }
    const auto score = parse_score_argument(args.positional[0], "SCORE");
    const auto tier = trustchain::scoring::reputation_tier_for(score);
    std::cout << trustchain::scoring::reputation_tier_to_string(tier) << ' '
              << trustchain::scoring::reputation_amount(tier) << std::endl;
    return kExitOk;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        std::vector<std::string_view> args;
        args.reserve(static_cast<std::size_t>(argc));
        for (int i = 1; i < argc; ++i) {
            args.emplace_back(argv[i]);
        }

        GlobalOptions options{};
        std::size_t index = 0;

        auto require_value = [&](std::string_view option) -> std::string {
            if (index >= args.size()) {
                throw_cli_error("E_MISSING_VALUE",
                                std::string(option) + " requires a value",
                                "Provide an argument immediately after " + std::string(option));
            }
            return std::string(args[index++]);
        };

        while (index < args.size() && args[index].starts_with("-")) {
            const auto opt = args[index++];
            if (opt == "--help" || opt == "-h") {
                print_usage();
                return kExitOk;
            }
            if (opt == "--version") {
                std::cout << "trustchain " << kTrustchainVersion << std::endl;
                return kExitOk;
            }
            if (opt == "--quiet" || opt == "-q") {
                options.quiet = true;
                continue;
            }
            if (opt == "--config") {
                if (options.config_path.has_value()) {
                    throw_cli_error("E_DUPLICATE_OPTION",
                                    "Option --config specified multiple times",
                                    "Provide the configuration file only once");
                }
                options.config_path = require_value(opt);
                continue;
            }
            if (opt == "--profile") {
                if (options.profile_name.has_value()) {
                    throw_cli_error("E_DUPLICATE_OPTION",
                                    "Option --profile specified multiple times",
                                    "Select a single profile");
                }
                options.profile_name = require_value(opt);
                continue;
            }
            throw_cli_error("E_UNKNOWN_OPTION",
                            "Unknown option: " + std::string(opt),
                            "Run 'trustchain --help' to view available options");
        }

        if (index >= args.size()) {
            print_usage();
            return kExitUsage;
        }
        const auto command = to_lower(std::string(args[index++]));
        if (command == "help") {
            print_usage();
            return kExitOk;
        }

        const auto config = load_configuration(options);
        trustchain::log::StructuredLogger::instance().set_enabled(config.logging_enabled && !options.quiet);

        if (command == "analyze") {
            return run_analyze(config, parse_command_args(args, index, {"--repo", "--since", "--until"}));
        }
        if (command == "score") {
            return run_score(config, parse_command_args(args, index, {"--code", "--time", "--peer", "--weights"}));
        }
        if (command == "commit") {
            return run_commit(parse_command_args(args, index, {}));
        }
        if (command == "verify") {
            return run_verify(parse_command_args(args, index, {}));
        }
        if (command == "tier") {
            return run_tier(parse_command_args(args, index, {}));
        }

        throw_cli_error("E_UNKNOWN_COMMAND",
                        "Unknown command: " + command,
                        "Run 'trustchain --help' to see the list of available commands");
    } catch (const CliException& ex) {
        print_error(ex.what(), ex.hint());
        return kExitUsage;
    } catch (const trustchain::HistoryUnavailable& ex) {
        print_error(ex.what(), ex.hint());
        return kExitIo;
    } catch (const trustchain::ConfigError& ex) {
        print_error(ex.what(), ex.hint());
        return ex.code() == "E_CONFIG_NOT_FOUND" ? kExitIo : kExitUsage;
    } catch (const trustchain::Error& ex) {
        print_error(ex.what(), ex.hint());
        return kExitUsage;
    } catch (const std::exception& ex) {
        std::cerr << "Error [E_UNEXPECTED]: " << ex.what() << std::endl;
        return kExitUsage;
    }
}
