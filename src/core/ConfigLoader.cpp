#include "trustchain/ConfigLoader.hpp"

#include "trustchain/core/Errors.hpp"
#include "trustchain/scoring/Scoring.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <system_error>
#include <vector>

namespace trustchain {

namespace {

using json::Value;

constexpr std::string_view kBlank = " \t\r\n";

std::string_view strip(std::string_view text) {
    const auto first = text.find_first_not_of(kBlank);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(kBlank);
    return text.substr(first, last - first + 1);
}

Value parse_json_text(std::string_view text) {
    try {
        return json::parse(text);
    } catch (const json::ParseError& ex) {
        throw ConfigError("E_CONFIG_PARSE", ex.what());
    }
}

std::optional<Value> number_scalar(std::string_view token) {
    if (!token.empty() && token.front() == '+') {
        token.remove_prefix(1);
    }
    if (token.empty() || token.find_first_not_of("-0123456789.") != std::string_view::npos) {
        return std::nullopt;
    }
    std::int64_t integer{};
    const auto [end, ec] = std::from_chars(token.data(), token.data() + token.size(), integer);
    if (ec == std::errc{} && end == token.data() + token.size()) {
        return Value(integer);
    }
    const std::string buffer(token);
    char* parsed_end = nullptr;
    const double value = std::strtod(buffer.c_str(), &parsed_end);
    if (parsed_end != buffer.c_str() + buffer.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return Value(value);
}

Value yaml_scalar(std::string_view raw) {
    const std::string_view token = strip(raw);
    if (token.empty() || token == "~" || token == "null") {
        return Value();
    }
    if (token.size() >= 2 && token.front() == '\'' && token.back() == '\'') {
        return Value(std::string(token.substr(1, token.size() - 2)));
    }
    if (token.size() >= 2 && token.front() == '"' && token.back() == '"') {
        // Double-quoted YAML escapes are a superset of what configs use; JSON rules apply.
        return parse_json_text(token);
    }
    if (token == "true" || token == "True") {
        return Value(true);
    }
    if (token == "false" || token == "False") {
        return Value(false);
    }
    if (auto number = number_scalar(token)) {
        return *std::move(number);
    }
    return Value(std::string(token));
}

// Drops a trailing "# comment" that sits outside quotes.
std::string_view without_comment(std::string_view line) {
    char quote = '\0';
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char ch = line[i];
        if (quote != '\0') {
            if (ch == quote) {
                quote = '\0';
            }
        } else if (ch == '"' || ch == '\'') {
            quote = ch;
        } else if (ch == '#') {
            return line.substr(0, i);
        }
    }
    return line;
}

// Key separator: the first ':' followed by whitespace or end of line.
std::size_t key_separator(std::string_view content) {
    for (std::size_t i = 0; i < content.size(); ++i) {
        if (content[i] == ':' && (i + 1 == content.size() || content[i + 1] == ' ')) {
            return i;
        }
    }
    return std::string_view::npos;
}

class YamlReader {
public:
    Value read(std::string_view text) {
        frames_.push_back({0, &root_});
        std::size_t line_number = 0;
        while (!text.empty()) {
            const auto newline = text.find('\n');
            const std::string_view line = text.substr(0, newline);
            text = newline == std::string_view::npos ? std::string_view{} : text.substr(newline + 1);
            ++line_number;
            consume_line(line, line_number);
        }
        return std::move(root_);
    }

private:
    struct Frame {
        std::size_t indent;
        Value* node;
    };

    [[noreturn]] static void fail(std::size_t line_number, const std::string& message) {
        throw ConfigError("E_CONFIG_PARSE", "YAML line " + std::to_string(line_number) + ": " + message);
    }

    void consume_line(std::string_view line, std::size_t line_number) {
        line = without_comment(line);
        if (strip(line).empty()) {
            return;
        }
        const std::size_t indent = line.find_first_not_of(' ');
        if (line[indent] == '\t') {
            fail(line_number, "tabs are not allowed for indentation");
        }
        if (indent % 2 != 0) {
            fail(line_number, "indentation must be a multiple of two spaces");
        }
        while (frames_.size() > 1 && indent < frames_.back().indent) {
            frames_.pop_back();
        }
        if (indent != frames_.back().indent) {
            fail(line_number, "unexpected indentation");
        }

        const std::string_view content = strip(line);
        Value& parent = *frames_.back().node;
        if (content.front() == '-') {
            auto& items = parent.ensure_array();
            const std::string_view item = strip(content.substr(1));
            if (item.empty()) {
                items.push_back(Value::make_object());
                frames_.push_back({indent + 2, &items.back()});
            } else {
                items.push_back(yaml_scalar(item));
            }
            return;
        }

        const auto separator = key_separator(content);
        if (separator == std::string_view::npos || separator == 0) {
            fail(line_number, "expected 'key: value', got '" + std::string(content) + "'");
        }
        const std::string key(strip(content.substr(0, separator)));
        const std::string_view rest = strip(content.substr(separator + 1));
        auto& fields = parent.ensure_object();
        if (!rest.empty()) {
            fields[key] = yaml_scalar(rest);
            return;
        }
        Value& child = fields[key];
        if (child.is_null()) {
            child = Value::make_object();
        }
        frames_.push_back({indent + 2, &child});
    }

    Value root_{Value::make_object()};
    std::vector<Frame> frames_;
};

Value remove_keys(const Value& object, std::initializer_list<std::string_view> keys) {
    Value filtered = Value::make_object();
    for (const auto& [key, value] : object.as_object()) {
        if (std::find(keys.begin(), keys.end(), key) != keys.end()) {
            continue;
        }
        filtered.as_object()[key] = value;
    }
    return filtered;
}

std::string profile_names(const Value& profiles) {
    std::string names;
    for (const auto& [name, _] : profiles.as_object()) {
        if (!names.empty()) {
            names += ", ";
        }
        names += name;
    }
    return names.empty() ? std::string{"<none>"} : names;
}

Value resolve_profile(const Value& profiles, const std::string& profile_name, std::set<std::string>& visiting) {
    const auto it = profiles.as_object().find(profile_name);
    if (it == profiles.as_object().end()) {
        throw ConfigError("E_CONFIG_PROFILE", "Profile not found: " + profile_name,
                          "Available profiles: " + profile_names(profiles));
    }
    if (!it->second.is_object()) {
        throw ConfigError("E_CONFIG_TYPE", "Profile must be a mapping: " + profile_name);
    }
    if (visiting.contains(profile_name)) {
        throw ConfigError("E_CONFIG_PROFILE", "Profile inheritance cycle detected at " + profile_name);
    }
    visiting.insert(profile_name);

    Value result = Value::make_object();
    if (const auto* extends = it->second.find("extends")) {
        if (!extends->is_string()) {
            throw ConfigError("E_CONFIG_PROFILE", "'extends' must be a string in profile " + profile_name);
        }
        result = resolve_profile(profiles, extends->string_value, visiting);
    }

    result = json::merge_objects(result, remove_keys(it->second, {"extends"}));
    visiting.erase(profile_name);
    return result;
}

using ConfigPath = std::vector<std::string>;

std::string dotted(const ConfigPath& path) {
    std::string text;
    for (const auto& segment : path) {
        if (!text.empty()) {
            text += '.';
        }
        text += segment;
    }
    return text;
}

[[noreturn]] void wrong_type(const ConfigPath& path, std::string_view expected) {
    throw ConfigError("E_CONFIG_TYPE", "Expected " + std::string(expected) + " at config path " + dotted(path));
}

const Value* lookup(const Value& root, const ConfigPath& path) {
    const Value* node = json::find_path(root, path);
    return node == nullptr || node->is_null() ? nullptr : node;
}

std::optional<std::string> get_string(const Value& root, const ConfigPath& path) {
    const Value* node = lookup(root, path);
    if (node == nullptr) {
        return std::nullopt;
    }
    if (!node->is_string()) {
        wrong_type(path, "string");
    }
    return node->string_value;
}

std::optional<bool> get_bool(const Value& root, const ConfigPath& path) {
    static const std::map<std::string_view, bool> kWords{
        {"true", true}, {"yes", true}, {"on", true}, {"false", false}, {"no", false}, {"off", false}};
    const Value* node = lookup(root, path);
    if (node == nullptr) {
        return std::nullopt;
    }
    if (node->is_boolean()) {
        return node->boolean_value;
    }
    if (node->is_string()) {
        std::string lowered = node->string_value;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
            return static_cast<char>(std::tolower(ch));
        });
        if (const auto it = kWords.find(lowered); it != kWords.end()) {
            return it->second;
        }
    }
    wrong_type(path, "boolean");
}

std::optional<std::int64_t> get_int64(const Value& root, const ConfigPath& path) {
    const Value* node = lookup(root, path);
    if (node == nullptr) {
        return std::nullopt;
    }
    if (node->is_integer()) {
        return node->integer_value;
    }
    if (node->is_double() && std::trunc(node->double_value) == node->double_value) {
        return static_cast<std::int64_t>(node->double_value);
    }
    wrong_type(path, "integer");
}

std::optional<double> get_double(const Value& root, const ConfigPath& path) {
    const Value* node = lookup(root, path);
    if (node == nullptr) {
        return std::nullopt;
    }
    if (!node->is_number()) {
        wrong_type(path, "number");
    }
    return node->number();
}

std::int64_t require_positive(std::int64_t value, const char* key) {
    if (value <= 0) {
        throw ConfigError("E_CONFIG_VALUE", std::string(key) + " must be positive");
    }
    return value;
}

void apply_document(const Value& document, Config& config) {
    if (auto code = get_double(document, ConfigPath{"scoring", "weights", "code"})) {
        config.default_weight_code = *code;
    }
    if (auto time = get_double(document, ConfigPath{"scoring", "weights", "time"})) {
        config.default_weight_time = *time;
    }
    if (auto vote = get_double(document, ConfigPath{"scoring", "weights", "vote"})) {
        config.default_weight_vote = *vote;
    }
    if (auto tolerance = get_double(document, ConfigPath{"scoring", "tolerance"})) {
        if (*tolerance < 0.0 || *tolerance >= 1.0) {
            throw ConfigError("E_CONFIG_VALUE", "scoring.tolerance must lie in [0, 1)");
        }
        config.weight_tolerance = *tolerance;
    }
    const scoring::Weights weights{config.default_weight_code, config.default_weight_time, config.default_weight_vote};
    if (!scoring::weights_valid(weights, config.weight_tolerance)) {
        throw ConfigError("E_CONFIG_VALUE",
                          "scoring.weights must each lie in [0, 1] and sum to 1",
                          "Example: code 0.4, time 0.3, vote 0.3");
    }

    if (auto days = get_int64(document, ConfigPath{"analysis", "window_days"})) {
        config.analysis_window = std::chrono::hours(24 * require_positive(*days, "analysis.window_days"));
    }
    if (auto git = get_string(document, ConfigPath{"analysis", "git"})) {
        if (git->empty()) {
            throw ConfigError("E_CONFIG_VALUE", "analysis.git must not be empty");
        }
        config.git_executable = *git;
    }

    if (auto enabled = get_bool(document, ConfigPath{"ledger", "enabled"})) {
        config.ledger_enabled = *enabled;
    }
    if (auto endpoint = get_string(document, ConfigPath{"ledger", "endpoint"})) {
        config.ledger_endpoint = *endpoint;
    }
    if (auto token = get_string(document, ConfigPath{"ledger", "token"})) {
        config.ledger_token = *token;
    }
    if (auto account = get_string(document, ConfigPath{"ledger", "account"})) {
        config.ledger_account = *account;
    }
    if (auto key = get_string(document, ConfigPath{"ledger", "signing_key"})) {
        config.ledger_signing_key = *key;
    }
    if (auto asset = get_int64(document, ConfigPath{"ledger", "reputation_asset_id"})) {
        if (*asset < 0) {
            throw ConfigError("E_CONFIG_VALUE", "ledger.reputation_asset_id must be non-negative");
        }
        config.reputation_asset_id = static_cast<std::uint64_t>(*asset);
    }
    if (auto timeout = get_int64(document, ConfigPath{"ledger", "timeout_seconds"})) {
        config.ledger_timeout = std::chrono::seconds(require_positive(*timeout, "ledger.timeout_seconds"));
    }
    if (auto timeout = get_int64(document, ConfigPath{"ledger", "connect_timeout_seconds"})) {
        config.ledger_connect_timeout =
            std::chrono::seconds(require_positive(*timeout, "ledger.connect_timeout_seconds"));
    }

    if (auto enabled = get_bool(document, ConfigPath{"logging", "enabled"})) {
        config.logging_enabled = *enabled;
    }
}

}  // namespace

json::Value parse_config_text(std::string_view text, bool force_json) {
    const bool looks_like_json = force_json || strip(text).starts_with('{');
    Value document = looks_like_json ? parse_json_text(text) : YamlReader{}.read(text);
    if (!document.is_object()) {
        throw ConfigError("E_CONFIG_TYPE", "Configuration root must be an object");
    }
    return document;
}

Config config_from_document(const json::Value& document, const std::optional<std::string>& profile) {
    if (!document.is_object()) {
        throw ConfigError("E_CONFIG_TYPE", "Configuration root must be an object");
    }

    std::optional<std::string> selected = profile;
    if (!selected) {
        selected = get_string(document, ConfigPath{"profile"});
    }

    Value effective = remove_keys(document, {"profiles", "profile"});
    if (selected) {
        const auto* profiles = document.find("profiles");
        if (!profiles || !profiles->is_object()) {
            throw ConfigError("E_CONFIG_PROFILE",
                              "Profile '" + *selected + "' requested but no 'profiles' mapping is defined");
        }
        std::set<std::string> visiting;
        effective = json::merge_objects(effective, resolve_profile(*profiles, *selected, visiting));
    }

    Config config;
    apply_document(effective, config);
    return config;
}

void apply_environment_overrides(Config& config, const EnvironmentLookup& lookup) {
    const auto read = [&](const char* name) -> std::optional<std::string> {
        if (lookup) {
            return lookup(name);
        }
        if (const char* value = std::getenv(name)) {
            return std::string(value);
        }
        return std::nullopt;
    };

    if (auto endpoint = read("TRUSTCHAIN_LEDGER_ENDPOINT")) {
        config.ledger_endpoint = *endpoint;
        if (!endpoint->empty()) {
            config.ledger_enabled = true;
        }
    }
    if (auto token = read("TRUSTCHAIN_LEDGER_TOKEN")) {
        config.ledger_token = *token;
    }
    if (auto key = read("TRUSTCHAIN_LEDGER_KEY")) {
        config.ledger_signing_key = *key;
    }
}

Config load_config_file(const std::filesystem::path& path, const std::optional<std::string>& profile) {
    const auto absolute = std::filesystem::absolute(path);
    std::ifstream input(absolute);
    if (!input) {
        throw ConfigError("E_CONFIG_NOT_FOUND", "Configuration file not found: " + absolute.string(),
                          "Verify the path or provide an absolute path");
    }
    std::stringstream buffer;
    buffer << input.rdbuf();

    const auto document = parse_config_text(buffer.str(), path.extension() == ".json");
    auto config = config_from_document(document, profile);
    apply_environment_overrides(config);
    return config;
}

}  // namespace trustchain
