#include <array>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#if !defined(_WIN32)
#include <sys/wait.h>
#endif

namespace {

struct CommandResult {
    int exit_code;
    std::string output;
};

CommandResult run_cli(const std::string& executable, const std::string& arguments) {
    const std::string command = "\"" + executable + "\" " + arguments + " 2>&1";
#if defined(_WIN32)
    FILE* pipe = _popen(command.c_str(), "r");
#else
    FILE* pipe = popen(command.c_str(), "r");
#endif
    if (!pipe) {
        throw std::runtime_error("Failed to open a pipe to the CLI");
    }

    std::string output;
    std::array<char, 256> buffer{};
    while (std::fgets(buffer.data(), static_cast<int>(buffer.size()), pipe)) {
        output.append(buffer.data());
    }

#if defined(_WIN32)
    const int exit_code = _pclose(pipe);
#else
    const int status = pclose(pipe);
    int exit_code = -1;
    if (WIFEXITED(status)) {
        exit_code = WEXITSTATUS(status);
    }
#endif
    return CommandResult{exit_code, output};
}

bool expect_contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

bool check(const CommandResult& result, int exit_code, const std::string& needle, const char* label) {
    if (result.exit_code != exit_code || !expect_contains(result.output, needle)) {
        std::cerr << "Failure on " << label << ". exit=" << result.exit_code << "\n" << result.output << std::endl;
        return false;
    }
    return true;
}

constexpr const char* kCommitment = "43327fcb94d0c6dd0cf9db425e55b0276b3103367010c27e85dbe93fca63c842";

}  // namespace

int main() {
    const char* executable_env = std::getenv("TRUSTCHAIN_CLI_EXECUTABLE");
    if (!executable_env) {
        std::cerr << "TRUSTCHAIN_CLI_EXECUTABLE is not defined" << std::endl;
        return 1;
    }
    const std::string executable = std::filesystem::path(executable_env).string();

    const auto directory = std::filesystem::temp_directory_path() / "trustchain-cli-test";
    std::filesystem::create_directories(directory);
    const auto config_path = directory / "trustchain.yaml";
    {
        std::ofstream out(config_path);
        out << "scoring:\n"
               "  weights:\n"
               "    code: 0.5\n"
               "    time: 0.25\n"
               "    vote: 0.25\n"
               "logging:\n"
               "  enabled: false\n"
               "profiles:\n"
               "  peers:\n"
               "    scoring:\n"
               "      weights:\n"
               "        code: 0.0\n"
               "        time: 0.0\n"
               "        vote: 1.0\n";
    }
    const std::string config_arg = "--config \"" + config_path.string() + "\"";

    bool ok = true;
    try {
        ok &= check(run_cli(executable, "--help"), 0, "Usage: trustchain", "--help");
        ok &= check(run_cli(executable, "--version"), 0, "trustchain v", "--version");
        ok &= check(run_cli(executable, ""), 1, "Usage: trustchain", "no command");
        ok &= check(run_cli(executable, "launch"), 1, "E_UNKNOWN_COMMAND", "unknown command");
        ok &= check(run_cli(executable, "--frobnicate tier 50"), 1, "E_UNKNOWN_OPTION", "unknown option");
        ok &= check(run_cli(executable, "--config"), 1, "E_MISSING_VALUE", "--config without value");

        const auto score = run_cli(executable, "--quiet score --code 80 --time 60 --peer 50");
        ok &= check(score, 0, "final: 65.00", "score");
        ok &= check(score, 0, "tier: bronze", "score tier");
        ok &= check(score, 0, "reputation: 40", "score reputation");
        ok &= check(score, 0, std::string("commitment: ") + kCommitment, "score commitment");

        ok &= check(run_cli(executable, "score --code 80 --time 60 --peer 50 --weights 1,0,0"),
                    0, "final: 80.00", "score with weights");
        ok &= check(run_cli(executable, "score --code 80 --time 60 --peer 50 --weights 0.5,0.5,0.5"),
                    1, "E_INVALID_WEIGHTS", "invalid weights");
        ok &= check(run_cli(executable, "score --code 120 --time 60 --peer 50"), 1, "E_SCORE_RANGE", "score range");
        ok &= check(run_cli(executable, "score --code 80 --time 60"), 1, "E_MISSING_SCORE", "missing score");
        ok &= check(run_cli(executable, config_arg + " score --code 80 --time 60 --peer 50"),
                    0, "final: 67.50", "score with config");
        ok &= check(run_cli(executable, config_arg + " --profile peers score --code 80 --time 60 --peer 50"),
                    0, "final: 50.00", "score with profile");
        ok &= check(run_cli(executable, config_arg + " --profile nightly tier 50"),
                    1, "E_CONFIG_PROFILE", "unknown profile");
        ok &= check(run_cli(executable, "--config \"" + (directory / "absent.yaml").string() + "\" tier 50"),
                    2, "E_CONFIG_NOT_FOUND", "missing config");

        ok &= check(run_cli(executable, "commit 80 60 50 65"), 0, kCommitment, "commit");
        ok &= check(run_cli(executable, "commit 80 60 50"), 1, "E_USAGE", "commit arity");
        ok &= check(run_cli(executable, std::string("verify 80 60 50 65 ") + kCommitment), 0, "verified", "verify");
        ok &= check(run_cli(executable, std::string("verify 80 60 50 65.01 ") + kCommitment),
                    3, "mismatch", "verify mismatch");
        ok &= check(run_cli(executable, "verify 80 sixty 50 65 abc"), 1, "E_INVALID_NUMBER", "verify number");

        ok &= check(run_cli(executable, "tier 95"), 0, "platinum 100", "tier platinum");
        ok &= check(run_cli(executable, "tier 49.99"), 0, "none 0", "tier none");
        ok &= check(run_cli(executable, "tier 101"), 1, "E_SCORE_RANGE", "tier range");

        ok &= check(run_cli(executable, "analyze"), 1, "E_MISSING_REPO", "analyze without repo");
        ok &= check(run_cli(executable, "--quiet analyze --repo /nonexistent/trustchain-repo"),
                    2, "E_HISTORY_GIT", "analyze missing repo");
        ok &= check(run_cli(executable, "analyze --repo . --since 2024-13-45"), 1, "E_INVALID_TIME", "analyze time");
        ok &= check(run_cli(executable, "analyze --repo . --since 2024-03-10 --until 2024-03-01"),
                    1, "E_WINDOW_ORDER", "analyze window order");
    } catch (const std::exception& ex) {
        std::cerr << "Unexpected error: " << ex.what() << std::endl;
        ok = false;
    }

    std::filesystem::remove_all(directory);
    return ok ? 0 : 1;
}
