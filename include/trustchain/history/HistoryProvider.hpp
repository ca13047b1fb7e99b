#pragma once

#include "trustchain/core/Errors.hpp"
#include "trustchain/scoring/ActivityAggregator.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace trustchain::history {

class HistoryProvider {
public:
    virtual ~HistoryProvider() = default;

    // Throws HistoryUnavailable when the repository cannot be read.
    virtual std::vector<scoring::CommitRecord> commits(const std::string& repository,
                                                       const scoring::AnalysisWindow& window) = 0;
};

// Reads a local clone through `git log --numstat`.
class GitLogProvider : public HistoryProvider {
public:
    explicit GitLogProvider(std::string git_executable = "git");

    std::vector<scoring::CommitRecord> commits(const std::string& repository,
                                               const scoring::AnalysisWindow& window) override;

    std::string build_command(const std::string& repository, const scoring::AnalysisWindow& window) const;

private:
    std::string git_executable_;
};

// Parses output produced with kGitLogFormat and --numstat.
std::vector<scoring::CommitRecord> parse_git_log(std::string_view output);

// Record separator 0x1e, field separator 0x1f: hash, parents, author email, author name, committer unix time
// (the date git --since/--until filter on).
inline constexpr std::string_view kGitLogFormat = "%x1e%H%x1f%P%x1f%ae%x1f%an%x1f%ct";

}  // namespace trustchain::history
