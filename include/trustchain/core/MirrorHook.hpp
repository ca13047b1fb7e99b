#pragma once

#include "trustchain/core/Project.hpp"

#include <vector>

namespace trustchain {

// Called after the store committed a change. Implementations may forward the records to
// a secondary document store; exceptions are logged by the caller and never roll back.
class MirrorHook {
public:
    virtual ~MirrorHook() = default;

    virtual void project_saved(const Project&) {}
    virtual void summaries_saved(ProjectId, const std::vector<ActivitySummary>&) {}
    virtual void vote_saved(const Vote&) {}
    virtual void final_scores_saved(ProjectId, const std::vector<FinalScore>&) {}
};

}  // namespace trustchain
