#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "core/errors/pipeline_errors.hpp"
#include "runtime/workflow_orchestrator.hpp"

namespace seoflow::runtime {

struct BatchOptions {
    std::size_t max_parallel = 1;
    bool continue_on_error = true;
};

struct BatchItemResult {
    std::string keyword;
    core::errors::Result<std::filesystem::path> outcome;
};

using OrchestratorFactory = std::function<std::unique_ptr<WorkflowOrchestrator>()>;

// Runs one orchestrator per keyword, at most max_parallel at a time. Each run
// owns its own session, so runs need no coordination beyond scheduling.
class BatchRunner {
public:
    BatchRunner(OrchestratorFactory factory, BatchOptions options);

    // One result per keyword that was started, in input order. Without
    // continue_on_error no keyword is started after the first failure.
    std::vector<BatchItemResult> run(const std::vector<std::string>& keywords) const;

private:
    BatchItemResult run_one(const std::string& keyword) const;

    OrchestratorFactory factory_;
    BatchOptions options_;
};

}  // namespace seoflow::runtime
