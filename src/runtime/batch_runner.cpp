#include "runtime/batch_runner.hpp"

#include <algorithm>
#include <functional>
#include <future>
#include <utility>
#include "core/logging/logger.hpp"
#include "runtime/workflow_scope.hpp"

namespace seoflow::runtime {

using core::errors::ErrorCategory;
using core::errors::PipelineError;

BatchRunner::BatchRunner(OrchestratorFactory factory, BatchOptions options)
    : factory_(std::move(factory)), options_(options) {
    options_.max_parallel = std::max<std::size_t>(1, options_.max_parallel);
}

BatchItemResult BatchRunner::run_one(const std::string& keyword) const {
    auto orchestrator = factory_ ? factory_() : nullptr;
    if (!orchestrator) {
        return BatchItemResult{keyword,
                               PipelineError{ErrorCategory::Internal,
                                             "Orchestrator factory returned nothing.",
                                             "missing_collaborator"}};
    }

    WorkflowScope scope(*orchestrator);
    return BatchItemResult{keyword, scope->run_full_workflow(keyword)};
}

std::vector<BatchItemResult> BatchRunner::run(const std::vector<std::string>& keywords) const {
    std::vector<BatchItemResult> results;
    results.reserve(keywords.size());

    std::size_t next = 0;
    bool stop = false;
    while (next < keywords.size() && !stop) {
        const std::size_t wave_end = std::min(keywords.size(), next + options_.max_parallel);
        LOG_INFO("BatchRunner: starting keywords " + std::to_string(next + 1) + "-" +
                 std::to_string(wave_end) + " of " + std::to_string(keywords.size()));

        std::vector<std::future<BatchItemResult>> wave;
        for (std::size_t i = next; i < wave_end; ++i) {
            wave.push_back(std::async(std::launch::async, &BatchRunner::run_one, this,
                                      std::cref(keywords[i])));
        }
        for (auto& pending : wave) {
            BatchItemResult item = pending.get();
            if (core::errors::is_error(item.outcome)) {
                LOG_ERROR("BatchRunner: '" + item.keyword + "' failed: " +
                          core::errors::get_error(item.outcome).message);
                stop = stop || !options_.continue_on_error;
            } else {
                LOG_INFO("BatchRunner: '" + item.keyword + "' -> " +
                         core::errors::get_value(item.outcome).string());
            }
            results.push_back(std::move(item));
        }
        next = wave_end;
    }

    if (stop && next < keywords.size()) {
        LOG_WARN("BatchRunner: stopped after a failure; " +
                 std::to_string(keywords.size() - next) + " keywords not started");
    }
    return results;
}

}  // namespace seoflow::runtime
