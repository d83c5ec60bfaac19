#pragma once

#include "runtime/workflow_orchestrator.hpp"

namespace seoflow::runtime {

// Scoped ownership of one run's on-disk leftovers. When the scope ends and the
// run has not reached COMPLETE (failure, cancellation, early return), the
// staging directory and snapshot are deleted on a best-effort basis.
class WorkflowScope {
public:
    explicit WorkflowScope(WorkflowOrchestrator& orchestrator)
        : orchestrator_(orchestrator) {}

    // release_incomplete() logs its own cleanup failures.
    ~WorkflowScope() { orchestrator_.release_incomplete(); }

    WorkflowScope(const WorkflowScope&) = delete;
    WorkflowScope& operator=(const WorkflowScope&) = delete;

    WorkflowOrchestrator& orchestrator() { return orchestrator_; }
    WorkflowOrchestrator* operator->() { return &orchestrator_; }

private:
    WorkflowOrchestrator& orchestrator_;
};

}  // namespace seoflow::runtime
