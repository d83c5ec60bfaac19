#pragma once

#include <optional>
#include <string>

namespace seoflow::protocol {

enum class WorkflowState {
    Initialized,
    Researching,
    ResearchComplete,
    Writing,
    WritingComplete,
    Saving,
    Complete,
    Failed,
    RolledBack
};

inline std::string to_string(const WorkflowState state) {
    switch (state) {
        case WorkflowState::Initialized:
            return "initialized";
        case WorkflowState::Researching:
            return "researching";
        case WorkflowState::ResearchComplete:
            return "research_complete";
        case WorkflowState::Writing:
            return "writing";
        case WorkflowState::WritingComplete:
            return "writing_complete";
        case WorkflowState::Saving:
            return "saving";
        case WorkflowState::Complete:
            return "complete";
        case WorkflowState::Failed:
            return "failed";
        case WorkflowState::RolledBack:
            return "rolled_back";
        default:
            return "unknown";
    }
}

inline std::optional<WorkflowState> parse_workflow_state(const std::string& text) {
    for (const auto state :
         {WorkflowState::Initialized, WorkflowState::Researching,
          WorkflowState::ResearchComplete, WorkflowState::Writing,
          WorkflowState::WritingComplete, WorkflowState::Saving,
          WorkflowState::Complete, WorkflowState::Failed,
          WorkflowState::RolledBack}) {
        if (to_string(state) == text) {
            return state;
        }
    }
    return std::nullopt;
}

inline bool is_terminal(const WorkflowState state) {
    return state == WorkflowState::Complete || state == WorkflowState::RolledBack;
}

// Happy-path edges plus the failure edges. Anything else is illegal.
inline bool is_valid_transition(const WorkflowState from, const WorkflowState to) {
    switch (to) {
        case WorkflowState::Researching:
            return from == WorkflowState::Initialized;
        case WorkflowState::ResearchComplete:
            return from == WorkflowState::Researching;
        case WorkflowState::Writing:
            return from == WorkflowState::ResearchComplete;
        case WorkflowState::WritingComplete:
            return from == WorkflowState::Writing;
        case WorkflowState::Saving:
            return from == WorkflowState::WritingComplete;
        case WorkflowState::Complete:
            return from == WorkflowState::Saving;
        case WorkflowState::Failed:
            return !is_terminal(from) && from != WorkflowState::Failed;
        case WorkflowState::RolledBack:
            return !is_terminal(from);
        case WorkflowState::Initialized:
        default:
            return false;
    }
}

}  // namespace seoflow::protocol
