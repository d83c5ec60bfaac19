#pragma once
#include <string>
#include <variant>

namespace seoflow::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Validation,   // E.g., empty keyword, uncited article, corrupt snapshot
        Transient,    // E.g., research API timed out; safe to retry
        Commit,       // E.g., rename of the staging directory failed
        Persistence,  // E.g., snapshot could not be written or read
        Cancelled,    // Caller asked the workflow to stop
        Internal      // E.g., illegal state transition
    };

    // The standardized error payload
    struct PipelineError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";
        };

    // 2. Propagation strategy (Result object)
    // A Result holds either a successful value of type T, OR a PipelineError.
    template <typename T>
    using Result = std::variant<T, PipelineError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<PipelineError>(result);
    }

    template <typename T>
    const PipelineError& get_error(const Result<T>& result) {
        return std::get<PipelineError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Validation:  return "validation";
            case ErrorCategory::Transient:   return "transient";
            case ErrorCategory::Commit:      return "commit";
            case ErrorCategory::Persistence: return "persistence";
            case ErrorCategory::Cancelled:   return "cancelled";
            case ErrorCategory::Internal:    return "internal";
            default: return "unknown";
        }
    }

} // namespace seoflow::core::errors
