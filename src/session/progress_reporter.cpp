#include "session/progress_reporter.hpp"

#include <exception>
#include <utility>
#include "core/logging/logger.hpp"

namespace seoflow::session {

void ProgressReporter::set_callback(ProgressCallback callback) {
    callback_ = std::move(callback);
}

bool ProgressReporter::has_callback() const {
    return static_cast<bool>(callback_);
}

void ProgressReporter::report(const std::string& phase,
                              const std::string& message) const {
    LOG_DEBUG("Progress [" + phase + "]: " + message);
    if (!callback_) {
        return;
    }
    try {
        callback_(phase, message);
    } catch (const std::exception& e) {
        LOG_WARN("ProgressReporter: callback failed for phase " + phase + ": " + e.what());
    }
}

}  // namespace seoflow::session
