#pragma once

#include <functional>
#include <string>

namespace seoflow::session {

using ProgressCallback = std::function<void(const std::string& phase, const std::string& message)>;

// Synchronous (phase, message) delivery to an external UI. A no-op when no
// callback is installed.
class ProgressReporter {
public:
    void set_callback(ProgressCallback callback);
    bool has_callback() const;

    // A throwing callback is logged and otherwise ignored.
    void report(const std::string& phase, const std::string& message) const;

private:
    ProgressCallback callback_;
};

}  // namespace seoflow::session
