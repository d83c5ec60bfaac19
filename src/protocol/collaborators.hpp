#pragma once

#include <filesystem>
#include <string>
#include "core/errors/pipeline_errors.hpp"
#include "protocol/content_contract.hpp"

namespace seoflow::protocol {

// Produces research for a keyword. Retryable failures must carry
// ErrorCategory::Transient; an empty source list is returned as a value.
class ResearchOperation {
public:
    virtual ~ResearchOperation() = default;
    virtual core::errors::Result<ResearchResult> research(const std::string& keyword) = 0;
};

class WritingOperation {
public:
    virtual ~WritingOperation() = default;
    virtual core::errors::Result<ArticleResult> write(const std::string& keyword,
                                                      const ResearchResult& research) = 0;
};

// Best-effort publication of a committed output directory (e.g. a cloud
// document upload). Returns a remote reference on success.
class PublishSink {
public:
    virtual ~PublishSink() = default;
    virtual core::errors::Result<std::string> publish(const std::filesystem::path& output_dir,
                                                      const std::string& keyword) = 0;
};

}  // namespace seoflow::protocol
