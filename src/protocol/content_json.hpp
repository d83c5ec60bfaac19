#pragma once

#include <nlohmann/json.hpp>
#include "core/errors/pipeline_errors.hpp"
#include "protocol/content_contract.hpp"

namespace seoflow::protocol {

nlohmann::json research_to_json(const ResearchResult& research);
nlohmann::json article_to_json(const ArticleResult& article);

// Decoding tolerates missing optional fields but rejects wrong types.
core::errors::Result<ResearchResult> research_from_json(const nlohmann::json& payload);
core::errors::Result<ArticleResult> article_from_json(const nlohmann::json& payload);

}  // namespace seoflow::protocol
