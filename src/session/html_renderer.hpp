#pragma once

#include <string>
#include "protocol/content_contract.hpp"

namespace seoflow::session {

std::string escape_html(const std::string& text);

std::string render_article_html(const protocol::ArticleResult& article);

// Inserts the default stylesheet before the first "</head>". Input without a
// head-close marker is returned unchanged.
std::string inject_default_styling(const std::string& html);

// Landing page linking article.html and research.json by relative path.
std::string render_review_page(const std::string& keyword,
                               const protocol::ArticleResult& article,
                               const protocol::ResearchResult& research,
                               const std::string& generated_at);

}  // namespace seoflow::session
