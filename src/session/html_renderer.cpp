#include "session/html_renderer.hpp"

#include <cstddef>
#include <iomanip>
#include <sstream>
#include "core/config/session_id.hpp"

namespace seoflow::session {

namespace {

constexpr const char* kHeadClose = "</head>";

constexpr const char* kDefaultStyle = R"(<style>
    body {
        font-family: -apple-system, BlinkMacSystemFont, 'Segoe UI', Roboto, sans-serif;
        line-height: 1.6;
        color: #333;
        max-width: 800px;
        margin: 0 auto;
        padding: 20px;
        background-color: #f9f9f9;
    }
    h1 { color: #2c3e50; border-bottom: 3px solid #3498db; padding-bottom: 10px; margin-bottom: 30px; }
    h2 { color: #34495e; margin-top: 30px; margin-bottom: 15px; }
    h3 { color: #7f8c8d; margin-top: 20px; margin-bottom: 10px; }
    .reading-time { color: #7f8c8d; font-style: italic; margin-bottom: 20px; }
    .introduction { font-size: 1.1em; color: #555; background-color: #ecf0f1; padding: 15px; border-radius: 5px; margin-bottom: 30px; }
    .conclusion { background-color: #e8f8f5; padding: 15px; border-radius: 5px; margin-top: 30px; border-left: 4px solid #27ae60; }
    .section-content, .subsection-content { margin-bottom: 20px; text-align: justify; }
</style>
)";

constexpr const char* kReviewStyle = R"(<style>
    body { font-family: -apple-system, BlinkMacSystemFont, 'Segoe UI', Roboto, sans-serif; margin: 0; padding: 20px; background-color: #f0f0f0; }
    .container { max-width: 1200px; margin: 0 auto; }
    .header { background-color: #2c3e50; color: white; padding: 20px; border-radius: 5px; margin-bottom: 20px; }
    .metrics { display: grid; grid-template-columns: repeat(auto-fit, minmax(200px, 1fr)); gap: 15px; margin-bottom: 20px; }
    .metric { background-color: white; padding: 15px; border-radius: 5px; text-align: center; box-shadow: 0 2px 4px rgba(0,0,0,0.1); }
    .metric-value { font-size: 2em; font-weight: bold; color: #3498db; }
    .metric-label { color: #7f8c8d; font-size: 0.9em; }
    .content-preview { background-color: white; padding: 20px; border-radius: 5px; margin-bottom: 20px; box-shadow: 0 2px 4px rgba(0,0,0,0.1); }
    .actions { display: flex; gap: 10px; margin-top: 20px; }
    .button { padding: 10px 20px; border: none; border-radius: 5px; text-decoration: none; display: inline-block; color: white; }
    .button-primary { background-color: #3498db; }
    .button-secondary { background-color: #95a5a6; }
</style>
)";

constexpr std::size_t kIntroPreviewChars = 200;

std::string metric(const std::string& value, const std::string& label) {
    return "      <div class='metric'><div class='metric-value'>" + value +
           "</div><div class='metric-label'>" + label + "</div></div>\n";
}

}  // namespace

std::string escape_html(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (const char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out.push_back(c); break;
        }
    }
    return out;
}

std::string render_article_html(const protocol::ArticleResult& article) {
    std::ostringstream html;
    html << "<!DOCTYPE html>\n"
         << "<html lang='en'>\n"
         << "<head>\n"
         << "  <title>" << escape_html(article.title) << "</title>\n"
         << "  <meta name='description' content='" << escape_html(article.meta_description) << "'>\n"
         << "  <meta name='keywords' content='" << escape_html(article.focus_keyword) << "'>\n"
         << "  <meta charset='UTF-8'>\n"
         << "  <meta name='viewport' content='width=device-width, initial-scale=1.0'>\n"
         << kHeadClose << "\n"
         << "<body>\n"
         << "  <h1>" << escape_html(article.title) << "</h1>\n"
         << "  <p class='reading-time'>" << article.reading_time_minutes << " min read</p>\n"
         << "  <div class='introduction'>" << escape_html(article.introduction) << "</div>\n";

    for (const auto& section : article.main_sections) {
        html << "  <h2>" << escape_html(section.heading) << "</h2>\n"
             << "  <div class='section-content'>" << escape_html(section.content) << "</div>\n";
        for (const auto& sub : section.subsections) {
            html << "    <h3>" << escape_html(sub.heading) << "</h3>\n"
                 << "    <div class='subsection-content'>" << escape_html(sub.content) << "</div>\n";
        }
    }

    html << "  <div class='conclusion'>" << escape_html(article.conclusion) << "</div>\n"
         << "</body>\n"
         << "</html>\n";
    return html.str();
}

std::string inject_default_styling(const std::string& html) {
    const auto pos = html.find(kHeadClose);
    if (pos == std::string::npos) {
        return html;
    }
    std::string styled = html;
    styled.insert(pos, kDefaultStyle);
    return styled;
}

std::string render_review_page(const std::string& keyword,
                               const protocol::ArticleResult& article,
                               const protocol::ResearchResult& research,
                               const std::string& generated_at) {
    std::ostringstream density;
    density << std::fixed << std::setprecision(1) << article.keyword_density * 100.0 << "%";

    std::string intro = core::config::utf8_prefix(article.introduction, kIntroPreviewChars);
    if (intro.size() < article.introduction.size()) {
        intro += "...";
    }

    std::ostringstream html;
    html << "<!DOCTYPE html>\n"
         << "<html lang=\"en\">\n"
         << "<head>\n"
         << "  <meta charset=\"UTF-8\">\n"
         << "  <meta name=\"viewport\" content=\"width=device-width, initial-scale=1.0\">\n"
         << "  <title>Review: " << escape_html(keyword) << "</title>\n"
         << kReviewStyle
         << kHeadClose << "\n"
         << "<body>\n"
         << "  <div class='container'>\n"
         << "    <div class='header'>\n"
         << "      <h1>Content Review: " << escape_html(keyword) << "</h1>\n"
         << "      <p>Generated on " << escape_html(generated_at) << "</p>\n"
         << "    </div>\n"
         << "    <div class='metrics'>\n"
         << metric(std::to_string(article.word_count), "Words")
         << metric(std::to_string(article.reading_time_minutes), "Min Read")
         << metric(std::to_string(research.academic_sources.size()), "Sources")
         << metric(density.str(), "Keyword Density")
         << "    </div>\n"
         << "    <div class='content-preview'>\n"
         << "      <h2>Article Preview</h2>\n"
         << "      <h3>" << escape_html(article.title) << "</h3>\n"
         << "      <p><strong>Meta Description:</strong> " << escape_html(article.meta_description) << "</p>\n"
         << "      <p><strong>Introduction:</strong> " << escape_html(intro) << "</p>\n"
         << "      <div class='actions'>\n"
         << "        <a href=\"article.html\" class=\"button button-primary\">View Full Article</a>\n"
         << "        <a href=\"research.json\" class=\"button button-secondary\">View Research Data</a>\n"
         << "      </div>\n"
         << "    </div>\n"
         << "    <div class='content-preview'>\n"
         << "      <h2>Top Sources Used</h2>\n"
         << "      <ul>\n";

    for (const auto& source : research.top_sources(3)) {
        std::ostringstream score;
        score << std::fixed << std::setprecision(2) << source.credibility_score;
        html << "        <li><a href=\"" << escape_html(source.url) << "\">"
             << escape_html(source.title) << "</a> (Credibility: " << score.str()
             << ")</li>\n";
    }

    html << "      </ul>\n"
         << "    </div>\n"
         << "  </div>\n"
         << "</body>\n"
         << "</html>\n";
    return html.str();
}

}  // namespace seoflow::session
