#include "protocol/content_json.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace seoflow::protocol {

using core::errors::ErrorCategory;
using core::errors::PipelineError;
using nlohmann::json;

namespace {

json source_to_json(const AcademicSource& source) {
    json payload;
    payload["title"] = source.title;
    payload["url"] = source.url;
    payload["excerpt"] = source.excerpt;
    payload["domain"] = source.domain;
    payload["credibility_score"] = source.credibility_score;
    payload["authors"] = source.authors;
    payload["publication_date"] =
        source.publication_date.has_value() ? json(source.publication_date.value()) : json(nullptr);
    payload["journal_name"] =
        source.journal_name.has_value() ? json(source.journal_name.value()) : json(nullptr);
    payload["source_type"] = source.source_type;
    return payload;
}

std::optional<std::string> optional_string(const json& payload, const char* key) {
    if (!payload.contains(key) || payload[key].is_null()) {
        return std::nullopt;
    }
    return payload[key].get<std::string>();
}

AcademicSource source_from_json(const json& payload) {
    AcademicSource source;
    source.title = payload.value("title", std::string{});
    source.url = payload.value("url", std::string{});
    source.excerpt = payload.value("excerpt", std::string{});
    source.domain = payload.value("domain", std::string{});
    source.credibility_score = payload.value("credibility_score", 0.0);
    source.authors = payload.value("authors", std::vector<std::string>{});
    source.publication_date = optional_string(payload, "publication_date");
    source.journal_name = optional_string(payload, "journal_name");
    source.source_type = payload.value("source_type", std::string{"web"});
    return source;
}

PipelineError decode_failure(const std::string& what, const std::string& detail) {
    return PipelineError{ErrorCategory::Validation,
                         "Unable to decode " + what + ": " + detail,
                         "payload_malformed"};
}

}  // namespace

json research_to_json(const ResearchResult& research) {
    json payload;
    payload["keyword"] = research.keyword;
    payload["research_summary"] = research.research_summary;
    payload["academic_sources"] = json::array();
    for (const auto& source : research.academic_sources) {
        payload["academic_sources"].push_back(source_to_json(source));
    }
    payload["key_statistics"] = research.key_statistics;
    payload["research_gaps"] = research.research_gaps;
    payload["main_findings"] = research.main_findings;
    payload["total_sources_analyzed"] = research.total_sources_analyzed;
    payload["search_query_used"] = research.search_query_used;
    payload["research_timestamp"] = research.research_timestamp;
    return payload;
}

json article_to_json(const ArticleResult& article) {
    json payload;
    payload["title"] = article.title;
    payload["meta_description"] = article.meta_description;
    payload["focus_keyword"] = article.focus_keyword;
    payload["introduction"] = article.introduction;
    payload["main_sections"] = json::array();
    for (const auto& section : article.main_sections) {
        json entry;
        entry["heading"] = section.heading;
        entry["content"] = section.content;
        entry["subsections"] = json::array();
        for (const auto& sub : section.subsections) {
            entry["subsections"].push_back({{"heading", sub.heading}, {"content", sub.content}});
        }
        payload["main_sections"].push_back(std::move(entry));
    }
    payload["conclusion"] = article.conclusion;
    payload["word_count"] = article.word_count;
    payload["reading_time_minutes"] = article.reading_time_minutes;
    payload["keyword_density"] = article.keyword_density;
    payload["internal_links"] = article.internal_links;
    payload["external_links"] = article.external_links;
    payload["sources_used"] = article.sources_used;
    return payload;
}

core::errors::Result<ResearchResult> research_from_json(const json& payload) {
    if (!payload.is_object()) {
        return decode_failure("research payload", "expected an object");
    }
    try {
        ResearchResult research;
        research.keyword = payload.value("keyword", std::string{});
        research.research_summary = payload.value("research_summary", std::string{});
        if (payload.contains("academic_sources")) {
            for (const auto& entry : payload.at("academic_sources")) {
                research.academic_sources.push_back(source_from_json(entry));
            }
        }
        research.key_statistics = payload.value("key_statistics", std::vector<std::string>{});
        research.research_gaps = payload.value("research_gaps", std::vector<std::string>{});
        research.main_findings = payload.value("main_findings", std::vector<std::string>{});
        research.total_sources_analyzed = payload.value("total_sources_analyzed", 0U);
        research.search_query_used = payload.value("search_query_used", std::string{});
        research.research_timestamp = payload.value("research_timestamp", std::string{});
        return research;
    } catch (const json::exception& e) {
        return decode_failure("research payload", e.what());
    }
}

core::errors::Result<ArticleResult> article_from_json(const json& payload) {
    if (!payload.is_object()) {
        return decode_failure("article payload", "expected an object");
    }
    try {
        ArticleResult article;
        article.title = payload.value("title", std::string{});
        article.meta_description = payload.value("meta_description", std::string{});
        article.focus_keyword = payload.value("focus_keyword", std::string{});
        article.introduction = payload.value("introduction", std::string{});
        if (payload.contains("main_sections")) {
            for (const auto& entry : payload.at("main_sections")) {
                ArticleSection section;
                section.heading = entry.value("heading", std::string{});
                section.content = entry.value("content", std::string{});
                if (entry.contains("subsections") && !entry["subsections"].is_null()) {
                    for (const auto& sub : entry.at("subsections")) {
                        section.subsections.push_back(
                            ArticleSubsection{sub.value("heading", std::string{}),
                                              sub.value("content", std::string{})});
                    }
                }
                article.main_sections.push_back(std::move(section));
            }
        }
        article.conclusion = payload.value("conclusion", std::string{});
        article.word_count = payload.value("word_count", 0U);
        article.reading_time_minutes = payload.value("reading_time_minutes", 0U);
        article.keyword_density = payload.value("keyword_density", 0.0);
        article.internal_links = payload.value("internal_links", std::vector<std::string>{});
        article.external_links = payload.value("external_links", std::vector<std::string>{});
        article.sources_used = payload.value("sources_used", std::vector<std::string>{});
        return article;
    } catch (const json::exception& e) {
        return decode_failure("article payload", e.what());
    }
}

}  // namespace seoflow::protocol
