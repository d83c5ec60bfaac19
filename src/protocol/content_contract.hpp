#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace seoflow::protocol {

// One source surfaced by the research operation.
struct AcademicSource {
    std::string title;
    std::string url;
    std::string excerpt;
    std::string domain;
    double credibility_score = 0.0;
    std::vector<std::string> authors;
    std::optional<std::string> publication_date;
    std::optional<std::string> journal_name;
    std::string source_type = "web";
};

struct ResearchResult {
    std::string keyword;
    std::string research_summary;
    std::vector<AcademicSource> academic_sources;
    std::vector<std::string> key_statistics;
    std::vector<std::string> research_gaps;
    std::vector<std::string> main_findings;
    std::uint32_t total_sources_analyzed = 0;
    std::string search_query_used;
    std::string research_timestamp;

    // Highest credibility first; ties keep research order.
    std::vector<AcademicSource> top_sources(std::size_t n) const {
        std::vector<AcademicSource> sorted = academic_sources;
        std::stable_sort(sorted.begin(), sorted.end(),
                         [](const AcademicSource& a, const AcademicSource& b) {
                             return a.credibility_score > b.credibility_score;
                         });
        if (sorted.size() > n) {
            sorted.resize(n);
        }
        return sorted;
    }

    std::size_t usable_source_count(double min_credibility) const {
        return static_cast<std::size_t>(std::count_if(
            academic_sources.begin(), academic_sources.end(),
            [min_credibility](const AcademicSource& s) {
                return !s.url.empty() && s.credibility_score >= min_credibility;
            }));
    }
};

struct ArticleSubsection {
    std::string heading;
    std::string content;
};

struct ArticleSection {
    std::string heading;
    std::string content;
    std::vector<ArticleSubsection> subsections;
};

struct ArticleResult {
    std::string title;
    std::string meta_description;
    std::string focus_keyword;
    std::string introduction;
    std::vector<ArticleSection> main_sections;
    std::string conclusion;
    std::uint32_t word_count = 0;
    std::uint32_t reading_time_minutes = 0;
    double keyword_density = 0.0;
    std::vector<std::string> internal_links;
    std::vector<std::string> external_links;
    std::vector<std::string> sources_used;
};

}  // namespace seoflow::protocol
