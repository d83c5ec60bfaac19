#pragma once
#include <cctype>
#include <chrono>
#include <cstddef>
#include <ctime>
#include <random>
#include <sstream>
#include <string>

namespace seoflow::core::config {

    inline bool is_utf8_continuation(const char c) {
        return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
    }

    // Characters, not bytes. Continuation bytes are not counted.
    inline std::size_t utf8_length(const std::string& text) {
        std::size_t count = 0;
        for (const char c : text) {
            if (!is_utf8_continuation(c)) {
                ++count;
            }
        }
        return count;
    }

    // The first max_chars characters of text, never splitting a sequence.
    inline std::string utf8_prefix(const std::string& text, const std::size_t max_chars) {
        std::size_t chars = 0;
        for (std::size_t i = 0; i < text.size(); ++i) {
            if (!is_utf8_continuation(text[i]) && chars++ == max_chars) {
                return text.substr(0, i);
            }
        }
        return text;
    }

    // Keeps [A-Za-z0-9_-] and maps every other character to one '_'.
    inline std::string sanitize_keyword(const std::string& keyword) {
        std::string safe;
        safe.reserve(keyword.size());
        for (const char c : keyword) {
            if (is_utf8_continuation(c)) {
                continue;
            }
            const auto uc = static_cast<unsigned char>(c);
            if (uc < 0x80 && (std::isalnum(uc) != 0 || c == '-' || c == '_')) {
                safe.push_back(c);
            } else {
                safe.push_back('_');
            }
        }
        return safe;
    }

    inline std::tm local_time(const std::chrono::system_clock::time_point tp) {
        const std::time_t t = std::chrono::system_clock::to_time_t(tp);
        std::tm tm{};
        localtime_r(&t, &tm);
        return tm;
    }

    // "20240101_093000", used in directory and snapshot names
    inline std::string compact_timestamp(
        const std::chrono::system_clock::time_point tp = std::chrono::system_clock::now()) {
        char buf[32];
        const std::tm tm = local_time(tp);
        std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
        return buf;
    }

    // "2024-01-01T09:30:00", used inside snapshot documents
    inline std::string iso_timestamp(
        const std::chrono::system_clock::time_point tp = std::chrono::system_clock::now()) {
        char buf[32];
        const std::tm tm = local_time(tp);
        std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
        return buf;
    }

    // Generates a simple 8-character hex suffix
    inline std::string random_hex_suffix() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    // <sanitized_keyword>_<YYYYmmdd_HHMMSS>_<8 hex>
    inline std::string generate_session_id(const std::string& keyword) {
        return sanitize_keyword(keyword) + "_" + compact_timestamp() + "_" +
               random_hex_suffix();
    }

} // namespace seoflow::core::config
