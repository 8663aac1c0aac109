#include "pwcheck/analysis_result.hpp"

#include <algorithm> // For std::ranges::find
#include <format>    // For std::format, std::format_to
#include <iterator>  // For std::back_inserter

namespace pwcheck {

namespace {

auto escape_json(std::string_view text) -> std::string {
    std::string escaped;
    escaped.reserve(text.size());
    for (const char c : text) {
        switch (c) {
            case '"': escaped += R"(\")"; break;
            case '\\': escaped += R"(\\)"; break;
            case '\n': escaped += R"(\n)"; break;
            case '\t': escaped += R"(\t)"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    std::format_to(std::back_inserter(escaped), "\\u{:04x}", static_cast<unsigned>(c));
                } else {
                    escaped += c;
                }
        }
    }
    return escaped;
}

} // namespace

auto AnalysisResult::has_pattern(PatternKind kind) const noexcept -> bool {
    return std::ranges::find(patterns, kind) != patterns.end();
}

auto AnalysisResult::to_json() const -> std::string {
    std::string notes_json;
    for (const auto& note : notes) {
        if (!notes_json.empty()) {
            notes_json += ", ";
        }
        std::format_to(std::back_inserter(notes_json), R"("{}")", escape_json(note));
    }

    std::string patterns_json;
    for (const auto kind : patterns) {
        if (!patterns_json.empty()) {
            patterns_json += ", ";
        }
        std::format_to(std::back_inserter(patterns_json), R"("{}")", pattern_kind_name(kind));
    }

    return std::format(R"({{
    "score": {},
    "tier": "{}",
    "entropy_bits": {:.2f},
    "length": {},
    "charset": {{"lower": {}, "upper": {}, "digit": {}, "symbol": {}}},
    "patterns": [{}],
    "notes": [{}]
}})",
        score, tier_name(), entropy_bits, length,
        charset.has_lower, charset.has_upper, charset.has_digit, charset.has_symbol,
        patterns_json, notes_json);
}

} // namespace pwcheck
