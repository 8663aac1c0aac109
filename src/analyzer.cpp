#include "pwcheck/analyzer.hpp"

#include <algorithm> // For std::clamp, std::max, std::min, std::ranges::find_if
#include <cmath>     // For std::log2
#include <format>    // For std::format

#include "pwcheck/text.hpp"

namespace pwcheck {

namespace {

constexpr std::string_view EMPTY_PASSWORD_NOTE{"No password provided."};
constexpr std::string_view STRONG_PASSWORD_NOTE{"No common patterns detected. Looks strong."};
constexpr std::string_view IMPROVEMENT_TIP{
    "Use a longer random phrase: several unrelated words joined by symbols and digits."};

} // namespace

auto Analyzer::analyze(std::string_view password) const -> AnalysisResult {
    AnalysisResult result;

    if (password.empty()) {
        result.notes.emplace_back(EMPTY_PASSWORD_NOTE);
        return result;
    }

    const auto code_points{decode_code_points(password)};
    result.length = code_points.size();
    result.charset = detect_charset(code_points);
    result.entropy_bits = estimate_entropy(result.length, result.charset);
    result.patterns = detector_.detect(code_points, to_lower_ascii(password));
    result.score = derive_score(result);
    result.notes = assemble_notes(result);

    return result;
}

auto Analyzer::estimate_entropy(std::size_t length, const CharsetProfile& charset) noexcept -> double {
    const auto alphabet{static_cast<double>(charset.alphabet_size())};
    return static_cast<double>(length) * std::log2(alphabet);
}

auto Analyzer::base_score(double entropy_bits) noexcept -> int {
    const auto threshold_iterator = std::ranges::find_if(ENTROPY_THRESHOLDS,
        [entropy_bits](double threshold) { return entropy_bits < threshold; });

    const auto band = threshold_iterator - ENTROPY_THRESHOLDS.begin();
    return BASE_SCORES[static_cast<std::size_t>(band)];
}

auto Analyzer::derive_score(const AnalysisResult& partial) noexcept -> int {
    int score{base_score(partial.entropy_bits)};

    const auto penalty{static_cast<int>(partial.patterns.size()) * PATTERN_PENALTY};
    score = std::max(MIN_SCORE, score - penalty);

    if (partial.charset.has_all_categories()) {
        score += (partial.length >= COMPLEXITY_BONUS_LENGTH) ? 1 : 0;
        score += (partial.length >= LONG_PASSWORD_BONUS_LENGTH) ? 1 : 0;
    }

    score = std::clamp(score, MIN_SCORE, MAX_SCORE);

    if (partial.has_pattern(PatternKind::COMMON_PASSWORD)) {
        score = std::min(score, COMMON_PASSWORD_CEILING);
    }

    return score;
}

auto Analyzer::pattern_note(PatternKind kind) -> std::string {
    switch (kind) {
        case PatternKind::REPEATED_CHARACTERS:
            return "Contains repeated characters (e.g., 'aaa', '111').";
        case PatternKind::NUMERIC_SEQUENCE:
            return "Contains a numeric sequence (e.g., '1234', '4321').";
        case PatternKind::ALPHABETIC_SEQUENCE:
            return "Contains an alphabetic sequence (e.g., 'abcd', 'dcba').";
        case PatternKind::KEYBOARD_SEQUENCE:
            return "Contains a keyboard sequence (e.g., 'qwer', 'asdf', 'zxcv').";
        case PatternKind::COMMON_PASSWORD:
            return "Common password (easily guessed).";
    }
    return "Contains a predictable pattern.";
}

auto Analyzer::assemble_notes(const AnalysisResult& partial) -> std::vector<std::string> {
    std::vector<std::string> weaknesses;

    for (const auto kind : partial.patterns) {
        weaknesses.push_back(pattern_note(kind));
    }
    if (partial.length < MIN_RECOMMENDED_LENGTH) {
        weaknesses.push_back(std::format("Too short (< {} characters).", MIN_RECOMMENDED_LENGTH));
    }
    if (partial.charset.category_count() <= 1) {
        weaknesses.emplace_back("Use a mix of lowercase, uppercase, digits, and symbols.");
    }
    if (partial.entropy_bits < LOW_ENTROPY_BITS) {
        weaknesses.emplace_back("Low entropy: use a longer password with more character variety.");
    }

    if (weaknesses.empty() && partial.score >= STRONG_SCORE) {
        return {std::string{STRONG_PASSWORD_NOTE}};
    }

    weaknesses.emplace_back(IMPROVEMENT_TIP);
    return weaknesses;
}

auto analyze(std::string_view password) -> AnalysisResult {
    static const Analyzer analyzer{};
    return analyzer.analyze(password);
}

} // namespace pwcheck
