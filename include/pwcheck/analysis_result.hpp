// analysis_result.hpp
#ifndef PWCHECK_ANALYSIS_RESULT_HPP
#define PWCHECK_ANALYSIS_RESULT_HPP

#include <array>       // For std::array
#include <cstddef>     // For std::size_t
#include <cstdint>     // For std::uint8_t
#include <string>      // For std::string
#include <string_view> // For std::string_view
#include <utility>     // For std::to_underlying
#include <vector>      // For std::vector

#include "pwcheck/charset_profile.hpp"
#include "pwcheck/pattern_detector.hpp"

namespace pwcheck {

/// @brief Descriptive bands over the 0-10 score.
enum class StrengthTier : std::uint8_t {
    VERY_WEAK = 0,   ///< 0-2
    WEAK = 1,        ///< 3-4
    FAIR = 2,        ///< 5-6
    STRONG = 3,      ///< 7-8
    VERY_STRONG = 4  ///< 9-10
};

/// @brief Maps a score onto its tier; scores outside [0, 10] fall into the nearest band.
/// @complexity Time: O(1). Space: O(1).
[[nodiscard]] constexpr auto tier_for_score(int score) noexcept -> StrengthTier {
    if (score >= 9) return StrengthTier::VERY_STRONG;
    if (score >= 7) return StrengthTier::STRONG;
    if (score >= 5) return StrengthTier::FAIR;
    if (score >= 3) return StrengthTier::WEAK;
    return StrengthTier::VERY_WEAK;
}

[[nodiscard]] constexpr auto tier_name(StrengthTier tier) noexcept -> std::string_view {
    constexpr std::array<std::string_view, 5> names{
        "Very Weak", "Weak", "Fair", "Strong", "Very Strong"
    };
    return names[static_cast<std::size_t>(std::to_underlying(tier))];
}

/// @brief Complete analysis report for one password.
struct AnalysisResult final {
    int score{0};                       ///< Heuristic strength, 0 to 10.
    double entropy_bits{0.0};           ///< length * log2(alphabet size).
    std::size_t length{0};              ///< Character (code point) count.
    std::vector<std::string> notes;     ///< Warnings and advice, in display order.
    CharsetProfile charset;             ///< Categories that drove the alphabet size.
    std::vector<PatternKind> patterns;  ///< Weak patterns found, in detection order.

    [[nodiscard]] constexpr auto tier() const noexcept -> StrengthTier {
        return tier_for_score(score);
    }

    [[nodiscard]] constexpr auto tier_name() const noexcept -> std::string_view {
        return pwcheck::tier_name(tier());
    }

    [[nodiscard]] auto has_pattern(PatternKind kind) const noexcept -> bool;

    /// @brief Serializes the result into a JSON object.
    /// @complexity Time: O(total note length). Space: O(JSON string length).
    [[nodiscard]] auto to_json() const -> std::string;

    friend auto operator==(const AnalysisResult&, const AnalysisResult&) -> bool = default;
};

} // namespace pwcheck

#endif // PWCHECK_ANALYSIS_RESULT_HPP
