// analyzer.hpp
#ifndef PWCHECK_ANALYZER_HPP
#define PWCHECK_ANALYZER_HPP

#include <array>       // For std::array
#include <cstddef>     // For std::size_t
#include <string>      // For std::string
#include <string_view> // For std::string_view
#include <vector>      // For std::vector

#include "pwcheck/analysis_result.hpp"
#include "pwcheck/charset_profile.hpp"
#include "pwcheck/pattern_detector.hpp"

namespace pwcheck {

/**
 * @brief Heuristic password strength analyzer.
 * @intuition Entropy alone rewards long passwords built from predictable material, so the
 * score starts from an entropy band and then pays for every weak pattern found.
 * @approach
 * 1. Decode to code points and detect the charset profile.
 * 2. Entropy = length * log2(alphabet size).
 * 3. Base score from `ENTROPY_THRESHOLDS` / `BASE_SCORES`.
 * 4. Subtract `PATTERN_PENALTY` per pattern category, floor at 0.
 * 5. Add complexity bonuses for long passwords using all four categories, clamp to 0-10.
 * 6. A common password is capped at `COMMON_PASSWORD_CEILING`.
 * 7. Assemble notes.
 * The analyzer holds only immutable tables; `analyze` is pure and safe to call concurrently.
 * @complexity Time: O(N * K), K being the keyboard table size. Space: O(N).
 */
class Analyzer final {
public:
    static constexpr std::array<double, 4> ENTROPY_THRESHOLDS{28.0, 36.0, 60.0, 80.0};
    static constexpr std::array<int, 5> BASE_SCORES{1, 3, 5, 7, 8}; ///< One more entry than thresholds.
    static constexpr int PATTERN_PENALTY{2};
    static constexpr std::size_t COMPLEXITY_BONUS_LENGTH{12};
    static constexpr std::size_t LONG_PASSWORD_BONUS_LENGTH{16};
    static constexpr int COMMON_PASSWORD_CEILING{1};
    static constexpr std::size_t MIN_RECOMMENDED_LENGTH{8};
    static constexpr double LOW_ENTROPY_BITS{36.0};
    static constexpr int STRONG_SCORE{7};
    static constexpr int MIN_SCORE{0};
    static constexpr int MAX_SCORE{10};

    explicit Analyzer() = default;

    /// @brief Analyzes one password. Total: every input, the empty string included, yields a result.
    /// @param password UTF-8 password; malformed bytes count as one character each.
    [[nodiscard]] auto analyze(std::string_view password) const -> AnalysisResult;

    /// @brief Entropy estimate for `length` characters drawn from the profile's alphabet.
    [[nodiscard]] static auto estimate_entropy(std::size_t length, const CharsetProfile& charset) noexcept -> double;

    /// @brief Score before pattern penalties and bonuses.
    [[nodiscard]] static auto base_score(double entropy_bits) noexcept -> int;

    /// @brief Human-readable warning for a detected pattern.
    [[nodiscard]] static auto pattern_note(PatternKind kind) -> std::string;

private:
    [[nodiscard]] static auto derive_score(const AnalysisResult& partial) noexcept -> int;
    [[nodiscard]] static auto assemble_notes(const AnalysisResult& partial) -> std::vector<std::string>;

    PatternDetector detector_;
};

/// @brief Analyzes a password with a shared, immutable `Analyzer`.
[[nodiscard]] auto analyze(std::string_view password) -> AnalysisResult;

} // namespace pwcheck

#endif // PWCHECK_ANALYZER_HPP
