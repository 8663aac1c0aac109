// pattern_detector.hpp
#ifndef PWCHECK_PATTERN_DETECTOR_HPP
#define PWCHECK_PATTERN_DETECTOR_HPP

#include <array>         // For std::array
#include <cstddef>       // For std::size_t
#include <cstdint>       // For std::uint8_t
#include <functional>    // For std::hash, std::equal_to
#include <string>        // For std::string
#include <string_view>   // For std::string_view, std::u32string_view
#include <unordered_set> // For std::unordered_set
#include <vector>        // For std::vector

namespace pwcheck {

/// @brief Weak-pattern categories; each one detected costs a fixed score penalty.
enum class PatternKind : std::uint8_t {
    REPEATED_CHARACTERS = 0,
    NUMERIC_SEQUENCE = 1,
    ALPHABETIC_SEQUENCE = 2,
    KEYBOARD_SEQUENCE = 3,
    COMMON_PASSWORD = 4
};

/// @brief Short identifier of a pattern kind, as used in JSON output and logs.
[[nodiscard]] auto pattern_kind_name(PatternKind kind) noexcept -> std::string_view;

/// @brief Hashes `std::string` keys and `std::string_view` probes alike, so the
/// common-password set can be searched without allocating.
struct TransparentStringHasher {
    using is_transparent = void;

    [[nodiscard]] auto operator()(std::string_view sv) const noexcept -> std::size_t {
        return std::hash<std::string_view>{}(sv);
    }
};

using TransparentStringSet = std::unordered_set<std::string, TransparentStringHasher, std::equal_to<>>;

/**
 * @brief Detects the weak patterns that reduce a password's score.
 * @intuition Length times log2(alphabet) overestimates passwords built from runs,
 * sequences, keyboard rows or well-known choices; those are flagged separately.
 * @approach Each category is checked independently. Runs are measured on code points;
 * the keyboard and common-password tables are static ASCII lists matched against an
 * ASCII-lowercased copy of the password.
 * @complexity Time: O(N * K) where K is the keyboard table size. Space: O(N + M)
 * for the lowercase copy and the common-password set.
 */
class PatternDetector final {
public:
    static constexpr std::size_t MIN_REPEAT_RUN{3};
    static constexpr std::size_t MIN_SEQUENCE_RUN{4};

    /// @brief Every four-key window of the three letter rows, forwards and reversed.
    static constexpr std::array<std::string_view, 34> KEYBOARD_SEQUENCES{
        "qwer", "wert", "erty", "rtyu", "tyui", "yuio", "uiop",
        "asdf", "sdfg", "dfgh", "fghj", "ghjk", "hjkl",
        "zxcv", "xcvb", "cvbn", "vbnm",
        "rewq", "trew", "ytre", "uytr", "iuyt", "oiuy", "poiu",
        "fdsa", "gfds", "hgfd", "jhgf", "kjhg", "lkjh",
        "vcxz", "bvcx", "nbvc", "mnbv"
    };

    /// @brief Loads the common-password table.
    explicit PatternDetector();

    /// @brief Runs every detector and returns the categories found, in `PatternKind` order.
    /// @param code_points The password, decoded by `decode_code_points`.
    /// @param lowered The UTF-8 password after `to_lower_ascii`.
    [[nodiscard]] auto detect(std::u32string_view code_points, std::string_view lowered) const
        -> std::vector<PatternKind>;

    /// @brief True if some character occurs `MIN_REPEAT_RUN` or more times in a row.
    [[nodiscard]] static auto has_repeated_run(std::u32string_view code_points) noexcept -> bool;

    /// @brief True for a run of `MIN_SEQUENCE_RUN` digits stepping by +1 or by -1 throughout.
    [[nodiscard]] static auto has_numeric_sequence(std::u32string_view code_points) noexcept -> bool;

    /// @brief Same as `has_numeric_sequence` for ASCII letters, ignoring case.
    [[nodiscard]] static auto has_alphabetic_sequence(std::u32string_view code_points) noexcept -> bool;

    /// @brief Substring match against `KEYBOARD_SEQUENCES`.
    /// @param lowered ASCII-lowercased password.
    [[nodiscard]] static auto has_keyboard_sequence(std::string_view lowered) noexcept -> bool;

    /// @brief Exact match against the common-password table.
    /// @param lowered ASCII-lowercased password.
    [[nodiscard]] auto is_common_password(std::string_view lowered) const -> bool;

private:
    TransparentStringSet common_passwords_; ///< Well-known weak passwords, lowercase.
};

} // namespace pwcheck

#endif // PWCHECK_PATTERN_DETECTOR_HPP
