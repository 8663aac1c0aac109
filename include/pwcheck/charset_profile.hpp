// charset_profile.hpp
#ifndef PWCHECK_CHARSET_PROFILE_HPP
#define PWCHECK_CHARSET_PROFILE_HPP

#include <algorithm>   // For std::max
#include <string_view> // For std::u32string_view

namespace pwcheck {

/// @brief Character categories present in a password.
/// @intuition A password drawing on more categories comes from a larger alphabet.
/// @approach Alphabet sizes are additive per category: 26 lowercase, 26 uppercase,
/// 10 digits, 32 symbols. Any character that is not an ASCII letter or digit
/// (space and non-ASCII included) is a symbol.
struct CharsetProfile final {
    static constexpr int LOWER_ALPHABET_SIZE{26};
    static constexpr int UPPER_ALPHABET_SIZE{26};
    static constexpr int DIGIT_ALPHABET_SIZE{10};
    static constexpr int SYMBOL_ALPHABET_SIZE{32}; ///< Printable ASCII symbols, excluding space.

    bool has_lower{false};
    bool has_upper{false};
    bool has_digit{false};
    bool has_symbol{false};

    /// @brief Number of categories present, 0 to 4.
    [[nodiscard]] constexpr auto category_count() const noexcept -> int {
        return static_cast<int>(has_lower) + static_cast<int>(has_upper) +
               static_cast<int>(has_digit) + static_cast<int>(has_symbol);
    }

    [[nodiscard]] constexpr auto has_all_categories() const noexcept -> bool {
        return category_count() == 4;
    }

    /// @brief Estimated alphabet size, floored at 1 for log2 safety.
    /// @complexity Time: O(1). Space: O(1).
    [[nodiscard]] constexpr auto alphabet_size() const noexcept -> int {
        int size{0};
        if (has_lower) size += LOWER_ALPHABET_SIZE;
        if (has_upper) size += UPPER_ALPHABET_SIZE;
        if (has_digit) size += DIGIT_ALPHABET_SIZE;
        if (has_symbol) size += SYMBOL_ALPHABET_SIZE;
        return std::max(1, size);
    }

    friend constexpr auto operator==(const CharsetProfile&, const CharsetProfile&) -> bool = default;
};

/// @brief Scans the code points once and records which categories occur.
/// @complexity Time: O(N). Space: O(1).
[[nodiscard]] auto detect_charset(std::u32string_view code_points) noexcept -> CharsetProfile;

} // namespace pwcheck

#endif // PWCHECK_CHARSET_PROFILE_HPP
