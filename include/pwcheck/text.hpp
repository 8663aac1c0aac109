// text.hpp
#ifndef PWCHECK_TEXT_HPP
#define PWCHECK_TEXT_HPP

#include <string>      // For std::string, std::u32string
#include <string_view> // For std::string_view, std::u32string_view

namespace pwcheck {

/// @brief Opaque bytes are stored at U+DC00 + byte, inside the low-surrogate block, so
/// they never compare equal to a decoded character.
inline constexpr char32_t OPAQUE_BYTE_BASE{0xDC00};

/// @brief Code point standing in for a byte that is not part of well-formed UTF-8.
[[nodiscard]] auto opaque_byte(unsigned char byte) noexcept -> char32_t;

/// @brief Decodes a UTF-8 byte string into code points.
/// @intuition Password length and character runs are measured in characters, not bytes.
/// @approach Strict decoding: overlong forms, surrogates and values above U+10FFFF are
/// rejected by the second-byte range of their lead. Every byte of a rejected or truncated
/// sequence becomes one opaque character (`opaque_byte`), so decoding never fails.
/// @complexity Time: O(N). Space: O(N).
[[nodiscard]] auto decode_code_points(std::string_view text) -> std::u32string;

/// @brief Returns a copy with ASCII letters folded to lowercase; other bytes are untouched.
/// @complexity Time: O(N). Space: O(N).
[[nodiscard]] auto to_lower_ascii(std::string_view text) -> std::string;

[[nodiscard]] constexpr auto is_ascii_lower(char32_t c) noexcept -> bool {
    return c >= U'a' && c <= U'z';
}

[[nodiscard]] constexpr auto is_ascii_upper(char32_t c) noexcept -> bool {
    return c >= U'A' && c <= U'Z';
}

[[nodiscard]] constexpr auto is_ascii_digit(char32_t c) noexcept -> bool {
    return c >= U'0' && c <= U'9';
}

[[nodiscard]] constexpr auto fold_ascii_case(char32_t c) noexcept -> char32_t {
    return is_ascii_upper(c) ? c - U'A' + U'a' : c;
}

} // namespace pwcheck

#endif // PWCHECK_TEXT_HPP
