#include "pwcheck/text.hpp"

#include <cstddef> // For std::size_t

namespace pwcheck {

namespace {

constexpr auto is_continuation_byte(unsigned char byte) noexcept -> bool {
    return (byte & 0xC0U) == 0x80U;
}

/// @brief Valid range of the byte after `lead`. Narrower than 80..BF for the leads that
/// would otherwise admit overlong forms, surrogates or values above U+10FFFF.
constexpr auto second_byte_in_range(unsigned char lead, unsigned char byte) noexcept -> bool {
    switch (lead) {
        case 0xE0U: return byte >= 0xA0U && byte <= 0xBFU;
        case 0xEDU: return byte >= 0x80U && byte <= 0x9FU;
        case 0xF0U: return byte >= 0x90U && byte <= 0xBFU;
        case 0xF4U: return byte >= 0x80U && byte <= 0x8FU;
        default: return is_continuation_byte(byte);
    }
}

} // namespace

auto opaque_byte(unsigned char byte) noexcept -> char32_t {
    return OPAQUE_BYTE_BASE + byte;
}

auto decode_code_points(std::string_view text) -> std::u32string {
    std::u32string code_points;
    code_points.reserve(text.size());

    std::size_t i{0};
    while (i < text.size()) {
        const auto lead{static_cast<unsigned char>(text[i])};

        if (lead < 0x80U) {
            code_points.push_back(lead);
            ++i;
            continue;
        }

        std::size_t width{0};
        char32_t value{0};
        if (lead >= 0xC2U && lead <= 0xDFU) {
            width = 2;
            value = lead & 0x1FU;
        } else if (lead >= 0xE0U && lead <= 0xEFU) {
            width = 3;
            value = lead & 0x0FU;
        } else if (lead >= 0xF0U && lead <= 0xF4U) {
            width = 4;
            value = lead & 0x07U;
        }

        bool well_formed{width != 0 && i + width <= text.size()};
        for (std::size_t k{1}; well_formed && k < width; ++k) {
            const auto byte{static_cast<unsigned char>(text[i + k])};
            well_formed = (k == 1) ? second_byte_in_range(lead, byte) : is_continuation_byte(byte);
            value = (value << 6) | (byte & 0x3FU);
        }

        if (!well_formed) {
            code_points.push_back(opaque_byte(lead));
            ++i;
            continue;
        }

        code_points.push_back(value);
        i += width;
    }

    return code_points;
}

auto to_lower_ascii(std::string_view text) -> std::string {
    std::string lowered{text};
    for (char& c : lowered) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return lowered;
}

} // namespace pwcheck
