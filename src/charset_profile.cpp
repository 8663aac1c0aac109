#include "pwcheck/charset_profile.hpp"

#include "pwcheck/text.hpp"

namespace pwcheck {

auto detect_charset(std::u32string_view code_points) noexcept -> CharsetProfile {
    CharsetProfile profile;

    for (const char32_t c : code_points) {
        if (is_ascii_lower(c)) {
            profile.has_lower = true;
        } else if (is_ascii_upper(c)) {
            profile.has_upper = true;
        } else if (is_ascii_digit(c)) {
            profile.has_digit = true;
        } else {
            profile.has_symbol = true;
        }
    }

    return profile;
}

} // namespace pwcheck
