#include "pwcheck/charset_profile.hpp"
#include "pwcheck/text.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

using pwcheck::CharsetProfile;
using pwcheck::decode_code_points;
using pwcheck::detect_charset;

static void expect(bool cond, const std::string& msg) {
    if (!cond) {
        std::cerr << "Test failed: " << msg << std::endl;
        std::exit(1);
    }
}

int main() {
    // Empty input: no categories, alphabet floored at 1
    const auto empty = detect_charset(U"");
    expect(empty.category_count() == 0, "empty has no categories");
    expect(empty.alphabet_size() == 1, "empty alphabet floors at 1");

    // Single categories
    expect(detect_charset(U"abc").alphabet_size() == 26, "lowercase alphabet is 26");
    expect(detect_charset(U"ABC").alphabet_size() == 26, "uppercase alphabet is 26");
    expect(detect_charset(U"123").alphabet_size() == 10, "digit alphabet is 10");
    expect(detect_charset(U"!@#").alphabet_size() == 32, "symbol alphabet is 32");

    // All four categories are additive: 26 + 26 + 10 + 32
    const auto all = detect_charset(decode_code_points("Kumari@2025!"));
    expect(all.has_all_categories(), "Kumari@2025! uses all four categories");
    expect(all.alphabet_size() == 94, "all categories give 94");

    // Space and non-ASCII characters are symbols
    const auto spaced = detect_charset(U"a b");
    expect(spaced.has_lower && spaced.has_symbol && !spaced.has_upper, "space counts as a symbol");
    const auto accented = detect_charset(decode_code_points("\xC3\xA9t\xC3\xA9"));
    expect(accented.has_symbol && accented.has_lower, "non-ASCII letters are opaque symbols");
    expect(accented.category_count() == 2, "accented word has two categories");

    // Decoding counts characters, not bytes
    expect(decode_code_points("na\xC3\xAFve").size() == 5, "two-byte sequence is one character");
    expect(decode_code_points("\xE2\x82\xAC").size() == 1, "three-byte sequence is one character");
    expect(decode_code_points("\xF0\x9F\x94\x91").size() == 1, "four-byte sequence is one character");
    expect(decode_code_points("\xF0\x9F\x94\x91") == std::u32string{U'\U0001F511'}, "four-byte value decoded");

    // Malformed bytes are kept as one opaque character each
    const auto malformed = decode_code_points("a\xC3(b\xFF");
    expect(malformed.size() == 5, "malformed bytes are single characters");
    expect(malformed[1] == pwcheck::opaque_byte(0xC3), "truncated lead byte kept as an opaque character");
    const auto truncated = decode_code_points("\xE2\x82");
    expect(truncated.size() == 2, "sequence cut by end of input splits into bytes");

    // Overlong forms, surrogates and values above U+10FFFF are rejected byte by byte
    const auto overlong = decode_code_points("\xE0\x80\x80");
    expect(overlong.size() == 3, "overlong three-byte NUL is three opaque bytes");
    expect(overlong[0] == pwcheck::opaque_byte(0xE0), "overlong lead is opaque");
    expect(decode_code_points("\xF0\x80\x80\x80").size() == 4, "overlong four-byte form rejected");
    expect(decode_code_points("\xC0\xAF").size() == 2, "C0 lead is never valid");
    expect(decode_code_points("\xED\xA0\x80").size() == 3, "UTF-16 surrogate rejected");
    expect(decode_code_points("\xF4\x90\x80\x80").size() == 4, "value above U+10FFFF rejected");
    expect(decode_code_points("\xED\x9F\xBF") == std::u32string{U'\uD7FF'}, "last code point before surrogates");
    expect(decode_code_points("\xF4\x8F\xBF\xBF") == std::u32string{U'\U0010FFFF'}, "U+10FFFF accepted");

    // An opaque byte never equals the character with the same number
    const auto lone = decode_code_points("\xE9");
    expect(lone.size() == 1 && lone[0] != U'\u00E9', "lone E9 byte is not U+00E9");
    const auto mixed = decode_code_points("\xE9\xC3\xA9\xE9");
    expect(mixed.size() == 3, "opaque, decoded, opaque");
    expect(mixed[0] == mixed[2] && mixed[0] != mixed[1], "opaque bytes differ from the decoded character");
    expect(detect_charset(lone).has_symbol, "opaque bytes are symbols");

    expect(pwcheck::to_lower_ascii("PassWORD!\xC3\x89") == "password!\xC3\x89", "ASCII-only lowercasing");

    std::cout << "All tests passed." << std::endl;
    return 0;
}
