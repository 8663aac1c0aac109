#include "pwcheck/analyzer.hpp"

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

using pwcheck::AnalysisResult;
using pwcheck::Analyzer;
using pwcheck::PatternKind;
using pwcheck::StrengthTier;

static void expect(bool cond, const std::string& msg) {
    if (!cond) {
        std::cerr << "Test failed: " << msg << std::endl;
        std::exit(1);
    }
}

static bool note_contains(const AnalysisResult& result, std::string_view needle) {
    for (const auto& note : result.notes) {
        if (note.find(needle) != std::string::npos) return true;
    }
    return false;
}

int main() {
    const Analyzer analyzer;

    // Empty password: zero result, one explanatory note
    const auto empty = analyzer.analyze("");
    expect(empty.entropy_bits == 0.0, "empty entropy is 0");
    expect(empty.length == 0, "empty length is 0");
    expect(empty.score == 0, "empty score is 0");
    expect(empty.tier() == StrengthTier::VERY_WEAK, "empty is in the lowest band");
    expect(empty.notes.size() == 1 && empty.notes[0] == "No password provided.", "empty note");

    // Reference password: 12 chars, all four categories, no weak pattern
    const auto kumari = analyzer.analyze("Kumari@2025!");
    expect(kumari.length == 12, "Kumari length 12");
    expect(std::abs(kumari.entropy_bits - 12.0 * std::log2(94.0)) < 1e-9, "Kumari entropy is 12 * log2(94)");
    expect(kumari.entropy_bits > 78.6 && kumari.entropy_bits < 78.7, "Kumari entropy about 78.6 bits");
    expect(kumari.patterns.empty(), "Kumari has no patterns");
    expect(kumari.score == 8, "Kumari scores 8");
    expect(kumari.tier() == StrengthTier::STRONG, "Kumari is Strong");
    expect(kumari.notes.size() == 1 && note_contains(kumari, "Looks strong"), "Kumari gets the encouraging note");

    // Long, varied, pattern-free password reaches the top band
    const auto long_one = analyzer.analyze("Tr0ub4dor&3xK!9zLm");
    expect(long_one.patterns.empty(), "long password has no patterns");
    expect(long_one.score == 10, "long password scores 10");
    expect(long_one.tier_name() == "Very Strong", "long password is Very Strong");

    // Repeats lower the score relative to a pattern-free password of equal length and charset
    const auto repeated = analyzer.analyze("aaa");
    const auto plain = analyzer.analyze("xqz");
    expect(repeated.has_pattern(PatternKind::REPEATED_CHARACTERS), "aaa repeat detected");
    expect(note_contains(repeated, "repeated"), "aaa note mentions repeats");
    expect(repeated.charset == plain.charset && repeated.length == plain.length, "same shape");
    expect(repeated.score < plain.score, "repeat is penalized");

    const auto numeric = analyzer.analyze("1234");
    expect(note_contains(numeric, "numeric sequence"), "1234 numeric note");

    const auto keyboard = analyzer.analyze("qwer");
    expect(note_contains(keyboard, "keyboard sequence"), "qwer keyboard note");

    const auto alphabetic = analyzer.analyze("xyzabcd!");
    expect(note_contains(alphabetic, "alphabetic sequence"), "abcd alphabetic note");

    // Common password lands in the lowest band despite its entropy
    const auto common = analyzer.analyze("password");
    expect(common.entropy_bits > 36.0, "password entropy alone would be Fair");
    expect(note_contains(common, "Common password"), "password common note");
    expect(common.score <= 2, "password in the lowest band");
    expect(analyzer.analyze("PASSWORD").score <= 2, "common match ignores case");

    // Penalty is per category and never drives the score negative
    const auto stacked = analyzer.analyze("aaa1234qwer");
    expect(stacked.patterns.size() == 3, "three categories stacked");
    expect(stacked.score == 0, "stacked penalties floor at 0");

    // Weak results end with the improvement tip
    expect(note_contains(repeated, "longer random phrase"), "weak result carries the tip");
    expect(note_contains(repeated, "Too short"), "short note");
    expect(note_contains(repeated, "mix of lowercase"), "single category note");
    expect(note_contains(repeated, "Low entropy"), "low entropy note");
    expect(!note_contains(kumari, "longer random phrase"), "strong result has no tip");

    // Determinism
    expect(analyzer.analyze("S0me!Pass") == analyzer.analyze("S0me!Pass"), "same input, same result");
    expect(pwcheck::analyze("S0me!Pass") == analyzer.analyze("S0me!Pass"), "free function matches");

    // Entropy grows with length for a fixed charset
    double previous{0.0};
    std::string grown;
    for (const char c : std::string_view{"Xk9!mQ2#vR7$"}) {
        grown.push_back(c);
        const auto result = analyzer.analyze(grown);
        expect(result.entropy_bits >= previous, "entropy is monotonic in length");
        previous = result.entropy_bits;
    }

    // Bounds over a varied sample
    const std::vector<std::string> samples{
        "", " ", "a", "!!!!!!!!!!!!!!!!!!!!", "0000", "correct horse battery staple",
        "\xC3\xA9\xC3\xA9\xC3\xA9", "ZXCVBNMzxcvbnm1234567890!@#$%^&*()", "\xFF\xFE"
    };
    for (const auto& sample : samples) {
        const auto result = analyzer.analyze(sample);
        expect(result.score >= 0 && result.score <= 10, "score within 0-10");
        expect(result.entropy_bits >= 0.0, "entropy non-negative");
    }

    // Unicode: characters, not bytes
    const auto accented = analyzer.analyze("\xC3\xA9\xC3\xA9\xC3\xA9");
    expect(accented.length == 3, "three accented characters");
    expect(accented.has_pattern(PatternKind::REPEATED_CHARACTERS), "accented repeat");
    expect(std::abs(accented.entropy_bits - 15.0) < 1e-9, "3 * log2(32) for opaque symbols");

    // Base score bands and tier bands
    expect(Analyzer::base_score(0.0) == 1, "below 28 bits");
    expect(Analyzer::base_score(28.0) == 3, "28 bits");
    expect(Analyzer::base_score(36.0) == 5, "36 bits");
    expect(Analyzer::base_score(60.0) == 7, "60 bits");
    expect(Analyzer::base_score(80.0) == 8, "80 bits");

    expect(pwcheck::tier_for_score(2) == StrengthTier::VERY_WEAK, "2 Very Weak");
    expect(pwcheck::tier_for_score(3) == StrengthTier::WEAK, "3 Weak");
    expect(pwcheck::tier_for_score(4) == StrengthTier::WEAK, "4 Weak");
    expect(pwcheck::tier_for_score(5) == StrengthTier::FAIR, "5 Fair");
    expect(pwcheck::tier_for_score(6) == StrengthTier::FAIR, "6 Fair");
    expect(pwcheck::tier_for_score(7) == StrengthTier::STRONG, "7 Strong");
    expect(pwcheck::tier_for_score(8) == StrengthTier::STRONG, "8 Strong");
    expect(pwcheck::tier_for_score(9) == StrengthTier::VERY_STRONG, "9 Very Strong");
    expect(pwcheck::tier_for_score(10) == StrengthTier::VERY_STRONG, "10 Very Strong");

    std::cout << "All tests passed." << std::endl;
    return 0;
}
