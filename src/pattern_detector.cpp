#include "pwcheck/pattern_detector.hpp"

#include <algorithm> // For std::ranges::any_of

#include "pwcheck/text.hpp"

namespace pwcheck {

namespace {

/// @brief Finds a run of `min_run` characters of one class, each stepping by exactly +1
/// or exactly -1 from the previous one after case folding.
template <typename InClass>
auto has_stepping_run(std::u32string_view code_points, std::size_t min_run, InClass in_class) noexcept -> bool {
    std::size_t ascending{1};
    std::size_t descending{1};

    for (std::size_t i{1}; i < code_points.size(); ++i) {
        const auto prev{fold_ascii_case(code_points[i - 1])};
        const auto curr{fold_ascii_case(code_points[i])};

        if (in_class(prev) && in_class(curr)) {
            ascending = (curr == prev + 1) ? ascending + 1 : 1;
            descending = (prev == curr + 1) ? descending + 1 : 1;
        } else {
            ascending = 1;
            descending = 1;
        }

        if (ascending >= min_run || descending >= min_run) {
            return true;
        }
    }

    return false;
}

} // namespace

auto pattern_kind_name(PatternKind kind) noexcept -> std::string_view {
    switch (kind) {
        case PatternKind::REPEATED_CHARACTERS: return "repeated_characters";
        case PatternKind::NUMERIC_SEQUENCE: return "numeric_sequence";
        case PatternKind::ALPHABETIC_SEQUENCE: return "alphabetic_sequence";
        case PatternKind::KEYBOARD_SEQUENCE: return "keyboard_sequence";
        case PatternKind::COMMON_PASSWORD: return "common_password";
    }
    return "unknown";
}

PatternDetector::PatternDetector()
    : common_passwords_{
          "password", "password1", "passw0rd", "123456", "123456789", "12345678",
          "12345", "1234567", "1234", "1234567890", "000000", "111111", "121212",
          "123123", "123321", "654321", "666666", "7777777", "abc123", "a123456",
          "123qwe", "1q2w3e4r", "qwerty", "qwertyuiop", "zxcvbnm", "asdasd",
          "letmein", "admin", "welcome", "iloveyou", "monkey", "dragon",
          "football", "baseball", "master", "sunshine", "guest", "trustno1"
      } {}

auto PatternDetector::detect(std::u32string_view code_points, std::string_view lowered) const
    -> std::vector<PatternKind> {
    std::vector<PatternKind> found;
    if (has_repeated_run(code_points)) {
        found.push_back(PatternKind::REPEATED_CHARACTERS);
    }
    if (has_numeric_sequence(code_points)) {
        found.push_back(PatternKind::NUMERIC_SEQUENCE);
    }
    if (has_alphabetic_sequence(code_points)) {
        found.push_back(PatternKind::ALPHABETIC_SEQUENCE);
    }
    if (has_keyboard_sequence(lowered)) {
        found.push_back(PatternKind::KEYBOARD_SEQUENCE);
    }
    if (is_common_password(lowered)) {
        found.push_back(PatternKind::COMMON_PASSWORD);
    }
    return found;
}

auto PatternDetector::has_repeated_run(std::u32string_view code_points) noexcept -> bool {
    std::size_t run{1};
    for (std::size_t i{1}; i < code_points.size(); ++i) {
        run = (code_points[i] == code_points[i - 1]) ? run + 1 : 1;
        if (run >= MIN_REPEAT_RUN) {
            return true;
        }
    }
    return false;
}

auto PatternDetector::has_numeric_sequence(std::u32string_view code_points) noexcept -> bool {
    return has_stepping_run(code_points, MIN_SEQUENCE_RUN, is_ascii_digit);
}

auto PatternDetector::has_alphabetic_sequence(std::u32string_view code_points) noexcept -> bool {
    return has_stepping_run(code_points, MIN_SEQUENCE_RUN, is_ascii_lower);
}

auto PatternDetector::has_keyboard_sequence(std::string_view lowered) noexcept -> bool {
    return std::ranges::any_of(KEYBOARD_SEQUENCES, [lowered](std::string_view sequence) {
        return lowered.find(sequence) != std::string_view::npos;
    });
}

auto PatternDetector::is_common_password(std::string_view lowered) const -> bool {
    return common_passwords_.contains(lowered);
}

} // namespace pwcheck
