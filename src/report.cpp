#include "pwcheck/report.hpp"

#include <format>   // For std::format, std::format_to
#include <iterator> // For std::back_inserter

namespace pwcheck {

auto render_report(const AnalysisResult& result) -> std::string {
    std::string report;
    auto out = std::back_inserter(report);

    std::format_to(out, "\nPassword Check\n");
    std::format_to(out, "Score         : {}/10 ({})\n", result.score, result.tier_name());
    std::format_to(out, "Entropy       : ~{:.1f} bits (approx.)\n", result.entropy_bits);
    std::format_to(out, "Length        : {} chars\n", result.length);

    if (!result.notes.empty()) {
        std::format_to(out, "Notes         :\n");
        for (const auto& note : result.notes) {
            std::format_to(out, "  - {}\n", note);
        }
    }

    std::format_to(out, "\n{}\n", PASSPHRASE_TIP);
    return report;
}

} // namespace pwcheck
