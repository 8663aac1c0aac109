// report.hpp
#ifndef PWCHECK_REPORT_HPP
#define PWCHECK_REPORT_HPP

#include <string>      // For std::string
#include <string_view> // For std::string_view

#include "pwcheck/analysis_result.hpp"

namespace pwcheck {

/// @brief Closing advice printed under every text report.
inline constexpr std::string_view PASSPHRASE_TIP{
    "Tips: Use 3-4 random words + symbols (e.g., 'river*planet*violet*42'). "
    "Avoid personal info and patterns."};

/// @brief Renders the human-readable multi-line report for a result.
[[nodiscard]] auto render_report(const AnalysisResult& result) -> std::string;

} // namespace pwcheck

#endif // PWCHECK_REPORT_HPP
