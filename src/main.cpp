#include <chrono>      // For std::chrono::high_resolution_clock
#include <exception>   // For std::exception
#include <print>       // For std::print, std::println
#include <string>      // For std::string
#include <string_view> // For std::string_view
#include <utility>     // For std::to_underlying
#include <vector>      // For std::vector

#include "pwcheck/analyzer.hpp"
#include "pwcheck/cli.hpp"
#include "pwcheck/report.hpp"

namespace {

constexpr std::string_view PROMPT{"Enter a password to check (input hidden): "};

auto run(const pwcheck::CliOptions& options) -> pwcheck::ExitCode {
    using pwcheck::ExitCode;

    std::string password;
    if (options.password.has_value()) {
        password = *options.password;
    } else {
        auto line{pwcheck::read_hidden_line(PROMPT)};
        if (!line.has_value()) {
            std::println(stderr, "pwcheck: {}", line.error());
            return ExitCode::INPUT_ERROR;
        }
        password = std::move(*line);
    }

    const auto start_time{std::chrono::high_resolution_clock::now()};
    const auto result{pwcheck::analyze(password)};
    const auto end_time{std::chrono::high_resolution_clock::now()};

    if (options.verbose) {
        const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time);
        std::println(stderr, "pwcheck: analyzed {} chars in {} us", result.length, elapsed.count());
        std::println(stderr, "pwcheck: alphabet size {} (lower={} upper={} digit={} symbol={})",
                     result.charset.alphabet_size(), result.charset.has_lower, result.charset.has_upper,
                     result.charset.has_digit, result.charset.has_symbol);
        for (const auto kind : result.patterns) {
            std::println(stderr, "pwcheck: pattern {}", pwcheck::pattern_kind_name(kind));
        }
    }

    if (options.format == pwcheck::OutputFormat::JSON) {
        std::println("{}", result.to_json());
    } else {
        std::print("{}", pwcheck::render_report(result));
    }

    return ExitCode::OK;
}

} // namespace

auto main(int argc, char* argv[]) -> int {
    try {
        const std::vector<std::string_view> args(argv + 1, argv + argc);
        const auto options{pwcheck::parse_arguments(args)};

        if (!options.has_value()) {
            std::println(stderr, "pwcheck: {}", options.error());
            std::print(stderr, "{}", pwcheck::usage_text());
            return std::to_underlying(pwcheck::ExitCode::USAGE_ERROR);
        }

        if (options->show_help) {
            std::print("{}", pwcheck::usage_text());
            return std::to_underlying(pwcheck::ExitCode::OK);
        }

        return std::to_underlying(run(*options));
    } catch (const std::exception& e) {
        std::println(stderr, "pwcheck: fatal error: {}", e.what());
        return std::to_underlying(pwcheck::ExitCode::INPUT_ERROR);
    }
}
