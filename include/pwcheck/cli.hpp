// cli.hpp
#ifndef PWCHECK_CLI_HPP
#define PWCHECK_CLI_HPP

#include <cstdint>     // For std::uint8_t
#include <expected>    // For std::expected
#include <optional>    // For std::optional
#include <span>        // For std::span
#include <string>      // For std::string
#include <string_view> // For std::string_view

namespace pwcheck {

enum class OutputFormat : std::uint8_t {
    TEXT = 0,
    JSON = 1
};

/// @brief Exit statuses of the command-line tool.
enum class ExitCode : int {
    OK = 0,
    INPUT_ERROR = 1, ///< The password could not be read.
    USAGE_ERROR = 2
};

/// @brief Parsed command line.
struct CliOptions final {
    std::optional<std::string> password; ///< Positional argument; prompt when absent.
    OutputFormat format{OutputFormat::TEXT};
    bool verbose{false};
    bool show_help{false};
};

/// @brief Parses the arguments that follow the program name.
/// @return The options, or a message describing the first usage error.
[[nodiscard]] auto parse_arguments(std::span<const std::string_view> args)
    -> std::expected<CliOptions, std::string>;

[[nodiscard]] auto usage_text() -> std::string_view;

/// @brief Reads one line from stdin. When stdin is a terminal the prompt is written to
/// stderr and echo is switched off until the line is read. End of input yields "".
/// @return The line without its terminator, or why the terminal could not be configured.
[[nodiscard]] auto read_hidden_line(std::string_view prompt) -> std::expected<std::string, std::string>;

} // namespace pwcheck

#endif // PWCHECK_CLI_HPP
