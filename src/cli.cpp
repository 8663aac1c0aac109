#include "pwcheck/cli.hpp"

#include <cerrno>   // For errno
#include <cstdio>   // For stderr
#include <cstring>  // For std::strerror
#include <format>   // For std::format
#include <iostream> // For std::cin
#include <print>    // For std::print, std::println

#include <termios.h>
#include <unistd.h>

namespace pwcheck {

namespace {

constexpr std::string_view USAGE{
    "Usage: pwcheck [--json] [-v|--verbose] [--help] [--] [PASSWORD]\n"
    "\n"
    "Estimates password strength: a 0-10 score, an entropy estimate and pattern warnings.\n"
    "Without PASSWORD, reads one line from stdin (hidden when stdin is a terminal).\n"
    "\n"
    "Options:\n"
    "  --json         Print the analysis as JSON\n"
    "  -v, --verbose  Log timing and charset details to stderr\n"
    "  -h, --help     Show this message\n"
    "  --             Treat every following argument as the password\n"};

/// @brief Restores the saved terminal attributes when it goes out of scope.
class EchoGuard final {
public:
    explicit EchoGuard(const termios& saved) noexcept : saved_{saved} {}
    EchoGuard(const EchoGuard&) = delete;
    auto operator=(const EchoGuard&) -> EchoGuard& = delete;

    ~EchoGuard() {
        // A destructor has no way to report a failed restore.
        static_cast<void>(tcsetattr(STDIN_FILENO, TCSANOW, &saved_));
    }

private:
    termios saved_;
};

auto read_line() -> std::string {
    std::string line;
    if (!std::getline(std::cin, line)) {
        return {};
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

} // namespace

auto parse_arguments(std::span<const std::string_view> args) -> std::expected<CliOptions, std::string> {
    CliOptions options;
    bool positional_only{false};

    for (const auto arg : args) {
        if (!positional_only && arg.starts_with('-') && arg.size() > 1) {
            if (arg == "--") {
                positional_only = true;
            } else if (arg == "--json") {
                options.format = OutputFormat::JSON;
            } else if (arg == "--verbose" || arg == "-v") {
                options.verbose = true;
            } else if (arg == "--help" || arg == "-h") {
                options.show_help = true;
            } else {
                return std::unexpected(std::format("unknown option '{}'", arg));
            }
            continue;
        }

        if (options.password.has_value()) {
            return std::unexpected(std::string{"expected at most one PASSWORD argument"});
        }
        options.password = std::string{arg};
    }

    return options;
}

auto usage_text() -> std::string_view {
    return USAGE;
}

auto read_hidden_line(std::string_view prompt) -> std::expected<std::string, std::string> {
    if (isatty(STDIN_FILENO) == 0) {
        return read_line();
    }

    termios saved{};
    if (tcgetattr(STDIN_FILENO, &saved) != 0) {
        return std::unexpected(std::format("cannot read terminal attributes: {}", std::strerror(errno)));
    }

    termios hidden{saved};
    hidden.c_lflag &= ~static_cast<tcflag_t>(ECHO);
    if (tcsetattr(STDIN_FILENO, TCSANOW, &hidden) != 0) {
        return std::unexpected(std::format("cannot disable terminal echo: {}", std::strerror(errno)));
    }

    std::string line;
    {
        const EchoGuard guard{saved};
        std::print(stderr, "{}", prompt);
        line = read_line();
    }
    std::println(stderr, "");
    return line;
}

} // namespace pwcheck
