// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/config.hpp>
#include <expected>
#include <stop_token>
#include <string>
#include <string_view>
#include <system_error>

namespace ferry::cli {

// CLI result
using CliResult = std::expected<int, std::error_code>;

// Command line arguments
struct CliArgs {
    std::string config_path;
    std::string log_level;      // Overrides the configured level when set
    bool verbose{false};
    bool check{false};          // Validate configuration and exit
    bool version{false};
    bool help{false};
    std::string error;          // Set when the arguments are unusable
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Long-poll the Bot API and serve jobs until `stop` is requested
[[nodiscard]] CliResult run_bot(const core::Settings& settings, std::stop_token stop) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace ferry::cli
