// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <stop_token>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace ferry::core {

struct SubprocessResult {
    int exit_code{-1};       // -1 when killed by a signal
    int term_signal{0};
    std::string output;      // Combined stdout and stderr, tail only
    bool stopped{false};     // Stop token fired and the child was terminated
    bool timed_out{false};

    [[nodiscard]] bool success() const noexcept {
        return exit_code == 0 && !stopped && !timed_out;
    }
};

struct SubprocessOptions {
    std::chrono::milliseconds timeout{0};        // 0 = no limit
    std::chrono::milliseconds kill_grace{5000};  // SIGTERM -> SIGKILL
    std::size_t output_limit{64 * 1024};
    std::filesystem::path cwd;
};

// fork/exec `argv[0]` (searched on PATH) and wait for it. A stop request
// sends SIGTERM, then SIGKILL after the grace period. Only spawn failures
// are errors; a non-zero exit is reported in the result.
[[nodiscard]] std::expected<SubprocessResult, std::error_code>
run_subprocess(const std::vector<std::string>& argv,
               std::stop_token stop = {},
               const SubprocessOptions& options = {});

// Last non-empty line of a process transcript
[[nodiscard]] std::string last_line(std::string_view output);

} // namespace ferry::core
