// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>

namespace ferry::core {

using CancelCheck = std::function<bool()>;
using SizeObserver = std::function<void(std::uint64_t size)>;

// Decides whether a file has stopped growing by polling its size.
class StabilityDetector {
public:
    StabilityDetector(std::chrono::milliseconds window,
                      std::chrono::milliseconds poll) noexcept;

    // Blocks until the file existed with an unchanged size for at least the
    // window (true) or `cancel` reports true (false). A missing file counts
    // as not arrived yet. There is no upper bound on the wait.
    // `observer`, if set, sees every size read.
    [[nodiscard]] bool is_stable(const std::filesystem::path& path,
                                 const CancelCheck& cancel,
                                 const SizeObserver& observer = {}) const;

    [[nodiscard]] std::chrono::milliseconds window() const noexcept { return window_; }
    [[nodiscard]] std::chrono::milliseconds poll() const noexcept { return poll_; }

private:
    // Sleep one poll interval, waking early on cancellation
    [[nodiscard]] bool sleep_poll(const CancelCheck& cancel) const;

    std::chrono::milliseconds window_;
    std::chrono::milliseconds poll_;
};

} // namespace ferry::core
