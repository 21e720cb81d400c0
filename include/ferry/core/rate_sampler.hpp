// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/config.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>

namespace ferry::core {

// Smoothed transfer rate from (time, cumulative bytes) samples kept for a
// bounded wall-clock window.
class ByteRateSampler {
public:
    using clock = std::chrono::steady_clock;

    explicit ByteRateSampler(std::chrono::milliseconds window = RATE_WINDOW) noexcept;

    void observe(clock::time_point when, std::uint64_t cumulative_bytes);

    // Bytes per second between oldest and newest retained sample, 0 with
    // fewer than two samples
    [[nodiscard]] double rate() const noexcept;

    // Seconds until `remaining_bytes` are through at the current rate
    [[nodiscard]] std::optional<std::uint64_t> eta(std::uint64_t remaining_bytes) const noexcept;

    void reset() noexcept { samples_.clear(); }

    [[nodiscard]] std::size_t sample_count() const noexcept { return samples_.size(); }

private:
    struct Sample {
        clock::time_point when;
        std::uint64_t bytes;
    };

    std::chrono::milliseconds window_;
    std::deque<Sample> samples_;
};

} // namespace ferry::core
