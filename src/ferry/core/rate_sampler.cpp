// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/rate_sampler.hpp>
#include <cmath>

namespace ferry::core {

ByteRateSampler::ByteRateSampler(std::chrono::milliseconds window) noexcept
    : window_(window) {}

void ByteRateSampler::observe(clock::time_point when, std::uint64_t cumulative_bytes) {
    // A counter going backwards or time going backwards starts a new series
    if (!samples_.empty() &&
        (cumulative_bytes < samples_.back().bytes || when < samples_.back().when)) {
        samples_.clear();
    }

    samples_.push_back({when, cumulative_bytes});

    const auto cutoff = when - window_;
    while (samples_.size() > 1 && samples_.front().when < cutoff) {
        samples_.pop_front();
    }
}

double ByteRateSampler::rate() const noexcept {
    if (samples_.size() < 2) {
        return 0.0;
    }

    const auto& oldest = samples_.front();
    const auto& newest = samples_.back();
    const double elapsed = std::chrono::duration<double>(newest.when - oldest.when).count();
    if (elapsed <= 0.0) {
        return 0.0;
    }
    return static_cast<double>(newest.bytes - oldest.bytes) / elapsed;
}

std::optional<std::uint64_t> ByteRateSampler::eta(std::uint64_t remaining_bytes) const noexcept {
    const double r = rate();
    if (r <= 0.0) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(std::ceil(static_cast<double>(remaining_bytes) / r));
}

} // namespace ferry::core
