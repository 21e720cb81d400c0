// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/interfaces.hpp>
#include <ferry/core/job.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ferry::core {

enum class Phase : std::uint8_t {
    fetching,   // Bytes arriving in the working directory
    relaying,   // Bytes leaving through the relay client
    complete,   // A step finished
    failed      // A step failed or was skipped
};

// What one status update shows. Rendered, never stored by the pipeline.
struct ProgressSnapshot {
    Phase phase{Phase::fetching};
    std::uint64_t bytes_done{0};
    std::optional<std::uint64_t> bytes_total;   // Unknown while fetching
    double rate_bps{0.0};
    std::optional<std::uint64_t> eta_seconds;
    std::string label;
    std::vector<std::string> detail;

    [[nodiscard]] bool terminal() const noexcept {
        return phase == Phase::complete || phase == Phase::failed;
    }
};

enum class EmitResult : std::uint8_t {
    sent,        // Transport accepted it (or had it already)
    throttled,   // Too soon after the previous emission
    unchanged,   // Same text as the previous emission
    failed       // Transport error, state left untouched
};

// Throttled sink that renders snapshots into status handles.
class ProgressReporter {
public:
    using clock = std::chrono::steady_clock;
    using Clock = std::function<clock::time_point()>;

    ProgressReporter(Transport& transport,
                     std::chrono::milliseconds update_interval,
                     std::uint32_t bar_length,
                     Clock now = {});

    // Non-terminal snapshots are dropped inside the update interval and when
    // their text equals the last one sent; terminal snapshots always go out.
    EmitResult emit(const StatusHandle& handle, const ProgressSnapshot& snapshot);

    [[nodiscard]] std::string render(const ProgressSnapshot& snapshot) const;

    // Drop throttle state for a handle that will not be written again
    void forget(const StatusHandle& handle);

    // Number of successful emissions to a handle
    [[nodiscard]] std::uint64_t emitted(const StatusHandle& handle) const;

private:
    struct Slot {
        std::optional<clock::time_point> last_emit;
        std::string last_text;
        std::uint64_t count{0};
    };

    Transport& transport_;
    std::chrono::milliseconds update_interval_;
    std::uint32_t bar_length_;
    Clock now_;

    std::map<StatusHandle, Slot> slots_;
    mutable std::mutex mutex_;
};

} // namespace ferry::core
