// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>

namespace ferry::core {

using JobId = std::string;

// Job state machine (forward transitions only)
enum class JobState : std::uint8_t {
    running,           // Fetching and draining
    cancel_requested,  // Operator asked to stop, pipeline still winding down
    done,              // Finished (possibly cancelled)
    failed             // Retrieval failed terminally
};

[[nodiscard]] std::string_view to_string(JobState state) noexcept;

// True when `from -> to` is a legal transition
[[nodiscard]] bool can_transition(JobState from, JobState to) noexcept;

[[nodiscard]] constexpr bool is_terminal(JobState state) noexcept {
    return state == JobState::done || state == JobState::failed;
}

// Where a job came from
struct ChatContext {
    std::int64_t chat_id{0};
    std::int64_t user_id{0};
};

// The single editable status message a job renders into
struct StatusHandle {
    std::int64_t chat_id{0};
    std::int64_t message_id{0};

    [[nodiscard]] bool valid() const noexcept { return message_id != 0; }
    auto operator<=>(const StatusHandle&) const = default;
};

// Terminal category of one discovered file
enum class FileOutcome : std::uint8_t {
    relayed,        // Relayed and deleted
    skipped,        // Too large, kept on disk
    relay_failed,   // Relay failed, deleted anyway
    abandoned       // Cancelled mid-stabilization, kept on disk
};

struct JobCounters {
    std::uint32_t relayed{0};
    std::uint32_t skipped{0};
    std::uint32_t relay_failed{0};
    std::uint32_t abandoned{0};

    [[nodiscard]] std::uint32_t total() const noexcept {
        return relayed + skipped + relay_failed + abandoned;
    }
};

// One retrieval-and-relay task. The registry owns the live record; callers
// only ever see copies.
struct Job {
    JobId id;
    std::string source_url;
    std::filesystem::path work_dir;
    ChatContext chat;
    JobState state{JobState::running};
    bool cancelled{false};
    std::chrono::system_clock::time_point started_at;
    std::chrono::steady_clock::time_point started_mono;
    std::optional<StatusHandle> status;
    std::unordered_set<std::string> processed;
    JobCounters counters;
    std::string failure;
};

} // namespace ferry::core
