// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <chrono>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace ferry::core {

constexpr std::uint64_t RELAY_MAX_BYTES = 2ULL * 1024 * 1024 * 1024;   // 2 GiB upload ceiling

constexpr std::chrono::milliseconds DRAIN_IDLE_SLEEP{800};
constexpr std::chrono::milliseconds DRAIN_BATCH_SLEEP{500};
constexpr std::chrono::milliseconds STABILITY_POLL_INTERVAL{800};
constexpr std::chrono::milliseconds STABILITY_WINDOW{3000};
constexpr std::chrono::milliseconds UPDATE_INTERVAL{1000};
constexpr std::chrono::milliseconds RATE_WINDOW{6000};
constexpr std::chrono::milliseconds FETCH_RETRY_DELAY{1000};

constexpr std::uint32_t FETCH_RETRY_COUNT = 3;
constexpr std::uint32_t CLEANUP_AGE_HOURS = 6;
constexpr std::uint32_t PROGRESS_BAR_LEN = 24;
constexpr std::uint32_t MAX_CONCURRENT_JOBS = 0;                    // 0 = unbounded

constexpr std::uint32_t API_CONNECT_TIMEOUT_SEC = 30;
constexpr std::uint32_t API_REQUEST_TIMEOUT_SEC = 60;
constexpr std::uint32_t UPLOAD_TIMEOUT_SEC = 3600;
constexpr std::uint32_t LONG_POLL_TIMEOUT_SEC = 30;
constexpr std::uint32_t PROBE_TIMEOUT_SEC = 15;

// Knobs for one job run
struct PipelineConfig {
    std::chrono::milliseconds stability_window{STABILITY_WINDOW};
    std::chrono::milliseconds stability_poll{STABILITY_POLL_INTERVAL};
    std::chrono::milliseconds idle_sleep{DRAIN_IDLE_SLEEP};
    std::chrono::milliseconds batch_sleep{DRAIN_BATCH_SLEEP};
    std::chrono::milliseconds retry_delay{FETCH_RETRY_DELAY};
    std::chrono::milliseconds rate_window{RATE_WINDOW};
    std::uint32_t fetch_retries{FETCH_RETRY_COUNT};
    std::uint64_t relay_max_bytes{RELAY_MAX_BYTES};
};

// Process-wide settings: compiled defaults, then JSON file, then environment
struct Settings {
    std::string bot_token;
    std::int64_t owner_id{0};
    std::string download_dir{"/data/downloads"};
    std::string api_base{"https://api.telegram.org"};
    std::string megadl_path{"megadl"};
    std::string ffprobe_path{"ffprobe"};
    std::string log_level{"info"};

    std::chrono::milliseconds update_interval{UPDATE_INTERVAL};
    std::uint32_t cleanup_age_hours{CLEANUP_AGE_HOURS};
    std::uint32_t progress_bar_len{PROGRESS_BAR_LEN};
    std::uint32_t max_concurrent_jobs{MAX_CONCURRENT_JOBS};

    PipelineConfig pipeline;

    // Apply a JSON document (snake_case keys) on top of the current values
    [[nodiscard]] std::error_code merge_json(std::string_view json) noexcept;

    // Apply environment variables on top of the current values
    [[nodiscard]] std::error_code merge_env() noexcept;

    // Reject settings the bot cannot run with
    [[nodiscard]] std::error_code validate() const noexcept;
};

// Defaults + optional file + environment, validated
[[nodiscard]] std::expected<Settings, std::error_code>
load_settings(std::string_view config_path = {}) noexcept;

} // namespace ferry::core
