// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/config.hpp>
#include <ferry/core/error.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <type_traits>

namespace ferry::core {

namespace {

// Anything longer is a typo, and the millisecond cast must not overflow
constexpr double MAX_SETTING_SECONDS = 365.0 * 24 * 3600;

bool valid_seconds(double seconds) noexcept {
    return std::isfinite(seconds) && seconds >= 0.0 && seconds <= MAX_SETTING_SECONDS;
}

std::chrono::milliseconds seconds_to_ms(double seconds) noexcept {
    return std::chrono::milliseconds(static_cast<std::int64_t>(seconds * 1000.0));
}

// Parse a whole string as a number, rejecting trailing garbage
bool parse_double(const char* text, double& out) noexcept {
    char* end = nullptr;
    double v = std::strtod(text, &end);
    if (end == text || *end != '\0' || !valid_seconds(v)) return false;
    out = v;
    return true;
}

// strtoull wraps a leading minus sign, so it is refused up front
bool parse_u64(const char* text, std::uint64_t& out) noexcept {
    const char* p = text;
    while (std::isspace(static_cast<unsigned char>(*p))) ++p;
    if (*p == '-') return false;

    char* end = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(p, &end, 10);
    if (end == p || *end != '\0' || errno == ERANGE) return false;
    out = static_cast<std::uint64_t>(v);
    return true;
}

bool parse_i64(const char* text, std::int64_t& out) noexcept {
    char* end = nullptr;
    errno = 0;
    long long v = std::strtoll(text, &end, 10);
    if (end == text || *end != '\0' || errno == ERANGE) return false;
    out = static_cast<std::int64_t>(v);
    return true;
}

// Environment lookups: absent -> true and untouched, malformed -> false
bool env_string(const char* name, std::string& out) {
    if (const char* v = std::getenv(name)) {
        out = v;
    }
    return true;
}

bool env_seconds(const char* name, std::chrono::milliseconds& out) noexcept {
    const char* v = std::getenv(name);
    if (!v) return true;
    double seconds = 0.0;
    if (!parse_double(v, seconds)) {
        spdlog::error("{} is not a non-negative number of seconds: '{}'", name, v);
        return false;
    }
    out = seconds_to_ms(seconds);
    return true;
}

template<typename T>
bool env_unsigned(const char* name, T& out) noexcept {
    const char* v = std::getenv(name);
    if (!v) return true;
    std::uint64_t parsed = 0;
    if (!parse_u64(v, parsed) || parsed > std::numeric_limits<T>::max()) {
        spdlog::error("{} is not an unsigned integer in range: '{}'", name, v);
        return false;
    }
    out = static_cast<T>(parsed);
    return true;
}

bool json_seconds(const nlohmann::json& j, const char* key, std::chrono::milliseconds& out) {
    if (!j.contains(key)) return true;
    const auto& v = j.at(key);
    if (!v.is_number() || !valid_seconds(v.get<double>())) {
        spdlog::error("{} is not a non-negative number of seconds: {}", key, v.dump());
        return false;
    }
    out = seconds_to_ms(v.get<double>());
    return true;
}

template<typename T>
bool json_value(const nlohmann::json& j, const char* key, T& out) {
    if (!j.contains(key)) return true;
    const auto& v = j.at(key);
    if constexpr (std::is_unsigned_v<T>) {
        if (!v.is_number_unsigned() || v.get<std::uint64_t>() > std::numeric_limits<T>::max()) {
            spdlog::error("{} is not an unsigned integer in range: {}", key, v.dump());
            return false;
        }
    }
    out = v.get<T>();
    return true;
}

} // namespace

std::error_code Settings::merge_json(std::string_view json) noexcept {
    try {
        auto j = nlohmann::json::parse(json);
        if (!j.is_object()) {
            return make_error_code(JobErrc::invalid_config);
        }

        bool ok = true;
        ok &= json_value(j, "bot_token", bot_token);
        ok &= json_value(j, "owner_id", owner_id);
        ok &= json_value(j, "download_dir", download_dir);
        ok &= json_value(j, "api_base", api_base);
        ok &= json_value(j, "megadl_path", megadl_path);
        ok &= json_value(j, "ffprobe_path", ffprobe_path);
        ok &= json_value(j, "log_level", log_level);
        ok &= json_value(j, "cleanup_age_hours", cleanup_age_hours);
        ok &= json_value(j, "progress_bar_len", progress_bar_len);
        ok &= json_value(j, "max_concurrent_jobs", max_concurrent_jobs);
        ok &= json_seconds(j, "update_interval", update_interval);

        ok &= json_seconds(j, "idle_sleep", pipeline.idle_sleep);
        ok &= json_seconds(j, "stability_poll", pipeline.stability_poll);
        ok &= json_seconds(j, "stable_seconds", pipeline.stability_window);
        ok &= json_value(j, "fetch_retries", pipeline.fetch_retries);
        ok &= json_value(j, "relay_max_bytes", pipeline.relay_max_bytes);

        return ok ? std::error_code{} : make_error_code(JobErrc::invalid_config);
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Invalid configuration document: {}", e.what());
        return make_error_code(JobErrc::invalid_config);
    }
}

std::error_code Settings::merge_env() noexcept {
    try {
        bool ok = true;
        ok &= env_string("BOT_TOKEN", bot_token);
        ok &= env_string("DOWNLOAD_DIR", download_dir);
        ok &= env_string("TELEGRAM_API_BASE", api_base);
        ok &= env_string("MEGADL_PATH", megadl_path);
        ok &= env_string("FFPROBE_PATH", ffprobe_path);
        ok &= env_string("LOG_LEVEL", log_level);

        if (const char* v = std::getenv("BOT_OWNER_ID")) {
            if (!parse_i64(v, owner_id)) {
                spdlog::error("BOT_OWNER_ID is not an integer: '{}'", v);
                ok = false;
            }
        }

        ok &= env_seconds("UPLOAD_PROGRESS_UPDATE_INTERVAL", update_interval);
        ok &= env_seconds("DOWNLOAD_POLL_INTERVAL", pipeline.idle_sleep);
        ok &= env_seconds("STABLE_POLL_INTERVAL", pipeline.stability_poll);
        ok &= env_seconds("STABLE_SECONDS", pipeline.stability_window);
        ok &= env_unsigned("CLEANUP_AGE_HOURS", cleanup_age_hours);
        ok &= env_unsigned("PROGRESS_BAR_LEN", progress_bar_len);
        ok &= env_unsigned("MAX_CONCURRENT_JOBS", max_concurrent_jobs);
        ok &= env_unsigned("MEGATOOLS_RETRY", pipeline.fetch_retries);
        ok &= env_unsigned("RELAY_MAX_BYTES", pipeline.relay_max_bytes);

        return ok ? std::error_code{} : make_error_code(JobErrc::invalid_config);
    } catch (const std::exception&) {
        return make_error_code(JobErrc::invalid_config);
    }
}

std::error_code Settings::validate() const noexcept {
    if (bot_token.empty()) {
        spdlog::error("BOT_TOKEN is required");
        return make_error_code(JobErrc::invalid_config);
    }
    if (download_dir.empty()) {
        spdlog::error("download_dir must not be empty");
        return make_error_code(JobErrc::invalid_config);
    }
    if (pipeline.fetch_retries == 0 || progress_bar_len == 0) {
        spdlog::error("fetch_retries and progress_bar_len must be positive");
        return make_error_code(JobErrc::invalid_config);
    }
    if (pipeline.stability_window.count() < 0 || pipeline.idle_sleep.count() < 0
        || update_interval.count() < 0) {
        spdlog::error("durations must not be negative");
        return make_error_code(JobErrc::invalid_config);
    }
    if (pipeline.stability_poll.count() <= 0) {
        spdlog::error("stability_poll must be positive");
        return make_error_code(JobErrc::invalid_config);
    }
    return {};
}

std::expected<Settings, std::error_code> load_settings(std::string_view config_path) noexcept {
    Settings settings;

    if (!config_path.empty()) {
        std::ifstream file{std::string(config_path)};
        if (!file) {
            spdlog::error("Cannot open config file {}", config_path);
            return std::unexpected(make_error_code(JobErrc::invalid_config));
        }
        std::ostringstream ss;
        ss << file.rdbuf();
        if (auto ec = settings.merge_json(ss.str())) {
            return std::unexpected(ec);
        }
    }

    if (auto ec = settings.merge_env()) {
        return std::unexpected(ec);
    }
    if (auto ec = settings.validate()) {
        return std::unexpected(ec);
    }
    return settings;
}

} // namespace ferry::core
