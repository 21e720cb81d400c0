// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/units.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <array>
#include <cmath>

namespace ferry::core {

namespace {

constexpr std::string_view FILLED_CELL = "▓";
constexpr std::string_view EMPTY_CELL = "░";

} // namespace

std::string format_bytes(std::uint64_t bytes) {
    if (bytes < 1024) {
        return fmt::format("{} B", bytes);
    }

    constexpr std::array<const char*, 4> units{"KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    for (const char* unit : units) {
        value /= 1024.0;
        if (value < 1024.0) {
            return fmt::format("{:.2f} {}", value, unit);
        }
    }
    return fmt::format("{:.2f} PB", value / 1024.0);
}

std::string format_rate(double bytes_per_sec) {
    if (bytes_per_sec <= 0.0) {
        return "0 B/s";
    }
    return format_bytes(static_cast<std::uint64_t>(bytes_per_sec)) + "/s";
}

std::string format_hms(std::uint64_t seconds) {
    std::uint64_t hours = seconds / 3600;
    std::uint64_t minutes = (seconds % 3600) / 60;
    std::uint64_t secs = seconds % 60;
    return fmt::format("{:02}:{:02}:{:02}", hours, minutes, secs);
}

std::string render_bar(double percent, std::uint32_t length) {
    percent = std::clamp(percent, 0.0, 100.0);
    const auto filled = static_cast<std::uint32_t>(
        std::round(static_cast<double>(length) * percent / 100.0));

    std::string bar;
    bar.reserve(length * FILLED_CELL.size());
    for (std::uint32_t i = 0; i < length; ++i) {
        bar += (i < filled) ? FILLED_CELL : EMPTY_CELL;
    }
    return bar;
}

} // namespace ferry::core
