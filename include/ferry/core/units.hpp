// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>

namespace ferry::core {

// 1536 -> "1.50 KB"
[[nodiscard]] std::string format_bytes(std::uint64_t bytes);

// Bytes per second -> "1.50 MB/s"
[[nodiscard]] std::string format_rate(double bytes_per_sec);

// Seconds -> "HH:MM:SS"
[[nodiscard]] std::string format_hms(std::uint64_t seconds);

// Fixed-width bar of filled/empty cells for a 0..100 percentage
[[nodiscard]] std::string render_bar(double percent, std::uint32_t length);

} // namespace ferry::core
