// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/log.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>

namespace ferry::core {

void init_logging(std::string_view level) noexcept {
    try {
        auto logger = spdlog::stdout_color_mt("ferry");
        spdlog::set_default_logger(logger);
    } catch (const spdlog::spdlog_ex&) {
        // Already installed by an earlier call
    }

    auto parsed = spdlog::level::from_str(std::string(level));
    if (parsed == spdlog::level::off && level != "off") {
        parsed = spdlog::level::info;
    }
    spdlog::set_level(parsed);
    spdlog::set_pattern("%Y-%m-%d %H:%M:%S - %l - %v");
}

} // namespace ferry::core
