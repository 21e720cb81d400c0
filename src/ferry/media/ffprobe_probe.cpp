// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/media/ffprobe_probe.hpp>
#include <ferry/core/config.hpp>
#include <ferry/core/subprocess.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace ferry::media {

FfprobeProbe::FfprobeProbe(std::string ffprobe_path)
    : ffprobe_path_(std::move(ffprobe_path)) {}

std::optional<std::uint32_t> FfprobeProbe::parse_duration(std::string_view json) noexcept {
    try {
        auto doc = nlohmann::json::parse(json);
        const auto& format = doc.at("format");
        const auto& dur = format.at("duration");

        // ffprobe prints numbers as strings
        double seconds = 0.0;
        if (dur.is_string()) {
            const auto text = dur.get<std::string>();
            char* end = nullptr;
            seconds = std::strtod(text.c_str(), &end);
            if (end == text.c_str()) return std::nullopt;
        } else if (dur.is_number()) {
            seconds = dur.get<double>();
        } else {
            return std::nullopt;
        }

        if (!std::isfinite(seconds) || seconds <= 0.0) return std::nullopt;
        constexpr auto longest = std::numeric_limits<std::uint32_t>::max();
        if (seconds >= static_cast<double>(longest)) return longest;
        return static_cast<std::uint32_t>(seconds);
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

std::optional<std::uint32_t> FfprobeProbe::duration(const std::filesystem::path& file) {
    core::SubprocessOptions options;
    options.timeout = std::chrono::seconds(core::PROBE_TIMEOUT_SEC);

    auto result = core::run_subprocess(
        {ffprobe_path_, "-v", "quiet", "-print_format", "json", "-show_format", file.string()},
        {}, options);
    if (!result) {
        spdlog::debug("ffprobe unavailable: {}", result.error().message());
        return std::nullopt;
    }
    if (!result->success()) {
        spdlog::debug("ffprobe failed on {} (exit {})", file.filename().string(), result->exit_code);
        return std::nullopt;
    }
    return parse_duration(result->output);
}

} // namespace ferry::media
