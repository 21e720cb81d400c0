// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/interfaces.hpp>
#include <string>
#include <string_view>

namespace ferry::media {

// Reads container duration with `ffprobe -show_format`.
class FfprobeProbe final : public core::MediaProbe {
public:
    explicit FfprobeProbe(std::string ffprobe_path = "ffprobe");

    [[nodiscard]] std::optional<std::uint32_t>
    duration(const std::filesystem::path& file) override;

    // format.duration of an ffprobe JSON document, whole seconds
    [[nodiscard]] static std::optional<std::uint32_t>
    parse_duration(std::string_view json) noexcept;

private:
    std::string ffprobe_path_;
};

} // namespace ferry::media
