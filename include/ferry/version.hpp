// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <fmt/format.h>
#include <cstdint>
#include <string>
#include <string_view>

namespace ferry {

constexpr struct Version {
    std::uint32_t major = 0;
    std::uint32_t minor = 1;
    std::uint32_t patch = 0;

    constexpr auto operator<=>(const Version&) const = default;

    [[nodiscard]] std::string to_string() const {
        return fmt::format("{}.{}.{}", major, minor, patch);
    }

    // Sent with every Bot API request
    [[nodiscard]] std::string user_agent() const {
        return fmt::format("ferry/{}.{}.{} (+libcurl)", major, minor, patch);
    }
} version;

constexpr std::string_view BUILD_DATE = __DATE__;

} // namespace ferry
