// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <string_view>

namespace ferry::core {

// Install the process logger (stdout, colored) and set its level.
// Unknown level names fall back to info.
void init_logging(std::string_view level) noexcept;

} // namespace ferry::core
