// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/stability_detector.hpp>
#include <algorithm>
#include <optional>
#include <thread>

namespace ferry::core {

namespace {

constexpr std::chrono::milliseconds CANCEL_CHECK_SLICE{50};

} // namespace

StabilityDetector::StabilityDetector(std::chrono::milliseconds window,
                                     std::chrono::milliseconds poll) noexcept
    : window_(window)
    , poll_(poll) {}

bool StabilityDetector::is_stable(const std::filesystem::path& path,
                                  const CancelCheck& cancel,
                                  const SizeObserver& observer) const {
    using clock = std::chrono::steady_clock;

    std::optional<std::uint64_t> last_size;
    clock::time_point unchanged_since{};

    while (true) {
        if (cancel && cancel()) {
            return false;
        }

        std::error_code ec;
        const std::uint64_t size = std::filesystem::file_size(path, ec);
        const auto now = clock::now();

        if (ec) {
            // Not there (yet, or any more): existence restarts the window
            last_size.reset();
        } else if (!last_size || *last_size != size) {
            last_size = size;
            unchanged_since = now;
            if (observer) observer(size);
        } else {
            if (observer) observer(size);
            if (now - unchanged_since >= window_) {
                return true;
            }
        }

        if (!sleep_poll(cancel)) {
            return false;
        }
    }
}

bool StabilityDetector::sleep_poll(const CancelCheck& cancel) const {
    const auto deadline = std::chrono::steady_clock::now() + poll_;
    while (true) {
        if (cancel && cancel()) {
            return false;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(
            deadline - now, CANCEL_CHECK_SLICE));
    }
}

} // namespace ferry::core
