// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/progress_reporter.hpp>
#include <ferry/core/error.hpp>
#include <ferry/core/units.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace ferry::core {

ProgressReporter::ProgressReporter(Transport& transport,
                                   std::chrono::milliseconds update_interval,
                                   std::uint32_t bar_length,
                                   Clock now)
    : transport_(transport)
    , update_interval_(update_interval)
    , bar_length_(bar_length)
    , now_(now ? std::move(now) : Clock([] { return clock::now(); })) {}

EmitResult ProgressReporter::emit(const StatusHandle& handle, const ProgressSnapshot& snapshot) {
    const auto now = now_();
    const bool terminal = snapshot.terminal();

    // Read slot state, then talk to the transport without holding the lock.
    // Each handle has a single writer so the slot cannot change underneath.
    std::string last_text;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto& slot = slots_[handle];
        if (!terminal && slot.last_emit && now - *slot.last_emit < update_interval_) {
            return EmitResult::throttled;
        }
        last_text = slot.last_text;
    }

    std::string text = render(snapshot);
    if (!terminal && text == last_text) {
        return EmitResult::unchanged;
    }

    auto ec = transport_.edit(handle, text);
    if (ec && ec != JobErrc::not_modified) {
        spdlog::debug("Status edit for message {} failed: {}", handle.message_id, ec.message());
        return EmitResult::failed;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = slots_[handle];
    slot.last_emit = now;
    slot.last_text = std::move(text);
    ++slot.count;
    return EmitResult::sent;
}

std::string ProgressReporter::render(const ProgressSnapshot& snapshot) const {
    std::string text;

    switch (snapshot.phase) {
        case Phase::fetching: {
            text = fmt::format("📥 Downloading: `{}`\n\n", snapshot.label);
            if (snapshot.bytes_total && *snapshot.bytes_total > 0) {
                const double pct = static_cast<double>(snapshot.bytes_done) * 100.0
                                 / static_cast<double>(*snapshot.bytes_total);
                text += fmt::format("Progress: {:5.1f}% `{}`\n", pct, render_bar(pct, bar_length_));
            }
            text += fmt::format("📦 Received: `{}`\n", format_bytes(snapshot.bytes_done));
            text += fmt::format("⚡ Speed: `{}`", format_rate(snapshot.rate_bps));
            if (snapshot.eta_seconds) {
                text += fmt::format(" | ETA: `{}`", format_hms(*snapshot.eta_seconds));
            }
            text += "\n";
            break;
        }
        case Phase::relaying: {
            const std::uint64_t total = snapshot.bytes_total.value_or(0);
            const double pct = total > 0
                ? static_cast<double>(snapshot.bytes_done) * 100.0 / static_cast<double>(total)
                : 0.0;
            text = fmt::format("📤 Uploading: `{}`\n\n", snapshot.label);
            text += fmt::format("Progress: {:5.1f}% `{}`\n", pct, render_bar(pct, bar_length_));
            text += fmt::format("⚡ Speed: `{}` | ETA: `{}`\n",
                                format_rate(snapshot.rate_bps),
                                snapshot.eta_seconds ? format_hms(*snapshot.eta_seconds) : "--:--:--");
            break;
        }
        case Phase::complete:
            text = fmt::format("✅ {}\n", snapshot.label);
            break;
        case Phase::failed:
            text = fmt::format("⚠️ {}\n", snapshot.label);
            break;
    }

    if (!snapshot.detail.empty()) {
        if (snapshot.terminal()) text += "\n";
        for (const auto& line : snapshot.detail) {
            text += line;
            text += '\n';
        }
    }
    return text;
}

void ProgressReporter::forget(const StatusHandle& handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    slots_.erase(handle);
}

std::uint64_t ProgressReporter::emitted(const StatusHandle& handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(handle);
    return it == slots_.end() ? 0 : it->second.count;
}

} // namespace ferry::core
