// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/job.hpp>
#include <ferry/core/interfaces.hpp>
#include <algorithm>
#include <array>
#include <cctype>

namespace ferry::core {

std::string_view to_string(JobState state) noexcept {
    switch (state) {
        case JobState::running:           return "running";
        case JobState::cancel_requested:  return "cancel requested";
        case JobState::done:              return "done";
        case JobState::failed:            return "failed";
    }
    return "unknown";
}

bool can_transition(JobState from, JobState to) noexcept {
    switch (from) {
        case JobState::running:
            return to == JobState::done || to == JobState::failed
                || to == JobState::cancel_requested;
        case JobState::cancel_requested:
            return to == JobState::done || to == JobState::failed;
        case JobState::done:
        case JobState::failed:
            return false;
    }
    return false;
}

namespace {

constexpr std::array<std::string_view, 5> VIDEO_EXTS{".mp4", ".mkv", ".mov", ".avi", ".webm"};
constexpr std::array<std::string_view, 6> PHOTO_EXTS{".jpg", ".jpeg", ".png", ".gif", ".bmp", ".webp"};
constexpr std::array<std::string_view, 5> AUDIO_EXTS{".mp3", ".wav", ".m4a", ".ogg", ".flac"};

template<std::size_t N>
bool contains(const std::array<std::string_view, N>& exts, std::string_view ext) noexcept {
    return std::find(exts.begin(), exts.end(), ext) != exts.end();
}

} // namespace

MediaKind classify_media(const std::filesystem::path& path) noexcept {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (contains(VIDEO_EXTS, ext)) return MediaKind::video;
    if (contains(PHOTO_EXTS, ext)) return MediaKind::photo;
    if (contains(AUDIO_EXTS, ext)) return MediaKind::audio;
    return MediaKind::document;
}

} // namespace ferry::core
