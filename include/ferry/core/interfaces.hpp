// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/job.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <system_error>

namespace ferry::core {

// Why a retrieval attempt stopped. `conflict_path` is set for
// JobErrc::retrieval_conflict and names the local path in the way.
struct FetchFailure {
    std::error_code code;
    std::filesystem::path conflict_path;
    std::string detail;
};

// Retrieves one link into a directory, populating it incrementally.
class Fetcher {
public:
    virtual ~Fetcher() = default;

    // Blocks until retrieval ends. A stop request should end it early.
    [[nodiscard]] virtual std::expected<void, FetchFailure>
    fetch(const std::string& url, const std::filesystem::path& dest_dir,
          std::stop_token stop) = 0;
};

enum class MediaKind : std::uint8_t { video, photo, audio, document };

// Video/photo/audio by extension, everything else is a document
[[nodiscard]] MediaKind classify_media(const std::filesystem::path& path) noexcept;

struct FileMetadata {
    std::string name;
    std::uint64_t size{0};
    MediaKind kind{MediaKind::document};
    std::optional<std::uint32_t> duration_seconds;
    std::string caption;
};

// Called with bytes sent so far and total bytes, non-decreasing
using RelayProgress = std::function<void(std::uint64_t sent, std::uint64_t total)>;

// Uploads one local file to a chat.
class RelayClient {
public:
    virtual ~RelayClient() = default;

    [[nodiscard]] virtual std::error_code
    send(const ChatContext& dest, const std::filesystem::path& file,
         const FileMetadata& meta, const RelayProgress& on_progress) = 0;
};

// Posts and edits status messages.
class Transport {
public:
    virtual ~Transport() = default;

    [[nodiscard]] virtual std::expected<StatusHandle, std::error_code>
    post(const ChatContext& chat, const std::string& text) = 0;

    // May return JobErrc::not_modified when the text is unchanged
    [[nodiscard]] virtual std::error_code
    edit(const StatusHandle& handle, const std::string& text) = 0;

    // Separate, non-editable message to the chat
    [[nodiscard]] virtual std::error_code
    notify(const ChatContext& chat, const std::string& text) = 0;
};

// Reads the playing time of a media file.
class MediaProbe {
public:
    virtual ~MediaProbe() = default;

    [[nodiscard]] virtual std::optional<std::uint32_t>
    duration(const std::filesystem::path& file) = 0;
};

} // namespace ferry::core
