// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <system_error>
#include <vector>

namespace ferry::disk {

// A regular file found under a working directory
struct FileInfo {
    std::filesystem::path path;
    std::uint64_t size{0};
};

// Destroy whatever is at `dir`, then create it empty
[[nodiscard]] std::error_code prepare_fresh(const std::filesystem::path& dir) noexcept;

// All regular files below `dir`, sorted by path. A missing directory is empty.
[[nodiscard]] std::expected<std::vector<FileInfo>, std::error_code>
scan_files(const std::filesystem::path& dir) noexcept;

// Remove a file or a whole directory tree; a missing path is not an error
[[nodiscard]] std::error_code remove_path(const std::filesystem::path& path) noexcept;

// True if any regular file exists below `dir`
[[nodiscard]] bool contains_files(const std::filesystem::path& dir) noexcept;

// Remove `dir` if it holds no regular files. Returns true if removed.
bool remove_if_drained(const std::filesystem::path& dir) noexcept;

// Remove direct children of `root` last modified before `cutoff`.
// Returns how many were removed.
std::size_t remove_entries_older_than(const std::filesystem::path& root,
                                      std::filesystem::file_time_type cutoff) noexcept;

} // namespace ferry::disk
