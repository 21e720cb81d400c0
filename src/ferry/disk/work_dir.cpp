// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/disk/work_dir.hpp>
#include <ferry/disk/error.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace fs = std::filesystem;

namespace ferry::disk {

std::error_code prepare_fresh(const fs::path& dir) noexcept {
    if (dir.empty()) {
        return make_error_code(DiskErrc::invalid_path);
    }

    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        spdlog::warn("Could not clear {}: {}", dir.string(), ec.message());
        return make_error_code(DiskErrc::remove_failed);
    }

    fs::create_directories(dir, ec);
    if (ec) {
        spdlog::warn("Could not create {}: {}", dir.string(), ec.message());
        return ec == std::errc::permission_denied
            ? make_error_code(DiskErrc::access_denied)
            : make_error_code(DiskErrc::create_failed);
    }
    return {};
}

std::expected<std::vector<FileInfo>, std::error_code>
scan_files(const fs::path& dir) noexcept {
    std::vector<FileInfo> files;

    try {
        std::error_code ec;
        if (!fs::exists(dir, ec)) {
            return files;
        }

        // Entries may vanish mid-walk while the fetcher renames temp files
        for (auto it = fs::recursive_directory_iterator(
                 dir, fs::directory_options::skip_permission_denied, ec);
             !ec && it != fs::recursive_directory_iterator();
             it.increment(ec)) {
            std::error_code entry_ec;
            if (!it->is_regular_file(entry_ec)) continue;

            auto size = it->file_size(entry_ec);
            if (entry_ec) continue;
            files.push_back({it->path(), size});
        }
        if (ec && ec != std::errc::no_such_file_or_directory) {
            spdlog::debug("Scan of {} stopped early: {}", dir.string(), ec.message());
            return std::unexpected(make_error_code(DiskErrc::scan_failed));
        }

        std::sort(files.begin(), files.end(),
                  [](const FileInfo& a, const FileInfo& b) { return a.path < b.path; });
        return files;
    } catch (const std::exception& e) {
        spdlog::debug("Scan of {} failed: {}", dir.string(), e.what());
        return std::unexpected(make_error_code(DiskErrc::scan_failed));
    }
}

std::error_code remove_path(const fs::path& path) noexcept {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        return make_error_code(DiskErrc::remove_failed);
    }
    return {};
}

bool contains_files(const fs::path& dir) noexcept {
    auto files = scan_files(dir);
    // Unreadable counts as non-empty so nothing gets removed by mistake
    return !files || !files->empty();
}

bool remove_if_drained(const fs::path& dir) noexcept {
    std::error_code ec;
    if (!fs::exists(dir, ec) || contains_files(dir)) {
        return false;
    }
    if (remove_path(dir)) {
        spdlog::debug("Could not remove drained directory {}", dir.string());
        return false;
    }
    return true;
}

std::size_t remove_entries_older_than(const fs::path& root, fs::file_time_type cutoff) noexcept {
    std::vector<fs::path> stale;
    std::error_code ec;

    for (auto it = fs::directory_iterator(root, ec);
         !ec && it != fs::directory_iterator();
         it.increment(ec)) {
        std::error_code entry_ec;
        auto mtime = it->last_write_time(entry_ec);
        if (entry_ec || mtime >= cutoff) continue;
        stale.push_back(it->path());
    }
    if (ec) {
        spdlog::debug("Sweep of {} stopped: {}", root.string(), ec.message());
    }

    std::size_t removed = 0;
    for (const auto& path : stale) {
        if (!remove_path(path)) {
            spdlog::info("Removed stale download entry {}", path.string());
            ++removed;
        }
    }
    return removed;
}

} // namespace ferry::disk
