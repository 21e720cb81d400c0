// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>

namespace ferry::disk {

enum class DiskErrc {
    success = 0,
    access_denied,
    invalid_path,
    create_failed,
    remove_failed,
    scan_failed,
};

namespace detail {

struct DiskErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "ferry::disk";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<DiskErrc>(ev)) {
            case DiskErrc::success:            return "Success";
            case DiskErrc::access_denied:      return "Access denied";
            case DiskErrc::invalid_path:       return "Invalid path";
            case DiskErrc::create_failed:      return "Could not create directory";
            case DiskErrc::remove_failed:      return "Could not remove path";
            case DiskErrc::scan_failed:        return "Directory scan failed";
            default:                           return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DiskErrcCategory& disk_errc_category() noexcept {
    static detail::DiskErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DiskErrc e) noexcept {
    return {static_cast<int>(e), disk_errc_category()};
}

} // namespace ferry::disk

namespace std {

template<>
struct is_error_code_enum<ferry::disk::DiskErrc> : true_type {};

} // namespace std
