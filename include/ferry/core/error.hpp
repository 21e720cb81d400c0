// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string_view>

namespace ferry::core {

enum class JobErrc {
    success = 0,
    retrieval_conflict,
    retrieval_failure,
    relay_size_exceeded,
    relay_failure,
    cancelled,
    job_not_found,
    invalid_transition,
    not_modified,
    transport_error,
    invalid_config,
};

namespace detail {

struct JobErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "ferry::job";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<JobErrc>(ev)) {
            case JobErrc::success:              return "Success";
            case JobErrc::retrieval_conflict:   return "Destination already exists";
            case JobErrc::retrieval_failure:    return "Retrieval failed";
            case JobErrc::relay_size_exceeded:  return "File exceeds relay size limit";
            case JobErrc::relay_failure:        return "Relay failed";
            case JobErrc::cancelled:            return "Job cancelled";
            case JobErrc::job_not_found:        return "Job not found";
            case JobErrc::invalid_transition:   return "Invalid job state transition";
            case JobErrc::not_modified:         return "Message not modified";
            case JobErrc::transport_error:      return "Transport error";
            case JobErrc::invalid_config:       return "Invalid configuration";
            default:                            return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::JobErrcCategory& job_errc_category() noexcept {
    static detail::JobErrcCategory category;
    return category;
}

inline std::error_code make_error_code(JobErrc e) noexcept {
    return {static_cast<int>(e), job_errc_category()};
}

} // namespace ferry::core

namespace std {

template<>
struct is_error_code_enum<ferry::core::JobErrc> : true_type {};

} // namespace std
