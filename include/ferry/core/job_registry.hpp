// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/error.hpp>
#include <ferry/core/job.hpp>
#include <chrono>
#include <expected>
#include <filesystem>
#include <map>
#include <mutex>
#include <random>
#include <string>
#include <system_error>
#include <vector>

namespace ferry::core {

// Concurrent map of job id -> job record. Every cross-activity mutation of a
// job goes through here. The lock is never held across filesystem or network
// calls.
class JobRegistry {
public:
    explicit JobRegistry(std::filesystem::path download_root);

    JobRegistry(const JobRegistry&) = delete;
    JobRegistry& operator=(const JobRegistry&) = delete;

    // New running job with a fresh id and a work dir under the download root
    [[nodiscard]] Job create(std::string source_url, const ChatContext& chat);

    [[nodiscard]] std::expected<Job, std::error_code> get(const JobId& id) const;

    // Running -> cancel_requested. No-op on finished jobs.
    [[nodiscard]] std::error_code request_cancel(const JobId& id);

    // Snapshot of all jobs, oldest first
    [[nodiscard]] std::vector<Job> list() const;

    // Remove working directories of jobs started more than `age` ago (any
    // state) and stale entries under the download root. Returns the count.
    std::size_t reap_older_than(std::chrono::seconds age);

    // Drop a finished job's record
    [[nodiscard]] std::error_code forget(const JobId& id);

    // Drop finished job records started more than `age` ago
    std::size_t forget_older_than(std::chrono::seconds age);

    [[nodiscard]] std::error_code attach_status(const JobId& id, StatusHandle handle);

    // Atomically add `path` to the processed set. False if it was already
    // there or the job is unknown.
    [[nodiscard]] bool mark_processed(const JobId& id, const std::filesystem::path& path);
    [[nodiscard]] bool is_processed(const JobId& id, const std::filesystem::path& path) const;

    [[nodiscard]] bool cancel_requested(const JobId& id) const;

    [[nodiscard]] std::error_code transition(const JobId& id, JobState to);

    // Move to failed and keep the cause for status listings
    [[nodiscard]] std::error_code fail(const JobId& id, std::string cause);

    void record(const JobId& id, FileOutcome outcome);

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] const std::filesystem::path& download_root() const noexcept { return download_root_; }

private:
    [[nodiscard]] JobId generate_id();

    std::filesystem::path download_root_;
    std::map<JobId, Job> jobs_;
    std::mt19937 rng_;
    mutable std::mutex mutex_;
};

} // namespace ferry::core
