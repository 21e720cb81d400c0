// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/job_registry.hpp>
#include <ferry/disk/work_dir.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace ferry::core {

JobRegistry::JobRegistry(std::filesystem::path download_root)
    : download_root_(std::move(download_root))
    , rng_(std::random_device{}()) {}

JobId JobRegistry::generate_id() {
    std::uniform_int_distribution<std::uint32_t> dist;
    JobId id;
    do {
        id = fmt::format("{:08x}", dist(rng_));
    } while (jobs_.contains(id));
    return id;
}

Job JobRegistry::create(std::string source_url, const ChatContext& chat) {
    std::lock_guard<std::mutex> lock(mutex_);

    Job job;
    job.id = generate_id();
    job.source_url = std::move(source_url);
    job.chat = chat;
    job.work_dir = download_root_ / fmt::format("user_{}_{}", chat.user_id, job.id);
    job.started_at = std::chrono::system_clock::now();
    job.started_mono = std::chrono::steady_clock::now();

    auto it = jobs_.emplace(job.id, std::move(job)).first;
    return it->second;
}

std::expected<Job, std::error_code> JobRegistry::get(const JobId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return std::unexpected(make_error_code(JobErrc::job_not_found));
    }
    return it->second;
}

std::error_code JobRegistry::request_cancel(const JobId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return make_error_code(JobErrc::job_not_found);
    }

    auto& job = it->second;
    if (job.state == JobState::running) {
        job.state = JobState::cancel_requested;
        spdlog::info("Cancel requested for job {}", id);
    }
    return {};
}

std::vector<Job> JobRegistry::list() const {
    std::vector<Job> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result.reserve(jobs_.size());
        for (const auto& [id, job] : jobs_) {
            result.push_back(job);
        }
    }
    std::sort(result.begin(), result.end(), [](const Job& a, const Job& b) {
        return a.started_mono < b.started_mono;
    });
    return result;
}

std::size_t JobRegistry::reap_older_than(std::chrono::seconds age) {
    const auto cutoff = std::chrono::steady_clock::now() - age;

    std::vector<std::filesystem::path> stale;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, job] : jobs_) {
            if (job.started_mono <= cutoff) {
                stale.push_back(job.work_dir);
            }
        }
    }

    std::size_t removed = 0;
    for (const auto& dir : stale) {
        std::error_code ec;
        if (!std::filesystem::exists(dir, ec)) continue;
        if (!disk::remove_path(dir)) {
            spdlog::info("Removed working directory {}", dir.string());
            ++removed;
        }
    }

    // Leftovers from earlier runs are not in the map; judge them by mtime
    const auto file_cutoff = std::filesystem::file_time_type::clock::now() - age;
    removed += disk::remove_entries_older_than(download_root_, file_cutoff);
    return removed;
}

std::error_code JobRegistry::forget(const JobId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return make_error_code(JobErrc::job_not_found);
    }
    if (!is_terminal(it->second.state)) {
        return make_error_code(JobErrc::invalid_transition);
    }
    jobs_.erase(it);
    return {};
}

std::size_t JobRegistry::forget_older_than(std::chrono::seconds age) {
    const auto cutoff = std::chrono::steady_clock::now() - age;

    std::lock_guard<std::mutex> lock(mutex_);
    return std::erase_if(jobs_, [&](const auto& entry) {
        const auto& job = entry.second;
        return is_terminal(job.state) && job.started_mono <= cutoff;
    });
}

std::error_code JobRegistry::attach_status(const JobId& id, StatusHandle handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return make_error_code(JobErrc::job_not_found);
    }
    it->second.status = handle;
    return {};
}

bool JobRegistry::mark_processed(const JobId& id, const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return false;
    }
    return it->second.processed.insert(path.string()).second;
}

bool JobRegistry::is_processed(const JobId& id, const std::filesystem::path& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    return it != jobs_.end() && it->second.processed.contains(path.string());
}

bool JobRegistry::cancel_requested(const JobId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    return it != jobs_.end() && it->second.state == JobState::cancel_requested;
}

std::error_code JobRegistry::transition(const JobId& id, JobState to) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return make_error_code(JobErrc::job_not_found);
    }

    auto& job = it->second;
    if (!can_transition(job.state, to)) {
        return make_error_code(JobErrc::invalid_transition);
    }
    if (job.state == JobState::cancel_requested && to == JobState::done) {
        job.cancelled = true;
    }
    job.state = to;
    return {};
}

std::error_code JobRegistry::fail(const JobId& id, std::string cause) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return make_error_code(JobErrc::job_not_found);
    }

    auto& job = it->second;
    if (!can_transition(job.state, JobState::failed)) {
        return make_error_code(JobErrc::invalid_transition);
    }
    job.state = JobState::failed;
    job.failure = std::move(cause);
    return {};
}

void JobRegistry::record(const JobId& id, FileOutcome outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) return;

    auto& counters = it->second.counters;
    switch (outcome) {
        case FileOutcome::relayed:       ++counters.relayed; break;
        case FileOutcome::skipped:       ++counters.skipped; break;
        case FileOutcome::relay_failed:  ++counters.relay_failed; break;
        case FileOutcome::abandoned:     ++counters.abandoned; break;
    }
}

std::size_t JobRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

} // namespace ferry::core
