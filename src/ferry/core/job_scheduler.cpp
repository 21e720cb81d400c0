// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/job_scheduler.hpp>
#include <spdlog/spdlog.h>

namespace ferry::core {

JobScheduler::JobScheduler(FetchPipeline& pipeline, std::uint32_t max_concurrent_jobs)
    : pipeline_(pipeline)
    , limit_(max_concurrent_jobs) {}

JobScheduler::~JobScheduler() {
    shutdown();
}

void JobScheduler::submit(const JobId& id) {
    collect_finished();

    std::lock_guard<std::mutex> lock(mutex_);
    if (shutting_down_) {
        spdlog::warn("Scheduler is shutting down, job {} not started", id);
        return;
    }

    auto& worker = workers_.emplace_back();
    worker.thread = std::jthread([this, id, &worker](std::stop_token stop) {
        if (acquire_slot(stop)) {
            try {
                pipeline_.run(id, stop);
            } catch (const std::exception& e) {
                spdlog::error("Job {} aborted: {}", id, e.what());
            }
            release_slot();
        } else {
            spdlog::info("Job {} never started: scheduler stopped", id);
        }

        std::lock_guard<std::mutex> done_lock(mutex_);
        worker.finished = true;
    });
}

bool JobScheduler::acquire_slot(std::stop_token stop) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (limit_ > 0) {
        slot_freed_.wait(lock, stop, [this] { return active_ < limit_ || shutting_down_; });
    }
    if (stop.stop_requested() || shutting_down_) {
        return false;
    }
    ++active_;
    return true;
}

void JobScheduler::release_slot() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --active_;
    }
    slot_freed_.notify_one();
}

void JobScheduler::collect_finished() {
    std::list<Worker> done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            auto next = std::next(it);
            if (it->finished) {
                done.splice(done.end(), workers_, it);
            }
            it = next;
        }
    }
    // Joining happens here, outside the lock
    done.clear();
}

void JobScheduler::shutdown() noexcept {
    std::list<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutting_down_ = true;
        workers.swap(workers_);
    }
    slot_freed_.notify_all();

    for (auto& worker : workers) {
        worker.thread.request_stop();
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) worker.thread.join();
    }
}

std::uint32_t JobScheduler::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

} // namespace ferry::core
