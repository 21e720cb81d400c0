// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/fetch_pipeline.hpp>
#include <ferry/core/job.hpp>
#include <condition_variable>
#include <cstdint>
#include <list>
#include <mutex>
#include <thread>

namespace ferry::core {

// Runs each submitted job on its own thread. With a non-zero limit, at most
// that many pipelines run at once and the rest wait for a slot.
class JobScheduler {
public:
    JobScheduler(FetchPipeline& pipeline, std::uint32_t max_concurrent_jobs);
    ~JobScheduler();

    JobScheduler(const JobScheduler&) = delete;
    JobScheduler& operator=(const JobScheduler&) = delete;

    void submit(const JobId& id);

    // Stop every run (treated as a cancel) and join the threads
    void shutdown() noexcept;

    [[nodiscard]] std::uint32_t active() const;
    [[nodiscard]] std::uint32_t limit() const noexcept { return limit_; }

private:
    struct Worker {
        std::jthread thread;
        bool finished{false};
    };

    // Blocks until a slot is free; false when shutting down
    [[nodiscard]] bool acquire_slot(std::stop_token stop);
    void release_slot();

    // Join workers that have returned
    void collect_finished();

    FetchPipeline& pipeline_;
    std::uint32_t limit_;
    std::uint32_t active_{0};
    bool shutting_down_{false};
    std::list<Worker> workers_;
    mutable std::mutex mutex_;
    std::condition_variable_any slot_freed_;
};

} // namespace ferry::core
