// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/config.hpp>
#include <ferry/core/interfaces.hpp>
#include <ferry/core/job.hpp>
#include <ferry/core/job_registry.hpp>
#include <ferry/core/progress_reporter.hpp>
#include <ferry/core/stability_detector.hpp>
#include <filesystem>
#include <stop_token>
#include <vector>

namespace ferry::core {

// Pipeline phase of one run
enum class PipelineStage : std::uint8_t {
    starting,    // Preparing the work dir, launching the fetch activity
    draining,    // Stabilizing and relaying files as they arrive
    finishing,   // Settling job state, cleaning up
    terminal     // Done or failed
};

// Drives jobs from link to drained working directory: one fetch activity
// and a strictly sequential stabilize -> relay -> delete loop per job.
// One instance can run many jobs concurrently; per-run state lives on the
// running thread.
class FetchPipeline {
public:
    FetchPipeline(JobRegistry& registry,
                  Fetcher& fetcher,
                  RelayClient& relay,
                  Transport& transport,
                  ProgressReporter& reporter,
                  MediaProbe* probe,
                  PipelineConfig config);

    FetchPipeline(const FetchPipeline&) = delete;
    FetchPipeline& operator=(const FetchPipeline&) = delete;

    // Run a registered job to done or failed. Blocks. A stop request acts
    // like an operator cancel.
    JobState run(const JobId& id, std::stop_token stop = {});

    [[nodiscard]] const PipelineConfig& config() const noexcept { return config_; }

private:
    struct Run;

    void drain(Run& run);
    void route(Run& run, const std::filesystem::path& file);
    void relay_file(Run& run, const std::filesystem::path& file,
                    const FileMetadata& meta);
    void abandon(Run& run, const std::filesystem::path& file);
    JobState finish(Run& run);

    void fetch_activity(Run& run, std::stop_token stop);
    void emit_fetch_progress(Run& run, const std::string& label, std::uint64_t pending_bytes);

    // Sleep unless the run is cancelled first. False if cancelled.
    [[nodiscard]] bool pause(Run& run, std::chrono::milliseconds duration);

    JobRegistry& registry_;
    Fetcher& fetcher_;
    RelayClient& relay_;
    Transport& transport_;
    ProgressReporter& reporter_;
    MediaProbe* probe_;
    PipelineConfig config_;
    StabilityDetector detector_;
};

} // namespace ferry::core
