// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/fetch_pipeline.hpp>
#include <ferry/core/error.hpp>
#include <ferry/core/rate_sampler.hpp>
#include <ferry/core/units.hpp>
#include <ferry/disk/work_dir.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <mutex>
#include <optional>
#include <thread>

namespace fs = std::filesystem;

namespace ferry::core {

namespace {

constexpr std::chrono::milliseconds CANCEL_CHECK_SLICE{50};

std::string file_label(const fs::path& file) {
    return file.filename().string();
}

} // namespace

// Everything one run owns. Lives on the driver thread's stack.
struct FetchPipeline::Run {
    Job job;
    std::stop_token stop;
    PipelineStage stage{PipelineStage::starting};
    bool cancelled{false};

    // Single writer for the status handle; relay callbacks come through here
    std::mutex status_mutex;

    std::atomic<bool> fetch_finished{false};
    std::mutex fetch_mutex;
    std::optional<FetchFailure> fetch_failure;

    ByteRateSampler fetch_rate;
    ByteRateSampler relay_rate;
    std::uint64_t routed_bytes{0};

    // Declared last: joined before the members above go away
    std::jthread fetch_thread;

    Run(Job j, std::stop_token s, std::chrono::milliseconds rate_window)
        : job(std::move(j))
        , stop(std::move(s))
        , fetch_rate(rate_window)
        , relay_rate(rate_window) {}
};

FetchPipeline::FetchPipeline(JobRegistry& registry,
                             Fetcher& fetcher,
                             RelayClient& relay,
                             Transport& transport,
                             ProgressReporter& reporter,
                             MediaProbe* probe,
                             PipelineConfig config)
    : registry_(registry)
    , fetcher_(fetcher)
    , relay_(relay)
    , transport_(transport)
    , reporter_(reporter)
    , probe_(probe)
    , config_(config)
    , detector_(config.stability_window, config.stability_poll) {}

namespace {

// Serialized write into the job's status handle
void write_status(std::mutex& mutex, ProgressReporter& reporter,
                  const std::optional<StatusHandle>& handle,
                  const ProgressSnapshot& snapshot) {
    if (!handle) return;
    std::lock_guard<std::mutex> lock(mutex);
    (void)reporter.emit(*handle, snapshot);
}

// Final word on a job: the status handle when it takes it, the chat otherwise
void write_summary(std::mutex& mutex, ProgressReporter& reporter, Transport& transport,
                   const Job& job, const ProgressSnapshot& summary) {
    std::lock_guard<std::mutex> lock(mutex);
    if (job.status && reporter.emit(*job.status, summary) != EmitResult::failed) {
        return;
    }
    if (auto ec = transport.notify(job.chat, reporter.render(summary))) {
        spdlog::warn("Job {}: summary not delivered: {}", job.id, ec.message());
    }
}

} // namespace

JobState FetchPipeline::run(const JobId& id, std::stop_token stop) {
    auto job = registry_.get(id);
    if (!job) {
        spdlog::error("Job {} is not registered", id);
        return JobState::failed;
    }

    Run run(std::move(*job), std::move(stop), config_.rate_window);
    spdlog::info("Job {} starting: {} -> {}", id, run.job.source_url, run.job.work_dir.string());

    // Starting: never merge with leftovers of an earlier attempt
    if (auto ec = disk::prepare_fresh(run.job.work_dir)) {
        const auto cause = fmt::format("cannot prepare working directory: {}", ec.message());
        spdlog::error("Job {} failed: {}", id, cause);
        if (registry_.fail(id, cause)) {
            spdlog::debug("Job {} was already finished", id);
        }
        ProgressSnapshot snap{.phase = Phase::failed,
                              .label = fmt::format("Job `{}` failed", id),
                              .detail = {fmt::format("Cause: {}", cause)}};
        write_summary(run.status_mutex, reporter_, transport_, run.job, snap);
        return JobState::failed;
    }

    run.fetch_thread = std::jthread([this, &run](std::stop_token fetch_stop) {
        fetch_activity(run, std::move(fetch_stop));
    });

    run.stage = PipelineStage::draining;
    drain(run);

    run.stage = PipelineStage::finishing;
    return finish(run);
}

void FetchPipeline::fetch_activity(Run& run, std::stop_token stop) {
    const auto& id = run.job.id;
    std::optional<FetchFailure> failure;

    for (std::uint32_t attempt = 1; ; ++attempt) {
        if (stop.stop_requested() || registry_.cancel_requested(id)) {
            failure = FetchFailure{make_error_code(JobErrc::cancelled), {}, "cancelled"};
            break;
        }

        auto result = fetcher_.fetch(run.job.source_url, run.job.work_dir, stop);
        if (result) {
            spdlog::info("Job {} retrieval finished", id);
            break;
        }

        auto& err = result.error();
        if (err.code != JobErrc::retrieval_conflict) {
            spdlog::error("Job {} retrieval failed: {} ({})", id, err.code.message(), err.detail);
            failure = std::move(err);
            break;
        }

        if (attempt >= config_.fetch_retries) {
            failure = FetchFailure{make_error_code(JobErrc::retrieval_failure), {},
                                   fmt::format("Download failed after {} retries.", config_.fetch_retries)};
            spdlog::error("Job {}: {}", id, failure->detail);
            break;
        }

        if (!err.conflict_path.empty()) {
            if (disk::remove_path(err.conflict_path)) {
                spdlog::debug("Failed to remove existing path {}", err.conflict_path.string());
            } else {
                spdlog::info("Removed existing path to allow retry: {}", err.conflict_path.string());
            }
        }

        // Interruptible pause before the next attempt
        const auto deadline = std::chrono::steady_clock::now() + config_.retry_delay;
        while (!stop.stop_requested() && !registry_.cancel_requested(id)
               && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(CANCEL_CHECK_SLICE);
        }
    }

    {
        std::lock_guard<std::mutex> lock(run.fetch_mutex);
        run.fetch_failure = std::move(failure);
    }
    run.fetch_finished.store(true, std::memory_order_release);
}

void FetchPipeline::drain(Run& run) {
    const auto& id = run.job.id;

    auto is_cancelled = [&] {
        if (!run.cancelled) {
            run.cancelled = registry_.cancel_requested(id) || run.stop.stop_requested();
        }
        return run.cancelled;
    };

    while (true) {
        // Read before scanning so files written just before the fetch
        // activity ends are still seen by this pass
        const bool fetching = !run.fetch_finished.load(std::memory_order_acquire);

        std::vector<fs::path> candidates;
        if (auto files = disk::scan_files(run.job.work_dir)) {
            for (const auto& f : *files) {
                if (!registry_.is_processed(id, f.path)) {
                    candidates.push_back(f.path);
                }
            }
        } else {
            spdlog::debug("Job {}: scan failed: {}", id, files.error().message());
        }

        if (is_cancelled()) {
            for (const auto& file : candidates) abandon(run, file);
            break;
        }

        if (candidates.empty()) {
            if (!fetching) break;
            emit_fetch_progress(run, "waiting for data", 0);
            (void)pause(run, config_.idle_sleep);
            continue;
        }

        // scan_files returns paths in lexicographic order
        for (const auto& file : candidates) {
            if (is_cancelled()) {
                abandon(run, file);
                continue;
            }

            const auto label = file_label(file);
            bool stable = detector_.is_stable(file, is_cancelled, [&](std::uint64_t size) {
                emit_fetch_progress(run, label, size);
            });
            if (!stable) {
                abandon(run, file);
                continue;
            }
            route(run, file);
        }

        // A cancel seen during the batch is handled at the top of the loop
        (void)pause(run, config_.batch_sleep);
    }
}

void FetchPipeline::emit_fetch_progress(Run& run, const std::string& label, std::uint64_t pending_bytes) {
    const std::uint64_t cumulative = run.routed_bytes + pending_bytes;
    run.fetch_rate.observe(std::chrono::steady_clock::now(), cumulative);

    ProgressSnapshot snap{.phase = Phase::fetching,
                          .bytes_done = cumulative,
                          .rate_bps = run.fetch_rate.rate(),
                          .label = label};
    write_status(run.status_mutex, reporter_, run.job.status, snap);
}

void FetchPipeline::abandon(Run& run, const fs::path& file) {
    if (!registry_.mark_processed(run.job.id, file)) return;
    registry_.record(run.job.id, FileOutcome::abandoned);
    spdlog::info("Job {}: abandoned {} on cancel, left on disk", run.job.id, file.string());
}

void FetchPipeline::route(Run& run, const fs::path& file) {
    const auto& id = run.job.id;
    if (!registry_.mark_processed(id, file)) {
        return;
    }

    std::error_code ec;
    const std::uint64_t size = fs::file_size(file, ec);
    if (ec) {
        spdlog::debug("Job {}: size of {} unavailable: {}", id, file.string(), ec.message());
    }
    run.routed_bytes += ec ? 0 : size;

    FileMetadata meta;
    meta.name = file_label(file);
    meta.size = ec ? 0 : size;
    meta.kind = classify_media(file);
    meta.caption = fmt::format("{}\n{}", meta.name, format_bytes(meta.size));

    ProgressSnapshot fetched{.phase = Phase::complete,
                             .label = fmt::format("Downloaded: `{}`", meta.name),
                             .detail = {fmt::format("📦 Size: `{}`", format_bytes(meta.size))}};
    if (meta.kind == MediaKind::video && probe_) {
        meta.duration_seconds = probe_->duration(file);
        if (meta.duration_seconds && *meta.duration_seconds > 0) {
            fetched.detail.push_back(fmt::format("⏱ Duration: `{}`", format_hms(*meta.duration_seconds)));
        }
    }
    write_status(run.status_mutex, reporter_, run.job.status, fetched);
    spdlog::info("Job {}: fetched {} ({})", id, meta.name, format_bytes(meta.size));

    if (meta.size > config_.relay_max_bytes) {
        ProgressSnapshot skipped = fetched;
        skipped.phase = Phase::failed;
        skipped.label = fmt::format("File exceeds the upload limit ({}). Skipping upload.",
                                    format_bytes(config_.relay_max_bytes));
        skipped.detail.push_back(fmt::format("Local path: `{}`", file.string()));
        write_status(run.status_mutex, reporter_, run.job.status, skipped);
        registry_.record(id, FileOutcome::skipped);
        spdlog::warn("Job {}: {} is {}, over the relay limit; kept at {}",
                     id, meta.name, format_bytes(meta.size), file.string());
        return;
    }

    relay_file(run, file, meta);

    // Local copy goes regardless of the relay outcome
    if (disk::remove_path(file)) {
        spdlog::debug("Job {}: failed to remove {}", id, file.string());
    }
}

void FetchPipeline::relay_file(Run& run, const fs::path& file, const FileMetadata& meta) {
    const auto& id = run.job.id;
    const auto start = std::chrono::steady_clock::now();
    run.relay_rate.reset();

    auto on_progress = [&](std::uint64_t sent, std::uint64_t total) {
        run.relay_rate.observe(std::chrono::steady_clock::now(), sent);
        const std::uint64_t remaining = total > sent ? total - sent : 0;
        ProgressSnapshot snap{.phase = Phase::relaying,
                              .bytes_done = sent,
                              .bytes_total = total,
                              .rate_bps = run.relay_rate.rate(),
                              .eta_seconds = run.relay_rate.eta(remaining),
                              .label = meta.name};
        write_status(run.status_mutex, reporter_, run.job.status, snap);
    };

    auto ec = relay_.send(run.job.chat, file, meta, on_progress);

    if (ec) {
        spdlog::error("Job {}: upload of {} failed: {}", id, meta.name, ec.message());
        ProgressSnapshot failed{.phase = Phase::failed,
                                .label = fmt::format("Failed to upload `{}`: {}", meta.name, ec.message())};
        write_status(run.status_mutex, reporter_, run.job.status, failed);
        if (auto nec = transport_.notify(run.job.chat,
                fmt::format("⚠️ Upload failed for `{}`: {}", meta.name, ec.message()))) {
            spdlog::debug("Job {}: failure notice not delivered: {}", id, nec.message());
        }
        registry_.record(id, FileOutcome::relay_failed);
        return;
    }

    const double elapsed = std::max(
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count(), 1e-6);
    ProgressSnapshot done{.phase = Phase::complete,
                          .bytes_done = meta.size,
                          .bytes_total = meta.size,
                          .label = fmt::format("Upload complete: `{}`", meta.name),
                          .detail = {fmt::format("Avg speed: `{}` | Time: `{}`",
                                                 format_rate(static_cast<double>(meta.size) / elapsed),
                                                 format_hms(static_cast<std::uint64_t>(elapsed)))}};
    write_status(run.status_mutex, reporter_, run.job.status, done);
    registry_.record(id, FileOutcome::relayed);
    spdlog::info("Job {}: relayed {}", id, meta.name);
}

JobState FetchPipeline::finish(Run& run) {
    const auto& id = run.job.id;

    // A cancelled run stops the fetcher; otherwise it already returned
    if (run.cancelled) {
        run.fetch_thread.request_stop();
    }
    if (run.fetch_thread.joinable()) {
        run.fetch_thread.join();
    }

    std::optional<FetchFailure> failure;
    {
        std::lock_guard<std::mutex> lock(run.fetch_mutex);
        failure = run.fetch_failure;
    }

    // A stop request from the scheduler is recorded like an operator cancel
    if (run.stop.stop_requested()) {
        (void)registry_.request_cancel(id);
    }
    const bool cancelled = run.cancelled || registry_.cancel_requested(id);

    JobState final_state = JobState::done;
    ProgressSnapshot summary;

    if (!cancelled && failure && failure->code != JobErrc::cancelled) {
        final_state = JobState::failed;
        const auto cause = failure->detail.empty()
            ? failure->code.message()
            : fmt::format("{} ({})", failure->code.message(), failure->detail);
        if (auto ec = registry_.fail(id, cause)) {
            spdlog::debug("Job {}: could not record failure: {}", id, ec.message());
        }
        summary.phase = Phase::failed;
        summary.label = fmt::format("Job `{}` failed", id);
        summary.detail.push_back(fmt::format("Cause: {}", cause));
    } else {
        if (auto ec = registry_.transition(id, JobState::done)) {
            spdlog::debug("Job {}: could not mark done: {}", id, ec.message());
        }
        summary.phase = Phase::complete;
        summary.label = cancelled
            ? fmt::format("Job `{}` cancelled", id)
            : fmt::format("Job `{}` finished", id);
    }

    if (auto job = registry_.get(id)) {
        const auto& c = job->counters;
        summary.detail.push_back(fmt::format("Relayed: {} file(s)", c.relayed));
        if (c.skipped) summary.detail.push_back(fmt::format("Skipped (too large): {}", c.skipped));
        if (c.relay_failed) summary.detail.push_back(fmt::format("Upload failed: {}", c.relay_failed));
        if (c.abandoned) {
            summary.detail.push_back(fmt::format("Abandoned, kept in `{}`: {}",
                                                 run.job.work_dir.string(), c.abandoned));
        }
    }
    write_summary(run.status_mutex, reporter_, transport_, run.job, summary);
    if (run.job.status) {
        reporter_.forget(*run.job.status);
    }

    if (disk::remove_if_drained(run.job.work_dir)) {
        spdlog::info("Cleaned up: {}", run.job.work_dir.string());
    }

    run.stage = PipelineStage::terminal;
    spdlog::info("Job {} {}", id, cancelled ? "cancelled" : to_string(final_state));
    return final_state;
}

bool FetchPipeline::pause(Run& run, std::chrono::milliseconds duration) {
    const auto deadline = std::chrono::steady_clock::now() + duration;
    while (std::chrono::steady_clock::now() < deadline) {
        if (run.cancelled || registry_.cancel_requested(run.job.id) || run.stop.stop_requested()) {
            return false;
        }
        std::this_thread::sleep_for(CANCEL_CHECK_SLICE);
    }
    return true;
}

} // namespace ferry::core
