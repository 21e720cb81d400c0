// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <ferry/core/error.hpp>
#include <ferry/core/fetch_pipeline.hpp>
#include <ferry/core/job_registry.hpp>
#include <ferry/core/progress_reporter.hpp>
#include "test_support.hpp"
#include <atomic>
#include <thread>

using namespace ferry::core;
using namespace ferry::test;

namespace fs = std::filesystem;
namespace chrono = std::chrono;

namespace {

const ChatContext CHAT{-1001, 77};

std::expected<void, FetchFailure> ok() {
    return {};
}

std::expected<void, FetchFailure> failure(JobErrc code, fs::path conflict = {}, std::string detail = {}) {
    return std::unexpected(FetchFailure{make_error_code(code), std::move(conflict), std::move(detail)});
}

struct Harness {
    TempDir tmp;
    FakeTransport transport;
    FakeRelay relay;
    FakeProbe probe{42};
    JobRegistry registry{tmp.path() / "downloads"};
    ProgressReporter reporter{transport, chrono::milliseconds(0), 10};
    PipelineConfig config = fast_pipeline();

    Job make_job() {
        auto job = make_job_without_status();
        REQUIRE_FALSE(registry.attach_status(job.id, StatusHandle{CHAT.chat_id, 1}));
        return job;
    }

    // As when posting the status message failed
    Job make_job_without_status() {
        return registry.create("https://mega.nz/file/abc#key", CHAT);
    }

    JobState run(Fetcher& fetcher, const JobId& id, std::stop_token stop = {}) {
        FetchPipeline pipeline(registry, fetcher, relay, transport, reporter, &probe, config);
        return pipeline.run(id, std::move(stop));
    }

    Job job(const JobId& id) {
        auto j = registry.get(id);
        REQUIRE(j.has_value());
        return *j;
    }
};

} // namespace

TEST_CASE("Files are relayed in order and deleted", "[pipeline]") {
    Harness h;
    auto job = h.make_job();

    FakeFetcher fetcher([](int, const fs::path& dest, std::stop_token) {
        write_file(dest / "a.bin", 100);
        write_file(dest / "b.mp4", 200);
        return ok();
    });

    CHECK(h.run(fetcher, job.id) == JobState::done);

    auto sent = h.relay.sent();
    REQUIRE(sent.size() == 2);
    CHECK(sent[0].file.filename() == "a.bin");
    CHECK(sent[0].existed);
    CHECK(sent[0].meta.size == 100);
    CHECK(sent[0].meta.caption == "a.bin\n100 B");
    CHECK(sent[0].meta.kind == MediaKind::document);
    CHECK(sent[1].file.filename() == "b.mp4");
    CHECK(sent[1].meta.kind == MediaKind::video);
    CHECK(sent[1].meta.duration_seconds == std::optional<std::uint32_t>(42));
    CHECK(h.probe.calls() == 1);

    auto finished = h.job(job.id);
    CHECK(finished.state == JobState::done);
    CHECK_FALSE(finished.cancelled);
    CHECK(finished.counters.relayed == 2);
    CHECK(finished.processed.size() == 2);

    // Drained working directory is removed
    CHECK_FALSE(fs::exists(job.work_dir));

    SECTION("Status updates arrive in pipeline order") {
        const int fetched_a = h.transport.find_edit("Downloaded: `a.bin`");
        const int uploading_a = h.transport.find_edit("📤 Uploading: `a.bin`");
        const int relayed_a = h.transport.find_edit("Upload complete: `a.bin`");
        const int fetched_b = h.transport.find_edit("Downloaded: `b.mp4`");
        const int summary = h.transport.find_edit("finished");

        REQUIRE(fetched_a >= 0);
        CHECK(fetched_a < uploading_a);
        CHECK(uploading_a < relayed_a);
        CHECK(relayed_a < fetched_b);
        CHECK(fetched_b < summary);

        auto edits = h.transport.edits();
        CHECK(summary == static_cast<int>(edits.size()) - 1);
        CHECK(edits.back().find("Relayed: 2 file(s)") != std::string::npos);
        CHECK(h.transport.find_edit("⏱ Duration: `00:00:42`") >= 0);
    }
}

TEST_CASE("A conflicting path is removed and the fetch retried", "[pipeline]") {
    Harness h;
    auto job = h.make_job();

    auto stale = h.tmp.path() / "elsewhere" / "stale.bin";
    write_file(stale, 10);

    FakeFetcher fetcher([&](int attempt, const fs::path& dest, std::stop_token) {
        if (attempt == 1) {
            return failure(JobErrc::retrieval_conflict, stale, "File already exists");
        }
        write_file(dest / "c.txt", 30);
        return ok();
    });

    CHECK(h.run(fetcher, job.id) == JobState::done);
    CHECK(fetcher.attempts() == 2);
    CHECK_FALSE(fs::exists(stale));
    CHECK(h.relay.sent().size() == 1);
    CHECK(h.job(job.id).counters.relayed == 1);
}

TEST_CASE("Conflicts past the retry budget fail the job", "[pipeline]") {
    Harness h;
    auto job = h.make_job();

    FakeFetcher fetcher([](int, const fs::path&, std::stop_token) {
        return failure(JobErrc::retrieval_conflict);
    });

    CHECK(h.run(fetcher, job.id) == JobState::failed);
    CHECK(fetcher.attempts() == 3);

    auto failed = h.job(job.id);
    CHECK(failed.state == JobState::failed);
    CHECK(failed.failure.find("Download failed after 3 retries.") != std::string::npos);
    CHECK(h.transport.edits().back().find("failed") != std::string::npos);
}

TEST_CASE("A terminal fetch error fails the job after draining", "[pipeline]") {
    Harness h;
    auto job = h.make_job();

    FakeFetcher fetcher([](int, const fs::path& dest, std::stop_token) {
        write_file(dest / "part1.bin", 10);
        return failure(JobErrc::retrieval_failure, {}, "link expired");
    });

    CHECK(h.run(fetcher, job.id) == JobState::failed);
    CHECK(fetcher.attempts() == 1);

    // What arrived before the failure still went out
    CHECK(h.relay.sent().size() == 1);

    auto failed = h.job(job.id);
    CHECK(failed.failure.find("link expired") != std::string::npos);
    CHECK(h.transport.find_edit("Job `" + job.id + "` failed") >= 0);
}

TEST_CASE("Oversize files are skipped and kept", "[pipeline]") {
    Harness h;
    h.config.relay_max_bytes = 50;
    auto job = h.make_job();

    FakeFetcher fetcher([](int, const fs::path& dest, std::stop_token) {
        write_file(dest / "big.iso", 100);
        return ok();
    });

    CHECK(h.run(fetcher, job.id) == JobState::done);
    CHECK(h.relay.sent().empty());
    CHECK(fs::exists(job.work_dir / "big.iso"));
    CHECK(h.job(job.id).counters.skipped == 1);
    CHECK(h.transport.find_edit("Skipping upload") >= 0);
    CHECK(h.transport.find_edit("big.iso") >= 0);
}

TEST_CASE("A failed relay still deletes the local copy", "[pipeline]") {
    Harness h;
    h.relay.result = make_error_code(JobErrc::relay_failure);
    auto job = h.make_job();

    FakeFetcher fetcher([](int, const fs::path& dest, std::stop_token) {
        write_file(dest / "doc.pdf", 40);
        return ok();
    });

    CHECK(h.run(fetcher, job.id) == JobState::done);
    CHECK(h.relay.sent().size() == 1);
    CHECK_FALSE(fs::exists(job.work_dir / "doc.pdf"));
    CHECK(h.job(job.id).counters.relay_failed == 1);

    auto notices = h.transport.notices();
    REQUIRE(notices.size() == 1);
    CHECK(notices[0].find("Upload failed for `doc.pdf`") != std::string::npos);
}

TEST_CASE("Cancel during stabilization abandons the file", "[pipeline]") {
    Harness h;
    auto job = h.make_job();

    std::atomic<bool> fetcher_stopped{false};
    FakeFetcher fetcher([&](int, const fs::path& dest, std::stop_token stop) {
        auto file = dest / "grow.bin";
        write_file(file, 1);
        while (!stop.stop_requested()) {
            append_file(file, 8);
            std::this_thread::sleep_for(chrono::milliseconds(10));
        }
        fetcher_stopped = true;
        return failure(JobErrc::cancelled);
    });

    std::atomic<JobState> result{JobState::running};
    std::jthread runner([&] { result = h.run(fetcher, job.id); });

    REQUIRE(wait_until([&] { return h.transport.find_edit("Downloading: `grow.bin`") >= 0; }));
    REQUIRE_FALSE(h.registry.request_cancel(job.id));
    runner.join();

    CHECK(result.load() == JobState::done);
    CHECK(fetcher_stopped.load());
    CHECK(h.relay.sent().empty());
    CHECK(fs::exists(job.work_dir / "grow.bin"));

    auto cancelled = h.job(job.id);
    CHECK(cancelled.cancelled);
    CHECK(cancelled.counters.abandoned == 1);
    auto last = h.transport.edits().back();
    CHECK(last.find("cancelled") != std::string::npos);
    CHECK(last.find("Abandoned") != std::string::npos);
}

TEST_CASE("Cancel keeps relayed work and abandons the file in progress", "[pipeline]") {
    Harness h;
    auto job = h.make_job();

    FakeFetcher fetcher([&](int, const fs::path& dest, std::stop_token stop) {
        write_file(dest / "1_done.bin", 64);
        while (h.relay.sent().empty() && !stop.stop_requested()) {
            std::this_thread::sleep_for(chrono::milliseconds(5));
        }
        auto file = dest / "2_grow.bin";
        write_file(file, 1);
        while (!stop.stop_requested()) {
            append_file(file, 8);
            std::this_thread::sleep_for(chrono::milliseconds(10));
        }
        return failure(JobErrc::cancelled);
    });

    std::atomic<JobState> result{JobState::running};
    std::jthread runner([&] { result = h.run(fetcher, job.id); });

    REQUIRE(wait_until([&] { return h.transport.find_edit("Downloading: `2_grow.bin`") >= 0; }));
    REQUIRE_FALSE(h.registry.request_cancel(job.id));
    runner.join();

    CHECK(result.load() == JobState::done);

    auto sent = h.relay.sent();
    REQUIRE(sent.size() == 1);
    CHECK(sent[0].file.filename() == "1_done.bin");
    CHECK_FALSE(fs::exists(job.work_dir / "1_done.bin"));
    CHECK(fs::exists(job.work_dir / "2_grow.bin"));

    auto cancelled = h.job(job.id);
    CHECK(cancelled.state == JobState::done);
    CHECK(cancelled.cancelled);
    CHECK(cancelled.counters.relayed == 1);
    CHECK(cancelled.counters.abandoned == 1);
    auto last = h.transport.edits().back();
    CHECK(last.find("cancelled") != std::string::npos);
    CHECK(last.find("Relayed: 1 file(s)") != std::string::npos);
}

TEST_CASE("Cancel during the retry pause starts no new attempt", "[pipeline]") {
    Harness h;
    h.config.retry_delay = chrono::seconds(2);
    auto job = h.make_job();

    FakeFetcher fetcher([](int, const fs::path&, std::stop_token) {
        return failure(JobErrc::retrieval_conflict);
    });

    std::atomic<JobState> result{JobState::running};
    std::jthread runner([&] { result = h.run(fetcher, job.id); });

    REQUIRE(wait_until([&] { return fetcher.attempts() == 1; }));
    REQUIRE_FALSE(h.registry.request_cancel(job.id));
    runner.join();

    CHECK(fetcher.attempts() == 1);
    CHECK(result.load() == JobState::done);
    CHECK(h.job(job.id).cancelled);
}

TEST_CASE("Without a status message the summary goes to the chat", "[pipeline]") {
    Harness h;

    FakeFetcher fetcher([](int, const fs::path&, std::stop_token) {
        return failure(JobErrc::retrieval_failure, {}, "link expired");
    });

    SECTION("No handle attached") {
        auto job = h.make_job_without_status();
        CHECK(h.run(fetcher, job.id) == JobState::failed);
        CHECK(h.transport.edits().empty());

        auto notices = h.transport.notices();
        REQUIRE(notices.size() == 1);
        CHECK(notices[0].find("Job `" + job.id + "` failed") != std::string::npos);
        CHECK(notices[0].find("link expired") != std::string::npos);
    }

    SECTION("Status edits rejected") {
        h.transport.edit_result = make_error_code(JobErrc::transport_error);
        auto job = h.make_job();
        CHECK(h.run(fetcher, job.id) == JobState::failed);

        auto notices = h.transport.notices();
        REQUIRE(notices.size() == 1);
        CHECK(notices[0].find("link expired") != std::string::npos);
    }
}

TEST_CASE("A stop request ends the run like a cancel", "[pipeline]") {
    Harness h;
    auto job = h.make_job();

    FakeFetcher fetcher([](int, const fs::path&, std::stop_token stop) {
        while (!stop.stop_requested()) {
            std::this_thread::sleep_for(chrono::milliseconds(5));
        }
        return failure(JobErrc::cancelled);
    });

    std::stop_source source;
    std::jthread stopper([&source] {
        std::this_thread::sleep_for(chrono::milliseconds(100));
        source.request_stop();
    });

    CHECK(h.run(fetcher, job.id, source.get_token()) == JobState::done);
    CHECK(h.job(job.id).cancelled);
}

TEST_CASE("An unknown job id fails without side effects", "[pipeline]") {
    Harness h;
    FakeFetcher fetcher([](int, const fs::path&, std::stop_token) { return ok(); });

    CHECK(h.run(fetcher, "nope") == JobState::failed);
    CHECK(fetcher.attempts() == 0);
    CHECK(h.transport.edits().empty());
}
