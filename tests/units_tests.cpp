// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <ferry/core/interfaces.hpp>
#include <ferry/core/job.hpp>
#include <ferry/core/units.hpp>

using namespace ferry::core;

TEST_CASE("format_bytes", "[units]") {
    CHECK(format_bytes(0) == "0 B");
    CHECK(format_bytes(1023) == "1023 B");
    CHECK(format_bytes(1024) == "1.00 KB");
    CHECK(format_bytes(1536) == "1.50 KB");
    CHECK(format_bytes(1024ULL * 1024) == "1.00 MB");
    CHECK(format_bytes(2ULL * 1024 * 1024 * 1024) == "2.00 GB");
}

TEST_CASE("format_rate and format_hms", "[units]") {
    CHECK(format_rate(0.0) == "0 B/s");
    CHECK(format_rate(-5.0) == "0 B/s");
    CHECK(format_rate(2048.0) == "2.00 KB/s");

    CHECK(format_hms(0) == "00:00:00");
    CHECK(format_hms(59) == "00:00:59");
    CHECK(format_hms(3661) == "01:01:01");
    CHECK(format_hms(100 * 3600) == "100:00:00");
}

TEST_CASE("render_bar", "[units]") {
    CHECK(render_bar(0.0, 4) == "░░░░");
    CHECK(render_bar(50.0, 4) == "▓▓░░");
    CHECK(render_bar(100.0, 4) == "▓▓▓▓");

    SECTION("Out of range percentages are clamped") {
        CHECK(render_bar(150.0, 2) == "▓▓");
        CHECK(render_bar(-10.0, 2) == "░░");
    }
}

TEST_CASE("classify_media by extension", "[units]") {
    CHECK(classify_media("clip.mp4") == MediaKind::video);
    CHECK(classify_media("CLIP.MKV") == MediaKind::video);
    CHECK(classify_media("a/b/photo.JPeG") == MediaKind::photo);
    CHECK(classify_media("song.flac") == MediaKind::audio);
    CHECK(classify_media("report.pdf") == MediaKind::document);
    CHECK(classify_media("no_extension") == MediaKind::document);
}

TEST_CASE("Job state transitions", "[job]") {
    CHECK(can_transition(JobState::running, JobState::cancel_requested));
    CHECK(can_transition(JobState::running, JobState::done));
    CHECK(can_transition(JobState::cancel_requested, JobState::done));
    CHECK_FALSE(can_transition(JobState::cancel_requested, JobState::running));
    CHECK_FALSE(can_transition(JobState::done, JobState::running));
    CHECK_FALSE(can_transition(JobState::failed, JobState::done));

    CHECK(is_terminal(JobState::done));
    CHECK(is_terminal(JobState::failed));
    CHECK_FALSE(is_terminal(JobState::cancel_requested));
}
