// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <ferry/bot/command_router.hpp>
#include "test_support.hpp"
#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <memory>

using namespace ferry::bot;
using namespace ferry::core;
using ferry::test::FakeTransport;
using ferry::test::TempDir;

namespace chrono = std::chrono;

namespace {

constexpr std::int64_t OWNER = 1000;
constexpr const char* LINK = "https://mega.nz/file/AbC-12_x#KeY_9-z";

struct RouterHarness {
    TempDir tmp;
    FakeTransport transport;
    JobRegistry registry{tmp.path()};
    std::vector<JobId> submitted;
    CommandRouter router{registry, transport,
                         [this](const JobId& id) { submitted.push_back(id); },
                         RouterOptions{OWNER, 6}};

    Route say(std::int64_t user, std::string text) {
        return router.handle(InboundMessage{{-500, user}, std::move(text)});
    }

    std::string last_notice() const {
        auto notices = transport.notices();
        return notices.empty() ? std::string{} : notices.back();
    }
};

// Routes the default logger into a ring buffer for the scope
struct CapturedLog {
    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink =
        std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(128);
    std::shared_ptr<spdlog::logger> previous = spdlog::default_logger();

    CapturedLog() {
        spdlog::set_default_logger(std::make_shared<spdlog::logger>("captured", sink));
    }
    ~CapturedLog() { spdlog::set_default_logger(previous); }

    std::size_t count(std::string_view needle) const {
        auto lines = sink->last_formatted();
        return static_cast<std::size_t>(std::count_if(lines.begin(), lines.end(),
            [&](const std::string& line) { return line.find(needle) != std::string::npos; }));
    }
};

} // namespace

TEST_CASE("Mega link detection", "[router]") {
    CHECK(find_mega_link(LINK) == std::optional<std::string>(LINK));
    CHECK(find_mega_link("https://mega.nz/folder/xyz#abc").has_value());
    CHECK(find_mega_link(std::string("grab this: ") + LINK + " thanks") == std::optional<std::string>(LINK));

    CHECK_FALSE(find_mega_link("http://mega.nz/file/abc#key").has_value());
    CHECK_FALSE(find_mega_link("https://mega.nz/file/abc").has_value());
    CHECK_FALSE(find_mega_link("https://mega.nz/#!abc!key").has_value());
    CHECK_FALSE(find_mega_link("https://example.com/file/abc#key").has_value());
}

TEST_CASE("A link starts a job", "[router]") {
    RouterHarness h;

    CHECK(h.say(5, LINK) == Route::link);

    REQUIRE(h.registry.size() == 1);
    auto job = h.registry.list().front();
    CHECK(job.source_url == LINK);
    CHECK(job.chat.user_id == 5);
    CHECK(job.chat.chat_id == -500);

    auto posts = h.transport.posts();
    REQUIRE(posts.size() == 1);
    CHECK(posts[0].find("Job `" + job.id + "` started") != std::string::npos);

    // Status is attached before the run is submitted
    REQUIRE(job.status.has_value());
    CHECK(job.status->chat_id == -500);
    REQUIRE(h.submitted.size() == 1);
    CHECK(h.submitted[0] == job.id);

    CHECK(h.last_notice().find("Job queued: `" + job.id + "`") != std::string::npos);

    SECTION("A failed status post still submits the job") {
        h.transport.fail_post = true;
        CHECK(h.say(5, LINK) == Route::link);
        CHECK(h.submitted.size() == 2);
        CHECK_FALSE(h.registry.get(h.submitted[1])->status.has_value());
    }
}

TEST_CASE("Operator commands are owner only", "[router]") {
    RouterHarness h;

    for (const char* cmd : {"/status", "/cancel abc", "/clear"}) {
        CHECK(h.say(5, cmd) == Route::denied);
        CHECK(h.last_notice() == "❌ Owner only.");
    }
    CHECK(h.submitted.empty());
}

TEST_CASE("/status lists jobs", "[router]") {
    RouterHarness h;

    CHECK(h.say(OWNER, "/status") == Route::status);
    CHECK(h.last_notice() == "ℹ️ No active jobs.");

    auto job = h.registry.create(LINK, {1, 2});
    CHECK(h.say(OWNER, "/status@ferry_bot") == Route::status);
    auto text = h.last_notice();
    CHECK(text.starts_with("🧾 Jobs:"));
    CHECK(text.find("`" + job.id + "`") != std::string::npos);
    CHECK(text.find("running") != std::string::npos);
    CHECK(text.find(LINK) != std::string::npos);

    REQUIRE_FALSE(h.registry.request_cancel(job.id));
    REQUIRE_FALSE(h.registry.transition(job.id, JobState::done));
    (void)h.say(OWNER, "/status");
    CHECK(h.last_notice().find("cancelled") != std::string::npos);
}

TEST_CASE("/cancel", "[router]") {
    RouterHarness h;
    auto job = h.registry.create(LINK, {1, 2});

    CHECK(h.say(OWNER, "/cancel") == Route::cancel);
    CHECK(h.last_notice() == "Usage: /cancel <job_id>");

    (void)h.say(OWNER, "/cancel ffffffff");
    CHECK(h.last_notice() == "❌ Job `ffffffff` not found.");

    (void)h.say(OWNER, "/cancel  " + job.id + " ");
    CHECK(h.last_notice() == "⚠️ Cancel requested for `" + job.id + "`.");
    CHECK(h.registry.cancel_requested(job.id));
}

TEST_CASE("/clear reaps old folders", "[router]") {
    RouterHarness h;
    auto stale = h.tmp.path() / "user_9_00000000";
    ferry::test::write_file(stale / "x.bin", 4);
    std::filesystem::last_write_time(stale, std::filesystem::file_time_type::clock::now() - chrono::hours(7));

    CHECK(h.say(OWNER, "/clear") == Route::clear);
    CHECK(h.last_notice() == "🧹 Cleared 1 old download folder(s).");
    CHECK_FALSE(std::filesystem::exists(stale));
}

TEST_CASE("Help, fallback and empty messages", "[router]") {
    RouterHarness h;

    CHECK(h.say(5, "/start") == Route::start);
    CHECK(h.last_notice().find("/status /cancel <job_id> /clear") != std::string::npos);

    CHECK(h.say(5, "hello there") == Route::fallback);
    CHECK(h.last_notice().find("Send a public Mega.nz") != std::string::npos);

    CHECK(h.say(5, "/unknown") == Route::fallback);

    const auto before = h.transport.notices().size();
    CHECK(h.say(5, "   ") == Route::ignored);
    CHECK(h.transport.notices().size() == before);
}

TEST_CASE("Job creation is logged once", "[router]") {
    CapturedLog log;
    RouterHarness h;

    REQUIRE(h.say(5, LINK) == Route::link);
    CHECK(log.count("created") == 1);
}
