// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/bot/command_router.hpp>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <cctype>
#include <regex>

namespace ferry::bot {

namespace {

constexpr std::string_view HELP_TEXT =
    "👋 Send a public Mega.nz file or folder link. Owner commands: /status /cancel <job_id> /clear";
constexpr std::string_view FALLBACK_TEXT = "⚡ Send a public Mega.nz file or folder link to start.";
constexpr std::string_view OWNER_ONLY_TEXT = "❌ Owner only.";

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

// "/cancel@my_bot abc" -> {"cancel", "abc"}
std::pair<std::string_view, std::string_view> split_command(std::string_view text) noexcept {
    text.remove_prefix(1);
    auto space = text.find_first_of(" \t\n");
    auto word = text.substr(0, space);
    auto args = space == std::string_view::npos ? std::string_view{} : trim(text.substr(space));
    if (auto at = word.find('@'); at != std::string_view::npos) {
        word = word.substr(0, at);
    }
    return {word, args};
}

std::string_view state_label(const core::Job& job) noexcept {
    switch (job.state) {
        case core::JobState::running:          return "⏳ running";
        case core::JobState::cancel_requested: return "⚠ cancelling";
        case core::JobState::done:             return job.cancelled ? "⚠ cancelled" : "✅ done";
        case core::JobState::failed:           return "❌ failed";
    }
    return "?";
}

} // namespace

std::optional<std::string> find_mega_link(std::string_view text) {
    static const std::regex link_re(
        R"(https://mega\.nz/(file|folder)/[A-Za-z0-9_-]+#[A-Za-z0-9_-]+)");

    std::match_results<std::string_view::const_iterator> m;
    if (!std::regex_search(text.begin(), text.end(), m, link_re)) {
        return std::nullopt;
    }
    return m[0].str();
}

CommandRouter::CommandRouter(core::JobRegistry& registry, core::Transport& transport,
                             SubmitJob submit, RouterOptions options)
    : registry_(registry)
    , transport_(transport)
    , submit_(std::move(submit))
    , options_(options) {}

Route CommandRouter::handle(const InboundMessage& msg) {
    auto text = trim(msg.text);
    if (text.empty()) {
        return Route::ignored;
    }

    if (text.front() == '/') {
        auto [command, args] = split_command(text);

        if (command == "start" || command == "help") {
            reply(msg, std::string(HELP_TEXT));
            return Route::start;
        }

        Route route = Route::fallback;
        if (command == "status") route = Route::status;
        else if (command == "cancel") route = Route::cancel;
        else if (command == "clear") route = Route::clear;

        if (route != Route::fallback) {
            if (!is_owner(msg)) {
                spdlog::info("User {} tried /{}", msg.chat.user_id, command);
                reply(msg, std::string(OWNER_ONLY_TEXT));
                return Route::denied;
            }
            switch (route) {
                case Route::status: reply_status(msg); break;
                case Route::cancel: reply_cancel(msg, args); break;
                case Route::clear:  reply_clear(msg); break;
                default: break;
            }
            return route;
        }
    }

    if (auto url = find_mega_link(text)) {
        start_job(msg, std::move(*url));
        return Route::link;
    }

    reply(msg, std::string(FALLBACK_TEXT));
    return Route::fallback;
}

void CommandRouter::start_job(const InboundMessage& msg, std::string url) {
    auto job = registry_.create(url, msg.chat);
    spdlog::info("Job {} created for user {}: {}", job.id, msg.chat.user_id, url);

    auto handle = transport_.post(msg.chat, fmt::format("🔗 Job `{}` started\nProcessing `{}`", job.id, url));
    if (handle) {
        if (auto ec = registry_.attach_status(job.id, *handle)) {
            spdlog::warn("Job {}: cannot attach status: {}", job.id, ec.message());
        }
    } else {
        // The run still proceeds; it just has nowhere to render
        spdlog::warn("Job {}: status message failed: {}", job.id, handle.error().message());
    }

    submit_(job.id);
    reply(msg, fmt::format("🔔 Job queued: `{}`. This message will update as files download and upload.", job.id));
}

void CommandRouter::reply_status(const InboundMessage& msg) {
    auto jobs = registry_.list();
    if (jobs.empty()) {
        reply(msg, "ℹ️ No active jobs.");
        return;
    }

    std::string text = "🧾 Jobs:";
    for (const auto& job : jobs) {
        auto started = std::chrono::floor<std::chrono::seconds>(job.started_at);
        text += fmt::format("\n`{}` | {} | {} | started `{:%Y-%m-%d %H:%M:%S}`",
                            job.id, state_label(job), job.source_url, started);
        if (job.counters.total() > 0) {
            text += fmt::format(" | {} sent, {} skipped, {} failed",
                                job.counters.relayed, job.counters.skipped, job.counters.relay_failed);
        }
    }
    reply(msg, text);
}

void CommandRouter::reply_cancel(const InboundMessage& msg, std::string_view args) {
    auto id = trim(args.substr(0, args.find_first_of(" \t\n")));
    if (id.empty()) {
        reply(msg, "Usage: /cancel <job_id>");
        return;
    }

    const core::JobId job_id(id);
    if (auto ec = registry_.request_cancel(job_id)) {
        reply(msg, fmt::format("❌ Job `{}` not found.", job_id));
        return;
    }
    spdlog::info("Cancel requested for job {}", job_id);
    reply(msg, fmt::format("⚠️ Cancel requested for `{}`.", job_id));
}

void CommandRouter::reply_clear(const InboundMessage& msg) {
    const std::chrono::hours age(options_.cleanup_age_hours);
    auto removed = registry_.reap_older_than(age);
    auto forgotten = registry_.forget_older_than(age);
    spdlog::info("Cleanup removed {} folder(s), forgot {} job(s)", removed, forgotten);
    reply(msg, fmt::format("🧹 Cleared {} old download folder(s).", removed));
}

void CommandRouter::reply(const InboundMessage& msg, const std::string& text) {
    if (auto ec = transport_.notify(msg.chat, text)) {
        spdlog::warn("Reply to chat {} failed: {}", msg.chat.chat_id, ec.message());
    }
}

} // namespace ferry::bot
