// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/interfaces.hpp>
#include <ferry/core/job_registry.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace ferry::bot {

// What a message turned out to be
enum class Route : std::uint8_t {
    link,
    start,
    status,
    cancel,
    clear,
    denied,     // Owner command from someone else
    fallback,
    ignored     // No text
};

struct InboundMessage {
    core::ChatContext chat;
    std::string text;
};

struct RouterOptions {
    std::int64_t owner_id{0};
    std::uint32_t cleanup_age_hours{6};
};

using SubmitJob = std::function<void(const core::JobId&)>;

// First Mega file/folder link in `text`
[[nodiscard]] std::optional<std::string> find_mega_link(std::string_view text);

// Turns inbound chat messages into jobs and operator commands.
class CommandRouter {
public:
    CommandRouter(core::JobRegistry& registry, core::Transport& transport,
                  SubmitJob submit, RouterOptions options);

    Route handle(const InboundMessage& msg);

private:
    void start_job(const InboundMessage& msg, std::string url);
    void reply_status(const InboundMessage& msg);
    void reply_cancel(const InboundMessage& msg, std::string_view args);
    void reply_clear(const InboundMessage& msg);
    void reply(const InboundMessage& msg, const std::string& text);

    [[nodiscard]] bool is_owner(const InboundMessage& msg) const noexcept {
        return msg.chat.user_id == options_.owner_id;
    }

    core::JobRegistry& registry_;
    core::Transport& transport_;
    SubmitJob submit_;
    RouterOptions options_;
};

} // namespace ferry::bot
