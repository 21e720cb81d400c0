// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/interfaces.hpp>
#include <ferry/net/bot_api.hpp>

namespace ferry::net {

// Status messages over the Bot API
class TelegramTransport final : public core::Transport {
public:
    explicit TelegramTransport(BotApi& api) : api_(api) {}

    [[nodiscard]] std::expected<core::StatusHandle, std::error_code>
    post(const core::ChatContext& chat, const std::string& text) override;

    [[nodiscard]] std::error_code
    edit(const core::StatusHandle& handle, const std::string& text) override;

    [[nodiscard]] std::error_code
    notify(const core::ChatContext& chat, const std::string& text) override;

private:
    BotApi& api_;
};

// File uploads over the Bot API
class TelegramRelay final : public core::RelayClient {
public:
    explicit TelegramRelay(BotApi& api) : api_(api) {}

    [[nodiscard]] std::error_code
    send(const core::ChatContext& dest, const std::filesystem::path& file,
         const core::FileMetadata& meta, const core::RelayProgress& on_progress) override;

private:
    BotApi& api_;
};

} // namespace ferry::net
