// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/net/telegram.hpp>
#include <ferry/core/error.hpp>
#include <spdlog/spdlog.h>

namespace ferry::net {

std::expected<core::StatusHandle, std::error_code>
TelegramTransport::post(const core::ChatContext& chat, const std::string& text) {
    auto msg = api_.send_message(chat.chat_id, text);
    if (!msg) {
        return std::unexpected(msg.error());
    }
    return core::StatusHandle{msg->chat_id, msg->message_id};
}

std::error_code TelegramTransport::edit(const core::StatusHandle& handle, const std::string& text) {
    return api_.edit_message_text(handle.chat_id, handle.message_id, text);
}

std::error_code TelegramTransport::notify(const core::ChatContext& chat, const std::string& text) {
    auto msg = api_.send_message(chat.chat_id, text);
    return msg ? std::error_code{} : msg.error();
}

std::error_code TelegramRelay::send(const core::ChatContext& dest, const std::filesystem::path& file,
                                    const core::FileMetadata& meta,
                                    const core::RelayProgress& on_progress) {
    spdlog::info("Uploading {} ({} bytes) to chat {}", meta.name, meta.size, dest.chat_id);
    auto msg = api_.send_file(dest.chat_id, file, meta, on_progress);
    if (msg) {
        return {};
    }
    if (msg.error() == core::JobErrc::relay_size_exceeded) {
        return msg.error();
    }
    return make_error_code(core::JobErrc::relay_failure);
}

} // namespace ferry::net
