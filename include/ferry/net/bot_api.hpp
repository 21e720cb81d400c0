// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/interfaces.hpp>
#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace ferry::net {

// Subset of the Bot API message object the bot reads
struct Message {
    std::int64_t message_id{0};
    std::int64_t chat_id{0};
    std::int64_t from_id{0};
    std::string text;
};

struct Update {
    std::int64_t update_id{0};
    std::optional<Message> message;
};

// Multipart method and file field for one media kind
struct UploadMethod {
    std::string_view method;
    std::string_view field;
    bool streaming{false};
};

// Blocking Telegram Bot API client. Each call uses its own curl handle, so
// one instance can serve the poll loop and every job thread at once.
class BotApi {
public:
    explicit BotApi(std::string token, std::string api_base = "https://api.telegram.org");

    BotApi(const BotApi&) = delete;
    BotApi& operator=(const BotApi&) = delete;

    // Long poll; returns updates with id >= offset. A stop request aborts
    // the poll with JobErrc::cancelled.
    [[nodiscard]] std::expected<std::vector<Update>, std::error_code>
    get_updates(std::int64_t offset, std::uint32_t timeout_sec, std::stop_token stop = {});

    [[nodiscard]] std::expected<Message, std::error_code>
    send_message(std::int64_t chat_id, const std::string& text,
                 std::optional<std::int64_t> reply_to = std::nullopt);

    // JobErrc::not_modified when Telegram rejects an identical edit
    [[nodiscard]] std::error_code
    edit_message_text(std::int64_t chat_id, std::int64_t message_id, const std::string& text);

    // Multipart upload with live byte progress
    [[nodiscard]] std::expected<Message, std::error_code>
    send_file(std::int64_t chat_id, const std::filesystem::path& file,
              const core::FileMetadata& meta, const core::RelayProgress& on_progress);

    [[nodiscard]] static UploadMethod upload_method(core::MediaKind kind) noexcept;

    // Unwraps {"ok":..., "result":...}; API errors become error codes
    [[nodiscard]] static std::expected<nlohmann::json, std::error_code>
    parse_response(std::string_view body);

    [[nodiscard]] static std::vector<Update> parse_updates(const nlohmann::json& result);
    [[nodiscard]] static std::optional<Message> parse_message(const nlohmann::json& msg);

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    [[nodiscard]] std::string endpoint(std::string_view method) const;

    // POST a JSON body and unwrap the answer
    [[nodiscard]] std::expected<nlohmann::json, std::error_code>
    call(std::string_view method, const nlohmann::json& body, long timeout_sec,
         std::stop_token stop = {});

    std::string token_;
    std::string api_base_;
};

} // namespace ferry::net
