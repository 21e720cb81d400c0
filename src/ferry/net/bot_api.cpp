// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/net/bot_api.hpp>
#include <ferry/core/config.hpp>
#include <ferry/core/error.hpp>
#include <ferry/version.hpp>
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

namespace ferry::net {

namespace {

using core::JobErrc;

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

struct CurlMime {
    curl_mime* ptr = nullptr;

    explicit CurlMime(CURL* c) : ptr(curl_mime_init(c)) {}
    ~CurlMime() { if (ptr) curl_mime_free(ptr); }

    CurlMime(const CurlMime&) = delete;
    CurlMime& operator=(const CurlMime&) = delete;

    void add_field(const char* name, const std::string& value) {
        curl_mimepart* part = curl_mime_addpart(ptr);
        curl_mime_name(part, name);
        curl_mime_data(part, value.c_str(), CURL_ZERO_TERMINATED);
    }
};

struct CurlSlist {
    curl_slist* ptr = nullptr;

    CurlSlist() = default;
    ~CurlSlist() { if (ptr) curl_slist_free_all(ptr); }

    CurlSlist(const CurlSlist&) = delete;
    CurlSlist& operator=(const CurlSlist&) = delete;

    void append(const char* header) { ptr = curl_slist_append(ptr, header); }
};

// Write callback (stores the response body)
std::size_t write_callback(char* data, std::size_t size, std::size_t nitems, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    if (!body) return 0;
    std::size_t total = size * nitems;
    body->append(data, total);
    return total;
}

struct UploadProgress {
    const core::RelayProgress* callback{nullptr};
    std::uint64_t file_size{0};
    std::uint64_t last_reported{0};
};

// Upload progress from curl; multipart framing is clamped away so
// `sent` never exceeds the file size
int xferinfo_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t ulnow) {
    auto* p = static_cast<UploadProgress*>(clientp);
    if (!p || !p->callback || !*p->callback || ulnow <= 0) return 0;

    auto sent = std::min<std::uint64_t>(static_cast<std::uint64_t>(ulnow), p->file_size);
    if (sent > p->last_reported) {
        p->last_reported = sent;
        (*p->callback)(sent, p->file_size);
    }
    return 0;
}

// Aborts a request once stop is requested
int stop_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* stop = static_cast<std::stop_token*>(clientp);
    return stop && stop->stop_requested() ? 1 : 0;
}

void apply_common_options(CURL* curl, const std::string& url, std::string& body, long timeout_sec) {
    const std::string agent = ferry::version.user_agent();
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(core::API_CONNECT_TIMEOUT_SEC));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_sec);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, agent.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
}

bool contains_ci(std::string_view haystack, std::string_view needle) {
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
        [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) ==
                   std::tolower(static_cast<unsigned char>(b));
        });
    return it != haystack.end();
}

} // namespace

BotApi::BotApi(std::string token, std::string api_base)
    : token_(std::move(token))
    , api_base_(std::move(api_base)) {
    while (!api_base_.empty() && api_base_.back() == '/') {
        api_base_.pop_back();
    }
}

std::string BotApi::endpoint(std::string_view method) const {
    std::string url;
    url.reserve(api_base_.size() + token_.size() + method.size() + 6);
    url.append(api_base_).append("/bot").append(token_).append("/").append(method);
    return url;
}

UploadMethod BotApi::upload_method(core::MediaKind kind) noexcept {
    switch (kind) {
        case core::MediaKind::video:    return {"sendVideo", "video", true};
        case core::MediaKind::photo:    return {"sendPhoto", "photo", false};
        case core::MediaKind::audio:    return {"sendAudio", "audio", false};
        case core::MediaKind::document: return {"sendDocument", "document", false};
    }
    return {"sendDocument", "document", false};
}

std::expected<nlohmann::json, std::error_code> BotApi::parse_response(std::string_view body) {
    try {
        auto doc = nlohmann::json::parse(body);
        if (!doc.is_object()) {
            return std::unexpected(make_error_code(JobErrc::transport_error));
        }
        if (doc.value("ok", false)) {
            return doc.contains("result") ? doc.at("result") : nlohmann::json{};
        }

        auto description = doc.value("description", std::string{});
        if (contains_ci(description, "message is not modified")) {
            return std::unexpected(make_error_code(JobErrc::not_modified));
        }
        spdlog::warn("Bot API error {}: {}", doc.value("error_code", 0), description);
        return std::unexpected(make_error_code(JobErrc::transport_error));
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Malformed Bot API answer: {}", e.what());
        return std::unexpected(make_error_code(JobErrc::transport_error));
    }
}

std::optional<Message> BotApi::parse_message(const nlohmann::json& msg) {
    if (!msg.is_object() || !msg.contains("message_id") || !msg.contains("chat")) {
        return std::nullopt;
    }
    try {
        Message m;
        m.message_id = msg.at("message_id").get<std::int64_t>();
        m.chat_id = msg.at("chat").at("id").get<std::int64_t>();
        if (msg.contains("from")) {
            m.from_id = msg.at("from").value("id", std::int64_t{0});
        }
        m.text = msg.value("text", std::string{});
        return m;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

std::vector<Update> BotApi::parse_updates(const nlohmann::json& result) {
    std::vector<Update> updates;
    if (!result.is_array()) return updates;

    updates.reserve(result.size());
    for (const auto& item : result) {
        if (!item.is_object() || !item.contains("update_id")) continue;
        Update u;
        u.update_id = item.value("update_id", std::int64_t{0});
        if (item.contains("message")) {
            u.message = parse_message(item.at("message"));
        }
        updates.push_back(std::move(u));
    }
    return updates;
}

std::expected<nlohmann::json, std::error_code>
BotApi::call(std::string_view method, const nlohmann::json& payload, long timeout_sec,
             std::stop_token stop) {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(JobErrc::transport_error));
    }

    const std::string url = endpoint(method);
    const std::string request = payload.dump();
    std::string body;

    CurlSlist headers;
    headers.append("Content-Type: application/json");

    apply_common_options(curl.ptr, url, body, timeout_sec);
    curl_easy_setopt(curl.ptr, CURLOPT_HTTPHEADER, headers.ptr);
    curl_easy_setopt(curl.ptr, CURLOPT_POSTFIELDS, request.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.size()));
    if (stop.stop_possible()) {
        curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, stop_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &stop);
        curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);
    }

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result == CURLE_ABORTED_BY_CALLBACK) {
        return std::unexpected(make_error_code(JobErrc::cancelled));
    }
    if (result != CURLE_OK) {
        spdlog::warn("{} failed: {}", method, curl_easy_strerror(result));
        return std::unexpected(make_error_code(JobErrc::transport_error));
    }
    return parse_response(body);
}

std::expected<std::vector<Update>, std::error_code>
BotApi::get_updates(std::int64_t offset, std::uint32_t timeout_sec, std::stop_token stop) {
    nlohmann::json payload = {
        {"offset", offset},
        {"timeout", timeout_sec},
        {"allowed_updates", nlohmann::json::array({"message"})},
    };

    // Leave headroom over the server-side poll
    auto result = call("getUpdates", payload, static_cast<long>(timeout_sec) + core::API_CONNECT_TIMEOUT_SEC, stop);
    if (!result) {
        return std::unexpected(result.error());
    }
    return parse_updates(*result);
}

std::expected<Message, std::error_code>
BotApi::send_message(std::int64_t chat_id, const std::string& text,
                     std::optional<std::int64_t> reply_to) {
    nlohmann::json payload = {
        {"chat_id", chat_id},
        {"text", text},
        {"parse_mode", "Markdown"},
        {"disable_web_page_preview", true},
    };
    if (reply_to) {
        payload["reply_to_message_id"] = *reply_to;
    }

    auto result = call("sendMessage", payload, core::API_REQUEST_TIMEOUT_SEC);
    if (!result) {
        return std::unexpected(result.error());
    }
    auto msg = parse_message(*result);
    if (!msg) {
        return std::unexpected(make_error_code(JobErrc::transport_error));
    }
    return *msg;
}

std::error_code BotApi::edit_message_text(std::int64_t chat_id, std::int64_t message_id,
                                          const std::string& text) {
    nlohmann::json payload = {
        {"chat_id", chat_id},
        {"message_id", message_id},
        {"text", text},
        {"parse_mode", "Markdown"},
        {"disable_web_page_preview", true},
    };

    auto result = call("editMessageText", payload, core::API_REQUEST_TIMEOUT_SEC);
    return result ? std::error_code{} : result.error();
}

std::expected<Message, std::error_code>
BotApi::send_file(std::int64_t chat_id, const std::filesystem::path& file,
                  const core::FileMetadata& meta, const core::RelayProgress& on_progress) {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(JobErrc::transport_error));
    }

    const auto method = upload_method(meta.kind);
    const std::string url = endpoint(method.method);
    const std::string field(method.field);
    const std::string path = file.string();
    std::string body;

    CurlMime mime(curl.ptr);
    mime.add_field("chat_id", std::to_string(chat_id));
    mime.add_field("caption", meta.caption);
    if (method.streaming) {
        mime.add_field("supports_streaming", "true");
        mime.add_field("has_spoiler", "true");
        if (meta.duration_seconds) {
            mime.add_field("duration", std::to_string(*meta.duration_seconds));
        }
    }

    curl_mimepart* part = curl_mime_addpart(mime.ptr);
    curl_mime_name(part, field.c_str());
    if (curl_mime_filedata(part, path.c_str()) != CURLE_OK) {
        spdlog::error("Cannot attach {}", path);
        return std::unexpected(make_error_code(JobErrc::relay_failure));
    }
    curl_mime_filename(part, meta.name.c_str());
    curl_mime_type(part, "application/octet-stream");

    UploadProgress progress{&on_progress, meta.size, 0};

    apply_common_options(curl.ptr, url, body, static_cast<long>(core::UPLOAD_TIMEOUT_SEC));
    curl_easy_setopt(curl.ptr, CURLOPT_MIMEPOST, mime.ptr);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, xferinfo_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &progress);
    curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result != CURLE_OK) {
        spdlog::error("{} of {} failed: {}", method.method, meta.name, curl_easy_strerror(result));
        return std::unexpected(make_error_code(JobErrc::transport_error));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code == 413) {
        return std::unexpected(make_error_code(JobErrc::relay_size_exceeded));
    }

    auto answer = parse_response(body);
    if (!answer) {
        spdlog::error("Upload of {} rejected (HTTP {})", meta.name, http_code);
        return std::unexpected(answer.error());
    }
    if (progress.last_reported < meta.size && on_progress) {
        on_progress(meta.size, meta.size);
    }
    auto msg = parse_message(*answer);
    if (!msg) {
        return std::unexpected(make_error_code(JobErrc::transport_error));
    }
    return *msg;
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void BotApi::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void BotApi::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace ferry::net
