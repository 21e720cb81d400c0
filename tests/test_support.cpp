// Copyright (c) 2026 changcheng967. All rights reserved.

#include "test_support.hpp"
#include <fstream>
#include <random>
#include <thread>

namespace fs = std::filesystem;

namespace ferry::test {

TempDir::TempDir() {
    std::random_device rd;
    std::uniform_int_distribution<std::uint64_t> dist;
    path_ = fs::temp_directory_path() / ("ferry-test-" + std::to_string(dist(rd)));
    fs::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

void write_file(const fs::path& path, std::size_t bytes) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << std::string(bytes, 'x');
}

void append_file(const fs::path& path, std::size_t bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::app);
    out << std::string(bytes, 'y');
}

bool wait_until(const std::function<bool()>& pred, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

core::PipelineConfig fast_pipeline() {
    core::PipelineConfig config;
    config.stability_window = std::chrono::milliseconds(100);
    config.stability_poll = std::chrono::milliseconds(20);
    config.idle_sleep = std::chrono::milliseconds(20);
    config.batch_sleep = std::chrono::milliseconds(10);
    config.retry_delay = std::chrono::milliseconds(10);
    config.fetch_retries = 3;
    return config;
}

//=============================================================================
// FakeTransport
//=============================================================================

std::expected<core::StatusHandle, std::error_code>
FakeTransport::post(const core::ChatContext& chat, const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    posts_.push_back(text);
    if (fail_post) {
        return std::unexpected(std::make_error_code(std::errc::connection_refused));
    }
    return core::StatusHandle{chat.chat_id, ++next_message_id_};
}

std::error_code FakeTransport::edit(const core::StatusHandle&, const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    edits_.push_back(text);
    return edit_result;
}

std::error_code FakeTransport::notify(const core::ChatContext&, const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    notices_.push_back(text);
    return {};
}

std::vector<std::string> FakeTransport::posts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return posts_;
}

std::vector<std::string> FakeTransport::edits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return edits_;
}

std::vector<std::string> FakeTransport::notices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return notices_;
}

int FakeTransport::find_edit(std::string_view needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (std::size_t i = 0; i < edits_.size(); ++i) {
        if (edits_[i].find(needle) != std::string::npos) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

//=============================================================================
// FakeRelay
//=============================================================================

std::error_code FakeRelay::send(const core::ChatContext&, const fs::path& file,
                                const core::FileMetadata& meta,
                                const core::RelayProgress& on_progress) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sent_.push_back({file, meta, fs::exists(file)});
    }
    if (result) {
        return result;
    }
    if (on_progress) {
        on_progress(meta.size / 2, meta.size);
        on_progress(meta.size, meta.size);
    }
    return {};
}

std::vector<FakeRelay::Sent> FakeRelay::sent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sent_;
}

//=============================================================================
// FakeFetcher / FakeProbe
//=============================================================================

std::expected<void, core::FetchFailure>
FakeFetcher::fetch(const std::string&, const fs::path& dest_dir, std::stop_token stop) {
    const int attempt = ++attempts_;
    return script_(attempt, dest_dir, std::move(stop));
}

std::optional<std::uint32_t> FakeProbe::duration(const fs::path&) {
    ++calls_;
    return seconds_;
}

} // namespace ferry::test
