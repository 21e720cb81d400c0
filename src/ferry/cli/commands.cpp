// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/cli/commands.hpp>
#include <ferry/bot/command_router.hpp>
#include <ferry/core/error.hpp>
#include <ferry/core/fetch_pipeline.hpp>
#include <ferry/core/job_registry.hpp>
#include <ferry/core/job_scheduler.hpp>
#include <ferry/core/progress_reporter.hpp>
#include <ferry/fetch/megatools_fetcher.hpp>
#include <ferry/media/ffprobe_probe.hpp>
#include <ferry/net/bot_api.hpp>
#include <ferry/net/telegram.hpp>
#include <ferry/version.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <condition_variable>
#include <filesystem>
#include <iostream>
#include <mutex>

namespace ferry::cli {

namespace chrono = std::chrono;

namespace {

constexpr chrono::seconds POLL_ERROR_BACKOFF{3};

// Sleep that returns early on stop
void backoff(std::stop_token stop, chrono::milliseconds delay) {
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lock(m);
    cv.wait_for(lock, stop, delay, [] { return false; });
}

// Calls BotApi::global_cleanup when the bot returns
struct CurlGlobal {
    CurlGlobal() { net::BotApi::global_init(); }
    ~CurlGlobal() { net::BotApi::global_cleanup(); }

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }
        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "--check") {
            args.check = true;
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                args.error = "--config needs a file path";
                return args;
            }
            args.config_path = argv[++i];
        } else if (arg == "-l" || arg == "--log-level") {
            if (i + 1 >= argc) {
                args.error = "--log-level needs a level name";
                return args;
            }
            args.log_level = argv[++i];
        } else {
            args.error = "Unknown option: " + std::string(arg);
            return args;
        }
    }

    return args;
}

//=============================================================================
// Bot
//=============================================================================

CliResult run_bot(const core::Settings& settings, std::stop_token stop) noexcept {
    try {
        std::error_code ec;
        std::filesystem::create_directories(settings.download_dir, ec);
        if (ec) {
            spdlog::error("Cannot create download directory {}: {}", settings.download_dir, ec.message());
            return std::unexpected(ec);
        }

        CurlGlobal curl_global;

        net::BotApi api(settings.bot_token, settings.api_base);
        net::TelegramTransport transport(api);
        net::TelegramRelay relay(api);
        fetch::MegatoolsFetcher fetcher(settings.megadl_path);
        media::FfprobeProbe probe(settings.ffprobe_path);

        core::JobRegistry registry(settings.download_dir);
        core::ProgressReporter reporter(transport, settings.update_interval, settings.progress_bar_len);
        core::FetchPipeline pipeline(registry, fetcher, relay, transport, reporter, &probe, settings.pipeline);
        core::JobScheduler scheduler(pipeline, settings.max_concurrent_jobs);

        bot::CommandRouter router(registry, transport,
            [&scheduler](const core::JobId& id) { scheduler.submit(id); },
            bot::RouterOptions{settings.owner_id, settings.cleanup_age_hours});

        spdlog::info("🚀 ferry {} starting, downloads in {}", version.to_string(), settings.download_dir);
        if (settings.owner_id == 0) {
            spdlog::warn("BOT_OWNER_ID is not set, operator commands are disabled");
        }

        std::int64_t offset = 0;
        while (!stop.stop_requested()) {
            auto updates = api.get_updates(offset, core::LONG_POLL_TIMEOUT_SEC, stop);
            if (!updates) {
                if (updates.error() == core::JobErrc::cancelled) break;
                spdlog::warn("getUpdates failed: {}", updates.error().message());
                backoff(stop, POLL_ERROR_BACKOFF);
                continue;
            }

            for (const auto& update : *updates) {
                offset = std::max(offset, update.update_id + 1);
                if (!update.message) continue;

                const auto& msg = *update.message;
                bot::InboundMessage inbound{{msg.chat_id, msg.from_id}, msg.text};
                auto route = router.handle(inbound);
                spdlog::debug("Update {} from {} routed as {}", update.update_id, msg.from_id,
                              static_cast<int>(route));
            }
        }

        spdlog::info("Stopping, {} job(s) in flight", scheduler.active());
        scheduler.shutdown();
        return 0;
    } catch (const std::exception& e) {
        spdlog::error("Bot stopped on error: {}", e.what());
        return std::unexpected(make_error_code(core::JobErrc::transport_error));
    }
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "ferry " << program_name << " - Mega.nz to Telegram relay bot\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS]\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Debug logging\n";
    std::cout << "  -c, --config <FILE>     Read settings from a JSON file\n";
    std::cout << "  -l, --log-level <LVL>   trace, debug, info, warn, error\n";
    std::cout << "      --check             Validate the configuration and exit\n";
    std::cout << "\n";
    std::cout << "ENVIRONMENT:\n";
    std::cout << "  BOT_TOKEN (required), BOT_OWNER_ID, DOWNLOAD_DIR, MEGATOOLS_RETRY,\n";
    std::cout << "  STABLE_SECONDS, STABLE_POLL_INTERVAL, DOWNLOAD_POLL_INTERVAL,\n";
    std::cout << "  UPLOAD_PROGRESS_UPDATE_INTERVAL, CLEANUP_AGE_HOURS, PROGRESS_BAR_LEN,\n";
    std::cout << "  RELAY_MAX_BYTES, MAX_CONCURRENT_JOBS, MEGADL_PATH, FFPROBE_PATH,\n";
    std::cout << "  TELEGRAM_API_BASE, LOG_LEVEL\n";
    std::cout << "  Environment values override the config file.\n";
}

void print_version() noexcept {
    std::cout << "ferry " << ferry::version.to_string() << std::endl;
    std::cout << "Built " << BUILD_DATE << " with C++23, libcurl, spdlog, nlohmann/json\n";
}

} // namespace ferry::cli
