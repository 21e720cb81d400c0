// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/cli/commands.hpp>
#include <ferry/core/config.hpp>
#include <ferry/core/log.hpp>
#include <spdlog/spdlog.h>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <pthread.h>
#include <thread>
#include <time.h>

using namespace ferry::cli;

// Terminate handler to report exceptions escaping noexcept functions
static void ferry_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();  // Prevent re-entrant abort
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto current = std::current_exception()) {
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception in noexcept context" << std::endl;
        }
    }
    std::cerr << "Aborting..." << std::endl;
    std::abort();
}

int main(int argc, char* argv[]) {
    std::set_terminate(ferry_terminate_handler);

    CliArgs args = parse_args(argc, argv);

    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }
    if (args.help) {
        print_help(argv[0]);
        return 0;
    }
    if (args.version) {
        print_version();
        return 0;
    }

    // Log config problems at the requested level before settings exist
    std::string level = args.verbose ? "debug" : (args.log_level.empty() ? "info" : args.log_level);
    ferry::core::init_logging(level);

    auto settings = ferry::core::load_settings(args.config_path);
    if (!settings) {
        std::cerr << "Error: " << settings.error().message() << std::endl;
        return 1;
    }
    if (!args.verbose && args.log_level.empty()) {
        ferry::core::init_logging(settings->log_level);
    }
    if (args.check) {
        std::cout << "Configuration OK" << std::endl;
        return 0;
    }

    // SIGINT/SIGTERM are taken synchronously by a watcher thread; block them
    // before any other thread starts so they inherit the mask
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    std::stop_source stop;
    std::jthread watcher([&stop, signals](std::stop_token self) {
        const timespec slice{0, 200'000'000};
        while (!self.stop_requested()) {
            int sig = sigtimedwait(&signals, nullptr, &slice);
            if (sig == SIGINT || sig == SIGTERM) {
                spdlog::info("Received signal {}, shutting down", sig);
                stop.request_stop();
                return;
            }
        }
    });

    auto result = run_bot(*settings, stop.get_token());
    watcher.request_stop();

    return result ? *result : 1;
}
