#include "config.hpp"
#include "watcher_service.hpp"
#include "structure_engine.hpp"
#include "confidence_refiner.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <csignal>
#include <memory>
#include <atomic>
#include <thread>
#include <chrono>

// Global atomic flag to handle termination signals
std::atomic<bool> g_terminate_flag(false);

// Signal handler function
void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_terminate_flag = true;
    }
}

int main(int argc, char* argv[]) {
    // Set up logger
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("signal_watcher", console_sink);
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::info); // Default, will be overridden by config
    spdlog::flush_on(spdlog::level::info);

    spdlog::info("Starting Quantix Signal Watcher ({}, {})...",
                 StructureEngine::version(), ConfidenceRefiner::version());

    // Load configuration: optional JSON file, then environment overrides
    Config config;
    try {
        if (argc > 1) {
            config.load(argv[1]);
            spdlog::info("Configuration loaded from {}", argv[1]);
        }
        config.load_from_env();
        config.validate();
        spdlog::set_level(spdlog::level::from_str(config.log_level));
        spdlog::info("Watching every {}s, entry window {}m, trade window {}m, zombie threshold {}h",
                     config.watch_interval_seconds, config.entry_window_minutes,
                     config.trade_window_minutes, config.zombie_threshold_hours);
    } catch (const std::exception& e) {
        spdlog::critical("Failed to load configuration: {}", e.what());
        return 1;
    }

    // Register signal handlers
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    // Create and run the service
    std::unique_ptr<WatcherService> service;
    try {
        service = std::make_unique<WatcherService>(config);
        service->run();
    } catch (const std::exception& e) {
        spdlog::critical("Failed to initialize or start the service: {}", e.what());
        return 1;
    }

    // Wait for termination signal
    while (!g_terminate_flag) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    spdlog::info("Termination signal received. Shutting down...");
    service->stop();

    spdlog::info("Quantix Signal Watcher has shut down gracefully.");
    spdlog::shutdown();
    return 0;
}
