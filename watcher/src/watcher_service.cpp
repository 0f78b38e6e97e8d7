#include "watcher_service.hpp"
#include "pg_store.hpp"
#include "candle_client.hpp"
#include "redis_bus.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

WatcherService::WatcherService(const Config& config)
    : config_(config) {

    // Initialize components
    store_ = std::make_unique<PostgresSignalStore>(config_);
    feed_ = std::make_unique<CandleClient>(config_);
    notifier_ = std::make_unique<RedisBus>(config_);
    watcher_ = std::make_unique<SignalLifecycleWatcher>(config_, *store_, *feed_, *notifier_);
    health_ = std::make_unique<WatcherHealth>(std::chrono::system_clock::now());
    health_server_ = std::make_unique<HealthServer>(config_, *health_);
}

WatcherService::~WatcherService() {
    stop();
}

void WatcherService::run() {
    if (running_) {
        spdlog::warn("Watcher service is already running");
        return;
    }

    running_ = true;
    health_server_->start();
    service_thread_ = std::thread(&WatcherService::service_thread_func, this);

    spdlog::info("Watcher service started (interval {}s, {} workers)",
                 config_.watch_interval_seconds, config_.thread_pool_size);
}

void WatcherService::stop() {
    if (!running_) {
        return;
    }

    running_ = false;
    wait_cv_.notify_all();

    // Wait for service thread to finish
    if (service_thread_.joinable()) {
        service_thread_.join();
    }

    health_server_->stop();
    spdlog::info("Watcher service stopped");
}

void WatcherService::service_thread_func() {
    spdlog::info("Watcher service thread started");

    while (running_) {
        run_tick();

        std::unique_lock<std::mutex> lock(wait_mutex_);
        wait_cv_.wait_for(lock, config_.watch_interval(), [this] { return !running_; });
    }

    spdlog::info("Watcher service thread stopped");
}

void WatcherService::run_tick() {
    const auto now = std::chrono::system_clock::now();
    try {
        const TickReport report = watcher_->tick(now);
        health_->record_success(std::chrono::system_clock::now(), report);

        if (report.transitions > 0 || report.failures > 0 || report.feed_errors > 0) {
            spdlog::info("Tick: {} checked, {} transitions ({} published, {} cancelled), "
                         "{} feed errors, {} malformed candles, {} failures",
                         report.checked, report.transitions, report.published, report.cancelled,
                         report.feed_errors, report.malformed_candles, report.failures);
        }
    } catch (const std::exception& e) {
        // Keep polling; /health reports stalled if this persists
        health_->record_failure(now, e.what());
        spdlog::error("Watcher tick failed ({} in a row): {}", health_->consecutive_failures(), e.what());
    }
}
