#pragma once

#include "config.hpp"
#include "interfaces.hpp"
#include "signal_watcher.hpp"
#include "heartbeat.hpp"
#include "health_server.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

class WatcherService {
public:
    // Production wiring: PostgreSQL store, HTTP candle feed, Redis notifications
    explicit WatcherService(const Config& config);
    ~WatcherService();

    // Start the polling loop and the health server
    void run();

    // Stop the service
    void stop();

private:
    void service_thread_func();
    void run_tick();

    Config config_;

    // Service components
    std::unique_ptr<SignalStore> store_;
    std::unique_ptr<CandleFeed> feed_;
    std::unique_ptr<Notifier> notifier_;
    std::unique_ptr<SignalLifecycleWatcher> watcher_;
    std::unique_ptr<WatcherHealth> health_;
    std::unique_ptr<HealthServer> health_server_;

    // Thread management
    std::atomic<bool> running_{false};
    std::thread service_thread_;
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
};
