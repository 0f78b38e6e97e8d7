#pragma once
#include "config.hpp"
#include "heartbeat.hpp"
#include <memory>

// Operator-facing HTTP status endpoints:
//   GET /health            200 while ticks succeed, 503 once the watcher stalls
//   GET /structure/health  engine versions and determinism report
class HealthServer {
public:
    HealthServer(const Config& config, const WatcherHealth& health);
    ~HealthServer();

    void start();
    void stop();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
