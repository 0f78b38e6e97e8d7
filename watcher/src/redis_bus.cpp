#include "redis_bus.hpp"
#include <sw/redis++/redis++.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

class RedisBus::Impl {
public:
    Impl(const Config& config)
        : config_(config), backoff_ms_(1000), retry_count_(0) {
        connect();
    }

    ~Impl() {
        disconnect();
    }

    bool publish(const SignalNotification& notification) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!ensure_connection()) {
            return false;
        }

        try {
            std::unordered_map<std::string, std::string> fields = {
                {"data", notification.to_json().dump()},
                {"timestamp", std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
                    notification.timestamp.time_since_epoch()).count())}
            };

            redis_->xadd(config_.stream_signals, "*", fields.begin(), fields.end());
            spdlog::debug("Published {} notification for signal {}", notification.new_state, notification.signal_id);
            return true;
        } catch (const std::exception& e) {
            spdlog::error("Failed to publish notification for signal {}: {}", notification.signal_id, e.what());
            return false;
        }
    }

private:
    bool connect() {
        try {
            redis_ = std::make_unique<sw::redis::Redis>(config_.redis_url);
            redis_->ping();
            spdlog::info("Connected to Redis at {}", config_.redis_url);
            backoff_ms_ = 1000;  // Reset backoff on successful connection
            retry_count_ = 0;
            return true;
        } catch (const std::exception& e) {
            spdlog::error("Failed to connect to Redis: {}", e.what());
            redis_.reset();
            return false;
        }
    }

    void disconnect() {
        if (redis_) {
            redis_.reset();
            spdlog::info("Disconnected from Redis");
        }
    }

    bool is_connected() const {
        if (!redis_) return false;

        try {
            redis_->ping();
            return true;
        } catch (const sw::redis::Error& e) {
            spdlog::debug("Redis ping failed: {}", e.what());
            return false;
        }
    }

    bool ensure_connection() {
        if (is_connected()) {
            return true;
        }

        auto now = std::chrono::steady_clock::now();
        if (std::chrono::duration_cast<std::chrono::milliseconds>(
                now - last_connection_attempt_).count() < backoff_ms_) {
            return false;
        }

        last_connection_attempt_ = now;

        if (connect()) {
            spdlog::info("Redis connection restored");
            return true;
        }
        spdlog::warn("Redis reconnection failed (attempt {})", ++retry_count_);

        // Exponential backoff with cap
        backoff_ms_ = std::min(backoff_ms_ * 2, 30000);
        return false;
    }

    const Config& config_;
    std::unique_ptr<sw::redis::Redis> redis_;
    std::mutex mutex_;

    // Reconnection logic
    std::chrono::steady_clock::time_point last_connection_attempt_ = std::chrono::steady_clock::now();
    int backoff_ms_;
    int retry_count_;
};

RedisBus::RedisBus(const Config& config) : impl_(std::make_unique<Impl>(config)) {}

RedisBus::~RedisBus() = default;

bool RedisBus::publish(const SignalNotification& notification) {
    return impl_->publish(notification);
}
