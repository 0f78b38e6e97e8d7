#include "backoff_manager.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

BackoffManager::BackoffManager(double base_delay_seconds, double max_delay_seconds, double jitter_factor)
    : base_delay_seconds_(base_delay_seconds),
      max_delay_seconds_(max_delay_seconds),
      jitter_factor_(jitter_factor) {}

void BackoffManager::record_failure(const std::string& endpoint, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto& entry = blocked_[endpoint];
    entry.failures++;

    const auto delay = delay_for(entry.failures);
    const auto jittered = std::chrono::milliseconds(static_cast<long long>(
        util::random_jitter(static_cast<double>(delay.count()), jitter_factor_)));
    entry.until = now + jittered;

    spdlog::debug("Endpoint {} failed {} time(s), blocked for {}ms", endpoint, entry.failures, jittered.count());
}

void BackoffManager::record_success(const std::string& endpoint) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (blocked_.erase(endpoint) > 0) {
        spdlog::debug("Endpoint {} recovered", endpoint);
    }
}

std::chrono::milliseconds BackoffManager::time_until_allowed(const std::string& endpoint,
                                                             Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = blocked_.find(endpoint);
    if (it == blocked_.end() || now >= it->second.until) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(it->second.until - now);
}

std::chrono::milliseconds BackoffManager::delay_for(int failures) const {
    if (failures <= 0) {
        return std::chrono::milliseconds(0);
    }
    const double seconds = std::min(max_delay_seconds_, base_delay_seconds_ * std::pow(2.0, failures - 1));
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}
