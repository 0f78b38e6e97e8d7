#pragma once
#include <chrono>
#include <map>
#include <mutex>
#include <string>

// Per-endpoint exponential backoff for the candle feed. The n-th consecutive
// failure blocks the endpoint for base * 2^(n-1) seconds, capped at the maximum
// and spread by +-jitter_factor. A success clears the endpoint.
class BackoffManager {
public:
    using Clock = std::chrono::steady_clock;

    BackoffManager(double base_delay_seconds, double max_delay_seconds, double jitter_factor = 0.1);

    void record_failure(const std::string& endpoint, Clock::time_point now = Clock::now());
    void record_success(const std::string& endpoint);

    // Zero once the endpoint may be called again
    std::chrono::milliseconds time_until_allowed(const std::string& endpoint,
                                                 Clock::time_point now = Clock::now()) const;

    bool should_wait(const std::string& endpoint, Clock::time_point now = Clock::now()) const {
        return time_until_allowed(endpoint, now).count() > 0;
    }

    // Delay after `failures` consecutive failures, before jitter
    std::chrono::milliseconds delay_for(int failures) const;

private:
    struct Blocked {
        int failures = 0;
        Clock::time_point until;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Blocked> blocked_;
    double base_delay_seconds_;
    double max_delay_seconds_;
    double jitter_factor_;
};
