#pragma once

#include "types.hpp"
#include "signal_watcher.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>

// Liveness of the polling loop. The health endpoint reports the watcher
// unhealthy once no tick has succeeded for longer than the stall threshold.
class WatcherHealth {
public:
    explicit WatcherHealth(TimePoint started_at);

    void record_success(TimePoint at, const TickReport& report);
    void record_failure(TimePoint at, const std::string& error);

    // Before the first successful tick the start time counts as the last success
    bool is_stalled(TimePoint now, std::chrono::minutes threshold) const;

    std::optional<TimePoint> last_success() const;
    std::size_t consecutive_failures() const;

    nlohmann::json to_json(TimePoint now, std::chrono::minutes threshold) const;

private:
    mutable std::mutex mutex_;
    TimePoint started_at_;
    std::optional<TimePoint> last_success_;
    std::optional<TimePoint> last_failure_;
    std::string last_error_;
    std::size_t consecutive_failures_ = 0;
    std::size_t ticks_ = 0;
    TickReport last_report_;
};
