#include "heartbeat.hpp"
#include "util.hpp"

WatcherHealth::WatcherHealth(TimePoint started_at) : started_at_(started_at) {}

void WatcherHealth::record_success(TimePoint at, const TickReport& report) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_success_ = at;
    last_report_ = report;
    consecutive_failures_ = 0;
    ticks_++;
}

void WatcherHealth::record_failure(TimePoint at, const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_failure_ = at;
    last_error_ = error;
    consecutive_failures_++;
}

bool WatcherHealth::is_stalled(TimePoint now, std::chrono::minutes threshold) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const TimePoint reference = last_success_.value_or(started_at_);
    return now - reference > threshold;
}

std::optional<TimePoint> WatcherHealth::last_success() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_success_;
}

std::size_t WatcherHealth::consecutive_failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return consecutive_failures_;
}

nlohmann::json WatcherHealth::to_json(TimePoint now, std::chrono::minutes threshold) const {
    const bool stalled = is_stalled(now, threshold);

    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json j;
    j["status"] = stalled ? "stalled" : "healthy";
    j["started_at"] = util::format_iso8601(started_at_);
    j["last_success"] = last_success_ ? nlohmann::json(util::format_iso8601(*last_success_)) : nlohmann::json(nullptr);
    j["stall_threshold_minutes"] = threshold.count();
    j["ticks"] = ticks_;
    j["consecutive_failures"] = consecutive_failures_;
    j["last_tick"] = last_report_.to_json();
    if (last_failure_) {
        j["last_failure"] = util::format_iso8601(*last_failure_);
        j["last_error"] = last_error_;
    }
    return j;
}
