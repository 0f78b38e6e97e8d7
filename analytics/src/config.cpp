#include "config.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace {
    std::string get_env(const char* name, const std::string& default_value) {
        const char* value = std::getenv(name);
        return value ? value : default_value;
    }

    int get_env_int(const char* name, int default_value) {
        const char* value = std::getenv(name);
        if (value) {
            try {
                return std::stoi(value);
            } catch (const std::exception&) {
                spdlog::warn("Invalid integer value for {}: {}", name, value);
            }
        }
        return default_value;
    }

    double get_env_double(const char* name, double default_value) {
        const char* value = std::getenv(name);
        if (value) {
            try {
                return std::stod(value);
            } catch (const std::exception&) {
                spdlog::warn("Invalid double value for {}: {}", name, value);
            }
        }
        return default_value;
    }

    template <typename T>
    void read_key(const json& j, const char* key, T& target) {
        if (j.contains(key) && !j.at(key).is_null()) {
            target = j.at(key).get<T>();
        }
    }

    void require(bool condition, const std::string& message) {
        if (!condition) {
            throw std::invalid_argument("Invalid configuration: " + message);
        }
    }

    bool valid_hour(int hour) {
        return hour >= 0 && hour <= 24;
    }
}

void Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in config file " + path + ": " + e.what());
    }

    // PostgreSQL configuration
    read_key(j, "pg_dsn", pg_dsn);
    read_key(j, "table_signals", table_signals);
    read_key(j, "table_validation", table_validation);
    read_key(j, "table_heartbeat", table_heartbeat);
    read_key(j, "table_outcomes", table_outcomes);

    // Redis configuration
    read_key(j, "redis_url", redis_url);
    read_key(j, "stream_signals", stream_signals);

    // Candle feed
    read_key(j, "feed_base_url", feed_base_url);
    read_key(j, "feed_api_key", feed_api_key);
    read_key(j, "feed_timeout_ms", feed_timeout_ms);
    read_key(j, "feed_backoff_base_seconds", feed_backoff_base_seconds);
    read_key(j, "feed_backoff_max_seconds", feed_backoff_max_seconds);

    // Service configuration
    read_key(j, "service_name", service_name);
    read_key(j, "health_host", health_host);
    read_key(j, "health_port", health_port);
    read_key(j, "log_level", log_level);

    // Watcher timing
    read_key(j, "watch_interval_seconds", watch_interval_seconds);
    read_key(j, "stall_threshold_minutes", stall_threshold_minutes);
    read_key(j, "thread_pool_size", thread_pool_size);
    read_key(j, "max_lookback_candles", max_lookback_candles);
    read_key(j, "entry_window_minutes", entry_window_minutes);
    read_key(j, "trade_window_minutes", trade_window_minutes);
    read_key(j, "zombie_threshold_hours", zombie_threshold_hours);

    // Structure engine
    read_key(j, "structure_sensitivity", structure_sensitivity);
    read_key(j, "structure_min_window", structure_min_window);
    read_key(j, "break_threshold", break_threshold);
    read_key(j, "recent_swing_count", recent_swing_count);
    read_key(j, "fake_wick_threshold", fake_wick_threshold);
    read_key(j, "fake_weak_body_threshold", fake_weak_body_threshold);
    read_key(j, "followthrough_candles", followthrough_candles);
    read_key(j, "dominance_window", dominance_window);
    read_key(j, "min_evidence_score", min_evidence_score);
    read_key(j, "clear_dominance_ratio", clear_dominance_ratio);
    read_key(j, "lean_dominance_ratio", lean_dominance_ratio);
    read_key(j, "ranging_base_confidence", ranging_base_confidence);
    read_key(j, "max_confidence", max_confidence);
    read_key(j, "pip_size", pip_size);
    read_key(j, "fvg_min_gap_pips", fvg_min_gap_pips);
    read_key(j, "fvg_max_gap_pips", fvg_max_gap_pips);
    read_key(j, "fvg_max_age_candles", fvg_max_age_candles);
    read_key(j, "fvg_max_entry_distance_pips", fvg_max_entry_distance_pips);
    read_key(j, "sweep_wick_threshold_pips", sweep_wick_threshold_pips);
    read_key(j, "sweep_lookback_swings", sweep_lookback_swings);

    // Confidence refiner
    read_key(j, "london_open_hour", london_open_hour);
    read_key(j, "overlap_start_hour", overlap_start_hour);
    read_key(j, "london_close_hour", london_close_hour);
    read_key(j, "overlap_weight", overlap_weight);
    read_key(j, "primary_session_weight", primary_session_weight);
    read_key(j, "off_session_weight", off_session_weight);
    read_key(j, "rollover_start_hour", rollover_start_hour);
    read_key(j, "rollover_end_hour", rollover_end_hour);
    read_key(j, "spread_penalty", spread_penalty);
    read_key(j, "atr_period", atr_period);
    read_key(j, "volatility_low_ratio", volatility_low_ratio);
    read_key(j, "volatility_high_ratio", volatility_high_ratio);
    read_key(j, "volatility_low_factor", volatility_low_factor);
    read_key(j, "volatility_high_factor", volatility_high_factor);

    // Publish gate
    read_key(j, "min_release_score", min_release_score);
}

void Config::load_from_env() {
    // PostgreSQL configuration
    pg_dsn = get_env("PG_DSN", pg_dsn);

    // Redis configuration
    redis_url = get_env("REDIS_URL", redis_url);
    stream_signals = get_env("STREAM_SIGNALS", stream_signals);

    // Candle feed
    feed_base_url = get_env("FEED_BASE_URL", feed_base_url);
    feed_api_key = get_env("FEED_API_KEY", feed_api_key);
    feed_timeout_ms = get_env_int("FEED_TIMEOUT_MS", feed_timeout_ms);

    // Service configuration
    service_name = get_env("SERVICE_NAME", service_name);
    health_host = get_env("HEALTH_HOST", health_host);
    health_port = get_env_int("HEALTH_PORT", health_port);
    log_level = get_env("LOG_LEVEL", log_level);

    // Watcher timing
    watch_interval_seconds = get_env_int("WATCH_INTERVAL_SECONDS", watch_interval_seconds);
    stall_threshold_minutes = get_env_int("STALL_THRESHOLD_MINUTES", stall_threshold_minutes);
    thread_pool_size = get_env_int("THREAD_POOL_SIZE", thread_pool_size);
    entry_window_minutes = get_env_int("ENTRY_WINDOW_MINUTES", entry_window_minutes);
    trade_window_minutes = get_env_int("TRADE_WINDOW_MINUTES", trade_window_minutes);
    zombie_threshold_hours = get_env_int("ZOMBIE_THRESHOLD_HOURS", zombie_threshold_hours);

    // Gates
    structure_sensitivity = get_env_int("STRUCTURE_SENSITIVITY", structure_sensitivity);
    min_release_score = get_env_double("MIN_RELEASE_SCORE", min_release_score);
}

void Config::validate() const {
    require(watch_interval_seconds > 0, "watch_interval_seconds must be positive");
    require(stall_threshold_minutes > 0, "stall_threshold_minutes must be positive");
    require(thread_pool_size > 0, "thread_pool_size must be positive");
    require(max_lookback_candles > 0, "max_lookback_candles must be positive");
    require(entry_window_minutes > 0 && trade_window_minutes > 0, "signal windows must be positive");
    require(zombie_threshold_hours > 0, "zombie_threshold_hours must be positive");

    require(structure_sensitivity >= 1, "structure_sensitivity must be at least 1");
    require(structure_min_window >= 2 * structure_sensitivity + 1,
            "structure_min_window must cover one swing on each side");
    require(recent_swing_count >= 1, "recent_swing_count must be at least 1");
    require(dominance_window >= 1, "dominance_window must be at least 1");
    require(max_confidence > 0.0 && max_confidence <= 1.0, "max_confidence must be in (0, 1]");
    require(clear_dominance_ratio >= lean_dominance_ratio && lean_dominance_ratio >= 1.0,
            "dominance ratios must satisfy clear >= lean >= 1");
    require(pip_size > 0.0, "pip_size must be positive");
    require(fvg_min_gap_pips >= 0.0 && fvg_max_gap_pips >= fvg_min_gap_pips,
            "fvg gap bounds must satisfy 0 <= min <= max");
    require(fvg_max_age_candles >= 1 && sweep_lookback_swings >= 1,
            "fvg_max_age_candles and sweep_lookback_swings must be at least 1");

    require(valid_hour(london_open_hour) && valid_hour(overlap_start_hour) && valid_hour(london_close_hour),
            "session hours must be within 0..24");
    require(london_open_hour <= overlap_start_hour && overlap_start_hour <= london_close_hour,
            "session hours must be ordered");
    require(valid_hour(rollover_start_hour) && valid_hour(rollover_end_hour),
            "rollover hours must be within 0..24");
    require(atr_period >= 1, "atr_period must be at least 1");
    require(overlap_weight >= 0.0 && primary_session_weight >= 0.0 && off_session_weight >= 0.0 &&
            spread_penalty >= 0.0 && volatility_low_factor >= 0.0 && volatility_high_factor >= 0.0,
            "refiner factors must be non-negative");
    require(min_release_score >= 0.0 && min_release_score <= 1.0, "min_release_score must be in [0, 1]");
}
