#pragma once
#include <string>
#include <chrono>
#include <cstdint>

namespace util {

// Environment variable helpers
std::string get_env_var(const std::string& name, const std::string& default_value = "");

// String utilities
std::string trim(const std::string& str);
std::string to_upper(const std::string& str);

// Time utilities (all UTC)
std::string current_iso8601();
std::string format_iso8601(const std::chrono::system_clock::time_point& tp);
std::chrono::system_clock::time_point parse_iso8601(const std::string& iso_string);
int utc_hour(const std::chrono::system_clock::time_point& tp);

// Candle timeframe ("M15", "H4", "D1", "15min", "4h", ...) to bar duration.
// Throws std::invalid_argument for unknown timeframes.
std::chrono::minutes timeframe_duration(const std::string& timeframe);

// Whole bars of `timeframe` between two instants, 0 when `to` is not after `from`
long long bars_between(const std::string& timeframe, const std::chrono::system_clock::time_point& from,
                       const std::chrono::system_clock::time_point& to);

// Hashing
std::uint64_t fnv1a(const void* data, std::size_t size, std::uint64_t seed = 14695981039346656037ULL);
std::string hex_digest(std::uint64_t value, int width = 8);

// Math utilities
double clamp01(double value);
double round_to(double value, int decimals);

// base_value scaled by a uniform factor in [1 - jitter_factor, 1 + jitter_factor]
double random_jitter(double base_value, double jitter_factor);

} // namespace util
