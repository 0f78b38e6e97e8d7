#include "util.hpp"
#include <cstdlib>
#include <stdexcept>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <random>

namespace util {

std::string get_env_var(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : default_value;
}

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";

    auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

std::string to_upper(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::string current_iso8601() {
    return format_iso8601(std::chrono::system_clock::now());
}

std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch() % std::chrono::seconds(1)).count();
    if (ms < 0) {
        ms += 1000;
        time_t -= 1;
    }

    std::tm tm = {};
    gmtime_r(&time_t, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
    return ss.str();
}

std::chrono::system_clock::time_point parse_iso8601(const std::string& iso_string) {
    std::string text = trim(iso_string);
    if (text.size() > 10 && text[10] == ' ') {
        // Feed and database timestamps use a space separator
        text[10] = 'T';
    }

    std::tm tm = {};
    std::istringstream ss(text);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");

    if (ss.fail()) {
        // Date-only values ("2024-01-05") denote midnight UTC
        std::istringstream date_only(text);
        tm = {};
        date_only >> std::get_time(&tm, "%Y-%m-%d");
        if (date_only.fail() || text.size() != 10) {
            throw std::runtime_error("Failed to parse ISO8601 timestamp: " + iso_string);
        }
        return std::chrono::system_clock::from_time_t(timegm(&tm));
    }

    auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));

    // Optional fractional seconds
    if (ss.peek() == '.') {
        ss.get();
        std::string digits;
        while (std::isdigit(ss.peek())) {
            digits.push_back(static_cast<char>(ss.get()));
        }
        if (!digits.empty()) {
            digits = digits.substr(0, 3);
            while (digits.size() < 3) digits.push_back('0');
            tp += std::chrono::milliseconds(std::stoi(digits));
        }
    }

    // Optional zone designator: Z or +hh:mm / -hh:mm
    int sign = 0;
    if (ss.peek() == '+') sign = 1;
    if (ss.peek() == '-') sign = -1;
    if (sign != 0) {
        ss.get();
        int hours = 0;
        int minutes = 0;
        char sep = 0;
        ss >> hours;
        if (ss.peek() == ':') ss >> sep;
        ss >> minutes;
        tp -= sign * (std::chrono::hours(hours) + std::chrono::minutes(minutes));
    }

    return tp;
}

int utc_hour(const std::chrono::system_clock::time_point& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm = {};
    gmtime_r(&time_t, &tm);
    return tm.tm_hour;
}

std::chrono::minutes timeframe_duration(const std::string& timeframe) {
    const std::string tf = to_upper(trim(timeframe));
    if (tf.empty()) {
        throw std::invalid_argument("Empty timeframe");
    }

    auto parse_count = [&](const std::string& digits) {
        if (digits.empty() || !std::all_of(digits.begin(), digits.end(),
                                           [](unsigned char c) { return std::isdigit(c); })) {
            throw std::invalid_argument("Unknown timeframe: " + timeframe);
        }
        return std::stoi(digits);
    };

    // Broker style: M15, H4, D1, W1
    const char unit = tf.front();
    if (tf.size() > 1 && std::isalpha(static_cast<unsigned char>(unit))) {
        int count = parse_count(tf.substr(1));
        switch (unit) {
            case 'M': return std::chrono::minutes(count);
            case 'H': return std::chrono::hours(count);
            case 'D': return std::chrono::hours(24 * count);
            case 'W': return std::chrono::hours(24 * 7 * count);
            default: break;
        }
    }

    // Vendor style: 15MIN, 4H, 1DAY, 1WEEK
    auto pos = tf.find_first_not_of("0123456789");
    if (pos != std::string::npos && pos > 0) {
        int count = parse_count(tf.substr(0, pos));
        const std::string suffix = tf.substr(pos);
        if (suffix == "MIN") return std::chrono::minutes(count);
        if (suffix == "H") return std::chrono::hours(count);
        if (suffix == "DAY") return std::chrono::hours(24 * count);
        if (suffix == "WEEK") return std::chrono::hours(24 * 7 * count);
    }

    throw std::invalid_argument("Unknown timeframe: " + timeframe);
}

long long bars_between(const std::string& timeframe, const std::chrono::system_clock::time_point& from,
                       const std::chrono::system_clock::time_point& to) {
    const auto bar = timeframe_duration(timeframe);
    if (to <= from || bar.count() <= 0) {
        return 0;
    }
    return std::chrono::duration_cast<std::chrono::minutes>(to - from).count() / bar.count();
}

std::uint64_t fnv1a(const void* data, std::size_t size, std::uint64_t seed) {
    const auto* bytes = static_cast<const unsigned char*>(data);
    std::uint64_t hash = seed;
    for (std::size_t i = 0; i < size; ++i) {
        hash ^= bytes[i];
        hash *= 1099511628211ULL;
    }
    return hash;
}

std::string hex_digest(std::uint64_t value, int width) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0') << std::setw(16) << value;
    std::string full = ss.str();
    return full.substr(full.size() - static_cast<std::size_t>(width));
}

double clamp01(double value) {
    return std::max(0.0, std::min(1.0, value));
}

double round_to(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

double random_jitter(double base_value, double jitter_factor) {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_real_distribution<> dis(-jitter_factor, jitter_factor);
    return base_value * (1.0 + dis(gen));
}

} // namespace util
