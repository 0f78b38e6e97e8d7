#include "swing_detector.hpp"
#include <algorithm>
#include <initializer_list>
#include <stdexcept>

namespace {
    double pivot_price(const Candle& candle, SwingType type) {
        return type == SwingType::High ? candle.high : candle.low;
    }

    // true when `price` stands out from `other` in the swing's direction
    bool beyond(double price, double other, SwingType type) {
        return type == SwingType::High ? price > other : price < other;
    }
}

SwingDetector::SwingDetector(int sensitivity) : sensitivity_(sensitivity) {
    if (sensitivity_ < 1) {
        throw std::invalid_argument("Swing sensitivity must be at least 1");
    }
}

std::vector<SwingPoint> SwingDetector::detect_swings(const std::vector<Candle>& candles) const {
    std::vector<SwingPoint> swings;
    const std::size_t n = static_cast<std::size_t>(sensitivity_);

    if (candles.size() < 2 * n + 1) {
        return swings;
    }

    // Can't detect swings at the edges
    for (std::size_t i = n; i + n < candles.size(); ++i) {
        for (SwingType type : {SwingType::High, SwingType::Low}) {
            const double price = pivot_price(candles[i], type);
            bool is_pivot = true;
            for (std::size_t j = 1; j <= n && is_pivot; ++j) {
                is_pivot = beyond(price, pivot_price(candles[i - j], type), type) &&
                           beyond(price, pivot_price(candles[i + j], type), type);
            }
            if (is_pivot) {
                swings.push_back({i, price, type, swing_strength(candles, i, type)});
            }
        }
    }

    return swings;
}

std::vector<SwingPoint> SwingDetector::recent_swings(const std::vector<SwingPoint>& swings, std::size_t count) {
    if (swings.size() <= count) {
        return swings;
    }
    return std::vector<SwingPoint>(swings.end() - static_cast<std::ptrdiff_t>(count), swings.end());
}

int SwingDetector::swing_strength(const std::vector<Candle>& candles, std::size_t index, SwingType type) const {
    // Base requirement plus half a point per extra confirming candle on each side, up to 10 candles out
    double strength = sensitivity_;
    const double price = pivot_price(candles[index], type);
    const std::size_t max_offset = std::min<std::size_t>(10, std::min(index, candles.size() - index - 1));

    for (std::size_t offset = static_cast<std::size_t>(sensitivity_) + 1; offset <= max_offset; ++offset) {
        const bool left = beyond(price, pivot_price(candles[index - offset], type), type);
        const bool right = beyond(price, pivot_price(candles[index + offset], type), type);
        if (left) strength += 0.5;
        if (right) strength += 0.5;
        if (!left && !right) {
            break;
        }
    }

    return static_cast<int>(strength);
}
