#pragma once

#include "types.hpp"
#include <vector>

enum class SwingType {
    High,
    Low
};

struct SwingPoint {
    std::size_t index;
    double price;
    SwingType type;
    int strength;

    // First candle index at which the pivot is known without look-ahead
    std::size_t confirmed_at(int sensitivity) const { return index + static_cast<std::size_t>(sensitivity); }
};

// Strict pivot detection: a swing high is higher than the `sensitivity`
// candles on each side, a swing low lower. Larger sensitivity gives fewer,
// more significant swings.
class SwingDetector {
public:
    explicit SwingDetector(int sensitivity);

    // All swings, ordered by candle index (highs before lows on the same candle)
    std::vector<SwingPoint> detect_swings(const std::vector<Candle>& candles) const;

    // Most recent `count` swings
    static std::vector<SwingPoint> recent_swings(const std::vector<SwingPoint>& swings, std::size_t count);

    int sensitivity() const { return sensitivity_; }

private:
    int swing_strength(const std::vector<Candle>& candles, std::size_t index, SwingType type) const;

    int sensitivity_;
};
