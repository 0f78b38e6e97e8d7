#pragma once

#include "types.hpp"
#include "config.hpp"
#include "swing_detector.hpp"
#include <vector>

// The last candle trades through a swing level and closes back inside it
struct LiquiditySweep {
    std::size_t index;              // sweeping candle
    std::size_t swing_index;
    double swept_level;
    StructureDirection direction;   // Bullish: a low was swept, Bearish: a high was swept
    double rejection_strength;      // rejecting wick / candle range
    double wick_size_pips;
};

class LiquidityFilter {
public:
    explicit LiquidityFilter(const Config& config);

    // Sweeps by the last candle of the most recent sweep_lookback_swings swings,
    // in swing order. Swings on the last candle itself are never swept.
    std::vector<LiquiditySweep> detect_sweeps(const std::vector<Candle>& candles,
                                              const std::vector<SwingPoint>& swings) const;

    static bool has_sweep(const std::vector<LiquiditySweep>& sweeps, StructureDirection direction);

private:
    const Config& config_;
};
