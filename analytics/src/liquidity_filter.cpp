#include "liquidity_filter.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

LiquidityFilter::LiquidityFilter(const Config& config) : config_(config) {}

std::vector<LiquiditySweep> LiquidityFilter::detect_sweeps(
    const std::vector<Candle>& candles,
    const std::vector<SwingPoint>& swings
) const {
    std::vector<LiquiditySweep> sweeps;
    if (swings.empty() || candles.size() < 2) {
        return sweeps;
    }

    const std::size_t current = candles.size() - 1;
    const Candle& candle = candles[current];
    const double range = candle.high - candle.low;
    if (range <= 0.0) {
        return sweeps;
    }

    const double threshold = config_.sweep_wick_threshold_pips * config_.pip_size;

    for (const auto& swing : SwingDetector::recent_swings(swings, static_cast<std::size_t>(config_.sweep_lookback_swings))) {
        if (swing.index >= current) {
            continue;
        }

        double wick = 0.0;
        StructureDirection direction = StructureDirection::Ranging;
        if (swing.type == SwingType::High && candle.high > swing.price && candle.close <= swing.price) {
            wick = candle.high - std::max(candle.open, candle.close);
            direction = StructureDirection::Bearish;
        } else if (swing.type == SwingType::Low && candle.low < swing.price && candle.close >= swing.price) {
            wick = std::min(candle.open, candle.close) - candle.low;
            direction = StructureDirection::Bullish;
        } else {
            continue;
        }

        if (wick < threshold) {
            continue;
        }

        sweeps.push_back({current, swing.index, swing.price, direction,
                          util::round_to(wick / range, 4),
                          util::round_to(wick / config_.pip_size, 2)});
    }

    for (const auto& sweep : sweeps) {
        spdlog::debug("{} liquidity sweep of {:.5f} (rejection {:.2f})",
                      to_string(sweep.direction), sweep.swept_level, sweep.rejection_strength);
    }
    return sweeps;
}

bool LiquidityFilter::has_sweep(const std::vector<LiquiditySweep>& sweeps, StructureDirection direction) {
    return std::any_of(sweeps.begin(), sweeps.end(),
                       [direction](const LiquiditySweep& sweep) { return sweep.direction == direction; });
}
