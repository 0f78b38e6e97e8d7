#include "fvg_detector.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <iterator>

FvgDetector::FvgDetector(const Config& config) : config_(config) {}

std::vector<FairValueGap> FvgDetector::detect_fvgs(const std::vector<Candle>& candles) const {
    std::vector<FairValueGap> gaps;
    if (candles.size() < 3) {
        return gaps;
    }

    const std::size_t age = static_cast<std::size_t>(config_.fvg_max_age_candles);
    const std::size_t start = candles.size() > age + 2 ? candles.size() - age - 2 : 0;

    for (std::size_t i = start; i + 2 < candles.size(); ++i) {
        const Candle& before = candles[i];
        const Candle& after = candles[i + 2];

        if (after.low > before.high) {
            if (auto gap = make_gap(candles[i + 1], i + 1, StructureDirection::Bullish, after.low, before.high)) {
                gaps.push_back(*gap);
            }
        }
        if (before.low > after.high) {
            if (auto gap = make_gap(candles[i + 1], i + 1, StructureDirection::Bearish, before.low, after.high)) {
                gaps.push_back(*gap);
            }
        }
    }

    // Filled once a later candle trades back to the midpoint
    for (auto& gap : gaps) {
        for (std::size_t j = gap.index + 2; j < candles.size() && !gap.filled; ++j) {
            gap.filled = gap.direction == StructureDirection::Bullish ? candles[j].low <= gap.midpoint
                                                                      : candles[j].high >= gap.midpoint;
        }
    }

    spdlog::debug("FVG scan: {} gaps, {} unfilled", gaps.size(),
                  std::count_if(gaps.begin(), gaps.end(), [](const FairValueGap& g) { return !g.filled; }));
    return gaps;
}

std::optional<FairValueGap> FvgDetector::make_gap(
    const Candle& impulse,
    std::size_t index,
    StructureDirection direction,
    double top,
    double bottom
) const {
    const double size_pips = (top - bottom) / config_.pip_size;
    if (size_pips < config_.fvg_min_gap_pips || size_pips > config_.fvg_max_gap_pips) {
        return std::nullopt;
    }

    const double range = impulse.high - impulse.low;
    const double body_ratio = range > 0.0 ? std::abs(impulse.close - impulse.open) / range : 0.0;
    const double size_score = std::min(1.0, size_pips / 10.0);

    FairValueGap gap;
    gap.index = index;
    gap.direction = direction;
    gap.top = top;
    gap.bottom = bottom;
    gap.midpoint = (top + bottom) / 2.0;
    gap.size_pips = util::round_to(size_pips, 1);
    gap.quality = util::round_to(body_ratio * 0.6 + size_score * 0.4, 4);
    gap.candle_strength = util::round_to(body_ratio, 4);
    return gap;
}

std::vector<FairValueGap> FvgDetector::unfilled(const std::vector<FairValueGap>& gaps) {
    std::vector<FairValueGap> open;
    std::copy_if(gaps.begin(), gaps.end(), std::back_inserter(open),
                 [](const FairValueGap& gap) { return !gap.filled; });
    std::stable_sort(open.begin(), open.end(),
                     [](const FairValueGap& a, const FairValueGap& b) { return a.index > b.index; });
    return open;
}

std::optional<FairValueGap> FvgDetector::nearest_entry(
    const std::vector<FairValueGap>& gaps,
    StructureDirection direction,
    double price
) const {
    const double max_distance = config_.fvg_max_entry_distance_pips * config_.pip_size;

    std::vector<FairValueGap> candidates;
    for (const auto& gap : unfilled(gaps)) {
        if (gap.direction != direction) {
            continue;
        }
        // Buy the dip into a bullish gap, sell the rally into a bearish one
        const double distance = direction == StructureDirection::Bullish ? price - gap.midpoint
                                                                         : gap.midpoint - price;
        if (distance > 0.0 && distance <= max_distance) {
            candidates.push_back(gap);
        }
    }

    if (candidates.empty()) {
        return std::nullopt;
    }

    std::stable_sort(candidates.begin(), candidates.end(), [price](const FairValueGap& a, const FairValueGap& b) {
        if (a.quality != b.quality) {
            return a.quality > b.quality;
        }
        return std::abs(a.midpoint - price) < std::abs(b.midpoint - price);
    });
    return candidates.front();
}
