#include "structure_events.hpp"
#include <algorithm>
#include <cmath>

std::string to_string(BreakType type) {
    switch (type) {
        case BreakType::Bos: return "BOS";
        case BreakType::Choch: return "CHOCH";
        case BreakType::SwingBreak: return "SWING_BREAK";
    }
    return "SWING_BREAK";
}

StructureEventDetector::StructureEventDetector(const Config& config) : config_(config) {}

std::vector<StructureEvent> StructureEventDetector::detect_events(
    const std::vector<Candle>& candles,
    const std::vector<SwingPoint>& swings
) const {
    std::vector<StructureEvent> events;
    if (swings.empty()) {
        return events;
    }

    const int sensitivity = config_.structure_sensitivity;
    const auto recent = SwingDetector::recent_swings(swings, static_cast<std::size_t>(config_.recent_swing_count));

    for (const auto& swing : recent) {
        const bool is_high = swing.type == SwingType::High;
        const double threshold = is_high ? swing.price * (1.0 + config_.break_threshold)
                                         : swing.price * (1.0 - config_.break_threshold);

        // Candles up to confirmation cannot break the pivot by construction
        for (std::size_t i = swing.confirmed_at(sensitivity) + 1; i < candles.size(); ++i) {
            const Candle& candle = candles[i];

            bool close_beyond = is_high ? candle.close > threshold : candle.close < threshold;
            bool wick_beyond = is_high ? candle.high > threshold : candle.low < threshold;
            if (!close_beyond && !wick_beyond) {
                continue;
            }

            const double range = candle.range();
            const double body_strength = range > 0.0 ? std::abs(candle.close - candle.open) / range : 0.0;
            const Trend trend = trend_before(swings, i);
            const StructureDirection direction = is_high ? StructureDirection::Bullish
                                                         : StructureDirection::Bearish;

            BreakType type = BreakType::SwingBreak;
            if (trend == Trend::Up) {
                type = is_high ? BreakType::Bos : BreakType::Choch;
            } else if (trend == Trend::Down) {
                type = is_high ? BreakType::Choch : BreakType::Bos;
            }

            events.push_back({type, direction, swing.price, i, swing.index,
                              body_strength, close_beyond, trend});
            break;
        }
    }

    std::sort(events.begin(), events.end(), [](const StructureEvent& a, const StructureEvent& b) {
        if (a.candle_index != b.candle_index) {
            return a.candle_index < b.candle_index;
        }
        return a.swing_index < b.swing_index;
    });

    return events;
}

Trend StructureEventDetector::trend_before(const std::vector<SwingPoint>& swings, std::size_t before_index) const {
    std::vector<double> highs;
    std::vector<double> lows;

    for (const auto& swing : swings) {
        if (swing.confirmed_at(config_.structure_sensitivity) >= before_index) {
            break;
        }
        if (swing.type == SwingType::High) {
            highs.push_back(swing.price);
        } else {
            lows.push_back(swing.price);
        }
    }

    if (highs.size() < 2 || lows.size() < 2) {
        return Trend::None;
    }

    const bool higher_high = highs.back() > highs[highs.size() - 2];
    const bool higher_low = lows.back() > lows[lows.size() - 2];
    const bool lower_high = highs.back() < highs[highs.size() - 2];
    const bool lower_low = lows.back() < lows[lows.size() - 2];

    if (higher_high && higher_low) {
        return Trend::Up;
    }
    if (lower_low && lower_high) {
        return Trend::Down;
    }
    return Trend::None;
}

FakeBreakoutFilter::FakeBreakoutFilter(const Config& config) : config_(config) {}

bool FakeBreakoutFilter::is_fake_breakout(const StructureEvent& event, const std::vector<Candle>& candles) const {
    if (event.candle_index >= candles.size()) {
        return false;
    }

    int fake_score = 0;

    // Close rejected back into range
    if (!event.close_acceptance) {
        fake_score++;
    }

    if (is_wick_dominant(candles[event.candle_index])) {
        fake_score++;
    }

    if (event.body_strength < config_.fake_weak_body_threshold) {
        fake_score++;
    }

    if (!has_followthrough(event, candles)) {
        fake_score++;
    }

    return fake_score >= 2;
}

std::pair<std::vector<StructureEvent>, std::vector<StructureEvent>>
FakeBreakoutFilter::filter_events(const std::vector<StructureEvent>& events, const std::vector<Candle>& candles) const {
    std::vector<StructureEvent> valid;
    std::vector<StructureEvent> fake;

    for (const auto& event : events) {
        if (is_fake_breakout(event, candles)) {
            fake.push_back(event);
        } else {
            valid.push_back(event);
        }
    }

    return {valid, fake};
}

bool FakeBreakoutFilter::is_wick_dominant(const Candle& candle) const {
    const double range = candle.range();
    if (range <= 0.0) {
        return false;
    }

    const double upper_wick = candle.high - std::max(candle.open, candle.close);
    const double lower_wick = std::min(candle.open, candle.close) - candle.low;
    return (upper_wick + lower_wick) / range > config_.fake_wick_threshold;
}

bool FakeBreakoutFilter::has_followthrough(const StructureEvent& event, const std::vector<Candle>& candles) const {
    const std::size_t start = event.candle_index + 1;
    const std::size_t end = std::min(start + static_cast<std::size_t>(config_.followthrough_candles), candles.size());

    if (start >= end) {
        return false;  // Nothing after the break yet
    }

    std::size_t holding = 0;
    for (std::size_t i = start; i < end; ++i) {
        const bool holds = event.direction == StructureDirection::Bullish
                               ? candles[i].close > event.broken_level
                               : candles[i].close < event.broken_level;
        if (holds) {
            holding++;
        }
    }

    // At least half the follow-through closes stay beyond the level
    return 2 * holding >= end - start;
}
