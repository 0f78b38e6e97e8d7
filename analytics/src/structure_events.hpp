#pragma once

#include "types.hpp"
#include "config.hpp"
#include "swing_detector.hpp"
#include <vector>
#include <utility>

enum class BreakType {
    Bos,        // break in the direction of the prevailing trend
    Choch,      // break against the prevailing trend
    SwingBreak  // break while no trend is established
};

std::string to_string(BreakType type);

enum class Trend {
    Up,
    Down,
    None
};

struct StructureEvent {
    BreakType type;
    StructureDirection direction;  // Bullish or Bearish
    double broken_level;
    std::size_t candle_index;
    std::size_t swing_index;
    double body_strength;          // body / range of the breaking candle, 0..1
    bool close_acceptance;         // close beyond the level, not just a wick
    Trend trend;
};

// Detects BOS / CHoCH events from the most recent swings.
// Each swing yields at most one event: its first breaking candle.
class StructureEventDetector {
public:
    explicit StructureEventDetector(const Config& config);

    // Events ordered by breaking candle index, then swing index
    std::vector<StructureEvent> detect_events(const std::vector<Candle>& candles,
                                              const std::vector<SwingPoint>& swings) const;

    // HH+HL = Up, LL+LH = Down, otherwise None; only swings confirmed before `before_index` count
    Trend trend_before(const std::vector<SwingPoint>& swings, std::size_t before_index) const;

private:
    const Config& config_;
};

// Separates genuine breaks from breaks that reverse right away
class FakeBreakoutFilter {
public:
    explicit FakeBreakoutFilter(const Config& config);

    // Fake when at least two of: close rejected, wick dominant, weak body, no follow-through
    bool is_fake_breakout(const StructureEvent& event, const std::vector<Candle>& candles) const;

    // {valid, fake}, both keeping input order
    std::pair<std::vector<StructureEvent>, std::vector<StructureEvent>>
    filter_events(const std::vector<StructureEvent>& events, const std::vector<Candle>& candles) const;

private:
    bool is_wick_dominant(const Candle& candle) const;
    bool has_followthrough(const StructureEvent& event, const std::vector<Candle>& candles) const;

    const Config& config_;
};
