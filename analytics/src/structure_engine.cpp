#include "structure_engine.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>

namespace {
    constexpr const char* kEngineVersion = "structure-engine/1.5.0";

    double base_score(BreakType type, bool is_fake) {
        if (is_fake) {
            return -0.4;
        }
        switch (type) {
            case BreakType::Bos: return 0.6;
            case BreakType::Choch: return 0.5;
            case BreakType::SwingBreak: return 0.4;
        }
        return 0.0;
    }

    std::string direction_label(StructureDirection direction) {
        return direction == StructureDirection::Bullish ? "Bullish" : "Bearish";
    }

    std::string describe_event(const StructureEvent& event, bool is_fake) {
        const int body_pct = static_cast<int>(std::lround(event.body_strength * 100.0));
        if (is_fake) {
            return fmt::format("Fake {} breakout rejected at {:.5f} (body {}%)",
                               to_string(event.direction), event.broken_level, body_pct);
        }

        std::string label;
        switch (event.type) {
            case BreakType::Bos: label = "BOS confirmed"; break;
            case BreakType::Choch: label = "CHoCH detected"; break;
            case BreakType::SwingBreak: label = "swing break"; break;
        }

        if (event.close_acceptance) {
            return fmt::format("{} {} at {:.5f} (body {}%, close accepted)",
                               direction_label(event.direction), label, event.broken_level, body_pct);
        }
        return fmt::format("{} {} at {:.5f} (wick break, body {}%)",
                           direction_label(event.direction), label, event.broken_level, body_pct);
    }

    template <typename T>
    void hash_value(std::uint64_t& hash, const T& value) {
        hash = util::fnv1a(&value, sizeof(value), hash);
    }

    void hash_string(std::uint64_t& hash, const std::string& value) {
        hash = util::fnv1a(value.data(), value.size(), hash);
        hash_value(hash, value.size());
    }
}

StructureEngine::StructureEngine(const Config& config)
    : config_(config),
      swing_detector_(config.structure_sensitivity),
      event_detector_(config),
      fake_filter_(config),
      fvg_detector_(config),
      liquidity_filter_(config) {}

std::string StructureEngine::version() {
    return kEngineVersion;
}

double StructureEngine::event_strength(const StructureEvent& event) {
    double strength = 0.5;
    strength += event.body_strength * 0.3;
    if (event.close_acceptance) {
        strength += 0.2;
    }
    return std::min(1.0, strength);
}

double StructureEngine::event_quality(const StructureEvent& event) {
    double quality = 0.7;
    if (event.body_strength > 0.7) {
        quality += 0.2;
    } else if (event.body_strength < 0.3) {
        quality -= 0.2;
    }
    if (event.close_acceptance) {
        quality += 0.1;
    }
    return util::clamp01(quality);
}

double StructureEngine::effective_score(const StructureEvent& event, bool is_fake) {
    // Fake breaks carry a fixed high strength so they clearly offset their own direction
    const double strength = is_fake ? 0.8 : event_strength(event);
    return base_score(event.type, is_fake) * strength * event_quality(event);
}

StructureState StructureEngine::analyze(
    const std::vector<Candle>& candles,
    const std::string& symbol,
    const std::string& timeframe,
    const std::string& source
) const {
    validate_window(candles);

    StructureState state;
    state.symbol = symbol;
    state.timeframe = timeframe;
    state.source = source;
    state.trace_id = make_trace_id(candles, symbol, timeframe, source);
    state.generated_at = candles.back().timestamp;

    spdlog::debug("[{}] Analyzing structure for {} @ {} ({} candles)",
                  state.trace_id, symbol, timeframe, candles.size());

    // Step 1: swings
    const auto swings = swing_detector_.detect_swings(candles);
    spdlog::debug("[{}] Found {} swing points", state.trace_id, swings.size());

    if (swings.size() < 2) {
        state.direction = StructureDirection::Ranging;
        state.confidence = 0.0;
        if (!swings.empty()) {
            state.dominance_ratio = dominance_ratio(candles, swings.back(), StructureDirection::Ranging);
        }
        state.evidence.push_back({"INSUFFICIENT_SWINGS",
                                  fmt::format("Only {} swing point(s) in window", swings.size()),
                                  std::nullopt, std::nullopt, std::nullopt, std::nullopt,
                                  static_cast<double>(swings.size())});
        return state;
    }

    const SwingPoint& pivot = swings.back();
    state.evidence.push_back({"PIVOT",
                              fmt::format("Most recent swing {} at {:.5f}",
                                          pivot.type == SwingType::High ? "high" : "low", pivot.price),
                              std::nullopt, pivot.price, static_cast<double>(pivot.strength),
                              pivot.index, std::nullopt});

    // Step 2 + 3: breaks, split into genuine and fake
    const auto events = event_detector_.detect_events(candles, swings);
    const auto filtered = fake_filter_.filter_events(events, candles);
    const auto& valid_events = filtered.first;
    spdlog::debug("[{}] Detected {} structure events ({} valid, {} fake)",
                  state.trace_id, events.size(), valid_events.size(), filtered.second.size());

    // Step 4: score in chronological order
    double bullish = 0.0;
    double bearish = 0.0;
    for (const auto& event : events) {
        const bool is_fake = fake_filter_.is_fake_breakout(event, candles);
        const double score = effective_score(event, is_fake);

        if (event.direction == StructureDirection::Bullish) {
            bullish += score;
        } else {
            bearish += score;
        }

        state.evidence.push_back({is_fake ? "FAKE_BREAKOUT" : to_string(event.type),
                                  describe_event(event, is_fake),
                                  event.direction,
                                  event.broken_level,
                                  is_fake ? 0.8 : event_strength(event),
                                  event.candle_index,
                                  util::round_to(score, 6)});
    }

    bullish = std::max(0.0, bullish);
    bearish = std::max(0.0, bearish);
    state.bullish_score = util::round_to(bullish, 4);
    state.bearish_score = util::round_to(bearish, 4);

    // Step 5: resolve direction
    const double total = bullish + bearish;
    const double imbalance = total > 0.0 ? std::abs(bullish - bearish) / total : 0.0;
    StructureDirection direction = StructureDirection::Ranging;
    std::string resolution;

    if (events.empty()) {
        resolution = "No structure breaks detected, market ranging";
    } else if (total < config_.min_evidence_score) {
        resolution = fmt::format("Insufficient structure evidence (total {:.2f})", total);
    } else if (bullish > bearish && bullish >= bearish * config_.lean_dominance_ratio) {
        direction = StructureDirection::Bullish;
    } else if (bearish > bullish && bearish >= bullish * config_.lean_dominance_ratio) {
        direction = StructureDirection::Bearish;
    } else {
        resolution = fmt::format("Conflicting signals (bull: {:.2f}, bear: {:.2f})", bullish, bearish);
    }

    // More recent opposite evidence overrides the aggregate
    if (direction != StructureDirection::Ranging && !valid_events.empty()) {
        const StructureEvent& latest = valid_events.back();
        if (latest.direction != direction) {
            resolution = fmt::format("{} bias contradicted by later {} {} at {:.5f}",
                                     direction_label(direction), to_string(latest.direction),
                                     to_string(latest.type), latest.broken_level);
            direction = StructureDirection::Ranging;
        }
    }

    state.direction = direction;
    if (direction == StructureDirection::Ranging) {
        state.confidence = std::min(config_.max_confidence, config_.ranging_base_confidence * (1.0 - imbalance));
    } else {
        const double dominant = std::max(bullish, bearish);
        state.confidence = std::min(config_.max_confidence, dominant * imbalance);
        const bool clear = std::min(bullish, bearish) * config_.clear_dominance_ratio <= dominant;
        resolution = fmt::format("{} structure ({} dominance, bull: {:.2f}, bear: {:.2f})",
                                 direction_label(direction), clear ? "clear" : "moderate", bullish, bearish);
    }
    state.confidence = util::round_to(util::clamp01(state.confidence), 4);

    // Entry zones and stop hunts, only once there is structure to trade
    if (!events.empty()) {
        const auto gaps = fvg_detector_.detect_fvgs(candles);
        const auto lean = bullish > bearish ? StructureDirection::Bullish : StructureDirection::Bearish;
        const auto gap = fvg_detector_.nearest_entry(gaps, lean, candles.back().close);
        if (gap) {
            state.evidence.push_back({"FVG",
                                      fmt::format("{} FVG {:.5f}-{:.5f}, midpoint {:.5f} ({:.1f} pips, quality {:.2f})",
                                                  direction_label(gap->direction), gap->bottom, gap->top,
                                                  gap->midpoint, gap->size_pips, gap->quality),
                                      gap->direction, gap->midpoint, gap->quality, gap->index, gap->size_pips});
        }

        const auto sweeps = liquidity_filter_.detect_sweeps(candles, swings);
        for (const auto& sweep : sweeps) {
            state.evidence.push_back({"LIQUIDITY_SWEEP",
                                      fmt::format("Liquidity sweep of swing {} at {:.5f} ({:.1f} pip wick)",
                                                  sweep.direction == StructureDirection::Bullish ? "low" : "high",
                                                  sweep.swept_level, sweep.wick_size_pips),
                                      sweep.direction, sweep.swept_level, sweep.rejection_strength,
                                      sweep.index, sweep.wick_size_pips});
        }
        spdlog::debug("[{}] {} FVGs ({} unfilled), {} liquidity sweeps", state.trace_id, gaps.size(),
                      FvgDetector::unfilled(gaps).size(), sweeps.size());
    }

    state.dominance_ratio = dominance_ratio(candles, pivot, direction);
    state.evidence.push_back({"DOMINANCE",
                              fmt::format("{:.0f}% of recent closes on the dominant side of {:.5f}",
                                          state.dominance_ratio * 100.0, pivot.price),
                              direction, pivot.price, std::nullopt, pivot.index, state.dominance_ratio});
    state.evidence.push_back({"RESOLUTION", resolution, direction, std::nullopt, std::nullopt,
                              std::nullopt, state.confidence});

    spdlog::debug("[{}] Final state: {} (confidence: {:.2f}, dominance: {:.2f})",
                  state.trace_id, to_string(state.direction), state.confidence, state.dominance_ratio);

    return state;
}

void StructureEngine::validate_window(const std::vector<Candle>& candles) const {
    const auto required = static_cast<std::size_t>(config_.structure_min_window);
    if (candles.size() < required) {
        throw DataInsufficient(required, candles.size());
    }

    for (std::size_t i = 0; i < candles.size(); ++i) {
        if (!candles[i].is_consistent()) {
            throw MalformedCandle(fmt::format("Candle {} at {} violates OHLC invariant",
                                              i, util::format_iso8601(candles[i].timestamp)));
        }
        if (i > 0 && candles[i].timestamp <= candles[i - 1].timestamp) {
            throw MalformedCandle(fmt::format("Candle {} at {} is not after its predecessor",
                                              i, util::format_iso8601(candles[i].timestamp)));
        }
    }
}

std::string StructureEngine::make_trace_id(
    const std::vector<Candle>& candles,
    const std::string& symbol,
    const std::string& timeframe,
    const std::string& source
) const {
    std::uint64_t hash = 14695981039346656037ULL;
    hash_string(hash, symbol);
    hash_string(hash, timeframe);
    hash_string(hash, source);
    hash_value(hash, config_.structure_sensitivity);

    for (const auto& candle : candles) {
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            candle.timestamp.time_since_epoch()).count();
        hash_value(hash, ms);
        hash_value(hash, candle.open);
        hash_value(hash, candle.high);
        hash_value(hash, candle.low);
        hash_value(hash, candle.close);
        hash_value(hash, candle.volume);
    }

    return "struct-" + util::hex_digest(hash, 8);
}

double StructureEngine::dominance_ratio(
    const std::vector<Candle>& candles,
    const SwingPoint& pivot,
    StructureDirection direction
) const {
    const std::size_t window = std::min(candles.size(), static_cast<std::size_t>(config_.dominance_window));
    if (window == 0) {
        return 0.0;
    }

    std::size_t above = 0;
    std::size_t below = 0;
    for (std::size_t i = candles.size() - window; i < candles.size(); ++i) {
        if (candles[i].close > pivot.price) {
            above++;
        } else if (candles[i].close < pivot.price) {
            below++;
        }
    }

    std::size_t dominant = std::max(above, below);
    if (direction == StructureDirection::Bullish) {
        dominant = above;
    } else if (direction == StructureDirection::Bearish) {
        dominant = below;
    }

    return util::round_to(static_cast<double>(dominant) / static_cast<double>(window), 4);
}
