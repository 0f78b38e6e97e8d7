#include "signal_rules.hpp"
#include "errors.hpp"
#include <fmt/format.h>
#include <cmath>

namespace {
    bool valid_price(double price) {
        return std::isfinite(price) && price > 0.0;
    }
}

void validate_levels(const Signal& signal) {
    if (!valid_price(signal.entry_price) || !valid_price(signal.tp) || !valid_price(signal.sl)) {
        throw InvariantViolation(fmt::format("Signal {}: levels must be finite and positive", signal.id));
    }

    if (signal.direction == TradeDirection::Buy) {
        if (!(signal.sl < signal.entry_price && signal.entry_price < signal.tp)) {
            throw InvariantViolation(fmt::format(
                "Signal {}: BUY requires sl < entry < tp (sl={}, entry={}, tp={})",
                signal.id, signal.sl, signal.entry_price, signal.tp));
        }
    } else {
        if (!(signal.tp < signal.entry_price && signal.entry_price < signal.sl)) {
            throw InvariantViolation(fmt::format(
                "Signal {}: SELL requires tp < entry < sl (tp={}, entry={}, sl={})",
                signal.id, signal.tp, signal.entry_price, signal.sl));
        }
    }
}

void validate_transition(SignalState from, SignalState to) {
    if (state_rank(to) <= state_rank(from)) {
        throw InvariantViolation(fmt::format("Illegal transition {} -> {}", to_string(from), to_string(to)));
    }
}

bool entry_touched(const Signal& signal, const Candle& candle) {
    // BUY limit fills on a dip to entry, SELL on a rally to it
    if (signal.direction == TradeDirection::Buy) {
        return candle.low <= signal.entry_price;
    }
    return candle.high >= signal.entry_price;
}

bool stop_touched(const Signal& signal, const Candle& candle) {
    if (signal.direction == TradeDirection::Buy) {
        return candle.low <= signal.sl;
    }
    return candle.high >= signal.sl;
}

bool target_touched(const Signal& signal, const Candle& candle) {
    if (signal.direction == TradeDirection::Buy) {
        return candle.high >= signal.tp;
    }
    return candle.low <= signal.tp;
}
