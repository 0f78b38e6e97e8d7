#pragma once

#include "types.hpp"

// Level and lifecycle rules shared by the watcher, the resolver and the stores

// BUY: sl < entry < tp, SELL: tp < entry < sl, all prices finite and positive.
// Throws InvariantViolation.
void validate_levels(const Signal& signal);

// Throws InvariantViolation unless `to` is strictly later in the lifecycle than `from`
void validate_transition(SignalState from, SignalState to);

bool entry_touched(const Signal& signal, const Candle& candle);
bool stop_touched(const Signal& signal, const Candle& candle);
bool target_touched(const Signal& signal, const Candle& candle);
