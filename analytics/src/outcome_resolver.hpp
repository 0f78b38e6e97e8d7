#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

enum class Outcome {
    HitTp,
    HitSl,
    Expired
};

std::string to_string(Outcome outcome);

struct Resolution {
    Outcome outcome = Outcome::Expired;
    std::optional<Candle> candle;            // candle that decided the outcome
    std::optional<std::size_t> candle_index;
    std::size_t skipped_candles = 0;         // malformed or out-of-order input
};

// Replays candles after entry and decides which level was touched first.
// Within one candle the stop is checked before the target, so a candle
// spanning both levels always resolves as a loss.
class OutcomeResolver {
public:
    Resolution resolve(const Signal& signal, const std::vector<Candle>& candles_since_entry) const;

    // +reward_risk_ratio for HIT_TP, -1 for HIT_SL, 0 for EXPIRED
    static double compute_r_multiple(Outcome outcome, const Signal& signal);
};
