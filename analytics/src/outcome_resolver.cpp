#include "outcome_resolver.hpp"
#include "signal_rules.hpp"

std::string to_string(Outcome outcome) {
    switch (outcome) {
        case Outcome::HitTp: return "HIT_TP";
        case Outcome::HitSl: return "HIT_SL";
        case Outcome::Expired: return "EXPIRED";
    }
    return "EXPIRED";
}

Resolution OutcomeResolver::resolve(const Signal& signal, const std::vector<Candle>& candles_since_entry) const {
    Resolution resolution;
    std::optional<TimePoint> last_timestamp;

    for (std::size_t i = 0; i < candles_since_entry.size(); ++i) {
        const Candle& candle = candles_since_entry[i];

        if (!candle.is_consistent() || (last_timestamp && candle.timestamp <= *last_timestamp)) {
            resolution.skipped_candles++;
            continue;
        }
        last_timestamp = candle.timestamp;

        // Stop first
        if (stop_touched(signal, candle)) {
            resolution.outcome = Outcome::HitSl;
        } else if (target_touched(signal, candle)) {
            resolution.outcome = Outcome::HitTp;
        } else {
            continue;
        }

        resolution.candle = candle;
        resolution.candle_index = i;
        return resolution;
    }

    return resolution;
}

double OutcomeResolver::compute_r_multiple(Outcome outcome, const Signal& signal) {
    switch (outcome) {
        case Outcome::HitTp: return signal.reward_risk_ratio;
        case Outcome::HitSl: return -1.0;
        case Outcome::Expired: return 0.0;
    }
    return 0.0;
}
