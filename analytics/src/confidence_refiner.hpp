#pragma once

#include "types.hpp"
#include "config.hpp"
#include <optional>
#include <string>
#include <vector>

// The four factors behind a release score.
// Serialized as "raw=0.8000;session=1.2000;volatility=1.0000;spread=1.0000".
struct RefinementBreakdown {
    double raw = 0.0;
    double session = 1.0;
    double volatility = 1.0;
    double spread = 1.0;

    std::string to_string() const;

    // std::nullopt for anything that is not exactly the four key=value pairs
    static std::optional<RefinementBreakdown> parse(const std::string& text);
};

struct ReleaseScore {
    double score = 0.0;
    std::string explanation;
    RefinementBreakdown breakdown;
};

// Maps a raw model confidence into a context-adjusted release score:
//   clamp(raw * session_weight * volatility_factor * spread_factor, 0, 1)
// Pure: the clock is always passed in.
class ConfidenceRefiner {
public:
    explicit ConfidenceRefiner(const Config& config);

    // Throws std::invalid_argument for a NaN raw confidence
    ReleaseScore calculate_release_score(
        double raw_confidence,
        TimePoint now,
        const std::vector<Candle>& recent_candles
    ) const;

    double session_weight(TimePoint now) const;
    double session_weight_for_hour(int utc_hour) const;

    // Last candle range against the mean true range of the atr_period candles before it.
    // 1.0 when there is not enough history for a baseline.
    double volatility_factor(const std::vector<Candle>& recent_candles) const;

    double spread_factor(TimePoint now) const;
    double spread_factor_for_hour(int utc_hour) const;

    bool is_publishable(double release_score) const;

    static std::string version();

private:
    const Config& config_;
};
