#pragma once

#include "config.hpp"
#include "interfaces.hpp"
#include "outcome_resolver.hpp"
#include <optional>

struct BackfillReport {
    std::size_t processed = 0;
    std::size_t upserted = 0;
    std::size_t pending = 0;        // trade window still open, nothing touched yet
    std::size_t incomplete = 0;     // candle history does not reach back to entry, not written
    std::size_t disagreements = 0;  // replay differs from the live terminal state
    std::size_t feed_errors = 0;
    std::size_t failures = 0;
};

// Replays post-entry candles of every entered signal through the same
// OutcomeResolver the live watcher uses and upserts trade outcomes.
class BackfillRunner {
public:
    BackfillRunner(const Config& config, SignalStore& store, CandleFeed& feed);

    BackfillReport run(TimePoint since, TimePoint now);

    // std::nullopt while the outcome is still undecided. Throws FeedUnavailable.
    std::optional<TradeOutcome> replay(const Signal& signal, TimePoint now, BackfillReport& report) const;

    // Terminal live state matching a replayed outcome, or nullopt when the live
    // state says nothing about the market (still open or cancelled)
    static std::optional<Outcome> live_outcome(const Signal& signal);

private:
    const Config& config_;
    SignalStore& store_;
    CandleFeed& feed_;
    OutcomeResolver resolver_;
};
