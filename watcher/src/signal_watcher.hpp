#pragma once

#include "config.hpp"
#include "types.hpp"
#include "interfaces.hpp"
#include "outcome_resolver.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <vector>

struct TickReport {
    std::size_t checked = 0;
    std::size_t transitions = 0;
    std::size_t published = 0;
    std::size_t cancelled = 0;
    std::size_t feed_errors = 0;
    std::size_t malformed_candles = 0;
    std::size_t failures = 0;

    TickReport& operator+=(const TickReport& other);
    nlohmann::json to_json() const;
};

// Polls every non-terminal signal once per tick and advances its lifecycle:
//
//   CANDIDATE -> WAITING_FOR_ENTRY -> ENTRY_HIT -> TP_HIT | SL_HIT
//                       |                 |
//                       +-> EXPIRED       +-> EXPIRED (TIME_EXIT)
//
// plus administrative CANCELLED for zombies. Every transition is applied
// as a conditional update on the store, so concurrent ticks cannot double
// transition a signal. Errors are isolated per signal.
class SignalLifecycleWatcher {
public:
    SignalLifecycleWatcher(const Config& config, SignalStore& store, CandleFeed& feed, Notifier& notifier);

    // One polling pass. Throws only when the active signals cannot be listed.
    TickReport tick(TimePoint now);

    // Market-driven decision for one signal from the candles fetched this tick.
    // Malformed candles are skipped and added to `malformed`.
    std::optional<StateTransition> evaluate_market(
        const Signal& signal,
        const std::vector<Candle>& candles,
        TimePoint now,
        std::size_t& malformed
    ) const;

    // CANDIDATE promotion once the release score clears the publish gate
    std::optional<StateTransition> evaluate_release(const Signal& signal, TimePoint now) const;

    // Administrative cancellation of unacknowledged signals past the zombie threshold
    std::optional<StateTransition> evaluate_zombie(const Signal& signal, TimePoint now) const;

    TimePoint entry_deadline(const Signal& signal) const;
    TimePoint trade_deadline(const Signal& signal) const;

private:
    void process_signal(const Signal& signal, TimePoint now, TickReport& report);
    void apply(const Signal& signal, const StateTransition& transition, TimePoint now, TickReport& report);
    void notify(const Signal& signal, SignalState new_state, TimePoint now, TickReport& report, bool release);
    void record_heartbeat(const std::vector<Signal>& signals, TimePoint now);
    int lookback_for(const Signal& signal, TimePoint now) const;

    std::vector<Candle> sanitize(const Signal& signal, const std::vector<Candle>& candles,
                                 std::size_t& malformed) const;

    const Config& config_;
    SignalStore& store_;
    CandleFeed& feed_;
    Notifier& notifier_;
    OutcomeResolver resolver_;
};
