#pragma once

#include "types.hpp"
#include <map>
#include <string>
#include <vector>

// Collaborators the watcher talks to. Production implementations live in
// candle_client, pg_store and redis_bus; tests use in-process fakes.

class CandleFeed {
public:
    virtual ~CandleFeed() = default;

    // Chronologically ordered, oldest first. Throws FeedUnavailable.
    virtual std::vector<Candle> fetch_candles(const std::string& asset, const std::string& timeframe,
                                              int lookback) = 0;

    // Candles opening in [start, end), oldest first. Throws FeedUnavailable.
    virtual std::vector<Candle> fetch_candle_range(const std::string& asset, const std::string& timeframe,
                                                   TimePoint start, TimePoint end) = 0;

    // Throws FeedUnavailable
    virtual double fetch_latest_price(const std::string& asset) = 0;
};

struct Heartbeat {
    std::string service;
    std::string status;                   // "WATCHER_ONLINE"
    std::map<std::string, double> prices; // latest price per watched asset
    std::size_t active_signals = 0;
    TimePoint recorded_at;
};

class SignalStore {
public:
    virtual ~SignalStore() = default;

    // Signals whose state is not terminal
    virtual std::vector<Signal> list_active() = 0;

    // Throws InvariantViolation for broken levels, never repairs them
    virtual void insert_signal(const Signal& signal) = 0;

    // Applies state, status, result, timestamps and the validation event together,
    // only while the stored state still equals transition.expected_state.
    // Returns false (no-op) when the guard no longer matches.
    virtual bool apply_transition(const StateTransition& transition) = 0;

    virtual void record_heartbeat(const Heartbeat& heartbeat) = 0;

    // Signals that reached ENTRY_HIT at or after `since`, in any later state
    virtual std::vector<Signal> list_entered_signals(TimePoint since) = 0;

    virtual void upsert_outcome(const TradeOutcome& outcome) = 0;
};

class Notifier {
public:
    virtual ~Notifier() = default;

    // false when the notification could not be delivered
    virtual bool publish(const SignalNotification& notification) = 0;
};
