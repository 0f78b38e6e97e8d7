#pragma once

#include "interfaces.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <vector>

// Thread-safe SignalStore kept in process memory. Same conditional-update
// semantics as the PostgreSQL store; used by tests and dry runs.
class InMemorySignalStore : public SignalStore {
public:
    std::vector<Signal> list_active() override;
    void insert_signal(const Signal& signal) override;
    bool apply_transition(const StateTransition& transition) override;
    void record_heartbeat(const Heartbeat& heartbeat) override;
    std::vector<Signal> list_entered_signals(TimePoint since) override;
    void upsert_outcome(const TradeOutcome& outcome) override;

    std::optional<Signal> find(const std::string& id) const;
    std::vector<ValidationEvent> validation_events(const std::string& id) const;
    std::vector<Heartbeat> heartbeats() const;
    std::map<std::string, TradeOutcome> outcomes() const;

    // Sets acknowledged_at; false for unknown ids
    bool acknowledge(const std::string& id, TimePoint at);

private:
    mutable std::mutex mutex_;
    std::map<std::string, Signal> signals_;
    std::vector<ValidationEvent> events_;
    std::vector<Heartbeat> heartbeats_;
    std::map<std::string, TradeOutcome> outcomes_;
};
