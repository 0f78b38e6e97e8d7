#include "memory_store.hpp"
#include "errors.hpp"
#include "signal_rules.hpp"

std::vector<Signal> InMemorySignalStore::list_active() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Signal> active;
    for (const auto& entry : signals_) {
        if (!is_terminal(entry.second.state)) {
            active.push_back(entry.second);
        }
    }
    return active;
}

void InMemorySignalStore::insert_signal(const Signal& signal) {
    validate_levels(signal);

    std::lock_guard<std::mutex> lock(mutex_);
    if (signals_.count(signal.id) > 0) {
        throw InvariantViolation("Signal " + signal.id + " already exists");
    }
    Signal stored = signal;
    stored.status = status_for(stored.state);
    signals_.emplace(stored.id, stored);
}

bool InMemorySignalStore::apply_transition(const StateTransition& transition) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = signals_.find(transition.signal_id);
    if (it == signals_.end() || it->second.state != transition.expected_state) {
        return false;
    }

    validate_transition(transition.expected_state, transition.new_state);

    Signal& signal = it->second;
    signal.state = transition.new_state;
    signal.status = status_for(transition.new_state);
    signal.result = transition.result;
    if (transition.entry_hit_at) {
        signal.entry_hit_at = transition.entry_hit_at;
    }
    if (transition.closed_at) {
        signal.closed_at = transition.closed_at;
    }
    if (transition.mark_released) {
        signal.released = true;
    }

    events_.push_back(transition.event);
    return true;
}

void InMemorySignalStore::record_heartbeat(const Heartbeat& heartbeat) {
    std::lock_guard<std::mutex> lock(mutex_);
    heartbeats_.push_back(heartbeat);
}

std::vector<Signal> InMemorySignalStore::list_entered_signals(TimePoint since) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Signal> entered;
    for (const auto& entry : signals_) {
        const auto& hit = entry.second.entry_hit_at;
        if (hit && *hit >= since) {
            entered.push_back(entry.second);
        }
    }
    return entered;
}

void InMemorySignalStore::upsert_outcome(const TradeOutcome& outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    outcomes_[outcome.signal_id] = outcome;
}

std::optional<Signal> InMemorySignalStore::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = signals_.find(id);
    if (it == signals_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ValidationEvent> InMemorySignalStore::validation_events(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ValidationEvent> result;
    for (const auto& event : events_) {
        if (event.signal_id == id) {
            result.push_back(event);
        }
    }
    return result;
}

std::vector<Heartbeat> InMemorySignalStore::heartbeats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return heartbeats_;
}

std::map<std::string, TradeOutcome> InMemorySignalStore::outcomes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outcomes_;
}

bool InMemorySignalStore::acknowledge(const std::string& id, TimePoint at) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = signals_.find(id);
    if (it == signals_.end()) {
        return false;
    }
    it->second.acknowledged_at = at;
    return true;
}
