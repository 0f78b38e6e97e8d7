#pragma once

#include "config.hpp"
#include "interfaces.hpp"
#include <memory>

// SignalStore backed by PostgreSQL (see watcher/sql/001_signal_lifecycle.sql).
// One connection shared by all workers, serialized internally; reconnects
// with exponential backoff. Operations throw std::runtime_error while the
// database is unreachable.
class PostgresSignalStore : public SignalStore {
public:
    explicit PostgresSignalStore(const Config& config);
    ~PostgresSignalStore() override;

    std::vector<Signal> list_active() override;
    void insert_signal(const Signal& signal) override;
    bool apply_transition(const StateTransition& transition) override;
    void record_heartbeat(const Heartbeat& heartbeat) override;
    std::vector<Signal> list_entered_signals(TimePoint since) override;
    void upsert_outcome(const TradeOutcome& outcome) override;

    // Non-copyable
    PostgresSignalStore(const PostgresSignalStore&) = delete;
    PostgresSignalStore& operator=(const PostgresSignalStore&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};
