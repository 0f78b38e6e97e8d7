#include "pg_store.hpp"
#include "errors.hpp"
#include "signal_rules.hpp"
#include "util.hpp"
#include <pqxx/pqxx>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace {
    // Timestamps travel as UTC ISO-8601 text in both directions
    std::string ts_column(const char* name) {
        return fmt::format("to_char({0} AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS.MS\"Z\"') AS {0}", name);
    }

    std::string signal_columns() {
        return fmt::format(
            "id, asset, timeframe, direction, entry_price, tp, sl, reward_risk_ratio, "
            "raw_confidence, release_confidence, state, status, result, released, {}, {}, {}, {}, {}, {}",
            ts_column("generated_at"), ts_column("entry_deadline"), ts_column("trade_deadline"),
            ts_column("entry_hit_at"), ts_column("closed_at"), ts_column("acknowledged_at"));
    }

    std::optional<TimePoint> optional_time(const pqxx::row& row, const char* column) {
        if (row[column].is_null()) {
            return std::nullopt;
        }
        return util::parse_iso8601(row[column].as<std::string>());
    }

    std::optional<std::string> optional_iso(const std::optional<TimePoint>& tp) {
        if (!tp) {
            return std::nullopt;
        }
        return util::format_iso8601(*tp);
    }

    Signal signal_from_row(const pqxx::row& row) {
        Signal signal;
        signal.id = row["id"].as<std::string>();
        signal.asset = row["asset"].as<std::string>();
        signal.timeframe = row["timeframe"].as<std::string>();
        signal.direction = trade_direction_from_string(row["direction"].as<std::string>());
        signal.entry_price = row["entry_price"].as<double>();
        signal.tp = row["tp"].as<double>();
        signal.sl = row["sl"].as<double>();
        signal.reward_risk_ratio = row["reward_risk_ratio"].as<double>();
        signal.raw_confidence = row["raw_confidence"].as<double>();
        signal.release_confidence = row["release_confidence"].as<double>();
        signal.state = signal_state_from_string(row["state"].as<std::string>());
        // Status is always derived so the two can never disagree
        signal.status = status_for(signal.state);
        signal.result = signal_result_from_string(row["result"].as<std::string>());
        signal.released = row["released"].as<bool>();
        signal.generated_at = util::parse_iso8601(row["generated_at"].as<std::string>());
        signal.entry_deadline = optional_time(row, "entry_deadline");
        signal.trade_deadline = optional_time(row, "trade_deadline");
        signal.entry_hit_at = optional_time(row, "entry_hit_at");
        signal.closed_at = optional_time(row, "closed_at");
        signal.acknowledged_at = optional_time(row, "acknowledged_at");
        return signal;
    }
}

class PostgresSignalStore::Impl {
public:
    Impl(const Config& config)
        : config_(config), backoff_ms_(1000), retry_count_(0) {
        connect();
    }

    ~Impl() {
        disconnect();
    }

    std::vector<Signal> list_active() {
        std::lock_guard<std::mutex> lock(mutex_);
        require_connection();

        pqxx::work txn(*conn_);
        pqxx::result result = txn.exec_params(
            fmt::format("SELECT {} FROM {} WHERE state NOT IN ($1, $2, $3, $4) ORDER BY generated_at",
                        signal_columns(), config_.table_signals),
            to_string(SignalState::TpHit), to_string(SignalState::SlHit),
            to_string(SignalState::Expired), to_string(SignalState::Cancelled)
        );
        txn.commit();

        std::vector<Signal> signals;
        for (const auto& row : result) {
            try {
                signals.push_back(signal_from_row(row));
            } catch (const std::exception& e) {
                spdlog::error("Skipping unreadable signal row {}: {}", row["id"].c_str(), e.what());
            }
        }
        return signals;
    }

    void insert_signal(const Signal& signal) {
        // Rejected before it can reach the table
        validate_levels(signal);

        std::lock_guard<std::mutex> lock(mutex_);
        require_connection();

        pqxx::work txn(*conn_);
        txn.exec_params(
            fmt::format(
                "INSERT INTO {} (id, asset, timeframe, direction, entry_price, tp, sl, reward_risk_ratio, "
                "raw_confidence, release_confidence, state, status, result, released, generated_at, "
                "entry_deadline, trade_deadline) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, $15::timestamptz, "
                "$16::timestamptz, $17::timestamptz)",
                config_.table_signals),
            signal.id, signal.asset, signal.timeframe, to_string(signal.direction),
            signal.entry_price, signal.tp, signal.sl, signal.reward_risk_ratio,
            signal.raw_confidence, signal.release_confidence,
            to_string(signal.state), to_string(status_for(signal.state)), to_string(signal.result),
            signal.released, util::format_iso8601(signal.generated_at),
            optional_iso(signal.entry_deadline), optional_iso(signal.trade_deadline)
        );
        txn.commit();
    }

    bool apply_transition(const StateTransition& transition) {
        validate_transition(transition.expected_state, transition.new_state);

        std::lock_guard<std::mutex> lock(mutex_);
        require_connection();

        pqxx::work txn(*conn_);

        // Optimistic guard: only rows still in the expected state move
        pqxx::result updated = txn.exec_params(
            fmt::format(
                "UPDATE {} SET state = $3, status = $4, result = $5, "
                "entry_hit_at = COALESCE($6::timestamptz, entry_hit_at), "
                "closed_at = COALESCE($7::timestamptz, closed_at), "
                "released = released OR $8, updated_at = NOW() "
                "WHERE id = $1 AND state = $2",
                config_.table_signals),
            transition.signal_id, to_string(transition.expected_state),
            to_string(transition.new_state), to_string(status_for(transition.new_state)),
            to_string(transition.result), optional_iso(transition.entry_hit_at),
            optional_iso(transition.closed_at), transition.mark_released
        );

        if (updated.affected_rows() != 1) {
            txn.abort();
            return false;
        }

        const auto& event = transition.event;
        std::optional<std::string> candle_ts;
        std::optional<double> open, high, low, close;
        if (event.candle) {
            candle_ts = util::format_iso8601(event.candle->timestamp);
            open = event.candle->open;
            high = event.candle->high;
            low = event.candle->low;
            close = event.candle->close;
        }

        txn.exec_params(
            fmt::format(
                "INSERT INTO {} (signal_id, from_state, to_state, kind, reason, candle_ts, "
                "candle_open, candle_high, candle_low, candle_close, observed_at) "
                "VALUES ($1, $2, $3, $4, $5, $6::timestamptz, $7, $8, $9, $10, $11::timestamptz)",
                config_.table_validation),
            event.signal_id, to_string(event.from_state), to_string(event.to_state),
            to_string(event.kind), event.reason, candle_ts, open, high, low, close,
            util::format_iso8601(event.observed_at)
        );

        txn.commit();
        return true;
    }

    void record_heartbeat(const Heartbeat& heartbeat) {
        std::lock_guard<std::mutex> lock(mutex_);
        require_connection();

        nlohmann::json prices = heartbeat.prices;

        pqxx::work txn(*conn_);
        txn.exec_params(
            fmt::format("INSERT INTO {} (service, status, active_signals, prices, recorded_at) "
                        "VALUES ($1, $2, $3, $4::jsonb, $5::timestamptz)",
                        config_.table_heartbeat),
            heartbeat.service, heartbeat.status, static_cast<long>(heartbeat.active_signals),
            prices.dump(), util::format_iso8601(heartbeat.recorded_at)
        );
        txn.commit();
    }

    std::vector<Signal> list_entered_signals(TimePoint since) {
        std::lock_guard<std::mutex> lock(mutex_);
        require_connection();

        pqxx::work txn(*conn_);
        pqxx::result result = txn.exec_params(
            fmt::format("SELECT {} FROM {} WHERE entry_hit_at IS NOT NULL AND entry_hit_at >= $1::timestamptz "
                        "ORDER BY entry_hit_at",
                        signal_columns(), config_.table_signals),
            util::format_iso8601(since)
        );
        txn.commit();

        std::vector<Signal> signals;
        for (const auto& row : result) {
            try {
                signals.push_back(signal_from_row(row));
            } catch (const std::exception& e) {
                spdlog::error("Skipping unreadable signal row {}: {}", row["id"].c_str(), e.what());
            }
        }
        return signals;
    }

    void upsert_outcome(const TradeOutcome& outcome) {
        std::lock_guard<std::mutex> lock(mutex_);
        require_connection();

        pqxx::work txn(*conn_);
        txn.exec_params(
            fmt::format("INSERT INTO {} (signal_id, outcome, r_multiple, duration_minutes, resolved_at) "
                        "VALUES ($1, $2, $3, $4, $5::timestamptz) "
                        "ON CONFLICT (signal_id) DO UPDATE SET outcome = EXCLUDED.outcome, "
                        "r_multiple = EXCLUDED.r_multiple, duration_minutes = EXCLUDED.duration_minutes, "
                        "resolved_at = EXCLUDED.resolved_at",
                        config_.table_outcomes),
            outcome.signal_id, outcome.outcome, outcome.r_multiple, outcome.duration_minutes,
            util::format_iso8601(outcome.resolved_at)
        );
        txn.commit();
    }

private:
    bool connect() {
        try {
            conn_ = std::make_unique<pqxx::connection>(config_.pg_dsn);
            if (conn_->is_open()) {
                spdlog::info("Connected to PostgreSQL database");
                backoff_ms_ = 1000;  // Reset backoff on successful connection
                retry_count_ = 0;
                return true;
            } else {
                spdlog::error("PostgreSQL connection is not open");
                return false;
            }
        } catch (const std::exception& e) {
            spdlog::error("Failed to connect to PostgreSQL: {}", e.what());
            return false;
        }
    }

    void disconnect() {
        if (conn_ && conn_->is_open()) {
            conn_->close();
            conn_.reset();
            spdlog::info("Disconnected from PostgreSQL database");
        }
    }

    bool is_connected() const {
        return conn_ && conn_->is_open();
    }

    bool ensure_connection() {
        if (is_connected()) {
            return true;
        }

        auto now = std::chrono::steady_clock::now();
        if (std::chrono::duration_cast<std::chrono::milliseconds>(
                now - last_connection_attempt_).count() < backoff_ms_) {
            return false;
        }

        last_connection_attempt_ = now;

        if (connect()) {
            spdlog::info("PostgreSQL connection restored");
            return true;
        }
        spdlog::warn("PostgreSQL reconnection failed (attempt {})", ++retry_count_);

        // Exponential backoff with cap
        backoff_ms_ = std::min(backoff_ms_ * 2, 30000);
        return false;
    }

    void require_connection() {
        if (!ensure_connection()) {
            throw std::runtime_error("PostgreSQL unavailable");
        }
    }

    const Config& config_;
    std::unique_ptr<pqxx::connection> conn_;
    std::mutex mutex_;

    // Reconnection logic
    std::chrono::steady_clock::time_point last_connection_attempt_ = std::chrono::steady_clock::now();
    int backoff_ms_;
    int retry_count_;
};

PostgresSignalStore::PostgresSignalStore(const Config& config) : impl_(std::make_unique<Impl>(config)) {}

PostgresSignalStore::~PostgresSignalStore() = default;

std::vector<Signal> PostgresSignalStore::list_active() {
    return impl_->list_active();
}

void PostgresSignalStore::insert_signal(const Signal& signal) {
    impl_->insert_signal(signal);
}

bool PostgresSignalStore::apply_transition(const StateTransition& transition) {
    return impl_->apply_transition(transition);
}

void PostgresSignalStore::record_heartbeat(const Heartbeat& heartbeat) {
    impl_->record_heartbeat(heartbeat);
}

std::vector<Signal> PostgresSignalStore::list_entered_signals(TimePoint since) {
    return impl_->list_entered_signals(since);
}

void PostgresSignalStore::upsert_outcome(const TradeOutcome& outcome) {
    impl_->upsert_outcome(outcome);
}
