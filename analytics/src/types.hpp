#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <nlohmann/json.hpp>

using TimePoint = std::chrono::system_clock::time_point;

// OHLCV candle as delivered by the candle feed
struct Candle {
    TimePoint timestamp;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;

    // low <= min(open, close), high >= max(open, close), finite prices, volume >= 0
    bool is_consistent() const;
    double range() const { return high - low; }

    nlohmann::json to_json() const;
    static std::optional<Candle> from_json(const nlohmann::json& j);
};

// Market structure
enum class StructureDirection {
    Bullish,
    Bearish,
    Ranging
};

std::string to_string(StructureDirection direction);

struct EvidenceItem {
    std::string type;
    std::string description;
    std::optional<StructureDirection> direction;
    std::optional<double> price_level;
    std::optional<double> strength;
    std::optional<std::size_t> candle_index;
    std::optional<double> value;

    nlohmann::json to_json() const;
};

struct StructureState {
    std::string symbol;
    std::string timeframe;
    std::string source;
    StructureDirection direction = StructureDirection::Ranging;
    double confidence = 0.0;
    double dominance_ratio = 0.0;
    double bullish_score = 0.0;
    double bearish_score = 0.0;
    std::vector<EvidenceItem> evidence;
    std::string trace_id;
    TimePoint generated_at;

    nlohmann::json to_json() const;
};

// Signals
enum class TradeDirection {
    Buy,
    Sell
};

enum class SignalState {
    Candidate,
    WaitingForEntry,
    EntryHit,
    TpHit,
    SlHit,
    Expired,
    Cancelled
};

enum class SignalStatus {
    Active,
    Closed,
    Expired
};

enum class SignalResult {
    None,
    Profit,
    Loss,
    Expired,
    TimeExit,
    Cancelled
};

std::string to_string(TradeDirection direction);
std::string to_string(SignalState state);
std::string to_string(SignalStatus status);
std::string to_string(SignalResult result);

// Parsers throw std::invalid_argument on unknown names
TradeDirection trade_direction_from_string(const std::string& name);
SignalState signal_state_from_string(const std::string& name);
SignalResult signal_result_from_string(const std::string& name);

bool is_terminal(SignalState state);

// Lifecycle progress rank. Transitions only ever increase it.
int state_rank(SignalState state);

// Operational bucket implied by a state
SignalStatus status_for(SignalState state);

struct Signal {
    std::string id;
    std::string asset;
    std::string timeframe = "M15";
    TradeDirection direction = TradeDirection::Buy;
    double entry_price = 0.0;
    double tp = 0.0;
    double sl = 0.0;
    double reward_risk_ratio = 0.0;
    double raw_confidence = 0.0;
    double release_confidence = 0.0;
    SignalState state = SignalState::Candidate;
    SignalStatus status = SignalStatus::Active;
    SignalResult result = SignalResult::None;
    TimePoint generated_at;
    std::optional<TimePoint> entry_deadline;
    std::optional<TimePoint> trade_deadline;
    std::optional<TimePoint> entry_hit_at;
    std::optional<TimePoint> closed_at;
    std::optional<TimePoint> acknowledged_at;
    bool released = false;

    nlohmann::json to_json() const;
    static Signal from_json(const nlohmann::json& j);
};

// Audit record written together with every state transition
enum class TransitionKind {
    Market,
    Administrative
};

std::string to_string(TransitionKind kind);

struct ValidationEvent {
    std::string signal_id;
    SignalState from_state = SignalState::Candidate;
    SignalState to_state = SignalState::Candidate;
    TransitionKind kind = TransitionKind::Market;
    std::string reason;
    std::optional<Candle> candle;
    TimePoint observed_at;

    nlohmann::json to_json() const;
};

// Conditional update: applied only while the stored state still equals expected_state
struct StateTransition {
    std::string signal_id;
    SignalState expected_state = SignalState::Candidate;
    SignalState new_state = SignalState::Candidate;
    SignalResult result = SignalResult::None;
    std::optional<TimePoint> entry_hit_at;
    std::optional<TimePoint> closed_at;
    bool mark_released = false;
    ValidationEvent event;
};

// Offline resolution record
struct TradeOutcome {
    std::string signal_id;
    std::string outcome;
    double r_multiple = 0.0;
    long duration_minutes = 0;
    TimePoint resolved_at;
};

// Payload sent on publish and on terminal transitions
struct SignalNotification {
    std::string signal_id;
    std::string asset;
    TradeDirection direction = TradeDirection::Buy;
    double entry_price = 0.0;
    double tp = 0.0;
    double sl = 0.0;
    double release_confidence = 0.0;
    std::string new_state;
    TimePoint timestamp;

    static SignalNotification from_signal(const Signal& signal, const std::string& new_state,
                                          TimePoint timestamp);
    nlohmann::json to_json() const;
};
