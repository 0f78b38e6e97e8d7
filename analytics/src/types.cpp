#include "types.hpp"
#include "util.hpp"
#include <cmath>
#include <algorithm>
#include <stdexcept>

using json = nlohmann::json;

namespace {
    json optional_time(const std::optional<TimePoint>& tp) {
        return tp ? json(util::format_iso8601(*tp)) : json(nullptr);
    }

    std::optional<TimePoint> read_optional_time(const json& j, const char* key) {
        if (!j.contains(key) || j.at(key).is_null()) {
            return std::nullopt;
        }
        return util::parse_iso8601(j.at(key).get<std::string>());
    }

    // Feeds send prices either as numbers or as numeric strings
    double read_price(const json& j, const char* key) {
        const auto& v = j.at(key);
        if (v.is_string()) {
            return std::stod(v.get<std::string>());
        }
        return v.get<double>();
    }
}

bool Candle::is_consistent() const {
    if (!std::isfinite(open) || !std::isfinite(high) || !std::isfinite(low) ||
        !std::isfinite(close) || !std::isfinite(volume)) {
        return false;
    }
    if (low <= 0.0 || volume < 0.0) {
        return false;
    }
    return low <= std::min(open, close) && high >= std::max(open, close);
}

json Candle::to_json() const {
    return {
        {"timestamp", util::format_iso8601(timestamp)},
        {"open", open},
        {"high", high},
        {"low", low},
        {"close", close},
        {"volume", volume}
    };
}

std::optional<Candle> Candle::from_json(const json& j) {
    try {
        Candle candle;
        const char* ts_key = j.contains("timestamp") ? "timestamp" : "datetime";
        candle.timestamp = util::parse_iso8601(j.at(ts_key).get<std::string>());
        candle.open = read_price(j, "open");
        candle.high = read_price(j, "high");
        candle.low = read_price(j, "low");
        candle.close = read_price(j, "close");
        candle.volume = j.contains("volume") && !j.at("volume").is_null() ? read_price(j, "volume") : 0.0;
        return candle;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string to_string(StructureDirection direction) {
    switch (direction) {
        case StructureDirection::Bullish: return "bullish";
        case StructureDirection::Bearish: return "bearish";
        case StructureDirection::Ranging: return "ranging";
    }
    return "ranging";
}

json EvidenceItem::to_json() const {
    json j = {
        {"type", type},
        {"description", description}
    };
    if (direction) j["direction"] = to_string(*direction);
    if (price_level) j["price_level"] = *price_level;
    if (strength) j["strength"] = *strength;
    if (candle_index) j["candle_index"] = *candle_index;
    if (value) j["value"] = *value;
    return j;
}

json StructureState::to_json() const {
    json evidence_json = json::array();
    for (const auto& item : evidence) {
        evidence_json.push_back(item.to_json());
    }

    return {
        {"feature", "structure"},
        {"symbol", symbol},
        {"timeframe", timeframe},
        {"source", source},
        {"state", to_string(direction)},
        {"confidence", confidence},
        {"dominance_ratio", dominance_ratio},
        {"dominance", {{"bullish", bullish_score}, {"bearish", bearish_score}}},
        {"evidence", evidence_json},
        {"trace_id", trace_id},
        {"generated_at", util::format_iso8601(generated_at)}
    };
}

std::string to_string(TradeDirection direction) {
    return direction == TradeDirection::Buy ? "BUY" : "SELL";
}

std::string to_string(SignalState state) {
    switch (state) {
        case SignalState::Candidate: return "CANDIDATE";
        case SignalState::WaitingForEntry: return "WAITING_FOR_ENTRY";
        case SignalState::EntryHit: return "ENTRY_HIT";
        case SignalState::TpHit: return "TP_HIT";
        case SignalState::SlHit: return "SL_HIT";
        case SignalState::Expired: return "EXPIRED";
        case SignalState::Cancelled: return "CANCELLED";
    }
    return "CANDIDATE";
}

std::string to_string(SignalStatus status) {
    switch (status) {
        case SignalStatus::Active: return "ACTIVE";
        case SignalStatus::Closed: return "CLOSED";
        case SignalStatus::Expired: return "EXPIRED";
    }
    return "ACTIVE";
}

std::string to_string(SignalResult result) {
    switch (result) {
        case SignalResult::None: return "NONE";
        case SignalResult::Profit: return "PROFIT";
        case SignalResult::Loss: return "LOSS";
        case SignalResult::Expired: return "EXPIRED";
        case SignalResult::TimeExit: return "TIME_EXIT";
        case SignalResult::Cancelled: return "CANCELLED";
    }
    return "NONE";
}

std::string to_string(TransitionKind kind) {
    return kind == TransitionKind::Market ? "MARKET" : "ADMINISTRATIVE";
}

TradeDirection trade_direction_from_string(const std::string& name) {
    const std::string upper = util::to_upper(util::trim(name));
    if (upper == "BUY" || upper == "LONG") return TradeDirection::Buy;
    if (upper == "SELL" || upper == "SHORT") return TradeDirection::Sell;
    throw std::invalid_argument("Unknown trade direction: " + name);
}

SignalState signal_state_from_string(const std::string& name) {
    const std::string upper = util::to_upper(util::trim(name));
    // DETECTED is the generation path's name for a candidate
    if (upper == "CANDIDATE" || upper == "DETECTED") return SignalState::Candidate;
    if (upper == "WAITING_FOR_ENTRY") return SignalState::WaitingForEntry;
    if (upper == "ENTRY_HIT") return SignalState::EntryHit;
    if (upper == "TP_HIT") return SignalState::TpHit;
    if (upper == "SL_HIT") return SignalState::SlHit;
    if (upper == "EXPIRED") return SignalState::Expired;
    if (upper == "CANCELLED") return SignalState::Cancelled;
    throw std::invalid_argument("Unknown signal state: " + name);
}

SignalResult signal_result_from_string(const std::string& name) {
    const std::string upper = util::to_upper(util::trim(name));
    if (upper.empty() || upper == "NONE") return SignalResult::None;
    if (upper == "PROFIT") return SignalResult::Profit;
    if (upper == "LOSS") return SignalResult::Loss;
    if (upper == "EXPIRED") return SignalResult::Expired;
    if (upper == "TIME_EXIT") return SignalResult::TimeExit;
    if (upper == "CANCELLED") return SignalResult::Cancelled;
    throw std::invalid_argument("Unknown signal result: " + name);
}

bool is_terminal(SignalState state) {
    return state == SignalState::TpHit || state == SignalState::SlHit ||
           state == SignalState::Expired || state == SignalState::Cancelled;
}

int state_rank(SignalState state) {
    switch (state) {
        case SignalState::Candidate: return 0;
        case SignalState::WaitingForEntry: return 1;
        case SignalState::EntryHit: return 2;
        default: return 3;
    }
}

SignalStatus status_for(SignalState state) {
    if (!is_terminal(state)) {
        return SignalStatus::Active;
    }
    return state == SignalState::Expired ? SignalStatus::Expired : SignalStatus::Closed;
}

json Signal::to_json() const {
    return {
        {"id", id},
        {"asset", asset},
        {"timeframe", timeframe},
        {"direction", to_string(direction)},
        {"entry_price", entry_price},
        {"tp", tp},
        {"sl", sl},
        {"reward_risk_ratio", reward_risk_ratio},
        {"raw_confidence", raw_confidence},
        {"release_confidence", release_confidence},
        {"state", to_string(state)},
        {"status", to_string(status)},
        {"result", to_string(result)},
        {"generated_at", util::format_iso8601(generated_at)},
        {"entry_deadline", optional_time(entry_deadline)},
        {"trade_deadline", optional_time(trade_deadline)},
        {"entry_hit_at", optional_time(entry_hit_at)},
        {"closed_at", optional_time(closed_at)},
        {"acknowledged_at", optional_time(acknowledged_at)},
        {"released", released}
    };
}

Signal Signal::from_json(const json& j) {
    Signal signal;
    signal.id = j.at("id").get<std::string>();
    signal.asset = j.at("asset").get<std::string>();
    signal.timeframe = j.value("timeframe", signal.timeframe);
    signal.direction = trade_direction_from_string(j.at("direction").get<std::string>());
    signal.entry_price = j.at("entry_price").get<double>();
    signal.tp = j.at("tp").get<double>();
    signal.sl = j.at("sl").get<double>();
    signal.reward_risk_ratio = j.value("reward_risk_ratio", 0.0);
    signal.raw_confidence = j.value("raw_confidence", 0.0);
    signal.release_confidence = j.value("release_confidence", 0.0);
    signal.state = signal_state_from_string(j.value("state", std::string("CANDIDATE")));
    // Status follows state; a stored "status" is not read
    signal.status = status_for(signal.state);
    signal.result = signal_result_from_string(j.value("result", std::string("NONE")));
    signal.generated_at = util::parse_iso8601(j.at("generated_at").get<std::string>());
    signal.entry_deadline = read_optional_time(j, "entry_deadline");
    signal.trade_deadline = read_optional_time(j, "trade_deadline");
    signal.entry_hit_at = read_optional_time(j, "entry_hit_at");
    signal.closed_at = read_optional_time(j, "closed_at");
    signal.acknowledged_at = read_optional_time(j, "acknowledged_at");
    signal.released = j.value("released", false);
    return signal;
}

json ValidationEvent::to_json() const {
    return {
        {"signal_id", signal_id},
        {"from_state", to_string(from_state)},
        {"to_state", to_string(to_state)},
        {"kind", to_string(kind)},
        {"reason", reason},
        {"candle", candle ? candle->to_json() : json(nullptr)},
        {"observed_at", util::format_iso8601(observed_at)}
    };
}

SignalNotification SignalNotification::from_signal(const Signal& signal, const std::string& new_state,
                                                   TimePoint timestamp) {
    SignalNotification notification;
    notification.signal_id = signal.id;
    notification.asset = signal.asset;
    notification.direction = signal.direction;
    notification.entry_price = signal.entry_price;
    notification.tp = signal.tp;
    notification.sl = signal.sl;
    notification.release_confidence = signal.release_confidence;
    notification.new_state = new_state;
    notification.timestamp = timestamp;
    return notification;
}

json SignalNotification::to_json() const {
    return {
        {"signal_id", signal_id},
        {"asset", asset},
        {"direction", to_string(direction)},
        {"entry", entry_price},
        {"tp", tp},
        {"sl", sl},
        {"release_confidence", release_confidence},
        {"new_state", new_state},
        {"ts", util::format_iso8601(timestamp)}
    };
}
