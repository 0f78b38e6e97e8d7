#include "types.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>

using namespace testing_support;

TEST(CandleTest, ConsistencyChecks) {
    const TimePoint t = at("2024-03-04T10:00:00Z");
    EXPECT_TRUE(make_candle(t, 1.1, 1.102, 1.099, 1.101).is_consistent());
    EXPECT_FALSE(make_candle(t, 1.1, 1.099, 1.098, 1.101).is_consistent());
    EXPECT_FALSE(make_candle(t, 1.1, 1.102, 1.1005, 1.101).is_consistent());
    EXPECT_FALSE(make_candle(t, 1.1, 1.102, 1.099, 1.101, -1.0).is_consistent());
    EXPECT_FALSE(make_candle(t, std::numeric_limits<double>::quiet_NaN(), 1.102, 1.099, 1.101).is_consistent());
}

TEST(CandleTest, FromJsonAcceptsVendorRows) {
    const auto candle = Candle::from_json(nlohmann::json{
        {"datetime", "2024-03-04 10:15:00"},
        {"open", "1.10010"}, {"high", "1.10050"}, {"low", "1.09990"}, {"close", "1.10020"}
    });
    ASSERT_TRUE(candle.has_value());
    EXPECT_EQ(candle->timestamp, at("2024-03-04T10:15:00Z"));
    EXPECT_DOUBLE_EQ(candle->high, 1.1005);
    EXPECT_DOUBLE_EQ(candle->volume, 0.0);

    EXPECT_FALSE(Candle::from_json(nlohmann::json{{"datetime", "2024-03-04 10:15:00"}}).has_value());
}

TEST(SignalStateTest, NamesParseBack) {
    for (auto state : {SignalState::Candidate, SignalState::WaitingForEntry, SignalState::EntryHit,
                       SignalState::TpHit, SignalState::SlHit, SignalState::Expired, SignalState::Cancelled}) {
        EXPECT_EQ(signal_state_from_string(to_string(state)), state);
    }
    EXPECT_EQ(signal_state_from_string("detected"), SignalState::Candidate);
    EXPECT_THROW(signal_state_from_string("OPEN"), std::invalid_argument);
    EXPECT_EQ(trade_direction_from_string("long"), TradeDirection::Buy);
    EXPECT_EQ(signal_result_from_string(""), SignalResult::None);
    EXPECT_EQ(signal_result_from_string("TIME_EXIT"), SignalResult::TimeExit);
}

TEST(SignalStateTest, StatusFollowsState) {
    EXPECT_EQ(status_for(SignalState::Candidate), SignalStatus::Active);
    EXPECT_EQ(status_for(SignalState::EntryHit), SignalStatus::Active);
    EXPECT_EQ(status_for(SignalState::TpHit), SignalStatus::Closed);
    EXPECT_EQ(status_for(SignalState::Cancelled), SignalStatus::Closed);
    EXPECT_EQ(status_for(SignalState::Expired), SignalStatus::Expired);

    EXPECT_FALSE(is_terminal(SignalState::EntryHit));
    EXPECT_TRUE(is_terminal(SignalState::SlHit));
    EXPECT_LT(state_rank(SignalState::WaitingForEntry), state_rank(SignalState::EntryHit));
    EXPECT_EQ(state_rank(SignalState::TpHit), state_rank(SignalState::Cancelled));
}

TEST(SignalTest, JsonRoundTripKeepsOptionalTimes) {
    auto signal = make_signal("sig-1", TradeDirection::Sell, 1.1000, 1.0980, 1.1015,
                              at("2024-03-04T10:00:00Z"), SignalState::EntryHit);
    signal.entry_hit_at = at("2024-03-04T10:15:00Z");
    signal.trade_deadline = at("2024-03-04T11:45:00Z");

    const auto copy = Signal::from_json(signal.to_json());
    EXPECT_EQ(copy.id, "sig-1");
    EXPECT_EQ(copy.direction, TradeDirection::Sell);
    EXPECT_EQ(copy.state, SignalState::EntryHit);
    EXPECT_TRUE(copy.entry_hit_at == signal.entry_hit_at);
    EXPECT_TRUE(copy.trade_deadline == signal.trade_deadline);
    EXPECT_FALSE(copy.closed_at.has_value());
    EXPECT_TRUE(copy.released);
}

TEST(SignalTest, StatusIsDerivedFromStateWhenParsing) {
    auto json = make_signal("sig-3", TradeDirection::Buy, 1.1000, 1.1020, 1.0985,
                            at("2024-03-04T10:00:00Z"), SignalState::TpHit).to_json();
    json["status"] = "ACTIVE";
    EXPECT_EQ(Signal::from_json(json).status, SignalStatus::Closed);

    json["state"] = "EXPIRED";
    json["status"] = "CLOSED";
    EXPECT_EQ(Signal::from_json(json).status, SignalStatus::Expired);

    json["state"] = "ENTRY_HIT";
    json.erase("status");
    EXPECT_EQ(Signal::from_json(json).status, SignalStatus::Active);
}

TEST(SignalNotificationTest, PayloadKeys) {
    const auto signal = make_signal("sig-2", TradeDirection::Buy, 1.1000, 1.1020, 1.0985,
                                    at("2024-03-04T10:00:00Z"));
    const auto json = SignalNotification::from_signal(signal, "WAITING_FOR_ENTRY",
                                                      at("2024-03-04T10:00:30Z")).to_json();
    EXPECT_EQ(json.at("signal_id"), "sig-2");
    EXPECT_EQ(json.at("direction"), "BUY");
    EXPECT_DOUBLE_EQ(json.at("entry").get<double>(), 1.1);
    EXPECT_EQ(json.at("new_state"), "WAITING_FOR_ENTRY");
    EXPECT_EQ(json.at("ts"), "2024-03-04T10:00:30.000Z");
}
