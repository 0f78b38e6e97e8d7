#pragma once

#include "config.hpp"
#include "interfaces.hpp"
#include <memory>

// CandleFeed over a TwelveData-style REST API:
//   GET {base}/time_series?symbol=EUR/USD&interval=15min&outputsize=N
//   GET {base}/time_series?symbol=EUR/USD&interval=15min&start_date=...&end_date=...
//   GET {base}/price?symbol=EUR/USD
// Rows arrive newest first and are returned oldest first.
class CandleClient : public CandleFeed {
public:
    explicit CandleClient(const Config& config);
    ~CandleClient() override;

    std::vector<Candle> fetch_candles(const std::string& asset, const std::string& timeframe,
                                      int lookback) override;
    std::vector<Candle> fetch_candle_range(const std::string& asset, const std::string& timeframe,
                                           TimePoint start, TimePoint end) override;
    double fetch_latest_price(const std::string& asset) override;

    // Non-copyable
    CandleClient(const CandleClient&) = delete;
    CandleClient& operator=(const CandleClient&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// "M15" -> "15min", "H4" -> "4h", "D1" -> "1day". Throws std::invalid_argument.
std::string feed_interval(const std::string& timeframe);

// Vendor query datetime in UTC, "2024-03-04 10:15:00"
std::string feed_datetime(TimePoint tp);
