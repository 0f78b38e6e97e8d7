#include "candle_client.hpp"
#include "backoff_manager.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <initializer_list>
#include <stdexcept>

std::string feed_datetime(TimePoint tp) {
    // "2024-03-04T10:15:00.000Z" -> "2024-03-04 10:15:00"
    std::string text = util::format_iso8601(tp).substr(0, 19);
    text[10] = ' ';
    return text;
}

std::string feed_interval(const std::string& timeframe) {
    const auto minutes = util::timeframe_duration(timeframe).count();
    switch (minutes) {
        case 1: return "1min";
        case 5: return "5min";
        case 15: return "15min";
        case 30: return "30min";
        case 60: return "1h";
        case 240: return "4h";
        case 1440: return "1day";
        case 10080: return "1week";
        default:
            throw std::invalid_argument("No feed interval for timeframe " + timeframe);
    }
}

class CandleClient::Impl {
public:
    explicit Impl(const Config& config)
        : config_(config),
          backoff_(config.feed_backoff_base_seconds, config.feed_backoff_max_seconds) {}

    std::vector<Candle> fetch_candles(const std::string& asset, const std::string& timeframe, int lookback) {
        return fetch_series(asset, timeframe, {{"outputsize", std::to_string(lookback)}});
    }

    std::vector<Candle> fetch_candle_range(const std::string& asset, const std::string& timeframe,
                                           TimePoint start, TimePoint end) {
        if (end <= start) {
            return {};
        }

        // Upper bound on rows so the vendor default of 30 never truncates the range
        const long long bars = util::bars_between(timeframe, start, end) + 1;
        auto candles = fetch_series(asset, timeframe, {
            {"start_date", feed_datetime(start)},
            {"end_date", feed_datetime(end)},
            {"outputsize", std::to_string(std::min<long long>(bars, kMaxOutputSize))}
        });

        candles.erase(std::remove_if(candles.begin(), candles.end(), [&](const Candle& candle) {
            return candle.timestamp < start || candle.timestamp >= end;
        }), candles.end());
        return candles;
    }

    double fetch_latest_price(const std::string& asset) {
        const std::string endpoint = "price:" + asset;
        guard(endpoint);

        auto payload = get_json(endpoint, config_.feed_base_url + "/price", cpr::Parameters{
            {"symbol", asset},
            {"apikey", config_.feed_api_key}
        });

        try {
            const auto& price = payload.at("price");
            double value = price.is_string() ? std::stod(price.get<std::string>()) : price.get<double>();
            backoff_.record_success(endpoint);
            return value;
        } catch (const std::exception& e) {
            backoff_.record_failure(endpoint);
            throw FeedUnavailable(fmt::format("Invalid price payload for {}: {}", asset, e.what()));
        }
    }

private:
    static constexpr long long kMaxOutputSize = 5000;

    std::vector<Candle> fetch_series(const std::string& asset, const std::string& timeframe,
                                     std::initializer_list<cpr::Parameter> window) {
        const std::string endpoint = "time_series:" + asset + ":" + timeframe;
        guard(endpoint);

        cpr::Parameters parameters{
            {"symbol", asset},
            {"interval", feed_interval(timeframe)},
            {"timezone", "UTC"},
            {"apikey", config_.feed_api_key}
        };
        for (const auto& parameter : window) {
            parameters.Add(parameter);
        }

        auto payload = get_json(endpoint, config_.feed_base_url + "/time_series", std::move(parameters));

        if (!payload.contains("values") || !payload["values"].is_array()) {
            backoff_.record_failure(endpoint);
            throw FeedUnavailable(fmt::format("No candle values for {} {}", asset, timeframe));
        }

        std::vector<Candle> candles;
        for (const auto& item : payload["values"]) {
            auto candle = Candle::from_json(item);
            if (!candle) {
                spdlog::warn("Dropping unparseable {} candle: {}", asset, item.dump());
                continue;
            }
            candles.push_back(*candle);
        }

        // API returns newest first
        std::reverse(candles.begin(), candles.end());

        backoff_.record_success(endpoint);
        spdlog::debug("Fetched {} {} candles for {}", candles.size(), timeframe, asset);
        return candles;
    }

    void guard(const std::string& endpoint) {
        if (backoff_.should_wait(endpoint)) {
            throw FeedUnavailable(fmt::format("Feed endpoint {} backing off for {}ms",
                                              endpoint, backoff_.time_until_allowed(endpoint).count()));
        }
    }

    nlohmann::json get_json(const std::string& endpoint, const std::string& url, cpr::Parameters parameters) {
        auto response = cpr::Get(
            cpr::Url{url},
            parameters,
            cpr::Timeout{config_.feed_timeout_ms},
            cpr::Header{{"User-Agent", "Quantix-Watcher/1.0"}}
        );

        if (response.error) {
            backoff_.record_failure(endpoint);
            throw FeedUnavailable(fmt::format("Request to {} failed: {}", endpoint, response.error.message));
        }

        if (response.status_code != 200) {
            backoff_.record_failure(endpoint);
            throw FeedUnavailable(fmt::format("Request to {} returned status {}", endpoint, response.status_code));
        }

        nlohmann::json payload;
        try {
            payload = nlohmann::json::parse(response.text);
        } catch (const nlohmann::json::parse_error& e) {
            backoff_.record_failure(endpoint);
            throw FeedUnavailable(fmt::format("Invalid JSON from {}: {}", endpoint, e.what()));
        }

        // API-level errors come back as 200 with {"status": "error"}
        if (payload.value("status", std::string("ok")) == "error") {
            backoff_.record_failure(endpoint);
            throw FeedUnavailable(fmt::format("Feed error from {}: {}", endpoint,
                                              payload.value("message", std::string("unknown error"))));
        }

        return payload;
    }

    const Config& config_;
    BackoffManager backoff_;
};

CandleClient::CandleClient(const Config& config) : impl_(std::make_unique<Impl>(config)) {}

CandleClient::~CandleClient() = default;

std::vector<Candle> CandleClient::fetch_candles(const std::string& asset, const std::string& timeframe, int lookback) {
    return impl_->fetch_candles(asset, timeframe, lookback);
}

std::vector<Candle> CandleClient::fetch_candle_range(const std::string& asset, const std::string& timeframe,
                                                     TimePoint start, TimePoint end) {
    return impl_->fetch_candle_range(asset, timeframe, start, end);
}

double CandleClient::fetch_latest_price(const std::string& asset) {
    return impl_->fetch_latest_price(asset);
}
