#include "confidence_refiner.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace {
    constexpr const char* kRefinerVersion = "confidence-refiner/2.1.0";

    // Half-open [start, end); a band with start > end wraps past midnight
    bool in_band(int hour, int start, int end) {
        if (start <= end) {
            return hour >= start && hour < end;
        }
        return hour >= start || hour < end;
    }

    bool parse_field(const std::string& token, const std::string& key, double& target) {
        const std::string prefix = key + "=";
        if (token.compare(0, prefix.size(), prefix) != 0) {
            return false;
        }
        try {
            std::size_t consumed = 0;
            const std::string number = token.substr(prefix.size());
            target = std::stod(number, &consumed);
            return consumed == number.size();
        } catch (const std::exception&) {
            return false;
        }
    }
}

std::string RefinementBreakdown::to_string() const {
    return fmt::format("raw={:.4f};session={:.4f};volatility={:.4f};spread={:.4f}",
                       raw, session, volatility, spread);
}

std::optional<RefinementBreakdown> RefinementBreakdown::parse(const std::string& text) {
    std::vector<std::string> tokens;
    std::stringstream ss(text);
    std::string token;
    while (std::getline(ss, token, ';')) {
        tokens.push_back(util::trim(token));
    }
    if (tokens.size() != 4) {
        return std::nullopt;
    }

    RefinementBreakdown breakdown;
    if (!parse_field(tokens[0], "raw", breakdown.raw) ||
        !parse_field(tokens[1], "session", breakdown.session) ||
        !parse_field(tokens[2], "volatility", breakdown.volatility) ||
        !parse_field(tokens[3], "spread", breakdown.spread)) {
        return std::nullopt;
    }
    return breakdown;
}

ConfidenceRefiner::ConfidenceRefiner(const Config& config) : config_(config) {}

std::string ConfidenceRefiner::version() {
    return kRefinerVersion;
}

ReleaseScore ConfidenceRefiner::calculate_release_score(
    double raw_confidence,
    TimePoint now,
    const std::vector<Candle>& recent_candles
) const {
    if (std::isnan(raw_confidence)) {
        throw std::invalid_argument("Raw confidence is NaN");
    }

    ReleaseScore result;
    result.breakdown.raw = util::clamp01(raw_confidence);
    result.breakdown.session = session_weight(now);
    result.breakdown.volatility = volatility_factor(recent_candles);
    result.breakdown.spread = spread_factor(now);

    const double score = result.breakdown.raw * result.breakdown.session *
                         result.breakdown.volatility * result.breakdown.spread;
    result.score = util::round_to(util::clamp01(score), 4);
    result.explanation = result.breakdown.to_string();

    spdlog::debug("Release score {:.4f} ({})", result.score, result.explanation);
    return result;
}

double ConfidenceRefiner::session_weight(TimePoint now) const {
    return session_weight_for_hour(util::utc_hour(now));
}

double ConfidenceRefiner::session_weight_for_hour(int utc_hour) const {
    // London/New York overlap
    if (in_band(utc_hour, config_.overlap_start_hour, config_.london_close_hour)) {
        return config_.overlap_weight;
    }
    // London before New York opens
    if (in_band(utc_hour, config_.london_open_hour, config_.overlap_start_hour)) {
        return config_.primary_session_weight;
    }
    return config_.off_session_weight;
}

double ConfidenceRefiner::volatility_factor(const std::vector<Candle>& recent_candles) const {
    const std::size_t period = static_cast<std::size_t>(std::max(1, config_.atr_period));
    if (recent_candles.size() < period + 1) {
        return 1.0;
    }

    const std::size_t last = recent_candles.size() - 1;
    double total = 0.0;
    for (std::size_t i = last - period; i < last; ++i) {
        const Candle& candle = recent_candles[i];
        double true_range = candle.range();
        if (i > 0) {
            const double prev_close = recent_candles[i - 1].close;
            true_range = std::max({true_range,
                                   std::abs(candle.high - prev_close),
                                   std::abs(candle.low - prev_close)});
        }
        total += true_range;
    }

    const double baseline = total / static_cast<double>(period);
    if (baseline <= 0.0) {
        return 1.0;
    }

    const double ratio = recent_candles[last].range() / baseline;
    if (ratio < config_.volatility_low_ratio) {
        return config_.volatility_low_factor;
    }
    if (ratio > config_.volatility_high_ratio) {
        return config_.volatility_high_factor;
    }
    return 1.0;
}

double ConfidenceRefiner::spread_factor(TimePoint now) const {
    return spread_factor_for_hour(util::utc_hour(now));
}

double ConfidenceRefiner::spread_factor_for_hour(int utc_hour) const {
    if (in_band(utc_hour, config_.rollover_start_hour, config_.rollover_end_hour)) {
        return config_.spread_penalty;
    }
    return 1.0;
}

bool ConfidenceRefiner::is_publishable(double release_score) const {
    return release_score >= config_.min_release_score;
}
