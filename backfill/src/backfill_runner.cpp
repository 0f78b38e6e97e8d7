#include "backfill_runner.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <vector>

BackfillRunner::BackfillRunner(const Config& config, SignalStore& store, CandleFeed& feed)
    : config_(config), store_(store), feed_(feed) {}

BackfillReport BackfillRunner::run(TimePoint since, TimePoint now) {
    BackfillReport report;
    const auto signals = store_.list_entered_signals(since);
    spdlog::info("Backfilling outcomes for {} entered signals since {}", signals.size(), util::format_iso8601(since));

    for (const auto& signal : signals) {
        report.processed++;
        try {
            auto outcome = replay(signal, now, report);
            if (!outcome) {
                continue;
            }

            store_.upsert_outcome(*outcome);
            report.upserted++;

            const auto live = live_outcome(signal);
            if (live && to_string(*live) != outcome->outcome) {
                report.disagreements++;
                spdlog::warn("Signal {} replays as {} but was closed live as {}",
                             signal.id, outcome->outcome, to_string(signal.state));
            }
        } catch (const FeedUnavailable& e) {
            report.feed_errors++;
            spdlog::warn("Feed unavailable for signal {} ({}): {}", signal.id, signal.asset, e.what());
        } catch (const std::exception& e) {
            report.failures++;
            spdlog::error("Failed to backfill signal {}: {}", signal.id, e.what());
        }
    }

    return report;
}

std::optional<TradeOutcome> BackfillRunner::replay(const Signal& signal, TimePoint now, BackfillReport& report) const {
    if (!signal.entry_hit_at) {
        return std::nullopt;
    }

    const TimePoint entered = *signal.entry_hit_at;
    const TimePoint deadline = signal.trade_deadline.value_or(entered + config_.trade_window());

    // One bar of margin before entry so the bar containing it is covered
    const TimePoint end = std::min(deadline, now);
    const auto candles = feed_.fetch_candle_range(signal.asset, signal.timeframe,
                                                  entered - util::timeframe_duration(signal.timeframe), end);

    // A replay that misses the start of the trade would invent an outcome
    if (candles.empty() || candles.front().timestamp > entered) {
        report.incomplete++;
        spdlog::warn("Candle history for signal {} does not cover entry at {}, outcome not written",
                     signal.id, util::format_iso8601(entered));
        return std::nullopt;
    }

    std::vector<Candle> window;
    for (const auto& candle : candles) {
        if (candle.timestamp >= entered && candle.timestamp < deadline) {
            window.push_back(candle);
        }
    }

    const Resolution resolution = resolver_.resolve(signal, window);
    if (resolution.skipped_candles > 0) {
        spdlog::warn("Skipped {} malformed candles replaying signal {}", resolution.skipped_candles, signal.id);
    }

    TradeOutcome outcome;
    outcome.signal_id = signal.id;
    outcome.outcome = to_string(resolution.outcome);
    outcome.r_multiple = OutcomeResolver::compute_r_multiple(resolution.outcome, signal);

    if (resolution.candle) {
        outcome.resolved_at = resolution.candle->timestamp;
    } else if (now >= deadline) {
        outcome.resolved_at = deadline;
    } else {
        report.pending++;
        return std::nullopt;
    }

    outcome.duration_minutes = static_cast<long>(
        std::chrono::duration_cast<std::chrono::minutes>(outcome.resolved_at - entered).count());

    spdlog::debug("Signal {} replayed as {} (R {:.2f}, {} min)",
                  signal.id, outcome.outcome, outcome.r_multiple, outcome.duration_minutes);
    return outcome;
}

std::optional<Outcome> BackfillRunner::live_outcome(const Signal& signal) {
    switch (signal.state) {
        case SignalState::TpHit: return Outcome::HitTp;
        case SignalState::SlHit: return Outcome::HitSl;
        case SignalState::Expired: return Outcome::Expired;
        default: return std::nullopt;
    }
}
