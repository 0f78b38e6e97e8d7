#include "signal_watcher.hpp"
#include "errors.hpp"
#include "signal_rules.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <atomic>
#include <mutex>
#include <set>
#include <thread>

namespace {
    StateTransition make_transition(
        const Signal& signal,
        SignalState new_state,
        SignalResult result,
        TransitionKind kind,
        const std::string& reason,
        const std::optional<Candle>& candle,
        TimePoint now
    ) {
        StateTransition transition;
        transition.signal_id = signal.id;
        transition.expected_state = signal.state;
        transition.new_state = new_state;
        transition.result = result;
        if (is_terminal(new_state)) {
            transition.closed_at = now;
        }

        transition.event.signal_id = signal.id;
        transition.event.from_state = signal.state;
        transition.event.to_state = new_state;
        transition.event.kind = kind;
        transition.event.reason = reason;
        transition.event.candle = candle;
        transition.event.observed_at = now;
        return transition;
    }

    std::optional<Candle> last_candle(const std::vector<Candle>& candles) {
        if (candles.empty()) {
            return std::nullopt;
        }
        return candles.back();
    }
}

TickReport& TickReport::operator+=(const TickReport& other) {
    checked += other.checked;
    transitions += other.transitions;
    published += other.published;
    cancelled += other.cancelled;
    feed_errors += other.feed_errors;
    malformed_candles += other.malformed_candles;
    failures += other.failures;
    return *this;
}

nlohmann::json TickReport::to_json() const {
    return {
        {"checked", checked},
        {"transitions", transitions},
        {"published", published},
        {"cancelled", cancelled},
        {"feed_errors", feed_errors},
        {"malformed_candles", malformed_candles},
        {"failures", failures}
    };
}

SignalLifecycleWatcher::SignalLifecycleWatcher(
    const Config& config,
    SignalStore& store,
    CandleFeed& feed,
    Notifier& notifier
) : config_(config), store_(store), feed_(feed), notifier_(notifier) {}

TickReport SignalLifecycleWatcher::tick(TimePoint now) {
    const auto signals = store_.list_active();
    TickReport report;

    const std::size_t workers = std::min(signals.size(),
                                         static_cast<std::size_t>(std::max(1, config_.thread_pool_size)));

    if (workers <= 1) {
        for (const auto& signal : signals) {
            process_signal(signal, now, report);
        }
    } else {
        // Workers pull the next unclaimed signal so one slow feed call holds up only its own worker
        std::atomic<std::size_t> next{0};
        std::mutex report_mutex;
        std::vector<std::thread> pool;
        pool.reserve(workers);

        for (std::size_t w = 0; w < workers; ++w) {
            pool.emplace_back([&]() {
                TickReport local;
                for (std::size_t i = next++; i < signals.size(); i = next++) {
                    process_signal(signals[i], now, local);
                }
                std::lock_guard<std::mutex> lock(report_mutex);
                report += local;
            });
        }

        for (auto& worker : pool) {
            worker.join();
        }
    }

    record_heartbeat(signals, now);

    spdlog::debug("Tick complete: {}", report.to_json().dump());
    return report;
}

void SignalLifecycleWatcher::process_signal(const Signal& signal, TimePoint now, TickReport& report) {
    report.checked++;

    try {
        std::optional<StateTransition> transition;

        if (signal.state == SignalState::Candidate) {
            transition = evaluate_release(signal, now);
        } else {
            try {
                const auto candles = feed_.fetch_candles(signal.asset, signal.timeframe, lookback_for(signal, now));
                transition = evaluate_market(signal, candles, now, report.malformed_candles);
            } catch (const FeedUnavailable& e) {
                // Retried on the next tick
                report.feed_errors++;
                spdlog::warn("Feed unavailable for signal {} ({}): {}", signal.id, signal.asset, e.what());
            }
        }

        // Market resolution always wins over reclamation in the same tick
        if (!transition) {
            transition = evaluate_zombie(signal, now);
        }

        if (transition) {
            apply(signal, *transition, now, report);
        }
    } catch (const std::exception& e) {
        report.failures++;
        spdlog::error("Failed to check signal {}: {}", signal.id, e.what());
    }
}

std::optional<StateTransition> SignalLifecycleWatcher::evaluate_release(const Signal& signal, TimePoint now) const {
    if (signal.state != SignalState::Candidate || signal.release_confidence < config_.min_release_score) {
        return std::nullopt;
    }

    auto transition = make_transition(
        signal, SignalState::WaitingForEntry, SignalResult::None, TransitionKind::Market,
        fmt::format("Release confidence {:.4f} cleared publish gate {:.2f}",
                    signal.release_confidence, config_.min_release_score),
        std::nullopt, now);
    transition.mark_released = true;
    return transition;
}

std::optional<StateTransition> SignalLifecycleWatcher::evaluate_market(
    const Signal& signal,
    const std::vector<Candle>& candles,
    TimePoint now,
    std::size_t& malformed
) const {
    const auto clean = sanitize(signal, candles, malformed);

    if (signal.state == SignalState::WaitingForEntry) {
        const TimePoint deadline = entry_deadline(signal);

        for (const auto& candle : clean) {
            if (candle.timestamp < signal.generated_at || candle.timestamp >= deadline) {
                continue;
            }
            if (entry_touched(signal, candle)) {
                auto transition = make_transition(
                    signal, SignalState::EntryHit, SignalResult::None, TransitionKind::Market,
                    fmt::format("Entry {:.5f} touched (low {:.5f}, high {:.5f})",
                                signal.entry_price, candle.low, candle.high),
                    candle, now);
                transition.entry_hit_at = candle.timestamp;
                return transition;
            }
        }

        if (now >= deadline) {
            return make_transition(
                signal, SignalState::Expired, SignalResult::Expired, TransitionKind::Market,
                fmt::format("Entry window closed at {} without touching {:.5f}",
                            util::format_iso8601(deadline), signal.entry_price),
                last_candle(clean), now);
        }
        return std::nullopt;
    }

    if (signal.state == SignalState::EntryHit) {
        const TimePoint entered = signal.entry_hit_at.value_or(signal.generated_at);
        const TimePoint deadline = trade_deadline(signal);

        // The entry candle itself is replayed: a candle touching entry and stop is a loss
        std::vector<Candle> window;
        for (const auto& candle : clean) {
            if (candle.timestamp >= entered && candle.timestamp < deadline) {
                window.push_back(candle);
            }
        }

        const Resolution resolution = resolver_.resolve(signal, window);
        if (resolution.outcome == Outcome::HitSl) {
            return make_transition(
                signal, SignalState::SlHit, SignalResult::Loss, TransitionKind::Market,
                fmt::format("Stop {:.5f} hit (low {:.5f}, high {:.5f})",
                            signal.sl, resolution.candle->low, resolution.candle->high),
                resolution.candle, now);
        }
        if (resolution.outcome == Outcome::HitTp) {
            return make_transition(
                signal, SignalState::TpHit, SignalResult::Profit, TransitionKind::Market,
                fmt::format("Target {:.5f} hit (low {:.5f}, high {:.5f})",
                            signal.tp, resolution.candle->low, resolution.candle->high),
                resolution.candle, now);
        }

        if (now >= deadline) {
            return make_transition(
                signal, SignalState::Expired, SignalResult::TimeExit, TransitionKind::Market,
                fmt::format("Trade window closed at {} with neither level touched",
                            util::format_iso8601(deadline)),
                last_candle(clean), now);
        }
    }

    return std::nullopt;
}

std::optional<StateTransition> SignalLifecycleWatcher::evaluate_zombie(const Signal& signal, TimePoint now) const {
    if (is_terminal(signal.state) || signal.acknowledged_at) {
        return std::nullopt;
    }
    if (now - signal.generated_at < config_.zombie_threshold()) {
        return std::nullopt;
    }
    // Past its market deadline the signal resolves on the next successful fetch instead
    if ((signal.state == SignalState::WaitingForEntry && now >= entry_deadline(signal)) ||
        (signal.state == SignalState::EntryHit && now >= trade_deadline(signal))) {
        return std::nullopt;
    }

    const StaleSignal stale(fmt::format("Signal {} unresolved {}h after generation", signal.id,
                                        std::chrono::duration_cast<std::chrono::hours>(now - signal.generated_at).count()));
    return make_transition(signal, SignalState::Cancelled, SignalResult::Cancelled,
                           TransitionKind::Administrative, stale.what(), std::nullopt, now);
}

TimePoint SignalLifecycleWatcher::entry_deadline(const Signal& signal) const {
    return signal.entry_deadline.value_or(signal.generated_at + config_.entry_window());
}

TimePoint SignalLifecycleWatcher::trade_deadline(const Signal& signal) const {
    if (signal.trade_deadline) {
        return *signal.trade_deadline;
    }
    return signal.entry_hit_at.value_or(signal.generated_at) + config_.trade_window();
}

void SignalLifecycleWatcher::apply(
    const Signal& signal,
    const StateTransition& transition,
    TimePoint now,
    TickReport& report
) {
    validate_transition(transition.expected_state, transition.new_state);

    if (!store_.apply_transition(transition)) {
        spdlog::info("Signal {} no longer in {}, transition to {} skipped",
                     signal.id, to_string(transition.expected_state), to_string(transition.new_state));
        return;
    }

    report.transitions++;
    if (transition.event.kind == TransitionKind::Administrative) {
        report.cancelled++;
        spdlog::warn("[zombie] Signal {} ({}) cancelled from {}: {}",
                     signal.id, signal.asset, to_string(transition.expected_state), transition.event.reason);
    } else {
        spdlog::info("Signal {} ({} {}) {} -> {}: {}",
                     signal.id, to_string(signal.direction), signal.asset,
                     to_string(transition.expected_state), to_string(transition.new_state),
                     transition.event.reason);
    }

    if (transition.mark_released) {
        notify(signal, transition.new_state, now, report, true);
    } else if (is_terminal(transition.new_state)) {
        notify(signal, transition.new_state, now, report, false);
    }
}

void SignalLifecycleWatcher::notify(
    const Signal& signal,
    SignalState new_state,
    TimePoint now,
    TickReport& report,
    bool release
) {
    const auto notification = SignalNotification::from_signal(signal, to_string(new_state), now);
    if (!notifier_.publish(notification)) {
        // State is already persisted; delivery is not retried
        spdlog::error("Failed to publish {} notification for signal {}", to_string(new_state), signal.id);
        return;
    }
    if (release) {
        report.published++;
    }
}

void SignalLifecycleWatcher::record_heartbeat(const std::vector<Signal>& signals, TimePoint now) {
    Heartbeat heartbeat;
    heartbeat.service = config_.service_name;
    heartbeat.status = "WATCHER_ONLINE";
    heartbeat.active_signals = signals.size();
    heartbeat.recorded_at = now;

    std::set<std::string> assets;
    for (const auto& signal : signals) {
        assets.insert(signal.asset);
    }

    for (const auto& asset : assets) {
        try {
            heartbeat.prices[asset] = feed_.fetch_latest_price(asset);
        } catch (const FeedUnavailable& e) {
            spdlog::warn("No latest price for {}: {}", asset, e.what());
        }
    }

    try {
        store_.record_heartbeat(heartbeat);
    } catch (const std::exception& e) {
        spdlog::error("Failed to record heartbeat: {}", e.what());
    }
}

int SignalLifecycleWatcher::lookback_for(const Signal& signal, TimePoint now) const {
    // Every bar since generation plus the one still forming
    const long long bars = util::bars_between(signal.timeframe, signal.generated_at, now) + 2;
    return static_cast<int>(std::min<long long>(bars, config_.max_lookback_candles));
}

std::vector<Candle> SignalLifecycleWatcher::sanitize(
    const Signal& signal,
    const std::vector<Candle>& candles,
    std::size_t& malformed
) const {
    std::vector<Candle> clean;
    clean.reserve(candles.size());

    for (const auto& candle : candles) {
        const bool ordered = clean.empty() || candle.timestamp > clean.back().timestamp;
        if (!candle.is_consistent() || !ordered) {
            malformed++;
            spdlog::warn("Skipping malformed candle at {} for signal {} ({})",
                         util::format_iso8601(candle.timestamp), signal.id, signal.asset);
            continue;
        }
        clean.push_back(candle);
    }

    return clean;
}
