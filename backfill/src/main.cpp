#include "config.hpp"
#include "backfill_runner.hpp"
#include "pg_store.hpp"
#include "candle_client.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <chrono>
#include <memory>
#include <string>

namespace {
    void print_usage(const char* program) {
        spdlog::info("Usage: {} [config.json] [--since ISO8601]", program);
    }
}

int main(int argc, char* argv[]) {
    // Set up logger
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("outcome_backfill", console_sink);
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::info);
    spdlog::flush_on(spdlog::level::info);

    std::string config_path;
    std::string since_arg;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--since" && i + 1 < argc) {
            since_arg = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (config_path.empty() && arg.rfind("--", 0) != 0) {
            config_path = arg;
        } else {
            spdlog::error("Unexpected argument: {}", arg);
            print_usage(argv[0]);
            return 2;
        }
    }

    Config config;
    config.service_name = "outcome_backfill";
    try {
        if (!config_path.empty()) {
            config.load(config_path);
            spdlog::info("Configuration loaded from {}", config_path);
        }
        config.load_from_env();
        config.validate();
        spdlog::set_level(spdlog::level::from_str(config.log_level));
    } catch (const std::exception& e) {
        spdlog::critical("Failed to load configuration: {}", e.what());
        return 1;
    }

    const auto now = std::chrono::system_clock::now();
    auto since = now - std::chrono::hours(24 * 7);
    if (!since_arg.empty()) {
        try {
            since = util::parse_iso8601(since_arg);
        } catch (const std::exception& e) {
            spdlog::critical("Invalid --since value: {}", e.what());
            return 2;
        }
    }

    try {
        PostgresSignalStore store(config);
        CandleClient feed(config);
        BackfillRunner runner(config, store, feed);

        const BackfillReport report = runner.run(since, now);
        spdlog::info("Backfill complete: {} processed, {} upserted, {} pending, {} incomplete, "
                     "{} disagreements, {} feed errors, {} failures",
                     report.processed, report.upserted, report.pending, report.incomplete,
                     report.disagreements, report.feed_errors, report.failures);

        spdlog::shutdown();
        return report.failures > 0 ? 1 : 0;
    } catch (const std::exception& e) {
        spdlog::critical("Backfill aborted: {}", e.what());
        spdlog::shutdown();
        return 1;
    }
}
