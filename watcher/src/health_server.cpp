#include "health_server.hpp"
#include "structure_engine.hpp"
#include "confidence_refiner.hpp"
#include "util.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <thread>

class HealthServer::Impl {
public:
    Impl(const Config& config, const WatcherHealth& health)
        : config_(config), health_(health), running_(false) {
        server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            const auto now = std::chrono::system_clock::now();
            nlohmann::json health_status;
            health_status["service"] = config_.service_name;
            health_status["timestamp"] = util::current_iso8601();
            health_status["watcher"] = health_.to_json(now, config_.stall_threshold());

            if (health_.is_stalled(now, config_.stall_threshold())) {
                health_status["status"] = "unhealthy";
                res.status = 503;
            } else {
                health_status["status"] = "healthy";
                res.status = 200;
            }

            res.set_content(health_status.dump(2), "application/json");
        });

        server_.Get("/structure/health", [this](const httplib::Request&, httplib::Response& res) {
            nlohmann::json report;
            report["service"] = config_.service_name;
            report["structure_engine"] = StructureEngine::version();
            report["confidence_refiner"] = ConfidenceRefiner::version();
            report["deterministic"] = true;
            report["ml_components"] = false;
            report["sensitivity"] = config_.structure_sensitivity;
            report["min_window"] = config_.structure_min_window;
            res.status = 200;
            res.set_content(report.dump(2), "application/json");
        });
    }

    ~Impl() {
        stop();
    }

    void start() {
        if (running_) {
            return;
        }
        running_ = true;
        server_thread_ = std::thread([this]() {
            spdlog::info("Health check server starting on {}:{}", config_.health_host, config_.health_port);
            if (!server_.listen(config_.health_host.c_str(), config_.health_port)) {
                spdlog::error("Health check server failed to listen on {}:{}",
                              config_.health_host, config_.health_port);
            }
        });
    }

    void stop() {
        if (running_) {
            running_ = false;
            server_.stop();
            if (server_thread_.joinable()) {
                server_thread_.join();
            }
            spdlog::info("Health check server stopped");
        }
    }

private:
    const Config& config_;
    const WatcherHealth& health_;
    httplib::Server server_;
    std::atomic<bool> running_;
    std::thread server_thread_;
};

HealthServer::HealthServer(const Config& config, const WatcherHealth& health)
    : pImpl_(std::make_unique<Impl>(config, health)) {}

HealthServer::~HealthServer() = default;

void HealthServer::start() {
    pImpl_->start();
}

void HealthServer::stop() {
    pImpl_->stop();
}
