#pragma once

#include "config.hpp"
#include "interfaces.hpp"
#include <memory>

// Notifier appending signal notifications to a Redis stream
// as {data: <json>, timestamp: <ms since epoch>}
class RedisBus : public Notifier {
public:
    explicit RedisBus(const Config& config);
    ~RedisBus() override;

    bool publish(const SignalNotification& notification) override;

    // Non-copyable
    RedisBus(const RedisBus&) = delete;
    RedisBus& operator=(const RedisBus&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};
