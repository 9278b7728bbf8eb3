#pragma once

#include "fedlink/logging/StructuredLogger.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace fedlink::transport {

using Sleeper = std::function<void(std::chrono::milliseconds)>;

Sleeper default_sleeper();

class BackoffPolicy {
public:
    virtual ~BackoffPolicy() = default;

    // Blocks the caller before the next attempt.
    virtual void wait() = 0;

    // Called once at the start of every retried invocation.
    virtual void reset() {}
};

class ConstantBackoff final : public BackoffPolicy {
public:
    ConstantBackoff(std::chrono::milliseconds interval,
                    std::string target,
                    std::shared_ptr<logging::EventLog> log,
                    Sleeper sleeper = default_sleeper());

    void wait() override;

    std::chrono::milliseconds interval() const noexcept { return interval_; }

private:
    std::chrono::milliseconds interval_;
    std::string target_;
    std::shared_ptr<logging::EventLog> log_;
    Sleeper sleeper_;
};

class ExponentialBackoff final : public BackoffPolicy {
public:
    ExponentialBackoff(std::chrono::milliseconds initial,
                       std::chrono::milliseconds maximum,
                       std::string target,
                       std::shared_ptr<logging::EventLog> log,
                       double multiplier = 2.0,
                       Sleeper sleeper = default_sleeper());

    void wait() override;
    void reset() override;

    std::chrono::milliseconds next_interval() const noexcept { return current_; }

private:
    std::chrono::milliseconds initial_;
    std::chrono::milliseconds maximum_;
    std::chrono::milliseconds current_;
    double multiplier_;
    std::string target_;
    std::shared_ptr<logging::EventLog> log_;
    Sleeper sleeper_;
};

}  // namespace fedlink::transport
