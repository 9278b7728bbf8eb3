#include "fedlink/transport/Backoff.hpp"

#include <algorithm>
#include <thread>
#include <utility>

namespace fedlink::transport {

namespace {

void announce_attempt(logging::EventLog& log, const std::string& target, std::chrono::milliseconds interval) {
    log.log(logging::Level::Info,
            "transport.reconnect.attempt",
            {{"target", target}, {"interval_ms", std::to_string(interval.count())}});
}

}  // namespace

Sleeper default_sleeper() {
    return [](std::chrono::milliseconds duration) {
        if (duration.count() > 0) {
            std::this_thread::sleep_for(duration);
        }
    };
}

ConstantBackoff::ConstantBackoff(std::chrono::milliseconds interval,
                                 std::string target,
                                 std::shared_ptr<logging::EventLog> log,
                                 Sleeper sleeper)
    : interval_(interval),
      target_(std::move(target)),
      log_(std::move(log)),
      sleeper_(std::move(sleeper)) {}

void ConstantBackoff::wait() {
    announce_attempt(*log_, target_, interval_);
    sleeper_(interval_);
}

ExponentialBackoff::ExponentialBackoff(std::chrono::milliseconds initial,
                                       std::chrono::milliseconds maximum,
                                       std::string target,
                                       std::shared_ptr<logging::EventLog> log,
                                       double multiplier,
                                       Sleeper sleeper)
    : initial_(initial),
      maximum_(std::max(initial, maximum)),
      current_(initial),
      multiplier_(multiplier < 1.0 ? 1.0 : multiplier),
      target_(std::move(target)),
      log_(std::move(log)),
      sleeper_(std::move(sleeper)) {}

void ExponentialBackoff::wait() {
    const auto interval = current_;
    announce_attempt(*log_, target_, interval);
    sleeper_(interval);

    const auto scaled = static_cast<double>(current_.count()) * multiplier_;
    const auto capped = std::min(scaled, static_cast<double>(maximum_.count()));
    current_ = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(capped));
}

void ExponentialBackoff::reset() {
    current_ = initial_;
}

}  // namespace fedlink::transport
