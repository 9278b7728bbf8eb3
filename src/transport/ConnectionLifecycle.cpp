#include "fedlink/transport/ConnectionLifecycle.hpp"

#include <string>

namespace fedlink::transport {

ConnectionLifecycle::ConnectionLifecycle(std::string target,
                                         Opener opener,
                                         std::shared_ptr<logging::EventLog> log)
    : target_(std::move(target)), opener_(std::move(opener)), log_(std::move(log)) {
    channel_ = opener_();
    ++generation_;
}

ConnectionLifecycle::~ConnectionLifecycle() {
    channel_.reset();
}

void ConnectionLifecycle::reconnect() {
    std::scoped_lock lock(mutex_);
    reconnect_locked();
}

void ConnectionLifecycle::disconnect() {
    std::scoped_lock lock(mutex_);
    disconnect_locked();
}

bool ConnectionLifecycle::connected() const {
    std::scoped_lock lock(mutex_);
    return channel_ != nullptr;
}

std::uint64_t ConnectionLifecycle::generation() const {
    std::scoped_lock lock(mutex_);
    return generation_;
}

void ConnectionLifecycle::reconnect_locked() {
    disconnect_locked();
    channel_ = opener_();
    ++generation_;
    log_->log(logging::Level::Debug,
              "transport.connect",
              {{"target", target_}, {"generation", std::to_string(generation_)}});
}

void ConnectionLifecycle::disconnect_locked() {
    if (!channel_) {
        return;
    }
    // Released before logging so a failing logger cannot leak the channel.
    channel_.reset();
    log_->log(logging::Level::Debug, "transport.disconnect", {{"target", target_}});
}

}  // namespace fedlink::transport
