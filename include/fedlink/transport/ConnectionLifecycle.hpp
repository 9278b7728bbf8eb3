#pragma once

#include "fedlink/logging/StructuredLogger.hpp"

#include <grpcpp/channel.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <utility>

namespace fedlink::transport {

// Owns the client's only channel. Every run() executes on a freshly opened
// channel and closes it on the way out, whatever the body does.
class ConnectionLifecycle {
public:
    using Opener = std::function<std::shared_ptr<grpc::Channel>()>;

    ConnectionLifecycle(std::string target, Opener opener, std::shared_ptr<logging::EventLog> log);
    ~ConnectionLifecycle();

    ConnectionLifecycle(const ConnectionLifecycle&) = delete;
    ConnectionLifecycle& operator=(const ConnectionLifecycle&) = delete;

    void reconnect();
    void disconnect();

    [[nodiscard]] bool connected() const;
    // Number of channels opened so far; also logged with transport.connect.
    [[nodiscard]] std::uint64_t generation() const;

    template <typename Body>
    auto run(Body&& body) {
        using Result = std::invoke_result_t<Body, const std::shared_ptr<grpc::Channel>&>;
        std::scoped_lock lock(mutex_);
        reconnect_locked();
        try {
            if constexpr (std::is_void_v<Result>) {
                std::forward<Body>(body)(channel_);
                disconnect_locked();
            } else {
                Result result = std::forward<Body>(body)(channel_);
                disconnect_locked();
                return result;
            }
        } catch (...) {
            disconnect_locked();
            throw;
        }
    }

private:

    void reconnect_locked();
    void disconnect_locked();

    std::string target_;
    Opener opener_;
    std::shared_ptr<logging::EventLog> log_;

    mutable std::recursive_mutex mutex_;
    std::shared_ptr<grpc::Channel> channel_;
    std::uint64_t generation_{0};
};

}  // namespace fedlink::transport
