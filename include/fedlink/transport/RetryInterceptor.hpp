#pragma once

#include "fedlink/logging/StructuredLogger.hpp"
#include "fedlink/transport/Backoff.hpp"

#include <grpcpp/client_context.h>
#include <grpcpp/support/status.h>
#include <grpcpp/support/sync_stream.h>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace fedlink::transport {

struct RetryPolicy {
    // Empty means every failure status is retried. UNAUTHENTICATED never is.
    std::set<grpc::StatusCode> retryable{grpc::StatusCode::UNAVAILABLE};
    std::optional<std::size_t> max_attempts{};
    std::optional<std::chrono::milliseconds> deadline{};

    bool should_retry(grpc::StatusCode code) const;
};

class RetryInterceptor {
public:
    using Attempt = std::function<grpc::Status(grpc::ClientContext&)>;

    template <typename Frame>
    using StreamOpener = std::function<std::unique_ptr<grpc::ClientWriterInterface<Frame>>(grpc::ClientContext&)>;

    RetryInterceptor(RetryPolicy policy,
                     std::shared_ptr<BackoffPolicy> backoff,
                     std::shared_ptr<logging::EventLog> log);

    grpc::Status invoke_unary(const Attempt& attempt) const;

    // Every attempt re-opens the stream and replays all frames.
    template <typename Frame>
    grpc::Status invoke_streamed(const StreamOpener<Frame>& open, const std::vector<Frame>& frames) const {
        return invoke_unary([&](grpc::ClientContext& context) {
            auto writer = open(context);
            for (const auto& frame : frames) {
                if (!writer->Write(frame)) {
                    break;
                }
            }
            writer->WritesDone();
            return writer->Finish();
        });
    }

    const RetryPolicy& policy() const noexcept { return policy_; }

private:
    RetryPolicy policy_;
    std::shared_ptr<BackoffPolicy> backoff_;
    std::shared_ptr<logging::EventLog> log_;
};

}  // namespace fedlink::transport
