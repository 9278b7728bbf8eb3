#include "fedlink/transport/RetryInterceptor.hpp"

#include "fedlink/Errors.hpp"

#include <utility>

namespace fedlink::transport {

bool RetryPolicy::should_retry(grpc::StatusCode code) const {
    if (code == grpc::StatusCode::OK || code == grpc::StatusCode::UNAUTHENTICATED) {
        return false;
    }
    return retryable.empty() || retryable.contains(code);
}

RetryInterceptor::RetryInterceptor(RetryPolicy policy,
                                   std::shared_ptr<BackoffPolicy> backoff,
                                   std::shared_ptr<logging::EventLog> log)
    : policy_(std::move(policy)), backoff_(std::move(backoff)), log_(std::move(log)) {}

grpc::Status RetryInterceptor::invoke_unary(const Attempt& attempt) const {
    backoff_->reset();
    const auto started = std::chrono::steady_clock::now();
    std::size_t attempts = 0;

    while (true) {
        grpc::Status status;
        {
            // A ClientContext must not be reused across calls.
            grpc::ClientContext context;
            status = attempt(context);
        }
        ++attempts;

        if (status.ok()) {
            return status;
        }

        log_->log(logging::Level::Info,
                  "transport.response.status",
                  {{"code", status_code_name(status.error_code())}, {"attempt", std::to_string(attempts)}});

        if (!policy_.should_retry(status.error_code())) {
            return status;
        }

        const bool attempts_spent = policy_.max_attempts.has_value() && attempts >= *policy_.max_attempts;
        const bool deadline_passed = policy_.deadline.has_value() &&
                                     std::chrono::steady_clock::now() - started >= *policy_.deadline;
        if (attempts_spent || deadline_passed) {
            log_->log(logging::Level::Warning,
                      "transport.retry.exhausted",
                      {{"code", status_code_name(status.error_code())},
                       {"attempts", std::to_string(attempts)},
                       {"reason", attempts_spent ? "attempt_limit" : "deadline"}});
            return status;
        }

        backoff_->wait();
    }
}

}  // namespace fedlink::transport
