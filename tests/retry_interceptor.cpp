#include "fedlink/transport/RetryInterceptor.hpp"
#include "fedlink/v1/base.pb.h"
#include "test_support.hpp"

#include <cassert>
#include <chrono>
#include <deque>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace {

using fedlink::test::CountingBackoff;
using fedlink::test::RecordingLog;
using fedlink::transport::RetryInterceptor;
using fedlink::transport::RetryPolicy;

// Returns the scripted statuses in order, then OK.
class Script {
public:
    explicit Script(std::deque<grpc::StatusCode> codes) : codes_(std::move(codes)) {}

    grpc::Status next() {
        ++calls;
        if (codes_.empty()) {
            return grpc::Status::OK;
        }
        const auto code = codes_.front();
        codes_.pop_front();
        return grpc::Status(code, "scripted");
    }

    std::size_t calls{0};

private:
    std::deque<grpc::StatusCode> codes_;
};

class RecordingWriter final : public grpc::ClientWriterInterface<fedlink::v1::DataStream> {
public:
    RecordingWriter(std::vector<std::string>& sink, grpc::Status result) : sink_(sink), result_(std::move(result)) {}

    bool Write(const fedlink::v1::DataStream& frame, grpc::WriteOptions) override {
        current_.append(frame.npbytes());
        return true;
    }

    bool WritesDone() override {
        sink_.push_back(current_);
        return true;
    }

    grpc::Status Finish() override { return result_; }

private:
    std::vector<std::string>& sink_;
    grpc::Status result_;
    std::string current_;
};

void test_retryable_failures_wait_once_each() {
    auto log = std::make_shared<RecordingLog>();
    auto backoff = std::make_shared<CountingBackoff>();
    RetryInterceptor retry(RetryPolicy{}, backoff, log);

    Script script({grpc::StatusCode::UNAVAILABLE, grpc::StatusCode::UNAVAILABLE, grpc::StatusCode::UNAVAILABLE});
    const auto status = retry.invoke_unary([&](grpc::ClientContext&) { return script.next(); });
    assert(status.ok());
    assert(script.calls == 4);
    assert(backoff->waits == 3);
    assert(backoff->resets == 1);
    assert(log->count("transport.response.status") == 3);

    const auto entry = log->last("transport.response.status");
    assert(entry.has_value());
    assert(RecordingLog::field(*entry, "code") == "UNAVAILABLE");
    assert(RecordingLog::field(*entry, "attempt") == "3");
}

void test_non_retryable_returns_immediately() {
    auto log = std::make_shared<RecordingLog>();
    auto backoff = std::make_shared<CountingBackoff>();
    RetryInterceptor retry(RetryPolicy{}, backoff, log);

    Script script({grpc::StatusCode::PERMISSION_DENIED});
    const auto status = retry.invoke_unary([&](grpc::ClientContext&) { return script.next(); });
    assert(status.error_code() == grpc::StatusCode::PERMISSION_DENIED);
    assert(script.calls == 1);
    assert(backoff->waits == 0);
}

void test_authentication_is_never_retryable() {
    RetryPolicy policy{};
    policy.retryable = {grpc::StatusCode::UNAUTHENTICATED, grpc::StatusCode::UNAVAILABLE};
    assert(!policy.should_retry(grpc::StatusCode::UNAUTHENTICATED));
    assert(policy.should_retry(grpc::StatusCode::UNAVAILABLE));

    policy.retryable.clear();
    assert(!policy.should_retry(grpc::StatusCode::UNAUTHENTICATED));
    assert(!policy.should_retry(grpc::StatusCode::OK));
    assert(policy.should_retry(grpc::StatusCode::INTERNAL));
    assert(policy.should_retry(grpc::StatusCode::UNKNOWN));
}

void test_attempt_cap() {
    auto log = std::make_shared<RecordingLog>();
    auto backoff = std::make_shared<CountingBackoff>();
    RetryPolicy policy{};
    policy.max_attempts = 2;
    RetryInterceptor retry(policy, backoff, log);

    Script script({grpc::StatusCode::UNAVAILABLE, grpc::StatusCode::UNAVAILABLE, grpc::StatusCode::UNAVAILABLE});
    const auto status = retry.invoke_unary([&](grpc::ClientContext&) { return script.next(); });
    assert(status.error_code() == grpc::StatusCode::UNAVAILABLE);
    assert(script.calls == 2);
    assert(backoff->waits == 1);

    const auto exhausted = log->last("transport.retry.exhausted");
    assert(exhausted.has_value());
    assert(RecordingLog::field(*exhausted, "reason") == "attempt_limit");
}

void test_deadline() {
    auto log = std::make_shared<RecordingLog>();
    auto backoff = std::make_shared<CountingBackoff>();
    RetryPolicy policy{};
    policy.deadline = std::chrono::milliseconds(0);
    RetryInterceptor retry(policy, backoff, log);

    Script script({grpc::StatusCode::UNAVAILABLE});
    const auto status = retry.invoke_unary([&](grpc::ClientContext&) { return script.next(); });
    assert(status.error_code() == grpc::StatusCode::UNAVAILABLE);
    assert(script.calls == 1);
    assert(backoff->waits == 0);

    const auto exhausted = log->last("transport.retry.exhausted");
    assert(exhausted.has_value());
    assert(RecordingLog::field(*exhausted, "reason") == "deadline");
}

void test_streamed_attempts_replay_every_frame() {
    auto log = std::make_shared<RecordingLog>();
    auto backoff = std::make_shared<CountingBackoff>();
    RetryInterceptor retry(RetryPolicy{}, backoff, log);

    std::vector<fedlink::v1::DataStream> frames(3);
    frames[0].set_npbytes("ab");
    frames[1].set_npbytes("cd");
    frames[2].set_npbytes("e");

    std::vector<std::string> uploads;
    std::deque<grpc::Status> results{grpc::Status(grpc::StatusCode::UNAVAILABLE, "busy"), grpc::Status::OK};
    const auto status = retry.invoke_streamed<fedlink::v1::DataStream>(
        [&](grpc::ClientContext&) {
            auto result = results.front();
            results.pop_front();
            return std::make_unique<RecordingWriter>(uploads, result);
        },
        frames);

    assert(status.ok());
    assert((uploads == std::vector<std::string>{"abcde", "abcde"}));
    assert(backoff->waits == 1);
}

}  // namespace

int main() {
    test_retryable_failures_wait_once_each();
    test_non_retryable_returns_immediately();
    test_authentication_is_never_retryable();
    test_attempt_cap();
    test_deadline();
    test_streamed_attempts_replay_every_frame();
    return 0;
}
