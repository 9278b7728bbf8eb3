#pragma once

#include "fedlink/Types.hpp"

#include <grpcpp/support/status_code_enum.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>

namespace fedlink {

struct CredentialSource {
    std::optional<std::filesystem::path> path{};
    std::optional<std::string> pem{};

    static CredentialSource from_file(std::filesystem::path file);
    static CredentialSource from_pem(std::string bytes);

    bool present() const noexcept { return path.has_value() || pem.has_value(); }
    std::string describe() const;
};

struct SecurityConfig {
    bool tls{true};
    bool disable_client_auth{false};
    CredentialSource root_certificate{};
    CredentialSource certificate{};
    CredentialSource private_key{};
};

struct ChannelSettings {
    int max_metadata_size{32 * 1024 * 1024};
    int max_send_message_length{128 * 1024 * 1024};
    int max_receive_message_length{128 * 1024 * 1024};
};

struct ClientConfig {
    Endpoint aggregator{};
    SecurityConfig security{};
    ChannelSettings channel{};
    Identity identity{};

    std::chrono::milliseconds reconnect_interval{std::chrono::seconds(1)};
    // Empty means every failure status is retried.
    std::set<grpc::StatusCode> retryable_status_codes{grpc::StatusCode::UNAVAILABLE};
    std::optional<std::size_t> retry_attempt_limit{};
    std::optional<std::chrono::milliseconds> retry_deadline{};
    std::optional<std::size_t> resend_attempt_limit{};

    std::size_t stream_chunk_bytes{2ull * 1024ull * 1024ull};
};

}  // namespace fedlink
