#pragma once

#include "fedlink/Config.hpp"
#include "fedlink/Types.hpp"
#include "fedlink/logging/StructuredLogger.hpp"

#include <grpcpp/channel.h>

#include <memory>
#include <string>
#include <string_view>

namespace fedlink::transport {

class ChannelFactory {
public:
    ChannelFactory(ChannelSettings settings, std::shared_ptr<logging::EventLog> log);

    // Throws TransportConfigError when TLS credential material is missing or unreadable.
    std::shared_ptr<grpc::Channel> open(const Endpoint& endpoint, const SecurityConfig& security) const;

    static std::string read_credential(const CredentialSource& source, std::string_view label);
    static void validate(const SecurityConfig& security);

private:
    std::shared_ptr<grpc::Channel> open_insecure(const std::string& target) const;
    std::shared_ptr<grpc::Channel> open_tls(const std::string& target, const SecurityConfig& security) const;

    ChannelSettings settings_;
    std::shared_ptr<logging::EventLog> log_;
};

}  // namespace fedlink::transport
