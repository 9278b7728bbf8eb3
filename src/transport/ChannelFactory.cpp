#include "fedlink/transport/ChannelFactory.hpp"

#include "fedlink/Errors.hpp"

#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>
#include <grpcpp/support/channel_arguments.h>

#include <fstream>
#include <iterator>
#include <system_error>

namespace fedlink::transport {

namespace {

grpc::ChannelArguments make_arguments(const ChannelSettings& settings) {
    grpc::ChannelArguments arguments;
    arguments.SetInt("grpc.max_metadata_size", settings.max_metadata_size);
    arguments.SetMaxSendMessageSize(settings.max_send_message_length);
    arguments.SetMaxReceiveMessageSize(settings.max_receive_message_length);
    return arguments;
}

}  // namespace

ChannelFactory::ChannelFactory(ChannelSettings settings, std::shared_ptr<logging::EventLog> log)
    : settings_(settings), log_(std::move(log)) {}

std::shared_ptr<grpc::Channel> ChannelFactory::open(const Endpoint& endpoint, const SecurityConfig& security) const {
    const auto target = endpoint.target();
    if (!security.tls) {
        log_->log(logging::Level::Warning,
                  "transport.channel.insecure",
                  {{"target", target}, {"message", "gRPC is running on an insecure channel with TLS disabled"}});
        return open_insecure(target);
    }
    return open_tls(target, security);
}

std::string ChannelFactory::read_credential(const CredentialSource& source, std::string_view label) {
    if (source.pem.has_value()) {
        if (source.pem->empty()) {
            throw TransportConfigError(std::string(label) + " is empty");
        }
        return *source.pem;
    }
    if (!source.path.has_value()) {
        throw TransportConfigError(std::string(label) + " is required in TLS mode",
                                   "Set tls." + std::string(label) + " in the client profile");
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(*source.path, ec)) {
        throw TransportConfigError("Cannot read " + std::string(label) + ": " + source.describe(),
                                   "Check that the file exists and is readable");
    }

    std::ifstream stream(*source.path, std::ios::binary);
    if (!stream) {
        throw TransportConfigError("Cannot open " + std::string(label) + ": " + source.describe());
    }
    std::string contents((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
    if (stream.bad()) {
        throw TransportConfigError("Failed while reading " + std::string(label) + ": " + source.describe());
    }
    if (contents.empty()) {
        throw TransportConfigError(std::string(label) + " is empty: " + source.describe());
    }
    return contents;
}

void ChannelFactory::validate(const SecurityConfig& security) {
    if (!security.tls) {
        return;
    }
    if (!security.root_certificate.present()) {
        throw TransportConfigError("root_certificate is required in TLS mode",
                                   "Set tls.root_certificate or disable TLS with --insecure");
    }
    if (!security.disable_client_auth) {
        if (!security.certificate.present() || !security.private_key.present()) {
            throw TransportConfigError("certificate and private_key are both required for mutual TLS",
                                       "Provide both files or set tls.disable_client_auth");
        }
    }
}

std::shared_ptr<grpc::Channel> ChannelFactory::open_insecure(const std::string& target) const {
    return grpc::CreateCustomChannel(target, grpc::InsecureChannelCredentials(), make_arguments(settings_));
}

std::shared_ptr<grpc::Channel> ChannelFactory::open_tls(const std::string& target,
                                                        const SecurityConfig& security) const {
    validate(security);

    grpc::SslCredentialsOptions options;
    options.pem_root_certs = read_credential(security.root_certificate, "root_certificate");

    if (security.disable_client_auth) {
        log_->log(logging::Level::Warning,
                  "transport.client_auth.disabled",
                  {{"target", target}, {"message", "Client-side authentication is disabled"}});
    } else {
        options.pem_private_key = read_credential(security.private_key, "private_key");
        options.pem_cert_chain = read_credential(security.certificate, "certificate");
    }

    auto credentials = grpc::SslCredentials(options);
    if (!credentials) {
        throw TransportConfigError("Failed to build TLS credentials for " + target);
    }
    return grpc::CreateCustomChannel(target, credentials, make_arguments(settings_));
}

}  // namespace fedlink::transport
