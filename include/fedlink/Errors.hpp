#pragma once

#include <grpcpp/support/status_code_enum.h>

#include <exception>
#include <optional>
#include <string>
#include <string_view>

namespace fedlink {

class Error : public std::exception {
public:
    Error(std::string code, std::string message, std::string hint = {});

    const char* what() const noexcept override;

    const std::string& code() const& { return code_; }
    const std::string& message() const& { return message_; }
    const std::string& hint() const& { return hint_; }

private:
    std::string code_;
    std::string message_;
    std::string hint_;
    std::string formatted_;
};

// Credential material missing or unreadable, or an invalid security posture.
class TransportConfigError : public Error {
public:
    explicit TransportConfigError(std::string message, std::string hint = {});
};

// A non-OK gRPC status that reached the caller.
class TransportFailure : public Error {
public:
    TransportFailure(grpc::StatusCode status, std::string details);

    grpc::StatusCode status() const noexcept { return status_; }
    const std::string& details() const& { return details_; }

protected:
    TransportFailure(std::string code, grpc::StatusCode status, std::string details, std::string hint);

private:
    grpc::StatusCode status_;
    std::string details_;
};

class TransientTransportFailure : public TransportFailure {
public:
    TransientTransportFailure(grpc::StatusCode status, std::string details);
};

class AuthenticationFailure : public TransportFailure {
public:
    AuthenticationFailure(grpc::StatusCode status, std::string details);
};

class UnhandledTransportFailure : public TransportFailure {
public:
    UnhandledTransportFailure(grpc::StatusCode status, std::string details);
};

class HeaderMismatchError : public Error {
public:
    HeaderMismatchError(std::string field, std::string expected, std::string actual);

    const std::string& field() const& { return field_; }
    const std::string& expected() const& { return expected_; }
    const std::string& actual() const& { return actual_; }

private:
    std::string field_;
    std::string expected_;
    std::string actual_;
};

class ConfigError : public Error {
public:
    ConfigError(std::string code, std::string message, std::string hint = {});
};

class CodecError : public Error {
public:
    explicit CodecError(std::string message);
};

std::string status_code_name(grpc::StatusCode code);
std::optional<grpc::StatusCode> status_code_from_name(std::string_view name);

}  // namespace fedlink
