#include "fedlink/Errors.hpp"

#include <array>
#include <utility>

namespace fedlink {

namespace {

struct StatusName {
    grpc::StatusCode code;
    std::string_view name;
};

constexpr std::array<StatusName, 17> kStatusNames{{
    {grpc::StatusCode::OK, "OK"},
    {grpc::StatusCode::CANCELLED, "CANCELLED"},
    {grpc::StatusCode::UNKNOWN, "UNKNOWN"},
    {grpc::StatusCode::INVALID_ARGUMENT, "INVALID_ARGUMENT"},
    {grpc::StatusCode::DEADLINE_EXCEEDED, "DEADLINE_EXCEEDED"},
    {grpc::StatusCode::NOT_FOUND, "NOT_FOUND"},
    {grpc::StatusCode::ALREADY_EXISTS, "ALREADY_EXISTS"},
    {grpc::StatusCode::PERMISSION_DENIED, "PERMISSION_DENIED"},
    {grpc::StatusCode::RESOURCE_EXHAUSTED, "RESOURCE_EXHAUSTED"},
    {grpc::StatusCode::FAILED_PRECONDITION, "FAILED_PRECONDITION"},
    {grpc::StatusCode::ABORTED, "ABORTED"},
    {grpc::StatusCode::OUT_OF_RANGE, "OUT_OF_RANGE"},
    {grpc::StatusCode::UNIMPLEMENTED, "UNIMPLEMENTED"},
    {grpc::StatusCode::INTERNAL, "INTERNAL"},
    {grpc::StatusCode::UNAVAILABLE, "UNAVAILABLE"},
    {grpc::StatusCode::DATA_LOSS, "DATA_LOSS"},
    {grpc::StatusCode::UNAUTHENTICATED, "UNAUTHENTICATED"},
}};

std::string describe_status(grpc::StatusCode status, const std::string& details) {
    if (details.empty()) {
        return "aggregator call failed with " + status_code_name(status);
    }
    return "aggregator call failed with " + status_code_name(status) + ": " + details;
}

}  // namespace

Error::Error(std::string code, std::string message, std::string hint)
    : code_(std::move(code)), message_(std::move(message)), hint_(std::move(hint)) {
    formatted_ = code_.empty() ? message_ : ("[" + code_ + "] " + message_);
}

const char* Error::what() const noexcept {
    return formatted_.c_str();
}

TransportConfigError::TransportConfigError(std::string message, std::string hint)
    : Error("E_TRANSPORT_CONFIG", std::move(message), std::move(hint)) {}

TransportFailure::TransportFailure(grpc::StatusCode status, std::string details)
    : TransportFailure("E_TRANSPORT", status, std::move(details), {}) {}

TransportFailure::TransportFailure(std::string code,
                                   grpc::StatusCode status,
                                   std::string details,
                                   std::string hint)
    : Error(std::move(code), describe_status(status, details), std::move(hint)),
      status_(status),
      details_(std::move(details)) {}

TransientTransportFailure::TransientTransportFailure(grpc::StatusCode status, std::string details)
    : TransportFailure("E_TRANSPORT_TRANSIENT",
                       status,
                       std::move(details),
                       "The retry limit was reached; raise retry.attempt_limit or retry.deadline_ms") {}

AuthenticationFailure::AuthenticationFailure(grpc::StatusCode status, std::string details)
    : TransportFailure("E_AUTHENTICATION",
                       status,
                       std::move(details),
                       "Check that the client certificate is signed by the federation CA") {}

UnhandledTransportFailure::UnhandledTransportFailure(grpc::StatusCode status, std::string details)
    : TransportFailure("E_TRANSPORT_FATAL", status, std::move(details), {}) {}

HeaderMismatchError::HeaderMismatchError(std::string field, std::string expected, std::string actual)
    : Error("E_HEADER_MISMATCH",
            "response header field '" + field + "' expected '" + expected + "' but got '" + actual + "'"),
      field_(std::move(field)),
      expected_(std::move(expected)),
      actual_(std::move(actual)) {}

ConfigError::ConfigError(std::string code, std::string message, std::string hint)
    : Error(std::move(code), std::move(message), std::move(hint)) {}

CodecError::CodecError(std::string message)
    : Error("E_CODEC", std::move(message)) {}

std::string status_code_name(grpc::StatusCode code) {
    for (const auto& entry : kStatusNames) {
        if (entry.code == code) {
            return std::string(entry.name);
        }
    }
    return "STATUS_" + std::to_string(static_cast<int>(code));
}

std::optional<grpc::StatusCode> status_code_from_name(std::string_view name) {
    for (const auto& entry : kStatusNames) {
        if (entry.name == name) {
            return entry.code;
        }
    }
    return std::nullopt;
}

}  // namespace fedlink
