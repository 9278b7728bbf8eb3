#include "fedlink/protocol/HeaderValidator.hpp"

#include "fedlink/Errors.hpp"

#include <utility>

namespace fedlink::protocol {

HeaderValidator::HeaderValidator(Identity identity, std::shared_ptr<logging::EventLog> log)
    : identity_(std::move(identity)), log_(std::move(log)) {}

v1::MessageHeader HeaderValidator::stamp(const std::string& caller) const {
    v1::MessageHeader header;
    header.set_sender(caller);
    header.set_receiver(identity_.aggregator_uuid);
    header.set_federation_uuid(identity_.federation_uuid);
    header.set_single_col_cert_common_name(expected_common_name());
    return header;
}

void HeaderValidator::validate(const v1::MessageHeader& header, const std::string& caller) const {
    check("receiver", caller, header.receiver());
    check("sender", identity_.aggregator_uuid, header.sender());
    check("federation_uuid", identity_.federation_uuid, header.federation_uuid());
    check("single_col_cert_common_name", expected_common_name(), header.single_col_cert_common_name());
}

std::string HeaderValidator::expected_common_name() const {
    return identity_.single_col_cert_common_name.value_or(std::string{});
}

void HeaderValidator::check(const char* field, const std::string& expected, const std::string& actual) const {
    if (expected == actual) {
        return;
    }
    log_->log(logging::Level::Error,
              "header.mismatch",
              {{"field", field}, {"expected", expected}, {"actual", actual}});
    throw HeaderMismatchError(field, expected, actual);
}

}  // namespace fedlink::protocol
