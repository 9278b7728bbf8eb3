#pragma once

#include "fedlink/Types.hpp"
#include "fedlink/logging/StructuredLogger.hpp"

#include "fedlink/v1/aggregator.pb.h"

#include <memory>
#include <string>

namespace fedlink::protocol {

class HeaderValidator {
public:
    HeaderValidator(Identity identity, std::shared_ptr<logging::EventLog> log);

    v1::MessageHeader stamp(const std::string& caller) const;

    // Checks receiver, sender, federation_uuid, then single_col_cert_common_name and
    // throws HeaderMismatchError on the first field that disagrees.
    void validate(const v1::MessageHeader& header, const std::string& caller) const;

    const Identity& identity() const noexcept { return identity_; }

private:
    std::string expected_common_name() const;
    void check(const char* field, const std::string& expected, const std::string& actual) const;

    Identity identity_;
    std::shared_ptr<logging::EventLog> log_;
};

}  // namespace fedlink::protocol
