#include "fedlink/Errors.hpp"

#include <cassert>
#include <string>

namespace {

void test_rendering() {
    const fedlink::TransientTransportFailure transient(grpc::StatusCode::UNAVAILABLE, "connection refused");
    assert(transient.code() == "E_TRANSPORT_TRANSIENT");
    assert(std::string(transient.what()) ==
           "[E_TRANSPORT_TRANSIENT] aggregator call failed with UNAVAILABLE: connection refused");
    assert(!transient.hint().empty());

    const fedlink::TransportFailure bare(grpc::StatusCode::NOT_FOUND, "");
    assert(std::string(bare.what()) == "[E_TRANSPORT] aggregator call failed with NOT_FOUND");
}

void test_hierarchy() {
    try {
        throw fedlink::AuthenticationFailure(grpc::StatusCode::UNAUTHENTICATED, "expired");
    } catch (const fedlink::TransportFailure& ex) {
        assert(ex.status() == grpc::StatusCode::UNAUTHENTICATED);
        assert(ex.code() == "E_AUTHENTICATION");
    }

    try {
        throw fedlink::HeaderMismatchError("sender", "aggregator", "other");
    } catch (const fedlink::Error& ex) {
        assert(ex.code() == "E_HEADER_MISMATCH");
        assert(ex.message().find("'sender'") != std::string::npos);
    }
}

void test_status_names() {
    assert(fedlink::status_code_name(grpc::StatusCode::DEADLINE_EXCEEDED) == "DEADLINE_EXCEEDED");
    assert(fedlink::status_code_from_name("UNAVAILABLE") == grpc::StatusCode::UNAVAILABLE);
    assert(fedlink::status_code_from_name("UNAUTHENTICATED") == grpc::StatusCode::UNAUTHENTICATED);
    assert(!fedlink::status_code_from_name("SOMETIMES").has_value());
}

}  // namespace

int main() {
    test_rendering();
    test_hierarchy();
    test_status_names();
    return 0;
}
