#include "fedlink/Errors.hpp"
#include "fedlink/config/ProfileLoader.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

namespace {

namespace fs = std::filesystem;

fs::path write_profile(const std::string& name, const std::string& contents) {
    const auto directory = fs::temp_directory_path() / "fedlink_profile_loader";
    fs::create_directories(directory);
    const auto path = directory / name;
    std::ofstream out(path, std::ios::trunc);
    out << contents;
    return path;
}

std::string config_error_code(const std::string& contents) {
    try {
        fedlink::config::apply_profile(fedlink::config::parse_yaml(contents));
    } catch (const fedlink::ConfigError& ex) {
        return ex.code();
    }
    return {};
}

void test_full_profile() {
    const auto path = write_profile("collaborator.yaml",
                                    "# collaborator profile\n"
                                    "aggregator:\n"
                                    "  host: agg.example.org\n"
                                    "  port: 50052\n"
                                    "  uuid: \"aggregator-7f1c\"\n"
                                    "federation:\n"
                                    "  uuid: federation-0a42\n"
                                    "  common_name: 'col1.example.org'\n"
                                    "tls:\n"
                                    "  enabled: true\n"
                                    "  disable_client_auth: false\n"
                                    "  root_certificate: certs/ca.pem\n"
                                    "  certificate: /etc/fedlink/col1.crt\n"
                                    "  private_key: certs/col1.key  # kept next to the profile\n"
                                    "retry:\n"
                                    "  reconnect_interval_ms: 250\n"
                                    "  retryable_status:\n"
                                    "    - UNAVAILABLE\n"
                                    "    - deadline_exceeded\n"
                                    "  attempt_limit: 5\n"
                                    "  deadline_ms: 30000\n"
                                    "  resend_limit: 3\n"
                                    "stream:\n"
                                    "  chunk_bytes: 1048576\n");

    const auto config = fedlink::config::load_client_config(path);
    assert(config.aggregator.host == "agg.example.org");
    assert(config.aggregator.port == 50052);
    assert(config.aggregator.target() == "agg.example.org:50052");
    assert(config.identity.aggregator_uuid == "aggregator-7f1c");
    assert(config.identity.federation_uuid == "federation-0a42");
    assert(config.identity.single_col_cert_common_name == "col1.example.org");
    assert(config.security.tls);
    assert(!config.security.disable_client_auth);

    const auto base = fs::absolute(path).parent_path();
    assert(config.security.root_certificate.path == (base / "certs/ca.pem").lexically_normal());
    assert(config.security.certificate.path == fs::path("/etc/fedlink/col1.crt"));
    assert(config.security.private_key.path == (base / "certs/col1.key").lexically_normal());

    assert(config.reconnect_interval == std::chrono::milliseconds(250));
    assert(config.retryable_status_codes.size() == 2);
    assert(config.retryable_status_codes.contains(grpc::StatusCode::UNAVAILABLE));
    assert(config.retryable_status_codes.contains(grpc::StatusCode::DEADLINE_EXCEEDED));
    assert(config.retry_attempt_limit == 5u);
    assert(config.retry_deadline == std::chrono::milliseconds(30000));
    assert(config.resend_attempt_limit == 3u);
    assert(config.stream_chunk_bytes == 1048576u);
}

void test_defaults_survive_partial_profile() {
    const auto config = fedlink::config::apply_profile(fedlink::config::parse_yaml("aggregator:\n  port: 6000\n"));
    assert(config.aggregator.host == "localhost");
    assert(config.aggregator.port == 6000);
    assert(config.security.tls);
    assert(config.reconnect_interval == std::chrono::seconds(1));
    assert(config.retryable_status_codes == std::set<grpc::StatusCode>{grpc::StatusCode::UNAVAILABLE});
    assert(!config.retry_attempt_limit.has_value());
    assert(!config.retry_deadline.has_value());
    assert(config.stream_chunk_bytes == 2u * 1024u * 1024u);
}

void test_retryable_status_forms() {
    auto config = fedlink::config::apply_profile(
        fedlink::config::parse_yaml("retry:\n  retryable_status: \"UNAVAILABLE, ABORTED\"\n"));
    assert(config.retryable_status_codes.size() == 2);
    assert(config.retryable_status_codes.contains(grpc::StatusCode::ABORTED));

    config = fedlink::config::apply_profile(fedlink::config::parse_yaml("retry:\n  retryable_status: []\n"));
    assert(config.retryable_status_codes.empty());
}

void test_invalid_values() {
    assert(config_error_code("aggregator:\n  port: 0\n") == "E_CONFIG_VALUE");
    assert(config_error_code("aggregator:\n  port: 70000\n") == "E_CONFIG_VALUE");
    assert(config_error_code("aggregator:\n  port: fifty\n") == "E_CONFIG_TYPE");
    assert(config_error_code("tls:\n  enabled: maybe\n") == "E_CONFIG_TYPE");
    assert(config_error_code("retry:\n  attempt_limit: 0\n") == "E_CONFIG_VALUE");
    assert(config_error_code("retry:\n  retryable_status:\n    - SOMETIMES\n") == "E_CONFIG_VALUE");
    assert(config_error_code("retry:\n  retryable_status:\n    - OK\n") == "E_CONFIG_VALUE");
    assert(config_error_code("stream:\n  chunk_bytes: 0\n") == "E_CONFIG_VALUE");
    assert(config_error_code("aggregator:\n   host: odd\n") == "E_CONFIG_PARSE");
    assert(config_error_code("aggregator\n") == "E_CONFIG_PARSE");
}

void test_missing_file() {
    bool raised = false;
    try {
        fedlink::config::load_client_config("/nonexistent/fedlink/profile.yaml");
    } catch (const fedlink::ConfigError& ex) {
        raised = true;
        assert(ex.code() == "E_CONFIG_NOT_FOUND");
        assert(!ex.hint().empty());
    }
    assert(raised);
}

}  // namespace

int main() {
    test_full_profile();
    test_defaults_survive_partial_profile();
    test_retryable_status_forms();
    test_invalid_values();
    test_missing_file();
    return 0;
}
