#include "fedlink/config/ProfileLoader.hpp"

#include "fedlink/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <system_error>

namespace fedlink::config {

namespace {

std::string trim_left(std::string value) {
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [](unsigned char ch) {
                    return !std::isspace(ch);
                }));
    return value;
}

std::string trim_right(std::string value) {
    value.erase(std::find_if(value.rbegin(), value.rend(), [](unsigned char ch) {
                    return !std::isspace(ch);
                }).base(),
                value.end());
    return value;
}

std::string trim_copy(const std::string& value) {
    return trim_right(trim_left(value));
}

std::string unescape_double_quoted(const std::string& inner) {
    std::string result;
    result.reserve(inner.size());
    for (std::size_t i = 0; i < inner.size(); ++i) {
        const char ch = inner[i];
        if (ch != '\\') {
            result.push_back(ch);
            continue;
        }
        if (i + 1 >= inner.size()) {
            throw ConfigError("E_CONFIG_PARSE", "Incomplete escape sequence in YAML string");
        }
        const char next = inner[++i];
        switch (next) {
            case '"':
            case '\\':
            case '/':
                result.push_back(next);
                break;
            case 'n':
                result.push_back('\n');
                break;
            case 't':
                result.push_back('\t');
                break;
            case 'r':
                result.push_back('\r');
                break;
            default:
                throw ConfigError("E_CONFIG_PARSE", "Unsupported escape sequence in YAML string");
        }
    }
    return result;
}

Value parse_yaml_scalar(const std::string& text) {
    const std::string trimmed = trim_copy(text);
    if (trimmed.empty()) {
        return Value();
    }
    if (trimmed.size() >= 2 &&
        ((trimmed.front() == '"' && trimmed.back() == '"') || (trimmed.front() == '\'' && trimmed.back() == '\''))) {
        std::string inner = trimmed.substr(1, trimmed.size() - 2);
        if (trimmed.front() == '\'') {
            return Value(inner);
        }
        return Value(unescape_double_quoted(inner));
    }
    if (trimmed == "true" || trimmed == "True") {
        return Value(true);
    }
    if (trimmed == "false" || trimmed == "False") {
        return Value(false);
    }
    if (trimmed == "null" || trimmed == "~") {
        return Value();
    }
    std::int64_t number{};
    const auto result = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), number);
    if (result.ec == std::errc{} && result.ptr == trimmed.data() + trimmed.size()) {
        return Value(number);
    }
    return Value(trimmed);
}

std::string strip_comment(const std::string& line) {
    bool in_single = false;
    bool in_double = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char ch = line[i];
        if (ch == '"' && !in_single) {
            in_double = !in_double;
        } else if (ch == '\'' && !in_double) {
            in_single = !in_single;
        } else if (ch == '#' && !in_single && !in_double) {
            return line.substr(0, i);
        }
    }
    return line;
}

std::string join_path(const std::vector<std::string>& path) {
    std::string combined;
    for (std::size_t i = 0; i < path.size(); ++i) {
        combined += path[i];
        if (i + 1 < path.size()) {
            combined += '.';
        }
    }
    return combined.empty() ? std::string{"<root>"} : combined;
}

const Value* find_path(const Value& root, const std::vector<std::string>& path) {
    const Value* node = &root;
    for (const auto& segment : path) {
        if (!node->is_object()) {
            return nullptr;
        }
        const auto it = node->object_value.find(segment);
        if (it == node->object_value.end()) {
            return nullptr;
        }
        node = &it->second;
    }
    return node->is_null() ? nullptr : node;
}

std::optional<std::string> get_string(const Value& root, const std::vector<std::string>& path) {
    const Value* node = find_path(root, path);
    if (!node) {
        return std::nullopt;
    }
    if (node->is_string()) {
        return node->string_value;
    }
    if (node->is_integer()) {
        return std::to_string(node->integer_value);
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected string at config path " + join_path(path));
}

std::optional<bool> get_bool(const Value& root, const std::vector<std::string>& path) {
    const Value* node = find_path(root, path);
    if (!node) {
        return std::nullopt;
    }
    if (node->is_boolean()) {
        return node->boolean_value;
    }
    if (node->is_string()) {
        std::string lowered = node->string_value;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
            return static_cast<char>(std::tolower(ch));
        });
        if (lowered == "yes" || lowered == "on") {
            return true;
        }
        if (lowered == "no" || lowered == "off") {
            return false;
        }
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected boolean at config path " + join_path(path));
}

std::optional<std::int64_t> get_int64(const Value& root, const std::vector<std::string>& path) {
    const Value* node = find_path(root, path);
    if (!node) {
        return std::nullopt;
    }
    if (node->is_integer()) {
        return node->integer_value;
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected integer at config path " + join_path(path));
}

std::int64_t require_at_least(std::int64_t value, std::int64_t minimum, const std::string& key) {
    if (value < minimum) {
        throw ConfigError("E_CONFIG_VALUE", key + " must be at least " + std::to_string(minimum));
    }
    return value;
}

CredentialSource resolve_credential(const std::string& text, const std::filesystem::path& base_directory) {
    std::filesystem::path path(text);
    if (path.is_relative() && !base_directory.empty()) {
        path = base_directory / path;
    }
    return CredentialSource::from_file(path.lexically_normal());
}

grpc::StatusCode parse_status_name(std::string name) {
    name = trim_copy(name);
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char ch) {
        return static_cast<char>(std::toupper(ch));
    });
    const auto code = status_code_from_name(name);
    if (!code.has_value() || *code == grpc::StatusCode::OK) {
        throw ConfigError("E_CONFIG_VALUE",
                          "Unknown gRPC status in retry.retryable_status: " + name,
                          "Use canonical status names such as UNAVAILABLE or DEADLINE_EXCEEDED");
    }
    return *code;
}

std::optional<std::set<grpc::StatusCode>> get_status_set(const Value& root, const std::vector<std::string>& path) {
    const Value* node = find_path(root, path);
    if (!node) {
        return std::nullopt;
    }
    std::set<grpc::StatusCode> codes;
    if (node->is_array()) {
        for (const auto& item : node->array_value) {
            if (!item.is_string()) {
                throw ConfigError("E_CONFIG_TYPE", "Expected status names at config path " + join_path(path));
            }
            codes.insert(parse_status_name(item.string_value));
        }
        return codes;
    }
    if (node->is_string()) {
        std::string text = trim_copy(node->string_value);
        if (text.size() >= 2 && text.front() == '[' && text.back() == ']') {
            text = text.substr(1, text.size() - 2);
        }
        std::istringstream stream(text);
        std::string token;
        while (std::getline(stream, token, ',')) {
            if (!trim_copy(token).empty()) {
                codes.insert(parse_status_name(token));
            }
        }
        return codes;
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected status list at config path " + join_path(path));
}

}  // namespace

Value Value::make_object() {
    Value value;
    value.type = ValueType::Object;
    return value;
}

std::map<std::string, Value>& Value::ensure_object() {
    if (type != ValueType::Object) {
        type = ValueType::Object;
        object_value.clear();
        array_value.clear();
        string_value.clear();
    }
    return object_value;
}

std::vector<Value>& Value::ensure_array() {
    if (type != ValueType::Array) {
        type = ValueType::Array;
        array_value.clear();
        object_value.clear();
        string_value.clear();
    }
    return array_value;
}

Value parse_yaml(const std::string& text) {
    Value root = Value::make_object();
    struct Context {
        std::size_t indent;
        Value* node;
    };
    std::vector<Context> stack;
    stack.push_back({0, &root});

    std::istringstream input(text);
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        const std::string trimmed_line = trim_right(strip_comment(trim_right(line)));
        if (trimmed_line.empty()) {
            continue;
        }

        std::size_t indent = 0;
        while (indent < trimmed_line.size() && trimmed_line[indent] == ' ') {
            ++indent;
        }
        if (indent % 2 != 0) {
            throw ConfigError("E_CONFIG_PARSE",
                              "YAML indentation must be multiples of two spaces (line " +
                                  std::to_string(line_number) + ")");
        }
        const std::string content = trim_left(trimmed_line.substr(indent));

        while (!stack.empty() && indent < stack.back().indent) {
            stack.pop_back();
        }
        if (stack.empty()) {
            throw ConfigError("E_CONFIG_PARSE", "Invalid indentation in YAML config");
        }

        Value* current_node = stack.back().node;
        if (content.front() == '-') {
            current_node->ensure_array().push_back(parse_yaml_scalar(content.substr(1)));
            continue;
        }

        const auto colon = content.find(':');
        if (colon == std::string::npos) {
            throw ConfigError("E_CONFIG_PARSE",
                              "Expected ':' in YAML mapping entry (line " + std::to_string(line_number) + ")");
        }
        const std::string key = trim_copy(content.substr(0, colon));
        const std::string value_part = trim_copy(content.substr(colon + 1));

        auto& object = current_node->ensure_object();
        if (value_part.empty()) {
            Value& child = object[key];
            stack.push_back({indent + 2, &child});
        } else {
            object[key] = parse_yaml_scalar(value_part);
        }
    }

    return root;
}

ClientConfig apply_profile(const Value& document, ClientConfig base, const std::filesystem::path& base_directory) {
    if (!document.is_object()) {
        throw ConfigError("E_CONFIG_STRUCTURE", "Configuration root must be a mapping");
    }
    ClientConfig config = std::move(base);

    if (auto host = get_string(document, {"aggregator", "host"})) {
        if (host->empty()) {
            throw ConfigError("E_CONFIG_VALUE", "aggregator.host must not be empty");
        }
        config.aggregator.host = *host;
    }
    if (auto port = get_int64(document, {"aggregator", "port"})) {
        if (*port < 1 || *port > std::numeric_limits<std::uint16_t>::max()) {
            throw ConfigError("E_CONFIG_VALUE", "aggregator.port must be between 1 and 65535");
        }
        config.aggregator.port = static_cast<std::uint16_t>(*port);
    }
    if (auto uuid = get_string(document, {"aggregator", "uuid"})) {
        config.identity.aggregator_uuid = *uuid;
    }
    if (auto uuid = get_string(document, {"federation", "uuid"})) {
        config.identity.federation_uuid = *uuid;
    }
    if (auto common_name = get_string(document, {"federation", "common_name"})) {
        config.identity.single_col_cert_common_name = *common_name;
    }

    if (auto enabled = get_bool(document, {"tls", "enabled"})) {
        config.security.tls = *enabled;
    }
    if (auto disabled = get_bool(document, {"tls", "disable_client_auth"})) {
        config.security.disable_client_auth = *disabled;
    }
    if (auto path = get_string(document, {"tls", "root_certificate"})) {
        config.security.root_certificate = resolve_credential(*path, base_directory);
    }
    if (auto path = get_string(document, {"tls", "certificate"})) {
        config.security.certificate = resolve_credential(*path, base_directory);
    }
    if (auto path = get_string(document, {"tls", "private_key"})) {
        config.security.private_key = resolve_credential(*path, base_directory);
    }

    if (auto interval = get_int64(document, {"retry", "reconnect_interval_ms"})) {
        config.reconnect_interval =
            std::chrono::milliseconds(require_at_least(*interval, 0, "retry.reconnect_interval_ms"));
    }
    if (auto codes = get_status_set(document, {"retry", "retryable_status"})) {
        config.retryable_status_codes = std::move(*codes);
    }
    if (auto limit = get_int64(document, {"retry", "attempt_limit"})) {
        config.retry_attempt_limit = static_cast<std::size_t>(require_at_least(*limit, 1, "retry.attempt_limit"));
    }
    if (auto deadline = get_int64(document, {"retry", "deadline_ms"})) {
        config.retry_deadline = std::chrono::milliseconds(require_at_least(*deadline, 1, "retry.deadline_ms"));
    }
    if (auto limit = get_int64(document, {"retry", "resend_limit"})) {
        config.resend_attempt_limit = static_cast<std::size_t>(require_at_least(*limit, 1, "retry.resend_limit"));
    }

    if (auto chunk = get_int64(document, {"stream", "chunk_bytes"})) {
        config.stream_chunk_bytes = static_cast<std::size_t>(require_at_least(*chunk, 1, "stream.chunk_bytes"));
    }

    return config;
}

ClientConfig load_client_config(const std::filesystem::path& path, ClientConfig base) {
    const std::filesystem::path absolute = std::filesystem::absolute(path);
    std::ifstream input(absolute);
    if (!input) {
        throw ConfigError("E_CONFIG_NOT_FOUND",
                          "Configuration file not found: " + absolute.string(),
                          "Verify the path or provide an absolute path");
    }
    std::stringstream buffer;
    buffer << input.rdbuf();
    return apply_profile(parse_yaml(buffer.str()), std::move(base), absolute.parent_path());
}

}  // namespace fedlink::config
