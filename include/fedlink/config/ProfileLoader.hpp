#pragma once

#include "fedlink/Config.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace fedlink::config {

enum class ValueType {
    Null,
    Boolean,
    Integer,
    String,
    Object,
    Array
};

// Parsed YAML node. Scalars that look like integers or booleans are typed on parse.
struct Value {
    ValueType type{ValueType::Null};
    bool boolean_value{false};
    std::int64_t integer_value{0};
    std::string string_value;
    std::map<std::string, Value> object_value;
    std::vector<Value> array_value;

    Value() = default;
    explicit Value(bool value) : type(ValueType::Boolean), boolean_value(value) {}
    explicit Value(std::int64_t value) : type(ValueType::Integer), integer_value(value) {}
    explicit Value(std::string value) : type(ValueType::String), string_value(std::move(value)) {}

    static Value make_object();

    bool is_null() const { return type == ValueType::Null; }
    bool is_boolean() const { return type == ValueType::Boolean; }
    bool is_integer() const { return type == ValueType::Integer; }
    bool is_string() const { return type == ValueType::String; }
    bool is_object() const { return type == ValueType::Object; }
    bool is_array() const { return type == ValueType::Array; }

    std::map<std::string, Value>& ensure_object();
    std::vector<Value>& ensure_array();
};

// Indentation-based YAML subset: nested mappings, "- item" sequences, quoted
// strings and '#' comments. Throws ConfigError (E_CONFIG_PARSE).
Value parse_yaml(const std::string& text);

// Applies a parsed profile on top of base. Relative credential paths are resolved
// against base_directory.
ClientConfig apply_profile(const Value& document,
                           ClientConfig base = {},
                           const std::filesystem::path& base_directory = {});

// Reads and applies the profile at path. Throws ConfigError.
ClientConfig load_client_config(const std::filesystem::path& path, ClientConfig base = {});

}  // namespace fedlink::config
