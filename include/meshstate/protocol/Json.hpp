#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace meshstate::protocol {

enum class JsonType { Null, Boolean, Number, String, Object, Array };

struct JsonValue {
    JsonType type{JsonType::Null};
    bool bool_value{false};
    double number_value{0.0};
    std::string string_value;
    std::vector<JsonValue> array_value;
    std::vector<std::pair<std::string, JsonValue>> object_value;

    static JsonValue make_object();
    static JsonValue make_array();
    static JsonValue make_string(std::string value);
    static JsonValue make_number(double value);
    static JsonValue make_boolean(bool value);

    bool is_null() const { return type == JsonType::Null; }
    bool is_boolean() const { return type == JsonType::Boolean; }
    bool is_number() const { return type == JsonType::Number; }
    bool is_object() const { return type == JsonType::Object; }
    bool is_array() const { return type == JsonType::Array; }
    bool is_string() const { return type == JsonType::String; }

    const JsonValue* find(std::string_view key) const;
    void set(std::string key, JsonValue value);
    void push_back(JsonValue value);
};

class JsonError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Throws JsonError on malformed input or trailing data.
JsonValue parse_json(std::string_view input);

// Compact single-line rendering; never emits raw newlines.
std::string serialize_json(const JsonValue& value);

std::string escape_json(std::string_view value);

std::optional<std::string> string_field(const JsonValue& object, std::string_view key);
std::optional<double> number_field(const JsonValue& object, std::string_view key);

}  // namespace meshstate::protocol
