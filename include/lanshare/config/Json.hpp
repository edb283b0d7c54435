#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lanshare::config {

class JsonError : public std::runtime_error {
public:
    JsonError(const std::string& message, std::size_t offset)
        : std::runtime_error(message + " at offset " + std::to_string(offset)), offset_(offset) {}

    [[nodiscard]] std::size_t offset() const noexcept { return offset_; }

private:
    std::size_t offset_;
};

enum class JsonType { Null, Boolean, Number, String, Object, Array };

const char* to_string(JsonType type) noexcept;

struct JsonValue {
    JsonType type{JsonType::Null};
    bool bool_value{false};
    double number_value{0.0};
    std::string string_value;
    std::vector<JsonValue> array_value;
    // Members keep document order.
    std::vector<std::pair<std::string, JsonValue>> object_value;

    bool is_object() const { return type == JsonType::Object; }
    bool is_array() const { return type == JsonType::Array; }
    bool is_string() const { return type == JsonType::String; }
    bool is_number() const { return type == JsonType::Number; }
    bool is_bool() const { return type == JsonType::Boolean; }

    const JsonValue* find(std::string_view key) const;
};

// Parses one complete JSON document. Throws JsonError.
JsonValue parse_json(std::string_view text);

// JSON string literal, quotes included.
std::string quote_json(std::string_view text);

}  // namespace lanshare::config
