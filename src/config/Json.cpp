#include "lanshare/config/Json.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace lanshare::config {

namespace {

constexpr std::size_t kMaxDepth = 64;

class Parser {
public:
    explicit Parser(std::string_view input)
        : input_(input) {}

    JsonValue document() {
        skip_whitespace();
        auto value = value_at(0);
        skip_whitespace();
        if (!eof()) {
            fail("Unexpected trailing data");
        }
        return value;
    }

private:
    [[noreturn]] void fail(const std::string& message) const {
        throw JsonError(message, pos_);
    }

    JsonValue value_at(std::size_t depth) {
        if (depth > kMaxDepth) {
            fail("JSON nesting too deep");
        }
        if (eof()) {
            fail("Unexpected end of input");
        }

        JsonValue value;
        switch (peek()) {
            case '{':
                value.type = JsonType::Object;
                ++pos_;
                parse_members(value, depth);
                return value;
            case '[':
                value.type = JsonType::Array;
                ++pos_;
                parse_elements(value, depth);
                return value;
            case '"':
                value.type = JsonType::String;
                value.string_value = string_literal();
                return value;
            case 't':
                literal("true");
                value.type = JsonType::Boolean;
                value.bool_value = true;
                return value;
            case 'f':
                literal("false");
                value.type = JsonType::Boolean;
                return value;
            case 'n':
                literal("null");
                return value;
            default:
                break;
        }

        if (peek() == '-' || std::isdigit(static_cast<unsigned char>(peek())) != 0) {
            value.type = JsonType::Number;
            value.number_value = number_literal();
            return value;
        }
        fail("Invalid JSON token");
    }

    void parse_members(JsonValue& object, std::size_t depth) {
        skip_whitespace();
        if (consume('}')) {
            return;
        }
        while (true) {
            skip_whitespace();
            if (eof() || peek() != '"') {
                fail("Expected string key");
            }
            auto key = string_literal();
            skip_whitespace();
            expect(':');
            skip_whitespace();
            object.object_value.emplace_back(std::move(key), value_at(depth + 1));
            skip_whitespace();
            if (consume('}')) {
                return;
            }
            expect(',');
        }
    }

    void parse_elements(JsonValue& array, std::size_t depth) {
        skip_whitespace();
        if (consume(']')) {
            return;
        }
        while (true) {
            skip_whitespace();
            array.array_value.push_back(value_at(depth + 1));
            skip_whitespace();
            if (consume(']')) {
                return;
            }
            expect(',');
        }
    }

    double number_literal() {
        const auto start = pos_;
        consume('-');
        if (!consume('0')) {
            if (eof() || std::isdigit(static_cast<unsigned char>(peek())) == 0) {
                fail("Invalid number");
            }
            skip_digits();
        }
        if (consume('.')) {
            if (eof() || std::isdigit(static_cast<unsigned char>(peek())) == 0) {
                fail("Invalid fraction");
            }
            skip_digits();
        }
        if (consume('e') || consume('E')) {
            if (!consume('+')) {
                consume('-');
            }
            if (eof() || std::isdigit(static_cast<unsigned char>(peek())) == 0) {
                fail("Invalid exponent");
            }
            skip_digits();
        }

        const std::string text(input_.substr(start, pos_ - start));
        char* end = nullptr;
        errno = 0;
        const double parsed = std::strtod(text.c_str(), &end);
        if (errno == ERANGE || end != text.c_str() + text.size()) {
            fail("Number out of range");
        }
        return parsed;
    }

    std::string string_literal() {
        expect('"');
        std::string output;
        while (true) {
            if (eof()) {
                fail("Unterminated string");
            }
            const char ch = input_[pos_++];
            if (ch == '"') {
                return output;
            }
            if (static_cast<unsigned char>(ch) < 0x20) {
                fail("Control character in string");
            }
            if (ch != '\\') {
                output.push_back(ch);
                continue;
            }
            if (eof()) {
                fail("Unterminated escape");
            }
            const char escape = input_[pos_++];
            switch (escape) {
                case '"':
                case '\\':
                case '/':
                    output.push_back(escape);
                    break;
                case 'b':
                    output.push_back('\b');
                    break;
                case 'f':
                    output.push_back('\f');
                    break;
                case 'n':
                    output.push_back('\n');
                    break;
                case 'r':
                    output.push_back('\r');
                    break;
                case 't':
                    output.push_back('\t');
                    break;
                case 'u':
                    append_code_point(unicode_escape(), output);
                    break;
                default:
                    fail("Invalid escape");
            }
        }
    }

    std::uint32_t hex_quad() {
        if (input_.size() - pos_ < 4) {
            fail("Truncated unicode escape");
        }
        std::uint32_t value = 0;
        for (int index = 0; index < 4; ++index) {
            const char ch = input_[pos_++];
            value <<= 4;
            if (ch >= '0' && ch <= '9') {
                value |= static_cast<std::uint32_t>(ch - '0');
            } else if (ch >= 'a' && ch <= 'f') {
                value |= static_cast<std::uint32_t>(ch - 'a' + 10);
            } else if (ch >= 'A' && ch <= 'F') {
                value |= static_cast<std::uint32_t>(ch - 'A' + 10);
            } else {
                fail("Invalid unicode escape");
            }
        }
        return value;
    }

    std::uint32_t unicode_escape() {
        const auto high = hex_quad();
        if (high < 0xD800 || high > 0xDBFF) {
            return high;
        }
        // Surrogate pair.
        if (input_.substr(pos_, 2) != "\\u") {
            fail("Unpaired surrogate");
        }
        pos_ += 2;
        const auto low = hex_quad();
        if (low < 0xDC00 || low > 0xDFFF) {
            fail("Invalid low surrogate");
        }
        return 0x10000 + ((high - 0xD800) << 10) + (low - 0xDC00);
    }

    static void append_code_point(std::uint32_t code_point, std::string& out) {
        if (code_point <= 0x7F) {
            out.push_back(static_cast<char>(code_point));
        } else if (code_point <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
            out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
        } else if (code_point <= 0xFFFF) {
            out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
            out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
            out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
        }
    }

    void literal(std::string_view word) {
        if (input_.substr(pos_, word.size()) != word) {
            fail("Invalid literal");
        }
        pos_ += word.size();
    }

    void skip_digits() {
        while (!eof() && std::isdigit(static_cast<unsigned char>(peek())) != 0) {
            ++pos_;
        }
    }

    void skip_whitespace() {
        while (!eof() && (peek() == ' ' || peek() == '\n' || peek() == '\r' || peek() == '\t')) {
            ++pos_;
        }
    }

    void expect(char expected) {
        if (!consume(expected)) {
            fail(std::string("Expected '") + expected + "'");
        }
    }

    bool consume(char expected) {
        if (!eof() && input_[pos_] == expected) {
            ++pos_;
            return true;
        }
        return false;
    }

    bool eof() const { return pos_ >= input_.size(); }
    char peek() const { return input_[pos_]; }

    std::string_view input_;
    std::size_t pos_{0};
};

}  // namespace

const char* to_string(JsonType type) noexcept {
    switch (type) {
        case JsonType::Null:
            return "null";
        case JsonType::Boolean:
            return "boolean";
        case JsonType::Number:
            return "number";
        case JsonType::String:
            return "string";
        case JsonType::Object:
            return "object";
        case JsonType::Array:
            return "array";
    }
    return "unknown";
}

const JsonValue* JsonValue::find(std::string_view key) const {
    if (!is_object()) {
        return nullptr;
    }
    for (const auto& [name, value] : object_value) {
        if (name == key) {
            return &value;
        }
    }
    return nullptr;
}

JsonValue parse_json(std::string_view text) {
    return Parser(text).document();
}

std::string quote_json(std::string_view text) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string quoted;
    quoted.reserve(text.size() + 2);
    quoted.push_back('"');
    for (const unsigned char ch : text) {
        switch (ch) {
            case '"':
                quoted.append("\\\"");
                break;
            case '\\':
                quoted.append("\\\\");
                break;
            case '\n':
                quoted.append("\\n");
                break;
            case '\r':
                quoted.append("\\r");
                break;
            case '\t':
                quoted.append("\\t");
                break;
            default:
                if (ch < 0x20) {
                    quoted.append("\\u00");
                    quoted.push_back(kHex[ch >> 4]);
                    quoted.push_back(kHex[ch & 0x0F]);
                } else {
                    quoted.push_back(static_cast<char>(ch));
                }
                break;
        }
    }
    quoted.push_back('"');
    return quoted;
}

}  // namespace lanshare::config
