#include "meshstate/protocol/Json.hpp"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace meshstate::protocol {

namespace {

constexpr std::size_t kMaxNestingDepth = 64;
constexpr double kMaxExactInteger = 9007199254740992.0;  // 2^53

bool is_digit(char ch) {
    return ch >= '0' && ch <= '9';
}

// Read position over the document plus the current container depth.
struct Cursor {
    std::string_view text;
    std::size_t pos{0};
    std::size_t depth{0};

    bool done() const { return pos >= text.size(); }
    char peek() const { return done() ? '\0' : text[pos]; }

    void skip_space() {
        while (!done() && (text[pos] == ' ' || text[pos] == '\t' || text[pos] == '\n' || text[pos] == '\r')) {
            ++pos;
        }
    }

    bool consume(char ch) {
        if (peek() == ch && !done()) {
            ++pos;
            return true;
        }
        return false;
    }

    bool consume(std::string_view word) {
        if (text.substr(pos, word.size()) == word) {
            pos += word.size();
            return true;
        }
        return false;
    }

    void require(char ch, const char* message) {
        if (!consume(ch)) {
            throw JsonError(message);
        }
    }

    void skip_digits() {
        while (!done() && is_digit(text[pos])) {
            ++pos;
        }
    }
};

JsonValue read_value(Cursor& in);

unsigned int read_hex4(Cursor& in) {
    if (in.pos + 4 > in.text.size()) {
        throw JsonError("Truncated unicode escape");
    }
    unsigned int value = 0;
    for (int i = 0; i < 4; ++i) {
        const char ch = in.text[in.pos++];
        unsigned int digit = 0;
        if (is_digit(ch)) {
            digit = static_cast<unsigned int>(ch - '0');
        } else if (ch >= 'a' && ch <= 'f') {
            digit = static_cast<unsigned int>(ch - 'a' + 10);
        } else if (ch >= 'A' && ch <= 'F') {
            digit = static_cast<unsigned int>(ch - 'A' + 10);
        } else {
            throw JsonError("Invalid unicode escape");
        }
        value = (value << 4) | digit;
    }
    return value;
}

void put_utf8(unsigned int cp, std::string& out) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
        return;
    }
    if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    }
    out += static_cast<char>(0x80 | (cp & 0x3F));
}

void read_escape(Cursor& in, std::string& out) {
    if (in.done()) {
        throw JsonError("Unterminated escape sequence");
    }
    const char code = in.text[in.pos++];
    switch (code) {
        case '"':
        case '\\':
        case '/':
            out += code;
            return;
        case 'b':
            out += '\b';
            return;
        case 'f':
            out += '\f';
            return;
        case 'n':
            out += '\n';
            return;
        case 'r':
            out += '\r';
            return;
        case 't':
            out += '\t';
            return;
        case 'u': {
            unsigned int cp = read_hex4(in);
            if (cp >= 0xD800 && cp < 0xDC00) {
                if (!in.consume(std::string_view("\\u"))) {
                    throw JsonError("Unpaired surrogate in unicode escape");
                }
                const unsigned int low = read_hex4(in);
                if (low < 0xDC00 || low > 0xDFFF) {
                    throw JsonError("Invalid low surrogate in unicode escape");
                }
                cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
            }
            put_utf8(cp, out);
            return;
        }
        default:
            throw JsonError("Invalid escape sequence in string");
    }
}

std::string read_string(Cursor& in) {
    in.require('"', "Expected string");
    std::string out;
    for (;;) {
        if (in.done()) {
            throw JsonError("Unterminated string literal");
        }
        const char ch = in.text[in.pos++];
        if (ch == '"') {
            return out;
        }
        if (ch == '\\') {
            read_escape(in, out);
        } else if (static_cast<unsigned char>(ch) < 0x20) {
            throw JsonError("Control characters must be escaped in JSON strings");
        } else {
            out += ch;
        }
    }
}

JsonValue read_number(Cursor& in) {
    const std::size_t start = in.pos;
    in.consume('-');
    if (!in.consume('0')) {
        if (!is_digit(in.peek())) {
            throw JsonError("Invalid number literal");
        }
        in.skip_digits();
    }
    if (in.consume('.')) {
        if (!is_digit(in.peek())) {
            throw JsonError("Invalid fractional number");
        }
        in.skip_digits();
    }
    if (in.consume('e') || in.consume('E')) {
        if (!in.consume('+')) {
            in.consume('-');
        }
        if (!is_digit(in.peek())) {
            throw JsonError("Invalid exponent in number");
        }
        in.skip_digits();
    }
    const std::string literal(in.text.substr(start, in.pos - start));
    errno = 0;
    char* end = nullptr;
    const double number = std::strtod(literal.c_str(), &end);
    if (errno == ERANGE || end != literal.c_str() + literal.size()) {
        throw JsonError("Unable to parse number literal");
    }
    return JsonValue::make_number(number);
}

// Reads the comma-separated members of an object or array up to `close`.
template <typename ReadMember>
void read_members(Cursor& in, char close, ReadMember read_member) {
    if (++in.depth > kMaxNestingDepth) {
        throw JsonError("JSON nesting too deep");
    }
    ++in.pos;
    in.skip_space();
    if (!in.consume(close)) {
        do {
            in.skip_space();
            read_member();
            in.skip_space();
        } while (in.consume(','));
        in.require(close, "Unexpected character in JSON input");
    }
    --in.depth;
}

JsonValue read_value(Cursor& in) {
    in.skip_space();
    if (in.done()) {
        throw JsonError("Unexpected end of JSON input");
    }
    const char ch = in.peek();
    if (ch == '{') {
        auto object = JsonValue::make_object();
        read_members(in, '}', [&]() {
            if (in.peek() != '"') {
                throw JsonError("Expected string key in object");
            }
            std::string key = read_string(in);
            in.skip_space();
            in.require(':', "Unexpected character in JSON input");
            object.object_value.emplace_back(std::move(key), read_value(in));
        });
        return object;
    }
    if (ch == '[') {
        auto array = JsonValue::make_array();
        read_members(in, ']', [&]() { array.array_value.push_back(read_value(in)); });
        return array;
    }
    if (ch == '"') {
        return JsonValue::make_string(read_string(in));
    }
    if (ch == '-' || is_digit(ch)) {
        return read_number(in);
    }
    if (in.consume(std::string_view("true"))) {
        return JsonValue::make_boolean(true);
    }
    if (in.consume(std::string_view("false"))) {
        return JsonValue::make_boolean(false);
    }
    if (in.consume(std::string_view("null"))) {
        return JsonValue{};
    }
    throw JsonError("Invalid JSON token start");
}

void append_number(double number, std::string& out) {
    if (!std::isfinite(number)) {
        out += "null";
    } else if (std::trunc(number) == number && std::fabs(number) < kMaxExactInteger) {
        out += std::to_string(static_cast<long long>(number));
    } else {
        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "%.17g", number);
        out += buffer;
    }
}

void append_value(const JsonValue& value, std::string& out) {
    switch (value.type) {
        case JsonType::Null:
            out += "null";
            return;
        case JsonType::Boolean:
            out += value.bool_value ? "true" : "false";
            return;
        case JsonType::Number:
            append_number(value.number_value, out);
            return;
        case JsonType::String:
            out += '"';
            out += escape_json(value.string_value);
            out += '"';
            return;
        case JsonType::Array: {
            out += '[';
            const char* separator = "";
            for (const auto& item : value.array_value) {
                out += separator;
                append_value(item, out);
                separator = ",";
            }
            out += ']';
            return;
        }
        case JsonType::Object: {
            out += '{';
            const char* separator = "";
            for (const auto& [key, item] : value.object_value) {
                out += separator;
                out += '"';
                out += escape_json(key);
                out += "\":";
                append_value(item, out);
                separator = ",";
            }
            out += '}';
            return;
        }
    }
}

}  // namespace

JsonValue JsonValue::make_object() {
    JsonValue value;
    value.type = JsonType::Object;
    return value;
}

JsonValue JsonValue::make_array() {
    JsonValue value;
    value.type = JsonType::Array;
    return value;
}

JsonValue JsonValue::make_string(std::string text) {
    JsonValue value;
    value.type = JsonType::String;
    value.string_value = std::move(text);
    return value;
}

JsonValue JsonValue::make_number(double number) {
    JsonValue value;
    value.type = JsonType::Number;
    value.number_value = number;
    return value;
}

JsonValue JsonValue::make_boolean(bool flag) {
    JsonValue value;
    value.type = JsonType::Boolean;
    value.bool_value = flag;
    return value;
}

const JsonValue* JsonValue::find(std::string_view key) const {
    if (is_object()) {
        for (const auto& member : object_value) {
            if (member.first == key) {
                return &member.second;
            }
        }
    }
    return nullptr;
}

void JsonValue::set(std::string key, JsonValue value) {
    for (auto& member : object_value) {
        if (member.first == key) {
            member.second = std::move(value);
            return;
        }
    }
    object_value.emplace_back(std::move(key), std::move(value));
}

void JsonValue::push_back(JsonValue value) {
    array_value.push_back(std::move(value));
}

JsonValue parse_json(std::string_view input) {
    Cursor in{input};
    JsonValue document = read_value(in);
    in.skip_space();
    if (!in.done()) {
        throw JsonError("Unexpected trailing data after JSON document");
    }
    return document;
}

std::string serialize_json(const JsonValue& value) {
    std::string out;
    append_value(value, out);
    return out;
}

std::string escape_json(std::string_view value) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string escaped;
    escaped.reserve(value.size() + 2);
    for (const char ch : value) {
        const auto byte = static_cast<unsigned char>(ch);
        switch (ch) {
            case '"':
                escaped += "\\\"";
                break;
            case '\\':
                escaped += "\\\\";
                break;
            case '\b':
                escaped += "\\b";
                break;
            case '\f':
                escaped += "\\f";
                break;
            case '\n':
                escaped += "\\n";
                break;
            case '\r':
                escaped += "\\r";
                break;
            case '\t':
                escaped += "\\t";
                break;
            default:
                if (byte < 0x20) {
                    escaped += "\\u00";
                    escaped += kHex[byte >> 4];
                    escaped += kHex[byte & 0x0F];
                } else {
                    escaped += ch;
                }
        }
    }
    return escaped;
}

std::optional<std::string> string_field(const JsonValue& object, std::string_view key) {
    const auto* value = object.find(key);
    if (value && value->is_string()) {
        return value->string_value;
    }
    return std::nullopt;
}

std::optional<double> number_field(const JsonValue& object, std::string_view key) {
    const auto* value = object.find(key);
    if (value && value->is_number()) {
        return value->number_value;
    }
    return std::nullopt;
}

}  // namespace meshstate::protocol
