// value.cpp - Value utilities and JSON serialization

#include <struct_diff/value.h>
#include <struct_diff/serialization.h>

#include <cctype>     // for std::isspace, std::isdigit
#include <charconv>   // for std::to_chars / std::from_chars
#include <cmath>      // for std::isfinite, std::trunc
#include <cstdio>     // for std::snprintf
#include <cstdlib>    // for std::strtod
#include <fstream>
#include <sstream>    // for std::ostringstream
#include <stdexcept>  // for std::runtime_error

namespace struct_diff {

std::string format_number(double value)
{
    if (!std::isfinite(value)) {
        return std::isnan(value) ? "NaN" : (value > 0 ? "Infinity" : "-Infinity");
    }
    // Integral doubles in the exactly-representable range print as integers
    if (std::trunc(value) == value && std::fabs(value) < 9007199254740992.0) {
        if (value == 0.0) {
            return "0";
        }
        return std::to_string(static_cast<std::int64_t>(value));
    }
    char buf[32];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc{}) {
        std::ostringstream oss;
        oss.precision(17);
        oss << value;
        return oss.str();
    }
    return std::string(buf, end);
}

std::string value_to_string(const Value& val)
{
    return std::visit([&val](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            return format_number(arg);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + arg + "\"";
        } else if constexpr (std::is_same_v<T, ValueObject> || std::is_same_v<T, ValueArray>) {
            return to_json(val, true);
        } else {
            static_assert(detail::always_false<T>, "unhandled value alternative");
        }
    }, val.data);
}

std::size_t count_leaves(const Value& val)
{
    return fold_value(val, std::size_t{0}, [](std::size_t acc, const Value& node) {
        return (node.is_container() && node.size() > 0) ? acc : acc + 1;
    });
}

// ============================================================
// JSON Serialization / Deserialization Implementation
// ============================================================

JsonParseError::JsonParseError(const std::string& message, std::size_t offset)
    : std::runtime_error(message + " at position " + std::to_string(offset))
    , offset_(offset)
{}

namespace {

std::string json_escape_string(const std::string& s)
{
    std::string result;
    result.reserve(s.size() + 16);

    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned int>(static_cast<unsigned char>(c)));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

void to_json_impl(const Value& val, std::ostringstream& oss, bool compact, int indent_level)
{
    const std::string indent = compact ? "" : std::string(indent_level * 2, ' ');
    const std::string child_indent = compact ? "" : std::string((indent_level + 1) * 2, ' ');
    const std::string newline = compact ? "" : "\n";
    const std::string space_after_colon = compact ? "" : " ";

    std::visit([&](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (arg ? "true" : "false");
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            oss << arg;
        } else if constexpr (std::is_same_v<T, double>) {
            // JSON has no NaN/Infinity literals
            oss << (std::isfinite(arg) ? format_number(arg) : std::string("null"));
        } else if constexpr (std::is_same_v<T, std::string>) {
            oss << "\"" << json_escape_string(arg) << "\"";
        } else if constexpr (std::is_same_v<T, ValueObject>) {
            if (arg.empty()) {
                oss << "{}";
            } else {
                oss << "{" << newline;
                bool first = true;
                for (const auto& field : arg) {
                    if (!first) oss << "," << newline;
                    first = false;
                    oss << child_indent << "\"" << json_escape_string(field.name) << "\":" << space_after_colon;
                    to_json_impl(field.value.get(), oss, compact, indent_level + 1);
                }
                oss << newline << indent << "}";
            }
        } else if constexpr (std::is_same_v<T, ValueArray>) {
            if (arg.empty()) {
                oss << "[]";
            } else {
                oss << "[" << newline;
                bool first = true;
                for (const auto& box : arg) {
                    if (!first) oss << "," << newline;
                    first = false;
                    oss << child_indent;
                    to_json_impl(box.get(), oss, compact, indent_level + 1);
                }
                oss << newline << indent << "]";
            }
        } else {
            static_assert(detail::always_false<T>, "unhandled value alternative");
        }
    }, val.data);
}

// ============================================================
// JSON Parser
// ============================================================

class JsonParser {
public:
    explicit JsonParser(std::string_view json) : json_(json), pos_(0) {}

    Value parse()
    {
        skip_whitespace();
        if (pos_ >= json_.size()) {
            fail("Empty JSON input");
        }
        Value result = parse_value();
        skip_whitespace();
        if (pos_ < json_.size()) {
            fail("Unexpected trailing content");
        }
        return result;
    }

private:
    std::string_view json_;
    std::size_t pos_;

    [[noreturn]] void fail(const std::string& message) const
    {
        throw JsonParseError(message, pos_);
    }

    char peek() const
    {
        return pos_ < json_.size() ? json_[pos_] : '\0';
    }

    char consume()
    {
        return pos_ < json_.size() ? json_[pos_++] : '\0';
    }

    void skip_whitespace()
    {
        while (pos_ < json_.size() && std::isspace(static_cast<unsigned char>(json_[pos_]))) {
            ++pos_;
        }
    }

    void expect(char c)
    {
        skip_whitespace();
        if (peek() != c) {
            fail(std::string("Expected '") + c + "'");
        }
        ++pos_;
    }

    Value parse_value()
    {
        skip_whitespace();
        char c = peek();

        if (c == '{') return parse_object();
        if (c == '[') return parse_array();
        if (c == '"') return Value{parse_string_raw()};
        if (c == 't' || c == 'f') return parse_bool();
        if (c == 'n') return parse_null();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number();

        if (c == '\0' && pos_ >= json_.size()) {
            fail("Unexpected end of input");
        }
        fail("Unexpected character '" + std::string(1, c) + "'");
    }

    Value parse_object()
    {
        expect('{');
        skip_whitespace();

        ValueObject object;
        if (peek() == '}') {
            consume();
            return Value{object};
        }

        while (true) {
            skip_whitespace();
            if (peek() != '"') {
                fail("Expected string key in object");
            }
            std::string key = parse_string_raw();
            expect(':');
            Value val = parse_value();
            object = object.set(std::move(key), ValueBox{std::move(val)});

            skip_whitespace();
            char c = peek();
            if (c == '}') {
                consume();
                break;
            }
            if (c != ',') {
                fail("Expected ',' or '}' in object");
            }
            consume();
        }

        return Value{std::move(object)};
    }

    Value parse_array()
    {
        expect('[');
        skip_whitespace();

        if (peek() == ']') {
            consume();
            return Value{ValueArray{}};
        }

        auto transient = ValueArray{}.transient();

        while (true) {
            Value val = parse_value();
            transient.push_back(ValueBox{std::move(val)});

            skip_whitespace();
            char c = peek();
            if (c == ']') {
                consume();
                break;
            }
            if (c != ',') {
                fail("Expected ',' or ']' in array");
            }
            consume();
        }

        return Value{transient.persistent()};
    }

    unsigned parse_hex4()
    {
        if (pos_ + 4 > json_.size()) {
            fail("Invalid unicode escape");
        }
        unsigned codepoint = 0;
        auto [ptr, ec] = std::from_chars(json_.data() + pos_, json_.data() + pos_ + 4, codepoint, 16);
        if (ec != std::errc{} || ptr != json_.data() + pos_ + 4) {
            fail("Invalid unicode escape");
        }
        pos_ += 4;
        return codepoint;
    }

    static void append_utf8(std::string& out, unsigned codepoint)
    {
        if (codepoint < 0x80) {
            out += static_cast<char>(codepoint);
        } else if (codepoint < 0x800) {
            out += static_cast<char>(0xC0 | (codepoint >> 6));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        } else if (codepoint < 0x10000) {
            out += static_cast<char>(0xE0 | (codepoint >> 12));
            out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (codepoint >> 18));
            out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        }
    }

    std::string parse_string_raw()
    {
        expect('"');
        std::string result;

        while (pos_ < json_.size()) {
            char c = consume();
            if (c == '"') {
                return result;
            }
            if (c != '\\') {
                result += c;
                continue;
            }
            if (pos_ >= json_.size()) {
                fail("Unexpected end of string escape");
            }
            char escaped = consume();
            switch (escaped) {
                case '"':  result += '"'; break;
                case '\\': result += '\\'; break;
                case '/':  result += '/'; break;
                case 'b':  result += '\b'; break;
                case 'f':  result += '\f'; break;
                case 'n':  result += '\n'; break;
                case 'r':  result += '\r'; break;
                case 't':  result += '\t'; break;
                case 'u': {
                    unsigned codepoint = parse_hex4();
                    // Combine a UTF-16 surrogate pair
                    if (codepoint >= 0xD800 && codepoint <= 0xDBFF &&
                        json_.substr(pos_, 2) == "\\u") {
                        pos_ += 2;
                        unsigned low = parse_hex4();
                        if (low >= 0xDC00 && low <= 0xDFFF) {
                            codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
                        } else {
                            append_utf8(result, codepoint);
                            codepoint = low;
                        }
                    }
                    append_utf8(result, codepoint);
                    break;
                }
                default:
                    fail("Invalid escape sequence: \\" + std::string(1, escaped));
            }
        }

        fail("Unterminated string");
    }

    Value parse_number()
    {
        std::size_t start = pos_;
        bool is_integer = true;

        if (peek() == '-') consume();
        if (!std::isdigit(static_cast<unsigned char>(peek()))) {
            fail("Invalid number");
        }
        while (std::isdigit(static_cast<unsigned char>(peek()))) consume();
        if (peek() == '.') {
            is_integer = false;
            consume();
            if (!std::isdigit(static_cast<unsigned char>(peek()))) {
                fail("Expected digit after decimal point");
            }
            while (std::isdigit(static_cast<unsigned char>(peek()))) consume();
        }
        if (peek() == 'e' || peek() == 'E') {
            is_integer = false;
            consume();
            if (peek() == '+' || peek() == '-') consume();
            if (!std::isdigit(static_cast<unsigned char>(peek()))) {
                fail("Expected digit in exponent");
            }
            while (std::isdigit(static_cast<unsigned char>(peek()))) consume();
        }

        const char* first = json_.data() + start;
        const char* last = json_.data() + pos_;

        if (is_integer) {
            std::int64_t val = 0;
            auto [ptr, ec] = std::from_chars(first, last, val);
            if (ec == std::errc{} && ptr == last) {
                return Value{val};
            }
            // Out of int64 range: fall through to double
        }
        std::string num_str(first, last);
        return Value{std::strtod(num_str.c_str(), nullptr)};
    }

    Value parse_bool()
    {
        if (json_.substr(pos_, 4) == "true") {
            pos_ += 4;
            return Value{true};
        }
        if (json_.substr(pos_, 5) == "false") {
            pos_ += 5;
            return Value{false};
        }
        fail("Expected 'true' or 'false'");
    }

    Value parse_null()
    {
        if (json_.substr(pos_, 4) == "null") {
            pos_ += 4;
            return Value{};
        }
        fail("Expected 'null'");
    }
};

} // anonymous namespace

std::string to_json(const Value& val, bool compact)
{
    std::ostringstream oss;
    to_json_impl(val, oss, compact, 0);
    return oss.str();
}

Value parse_json(std::string_view json_str)
{
    JsonParser parser(json_str);
    return parser.parse();
}

Value from_json(std::string_view json_str, std::string* error_out)
{
    try {
        return parse_json(json_str);
    } catch (const JsonParseError& e) {
        if (error_out) *error_out = e.what();
        return Value{};
    }
}

Value load_json_file(const std::string& file_path)
{
    std::ifstream in(file_path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("cannot open '" + file_path + "'");
    }
    std::ostringstream content;
    content << in.rdbuf();
    if (in.bad()) {
        throw std::runtime_error("failed to read '" + file_path + "'");
    }
    return parse_json(content.str());
}

// ============================================================
// Explicit Template Instantiations
//
// These generate the code for the BasicValue specializations declared
// 'extern template' in value.h.
// ============================================================

STRUCT_DIFF_EXPORT_TEMPLATE BasicValue<unsafe_memory_policy>;
STRUCT_DIFF_EXPORT_TEMPLATE BasicValue<thread_safe_memory_policy>;

} // namespace struct_diff
