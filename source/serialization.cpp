// serialization.cpp - JSON conversion for Value

#include <deep_diff/serialization.h>
#include <deep_diff/builders.h>

#include <charconv>
#include <cstdio>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace deep_diff {

namespace {

// ============================================================
// JSON Writer
// ============================================================

std::string json_escape_string(const std::string& s) {
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
                    // Control characters as \uXXXX
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

void write_double(double d, std::ostringstream& oss) {
    if (!std::isfinite(d)) {
        oss << "null";
        return;
    }
    char buf[32];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), d);
    if (ec != std::errc{}) {
        oss << "null";
        return;
    }
    std::string_view text(buf, static_cast<std::size_t>(end - buf));
    oss << text;
    // Keep integral doubles recognizable as doubles ("1.0", not "1")
    if (text.find_first_of(".e") == std::string_view::npos) {
        oss << ".0";
    }
}

void to_json_impl(const Value& val, std::ostringstream& oss, bool compact, int indent_level) {
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
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << arg;
        } else if constexpr (std::is_same_v<T, double>) {
            write_double(arg, oss);
        } else if constexpr (std::is_same_v<T, std::string>) {
            oss << "\"" << json_escape_string(arg) << "\"";
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            if (arg.size() == 0) {
                oss << "{}";
            } else {
                oss << "{" << newline;
                bool first = true;
                for (const auto& [k, v] : arg) {
                    if (!first) oss << "," << newline;
                    first = false;
                    oss << child_indent << "\"" << json_escape_string(k) << "\":" << space_after_colon;
                    to_json_impl(*v, oss, compact, indent_level + 1);
                }
                oss << newline << indent << "}";
            }
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            if (arg.size() == 0) {
                oss << "[]";
            } else {
                oss << "[" << newline;
                bool first = true;
                for (const auto& v : arg) {
                    if (!first) oss << "," << newline;
                    first = false;
                    oss << child_indent;
                    to_json_impl(*v, oss, compact, indent_level + 1);
                }
                oss << newline << indent << "]";
            }
        }
    }, val.data);
}

// ============================================================
// Simple JSON Parser
// ============================================================

class JsonParser {
public:
    explicit JsonParser(std::string_view json) : json_(json), pos_(0), depth_(0) {}

    Value parse(std::string* error_out) {
        try {
            skip_whitespace();
            if (pos_ >= json_.size()) {
                throw std::runtime_error("Empty JSON input");
            }
            Value result = parse_value();
            skip_whitespace();
            if (pos_ < json_.size()) {
                throw std::runtime_error("Unexpected trailing character '" + std::string(1, json_[pos_]) +
                                         "' at position " + std::to_string(pos_));
            }
            if (error_out) error_out->clear();
            return result;
        } catch (const std::runtime_error& e) {
            if (error_out) *error_out = e.what();
            return Value{};
        }
    }

private:
    // Nesting cap so hostile input cannot exhaust the stack
    static constexpr std::size_t max_depth = 512;

    std::string_view json_;
    std::size_t pos_;
    std::size_t depth_;

    char peek() const {
        return pos_ < json_.size() ? json_[pos_] : '\0';
    }

    char consume() {
        return pos_ < json_.size() ? json_[pos_++] : '\0';
    }

    static bool is_digit(char c) {
        return c >= '0' && c <= '9';
    }

    void skip_whitespace() {
        while (pos_ < json_.size()) {
            const char c = json_[pos_];
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
            ++pos_;
        }
    }

    void expect(char c) {
        skip_whitespace();
        if (consume() != c) {
            throw std::runtime_error(std::string("Expected '") + c + "' at position " + std::to_string(pos_));
        }
    }

    void enter() {
        if (++depth_ > max_depth) {
            throw std::runtime_error("Nesting deeper than " + std::to_string(max_depth) +
                                     " at position " + std::to_string(pos_));
        }
    }

    Value parse_value() {
        skip_whitespace();
        char c = peek();

        if (c == '{') return parse_object();
        if (c == '[') return parse_array();
        if (c == '"') return parse_string();
        if (c == 't' || c == 'f') return parse_bool();
        if (c == 'n') return parse_null();
        if (c == '-' || is_digit(c)) return parse_number();

        if (c == '\0' && pos_ >= json_.size()) {
            throw std::runtime_error("Unexpected end of input");
        }
        throw std::runtime_error("Unexpected character '" + std::string(1, c) + "' at position " + std::to_string(pos_));
    }

    Value parse_object() {
        enter();
        expect('{');
        skip_whitespace();

        MapBuilder builder;
        if (peek() == '}') {
            consume();
            --depth_;
            return builder.finish();
        }

        while (true) {
            skip_whitespace();
            std::string key = parse_string_raw();
            expect(':');
            builder.set(key, parse_value());

            skip_whitespace();
            char c = peek();
            if (c == '}') {
                consume();
                break;
            }
            if (c != ',') {
                throw std::runtime_error("Expected ',' or '}' in object at position " + std::to_string(pos_));
            }
            consume();
        }

        --depth_;
        return builder.finish();
    }

    Value parse_array() {
        enter();
        expect('[');
        skip_whitespace();

        VectorBuilder builder;
        if (peek() == ']') {
            consume();
            --depth_;
            return builder.finish();
        }

        while (true) {
            builder.push_back(parse_value());

            skip_whitespace();
            char c = peek();
            if (c == ']') {
                consume();
                break;
            }
            if (c != ',') {
                throw std::runtime_error("Expected ',' or ']' in array at position " + std::to_string(pos_));
            }
            consume();
        }

        --depth_;
        return builder.finish();
    }

    unsigned parse_hex4() {
        if (pos_ + 4 > json_.size()) {
            throw std::runtime_error("Invalid unicode escape at position " + std::to_string(pos_));
        }
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(json_.data() + pos_, json_.data() + pos_ + 4, value, 16);
        if (ec != std::errc{} || ptr != json_.data() + pos_ + 4) {
            throw std::runtime_error("Invalid unicode escape at position " + std::to_string(pos_));
        }
        pos_ += 4;
        return value;
    }

    static void append_utf8(std::string& out, unsigned codepoint) {
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

    std::string parse_string_raw() {
        expect('"');
        std::string result;

        while (pos_ < json_.size()) {
            char c = consume();
            if (c == '"') {
                return result;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                throw std::runtime_error("Unescaped control character in string at position " + std::to_string(pos_ - 1));
            }
            if (c == '\\') {
                if (pos_ >= json_.size()) {
                    throw std::runtime_error("Unexpected end of string escape");
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
                        // A high surrogate must be followed by an escaped low surrogate
                        if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
                            if (json_.compare(pos_, 2, "\\u") != 0) {
                                throw std::runtime_error("Invalid surrogate pair at position " + std::to_string(pos_));
                            }
                            pos_ += 2;
                            unsigned low = parse_hex4();
                            if (low < 0xDC00 || low > 0xDFFF) {
                                throw std::runtime_error("Invalid surrogate pair at position " + std::to_string(pos_));
                            }
                            codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
                        } else if (codepoint >= 0xDC00 && codepoint <= 0xDFFF) {
                            throw std::runtime_error("Invalid surrogate pair at position " + std::to_string(pos_));
                        }
                        append_utf8(result, codepoint);
                        break;
                    }
                    default:
                        throw std::runtime_error("Invalid escape sequence: \\" + std::string(1, escaped));
                }
            } else {
                result += c;
            }
        }

        throw std::runtime_error("Unterminated string");
    }

    Value parse_string() {
        return Value{parse_string_raw()};
    }

    Value parse_number() {
        const std::size_t start = pos_;
        bool is_integer = true;
        const bool negative = peek() == '-';

        if (negative) consume();

        const std::size_t int_start = pos_;
        if (peek() == '0') {
            consume();
        } else if (is_digit(peek())) {
            while (is_digit(peek())) consume();
        } else {
            throw std::runtime_error("Invalid number at position " + std::to_string(start));
        }
        const std::string_view int_digits = json_.substr(int_start, pos_ - int_start);

        std::string_view frac_digits;
        if (peek() == '.') {
            is_integer = false;
            consume();
            if (!is_digit(peek())) {
                throw std::runtime_error("Expected digit after '.' at position " + std::to_string(pos_));
            }
            const std::size_t frac_start = pos_;
            while (is_digit(peek())) consume();
            frac_digits = json_.substr(frac_start, pos_ - frac_start);
        }

        std::string_view exp_text;
        if (peek() == 'e' || peek() == 'E') {
            is_integer = false;
            consume();
            const std::size_t exp_start = pos_;
            if (peek() == '+' || peek() == '-') consume();
            if (!is_digit(peek())) {
                throw std::runtime_error("Expected digit in exponent at position " + std::to_string(pos_));
            }
            while (is_digit(peek())) consume();
            exp_text = json_.substr(exp_start, pos_ - exp_start);
        }

        const char* first = json_.data() + start;
        const char* last = json_.data() + pos_;

        if (is_integer) {
            int64_t i = 0;
            auto [ptr, ec] = std::from_chars(first, last, i);
            if (ec == std::errc{} && ptr == last) {
                return Value{i};
            }
            // Out of int64_t range: fall through to double
        }

        double d = 0.0;
        auto [ptr, ec] = std::from_chars(first, last, d);
        if (ptr != last || (ec != std::errc{} && ec != std::errc::result_out_of_range)) {
            throw std::runtime_error("Invalid number '" + std::string(first, last) + "' at position " + std::to_string(start));
        }
        if (ec == std::errc::result_out_of_range) {
            // from_chars reports underflow and overflow alike
            if (exceeds_double_range(int_digits, frac_digits, exp_text)) {
                throw std::runtime_error("Number out of range '" + std::string(first, last) + "' at position " + std::to_string(start));
            }
            return Value{negative ? -0.0 : 0.0};
        }
        return Value{d};
    }

    /// True when the leading significant digit sits above 10^0 after
    /// applying the exponent. Only meaningful for literals from_chars
    /// flagged as out of range, whose magnitude is far from 1.
    static bool exceeds_double_range(std::string_view int_digits,
                                     std::string_view frac_digits,
                                     std::string_view exp_text)
    {
        int64_t lead = 0;
        const auto int_first = int_digits.find_first_not_of('0');
        if (int_first != std::string_view::npos) {
            lead = static_cast<int64_t>(int_digits.size() - int_first) - 1;
        } else {
            const auto frac_first = frac_digits.find_first_not_of('0');
            if (frac_first == std::string_view::npos) {
                return false;  // zero
            }
            lead = -static_cast<int64_t>(frac_first) - 1;
        }

        int64_t exponent = 0;
        if (!exp_text.empty()) {
            const bool exp_negative = exp_text.front() == '-';
            if (exp_text.front() == '+' || exp_negative) {
                exp_text.remove_prefix(1);
            }
            auto [ptr, ec] = std::from_chars(exp_text.data(), exp_text.data() + exp_text.size(), exponent);
            if (ec == std::errc::result_out_of_range) {
                return !exp_negative;
            }
            if (exp_negative) {
                exponent = -exponent;
            }
        }
        return lead + exponent > 0;
    }

    Value parse_bool() {
        if (json_.compare(pos_, 4, "true") == 0) {
            pos_ += 4;
            return Value{true};
        }
        if (json_.compare(pos_, 5, "false") == 0) {
            pos_ += 5;
            return Value{false};
        }
        throw std::runtime_error("Expected 'true' or 'false' at position " + std::to_string(pos_));
    }

    Value parse_null() {
        if (json_.compare(pos_, 4, "null") == 0) {
            pos_ += 4;
            return Value{};
        }
        throw std::runtime_error("Expected 'null' at position " + std::to_string(pos_));
    }
};

} // anonymous namespace

std::string to_json(const Value& val, bool compact) {
    std::ostringstream oss;
    to_json_impl(val, oss, compact, 0);
    return oss.str();
}

Value from_json(std::string_view json_str, std::string* error_out) {
    JsonParser parser(json_str);
    return parser.parse(error_out);
}

} // namespace deep_diff
