#include "json.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace paneldock::json
{

// ─── Value ───────────────────────────────────────────────────────────────────

Value Value::array()
{
    Value v;
    v.type_ = Type::Array;
    return v;
}

Value Value::object()
{
    Value v;
    v.type_ = Type::Object;
    return v;
}

const Value* Value::find(std::string_view key) const
{
    if (type_ != Type::Object)
        return nullptr;
    for (const auto& [k, v] : object_)
    {
        if (k == key)
            return &v;
    }
    return nullptr;
}

Value& Value::set(std::string key, Value value)
{
    if (type_ != Type::Object)
    {
        *this = object();
    }
    for (auto& [k, v] : object_)
    {
        if (k == key)
        {
            v = std::move(value);
            return v;
        }
    }
    object_.emplace_back(std::move(key), std::move(value));
    return object_.back().second;
}

void Value::push_back(Value value)
{
    if (type_ != Type::Array)
        *this = array();
    array_.push_back(std::move(value));
}

size_t Value::size() const
{
    if (type_ == Type::Array)
        return array_.size();
    if (type_ == Type::Object)
        return object_.size();
    return 0;
}

std::optional<std::string> Value::get_string(std::string_view key) const
{
    const Value* v = find(key);
    if (!v || !v->is_string())
        return std::nullopt;
    return v->as_string();
}

std::optional<double> Value::get_number(std::string_view key) const
{
    const Value* v = find(key);
    if (!v || !v->is_number())
        return std::nullopt;
    return v->as_number();
}

std::optional<bool> Value::get_bool(std::string_view key) const
{
    const Value* v = find(key);
    if (!v || !v->is_bool())
        return std::nullopt;
    return v->as_bool();
}

bool Value::operator==(const Value& other) const
{
    if (type_ != other.type_)
        return false;
    switch (type_)
    {
        case Type::Null:
            return true;
        case Type::Bool:
            return bool_ == other.bool_;
        case Type::Number:
            return number_ == other.number_;
        case Type::String:
            return string_ == other.string_;
        case Type::Array:
            return array_ == other.array_;
        case Type::Object:
            return object_ == other.object_;
    }
    return false;
}

std::string Value::dump() const
{
    std::string out;
    dump_into(out);
    return out;
}

void Value::dump_into(std::string& out) const
{
    switch (type_)
    {
        case Type::Null:
            out += "null";
            break;
        case Type::Bool:
            out += bool_ ? "true" : "false";
            break;
        case Type::Number:
            out += format_number(number_);
            break;
        case Type::String:
            out += '"';
            out += escape_string(string_);
            out += '"';
            break;
        case Type::Array:
        {
            out += '[';
            for (size_t i = 0; i < array_.size(); ++i)
            {
                if (i > 0)
                    out += ',';
                array_[i].dump_into(out);
            }
            out += ']';
            break;
        }
        case Type::Object:
        {
            out += '{';
            for (size_t i = 0; i < object_.size(); ++i)
            {
                if (i > 0)
                    out += ',';
                out += '"';
                out += escape_string(object_[i].first);
                out += "\":";
                object_[i].second.dump_into(out);
            }
            out += '}';
            break;
        }
    }
}

// ─── Helpers ─────────────────────────────────────────────────────────────────

std::string escape_string(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (char c : text)
    {
        switch (c)
        {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            case '\b':
                out += "\\b";
                break;
            case '\f':
                out += "\\f";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20)
                {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                }
                else
                {
                    out += c;
                }
        }
    }
    return out;
}

std::string format_number(double value)
{
    if (!std::isfinite(value))
        return "null";

    if (value == std::floor(value) && std::fabs(value) < 1e15)
    {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.0f", value);
        return buf;
    }

    // Shortest representation that reads back to the same double.
    char buf[32];
    for (int precision = 6; precision <= 17; ++precision)
    {
        std::snprintf(buf, sizeof(buf), "%.*g", precision, value);
        if (std::strtod(buf, nullptr) == value)
            break;
    }
    return buf;
}

// ─── Parser ──────────────────────────────────────────────────────────────────

namespace
{

constexpr int MAX_DEPTH = 256;

class Parser
{
   public:
    explicit Parser(std::string_view text) : text_(text) {}

    std::optional<Value> parse_document()
    {
        skip_ws();
        auto value = parse_value(0);
        if (!value)
            return std::nullopt;
        skip_ws();
        if (pos_ != text_.size())
            return fail("trailing characters");
        return value;
    }

    const ParseError& error() const { return error_; }

   private:
    std::nullopt_t fail(const char* message)
    {
        if (error_.message.empty())
        {
            error_.offset  = pos_;
            error_.message = message;
        }
        return std::nullopt;
    }

    void skip_ws()
    {
        while (pos_ < text_.size()
               && (text_[pos_] == ' ' || text_[pos_] == '\n' || text_[pos_] == '\r'
                   || text_[pos_] == '\t'))
            ++pos_;
    }

    bool consume_literal(std::string_view literal)
    {
        if (text_.substr(pos_, literal.size()) != literal)
            return false;
        pos_ += literal.size();
        return true;
    }

    std::optional<Value> parse_value(int depth)
    {
        if (depth > MAX_DEPTH)
            return fail("nesting too deep");
        if (pos_ >= text_.size())
            return fail("unexpected end of input");

        char c = text_[pos_];
        switch (c)
        {
            case '{':
                return parse_object(depth);
            case '[':
                return parse_array(depth);
            case '"':
            {
                auto s = parse_string();
                if (!s)
                    return std::nullopt;
                return Value(std::move(*s));
            }
            case 't':
                if (consume_literal("true"))
                    return Value(true);
                return fail("invalid literal");
            case 'f':
                if (consume_literal("false"))
                    return Value(false);
                return fail("invalid literal");
            case 'n':
                if (consume_literal("null"))
                    return Value();
                return fail("invalid literal");
            default:
                if (c == '-' || (c >= '0' && c <= '9'))
                    return parse_number();
                return fail("unexpected character");
        }
    }

    std::optional<Value> parse_number()
    {
        size_t start = pos_;
        if (text_[pos_] == '-')
            ++pos_;
        if (pos_ >= text_.size())
            return fail("invalid number");
        if (text_[pos_] == '0')
        {
            ++pos_;
        }
        else if (text_[pos_] >= '1' && text_[pos_] <= '9')
        {
            while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_])))
                ++pos_;
        }
        else
        {
            return fail("invalid number");
        }
        if (pos_ < text_.size() && text_[pos_] == '.')
        {
            ++pos_;
            size_t digits = pos_;
            while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_])))
                ++pos_;
            if (pos_ == digits)
                return fail("invalid fraction");
        }
        if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E'))
        {
            ++pos_;
            if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-'))
                ++pos_;
            size_t digits = pos_;
            while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_])))
                ++pos_;
            if (pos_ == digits)
                return fail("invalid exponent");
        }
        std::string literal(text_.substr(start, pos_ - start));
        return Value(std::strtod(literal.c_str(), nullptr));
    }

    static void append_utf8(std::string& out, unsigned cp)
    {
        if (cp < 0x80)
        {
            out += static_cast<char>(cp);
        }
        else if (cp < 0x800)
        {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
        else if (cp < 0x10000)
        {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
        else
        {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    std::optional<unsigned> parse_hex4()
    {
        if (pos_ + 4 > text_.size())
            return std::nullopt;
        unsigned value = 0;
        for (int i = 0; i < 4; ++i)
        {
            char c = text_[pos_++];
            value <<= 4;
            if (c >= '0' && c <= '9')
                value |= static_cast<unsigned>(c - '0');
            else if (c >= 'a' && c <= 'f')
                value |= static_cast<unsigned>(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F')
                value |= static_cast<unsigned>(c - 'A' + 10);
            else
                return std::nullopt;
        }
        return value;
    }

    std::optional<std::string> parse_string()
    {
        ++pos_;   // opening quote
        std::string out;
        while (pos_ < text_.size())
        {
            char c = text_[pos_++];
            if (c == '"')
                return out;
            if (static_cast<unsigned char>(c) < 0x20)
                return fail("control character in string");
            if (c != '\\')
            {
                out += c;
                continue;
            }
            if (pos_ >= text_.size())
                break;
            char esc = text_[pos_++];
            switch (esc)
            {
                case '"':
                    out += '"';
                    break;
                case '\\':
                    out += '\\';
                    break;
                case '/':
                    out += '/';
                    break;
                case 'b':
                    out += '\b';
                    break;
                case 'f':
                    out += '\f';
                    break;
                case 'n':
                    out += '\n';
                    break;
                case 'r':
                    out += '\r';
                    break;
                case 't':
                    out += '\t';
                    break;
                case 'u':
                {
                    auto cp = parse_hex4();
                    if (!cp)
                        return fail("invalid unicode escape");
                    unsigned code = *cp;
                    if (code >= 0xD800 && code <= 0xDBFF)
                    {
                        if (!consume_literal("\\u"))
                            return fail("unpaired surrogate");
                        auto low = parse_hex4();
                        if (!low || *low < 0xDC00 || *low > 0xDFFF)
                            return fail("unpaired surrogate");
                        code = 0x10000 + ((code - 0xD800) << 10) + (*low - 0xDC00);
                    }
                    append_utf8(out, code);
                    break;
                }
                default:
                    return fail("invalid escape");
            }
        }
        return fail("unterminated string");
    }

    std::optional<Value> parse_array(int depth)
    {
        ++pos_;
        Value result = Value::array();
        skip_ws();
        if (pos_ < text_.size() && text_[pos_] == ']')
        {
            ++pos_;
            return result;
        }
        while (true)
        {
            skip_ws();
            auto item = parse_value(depth + 1);
            if (!item)
                return std::nullopt;
            result.push_back(std::move(*item));
            skip_ws();
            if (pos_ >= text_.size())
                return fail("unterminated array");
            if (text_[pos_] == ',')
            {
                ++pos_;
                continue;
            }
            if (text_[pos_] == ']')
            {
                ++pos_;
                return result;
            }
            return fail("expected ',' or ']'");
        }
    }

    std::optional<Value> parse_object(int depth)
    {
        ++pos_;
        Value result = Value::object();
        skip_ws();
        if (pos_ < text_.size() && text_[pos_] == '}')
        {
            ++pos_;
            return result;
        }
        while (true)
        {
            skip_ws();
            if (pos_ >= text_.size() || text_[pos_] != '"')
                return fail("expected object key");
            auto key = parse_string();
            if (!key)
                return std::nullopt;
            skip_ws();
            if (pos_ >= text_.size() || text_[pos_] != ':')
                return fail("expected ':'");
            ++pos_;
            skip_ws();
            auto value = parse_value(depth + 1);
            if (!value)
                return std::nullopt;
            result.set(std::move(*key), std::move(*value));
            skip_ws();
            if (pos_ >= text_.size())
                return fail("unterminated object");
            if (text_[pos_] == ',')
            {
                ++pos_;
                continue;
            }
            if (text_[pos_] == '}')
            {
                ++pos_;
                return result;
            }
            return fail("expected ',' or '}'");
        }
    }

    std::string_view text_;
    size_t           pos_ = 0;
    ParseError       error_;
};

}   // namespace

std::optional<Value> parse(std::string_view text, ParseError* error)
{
    Parser parser(text);
    auto   result = parser.parse_document();
    if (!result && error)
        *error = parser.error();
    return result;
}

bool is_valid(std::string_view text)
{
    return parse(text).has_value();
}

}   // namespace paneldock::json
