#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace paneldock::json
{

// Minimal JSON document model used for persistence, configuration and host
// payloads (no external dependency). Objects keep insertion order.
class Value
{
   public:
    enum class Type
    {
        Null,
        Bool,
        Number,
        String,
        Array,
        Object
    };

    using Array  = std::vector<Value>;
    using Member = std::pair<std::string, Value>;
    using Object = std::vector<Member>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b) : type_(Type::Bool), bool_(b) {}
    Value(double n) : type_(Type::Number), number_(n) {}
    Value(int n) : type_(Type::Number), number_(n) {}
    Value(size_t n) : type_(Type::Number), number_(static_cast<double>(n)) {}
    Value(std::string s) : type_(Type::String), string_(std::move(s)) {}
    Value(const char* s) : type_(Type::String), string_(s) {}

    static Value array();
    static Value object();

    Type type() const { return type_; }
    bool is_null() const { return type_ == Type::Null; }
    bool is_bool() const { return type_ == Type::Bool; }
    bool is_number() const { return type_ == Type::Number; }
    bool is_string() const { return type_ == Type::String; }
    bool is_array() const { return type_ == Type::Array; }
    bool is_object() const { return type_ == Type::Object; }

    bool               as_bool() const { return bool_; }
    double             as_number() const { return number_; }
    const std::string& as_string() const { return string_; }
    const Array&       as_array() const { return array_; }
    const Object&      as_object() const { return object_; }

    // Object access. find() returns nullptr for a missing key or a
    // non-object value.
    const Value* find(std::string_view key) const;
    Value&       set(std::string key, Value value);

    // Array append.
    void   push_back(Value value);
    size_t size() const;

    std::optional<std::string> get_string(std::string_view key) const;
    std::optional<double>      get_number(std::string_view key) const;
    std::optional<bool>        get_bool(std::string_view key) const;

    // Compact serialization.
    std::string dump() const;

    bool operator==(const Value& other) const;

   private:
    void dump_into(std::string& out) const;

    Type        type_   = Type::Null;
    bool        bool_   = false;
    double      number_ = 0.0;
    std::string string_;
    Array       array_;
    Object      object_;
};

struct ParseError
{
    size_t      offset = 0;
    std::string message;
};

// Parses a complete document. Trailing non-whitespace is an error.
std::optional<Value> parse(std::string_view text, ParseError* error = nullptr);

// True when `text` is a single well-formed JSON document.
bool is_valid(std::string_view text);

std::string escape_string(std::string_view text);
std::string format_number(double value);

}   // namespace paneldock::json
