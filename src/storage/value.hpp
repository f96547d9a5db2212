#pragma once

#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mockdb {

// ── Value ─────────────────────────────────────────────────────────────────────
//
// One field of a record: null, bool, integer, double, string or an array of
// values.  Integers and doubles behave as one numeric domain for equality and
// ordering (1 == 1.0); all other comparisons require matching kinds.

class Value {
public:
    using Array = std::vector<Value>;

    // Matches the alternative order of Storage.
    enum class Kind : uint8_t {
        Null   = 0,
        Bool   = 1,
        Int    = 2,
        Double = 3,
        String = 4,
        Array  = 5,
    };

    Value() noexcept : data_(nullptr) {}
    Value(std::nullptr_t) noexcept : data_(nullptr) {}
    Value(bool b) noexcept : data_(b) {}

    template <std::integral I>
        requires (!std::same_as<I, bool>)
    Value(I i) noexcept : data_(static_cast<int64_t>(i)) {}

    Value(double d) noexcept : data_(d) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(std::string_view s) : data_(std::string(s)) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(Array a) : data_(std::move(a)) {}

    // Braces are reserved for Record literals, so arrays get a named factory.
    [[nodiscard]] static Value array(std::initializer_list<Value> items) {
        return Value(Array(items));
    }

    [[nodiscard]] Kind kind() const noexcept { return static_cast<Kind>(data_.index()); }

    [[nodiscard]] bool is_null()   const noexcept { return kind() == Kind::Null; }
    [[nodiscard]] bool is_bool()   const noexcept { return kind() == Kind::Bool; }
    [[nodiscard]] bool is_number() const noexcept { return kind() == Kind::Int || kind() == Kind::Double; }
    [[nodiscard]] bool is_string() const noexcept { return kind() == Kind::String; }
    [[nodiscard]] bool is_array()  const noexcept { return kind() == Kind::Array; }

    // Accessors throw std::bad_variant_access on a kind mismatch.
    [[nodiscard]] bool               as_bool()   const { return std::get<bool>(data_); }
    [[nodiscard]] int64_t            as_int()    const { return std::get<int64_t>(data_); }
    [[nodiscard]] const std::string& as_string() const { return std::get<std::string>(data_); }
    [[nodiscard]] const Array&       as_array()  const { return std::get<Array>(data_); }

    // Numeric view of an Int or Double.
    [[nodiscard]] double as_double() const;

    // True if the array holds an element equal to `v` (false for non-arrays).
    [[nodiscard]] bool array_includes(const Value& v) const;

    // Compare against an untyped textual literal: strings compare verbatim,
    // numbers by value, booleans as "true"/"false", null as "null".
    // Arrays never match.
    [[nodiscard]] bool matches_literal(std::string_view literal) const;

    // Compact JSON rendering.
    [[nodiscard]] std::string to_json() const;

    friend bool operator==(const Value& a, const Value& b);

private:
    using Storage = std::variant<std::nullptr_t, bool, int64_t, double, std::string, Array>;

    Storage data_;
};

// Three-way comparison for ordering and range filters.  Numbers compare
// numerically, strings lexicographically, booleans false < true.  Values of
// different kinds (and arrays) are unordered.
[[nodiscard]] std::partial_ordering compare(const Value& a, const Value& b);

[[nodiscard]] std::string_view kind_name(Value::Kind kind) noexcept;

// ── Record ────────────────────────────────────────────────────────────────────

// Open-ended field map; std::less<> allows lookup by string_view.
using Record = std::map<std::string, Value, std::less<>>;

// Returns the field named `column`, or nullptr if the record doesn't have it.
[[nodiscard]] const Value* find_field(const Record& record, std::string_view column);

// Compact JSON object rendering; keys appear in sorted order.
[[nodiscard]] std::string to_json(const Record& record);

} // namespace mockdb
