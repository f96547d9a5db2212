#include "storage/value.hpp"

#include <charconv>
#include <cmath>
#include <fmt/format.h>
#include <string>

namespace mockdb {

namespace {

void append_json_string(std::string& out, std::string_view s) {
    out += '"';
    for (const char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
                } else {
                    out += c;
                }
        }
    }
    out += '"';
}

} // namespace

double Value::as_double() const {
    if (kind() == Kind::Int) {
        return static_cast<double>(std::get<int64_t>(data_));
    }
    return std::get<double>(data_);
}

bool Value::array_includes(const Value& v) const {
    if (!is_array()) {
        return false;
    }
    for (const auto& item : as_array()) {
        if (item == v) {
            return true;
        }
    }
    return false;
}

bool Value::matches_literal(std::string_view literal) const {
    switch (kind()) {
        case Kind::Null:
            return literal == "null";
        case Kind::Bool:
            return literal == (as_bool() ? "true" : "false");
        case Kind::Int: {
            int64_t parsed = 0;
            auto [ptr, ec] = std::from_chars(literal.data(), literal.data() + literal.size(), parsed);
            if (ec == std::errc{} && ptr == literal.data() + literal.size()) {
                return parsed == as_int();
            }
            [[fallthrough]];
        }
        case Kind::Double: {
            double parsed = 0.0;
            auto [ptr, ec] = std::from_chars(literal.data(), literal.data() + literal.size(), parsed);
            return ec == std::errc{} && ptr == literal.data() + literal.size() &&
                   parsed == as_double();
        }
        case Kind::String:
            return as_string() == literal;
        case Kind::Array:
            return false;
    }
    return false;
}

std::string Value::to_json() const {
    switch (kind()) {
        case Kind::Null:
            return "null";
        case Kind::Bool:
            return as_bool() ? "true" : "false";
        case Kind::Int:
            return std::to_string(as_int());
        case Kind::Double: {
            const double d = std::get<double>(data_);
            if (!std::isfinite(d)) {
                return "null";
            }
            return fmt::format("{}", d);
        }
        case Kind::String: {
            std::string out;
            append_json_string(out, as_string());
            return out;
        }
        case Kind::Array: {
            std::string out = "[";
            bool first = true;
            for (const auto& item : as_array()) {
                if (!first) out += ',';
                first = false;
                out += item.to_json();
            }
            out += ']';
            return out;
        }
    }
    return "null";
}

bool operator==(const Value& a, const Value& b) {
    if (a.is_number() && b.is_number()) {
        if (a.kind() == Value::Kind::Int && b.kind() == Value::Kind::Int) {
            return a.as_int() == b.as_int();
        }
        return a.as_double() == b.as_double();
    }
    return a.data_ == b.data_;
}

std::partial_ordering compare(const Value& a, const Value& b) {
    if (a.is_number() && b.is_number()) {
        if (a.kind() == Value::Kind::Int && b.kind() == Value::Kind::Int) {
            return a.as_int() <=> b.as_int();
        }
        return a.as_double() <=> b.as_double();
    }
    if (a.kind() != b.kind()) {
        return std::partial_ordering::unordered;
    }
    switch (a.kind()) {
        case Value::Kind::Null:
            return std::partial_ordering::equivalent;
        case Value::Kind::Bool:
            return a.as_bool() <=> b.as_bool();
        case Value::Kind::String:
            return a.as_string().compare(b.as_string()) <=> 0;
        default:
            return std::partial_ordering::unordered;
    }
}

std::string_view kind_name(Value::Kind kind) noexcept {
    switch (kind) {
        case Value::Kind::Null:   return "null";
        case Value::Kind::Bool:   return "bool";
        case Value::Kind::Int:    return "int";
        case Value::Kind::Double: return "double";
        case Value::Kind::String: return "string";
        case Value::Kind::Array:  return "array";
    }
    return "unknown";
}

const Value* find_field(const Record& record, std::string_view column) {
    auto it = record.find(column);
    if (it == record.end()) {
        return nullptr;
    }
    return &it->second;
}

std::string to_json(const Record& record) {
    std::string out = "{";
    bool first = true;
    for (const auto& [key, value] : record) {
        if (!first) out += ',';
        first = false;
        append_json_string(out, key);
        out += ':';
        out += value.to_json();
    }
    out += '}';
    return out;
}

} // namespace mockdb
