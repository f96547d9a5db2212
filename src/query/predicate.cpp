#include "query/predicate.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/format.h>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace mockdb::query {

namespace {

char fold(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

Value::Array to_array(Value operand) {
    if (operand.is_array()) {
        return operand.as_array();
    }
    return Value::Array{std::move(operand)};
}

bool evaluate_comparison(const Comparison& c, const Record& record) {
    const Value* field = find_field(record, c.column);

    switch (c.op) {
        case CompareOp::Eq:
            return field != nullptr && *field == c.operand;
        case CompareOp::Neq:
            return field == nullptr || !(*field == c.operand);
        default:
            break;
    }

    if (field == nullptr) {
        return false;
    }
    const auto order = compare(*field, c.operand);
    switch (c.op) {
        case CompareOp::Gt:  return order == std::partial_ordering::greater;
        case CompareOp::Gte: return order == std::partial_ordering::greater ||
                                    order == std::partial_ordering::equivalent;
        case CompareOp::Lt:  return order == std::partial_ordering::less;
        case CompareOp::Lte: return order == std::partial_ordering::less ||
                                    order == std::partial_ordering::equivalent;
        default:             return false;
    }
}

bool evaluate_or_term(const OrTerm& term, const Record& record) {
    return std::visit(
        [&](const auto& t) -> bool {
            using T = std::decay_t<decltype(t)>;

            if constexpr (std::is_same_v<T, LiteralComparison>) {
                const Value* field = find_field(record, t.column);
                const bool equal = field != nullptr && field->matches_literal(t.literal);
                return t.op == CompareOp::Eq ? equal : !equal;
            } else {
                static_assert(std::is_same_v<T, MalformedTerm>);
                return false;
            }
        },
        term);
}

} // namespace

std::string_view to_string(CompareOp op) noexcept {
    switch (op) {
        case CompareOp::Eq:  return "eq";
        case CompareOp::Neq: return "neq";
        case CompareOp::Gt:  return "gt";
        case CompareOp::Gte: return "gte";
        case CompareOp::Lt:  return "lt";
        case CompareOp::Lte: return "lte";
    }
    return "?";
}

PatternMatch make_pattern_match(std::string column, std::string_view pattern) {
    std::string folded;
    folded.reserve(pattern.size() + 2);
    folded += '%';
    for (const char c : pattern) {
        folded += fold(c);
    }
    folded += '%';
    return PatternMatch{std::move(column), std::string(pattern), std::move(folded)};
}

bool like_match(std::string_view text, std::string_view folded) {
    std::size_t t = 0;
    std::size_t p = 0;
    std::size_t star = std::string_view::npos;  // position of the last '%' seen
    std::size_t resume = 0;                     // text position to retry from

    while (t < text.size()) {
        if (p < folded.size() && folded[p] == '%') {
            star   = p++;
            resume = t;
        } else if (p < folded.size() && folded[p] == fold(text[t])) {
            ++p;
            ++t;
        } else if (star != std::string_view::npos) {
            p = star + 1;
            t = ++resume;
        } else {
            return false;
        }
    }
    while (p < folded.size() && folded[p] == '%') {
        ++p;
    }
    return p == folded.size();
}

IsMatch make_is_match(std::string column, Value operand) {
    if (!operand.is_null() && !operand.is_bool()) {
        throw std::invalid_argument(
            fmt::format("is() expects null or a boolean, got {}", kind_name(operand.kind())));
    }
    return IsMatch{std::move(column), std::move(operand)};
}

Contains make_contains(std::string column, Value operand) {
    return Contains{std::move(column), to_array(std::move(operand))};
}

ContainedBy make_contained_by(std::string column, Value operand) {
    return ContainedBy{std::move(column), to_array(std::move(operand))};
}

bool evaluate(const Predicate& predicate, const Record& record) {
    return std::visit(
        [&](const auto& p) -> bool {
            using T = std::decay_t<decltype(p)>;

            if constexpr (std::is_same_v<T, Comparison>) {
                return evaluate_comparison(p, record);
            } else if constexpr (std::is_same_v<T, AnyOf>) {
                return std::any_of(p.terms.begin(), p.terms.end(),
                                   [&](const OrTerm& t) { return evaluate_or_term(t, record); });
            } else {
                const Value* field = find_field(record, p.column);

                if constexpr (std::is_same_v<T, PatternMatch>) {
                    if (field == nullptr) {
                        return false;
                    }
                    const std::string text = field->is_string() ? field->as_string() : field->to_json();
                    return like_match(text, p.folded);
                } else if constexpr (std::is_same_v<T, IsMatch>) {
                    // A missing column reads as null.
                    if (field == nullptr) {
                        return p.operand.is_null();
                    }
                    return *field == p.operand;
                } else if constexpr (std::is_same_v<T, InSet>) {
                    return field != nullptr &&
                           std::find(p.values.begin(), p.values.end(), *field) != p.values.end();
                } else if constexpr (std::is_same_v<T, Contains>) {
                    if (field == nullptr || !field->is_array()) {
                        return false;
                    }
                    return std::all_of(p.values.begin(), p.values.end(),
                                       [&](const Value& v) { return field->array_includes(v); });
                } else {
                    static_assert(std::is_same_v<T, ContainedBy>);
                    if (field == nullptr || !field->is_array()) {
                        return false;
                    }
                    const auto& items = field->as_array();
                    return std::all_of(items.begin(), items.end(), [&](const Value& v) {
                        return std::find(p.values.begin(), p.values.end(), v) != p.values.end();
                    });
                }
            }
        },
        predicate);
}

bool matches_all(const std::vector<Predicate>& predicates, const Record& record) {
    return std::all_of(predicates.begin(), predicates.end(),
                       [&](const Predicate& p) { return evaluate(p, record); });
}

} // namespace mockdb::query
