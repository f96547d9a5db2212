#include "query/or_filter.hpp"

#include <string>

namespace mockdb::query {

namespace {

// Split `s` on the first `sep`, returning {head, rest}.
// If `sep` is absent, rest is empty and found is false.
struct Split {
    std::string_view head;
    std::string_view rest;
    bool             found;
};

Split split_once(std::string_view s, char sep) {
    const auto pos = s.find(sep);
    if (pos == std::string_view::npos) {
        return {s, {}, false};
    }
    return {s.substr(0, pos), s.substr(pos + 1), true};
}

} // namespace

OrTerm parse_or_term(std::string_view term) {
    const auto [column, after_column, has_op] = split_once(term, '.');
    if (!has_op || column.empty()) {
        return MalformedTerm{std::string(term)};
    }

    const auto [op, literal, has_literal] = split_once(after_column, '.');
    if (!has_literal) {
        return MalformedTerm{std::string(term)};
    }

    if (op == "eq") {
        return LiteralComparison{std::string(column), CompareOp::Eq, std::string(literal)};
    }
    if (op == "neq") {
        return LiteralComparison{std::string(column), CompareOp::Neq, std::string(literal)};
    }
    return MalformedTerm{std::string(term)};
}

AnyOf parse_or_filter(std::string_view filter) {
    AnyOf result;
    std::string_view remaining = filter;
    for (;;) {
        const auto [term, rest, more] = split_once(remaining, ',');
        result.terms.push_back(parse_or_term(term));
        if (!more) {
            break;
        }
        remaining = rest;
    }
    return result;
}

} // namespace mockdb::query
