#pragma once

#include "query/predicate.hpp"

#include <string_view>
#include <variant>

namespace mockdb::query {

// Tokenizer for the or() mini-language:
//
//   filter := term { ',' term }
//   term   := column '.' op '.' literal
//   op     := "eq" | "neq"
//
// The literal is everything after the second '.', so it may itself contain
// dots ("email.eq.jo@example.com").  Terms that don't fit the grammar –
// missing parts, empty column, any other operator – become MalformedTerm and
// never match; they are not reported as errors.
//
// Thread-safe: pure function, no shared state.
[[nodiscard]] OrTerm parse_or_term(std::string_view term);

[[nodiscard]] AnyOf parse_or_filter(std::string_view filter);

} // namespace mockdb::query
