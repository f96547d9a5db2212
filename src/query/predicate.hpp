#pragma once

#include "storage/value.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mockdb::query {

// ── Predicates ────────────────────────────────────────────────────────────────
//
// One filter call of the query builder becomes exactly one Predicate.  Each
// predicate kind is a plain struct; the whole set is wrapped in a std::variant
// so the evaluator can std::visit over it without inheritance.

enum class CompareOp : uint8_t {
    Eq,
    Neq,
    Gt,
    Gte,
    Lt,
    Lte,
};

[[nodiscard]] std::string_view to_string(CompareOp op) noexcept;

// eq / neq / gt / gte / lt / lte against a typed operand.
struct Comparison {
    std::string column;
    CompareOp   op;
    Value       operand;
};

// like / ilike: '%' is a wildcard, matching is case-insensitive and
// unanchored (the pattern may match anywhere in the text).
struct PatternMatch {
    std::string column;
    std::string pattern;
    std::string folded;   // lowercased pattern wrapped in '%' on both ends
};

// is: exact match against null or a boolean.  A missing column counts as null.
struct IsMatch {
    std::string column;
    Value       operand;
};

// in: the column value equals one of `values`.
struct InSet {
    std::string        column;
    std::vector<Value> values;
};

// contains: the array column holds every element of `values`.
struct Contains {
    std::string  column;
    Value::Array values;
};

// containedBy: every element of the array column appears in `values`.
struct ContainedBy {
    std::string  column;
    Value::Array values;
};

// ── or() terms ────────────────────────────────────────────────────────────────

// `column.op.literal` with op restricted to eq / neq.  The literal is untyped
// text and is matched with Value::matches_literal().
struct LiteralComparison {
    std::string column;
    CompareOp   op;
    std::string literal;
};

// A term the or() grammar does not accept.  Always evaluates to false.
struct MalformedTerm {
    std::string text;
};

using OrTerm = std::variant<LiteralComparison, MalformedTerm>;

// Logical OR of the parsed terms; an empty term list matches nothing.
struct AnyOf {
    std::vector<OrTerm> terms;
};

using Predicate =
    std::variant<Comparison, PatternMatch, IsMatch, InSet, Contains, ContainedBy, AnyOf>;

// ── Construction ─────────────────────────────────────────────────────────────

// Prepares a SQL LIKE pattern for case-insensitive matching.  Only '%' is
// special; every other character, regex metacharacters included, is literal.
[[nodiscard]] PatternMatch make_pattern_match(std::string column, std::string_view pattern);

// Throws std::invalid_argument unless `operand` is null or a boolean.
[[nodiscard]] IsMatch make_is_match(std::string column, Value operand);

// Operands given as a scalar are treated as a one-element array.
[[nodiscard]] Contains make_contains(std::string column, Value operand);
[[nodiscard]] ContainedBy make_contained_by(std::string column, Value operand);

// ── Evaluation ───────────────────────────────────────────────────────────────

// Iterative LIKE matcher over ASCII case-folded text; stack use does not grow
// with the length of `text`.  `folded` comes from make_pattern_match().
[[nodiscard]] bool like_match(std::string_view text, std::string_view folded);

[[nodiscard]] bool evaluate(const Predicate& predicate, const Record& record);

// True if `record` satisfies every predicate (AND); true for an empty list.
[[nodiscard]] bool matches_all(const std::vector<Predicate>& predicates, const Record& record);

} // namespace mockdb::query
