#include "query/or_filter.hpp"

#include <gtest/gtest.h>

#include <string>
#include <variant>

namespace {

using namespace mockdb;
using namespace mockdb::query;

// ── parse_or_term ─────────────────────────────────────────────────────────────

TEST(OrFilterTest, ParsesEqTerm) {
    auto term = parse_or_term("status.eq.active");
    ASSERT_TRUE(std::holds_alternative<LiteralComparison>(term));
    const auto& lc = std::get<LiteralComparison>(term);
    EXPECT_EQ(lc.column, "status");
    EXPECT_EQ(lc.op, CompareOp::Eq);
    EXPECT_EQ(lc.literal, "active");
}

TEST(OrFilterTest, ParsesNeqTerm) {
    auto term = parse_or_term("status.neq.lost");
    ASSERT_TRUE(std::holds_alternative<LiteralComparison>(term));
    EXPECT_EQ(std::get<LiteralComparison>(term).op, CompareOp::Neq);
}

TEST(OrFilterTest, LiteralKeepsRemainingDots) {
    auto term = parse_or_term("email.eq.maya.patel@example.com");
    ASSERT_TRUE(std::holds_alternative<LiteralComparison>(term));
    EXPECT_EQ(std::get<LiteralComparison>(term).literal, "maya.patel@example.com");
}

TEST(OrFilterTest, EmptyLiteralIsAllowed) {
    auto term = parse_or_term("status.eq.");
    ASSERT_TRUE(std::holds_alternative<LiteralComparison>(term));
    EXPECT_EQ(std::get<LiteralComparison>(term).literal, "");
}

TEST(OrFilterTest, UnsupportedOperatorIsMalformed) {
    for (const char* text : {"score.gt.5", "name.like.%a%", "status.in.(a,b)", "status.EQ.x"}) {
        auto term = parse_or_term(text);
        ASSERT_TRUE(std::holds_alternative<MalformedTerm>(term)) << text;
        EXPECT_EQ(std::get<MalformedTerm>(term).text, text);
    }
}

TEST(OrFilterTest, MissingPartsAreMalformed) {
    for (const char* text : {"", "status", "status.eq", ".eq.x"}) {
        EXPECT_TRUE(std::holds_alternative<MalformedTerm>(parse_or_term(text))) << text;
    }
}

// ── parse_or_filter ──────────────────────────────────────────────────────────

TEST(OrFilterTest, SplitsOnCommas) {
    auto any = parse_or_filter("status.eq.active,status.eq.new,score.gt.9");
    ASSERT_EQ(any.terms.size(), 3u);
    EXPECT_TRUE(std::holds_alternative<LiteralComparison>(any.terms[0]));
    EXPECT_TRUE(std::holds_alternative<LiteralComparison>(any.terms[1]));
    EXPECT_TRUE(std::holds_alternative<MalformedTerm>(any.terms[2]));
}

TEST(OrFilterTest, TrailingCommaYieldsMalformedTerm) {
    auto any = parse_or_filter("status.eq.active,");
    ASSERT_EQ(any.terms.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<MalformedTerm>(any.terms[1]));
}

// ── Evaluation ───────────────────────────────────────────────────────────────

TEST(OrFilterTest, MatchesEitherTerm) {
    const Predicate p = parse_or_filter("status.eq.active,status.eq.new");
    EXPECT_TRUE(evaluate(p, Record{{"status", "active"}}));
    EXPECT_TRUE(evaluate(p, Record{{"status", "new"}}));
    EXPECT_FALSE(evaluate(p, Record{{"status", "won"}}));
    EXPECT_FALSE(evaluate(p, Record{}));
}

TEST(OrFilterTest, LiteralMatchesTypedFields) {
    const Predicate p = parse_or_filter("score.eq.90,is_deleted.eq.true");
    EXPECT_TRUE(evaluate(p, Record{{"score", 90}, {"is_deleted", false}}));
    EXPECT_TRUE(evaluate(p, Record{{"score", 10}, {"is_deleted", true}}));
    EXPECT_FALSE(evaluate(p, Record{{"score", 10}, {"is_deleted", false}}));
}

TEST(OrFilterTest, NeqMatchesMissingColumn) {
    const Predicate p = parse_or_filter("status.neq.won");
    EXPECT_TRUE(evaluate(p, Record{}));
    EXPECT_FALSE(evaluate(p, Record{{"status", "won"}}));
}

TEST(OrFilterTest, MalformedTermsNeverMatchButDoNotMaskOthers) {
    const Predicate typo = parse_or_filter("status.equals.active");
    EXPECT_FALSE(evaluate(typo, Record{{"status", "active"}}));

    const Predicate mixed = parse_or_filter("status.equals.active,status.eq.new");
    EXPECT_TRUE(evaluate(mixed, Record{{"status", "new"}}));
}

} // namespace
