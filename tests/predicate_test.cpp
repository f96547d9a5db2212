#include "query/predicate.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace {

using namespace mockdb;
using namespace mockdb::query;

const Record kLead{
    {"id",         "l1"},
    {"name",       "Maya Patel"},
    {"email",      "maya.patel@example.com"},
    {"status",     "active"},
    {"score",      72},
    {"ratio",      0.5},
    {"is_deleted", false},
    {"workspace",  nullptr},
    {"tags",       Value::array({"VIP", "Referral"})},
};

bool eval(const Predicate& p) {
    return evaluate(p, kLead);
}

// ── Comparison ───────────────────────────────────────────────────────────────

TEST(PredicateTest, EqualityOnStringsAndNumbers) {
    EXPECT_TRUE(eval(Comparison{"status", CompareOp::Eq, Value("active")}));
    EXPECT_FALSE(eval(Comparison{"status", CompareOp::Eq, Value("new")}));
    EXPECT_TRUE(eval(Comparison{"score", CompareOp::Eq, Value(72.0)}));
    EXPECT_FALSE(eval(Comparison{"score", CompareOp::Eq, Value("72")}));
}

TEST(PredicateTest, EqOnMissingColumnIsFalseNeqIsTrue) {
    EXPECT_FALSE(eval(Comparison{"missing", CompareOp::Eq, Value("x")}));
    EXPECT_TRUE(eval(Comparison{"missing", CompareOp::Neq, Value("x")}));
}

TEST(PredicateTest, RangeComparisons) {
    EXPECT_TRUE(eval(Comparison{"score", CompareOp::Gt,  Value(71)}));
    EXPECT_FALSE(eval(Comparison{"score", CompareOp::Gt,  Value(72)}));
    EXPECT_TRUE(eval(Comparison{"score", CompareOp::Gte, Value(72)}));
    EXPECT_TRUE(eval(Comparison{"score", CompareOp::Lt,  Value(72.5)}));
    EXPECT_FALSE(eval(Comparison{"score", CompareOp::Lt,  Value(72)}));
    EXPECT_TRUE(eval(Comparison{"score", CompareOp::Lte, Value(72)}));
    EXPECT_TRUE(eval(Comparison{"name",  CompareOp::Gt,  Value("Liam")}));
}

TEST(PredicateTest, RangeComparisonAcrossKindsNeverMatches) {
    EXPECT_FALSE(eval(Comparison{"score", CompareOp::Gt, Value("10")}));
    EXPECT_FALSE(eval(Comparison{"score", CompareOp::Lt, Value("10")}));
    EXPECT_FALSE(eval(Comparison{"missing", CompareOp::Lt, Value(10)}));
}

// ── like / ilike ─────────────────────────────────────────────────────────────

TEST(PredicateTest, LikeIsCaseInsensitiveWithWildcards) {
    EXPECT_TRUE(eval(make_pattern_match("name", "maya%")));
    EXPECT_TRUE(eval(make_pattern_match("email", "%@EXAMPLE.com")));
    EXPECT_TRUE(eval(make_pattern_match("name", "%pat%")));
    EXPECT_FALSE(eval(make_pattern_match("name", "zoe%")));
}

TEST(PredicateTest, LikeMatchesAnywhereInText) {
    EXPECT_TRUE(eval(make_pattern_match("name", "Patel")));
}

TEST(PredicateTest, LikeTreatsRegexMetacharactersLiterally) {
    EXPECT_FALSE(eval(make_pattern_match("email", "maya.patel@example.c.m")));
    EXPECT_NO_THROW((void)make_pattern_match("name", "(unbalanced["));

    const Record r{{"note", "50% off (today)"}};
    EXPECT_TRUE(evaluate(make_pattern_match("note", "50%(today)"), r));
}

TEST(PredicateTest, LikeOnNonStringUsesJsonText) {
    EXPECT_TRUE(eval(make_pattern_match("score", "7%")));
    EXPECT_FALSE(eval(make_pattern_match("missing", "%")));
}

TEST(PredicateTest, LikeMatchHandlesRepeatedWildcards) {
    EXPECT_TRUE(like_match("abcabd", "%ab%d%"));
    EXPECT_TRUE(like_match("", "%%"));
    EXPECT_FALSE(like_match("", "%x%"));
    EXPECT_TRUE(like_match("mississippi", "%m%iss%pi%"));
    EXPECT_FALSE(like_match("mississippi", "%m%iss%px%"));
    EXPECT_TRUE(like_match("ABC", "%abc%"));
}

TEST(PredicateTest, LikeOnLongTextDoesNotExhaustStack) {
    const Record r{{"body", std::string(300'000, 'x') + "Tail"}};
    EXPECT_TRUE(evaluate(make_pattern_match("body", "%tail"), r));
    EXPECT_FALSE(evaluate(make_pattern_match("body", "%tails%"), r));
}

// ── is ───────────────────────────────────────────────────────────────────────

TEST(PredicateTest, IsMatchesNullAndBooleans) {
    EXPECT_TRUE(eval(make_is_match("workspace", nullptr)));
    EXPECT_TRUE(eval(make_is_match("missing", nullptr)));
    EXPECT_TRUE(eval(make_is_match("is_deleted", false)));
    EXPECT_FALSE(eval(make_is_match("is_deleted", true)));
    EXPECT_FALSE(eval(make_is_match("is_deleted", nullptr)));
    EXPECT_FALSE(eval(make_is_match("missing", false)));
}

TEST(PredicateTest, IsRejectsOtherOperands) {
    EXPECT_THROW((void)make_is_match("score", 1), std::invalid_argument);
    EXPECT_THROW((void)make_is_match("status", "null"), std::invalid_argument);
}

// ── in ───────────────────────────────────────────────────────────────────────

TEST(PredicateTest, InTestsMembership) {
    EXPECT_TRUE(eval(InSet{"status", {"new", "active"}}));
    EXPECT_FALSE(eval(InSet{"status", {"won", "lost"}}));
    EXPECT_TRUE(eval(InSet{"score", {10, 72.0}}));
    EXPECT_FALSE(eval(InSet{"status", {}}));
    EXPECT_FALSE(eval(InSet{"missing", {nullptr}}));
}

// ── contains / containedBy ───────────────────────────────────────────────────

TEST(PredicateTest, ContainsIsSupersetTest) {
    EXPECT_TRUE(eval(make_contains("tags", Value::array({"VIP"}))));
    EXPECT_TRUE(eval(make_contains("tags", Value::array({"Referral", "VIP"}))));
    EXPECT_TRUE(eval(make_contains("tags", "VIP")));
    EXPECT_FALSE(eval(make_contains("tags", Value::array({"VIP", "Cold"}))));
    EXPECT_TRUE(eval(make_contains("tags", Value::array({}))));
}

TEST(PredicateTest, ContainedByIsSubsetTest) {
    EXPECT_TRUE(eval(make_contained_by("tags", Value::array({"VIP", "Referral", "Cold"}))));
    EXPECT_FALSE(eval(make_contained_by("tags", Value::array({"VIP"}))));
}

TEST(PredicateTest, ArrayPredicatesRequireArrayColumn) {
    EXPECT_FALSE(eval(make_contains("status", "active")));
    EXPECT_FALSE(eval(make_contained_by("status", Value::array({"active"}))));
    EXPECT_FALSE(eval(make_contains("missing", "x")));
}

// ── matches_all ──────────────────────────────────────────────────────────────

TEST(PredicateTest, MatchesAllIsConjunction) {
    std::vector<Predicate> preds;
    EXPECT_TRUE(matches_all(preds, kLead));

    preds.emplace_back(Comparison{"status", CompareOp::Eq, Value("active")});
    preds.emplace_back(Comparison{"score", CompareOp::Gte, Value(70)});
    EXPECT_TRUE(matches_all(preds, kLead));

    preds.emplace_back(make_is_match("is_deleted", true));
    EXPECT_FALSE(matches_all(preds, kLead));
}

TEST(PredicateTest, EmptyAnyOfMatchesNothing) {
    EXPECT_FALSE(eval(AnyOf{}));
}

} // namespace
