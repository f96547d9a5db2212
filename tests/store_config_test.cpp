#include "common/store_config.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

// ── Helpers ───────────────────────────────────────────────────────────────────

// Build a fake argv array from a vector of strings.
// The returned pointers are valid as long as `args` is alive.
static std::vector<char*> make_argv(std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size());
    for (auto& s : args) {
        argv.push_back(s.data());
    }
    return argv;
}

static mockdb::StoreConfig parse(std::vector<std::string> args) {
    args.insert(args.begin(), "mockdb-query");
    auto argv = make_argv(args);
    return mockdb::parse_config(static_cast<int>(argv.size()), argv.data());
}

// ── Defaults ──────────────────────────────────────────────────────────────────

TEST(StoreConfigTest, DefaultsWithNoArguments) {
    auto cfg = parse({});

    EXPECT_EQ(cfg.log_level,       "info");
    EXPECT_FALSE(cfg.log_operations);
    EXPECT_EQ(cfg.latency_min_ms,  0u);
    EXPECT_EQ(cfg.latency_max_ms,  0u);
    EXPECT_EQ(cfg.seed,            "mockdb");
    EXPECT_EQ(cfg.seed_leads,      0u);
    EXPECT_EQ(cfg.seed_contacts,   0u);
    EXPECT_EQ(cfg.seed_properties, 0u);
}

TEST(StoreConfigTest, DefaultConstructedConfigIsValid) {
    EXPECT_NO_THROW(mockdb::validate(mockdb::StoreConfig{}));
}

// ── Explicit values ───────────────────────────────────────────────────────────

TEST(StoreConfigTest, ParsesAllOptions) {
    auto cfg = parse({
        "--log-level",       "debug",
        "--log-operations",
        "--latency-min-ms",  "50",
        "--latency-max-ms",  "300",
        "--seed",            "demo",
        "--seed-leads",      "25",
        "--seed-contacts",   "10",
        "--seed-properties", "5",
    });

    EXPECT_EQ(cfg.log_level,       "debug");
    EXPECT_TRUE(cfg.log_operations);
    EXPECT_EQ(cfg.latency_min_ms,  50u);
    EXPECT_EQ(cfg.latency_max_ms,  300u);
    EXPECT_EQ(cfg.seed,            "demo");
    EXPECT_EQ(cfg.seed_leads,      25u);
    EXPECT_EQ(cfg.seed_contacts,   10u);
    EXPECT_EQ(cfg.seed_properties, 5u);
}

TEST(StoreConfigTest, EqualLatencyBoundsAreAccepted) {
    auto cfg = parse({"--latency-min-ms", "100", "--latency-max-ms", "100"});
    EXPECT_EQ(cfg.latency_min_ms, 100u);
    EXPECT_EQ(cfg.latency_max_ms, 100u);
}

TEST(StoreConfigTest, OffLogLevelIsAccepted) {
    EXPECT_EQ(parse({"--log-level", "off"}).log_level, "off");
}

// ── Validation errors ─────────────────────────────────────────────────────────

TEST(StoreConfigTest, ThrowsWhenLatencyMinExceedsMax) {
    EXPECT_THROW(parse({"--latency-min-ms", "500", "--latency-max-ms", "100"}),
                 std::runtime_error);
}

TEST(StoreConfigTest, ThrowsOnUnknownLogLevel) {
    EXPECT_THROW(parse({"--log-level", "verbose"}), std::runtime_error);
}

TEST(StoreConfigTest, ThrowsOnEmptySeed) {
    EXPECT_THROW(parse({"--seed", ""}), std::runtime_error);
}

TEST(StoreConfigTest, ThrowsOnNonNumericCount) {
    EXPECT_THROW(parse({"--seed-leads", "many"}), std::runtime_error);
}

TEST(StoreConfigTest, ThrowsOnUnknownOption) {
    EXPECT_THROW(parse({"--no-such-flag"}), std::runtime_error);
}

TEST(StoreConfigTest, HelpThrowsWithUsageText) {
    try {
        (void)parse({"--help"});
        FAIL() << "expected --help to throw";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("--seed-leads"), std::string::npos);
    }
}

TEST(StoreConfigTest, ValidateRejectsInvertedLatency) {
    mockdb::StoreConfig cfg;
    cfg.latency_min_ms = 10;
    EXPECT_THROW(mockdb::validate(cfg), std::runtime_error);
}
