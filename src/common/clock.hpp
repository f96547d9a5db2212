#pragma once

#include <chrono>
#include <string>

namespace mockdb {

// ── Clock abstraction ────────────────────────────────────────────────────────
//
// Wall-clock time source for record timestamps, so that tests can pin and
// advance time instead of sleeping.

class Clock {
public:
    using time_point = std::chrono::system_clock::time_point;

    virtual ~Clock() = default;

    [[nodiscard]] virtual time_point now() const = 0;
};

// ── SystemClock ──────────────────────────────────────────────────────────────
//
// Production implementation: delegates to std::chrono::system_clock.

class SystemClock final : public Clock {
public:
    [[nodiscard]] time_point now() const override {
        return std::chrono::system_clock::now();
    }
};

// ── MockClock ────────────────────────────────────────────────────────────────
//
// Test implementation: time only advances via explicit advance() calls.

class MockClock final : public Clock {
public:
    MockClock() = default;
    explicit MockClock(time_point start) : now_(start) {}

    [[nodiscard]] time_point now() const override {
        return now_;
    }

    void advance(std::chrono::milliseconds delta) {
        now_ += delta;
    }

    void set(time_point tp) {
        now_ = tp;
    }

private:
    time_point now_{};
};

// Format `tp` as an ISO-8601 UTC timestamp with millisecond precision,
// e.g. "2024-03-01T09:15:00.250Z".
[[nodiscard]] std::string format_iso8601(Clock::time_point tp);

} // namespace mockdb
