#pragma once

#include <chrono>
#include <cstdint>

namespace memkv {

// ── Clock abstraction ────────────────────────────────────────────────────────
//
// Time source for expiration and blocking-command deadlines.  Times are Unix
// epoch milliseconds so that absolute expire times survive a snapshot.
// Tests use MockClock and advance it explicitly.

class Clock {
public:
    virtual ~Clock() = default;

    [[nodiscard]] virtual int64_t now_ms() const = 0;
};

// ── SystemClock ──────────────────────────────────────────────────────────────
//
// Production implementation: delegates to std::chrono::system_clock.

class SystemClock final : public Clock {
public:
    [[nodiscard]] int64_t now_ms() const override {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }
};

// ── MockClock ────────────────────────────────────────────────────────────────
//
// Test implementation: time only advances via explicit advance() calls.

class MockClock final : public Clock {
public:
    explicit MockClock(int64_t start_ms = 1'700'000'000'000) : now_(start_ms) {}

    [[nodiscard]] int64_t now_ms() const override {
        return now_;
    }

    void advance(std::chrono::milliseconds delta) {
        now_ += delta.count();
    }

    void set(int64_t ms) {
        now_ = ms;
    }

private:
    int64_t now_;
};

} // namespace memkv
