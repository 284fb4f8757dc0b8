// CURATOR - Time Utilities
// Copyright (c) 2024 CURATOR Developers
// MIT License
//
// Provides time-related utilities:
// - Unix timestamps
// - The injectable clock consulted by every stage-window check
// - A settable clock for tests
// - Duration formatting for log lines

#ifndef CURATOR_UTIL_TIME_H
#define CURATOR_UTIL_TIME_H

#include <curator/core/types.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace curator {
namespace util {

using Seconds = std::chrono::seconds;

/// Get current Unix timestamp in seconds
int64_t GetTime();

/// Format duration as human-readable string (e.g., "1h 23m 45s")
std::string FormatDuration(Seconds duration);

// ============================================================================
// Clock Interface
// ============================================================================

/**
 * Source of the current time for stage windows.
 *
 * Implementations must be monotonic non-decreasing across calls made by the
 * same engine.
 */
class IClock {
public:
    virtual ~IClock() = default;

    /// Current Unix timestamp in seconds
    virtual Timestamp Now() const = 0;
};

/// Wall clock
class SystemClock : public IClock {
public:
    Timestamp Now() const override { return GetTime(); }
};

/// Settable clock for tests and deterministic replays
class MockClock : public IClock {
public:
    explicit MockClock(Timestamp start = 0) : now_(start) {}

    Timestamp Now() const override { return now_.load(); }

    void Set(Timestamp timestamp) { now_.store(timestamp); }

    void Advance(int64_t seconds) { now_.fetch_add(seconds); }

private:
    std::atomic<Timestamp> now_;
};

} // namespace util
} // namespace curator

#endif // CURATOR_UTIL_TIME_H
