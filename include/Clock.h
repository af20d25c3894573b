/**
 * @file Clock.h
 * @brief Time source consumed by the ledger: wall clock for live runs, manual clock for tests and simulation.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "LedgerTypes.h"

#include <atomic>

/**
 * @class Clock
 * @brief Source of "now" in whole seconds.
 */
class Clock {
public:
    virtual ~Clock() = default;
    virtual Timestamp now() const = 0;
};

/** @brief Seconds since the Unix epoch from std::chrono::system_clock. */
class SystemClock : public Clock {
public:
    Timestamp now() const override;
};

/**
 * @class ManualClock
 * @brief Clock that only moves when told to. Safe to read and advance from different threads.
 */
class ManualClock : public Clock {
public:
    explicit ManualClock(Timestamp start = 0) : t(start) {}

    Timestamp now() const override { return t.load(); }
    void set(Timestamp v) { t.store(v); }
    /** @brief Move forward by @p s seconds (negative values are ignored). */
    void advance(Seconds s);

private:
    std::atomic<Timestamp> t;
};
