/**
 * @file Clock.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Clock.h"

#include <chrono>

/** @copydoc SystemClock::now */
Timestamp SystemClock::now() const {
    using namespace std::chrono;
    return static_cast<Timestamp>(duration_cast<seconds>(system_clock::now().time_since_epoch()).count());
}

/** @copydoc ManualClock::advance */
void ManualClock::advance(Seconds s) {
    if (s <= 0) return;
    t.fetch_add(s);
}
