#pragma once

#include "types.h"

#include <atomic>

namespace polls {

/**
 * Source of "now" for phase computation
 */
class Clock {
public:
    virtual ~Clock() = default;

    [[nodiscard]] virtual Timestamp now() const = 0;
};

/**
 * Wall-clock seconds, never running backwards within one process
 */
class SystemClock : public Clock {
public:
    [[nodiscard]] Timestamp now() const override;

private:
    mutable std::atomic<Timestamp> last_{0};
};

/**
 * Clock that only moves when told to (tests, simulations)
 */
class ManualClock : public Clock {
public:
    explicit ManualClock(Timestamp start = 0) : now_(start) {}

    [[nodiscard]] Timestamp now() const override { return now_.load(); }

    void set(Timestamp t) { now_.store(t); }
    void advance(Timestamp seconds) { now_.fetch_add(seconds); }

private:
    std::atomic<Timestamp> now_;
};

} // namespace polls
