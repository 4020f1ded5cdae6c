#include "clock.h"

#include <chrono>

namespace polls {

Timestamp SystemClock::now() const {
    auto wall = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    Timestamp current = static_cast<Timestamp>(wall);
    Timestamp last = last_.load();
    while (current > last && !last_.compare_exchange_weak(last, current)) {
    }
    return current > last ? current : last;
}

} // namespace polls
