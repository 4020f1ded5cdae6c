#include "lifecycle.h"

namespace polls {

Phase phase_of(Timestamp now, Timestamp start_time, Timestamp end_time, bool finalized) {
    if (finalized) {
        return Phase::Finalized;
    }
    if (now < start_time) {
        return Phase::Pending;
    }
    if (now < end_time) {
        return Phase::Active;
    }
    return Phase::Ended;
}

const char* phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::Pending: return "Pending";
        case Phase::Active: return "Active";
        case Phase::Ended: return "Ended";
        case Phase::Finalized: return "Finalized";
        default: return "Unknown";
    }
}

} // namespace polls
