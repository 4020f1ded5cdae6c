#pragma once

#include "types.h"

namespace polls {

/**
 * Poll phase
 *
 * Pending -> Active -> Ended happen by time passing alone. Finalized is
 * terminal and reached by a decryption callback (from Ended) or by an
 * emergency pause (from any other phase).
 */
enum class Phase {
    Pending,    // now < start_time
    Active,     // start_time <= now < end_time
    Ended,      // now >= end_time
    Finalized
};

/**
 * Derive the phase; there is no stored phase to fall out of date.
 * `finalized` wins over every time-derived phase.
 */
Phase phase_of(Timestamp now, Timestamp start_time, Timestamp end_time, bool finalized);

const char* phase_to_string(Phase phase);

} // namespace polls
