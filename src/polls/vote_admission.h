#pragma once

#include "poll.h"
#include "status.h"

namespace polls {

/**
 * Admit one encrypted ballot into a poll
 *
 * Caller must hold poll.mutex(). Checks, in order: phase is Active
 * (VotingNotOpen), option in range (InvalidOption), voter not yet recorded
 * (AlreadyVoted). On success the ballot is folded into the option's counter
 * and the voter is recorded; on failure nothing changes.
 */
Status admit_vote(Poll& poll,
                  size_t option,
                  const crypto::Ciphertext& ballot,
                  const Identity& voter,
                  Timestamp now);

} // namespace polls
