#include "vote_admission.h"

namespace polls {

Status admit_vote(Poll& poll,
                  size_t option,
                  const crypto::Ciphertext& ballot,
                  const Identity& voter,
                  Timestamp now) {
    if (poll.phase(now) != Phase::Active) {
        return Status::VotingNotOpen;
    }

    if (option >= poll.options().size()) {
        return Status::InvalidOption;
    }

    if (poll.voters().contains(voter)) {
        return Status::AlreadyVoted;
    }

    // Tally first: if the addition throws, the voter is not recorded either
    if (!poll.tally().add_ballot(option, ballot)) {
        return Status::InvalidOption;
    }
    poll.voters().record(voter);

    return Status::Ok;
}

} // namespace polls
