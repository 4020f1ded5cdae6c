#include "voter_ledger.h"

namespace polls {

bool VoterLedger::record(const Identity& voter) {
    return voters_.insert(voter).second;
}

bool VoterLedger::contains(const Identity& voter) const {
    return voters_.count(voter) > 0;
}

} // namespace polls
