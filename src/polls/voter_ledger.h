#pragma once

#include "types.h"

#include <unordered_set>

namespace polls {

/**
 * Append-only set of identities that voted in one poll
 */
class VoterLedger {
public:
    /**
     * Record a voter
     * Returns false (and changes nothing) if the voter is already present
     */
    bool record(const Identity& voter);

    [[nodiscard]] bool contains(const Identity& voter) const;

    [[nodiscard]] size_t size() const { return voters_.size(); }

private:
    std::unordered_set<Identity, crypto::PublicKeyHasher> voters_;
};

} // namespace polls
