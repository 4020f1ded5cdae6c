#pragma once

#include "../crypto/ciphertext.h"

#include <vector>

namespace polls {

/**
 * One encrypted counter per poll option
 *
 * Counters start as encryptions of zero and only ever grow by homomorphic
 * addition of ballots. There is no decrement, overwrite or plaintext read.
 */
class TallyStore {
public:
    TallyStore(const crypto::TallyKey& key, size_t options);

    /**
     * Fold a ballot into the counter for `option`
     * Returns false if option is out of range
     */
    bool add_ballot(size_t option, const crypto::Ciphertext& ballot);

    /**
     * Raw ciphertexts, in option order
     */
    [[nodiscard]] const std::vector<crypto::Ciphertext>& ciphertexts() const { return counters_; }

    [[nodiscard]] size_t size() const { return counters_.size(); }

private:
    std::vector<crypto::Ciphertext> counters_;
};

} // namespace polls
