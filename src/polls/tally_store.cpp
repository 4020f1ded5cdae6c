#include "tally_store.h"

namespace polls {

TallyStore::TallyStore(const crypto::TallyKey& key, size_t options) {
    counters_.reserve(options);
    for (size_t i = 0; i < options; ++i) {
        counters_.push_back(crypto::Ciphertext::zero(key));
    }
}

bool TallyStore::add_ballot(size_t option, const crypto::Ciphertext& ballot) {
    if (option >= counters_.size()) {
        return false;
    }
    counters_[option] += ballot;
    return true;
}

} // namespace polls
