#pragma once

#include "../crypto/ciphertext.h"
#include "../crypto/hash.h"
#include "../crypto/keypair.h"

#include <cstdint>
#include <optional>
#include <vector>

namespace oracle {

/**
 * Identifier binding a result to exactly one finalization request
 */
using RequestId = crypto::Hash;

/**
 * Ask the oracle to decrypt a poll's tally
 */
struct DecryptionRequest {
    RequestId request_id;
    uint64_t poll_id;
    std::vector<crypto::Ciphertext> ciphertexts;  // one per option

    /**
     * Build a request; the id is BLAKE2b(poll_id || sequence || ciphertexts)
     * so every request for every poll gets a distinct id.
     */
    static DecryptionRequest make(uint64_t poll_id,
                                  uint64_t sequence,
                                  std::vector<crypto::Ciphertext> ciphertexts);

    [[nodiscard]] std::vector<uint8_t> serialize() const;
    static std::optional<DecryptionRequest> deserialize(const std::vector<uint8_t>& data);
};

/**
 * Plaintext counts delivered back by the oracle, signed by its key
 */
struct DecryptionResult {
    RequestId request_id;
    uint64_t poll_id;
    std::vector<uint64_t> counts;
    crypto::Signature signature{};

    /**
     * Bytes covered by the signature (everything but the signature)
     */
    [[nodiscard]] std::vector<uint8_t> signing_data() const;

    void sign(const crypto::Keypair& oracle_key);
    [[nodiscard]] bool verify(const crypto::PublicKey& oracle_key) const;

    [[nodiscard]] std::vector<uint8_t> serialize() const;
    static std::optional<DecryptionResult> deserialize(const std::vector<uint8_t>& data);
};

} // namespace oracle
