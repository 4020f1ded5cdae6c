#pragma once

#include "ciphertext.h"

#include <cstdint>
#include <optional>
#include <vector>

namespace crypto {

/**
 * One trustee's contribution to decrypting a ciphertext: s_i * c1
 */
struct PartialDecryption {
    uint32_t share_id;
    Point value;
};

/**
 * Shamir share s_i = f(i) of the tally secret key
 */
class KeyShare {
public:
    KeyShare(uint32_t id, const Scalar& secret);
    ~KeyShare();

    KeyShare(const KeyShare&) = default;
    KeyShare& operator=(const KeyShare&) = default;
    KeyShare(KeyShare&&) = default;
    KeyShare& operator=(KeyShare&&) = default;

    [[nodiscard]] uint32_t id() const { return id_; }

    /**
     * Compute this share's partial decryption of ciphertext
     * Returns nullopt if the result degenerates to the identity element
     */
    [[nodiscard]] std::optional<PartialDecryption> partial_decrypt(const Ciphertext& ciphertext) const;

private:
    uint32_t id_;
    Scalar secret_;
};

/**
 * Output of the trusted dealer
 */
struct ThresholdKeys {
    std::vector<KeyShare> shares;  // ids 1..trustees
    TallyKey public_key;
    uint32_t threshold;
};

/**
 * Generate a fresh tally key and split its secret into `trustees` shares,
 * any `threshold` of which can decrypt.
 *
 * Throws std::invalid_argument if threshold is 0 or exceeds trustees.
 */
ThresholdKeys deal_threshold_keys(uint32_t threshold, uint32_t trustees);

/**
 * Combines partial decryptions into a plaintext count
 *
 * Counts are recovered from m*G by bounded search, so max_count bounds both
 * the largest decodable tally and the work per ciphertext.
 */
class ThresholdDecryptor {
public:
    ThresholdDecryptor(uint32_t threshold, uint64_t max_count);

    /**
     * Decrypt ciphertext from at least `threshold` partials with distinct ids.
     * Returns nullopt when the partials are insufficient, duplicated or
     * invalid, or when the plaintext exceeds max_count.
     */
    [[nodiscard]] std::optional<uint64_t> decrypt(const Ciphertext& ciphertext,
                                                  const std::vector<PartialDecryption>& partials) const;

    [[nodiscard]] uint32_t threshold() const { return threshold_; }

private:
    uint32_t threshold_;
    uint64_t max_count_;
};

} // namespace crypto
