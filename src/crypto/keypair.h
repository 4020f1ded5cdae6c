#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace crypto {

// Ed25519 sizes
constexpr size_t PUBLIC_KEY_SIZE = 32;
constexpr size_t SECRET_KEY_SIZE = 64;
constexpr size_t SEED_SIZE = 32;
constexpr size_t SIGNATURE_SIZE = 64;

using PublicKey = std::array<uint8_t, PUBLIC_KEY_SIZE>;
using SecretKey = std::array<uint8_t, SECRET_KEY_SIZE>;
using Seed = std::array<uint8_t, SEED_SIZE>;
using Signature = std::array<uint8_t, SIGNATURE_SIZE>;

/**
 * Ed25519 key pair
 *
 * The public half is the stable identity of a participant (poll creator,
 * voter) or of the decryption oracle, which signs every result it delivers.
 */
class Keypair {
public:
    /**
     * Generate a new random key pair
     */
    static Keypair generate();

    /**
     * Create key pair from seed (deterministic)
     */
    static Keypair from_seed(const Seed& seed);

    /**
     * Produce a detached signature over message
     */
    [[nodiscard]] Signature sign(std::span<const uint8_t> message) const;

    [[nodiscard]] const PublicKey& public_key() const { return public_key_; }

private:
    Keypair(PublicKey public_key, SecretKey secret_key);

    PublicKey public_key_;
    SecretKey secret_key_;
};

/**
 * Verify a detached Ed25519 signature
 *
 * @return true if signature is valid for message under public_key
 */
bool verify(std::span<const uint8_t> message,
            const Signature& signature,
            const PublicKey& public_key);

/**
 * True for the all-zero key, which never identifies a real participant
 */
bool is_null_key(const PublicKey& key);

/**
 * Hash function for PublicKey (for use in unordered containers)
 */
struct PublicKeyHasher {
    size_t operator()(const PublicKey& pk) const {
        size_t result = 0;
        for (size_t i = 0; i < 8 && i < pk.size(); ++i) {
            result ^= static_cast<size_t>(pk[i]) << (i * 8);
        }
        return result;
    }
};

/**
 * Initialize libsodium (must be called once at program start)
 * Returns true on success
 */
bool init();

} // namespace crypto
