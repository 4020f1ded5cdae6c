#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace crypto {

// ristretto255 encoding sizes
constexpr size_t POINT_SIZE = 32;
constexpr size_t SCALAR_SIZE = 32;
constexpr size_t CIPHERTEXT_SIZE = 2 * POINT_SIZE;

using Point = std::array<uint8_t, POINT_SIZE>;
using Scalar = std::array<uint8_t, SCALAR_SIZE>;

/**
 * Public tally encryption key H = x*G
 *
 * The secret x never exists in one place after dealing; see threshold.h.
 */
class TallyKey {
public:
    /**
     * Load a key from its encoding
     * Returns nullopt if the bytes are not a valid group element
     */
    static std::optional<TallyKey> from_bytes(const Point& point);

    [[nodiscard]] const Point& point() const { return point_; }

    bool operator==(const TallyKey& other) const = default;

private:
    explicit TallyKey(const Point& point) : point_(point) {}

    Point point_;
};

class KeyShare;
class ThresholdDecryptor;

/**
 * Additively homomorphic ciphertext (exponential ElGamal over ristretto255)
 *
 * Encrypts m as (r*G, m*G + r*H). Adding two ciphertexts component-wise
 * yields an encryption of the sum. No accessor exposes the plaintext;
 * only key share holders can take part in decryption.
 */
class Ciphertext {
public:
    /**
     * Fresh encryption of 0
     */
    static Ciphertext zero(const TallyKey& key);

    /**
     * Fresh encryption of 1 (a single ballot)
     */
    static Ciphertext encrypt_unit(const TallyKey& key);

    /**
     * Parse a 64-byte encoding
     * Returns nullopt if the size is wrong or either point is invalid
     */
    static std::optional<Ciphertext> from_bytes(std::span<const uint8_t> data);

    [[nodiscard]] std::vector<uint8_t> to_bytes() const;

    /**
     * Homomorphic addition
     */
    [[nodiscard]] Ciphertext operator+(const Ciphertext& other) const;
    Ciphertext& operator+=(const Ciphertext& other);

    bool operator==(const Ciphertext& other) const = default;

private:
    Ciphertext(const Point& c1, const Point& c2) : c1_(c1), c2_(c2) {}

    static Ciphertext encrypt(const TallyKey& key, bool unit);

    Point c1_;  // r*G
    Point c2_;  // m*G + r*H

    friend class KeyShare;
    friend class ThresholdDecryptor;
};

/**
 * The ristretto255 generator G
 */
const Point& generator();

} // namespace crypto
