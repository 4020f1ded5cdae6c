#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>

namespace crypto {

constexpr size_t HASH_SIZE = 32;

using Hash = std::array<uint8_t, HASH_SIZE>;

/**
 * Compute BLAKE2b-256 hash of data
 *
 * @param data Input data to hash
 * @return 32-byte hash
 */
Hash blake2b(std::span<const uint8_t> data);

/**
 * Convert hash to hexadecimal string
 */
std::string to_hex(const Hash& hash);

/**
 * Convert any byte array to hexadecimal string
 */
std::string to_hex(std::span<const uint8_t> data);

/**
 * Shortened hex form for display ("3f9a1c0e...")
 */
std::string short_hex(std::span<const uint8_t> data, size_t bytes = 8);

} // namespace crypto
