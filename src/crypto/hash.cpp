#include "hash.h"
#include "keypair.h" // for init()

#include <algorithm>
#include <sodium.h>
#include <stdexcept>

namespace crypto {

Hash blake2b(std::span<const uint8_t> data) {
    if (!init()) {
        throw std::runtime_error("Failed to initialize libsodium");
    }

    Hash hash;
    crypto_generichash(
        hash.data(), HASH_SIZE,
        data.data(), data.size(),
        nullptr, 0  // no key
    );
    return hash;
}

std::string to_hex(const Hash& hash) {
    return to_hex(std::span<const uint8_t>(hash.data(), hash.size()));
}

std::string to_hex(std::span<const uint8_t> data) {
    if (!init()) {
        throw std::runtime_error("Failed to initialize libsodium");
    }

    std::string hex(data.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), data.data(), data.size());
    hex.pop_back(); // remove null terminator
    return hex;
}

std::string short_hex(std::span<const uint8_t> data, size_t bytes) {
    if (data.size() <= bytes) {
        return to_hex(data);
    }
    return to_hex(data.first(bytes)) + "...";
}

} // namespace crypto
