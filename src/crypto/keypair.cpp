#include "keypair.h"

#include <sodium.h>
#include <stdexcept>

namespace crypto {

bool init() {
    static bool initialized = false;
    if (!initialized) {
        if (sodium_init() < 0) {
            return false;
        }
        initialized = true;
    }
    return true;
}

Keypair::Keypair(PublicKey public_key, SecretKey secret_key)
    : public_key_(public_key), secret_key_(secret_key) {}

Keypair Keypair::generate() {
    if (!init()) {
        throw std::runtime_error("Failed to initialize libsodium");
    }

    PublicKey pk;
    SecretKey sk;
    crypto_sign_keypair(pk.data(), sk.data());

    return Keypair(pk, sk);
}

Keypair Keypair::from_seed(const Seed& seed) {
    if (!init()) {
        throw std::runtime_error("Failed to initialize libsodium");
    }

    PublicKey pk;
    SecretKey sk;
    crypto_sign_seed_keypair(pk.data(), sk.data(), seed.data());

    return Keypair(pk, sk);
}

Signature Keypair::sign(std::span<const uint8_t> message) const {
    if (!init()) {
        throw std::runtime_error("Failed to initialize libsodium");
    }

    Signature sig;
    crypto_sign_detached(sig.data(), nullptr,
                         message.data(), message.size(),
                         secret_key_.data());
    return sig;
}

bool verify(std::span<const uint8_t> message,
            const Signature& signature,
            const PublicKey& public_key) {
    if (!init()) {
        return false;
    }

    return crypto_sign_verify_detached(
        signature.data(),
        message.data(),
        message.size(),
        public_key.data()
    ) == 0;
}

bool is_null_key(const PublicKey& key) {
    if (!init()) {
        throw std::runtime_error("Failed to initialize libsodium");
    }
    return sodium_is_zero(key.data(), key.size()) == 1;
}

} // namespace crypto
