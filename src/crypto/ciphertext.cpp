#include "ciphertext.h"
#include "keypair.h" // for init()

#include <algorithm>
#include <sodium.h>
#include <stdexcept>

namespace crypto {

namespace {

void require_sodium() {
    if (!init()) {
        throw std::runtime_error("Failed to initialize libsodium");
    }
}

Point add_points(const Point& a, const Point& b) {
    Point sum;
    if (crypto_core_ristretto255_add(sum.data(), a.data(), b.data()) != 0) {
        throw std::runtime_error("ristretto255 addition on invalid point");
    }
    return sum;
}

}

const Point& generator() {
    static const Point g = [] {
        require_sodium();
        Scalar one{};
        one[0] = 1;
        Point p;
        crypto_scalarmult_ristretto255_base(p.data(), one.data());
        return p;
    }();
    return g;
}

std::optional<TallyKey> TallyKey::from_bytes(const Point& point) {
    require_sodium();

    if (crypto_core_ristretto255_is_valid_point(point.data()) != 1) {
        return std::nullopt;
    }
    return TallyKey(point);
}

Ciphertext Ciphertext::encrypt(const TallyKey& key, bool unit) {
    require_sodium();

    Scalar r;
    Point c1;
    Point c2;

    // r == 0 would make c1 the identity; draw again
    do {
        crypto_core_ristretto255_scalar_random(r.data());
    } while (crypto_scalarmult_ristretto255_base(c1.data(), r.data()) != 0);

    if (crypto_scalarmult_ristretto255(c2.data(), r.data(), key.point().data()) != 0) {
        sodium_memzero(r.data(), r.size());
        throw std::runtime_error("Tally key is the identity element");
    }
    sodium_memzero(r.data(), r.size());

    if (unit) {
        c2 = add_points(c2, generator());
    }

    return Ciphertext(c1, c2);
}

Ciphertext Ciphertext::zero(const TallyKey& key) {
    return encrypt(key, false);
}

Ciphertext Ciphertext::encrypt_unit(const TallyKey& key) {
    return encrypt(key, true);
}

std::optional<Ciphertext> Ciphertext::from_bytes(std::span<const uint8_t> data) {
    require_sodium();

    if (data.size() != CIPHERTEXT_SIZE) {
        return std::nullopt;
    }

    Point c1;
    Point c2;
    std::copy(data.begin(), data.begin() + POINT_SIZE, c1.begin());
    std::copy(data.begin() + POINT_SIZE, data.end(), c2.begin());

    if (crypto_core_ristretto255_is_valid_point(c1.data()) != 1 ||
        crypto_core_ristretto255_is_valid_point(c2.data()) != 1) {
        return std::nullopt;
    }

    return Ciphertext(c1, c2);
}

std::vector<uint8_t> Ciphertext::to_bytes() const {
    std::vector<uint8_t> data;
    data.reserve(CIPHERTEXT_SIZE);
    data.insert(data.end(), c1_.begin(), c1_.end());
    data.insert(data.end(), c2_.begin(), c2_.end());
    return data;
}

Ciphertext Ciphertext::operator+(const Ciphertext& other) const {
    return Ciphertext(add_points(c1_, other.c1_), add_points(c2_, other.c2_));
}

Ciphertext& Ciphertext::operator+=(const Ciphertext& other) {
    c1_ = add_points(c1_, other.c1_);
    c2_ = add_points(c2_, other.c2_);
    return *this;
}

} // namespace crypto
