#include "threshold.h"
#include "keypair.h" // for init()

#include <sodium.h>
#include <stdexcept>
#include <unordered_set>

namespace crypto {

namespace {

void require_sodium() {
    if (!init()) {
        throw std::runtime_error("Failed to initialize libsodium");
    }
}

Scalar scalar_from_u64(uint64_t value) {
    Scalar s{};
    for (int i = 0; i < 8; ++i) {
        s[i] = static_cast<uint8_t>(value >> (i * 8));
    }
    return s;
}

Scalar random_nonzero_scalar() {
    Scalar s;
    do {
        crypto_core_ristretto255_scalar_random(s.data());
    } while (sodium_is_zero(s.data(), s.size()) == 1);
    return s;
}

// Lagrange coefficient at x = 0 for point i over the given share ids:
// L_i = prod_{j != i} j / (j - i)
std::optional<Scalar> lagrange_coefficient(uint32_t i, const std::vector<uint32_t>& ids) {
    Scalar numerator = scalar_from_u64(1);
    Scalar denominator = scalar_from_u64(1);
    const Scalar si = scalar_from_u64(i);

    for (uint32_t j : ids) {
        if (j == i) {
            continue;
        }
        const Scalar sj = scalar_from_u64(j);

        Scalar diff;
        crypto_core_ristretto255_scalar_sub(diff.data(), sj.data(), si.data());

        Scalar tmp;
        crypto_core_ristretto255_scalar_mul(tmp.data(), numerator.data(), sj.data());
        numerator = tmp;
        crypto_core_ristretto255_scalar_mul(tmp.data(), denominator.data(), diff.data());
        denominator = tmp;
    }

    Scalar inverse;
    if (crypto_core_ristretto255_scalar_invert(inverse.data(), denominator.data()) != 0) {
        return std::nullopt;
    }

    Scalar coefficient;
    crypto_core_ristretto255_scalar_mul(coefficient.data(), numerator.data(), inverse.data());
    return coefficient;
}

}

KeyShare::KeyShare(uint32_t id, const Scalar& secret) : id_(id), secret_(secret) {}

KeyShare::~KeyShare() {
    sodium_memzero(secret_.data(), secret_.size());
}

std::optional<PartialDecryption> KeyShare::partial_decrypt(const Ciphertext& ciphertext) const {
    require_sodium();

    PartialDecryption partial{.share_id = id_, .value = {}};
    if (crypto_scalarmult_ristretto255(partial.value.data(), secret_.data(),
                                       ciphertext.c1_.data()) != 0) {
        return std::nullopt;
    }
    return partial;
}

ThresholdKeys deal_threshold_keys(uint32_t threshold, uint32_t trustees) {
    if (threshold == 0 || threshold > trustees) {
        throw std::invalid_argument("Invalid threshold parameters");
    }
    require_sodium();

    // f(X) = a_0 + a_1 X + ... + a_{t-1} X^{t-1}, a_0 is the tally secret
    std::vector<Scalar> coefficients;
    coefficients.reserve(threshold);
    for (uint32_t k = 0; k < threshold; ++k) {
        coefficients.push_back(random_nonzero_scalar());
    }

    Point h;
    crypto_scalarmult_ristretto255_base(h.data(), coefficients[0].data());

    std::vector<KeyShare> shares;
    shares.reserve(trustees);

    for (uint32_t i = 1; i <= trustees; ++i) {
        const Scalar x = scalar_from_u64(i);

        // Horner evaluation of f(i)
        Scalar acc = coefficients[threshold - 1];
        for (uint32_t k = threshold - 1; k-- > 0;) {
            Scalar product;
            crypto_core_ristretto255_scalar_mul(product.data(), acc.data(), x.data());
            crypto_core_ristretto255_scalar_add(acc.data(), product.data(), coefficients[k].data());
        }

        shares.emplace_back(i, acc);
        sodium_memzero(acc.data(), acc.size());
    }

    for (auto& c : coefficients) {
        sodium_memzero(c.data(), c.size());
    }

    auto public_key = TallyKey::from_bytes(h);
    if (!public_key) {
        throw std::runtime_error("Dealer produced an invalid tally key");
    }

    return ThresholdKeys{
        .shares = std::move(shares),
        .public_key = *public_key,
        .threshold = threshold
    };
}

ThresholdDecryptor::ThresholdDecryptor(uint32_t threshold, uint64_t max_count)
    : threshold_(threshold), max_count_(max_count) {}

std::optional<uint64_t> ThresholdDecryptor::decrypt(
    const Ciphertext& ciphertext,
    const std::vector<PartialDecryption>& partials) const {
    require_sodium();

    if (threshold_ == 0 || partials.size() < threshold_) {
        return std::nullopt;
    }

    std::vector<uint32_t> ids;
    std::unordered_set<uint32_t> seen;
    for (uint32_t k = 0; k < threshold_; ++k) {
        uint32_t id = partials[k].share_id;
        if (id == 0 || !seen.insert(id).second) {
            return std::nullopt;
        }
        ids.push_back(id);
    }

    // D = sum L_i * (s_i * c1) = x * c1
    Point combined{};
    bool first = true;
    for (uint32_t k = 0; k < threshold_; ++k) {
        auto lambda = lagrange_coefficient(ids[k], ids);
        if (!lambda) {
            return std::nullopt;
        }

        Point term;
        if (crypto_scalarmult_ristretto255(term.data(), lambda->data(),
                                           partials[k].value.data()) != 0) {
            return std::nullopt;
        }

        if (first) {
            combined = term;
            first = false;
        } else {
            Point sum;
            if (crypto_core_ristretto255_add(sum.data(), combined.data(), term.data()) != 0) {
                return std::nullopt;
            }
            combined = sum;
        }
    }

    // m*G = c2 - x*c1
    Point message;
    if (crypto_core_ristretto255_sub(message.data(), ciphertext.c2_.data(), combined.data()) != 0) {
        return std::nullopt;
    }

    if (sodium_is_zero(message.data(), message.size()) == 1) {
        return 0;
    }

    Point candidate = generator();
    for (uint64_t m = 1; m <= max_count_; ++m) {
        if (candidate == message) {
            return m;
        }
        Point next;
        if (crypto_core_ristretto255_add(next.data(), candidate.data(), generator().data()) != 0) {
            return std::nullopt;
        }
        candidate = next;
    }

    return std::nullopt;
}

} // namespace crypto
