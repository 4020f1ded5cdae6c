#include "messages.h"

#include <algorithm>
#include <string_view>

namespace oracle {

namespace {

constexpr std::string_view RESULT_DOMAIN = "sealpoll/decryption-result/v1";

// Upper bound on entries per message; polls never exceed 16 options
constexpr uint64_t MAX_ENTRIES = 256;

void write_u64(std::vector<uint8_t>& out, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<uint8_t>(value >> (i * 8)));
    }
}

uint64_t read_u64(const uint8_t* data) {
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value |= static_cast<uint64_t>(data[i]) << (i * 8);
    }
    return value;
}

void write_bytes(std::vector<uint8_t>& out, const uint8_t* data, size_t len) {
    out.insert(out.end(), data, data + len);
}

}

DecryptionRequest DecryptionRequest::make(uint64_t poll_id,
                                          uint64_t sequence,
                                          std::vector<crypto::Ciphertext> ciphertexts) {
    std::vector<uint8_t> preimage;
    write_u64(preimage, poll_id);
    write_u64(preimage, sequence);
    for (const auto& ct : ciphertexts) {
        auto bytes = ct.to_bytes();
        write_bytes(preimage, bytes.data(), bytes.size());
    }

    return DecryptionRequest{
        .request_id = crypto::blake2b(preimage),
        .poll_id = poll_id,
        .ciphertexts = std::move(ciphertexts)
    };
}

std::vector<uint8_t> DecryptionRequest::serialize() const {
    std::vector<uint8_t> data;
    data.reserve(crypto::HASH_SIZE + 16 + ciphertexts.size() * crypto::CIPHERTEXT_SIZE);

    write_bytes(data, request_id.data(), request_id.size());
    write_u64(data, poll_id);
    write_u64(data, ciphertexts.size());
    for (const auto& ct : ciphertexts) {
        auto bytes = ct.to_bytes();
        write_bytes(data, bytes.data(), bytes.size());
    }
    return data;
}

std::optional<DecryptionRequest> DecryptionRequest::deserialize(const std::vector<uint8_t>& data) {
    constexpr size_t HEADER_SIZE = crypto::HASH_SIZE + 8 + 8;
    if (data.size() < HEADER_SIZE) {
        return std::nullopt;
    }

    const uint8_t* ptr = data.data();
    RequestId request_id;
    std::copy(ptr, ptr + crypto::HASH_SIZE, request_id.begin());
    ptr += crypto::HASH_SIZE;

    uint64_t poll_id = read_u64(ptr);
    ptr += 8;
    uint64_t count = read_u64(ptr);
    ptr += 8;

    if (count > MAX_ENTRIES ||
        data.size() != HEADER_SIZE + count * crypto::CIPHERTEXT_SIZE) {
        return std::nullopt;
    }

    std::vector<crypto::Ciphertext> ciphertexts;
    ciphertexts.reserve(count);
    for (uint64_t i = 0; i < count; ++i) {
        auto ct = crypto::Ciphertext::from_bytes(
            std::span<const uint8_t>(ptr, crypto::CIPHERTEXT_SIZE));
        if (!ct) {
            return std::nullopt;
        }
        ciphertexts.push_back(*ct);
        ptr += crypto::CIPHERTEXT_SIZE;
    }

    return DecryptionRequest{
        .request_id = request_id,
        .poll_id = poll_id,
        .ciphertexts = std::move(ciphertexts)
    };
}

std::vector<uint8_t> DecryptionResult::signing_data() const {
    std::vector<uint8_t> data;
    data.reserve(RESULT_DOMAIN.size() + crypto::HASH_SIZE + 16 + counts.size() * 8);

    write_bytes(data, reinterpret_cast<const uint8_t*>(RESULT_DOMAIN.data()), RESULT_DOMAIN.size());
    write_bytes(data, request_id.data(), request_id.size());
    write_u64(data, poll_id);
    write_u64(data, counts.size());
    for (uint64_t count : counts) {
        write_u64(data, count);
    }
    return data;
}

void DecryptionResult::sign(const crypto::Keypair& oracle_key) {
    signature = oracle_key.sign(signing_data());
}

bool DecryptionResult::verify(const crypto::PublicKey& oracle_key) const {
    return crypto::verify(signing_data(), signature, oracle_key);
}

std::vector<uint8_t> DecryptionResult::serialize() const {
    std::vector<uint8_t> data;
    data.reserve(crypto::HASH_SIZE + 16 + counts.size() * 8 + crypto::SIGNATURE_SIZE);

    write_bytes(data, request_id.data(), request_id.size());
    write_u64(data, poll_id);
    write_u64(data, counts.size());
    for (uint64_t count : counts) {
        write_u64(data, count);
    }
    write_bytes(data, signature.data(), signature.size());
    return data;
}

std::optional<DecryptionResult> DecryptionResult::deserialize(const std::vector<uint8_t>& data) {
    constexpr size_t HEADER_SIZE = crypto::HASH_SIZE + 8 + 8;
    if (data.size() < HEADER_SIZE + crypto::SIGNATURE_SIZE) {
        return std::nullopt;
    }

    DecryptionResult result;
    const uint8_t* ptr = data.data();

    std::copy(ptr, ptr + crypto::HASH_SIZE, result.request_id.begin());
    ptr += crypto::HASH_SIZE;

    result.poll_id = read_u64(ptr);
    ptr += 8;
    uint64_t count = read_u64(ptr);
    ptr += 8;

    if (count > MAX_ENTRIES ||
        data.size() != HEADER_SIZE + count * 8 + crypto::SIGNATURE_SIZE) {
        return std::nullopt;
    }

    result.counts.reserve(count);
    for (uint64_t i = 0; i < count; ++i) {
        result.counts.push_back(read_u64(ptr));
        ptr += 8;
    }

    std::copy(ptr, ptr + crypto::SIGNATURE_SIZE, result.signature.begin());
    return result;
}

} // namespace oracle
