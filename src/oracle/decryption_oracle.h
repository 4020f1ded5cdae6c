#pragma once

#include "messages.h"

#include <functional>

namespace oracle {

/**
 * Callback through which an oracle delivers a result.
 * May be invoked from any thread, at any later time.
 */
using ResultCallback = std::function<void(const DecryptionResult& result)>;

/**
 * Threshold-decryption service boundary
 *
 * Implementations decrypt the request's ciphertexts out of band and deliver
 * the signed counts through the callback. Delivery is at least once: callers
 * must tolerate duplicates.
 */
class DecryptionOracle {
public:
    virtual ~DecryptionOracle() = default;

    /**
     * Queue a request (non-blocking)
     * Returns false if the oracle refuses it, in which case the callback
     * will never be invoked for this request.
     */
    virtual bool submit(const DecryptionRequest& request, ResultCallback callback) = 0;

    /**
     * Public key the oracle signs its results with
     */
    [[nodiscard]] virtual const crypto::PublicKey& signer() const = 0;
};

} // namespace oracle
