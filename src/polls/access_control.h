#pragma once

#include "poll.h"
#include "status.h"

namespace polls {

/**
 * Caller checks for every entry point
 *
 * Ordinary callers are identified by their public key; the decryption oracle
 * is identified by the signature on each result it delivers.
 */
class AccessControl {
public:
    explicit AccessControl(const crypto::PublicKey& oracle_signer);

    /**
     * Reject the null identity
     */
    [[nodiscard]] Status check_caller(const Identity& caller) const;

    /**
     * Ok iff caller created the poll
     */
    [[nodiscard]] Status authorize_creator(const Poll& poll, const Identity& caller) const;

    /**
     * True iff the result carries a valid oracle signature
     */
    [[nodiscard]] bool is_from_oracle(const oracle::DecryptionResult& result) const;

    /**
     * Creator-only override: finalize immediately, forfeiting results.
     * Caller must hold poll.mutex(). Fails with Unauthorized, then
     * AlreadyFinalized.
     */
    Status emergency_pause(Poll& poll, const Identity& caller) const;

private:
    crypto::PublicKey oracle_signer_;
};

} // namespace polls
