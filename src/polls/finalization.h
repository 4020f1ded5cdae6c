#pragma once

#include "access_control.h"
#include "poll.h"
#include "status.h"
#include "../oracle/decryption_oracle.h"

#include <atomic>

namespace polls {

/**
 * Drives the decrypt-on-finalize handshake with the oracle
 *
 * request() moves an Ended poll to "decryption pending" and hands its tally
 * to the oracle; accept() commits the oracle's answer and finalizes. Each
 * request carries a fresh id and only a result echoing the id of the
 * currently pending request is accepted, so stale, duplicate and replayed
 * results are refused with UnknownRequest.
 */
class FinalizationCoordinator {
public:
    FinalizationCoordinator(oracle::DecryptionOracle& oracle, const AccessControl& access);

    /**
     * Caller must hold poll.mutex(). The oracle must not invoke `callback`
     * from inside submit().
     *
     * Fails with AlreadyFinalized, FinalizationAlreadyPending,
     * VotingStillOpen or OracleUnavailable. If submit() throws, the poll is
     * left as it was and the exception propagates.
     */
    Result<oracle::RequestId> request(Poll& poll, Timestamp now, oracle::ResultCallback callback);

    /**
     * Caller must hold poll.mutex().
     *
     * Fails with UnknownRequest (nothing pending, or another request),
     * Unauthorized (bad oracle signature) or ResultShapeMismatch (count
     * does not match options; the request stays pending for a resend).
     */
    Status accept(Poll& poll, const oracle::DecryptionResult& result);

private:
    oracle::DecryptionOracle& oracle_;
    const AccessControl& access_;
    std::atomic<uint64_t> sequence_{0};
};

} // namespace polls
