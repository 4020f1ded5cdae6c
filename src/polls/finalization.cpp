#include "finalization.h"

namespace polls {

FinalizationCoordinator::FinalizationCoordinator(oracle::DecryptionOracle& oracle,
                                                 const AccessControl& access)
    : oracle_(oracle), access_(access) {}

Result<oracle::RequestId> FinalizationCoordinator::request(Poll& poll,
                                                           Timestamp now,
                                                           oracle::ResultCallback callback) {
    if (poll.finalized()) {
        return Status::AlreadyFinalized;
    }

    if (poll.decryption_pending()) {
        return Status::FinalizationAlreadyPending;
    }

    if (poll.phase(now) != Phase::Ended) {
        return Status::VotingStillOpen;
    }

    auto request = oracle::DecryptionRequest::make(
        poll.id(), sequence_.fetch_add(1), poll.tally().ciphertexts());

    poll.begin_decryption(request.request_id);

    bool accepted = false;
    try {
        accepted = oracle_.submit(request, std::move(callback));
    } catch (...) {
        poll.abandon_decryption();
        throw;
    }

    if (!accepted) {
        poll.abandon_decryption();
        return Status::OracleUnavailable;
    }

    return request.request_id;
}

Status FinalizationCoordinator::accept(Poll& poll, const oracle::DecryptionResult& result) {
    const auto& pending = poll.pending_request();
    if (!pending || *pending != result.request_id || result.poll_id != poll.id()) {
        return Status::UnknownRequest;
    }

    if (!access_.is_from_oracle(result)) {
        return Status::Unauthorized;
    }

    if (result.counts.size() != poll.options().size()) {
        return Status::ResultShapeMismatch;
    }

    poll.finalize_with_results(result.counts);
    return Status::Ok;
}

} // namespace polls
