#include "access_control.h"

namespace polls {

AccessControl::AccessControl(const crypto::PublicKey& oracle_signer)
    : oracle_signer_(oracle_signer) {}

Status AccessControl::check_caller(const Identity& caller) const {
    if (crypto::is_null_key(caller)) {
        return Status::Unauthorized;
    }
    return Status::Ok;
}

Status AccessControl::authorize_creator(const Poll& poll, const Identity& caller) const {
    if (check_caller(caller) != Status::Ok || caller != poll.creator()) {
        return Status::Unauthorized;
    }
    return Status::Ok;
}

bool AccessControl::is_from_oracle(const oracle::DecryptionResult& result) const {
    return result.verify(oracle_signer_);
}

Status AccessControl::emergency_pause(Poll& poll, const Identity& caller) const {
    if (auto status = authorize_creator(poll, caller); status != Status::Ok) {
        return status;
    }

    if (poll.finalized()) {
        return Status::AlreadyFinalized;
    }

    poll.force_finalize();
    return Status::Ok;
}

} // namespace polls
