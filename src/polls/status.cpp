#include "status.h"

namespace polls {

const char* status_to_string(Status status) {
    switch (status) {
        case Status::Ok: return "Ok";
        case Status::InvalidTitle: return "Title cannot be empty";
        case Status::InvalidOptionCount: return "Must have 2-16 options";
        case Status::InvalidOptionLabel: return "Option labels cannot be empty";
        case Status::InvalidWindow: return "Start time must be before end time";
        case Status::InvalidOption: return "Invalid option index";
        case Status::InvalidBallot: return "Malformed encrypted ballot";
        case Status::PollNotFound: return "Poll does not exist";
        case Status::VotingNotOpen: return "Voting is not open";
        case Status::VotingStillOpen: return "Voting has not ended yet";
        case Status::AlreadyFinalized: return "Poll already finalized";
        case Status::FinalizationAlreadyPending: return "Finalization already pending";
        case Status::AlreadyVoted: return "Already voted";
        case Status::Unauthorized: return "Unauthorized caller";
        case Status::UnknownRequest: return "No pending decryption request matches";
        case Status::ResultShapeMismatch: return "Result count does not match options";
        case Status::OracleUnavailable: return "Decryption oracle refused the request";
        case Status::ResultsNotAvailable: return "Results not available";
        default: return "Unknown error";
    }
}

} // namespace polls
