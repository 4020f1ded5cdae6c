#include "poll.h"

namespace polls {

Poll::Poll(PollId id,
           std::string title,
           std::vector<std::string> options,
           Timestamp start_time,
           Timestamp end_time,
           const Identity& creator,
           const crypto::TallyKey& tally_key)
    : id_(id)
    , title_(std::move(title))
    , options_(std::move(options))
    , start_time_(start_time)
    , end_time_(end_time)
    , creator_(creator)
    , tally_(tally_key, options_.size()) {}

Phase Poll::phase(Timestamp now) const {
    return phase_of(now, start_time_, end_time_, finalized_);
}

PollInfo Poll::info() const {
    return PollInfo{
        .title = title_,
        .options = options_,
        .start_time = start_time_,
        .end_time = end_time_,
        .creator = creator_,
        .finalized = finalized_,
        .decryption_pending = decryption_pending(),
        .total_voters = total_voters()
    };
}

VotingStats Poll::stats(Timestamp now) const {
    bool active = phase(now) == Phase::Active;
    return VotingStats{
        .total_voters = total_voters(),
        .is_active = active,
        .time_remaining = active ? end_time_ - now : 0
    };
}

void Poll::begin_decryption(const oracle::RequestId& request) {
    pending_request_ = request;
}

void Poll::abandon_decryption() {
    pending_request_.reset();
}

void Poll::finalize_with_results(std::vector<uint64_t> counts) {
    results_ = std::move(counts);
    pending_request_.reset();
    finalized_ = true;
}

void Poll::force_finalize() {
    pending_request_.reset();
    finalized_ = true;
}

} // namespace polls
