#include "poll_engine.h"
#include "vote_admission.h"

namespace polls {

PollEngine::PollEngine(const crypto::TallyKey& tally_key,
                       oracle::DecryptionOracle& oracle,
                       std::shared_ptr<const Clock> clock,
                       const EngineConfig& config)
    : clock_(std::move(clock))
    , registry_(tally_key, config)
    , access_(oracle.signer())
    , coordinator_(oracle, access_)
    , inbox_(std::make_shared<Inbox>())
    , events_(std::make_shared<EventDispatcher>()) {
    inbox_->engine = this;
}

PollEngine::~PollEngine() {
    std::lock_guard<std::mutex> lock(inbox_->mutex);
    inbox_->engine = nullptr;
}

Result<PollId> PollEngine::create_poll(const PollParams& params, const Identity& caller) {
    if (auto status = access_.check_caller(caller); status != Status::Ok) {
        return status;
    }

    auto id = registry_.create(params, caller, [&](PollId created) {
        events_->post({.type = EventType::PollCreated, .poll_id = created, .actor = caller, .results = {}});
    });
    if (id.ok()) {
        deliver_events();
    }
    return id;
}

Result<PollId> PollEngine::create_poll(const std::string& title,
                                       const std::vector<std::string>& options,
                                       Timestamp start_time,
                                       Timestamp end_time,
                                       const Identity& caller) {
    return create_poll(PollParamsBuilder()
                           .set_title(title)
                           .set_options(options)
                           .set_window(start_time, end_time)
                           .build(),
                       caller);
}

uint64_t PollEngine::get_poll_count() const {
    return registry_.count();
}

Result<PollInfo> PollEngine::get_poll_info(PollId id) const {
    auto poll = registry_.find(id);
    if (!poll) {
        return Status::PollNotFound;
    }

    std::lock_guard<std::mutex> lock(poll->mutex());
    return poll->info();
}

Result<Identity> PollEngine::get_poll_creator(PollId id) const {
    auto poll = registry_.find(id);
    if (!poll) {
        return Status::PollNotFound;
    }
    return poll->creator();
}

Result<Phase> PollEngine::get_phase(PollId id) const {
    auto poll = registry_.find(id);
    if (!poll) {
        return Status::PollNotFound;
    }

    std::lock_guard<std::mutex> lock(poll->mutex());
    return poll->phase(clock_->now());
}

Status PollEngine::vote(PollId id, size_t option, const crypto::Ciphertext& ballot, const Identity& caller) {
    auto poll = registry_.find(id);
    if (!poll) {
        return Status::PollNotFound;
    }

    if (auto status = access_.check_caller(caller); status != Status::Ok) {
        return status;
    }

    {
        std::lock_guard<std::mutex> lock(poll->mutex());
        auto status = admit_vote(*poll, option, ballot, caller, clock_->now());
        if (status != Status::Ok) {
            return status;
        }
        events_->post({.type = EventType::VoteCast, .poll_id = id, .actor = caller, .results = {}});
    }

    deliver_events();
    return Status::Ok;
}

Status PollEngine::vote(PollId id, size_t option, std::span<const uint8_t> ballot, const Identity& caller) {
    auto parsed = crypto::Ciphertext::from_bytes(ballot);
    if (!parsed) {
        return Status::InvalidBallot;
    }
    return vote(id, option, *parsed, caller);
}

Result<bool> PollEngine::has_user_voted(PollId id, const Identity& voter) const {
    auto poll = registry_.find(id);
    if (!poll) {
        return Status::PollNotFound;
    }

    std::lock_guard<std::mutex> lock(poll->mutex());
    return poll->voters().contains(voter);
}

Result<uint64_t> PollEngine::get_total_voters(PollId id) const {
    auto poll = registry_.find(id);
    if (!poll) {
        return Status::PollNotFound;
    }

    std::lock_guard<std::mutex> lock(poll->mutex());
    return poll->total_voters();
}

Result<VotingStats> PollEngine::get_voting_stats(PollId id) const {
    auto poll = registry_.find(id);
    if (!poll) {
        return Status::PollNotFound;
    }

    std::lock_guard<std::mutex> lock(poll->mutex());
    return poll->stats(clock_->now());
}

Result<std::vector<crypto::Ciphertext>> PollEngine::get_encrypted_counts(PollId id) const {
    auto poll = registry_.find(id);
    if (!poll) {
        return Status::PollNotFound;
    }

    std::lock_guard<std::mutex> lock(poll->mutex());
    return poll->tally().ciphertexts();
}

Status PollEngine::request_finalization(PollId id, const Identity& caller) {
    auto poll = registry_.find(id);
    if (!poll) {
        return Status::PollNotFound;
    }

    if (auto status = access_.check_caller(caller); status != Status::Ok) {
        return status;
    }

    {
        std::lock_guard<std::mutex> lock(poll->mutex());
        auto request = coordinator_.request(*poll, clock_->now(), make_result_callback());
        if (!request.ok()) {
            return request.status();
        }
        // Posted before the lock drops, so ahead of the oracle's answer
        events_->post({.type = EventType::FinalizationRequested, .poll_id = id, .actor = caller, .results = {}});
    }

    deliver_events();
    return Status::Ok;
}

Status PollEngine::on_decryption_result(const oracle::DecryptionResult& result) {
    auto status = accept_result(result);
    if (status == Status::Ok) {
        deliver_events();
    }
    return status;
}

Status PollEngine::accept_result(const oracle::DecryptionResult& result) {
    auto poll = registry_.find(result.poll_id);
    if (!poll) {
        return Status::UnknownRequest;
    }

    std::lock_guard<std::mutex> lock(poll->mutex());
    auto status = coordinator_.accept(*poll, result);
    if (status != Status::Ok) {
        return status;
    }

    events_->post({.type = EventType::PollFinalized, .poll_id = result.poll_id, .actor = {}, .results = *poll->results()});
    return Status::Ok;
}

Result<std::vector<uint64_t>> PollEngine::get_results(PollId id) const {
    auto poll = registry_.find(id);
    if (!poll) {
        return Status::PollNotFound;
    }

    std::lock_guard<std::mutex> lock(poll->mutex());
    if (!poll->finalized() || !poll->results()) {
        return Status::ResultsNotAvailable;
    }
    return *poll->results();
}

Status PollEngine::emergency_pause(PollId id, const Identity& caller) {
    auto poll = registry_.find(id);
    if (!poll) {
        return Status::PollNotFound;
    }

    {
        std::lock_guard<std::mutex> lock(poll->mutex());
        auto status = access_.emergency_pause(*poll, caller);
        if (status != Status::Ok) {
            return status;
        }
        events_->post({.type = EventType::EmergencyPaused, .poll_id = id, .actor = caller, .results = {}});
    }

    deliver_events();
    return Status::Ok;
}

void PollEngine::set_event_callback(EventCallback callback) {
    events_->set_callback(std::move(callback));
}

oracle::ResultCallback PollEngine::make_result_callback() {
    std::weak_ptr<Inbox> weak_inbox = inbox_;
    std::weak_ptr<EventDispatcher> weak_events = events_;

    return [weak_inbox, weak_events](const oracle::DecryptionResult& result) {
        auto inbox = weak_inbox.lock();
        if (!inbox) {
            return;
        }

        {
            std::lock_guard<std::mutex> lock(inbox->mutex);
            if (!inbox->engine) {
                return;
            }

            if (inbox->engine->accept_result(result) != Status::Ok) {
                inbox->engine->rejected_results_++;
                return;
            }
        }

        // Delivered without the inbox lock so the callback may destroy the engine
        if (auto events = weak_events.lock()) {
            events->dispatch();
        }
    };
}

void PollEngine::deliver_events() const {
    auto events = events_;
    events->dispatch();
}

} // namespace polls
