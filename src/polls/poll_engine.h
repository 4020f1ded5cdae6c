#pragma once

#include "access_control.h"
#include "clock.h"
#include "config.h"
#include "events.h"
#include "finalization.h"
#include "poll_registry.h"
#include "status.h"
#include "../oracle/decryption_oracle.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <span>

namespace polls {

/**
 * Confidential poll engine
 *
 * Entry point for every poll operation. Each operation on a poll runs to
 * completion under that poll's mutex, so admission checks and the state
 * changes they guard are atomic with respect to concurrent callers. Oracle
 * results arrive through on_decryption_result(), on whatever thread the
 * oracle delivers them, and are serialized the same way.
 *
 * Thread-safe. The oracle must outlive the engine; results delivered after
 * the engine is destroyed are dropped.
 */
class PollEngine {
public:
    PollEngine(const crypto::TallyKey& tally_key,
               oracle::DecryptionOracle& oracle,
               std::shared_ptr<const Clock> clock,
               const EngineConfig& config = {});

    ~PollEngine();

    // Non-copyable
    PollEngine(const PollEngine&) = delete;
    PollEngine& operator=(const PollEngine&) = delete;

    // Registry

    Result<PollId> create_poll(const PollParams& params, const Identity& caller);
    Result<PollId> create_poll(const std::string& title,
                               const std::vector<std::string>& options,
                               Timestamp start_time,
                               Timestamp end_time,
                               const Identity& caller);

    [[nodiscard]] uint64_t get_poll_count() const;
    [[nodiscard]] Result<PollInfo> get_poll_info(PollId id) const;
    [[nodiscard]] Result<Identity> get_poll_creator(PollId id) const;
    [[nodiscard]] Result<Phase> get_phase(PollId id) const;

    // Voting

    Status vote(PollId id, size_t option, const crypto::Ciphertext& ballot, const Identity& caller);

    /**
     * Same as above for a ballot still in wire form; malformed bytes fail
     * with InvalidBallot before anything else is checked
     */
    Status vote(PollId id, size_t option, std::span<const uint8_t> ballot, const Identity& caller);

    [[nodiscard]] Result<bool> has_user_voted(PollId id, const Identity& voter) const;
    [[nodiscard]] Result<uint64_t> get_total_voters(PollId id) const;
    [[nodiscard]] Result<VotingStats> get_voting_stats(PollId id) const;

    /**
     * Current encrypted counters, in option order (never decrypted here)
     */
    [[nodiscard]] Result<std::vector<crypto::Ciphertext>> get_encrypted_counts(PollId id) const;

    // Finalization

    Status request_finalization(PollId id, const Identity& caller);

    /**
     * Inbound oracle message; only results signed by the oracle and echoing
     * the pending request id are accepted
     */
    Status on_decryption_result(const oracle::DecryptionResult& result);

    [[nodiscard]] Result<std::vector<uint64_t>> get_results(PollId id) const;

    // Access control

    Status emergency_pause(PollId id, const Identity& caller);

    /**
     * Observe successful state changes
     *
     * Events arrive in the order the state changes happened, outside every
     * engine lock, one at a time. The callback may run on the thread of a
     * later engine call or on the oracle's delivery thread, and may call
     * back into the engine or destroy it. It must not stop the oracle that
     * is delivering it.
     */
    void set_event_callback(EventCallback callback);

    /**
     * Oracle deliveries that on_decryption_result() refused
     */
    size_t rejected_results() const { return rejected_results_.load(); }

private:
    // Handle given to the oracle; outlives the engine, cut on destruction
    struct Inbox {
        std::mutex mutex;
        PollEngine* engine = nullptr;
    };

    std::shared_ptr<const Clock> clock_;
    PollRegistry registry_;
    AccessControl access_;
    FinalizationCoordinator coordinator_;

    std::shared_ptr<Inbox> inbox_;
    std::shared_ptr<EventDispatcher> events_;
    std::atomic<size_t> rejected_results_{0};

    oracle::ResultCallback make_result_callback();

    /**
     * on_decryption_result() without delivering the resulting event
     */
    Status accept_result(const oracle::DecryptionResult& result);

    /**
     * Nothing of *this is touched once delivery starts, so a callback may
     * destroy the engine
     */
    void deliver_events() const;
};

} // namespace polls
