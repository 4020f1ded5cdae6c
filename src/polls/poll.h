#pragma once

#include "lifecycle.h"
#include "tally_store.h"
#include "types.h"
#include "voter_ledger.h"
#include "../oracle/messages.h"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace polls {

/**
 * Public view of a poll (no ciphertexts, no voter list)
 */
struct PollInfo {
    std::string title;
    std::vector<std::string> options;
    Timestamp start_time;
    Timestamp end_time;
    Identity creator;
    bool finalized;
    bool decryption_pending;
    uint64_t total_voters;
};

struct VotingStats {
    uint64_t total_voters;
    bool is_active;
    Timestamp time_remaining;  // seconds until end_time while active, else 0
};

/**
 * Poll record
 *
 * Title, options, window and creator are fixed at construction. The mutable
 * part (tally, voters, flags, results) is only touched while holding
 * mutex(); the engine takes it for the whole of each operation.
 *
 * Invariants:
 * - finalized() and decryption_pending() are never both true
 * - results() is set iff finalized through decryption
 * - total_voters() == number of recorded voters
 */
class Poll {
public:
    Poll(PollId id,
         std::string title,
         std::vector<std::string> options,
         Timestamp start_time,
         Timestamp end_time,
         const Identity& creator,
         const crypto::TallyKey& tally_key);

    // Non-copyable
    Poll(const Poll&) = delete;
    Poll& operator=(const Poll&) = delete;

    [[nodiscard]] PollId id() const { return id_; }
    [[nodiscard]] const std::string& title() const { return title_; }
    [[nodiscard]] const std::vector<std::string>& options() const { return options_; }
    [[nodiscard]] Timestamp start_time() const { return start_time_; }
    [[nodiscard]] Timestamp end_time() const { return end_time_; }
    [[nodiscard]] const Identity& creator() const { return creator_; }

    [[nodiscard]] bool finalized() const { return finalized_; }
    [[nodiscard]] bool decryption_pending() const { return pending_request_.has_value(); }
    [[nodiscard]] uint64_t total_voters() const { return voters_.size(); }

    [[nodiscard]] Phase phase(Timestamp now) const;
    [[nodiscard]] PollInfo info() const;
    [[nodiscard]] VotingStats stats(Timestamp now) const;

    [[nodiscard]] TallyStore& tally() { return tally_; }
    [[nodiscard]] const TallyStore& tally() const { return tally_; }
    [[nodiscard]] VoterLedger& voters() { return voters_; }
    [[nodiscard]] const VoterLedger& voters() const { return voters_; }

    [[nodiscard]] const std::optional<std::vector<uint64_t>>& results() const { return results_; }
    [[nodiscard]] const std::optional<oracle::RequestId>& pending_request() const { return pending_request_; }

    /**
     * Ended -> awaiting decryption of `request`
     */
    void begin_decryption(const oracle::RequestId& request);

    /**
     * Drop a pending request the oracle never accepted
     */
    void abandon_decryption();

    /**
     * Awaiting decryption -> Finalized with plaintext results
     */
    void finalize_with_results(std::vector<uint64_t> counts);

    /**
     * Any non-final phase -> Finalized, without results
     */
    void force_finalize();

    std::mutex& mutex() const { return mutex_; }

private:
    const PollId id_;
    const std::string title_;
    const std::vector<std::string> options_;
    const Timestamp start_time_;
    const Timestamp end_time_;
    const Identity creator_;

    TallyStore tally_;
    VoterLedger voters_;
    bool finalized_ = false;
    std::optional<oracle::RequestId> pending_request_;
    std::optional<std::vector<uint64_t>> results_;

    mutable std::mutex mutex_;
};

} // namespace polls
