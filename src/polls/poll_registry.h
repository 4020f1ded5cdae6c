#pragma once

#include "config.h"
#include "poll.h"
#include "status.h"

#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace polls {

/**
 * All polls ever created, indexed by id
 * Thread-safe; polls are never removed
 */
class PollRegistry {
public:
    /**
     * Throws std::invalid_argument if the configured option bounds are empty
     * once clamped to [MIN_OPTIONS, MAX_OPTIONS]
     */
    PollRegistry(const crypto::TallyKey& tally_key, const EngineConfig& config);

    /**
     * Validate and store a new poll
     * Checks title, then option count and labels, then window.
     * `on_created` runs under the registry lock, before the new id can be
     * looked up by anyone else.
     */
    Result<PollId> create(const PollParams& params,
                          const Identity& creator,
                          const std::function<void(PollId)>& on_created = {});

    /**
     * Lookup; nullptr when id >= count()
     */
    [[nodiscard]] std::shared_ptr<Poll> find(PollId id) const;

    [[nodiscard]] uint64_t count() const;

    [[nodiscard]] size_t min_options() const { return min_options_; }
    [[nodiscard]] size_t max_options() const { return max_options_; }

private:
    crypto::TallyKey tally_key_;
    size_t min_options_;
    size_t max_options_;

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<Poll>> polls_;
};

} // namespace polls
