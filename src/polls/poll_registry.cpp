#include "poll_registry.h"

#include <algorithm>
#include <stdexcept>

namespace polls {

PollRegistry::PollRegistry(const crypto::TallyKey& tally_key, const EngineConfig& config)
    : tally_key_(tally_key)
    , min_options_(std::max(config.min_options, MIN_OPTIONS))
    , max_options_(std::min(config.max_options, MAX_OPTIONS)) {
    if (min_options_ > max_options_) {
        throw std::invalid_argument("Invalid option bounds in engine config");
    }
}

Result<PollId> PollRegistry::create(const PollParams& params,
                                    const Identity& creator,
                                    const std::function<void(PollId)>& on_created) {
    if (params.title.empty()) {
        return Status::InvalidTitle;
    }

    if (params.options.size() < min_options_ || params.options.size() > max_options_) {
        return Status::InvalidOptionCount;
    }

    bool blank_label = std::any_of(params.options.begin(), params.options.end(),
                                   [](const std::string& label) { return label.empty(); });
    if (blank_label) {
        return Status::InvalidOptionLabel;
    }

    if (params.start_time >= params.end_time) {
        return Status::InvalidWindow;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    PollId id = polls_.size();
    polls_.push_back(std::make_shared<Poll>(
        id, params.title, params.options,
        params.start_time, params.end_time,
        creator, tally_key_));

    if (on_created) {
        on_created(id);
    }
    return id;
}

std::shared_ptr<Poll> PollRegistry::find(PollId id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (id >= polls_.size()) {
        return nullptr;
    }
    return polls_[id];
}

uint64_t PollRegistry::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return polls_.size();
}

} // namespace polls
