#pragma once

#include "types.h"

#include <string>
#include <vector>

namespace polls {

// Hard limits on options per poll; EngineConfig may only narrow them
constexpr size_t MIN_OPTIONS = 2;
constexpr size_t MAX_OPTIONS = 16;

/**
 * Engine tunables
 */
struct EngineConfig {
    size_t min_options = MIN_OPTIONS;
    size_t max_options = MAX_OPTIONS;
};

/**
 * Arguments of createPoll
 */
struct PollParams {
    std::string title;
    std::vector<std::string> options;
    Timestamp start_time = 0;
    Timestamp end_time = 0;
};

/**
 * Builder for poll creation parameters
 *
 * Only assembles; validation happens in the registry so that each problem
 * surfaces with its own status.
 */
class PollParamsBuilder {
public:
    PollParamsBuilder& set_title(const std::string& title);
    PollParamsBuilder& add_option(const std::string& option);
    PollParamsBuilder& set_options(const std::vector<std::string>& options);
    PollParamsBuilder& set_start_time(Timestamp timestamp);
    PollParamsBuilder& set_end_time(Timestamp timestamp);
    PollParamsBuilder& set_window(Timestamp start, Timestamp end);
    PollParamsBuilder& set_duration(Timestamp seconds, Timestamp now);  // [now, now + seconds)

    [[nodiscard]] PollParams build() const { return params_; }

private:
    PollParams params_;
};

} // namespace polls
