#include "config.h"

namespace polls {

PollParamsBuilder& PollParamsBuilder::set_title(const std::string& title) {
    params_.title = title;
    return *this;
}

PollParamsBuilder& PollParamsBuilder::add_option(const std::string& option) {
    params_.options.push_back(option);
    return *this;
}

PollParamsBuilder& PollParamsBuilder::set_options(const std::vector<std::string>& options) {
    params_.options = options;
    return *this;
}

PollParamsBuilder& PollParamsBuilder::set_start_time(Timestamp timestamp) {
    params_.start_time = timestamp;
    return *this;
}

PollParamsBuilder& PollParamsBuilder::set_end_time(Timestamp timestamp) {
    params_.end_time = timestamp;
    return *this;
}

PollParamsBuilder& PollParamsBuilder::set_window(Timestamp start, Timestamp end) {
    params_.start_time = start;
    params_.end_time = end;
    return *this;
}

PollParamsBuilder& PollParamsBuilder::set_duration(Timestamp seconds, Timestamp now) {
    params_.start_time = now;
    params_.end_time = now + seconds;
    return *this;
}

} // namespace polls
