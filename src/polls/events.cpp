#include "events.h"

namespace polls {

const char* event_type_to_string(EventType type) {
    switch (type) {
        case EventType::PollCreated: return "PollCreated";
        case EventType::VoteCast: return "VoteCast";
        case EventType::FinalizationRequested: return "FinalizationRequested";
        case EventType::PollFinalized: return "PollFinalized";
        case EventType::EmergencyPaused: return "EmergencyPaused";
        default: return "Unknown";
    }
}

void EventDispatcher::set_callback(EventCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(callback);
}

void EventDispatcher::post(PollEvent event) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(std::move(event));
}

void EventDispatcher::dispatch() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (dispatching_) {
        return;
    }
    dispatching_ = true;

    try {
        while (!queue_.empty()) {
            PollEvent event = std::move(queue_.front());
            queue_.pop_front();
            EventCallback callback = callback_;

            lock.unlock();
            if (callback) {
                callback(event);
            }
            lock.lock();
        }
    } catch (...) {
        // Undelivered events stay queued for the next dispatch()
        if (!lock.owns_lock()) {
            lock.lock();
        }
        dispatching_ = false;
        throw;
    }

    dispatching_ = false;
}

size_t EventDispatcher::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

} // namespace polls
