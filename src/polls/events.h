#pragma once

#include "types.h"

#include <deque>
#include <functional>
#include <mutex>
#include <vector>

namespace polls {

enum class EventType {
    PollCreated,
    VoteCast,               // who voted, never for what
    FinalizationRequested,
    PollFinalized,          // carries the decrypted counts
    EmergencyPaused
};

const char* event_type_to_string(EventType type);

/**
 * Notification of a successful state change
 */
struct PollEvent {
    EventType type;
    PollId poll_id;
    Identity actor{};               // caller; zero for oracle-driven events
    std::vector<uint64_t> results;  // PollFinalized only
};

using EventCallback = std::function<void(const PollEvent& event)>;

/**
 * Ordered event delivery
 *
 * post() is called while still holding the lock that guarded the state
 * change, so queue order is state-change order. dispatch() hands queued
 * events to the callback outside every engine lock, one thread at a time;
 * a dispatch() that finds another thread (or an outer frame of its own
 * thread) delivering returns at once and leaves its events to that loop.
 */
class EventDispatcher {
public:
    void set_callback(EventCallback callback);

    void post(PollEvent event);

    void dispatch();

    size_t pending() const;

private:
    mutable std::mutex mutex_;
    std::deque<PollEvent> queue_;
    EventCallback callback_;
    bool dispatching_ = false;
};

} // namespace polls
