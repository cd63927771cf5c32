#pragma once

#include "sdlkit/TimerRegistry.h"

#include <SDL3/SDL.h>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_set>
#include <moodycamel/concurrentqueue.h>

namespace sdlkit {

// One firing of a mailbox timer, as observed on SDL's timer thread.
struct TimerFiring {
    TimerID timerID = 0;
    Uint64 intervalNs = 0;
    Uint64 ticksNS = 0;
};

/**
 * Delivers timer firings to the thread of the caller's choice.
 *
 * Mailbox timers are registered in a TimerRegistry like any other, but their
 * callbacks only push a TimerFiring onto a lock-free queue and keep the timer
 * running at the same rate. The owning thread drains the queue with poll().
 */
class TimerMailbox {
public:
    TimerMailbox();
    explicit TimerMailbox(TimerRegistry& registry);
    ~TimerMailbox();

    TimerMailbox(const TimerMailbox&) = delete;
    TimerMailbox& operator=(const TimerMailbox&) = delete;

    TimerID start(Uint32 intervalMs);
    TimerID startNS(Uint64 intervalNs);

    // A timer whose removal throws stays counted by activeCount().
    void stop(TimerID timerID);
    void stopAll();

    // Hands every queued firing to the handler. Returns the number delivered.
    size_t poll(const std::function<void(const TimerFiring&)>& handler);

    size_t pending() const { return queue.size_approx(); }
    size_t activeCount() const;

private:
    struct Shared {
        moodycamel::ConcurrentQueue<TimerFiring> queue;
        std::atomic<bool> open{true};
    };

    TimerRegistry& registry;

    // Outlives the mailbox while SDL may still be firing a timer callback.
    std::shared_ptr<Shared> shared;
    moodycamel::ConcurrentQueue<TimerFiring>& queue;

    mutable std::mutex timersMutex;
    std::unordered_set<TimerID> timers;
};

} // namespace sdlkit
