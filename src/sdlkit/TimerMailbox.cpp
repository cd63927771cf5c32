/*******************************************************************************
 * TimerMailbox.cpp
 *
 * Timer firings produced on SDL's timer thread, consumed on the thread that
 * calls poll(). Same producer/consumer split as a render loop draining the
 * queues filled by worker threads.
 ******************************************************************************/

#include "sdlkit/TimerMailbox.h"
#include "sdlkit/Error.h"
#include "sdlkit/Log.h"
#include "sdlkit/Time.h"

#include <exception>
#include <vector>

namespace sdlkit {

TimerMailbox::TimerMailbox()
    : TimerMailbox(TimerRegistry::instance()) {
}

TimerMailbox::TimerMailbox(TimerRegistry& registry)
    : registry(registry)
    , shared(std::make_shared<Shared>())
    , queue(shared->queue) {
}

TimerMailbox::~TimerMailbox() {
    shared->open = false;
    try {
        stopAll();
    } catch (const std::exception& e) {
        log::warn("MAILBOX", std::string("Failed to stop timers on shutdown: ") + e.what());
    }
}

TimerID TimerMailbox::start(Uint32 intervalMs) {
    std::weak_ptr<Shared> weak = shared;
    TimerID timerID = registry.addTimer(intervalMs, [weak](TimerID id, Uint32 interval) -> Uint32 {
        auto target = weak.lock();
        if (!target || !target->open) {
            return 0;
        }
        target->queue.enqueue(TimerFiring{id, msToNS(interval), getTicksNS()});
        return interval;
    });

    std::lock_guard<std::mutex> lock(timersMutex);
    timers.insert(timerID);
    return timerID;
}

TimerID TimerMailbox::startNS(Uint64 intervalNs) {
    std::weak_ptr<Shared> weak = shared;
    TimerID timerID = registry.addTimerNS(intervalNs, [weak](TimerID id, Uint64 interval) -> Uint64 {
        auto target = weak.lock();
        if (!target || !target->open) {
            return 0;
        }
        target->queue.enqueue(TimerFiring{id, interval, getTicksNS()});
        return interval;
    });

    std::lock_guard<std::mutex> lock(timersMutex);
    timers.insert(timerID);
    return timerID;
}

void TimerMailbox::stop(TimerID timerID) {
    bool tracked;
    {
        std::lock_guard<std::mutex> lock(timersMutex);
        tracked = timers.erase(timerID) > 0;
    }

    try {
        registry.removeTimer(timerID);
    } catch (const Error&) {
        if (tracked) {
            std::lock_guard<std::mutex> lock(timersMutex);
            timers.insert(timerID);
        }
        throw;
    }
}

/**
 * Removes every mailbox timer. Ids whose removal fails stay tracked so a later
 * stop can retry them; the first failure is rethrown once all were attempted.
 */
void TimerMailbox::stopAll() {
    std::vector<TimerID> stopping;
    {
        std::lock_guard<std::mutex> lock(timersMutex);
        stopping.assign(timers.begin(), timers.end());
        timers.clear();
    }

    std::vector<TimerID> failed;
    std::exception_ptr firstError;
    for (TimerID timerID : stopping) {
        try {
            registry.removeTimer(timerID);
        } catch (const Error&) {
            failed.push_back(timerID);
            if (!firstError) {
                firstError = std::current_exception();
            }
        }
    }

    if (!failed.empty()) {
        {
            std::lock_guard<std::mutex> lock(timersMutex);
            timers.insert(failed.begin(), failed.end());
        }
        log::warn("MAILBOX", std::to_string(failed.size()) + " timer(s) could not be stopped");
        std::rethrow_exception(firstError);
    }
}

size_t TimerMailbox::poll(const std::function<void(const TimerFiring&)>& handler) {
    size_t delivered = 0;
    TimerFiring firing;

    while (queue.try_dequeue(firing)) {
        handler(firing);
        ++delivered;
    }
    return delivered;
}

size_t TimerMailbox::activeCount() const {
    std::lock_guard<std::mutex> lock(timersMutex);
    return timers.size();
}

} // namespace sdlkit
