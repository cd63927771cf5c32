/*******************************************************************************
 * TimerRegistry.cpp
 *
 * Bridges SDL's function-pointer timer callbacks to std::function callbacks.
 *
 * Threading:
 * - SDL invokes the trampolines on its own timer thread
 * - Registration / removal may happen on any application thread
 * - Each table has its own mutex; user callbacks always run unlocked so they
 *   can add or remove timers themselves
 ******************************************************************************/

#include "sdlkit/TimerRegistry.h"
#include "sdlkit/Error.h"
#include "sdlkit/Log.h"

#include <exception>

namespace sdlkit {

// ============================================================================
//                     SdlTimerBackend implementation
// ============================================================================

TimerID SdlTimerBackend::addTimer(Uint32 intervalMs, SDL_TimerCallback callback, void* userdata) {
    return SDL_AddTimer(intervalMs, callback, userdata);
}

TimerID SdlTimerBackend::addTimerNS(Uint64 intervalNs, SDL_NSTimerCallback callback, void* userdata) {
    return SDL_AddTimerNS(intervalNs, callback, userdata);
}

bool SdlTimerBackend::removeTimer(TimerID timerID) {
    return SDL_RemoveTimer(timerID);
}

std::string SdlTimerBackend::lastError() const {
    return sdlkit::lastError();
}

// ============================================================================
//                     TimerRegistry implementation
// ============================================================================

TimerRegistry::TimerRegistry(std::unique_ptr<TimerBackend> backend)
    : backend(std::move(backend)) {
}

TimerRegistry::~TimerRegistry() = default;

TimerRegistry& TimerRegistry::instance() {
    static TimerRegistry registry(std::make_unique<SdlTimerBackend>());
    return registry;
}

/*-----------------------------------------------------------------------------
 *                          REGISTRATION / REMOVAL
*---------------------------------------------------------------------------*/

/**
 * Creates a millisecond timer that fires the shared trampoline and stores the
 * callback under the id SDL hands back.
 *
 * The table lock is held across the native call: SDL may fire the timer on its
 * own thread before SDL_AddTimer returns, and that firing must find the entry.
 *
 * @param intervalMs delay before the first firing
 * @param callback invoked on SDL's timer thread for every firing
 * @return the new timer id (never 0)
 */
TimerID TimerRegistry::addTimer(Uint32 intervalMs, TimerCallback callback) {
    if (!callback) {
        throw UsageError("No timer callback specified.");
    }

    std::lock_guard<std::mutex> lock(table.mutex);

    TimerID timerID = backend->addTimer(intervalMs, &TimerRegistry::trampoline, this);
    if (timerID == 0) {
        std::string message = backend->lastError();
        log::warn("TIMER", "Failed to add timer: " + message);
        throw Error(message);
    }

    table.callbacks[timerID] = std::move(callback);
    log::debug("TIMER", "Added timer " + std::to_string(timerID) + " (" + std::to_string(intervalMs) + " ms)");
    return timerID;
}

TimerID TimerRegistry::addTimerNS(Uint64 intervalNs, TimerNSCallback callback) {
    if (!callback) {
        throw UsageError("No timer callback specified.");
    }

    std::lock_guard<std::mutex> lock(tableNS.mutex);

    TimerID timerID = backend->addTimerNS(intervalNs, &TimerRegistry::trampolineNS, this);
    if (timerID == 0) {
        std::string message = backend->lastError();
        log::warn("TIMER", "Failed to add NS timer: " + message);
        throw Error(message);
    }

    tableNS.callbacks[timerID] = std::move(callback);
    log::debug("TIMER", "Added NS timer " + std::to_string(timerID) + " (" + std::to_string(intervalNs) + " ns)");
    return timerID;
}

/**
 * Forgets a timer and cancels it natively. The id is dropped from both tables
 * whether or not either one knew it. A firing already in flight finds nothing
 * and returns 0.
 *
 * SDL refuses to remove a timer whose last firing returned 0, including one
 * that raced this call. The stopped set is consulted only after the native
 * removal fails, so such a firing is always recorded by then.
 *
 * @param timerID id returned by addTimer() or addTimerNS()
 */
void TimerRegistry::removeTimer(TimerID timerID) {
    {
        std::lock_guard<std::mutex> lock(table.mutex);
        table.callbacks.erase(timerID);
    }
    {
        std::lock_guard<std::mutex> lock(tableNS.mutex);
        tableNS.callbacks.erase(timerID);
    }

    bool removed = backend->removeTimer(timerID);
    std::string message = removed ? std::string() : backend->lastError();

    bool alreadyStopped;
    {
        std::lock_guard<std::mutex> lock(stoppedMutex);
        alreadyStopped = stopped.erase(timerID) > 0;
    }

    if (removed) {
        log::debug("TIMER", "Removed timer " + std::to_string(timerID));
        return;
    }
    if (alreadyStopped) {
        log::debug("TIMER", "Timer " + std::to_string(timerID) + " had already stopped");
        return;
    }

    log::warn("TIMER", "Failed to remove timer " + std::to_string(timerID) + ": " + message);
    throw Error(message);
}

/*-----------------------------------------------------------------------------
 *                          DISPATCH
*---------------------------------------------------------------------------*/

template <typename Interval>
Interval TimerRegistry::dispatchFrom(CallbackTable<Interval>& from, TimerID timerID, Interval interval) {
    std::function<Interval(TimerID, Interval)> callback;
    {
        std::lock_guard<std::mutex> lock(from.mutex);
        auto it = from.callbacks.find(timerID);
        if (it == from.callbacks.end()) {
            // Removed between SDL picking the timer and this lookup.
            markStopped(timerID);
            return 0;
        }
        callback = it->second;
    }

    Interval next = callback(timerID, interval);
    if (next == 0) {
        retire(from, timerID);
    }
    return next;
}

template <typename Interval>
void TimerRegistry::retire(CallbackTable<Interval>& from, TimerID timerID) {
    std::lock_guard<std::mutex> lock(from.mutex);
    if (from.callbacks.erase(timerID) > 0) {
        log::debug("TIMER", "Timer " + std::to_string(timerID) + " cancelled itself");
    }
    // Recorded even when a concurrent removeTimer() already erased the entry.
    markStopped(timerID);
}

void TimerRegistry::markStopped(TimerID timerID) {
    std::lock_guard<std::mutex> lock(stoppedMutex);
    stopped.insert(timerID);
}

Uint32 TimerRegistry::dispatch(TimerID timerID, Uint32 intervalMs) {
    return dispatchFrom(table, timerID, intervalMs);
}

Uint64 TimerRegistry::dispatchNS(TimerID timerID, Uint64 intervalNs) {
    return dispatchFrom(tableNS, timerID, intervalNs);
}

/**
 * Called by SDL on its timer thread. Exceptions must not unwind into SDL, so a
 * throwing callback is logged and its timer stopped.
 */
Uint32 SDLCALL TimerRegistry::trampoline(void* userdata, TimerID timerID, Uint32 intervalMs) {
    auto* registry = static_cast<TimerRegistry*>(userdata);
    if (!registry) {
        return 0;
    }

    try {
        return registry->dispatch(timerID, intervalMs);
    } catch (const std::exception& e) {
        log::error("TIMER", "Timer " + std::to_string(timerID) + " callback threw: " + e.what());
        registry->retire(registry->table, timerID);
        return 0;
    } catch (...) {
        log::error("TIMER", "Timer " + std::to_string(timerID) + " callback threw a non-standard exception");
        registry->retire(registry->table, timerID);
        return 0;
    }
}

Uint64 SDLCALL TimerRegistry::trampolineNS(void* userdata, TimerID timerID, Uint64 intervalNs) {
    auto* registry = static_cast<TimerRegistry*>(userdata);
    if (!registry) {
        return 0;
    }

    try {
        return registry->dispatchNS(timerID, intervalNs);
    } catch (const std::exception& e) {
        log::error("TIMER", "NS timer " + std::to_string(timerID) + " callback threw: " + e.what());
        registry->retire(registry->tableNS, timerID);
        return 0;
    } catch (...) {
        log::error("TIMER", "NS timer " + std::to_string(timerID) + " callback threw a non-standard exception");
        registry->retire(registry->tableNS, timerID);
        return 0;
    }
}

/*-----------------------------------------------------------------------------
 *                          INSPECTION
*---------------------------------------------------------------------------*/

bool TimerRegistry::contains(TimerID timerID) const {
    std::lock_guard<std::mutex> lock(table.mutex);
    return table.callbacks.count(timerID) > 0;
}

bool TimerRegistry::containsNS(TimerID timerID) const {
    std::lock_guard<std::mutex> lock(tableNS.mutex);
    return tableNS.callbacks.count(timerID) > 0;
}

TimerCallback TimerRegistry::callbackFor(TimerID timerID) const {
    std::lock_guard<std::mutex> lock(table.mutex);
    auto it = table.callbacks.find(timerID);
    return it != table.callbacks.end() ? it->second : TimerCallback();
}

TimerNSCallback TimerRegistry::callbackForNS(TimerID timerID) const {
    std::lock_guard<std::mutex> lock(tableNS.mutex);
    auto it = tableNS.callbacks.find(timerID);
    return it != tableNS.callbacks.end() ? it->second : TimerNSCallback();
}

size_t TimerRegistry::size() const {
    std::lock_guard<std::mutex> lock(table.mutex);
    return table.callbacks.size();
}

size_t TimerRegistry::sizeNS() const {
    std::lock_guard<std::mutex> lock(tableNS.mutex);
    return tableNS.callbacks.size();
}

void TimerRegistry::clear() {
    {
        std::lock_guard<std::mutex> lock(table.mutex);
        table.callbacks.clear();
    }
    {
        std::lock_guard<std::mutex> lock(tableNS.mutex);
        tableNS.callbacks.clear();
    }
    {
        std::lock_guard<std::mutex> lock(stoppedMutex);
        stopped.clear();
    }
}

// ============================================================================
//                     Free functions
// ============================================================================

TimerID addTimer(Uint32 intervalMs, TimerCallback callback) {
    return TimerRegistry::instance().addTimer(intervalMs, std::move(callback));
}

TimerID addTimerNS(Uint64 intervalNs, TimerNSCallback callback) {
    return TimerRegistry::instance().addTimerNS(intervalNs, std::move(callback));
}

void removeTimer(TimerID timerID) {
    TimerRegistry::instance().removeTimer(timerID);
}

} // namespace sdlkit
