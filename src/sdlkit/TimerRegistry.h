#pragma once

#include <SDL3/SDL.h>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace sdlkit {

using TimerID = SDL_TimerID;

// Receives the timer id and the current interval, returns the next interval.
// Returning the same value keeps the rate, another non-zero value reschedules
// at that rate, and 0 cancels the timer.
using TimerCallback = std::function<Uint32(TimerID timerID, Uint32 intervalMs)>;
using TimerNSCallback = std::function<Uint64(TimerID timerID, Uint64 intervalNs)>;

/**
 * The three native timer entry points the registry depends on.
 * SdlTimerBackend forwards to SDL; tests substitute their own.
 */
class TimerBackend {
public:
    virtual ~TimerBackend() = default;

    virtual TimerID addTimer(Uint32 intervalMs, SDL_TimerCallback callback, void* userdata) = 0;
    virtual TimerID addTimerNS(Uint64 intervalNs, SDL_NSTimerCallback callback, void* userdata) = 0;
    virtual bool removeTimer(TimerID timerID) = 0;

    // Text describing the most recent failure on the calling thread.
    virtual std::string lastError() const = 0;
};

class SdlTimerBackend : public TimerBackend {
public:
    TimerID addTimer(Uint32 intervalMs, SDL_TimerCallback callback, void* userdata) override;
    TimerID addTimerNS(Uint64 intervalNs, SDL_NSTimerCallback callback, void* userdata) override;
    bool removeTimer(TimerID timerID) override;
    std::string lastError() const override;
};

/**
 * Maps live SDL timer ids to std::function callbacks.
 *
 * SDL only accepts a plain function pointer, so every timer is created with one
 * of two fixed trampolines (milliseconds / nanoseconds). The trampoline finds
 * the callback by id and forwards to it. Trampolines run on SDL's timer thread,
 * possibly before addTimer() has returned; every table access is guarded and
 * the registering thread holds the table lock until the new entry is stored.
 */
class TimerRegistry {
public:
    explicit TimerRegistry(std::unique_ptr<TimerBackend> backend);
    ~TimerRegistry();

    TimerRegistry(const TimerRegistry&) = delete;
    TimerRegistry& operator=(const TimerRegistry&) = delete;

    // Process-wide registry bound to SDL. Created on first use.
    static TimerRegistry& instance();

    // Throws UsageError for an empty callback, Error if SDL refuses the timer.
    TimerID addTimer(Uint32 intervalMs, TimerCallback callback);
    TimerID addTimerNS(Uint64 intervalNs, TimerNSCallback callback);

    // Forgets the id in both tables, then cancels the native timer.
    // Throws Error if the native removal fails for a timer whose last firing
    // did not return 0.
    void removeTimer(TimerID timerID);

    // Trampoline bodies. An unknown id returns 0 without invoking anything.
    Uint32 dispatch(TimerID timerID, Uint32 intervalMs);
    Uint64 dispatchNS(TimerID timerID, Uint64 intervalNs);

    bool contains(TimerID timerID) const;
    bool containsNS(TimerID timerID) const;
    TimerCallback callbackFor(TimerID timerID) const;
    TimerNSCallback callbackForNS(TimerID timerID) const;
    size_t size() const;
    size_t sizeNS() const;

    // Drops every entry without touching SDL. Used once SDL's timer thread is gone.
    void clear();

    static Uint32 SDLCALL trampoline(void* userdata, TimerID timerID, Uint32 intervalMs);
    static Uint64 SDLCALL trampolineNS(void* userdata, TimerID timerID, Uint64 intervalNs);

private:
    template <typename Interval>
    struct CallbackTable {
        mutable std::mutex mutex;
        std::unordered_map<TimerID, std::function<Interval(TimerID, Interval)>> callbacks;
    };

    template <typename Interval>
    Interval dispatchFrom(CallbackTable<Interval>& from, TimerID timerID, Interval interval);

    // Removes an entry whose firing returned 0 and remembers the id as stopped.
    template <typename Interval>
    void retire(CallbackTable<Interval>& from, TimerID timerID);

    void markStopped(TimerID timerID);

    std::unique_ptr<TimerBackend> backend;

    CallbackTable<Uint32> table;
    CallbackTable<Uint64> tableNS;

    // Ids whose last firing returned 0. SDL reports "not found" when these are removed.
    mutable std::mutex stoppedMutex;
    std::unordered_set<TimerID> stopped;
};

// Shortcuts to TimerRegistry::instance().
TimerID addTimer(Uint32 intervalMs, TimerCallback callback);
TimerID addTimerNS(Uint64 intervalNs, TimerNSCallback callback);
void removeTimer(TimerID timerID);

} // namespace sdlkit
