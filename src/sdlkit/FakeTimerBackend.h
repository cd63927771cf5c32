#pragma once

#include "sdlkit/TimerRegistry.h"

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace sdlkit {

// In-memory stand-in for SDL's timer thread, driven by the test through fire().
class FakeTimerBackend : public TimerBackend {
public:
    ~FakeTimerBackend() override { joinEarlyFirings(); }

    TimerID addTimer(Uint32 intervalMs, SDL_TimerCallback callback, void* userdata) override {
        TimerID timerID = 0;
        {
            std::lock_guard<std::mutex> lock(mutex);
            ++addCalls;
            if (failAdds) {
                error = "Timer creation refused";
                return 0;
            }
            timerID = nextID++;
            Timer timer;
            timer.callback = callback;
            timer.userdata = userdata;
            timer.interval = intervalMs;
            timers[timerID] = timer;
        }

        if (fireEarly) {
            // Fire from another thread while the registration is still in progress.
            earlyFirings.emplace_back([this, callback, userdata, timerID, intervalMs] {
                earlyResult = callback(userdata, timerID, intervalMs);
            });
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        return timerID;
    }

    TimerID addTimerNS(Uint64 intervalNs, SDL_NSTimerCallback callback, void* userdata) override {
        std::lock_guard<std::mutex> lock(mutex);
        ++addCalls;
        if (failAdds) {
            error = "Timer creation refused";
            return 0;
        }
        TimerID timerID = nextID++;
        Timer timer;
        timer.callbackNS = callback;
        timer.userdata = userdata;
        timer.interval = intervalNs;
        timers[timerID] = timer;
        return timerID;
    }

    bool removeTimer(TimerID timerID) override {
        std::lock_guard<std::mutex> lock(mutex);
        ++removeCalls;
        if (failRemoves) {
            error = "Timer removal refused";
            return false;
        }
        if (timers.erase(timerID) == 0) {
            error = "Timer not found";
            return false;
        }
        return true;
    }

    std::string lastError() const override {
        std::lock_guard<std::mutex> lock(mutex);
        return error;
    }

    // Runs one firing the way SDL does: a zero result stops the timer,
    // anything else becomes the next interval.
    Uint64 fire(TimerID timerID) {
        Timer timer;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = timers.find(timerID);
            if (it == timers.end()) {
                return 0;
            }
            timer = it->second;
        }

        Uint64 next = timer.callback
            ? timer.callback(timer.userdata, timerID, static_cast<Uint32>(timer.interval))
            : timer.callbackNS(timer.userdata, timerID, timer.interval);

        std::lock_guard<std::mutex> lock(mutex);
        if (next == 0) {
            timers.erase(timerID);
        } else {
            auto it = timers.find(timerID);
            if (it != timers.end()) {
                it->second.interval = next;
            }
        }
        return next;
    }

    bool isLive(TimerID timerID) const {
        std::lock_guard<std::mutex> lock(mutex);
        return timers.count(timerID) > 0;
    }

    Uint64 intervalOf(TimerID timerID) const {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = timers.find(timerID);
        return it != timers.end() ? it->second.interval : 0;
    }

    std::vector<TimerID> liveTimers() const {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<TimerID> result;
        for (const auto& entry : timers) {
            result.push_back(entry.first);
        }
        return result;
    }

    void joinEarlyFirings() {
        for (auto& thread : earlyFirings) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        earlyFirings.clear();
    }

    std::atomic<int> addCalls{0};
    std::atomic<int> removeCalls{0};
    std::atomic<bool> failAdds{false};
    std::atomic<bool> failRemoves{false};
    std::atomic<bool> fireEarly{false};
    std::atomic<Uint32> earlyResult{0};

private:
    struct Timer {
        SDL_TimerCallback callback = nullptr;
        SDL_NSTimerCallback callbackNS = nullptr;
        void* userdata = nullptr;
        Uint64 interval = 0;
    };

    mutable std::mutex mutex;
    std::map<TimerID, Timer> timers;
    TimerID nextID = 1;
    std::string error;
    std::vector<std::thread> earlyFirings;
};

} // namespace sdlkit
