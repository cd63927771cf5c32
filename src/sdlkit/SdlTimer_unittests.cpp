#include "sdlkit/TimerRegistry.h"
#include "sdlkit/TimerMailbox.h"
#include "sdlkit/Time.h"

#include "doctest/doctest.h"

#include <atomic>
#include <memory>

namespace sdlkit {

namespace {

// Polls until the condition holds or about two seconds have passed.
template <typename Condition>
bool waitFor(Condition condition) {
    for (int i = 0; i < 200; ++i) {
        if (condition()) {
            return true;
        }
        delay(10);
    }
    return condition();
}

} // namespace

TEST_CASE("SDL timers through the registry") {
    REQUIRE(SDL_Init(SDL_INIT_EVENTS));
    // Outlive any callback still in flight until SDL_Quit joins the timer thread.
    std::atomic<int> calls{0};
    TimerRegistry registry(std::make_unique<SdlTimerBackend>());

    SUBCASE("self-cancelling timer") {
        TimerID timerID = registry.addTimer(5, [&](TimerID, Uint32 interval) -> Uint32 {
            return ++calls < 3 ? interval : 0;
        });

        CHECK(waitFor([&] { return !registry.contains(timerID); }));
        CHECK(calls == 3);
        CHECK_NOTHROW(registry.removeTimer(timerID));
    }

    SUBCASE("running nanosecond timer is removed") {
        TimerID timerID = registry.addTimerNS(msToNS(2), [&](TimerID, Uint64 interval) -> Uint64 {
            ++calls;
            return interval;
        });

        CHECK(waitFor([&] { return calls > 1; }));
        CHECK_NOTHROW(registry.removeTimer(timerID));
        CHECK_FALSE(registry.containsNS(timerID));
    }

    SUBCASE("mailbox delivers on the polling thread") {
        TimerMailbox mailbox(registry);
        TimerID timerID = mailbox.start(5);

        size_t received = 0;
        CHECK(waitFor([&] {
            received += mailbox.poll([&](const TimerFiring& firing) { CHECK(firing.timerID == timerID); });
            return received >= 2;
        }));
        mailbox.stopAll();
        CHECK(registry.size() == 0);
    }

    SDL_Quit();
}

} // namespace sdlkit
