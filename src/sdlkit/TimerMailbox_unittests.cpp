#include "sdlkit/TimerMailbox.h"
#include "sdlkit/Error.h"
#include "sdlkit/FakeTimerBackend.h"
#include "sdlkit/Time.h"

#include "doctest/doctest.h"

#include <memory>
#include <vector>

namespace sdlkit {

TEST_CASE("TimerMailbox delivery") {
    auto backend = std::make_unique<FakeTimerBackend>();
    FakeTimerBackend* fake = backend.get();
    TimerRegistry registry(std::move(backend));

    SUBCASE("firings queue up until polled") {
        TimerMailbox mailbox(registry);
        TimerID timerID = mailbox.start(250);
        CHECK(mailbox.activeCount() == 1);
        CHECK(registry.contains(timerID));

        for (int i = 0; i < 3; ++i) {
            CHECK(fake->fire(timerID) == 250);
        }
        CHECK(mailbox.pending() == 3);

        std::vector<TimerFiring> received;
        CHECK(mailbox.poll([&](const TimerFiring& firing) { received.push_back(firing); }) == 3);
        REQUIRE(received.size() == 3);
        for (const auto& firing : received) {
            CHECK(firing.timerID == timerID);
            CHECK(firing.intervalNs == msToNS(250));
        }
        CHECK(received[0].ticksNS <= received[2].ticksNS);

        CHECK(mailbox.poll([](const TimerFiring&) {}) == 0);
    }

    SUBCASE("nanosecond timers report their interval unchanged") {
        TimerMailbox mailbox(registry);
        TimerID timerID = mailbox.startNS(1500);
        CHECK(registry.containsNS(timerID));

        fake->fire(timerID);
        TimerFiring last;
        mailbox.poll([&](const TimerFiring& firing) { last = firing; });
        CHECK(last.timerID == timerID);
        CHECK(last.intervalNs == 1500);
    }

    SUBCASE("stop removes a single timer") {
        TimerMailbox mailbox(registry);
        TimerID first = mailbox.start(10);
        TimerID second = mailbox.start(20);

        mailbox.stop(first);
        CHECK_FALSE(registry.contains(first));
        CHECK_FALSE(fake->isLive(first));
        CHECK(registry.contains(second));
        CHECK(mailbox.activeCount() == 1);
    }

    SUBCASE("failed removals stay tracked for a retry") {
        TimerMailbox mailbox(registry);
        mailbox.start(10);
        mailbox.start(20);
        mailbox.startNS(30);

        fake->failRemoves = true;
        CHECK_THROWS_WITH_AS(mailbox.stopAll(), "Timer removal refused", Error);
        CHECK(fake->removeCalls == 3);
        CHECK(mailbox.activeCount() == 3);
        CHECK(fake->liveTimers().size() == 3);

        fake->failRemoves = false;
        CHECK_NOTHROW(mailbox.stopAll());
        CHECK(mailbox.activeCount() == 0);
        CHECK(fake->liveTimers().empty());
    }

    SUBCASE("failed stop keeps the timer tracked") {
        TimerMailbox mailbox(registry);
        TimerID timerID = mailbox.start(10);

        fake->failRemoves = true;
        CHECK_THROWS_AS(mailbox.stop(timerID), Error);
        CHECK(mailbox.activeCount() == 1);

        fake->failRemoves = false;
        mailbox.stop(timerID);
        CHECK(mailbox.activeCount() == 0);
        CHECK_FALSE(fake->isLive(timerID));
    }

    SUBCASE("destruction stops every timer") {
        TimerID msID = 0;
        TimerID nsID = 0;
        TimerCallback orphan;
        {
            TimerMailbox mailbox(registry);
            msID = mailbox.start(10);
            nsID = mailbox.startNS(10);
            orphan = registry.callbackFor(msID);
        }
        CHECK_FALSE(registry.contains(msID));
        CHECK_FALSE(registry.containsNS(nsID));
        CHECK(fake->liveTimers().empty());

        // A firing already in flight when the mailbox went away stops its timer.
        REQUIRE(orphan);
        CHECK(orphan(msID, 10) == 0);
    }
}

} // namespace sdlkit
