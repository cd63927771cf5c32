#include "sdlkit/TimerRegistry.h"
#include "sdlkit/Error.h"
#include "sdlkit/FakeTimerBackend.h"

#include "doctest/doctest.h"

#include <atomic>
#include <functional>
#include <memory>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

namespace sdlkit {

namespace {

struct Fixture {
    Fixture() {
        auto backend = std::make_unique<FakeTimerBackend>();
        fake = backend.get();
        registry = std::make_unique<TimerRegistry>(std::move(backend));
    }

    FakeTimerBackend* fake = nullptr;
    std::unique_ptr<TimerRegistry> registry;
};

// Runs a hook inside the native removal call, where SDL's timer thread can
// still be firing the timer being removed.
class OverlappingRemovalBackend : public FakeTimerBackend {
public:
    bool removeTimer(TimerID timerID) override {
        if (duringRemoval) {
            duringRemoval(timerID);
        }
        return FakeTimerBackend::removeTimer(timerID);
    }

    std::function<void(TimerID)> duringRemoval;
};

Uint32 keepRate(TimerID, Uint32 interval) {
    return interval;
}

Uint64 keepRateNS(TimerID, Uint64 interval) {
    return interval;
}

} // namespace

TEST_CASE("TimerRegistry registration") {
    Fixture f;

    SUBCASE("empty callback never reaches the backend") {
        CHECK_THROWS_AS(f.registry->addTimer(100, TimerCallback()), UsageError);
        CHECK_THROWS_WITH(f.registry->addTimerNS(100, TimerNSCallback()), "No timer callback specified.");
        CHECK(f.fake->addCalls == 0);
        CHECK(f.registry->size() == 0);
        CHECK(f.registry->sizeNS() == 0);
    }

    SUBCASE("stored callback is the registered one") {
        TimerID timerID = f.registry->addTimer(100, keepRate);
        REQUIRE(timerID != 0);
        CHECK(f.registry->contains(timerID));

        TimerCallback stored = f.registry->callbackFor(timerID);
        REQUIRE(stored);
        auto target = stored.target<Uint32 (*)(TimerID, Uint32)>();
        REQUIRE(target != nullptr);
        CHECK(*target == &keepRate);
    }

    SUBCASE("millisecond and nanosecond ids live in separate tables") {
        TimerID msID = f.registry->addTimer(10, keepRate);
        TimerID nsID = f.registry->addTimerNS(10, keepRateNS);
        CHECK(f.registry->contains(msID));
        CHECK_FALSE(f.registry->containsNS(msID));
        CHECK(f.registry->containsNS(nsID));
        CHECK_FALSE(f.registry->contains(nsID));
        CHECK_FALSE(f.registry->callbackFor(nsID));
        CHECK(f.registry->callbackForNS(nsID));
    }

    SUBCASE("native failure stores nothing and reports the native message") {
        f.fake->failAdds = true;
        CHECK_THROWS_WITH_AS(f.registry->addTimer(10, keepRate), "Timer creation refused", Error);
        CHECK_THROWS_WITH_AS(f.registry->addTimerNS(10, keepRateNS), "Timer creation refused", Error);
        CHECK(f.fake->addCalls == 2);
        CHECK(f.registry->size() == 0);
        CHECK(f.registry->sizeNS() == 0);
    }
}

TEST_CASE("TimerRegistry dispatch") {
    Fixture f;

    SUBCASE("unknown id returns 0") {
        CHECK(TimerRegistry::trampoline(f.registry.get(), 4242, 10) == 0);
        CHECK(TimerRegistry::trampolineNS(f.registry.get(), 4242, 10) == 0);
        CHECK(f.registry->dispatch(0, 10) == 0);
    }

    SUBCASE("null userdata returns 0") {
        CHECK(TimerRegistry::trampoline(nullptr, 1, 10) == 0);
        CHECK(TimerRegistry::trampolineNS(nullptr, 1, 10) == 0);
    }

    SUBCASE("callback runs once with the firing's id and interval") {
        int calls = 0;
        TimerID seenID = 0;
        Uint32 seenInterval = 0;
        TimerID timerID = f.registry->addTimer(25, [&](TimerID id, Uint32 interval) -> Uint32 {
            ++calls;
            seenID = id;
            seenInterval = interval;
            return interval;
        });

        CHECK(f.registry->dispatch(timerID, 25) == 25);
        CHECK(calls == 1);
        CHECK(seenID == timerID);
        CHECK(seenInterval == 25);
        CHECK(f.registry->contains(timerID));
    }

    SUBCASE("entry goes away only when the callback returns 0") {
        Uint32 next = 40;
        TimerID timerID = f.registry->addTimer(20, [&](TimerID, Uint32) { return next; });

        CHECK(f.fake->fire(timerID) == 40);
        CHECK(f.fake->intervalOf(timerID) == 40);
        CHECK(f.registry->contains(timerID));

        next = 0;
        CHECK(f.fake->fire(timerID) == 0);
        CHECK_FALSE(f.registry->contains(timerID));
        CHECK_FALSE(f.fake->isLive(timerID));
    }

    SUBCASE("nanosecond timers use the nanosecond table") {
        int calls = 0;
        TimerID timerID = f.registry->addTimerNS(500, [&](TimerID, Uint64 interval) -> Uint64 {
            ++calls;
            return calls < 2 ? interval : 0;
        });

        CHECK(f.registry->dispatch(timerID, 500) == 0);
        CHECK(calls == 0);

        CHECK(f.fake->fire(timerID) == 500);
        CHECK(f.fake->fire(timerID) == 0);
        CHECK(calls == 2);
        CHECK_FALSE(f.registry->containsNS(timerID));
    }

    SUBCASE("throwing callback stops its timer") {
        TimerID timerID = f.registry->addTimer(10, [](TimerID, Uint32) -> Uint32 {
            throw std::runtime_error("callback failed");
        });

        CHECK(f.fake->fire(timerID) == 0);
        CHECK_FALSE(f.registry->contains(timerID));
        CHECK_NOTHROW(f.registry->removeTimer(timerID));
    }

    SUBCASE("non-standard exception also stops its timer") {
        TimerID timerID = f.registry->addTimer(10, [](TimerID, Uint32) -> Uint32 { throw 7; });

        CHECK(f.fake->fire(timerID) == 0);
        CHECK_FALSE(f.registry->contains(timerID));
        CHECK_FALSE(f.fake->isLive(timerID));
        CHECK_NOTHROW(f.registry->removeTimer(timerID));
    }

    SUBCASE("callback may remove its own timer") {
        TimerID timerID = 0;
        timerID = f.registry->addTimer(10, [&](TimerID id, Uint32 interval) -> Uint32 {
            f.registry->removeTimer(id);
            return interval;
        });

        f.fake->fire(timerID);
        CHECK_FALSE(f.registry->contains(timerID));
        CHECK_FALSE(f.fake->isLive(timerID));
    }
}

TEST_CASE("TimerRegistry removal") {
    Fixture f;

    SUBCASE("removal clears both tables") {
        TimerID msID = f.registry->addTimer(10, keepRate);
        TimerID nsID = f.registry->addTimerNS(10, keepRateNS);

        f.registry->removeTimer(msID);
        CHECK_FALSE(f.registry->contains(msID));
        CHECK_FALSE(f.registry->containsNS(msID));
        CHECK(f.registry->containsNS(nsID));

        f.registry->removeTimer(nsID);
        CHECK_FALSE(f.registry->contains(nsID));
        CHECK_FALSE(f.registry->containsNS(nsID));
        CHECK(f.fake->liveTimers().empty());
    }

    SUBCASE("repeating timer fires with its own id and can be removed") {
        std::vector<TimerID> seenIDs;
        std::vector<Uint32> seenIntervals;
        TimerID timerID = f.registry->addTimer(100, [&](TimerID id, Uint32 interval) -> Uint32 {
            seenIDs.push_back(id);
            seenIntervals.push_back(interval);
            return 100;
        });

        for (int i = 0; i < 5; ++i) {
            CHECK(f.fake->fire(timerID) == 100);
        }
        CHECK(seenIDs == std::vector<TimerID>(5, timerID));
        CHECK(seenIntervals == std::vector<Uint32>(5, 100));

        CHECK_NOTHROW(f.registry->removeTimer(timerID));
        CHECK_FALSE(f.registry->contains(timerID));
        CHECK_FALSE(f.fake->isLive(timerID));
    }

    SUBCASE("removing a self-cancelled timer is not an error") {
        int calls = 0;
        TimerID timerID = f.registry->addTimer(10, [&](TimerID, Uint32) -> Uint32 {
            ++calls;
            return 0;
        });

        CHECK(f.fake->fire(timerID) == 0);
        CHECK(calls == 1);
        CHECK_FALSE(f.registry->contains(timerID));
        CHECK_NOTHROW(f.registry->removeTimer(timerID));
        CHECK(f.fake->removeCalls == 1);
    }

    SUBCASE("native removal failure is reported") {
        CHECK_THROWS_WITH_AS(f.registry->removeTimer(777), "Timer not found", Error);

        TimerID timerID = f.registry->addTimer(10, keepRate);
        f.fake->failRemoves = true;
        CHECK_THROWS_WITH_AS(f.registry->removeTimer(timerID), "Timer removal refused", Error);
        CHECK_FALSE(f.registry->contains(timerID));
    }

    SUBCASE("clear forgets every entry without touching the backend") {
        f.registry->addTimer(10, keepRate);
        f.registry->addTimerNS(10, keepRateNS);
        f.registry->clear();
        CHECK(f.registry->size() == 0);
        CHECK(f.registry->sizeNS() == 0);
        CHECK(f.fake->removeCalls == 0);
    }
}

TEST_CASE("TimerRegistry removal overlapping the last firing") {
    auto owned = std::make_unique<OverlappingRemovalBackend>();
    OverlappingRemovalBackend* backend = owned.get();
    TimerRegistry registry(std::move(owned));

    SUBCASE("final firing in flight when removal starts") {
        std::atomic<bool> entered{false};
        std::atomic<bool> removalStarted{false};
        TimerID timerID = registry.addTimer(10, [&](TimerID, Uint32) -> Uint32 {
            entered = true;
            while (!removalStarted) {
                std::this_thread::yield();
            }
            return 0;
        });

        std::atomic<Uint64> result{1};
        std::thread firing([&] { result = backend->fire(timerID); });
        while (!entered) {
            std::this_thread::yield();
        }

        // The native call completes only after the firing has returned 0.
        backend->duringRemoval = [&](TimerID) {
            removalStarted = true;
            firing.join();
        };

        CHECK_NOTHROW(registry.removeTimer(timerID));
        CHECK(result == 0);
        CHECK_FALSE(registry.contains(timerID));
        CHECK_FALSE(backend->isLive(timerID));

        // The stopped record is consumed by the removal it excused.
        backend->duringRemoval = nullptr;
        CHECK_THROWS_WITH_AS(registry.removeTimer(timerID), "Timer not found", Error);
    }

    SUBCASE("firing arrives after the entry is gone") {
        int calls = 0;
        TimerID timerID = registry.addTimer(10, [&](TimerID, Uint32 interval) -> Uint32 {
            ++calls;
            return interval;
        });

        Uint64 result = 1;
        backend->duringRemoval = [&](TimerID id) { result = backend->fire(id); };

        CHECK_NOTHROW(registry.removeTimer(timerID));
        CHECK(result == 0);
        CHECK(calls == 0);
        CHECK_FALSE(backend->isLive(timerID));
    }

    SUBCASE("nanosecond firing after the entry is gone") {
        TimerID timerID = registry.addTimerNS(10, keepRateNS);

        backend->duringRemoval = [&](TimerID id) { backend->fire(id); };

        CHECK_NOTHROW(registry.removeTimer(timerID));
        CHECK_FALSE(registry.containsNS(timerID));
        CHECK_FALSE(backend->isLive(timerID));
    }

    SUBCASE("refused removal without a racing firing is still reported") {
        TimerID timerID = registry.addTimer(10, keepRate);
        backend->failRemoves = true;
        CHECK_THROWS_WITH_AS(registry.removeTimer(timerID), "Timer removal refused", Error);
    }
}

TEST_CASE("TimerRegistry firing before registration returns") {
    Fixture f;
    f.fake->fireEarly = true;

    std::atomic<int> calls{0};
    TimerID timerID = f.registry->addTimer(50, [&](TimerID, Uint32 interval) -> Uint32 {
        ++calls;
        return interval;
    });
    f.fake->joinEarlyFirings();

    CHECK(calls == 1);
    CHECK(f.fake->earlyResult == 50);
    CHECK(f.registry->contains(timerID));
}

TEST_CASE("TimerRegistry concurrent registration and removal") {
    Fixture f;

    const int THREADS = 8;
    const int PER_THREAD = 64;
    std::vector<std::vector<TimerID>> ids(THREADS);
    std::atomic<bool> done{false};
    std::atomic<int> firings{0};

    // Fires whatever is live while the table is being filled and emptied.
    std::thread firer([&] {
        while (!done) {
            for (TimerID timerID : f.fake->liveTimers()) {
                f.fake->fire(timerID);
            }
        }
    });

    std::vector<std::thread> workers;
    for (int t = 0; t < THREADS; ++t) {
        workers.emplace_back([&, t] {
            for (int i = 0; i < PER_THREAD; ++i) {
                ids[t].push_back(f.registry->addTimer(5, [&](TimerID, Uint32 interval) -> Uint32 {
                    ++firings;
                    return interval;
                }));
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    workers.clear();

    std::set<TimerID> unique;
    for (const auto& list : ids) {
        unique.insert(list.begin(), list.end());
    }
    CHECK(unique.size() == static_cast<size_t>(THREADS * PER_THREAD));
    CHECK(f.registry->size() == static_cast<size_t>(THREADS * PER_THREAD));

    for (int t = 0; t < THREADS; ++t) {
        workers.emplace_back([&, t] {
            for (TimerID timerID : ids[t]) {
                f.registry->removeTimer(timerID);
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    done = true;
    firer.join();

    CHECK(f.registry->size() == 0);
    CHECK(f.fake->liveTimers().empty());
}

} // namespace sdlkit
