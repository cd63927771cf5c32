#include "sdlkit/Time.h"

#include "doctest/doctest.h"

namespace sdlkit {

TEST_CASE("time unit conversions") {
    CHECK(msToNS(1) == 1000000);
    CHECK(nsToMS(2999999) == 2);
    CHECK(usToNS(7) == 7000);
    CHECK(nsToUS(7999) == 7);
    CHECK(secondsToNS(1.5) == 1500000000);
    CHECK(secondsToNS(0.0000000019) == 1);
    CHECK(nsToSeconds(250000000) == doctest::Approx(0.25));
}

TEST_CASE("clocks move forward") {
    Uint64 before = getTicksNS();
    delayNS(msToNS(2));
    Uint64 after = getTicksNS();
    CHECK(after - before >= msToNS(2));
    CHECK(getTicks() >= nsToMS(after) - 1);
    CHECK(getPerformanceFrequency() > 0);
    CHECK(getPerformanceCounter() > 0);
}

} // namespace sdlkit
