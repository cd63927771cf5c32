#include "sdlkit/Error.h"

#include "doctest/doctest.h"

namespace sdlkit {

TEST_CASE("SDL failures become Error") {
    SUBCASE("false result") {
        SDL_SetError("boom %d", 7);
        CHECK_THROWS_WITH_AS(checkSdl(false), "boom 7", Error);
        CHECK_NOTHROW(checkSdl(true));
    }

    SUBCASE("null handle") {
        SDL_SetError("no such window");
        SDL_Window* window = nullptr;
        CHECK_THROWS_WITH_AS(checkHandle(window), "no such window", Error);

        int value = 3;
        CHECK(checkHandle(&value) == &value);
    }

    SUBCASE("zero id") {
        SDL_SetError("bad id");
        CHECK_THROWS_WITH_AS(checkId(SDL_JoystickID(0)), "bad id", Error);
        CHECK(checkId(SDL_JoystickID(12)) == 12);
    }

    SUBCASE("empty error text") {
        clearError();
        CHECK(lastError().empty());
        CHECK_THROWS_WITH_AS(raiseLastError(), "Unknown SDL error", Error);
    }
}

TEST_CASE("error kinds stay distinct") {
    CHECK_THROWS_AS(throw UsageError("caller bug"), std::logic_error);
    CHECK_THROWS_AS(throw Error("native failure"), std::runtime_error);
}

} // namespace sdlkit
