#include "sdlkit/Marshal.h"

#include "doctest/doctest.h"

namespace sdlkit {

TEST_CASE("C string conversion") {
    CHECK(toString(nullptr) == "");
    CHECK(toString("pad") == "pad");
    CHECK(takeString(nullptr) == "");
    CHECK(takeString(SDL_strdup("owned")) == "owned");
}

TEST_CASE("SDL arrays are copied and released") {
    SUBCASE("null array") {
        int* none = nullptr;
        CHECK(takeArray(none, 4).empty());
    }

    SUBCASE("populated array") {
        auto* raw = static_cast<SDL_JoystickID*>(SDL_malloc(3 * sizeof(SDL_JoystickID)));
        REQUIRE(raw);
        raw[0] = 5;
        raw[1] = 9;
        raw[2] = 11;
        std::vector<SDL_JoystickID> ids = takeArray(raw, 3);
        CHECK(ids == std::vector<SDL_JoystickID>{5, 9, 11});
    }

    SUBCASE("empty array is still released") {
        auto* raw = static_cast<SDL_SensorID*>(SDL_malloc(sizeof(SDL_SensorID)));
        REQUIRE(raw);
        CHECK(takeArray(raw, 0).empty());
    }
}

TEST_CASE("GUID text form") {
    const std::string text = "03000000de280000ff11000001000000";
    SDL_GUID guid = guidFromString(text);
    CHECK(guidToString(guid) == text);
    CHECK(guidEquals(guid, guidFromString(text)));
    CHECK_FALSE(guidEquals(guid, guidFromString("00000000000000000000000000000000")));
}

} // namespace sdlkit
