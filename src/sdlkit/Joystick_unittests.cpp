#include "sdlkit/Joystick.h"
#include "sdlkit/Error.h"
#include "sdlkit/Marshal.h"

#include "doctest/doctest.h"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

namespace sdlkit {

TEST_CASE("joystick handles compare by identity") {
    Joystick none;
    CHECK(none == nullptr);
    CHECK_FALSE(none);
    CHECK(JoystickID() == JoystickID(0));
    CHECK(std::string(joystickKindName(SDL_JOYSTICK_TYPE_WHEEL)) == "wheel");
}

TEST_CASE("virtual joystick round trip") {
    REQUIRE(SDL_Init(SDL_INIT_JOYSTICK));

    int updates = 0;
    int playerIndex = -1;
    Uint16 rumbleLow = 0;

    VirtualJoystickDesc desc;
    desc.kind = SDL_JOYSTICK_TYPE_FLIGHT_STICK;
    desc.name = "sdlkit virtual stick";
    desc.vendorID = 0x1234;
    desc.productID = 0x5678;
    desc.numAxes = 2;
    desc.numButtons = 4;
    desc.numHats = 1;
    desc.numBalls = 1;
    desc.update = [&] { ++updates; };
    desc.setPlayerIndex = [&](int index) { playerIndex = index; };
    desc.rumble = [&](Uint16 low, Uint16) {
        rumbleLow = low;
        return true;
    };
    desc.setLED = [](Uint8, Uint8, Uint8) -> bool { throw std::runtime_error("no LED"); };
    desc.rumbleTriggers = [](Uint16, Uint16) -> bool { throw 42; };

    JoystickID id = desc.attach();
    REQUIRE(id);
    CHECK(id.isVirtual());
    CHECK_FALSE(id.isGamepad());
    CHECK(id.name() == "sdlkit virtual stick");
    CHECK(id.vendor() == 0x1234);
    CHECK(id.product() == 0x5678);
    CHECK(id.kind() == SDL_JOYSTICK_TYPE_FLIGHT_STICK);

    std::vector<JoystickID> all = Joystick::joysticks();
    CHECK(std::find(all.begin(), all.end(), id) != all.end());

    Joystick joystick = Joystick::open(id);
    REQUIRE(joystick);
    CHECK(joystick.id() == id);
    CHECK(Joystick::fromID(id) == joystick);
    CHECK(joystick.numAxes() == 2);
    CHECK(joystick.numButtons() == 4);
    CHECK(joystick.numHats() == 1);
    CHECK(joystick.numBalls() == 1);

    GuidInfo info = Joystick::guidInfo(joystick.guid());
    CHECK(info.vendor == 0x1234);
    CHECK(info.product == 0x5678);

    SUBCASE("injected input is visible after an update") {
        joystick.setVirtualAxis(1, -2000);
        joystick.setVirtualButton(3, true);
        joystick.setVirtualHat(0, SDL_HAT_LEFTUP);
        Joystick::update();

        CHECK(updates > 0);
        CHECK(joystick.axis(1) == -2000);
        CHECK(joystick.button(3));
        CHECK_FALSE(joystick.button(0));
        CHECK(joystick.hat(0) == SDL_HAT_LEFTUP);
    }

    SUBCASE("hooks receive output requests") {
        joystick.setPlayerIndex(2);
        CHECK(playerIndex == 2);
        CHECK(joystick.playerIndex() == 2);

        joystick.rumble(0x4000, 0x2000, 100);
        CHECK(rumbleLow == 0x4000);

        CHECK_THROWS_WITH_AS(joystick.setLED(1, 2, 3), "no LED", Error);
        std::vector<Uint8> effect = {1, 2};
        CHECK_THROWS_AS(joystick.sendEffect(effect), Error);

        CHECK_THROWS_WITH_AS(joystick.rumbleTriggers(1, 1, 100), "Virtual joystick rumbleTriggers hook failed", Error);
    }

    SUBCASE("out of range input is rejected") {
        CHECK_THROWS_AS(joystick.setVirtualAxis(5, 0), Error);
        CHECK_THROWS_AS(joystick.setVirtualButton(40, true), Error);
    }

    joystick.close();
    Joystick::detachVirtual(id);
    CHECK_FALSE(JoystickID(id).isVirtual());
    SDL_QuitSubSystem(SDL_INIT_JOYSTICK);
}

} // namespace sdlkit
