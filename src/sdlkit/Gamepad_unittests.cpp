#include "sdlkit/Gamepad.h"
#include "sdlkit/Error.h"
#include "sdlkit/Marshal.h"

#include "doctest/doctest.h"

#include <string>

namespace sdlkit {

TEST_CASE("gamepad string tables") {
    SUBCASE("buttons") {
        CHECK(gamepadButtonFromString("a") == SDL_GAMEPAD_BUTTON_SOUTH);
        CHECK(gamepadButtonToString(SDL_GAMEPAD_BUTTON_SOUTH) == "a");
        CHECK(gamepadButtonToString(SDL_GAMEPAD_BUTTON_START) == "start");
        CHECK(gamepadButtonFromString("not-a-button") == SDL_GAMEPAD_BUTTON_INVALID);
        CHECK(gamepadButtonToString(SDL_GAMEPAD_BUTTON_INVALID) == "");
    }

    SUBCASE("axes") {
        CHECK(gamepadAxisFromString("leftx") == SDL_GAMEPAD_AXIS_LEFTX);
        CHECK(gamepadAxisToString(SDL_GAMEPAD_AXIS_RIGHT_TRIGGER) == "righttrigger");
        CHECK(gamepadAxisFromString("sideways") == SDL_GAMEPAD_AXIS_INVALID);
    }

    SUBCASE("kinds") {
        CHECK(gamepadKindToString(SDL_GAMEPAD_TYPE_XBOXONE) == "xboxone");
        CHECK(gamepadKindFromString("ps4") == SDL_GAMEPAD_TYPE_PS4);
        CHECK(gamepadKindFromString("toaster") == SDL_GAMEPAD_TYPE_UNKNOWN);
    }

    SUBCASE("face button labels depend on the kind") {
        CHECK(gamepadButtonLabelFor(SDL_GAMEPAD_TYPE_XBOXONE, SDL_GAMEPAD_BUTTON_SOUTH) == SDL_GAMEPAD_BUTTON_LABEL_A);
        CHECK(gamepadButtonLabelFor(SDL_GAMEPAD_TYPE_PS4, SDL_GAMEPAD_BUTTON_SOUTH) == SDL_GAMEPAD_BUTTON_LABEL_CROSS);
    }
}

TEST_CASE("gamepad handles compare by identity") {
    Gamepad none;
    CHECK(none == nullptr);
    CHECK_FALSE(none);
    CHECK(none == Gamepad(nullptr));
    CHECK(GamepadID() == GamepadID(0));
    CHECK(GamepadID(3) != GamepadID(4));
}

TEST_CASE("gamepad mappings and a virtual gamepad") {
    REQUIRE(SDL_Init(SDL_INIT_GAMEPAD));

    SUBCASE("mapping database") {
        const std::string guid = "03000000ffff0000eeee000000000000";
        const std::string mapping = guid + ",sdlkit test pad,a:b0,b:b1,x:b2,y:b3,leftx:a0,lefty:a1,";

        CHECK(Gamepad::addMapping(mapping));
        CHECK_FALSE(Gamepad::addMapping(mapping));
        CHECK(Gamepad::mappingForGuid(guidFromString(guid)).find("sdlkit test pad") != std::string::npos);

        bool listed = false;
        for (const std::string& entry : Gamepad::mappings()) {
            listed = listed || entry.find("sdlkit test pad") != std::string::npos;
        }
        CHECK(listed);

        CHECK_THROWS_AS(Gamepad::addMapping("garbage"), Error);
    }

    SUBCASE("virtual gamepad input") {
        VirtualJoystickDesc desc;
        desc.kind = SDL_JOYSTICK_TYPE_GAMEPAD;
        desc.name = "sdlkit virtual pad";
        desc.numAxes = SDL_GAMEPAD_AXIS_COUNT;
        desc.numButtons = SDL_GAMEPAD_BUTTON_COUNT;

        JoystickID id = desc.attach();
        REQUIRE(id);
        CHECK(id.isVirtual());
        CHECK(id.isGamepad());

        Gamepad gamepad = Gamepad::open(GamepadID(id.value()));
        REQUIRE(gamepad);
        CHECK(gamepad.id() == GamepadID(id.value()));
        CHECK(Gamepad::fromID(GamepadID(id.value())) == gamepad);
        CHECK(gamepad.name() == "sdlkit virtual pad");
        CHECK(gamepad.hasButton(SDL_GAMEPAD_BUTTON_SOUTH));
        CHECK_FALSE(gamepad.bindings().empty());

        Joystick joystick = gamepad.joystick();
        joystick.setVirtualButton(SDL_GAMEPAD_BUTTON_SOUTH, true);
        joystick.setVirtualAxis(SDL_GAMEPAD_AXIS_LEFTX, 12000);
        Gamepad::update();

        CHECK(gamepad.button(SDL_GAMEPAD_BUTTON_SOUTH));
        CHECK(gamepad.axis(SDL_GAMEPAD_AXIS_LEFTX) == 12000);

        gamepad.close();
        CHECK(gamepad == nullptr);
        Joystick::detachVirtual(id);
    }

    SDL_QuitSubSystem(SDL_INIT_GAMEPAD);
}

} // namespace sdlkit
