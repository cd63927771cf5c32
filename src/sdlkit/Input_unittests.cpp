#include "sdlkit/DeviceReport.h"
#include "sdlkit/Joystick.h"
#include "sdlkit/Keyboard.h"
#include "sdlkit/Mouse.h"
#include "sdlkit/Touch.h"

#include "doctest/doctest.h"

namespace sdlkit {

TEST_CASE("keyboard state lookups stay in bounds") {
    bool keys[4] = {false, true, false, true};
    KeyboardState state(keys, 4);
    CHECK(state.isPressed(static_cast<SDL_Scancode>(1)));
    CHECK_FALSE(state.isPressed(static_cast<SDL_Scancode>(2)));
    CHECK_FALSE(state.isPressed(static_cast<SDL_Scancode>(4)));
    CHECK_FALSE(state.isPressed(static_cast<SDL_Scancode>(-1)));
    CHECK_FALSE(KeyboardState().isPressed(SDL_SCANCODE_A));
}

TEST_CASE("scancode and key names") {
    CHECK(Keyboard::scancodeName(SDL_SCANCODE_A) == "A");
    CHECK(Keyboard::scancodeFromName("Space") == SDL_SCANCODE_SPACE);
    CHECK(Keyboard::scancodeFromName("no such key") == SDL_SCANCODE_UNKNOWN);
    CHECK(Keyboard::keyName(SDLK_ESCAPE) == "Escape");
    CHECK(Keyboard::keyFromName("F1") == SDLK_F1);
}

TEST_CASE("device handles compare by id") {
    CHECK(Keyboard() == nullptr);
    CHECK(Keyboard(7) != nullptr);
    CHECK(Mouse::touch() == Mouse(SDL_TOUCH_MOUSEID));
    CHECK(Mouse::touch() != Mouse::pen());
    CHECK(Touch::mouse() == Touch(SDL_MOUSE_TOUCHID));
    CHECK(Cursor() == nullptr);
}

TEST_CASE("mouse button state") {
    MouseState state;
    state.buttons = SDL_BUTTON_LMASK | SDL_BUTTON_X1MASK;
    CHECK(state.isDown(SDL_BUTTON_LEFT));
    CHECK(state.isDown(SDL_BUTTON_X1));
    CHECK_FALSE(state.isDown(SDL_BUTTON_RIGHT));
}

TEST_CASE("device report lists every category") {
    REQUIRE(SDL_Init(SDL_INIT_JOYSTICK));

    VirtualJoystickDesc desc;
    desc.name = "sdlkit report stick";
    desc.numButtons = 1;
    JoystickID id = desc.attach();

    json report = DeviceReport::build();
    for (const char* key : {"keyboards", "mice", "touch", "sensors", "gamepads", "joysticks"}) {
        REQUIRE(report.contains(key));
        CHECK(report[key].is_array());
    }
    CHECK(report["sensors"].empty());

    bool listed = false;
    for (const auto& joystick : report["joysticks"]) {
        if (joystick["id"] == id.value()) {
            listed = true;
            CHECK(joystick["name"] == "sdlkit report stick");
            CHECK(joystick["virtual"] == true);
        }
    }
    CHECK(listed);

    Joystick::detachVirtual(id);
    SDL_QuitSubSystem(SDL_INIT_JOYSTICK);
}

} // namespace sdlkit
