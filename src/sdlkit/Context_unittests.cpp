#include "sdlkit/Context.h"
#include "sdlkit/Error.h"
#include "sdlkit/TimerRegistry.h"

#include "doctest/doctest.h"

#include <string>

namespace sdlkit {

TEST_CASE("Context owns SDL initialization") {
    InitConfig config;
    config.subsystems = {"events"};
    config.hints["SDL_APP_NAME"] = "sdlkit tests";
    config.app.name = "sdlkit unittests";
    config.logPriority = log::Priority::WARN;
    log::Priority previousPriority = log::getPriority();

    {
        Context context(config);
        CHECK(Context::wasInit(SDL_INIT_EVENTS));
        CHECK(log::getPriority() == log::Priority::WARN);
        CHECK(std::string(SDL_GetHint("SDL_APP_NAME")) == "sdlkit tests");
        CHECK(context.mappingsLoaded() == 0);

        addTimer(10000, [](TimerID, Uint32 interval) { return interval; });
        CHECK(TimerRegistry::instance().size() == 1);
    }

    CHECK_FALSE(Context::wasInit(SDL_INIT_EVENTS));
    CHECK(TimerRegistry::instance().size() == 0);
    log::setPriority(previousPriority);
}

TEST_CASE("Context loads gamepad mappings") {
    InitConfig config;
    config.subsystems = {"gamepad"};
    config.gamepadMappings = {"03000000ffff0000dddd000000000000,sdlkit context pad,a:b0,b:b1,"};

    Context context(config);
    CHECK(Context::wasInit(SDL_INIT_GAMEPAD | SDL_INIT_JOYSTICK));
    CHECK(context.mappingsLoaded() == 1);
}

TEST_CASE("Context reports bad mappings and leaves SDL down") {
    InitConfig config;
    config.subsystems = {"gamepad"};
    config.gamepadMappingFiles = {"/nonexistent/gamecontrollerdb.txt"};

    CHECK_THROWS_AS(Context{config}, Error);
    CHECK_FALSE(Context::wasInit(SDL_INIT_GAMEPAD));
}

} // namespace sdlkit
