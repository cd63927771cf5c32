#include "sdlkit/Config.h"
#include "sdlkit/Error.h"

#include "doctest/doctest.h"

namespace sdlkit {

TEST_CASE("InitConfig from JSON") {
    SUBCASE("full document") {
        json document = json::parse(R"({
            "subsystems": ["video", "gamepad", "sensor"],
            "hints": { "SDL_JOYSTICK_ALLOW_BACKGROUND_EVENTS": "1" },
            "app": { "name": "Probe", "version": "1.2", "identifier": "org.example.probe" },
            "gamepadMappings": ["03000000de280000ff11000001000000,Steam Virtual Gamepad,a:b0,b:b1,platform:Linux,"],
            "gamepadMappingFiles": ["gamecontrollerdb.txt"],
            "logPriority": "debug"
        })");

        InitConfig config = InitConfig::fromJson(document);
        CHECK(config.subsystems == std::vector<std::string>{"video", "gamepad", "sensor"});
        CHECK(config.initFlags() == (SDL_INIT_VIDEO | SDL_INIT_GAMEPAD | SDL_INIT_SENSOR));
        REQUIRE(config.hints.size() == 1);
        CHECK(config.hints.at("SDL_JOYSTICK_ALLOW_BACKGROUND_EVENTS") == "1");
        CHECK(config.app.name == "Probe");
        CHECK(config.app.version == "1.2");
        CHECK(config.app.identifier == "org.example.probe");
        CHECK(config.gamepadMappings.size() == 1);
        CHECK(config.gamepadMappingFiles == std::vector<std::string>{"gamecontrollerdb.txt"});
        CHECK(config.logPriority == log::Priority::DEBUG);
    }

    SUBCASE("empty object gives defaults") {
        InitConfig config = InitConfig::fromJson(json::object());
        CHECK(config.subsystems.empty());
        CHECK(config.hints.empty());
        CHECK(config.app.name.empty());
        CHECK(config.initFlags() == 0);
        CHECK(config.logPriority == log::Priority::INFO);
    }

    SUBCASE("toJson reads back the same settings") {
        InitConfig config;
        config.subsystems = {"audio", "joystick"};
        config.hints["SDL_HINT_X"] = "0";
        config.app.name = "Name";
        config.logPriority = log::Priority::WARN;

        json document = config.toJson();
        CHECK(document["subsystems"] == json::array({"audio", "joystick"}));
        CHECK(document["logPriority"] == "warn");

        InitConfig parsed = InitConfig::fromJson(document);
        CHECK(parsed.subsystems == config.subsystems);
        CHECK(parsed.hints == config.hints);
        CHECK(parsed.app.name == "Name");
        CHECK(parsed.logPriority == log::Priority::WARN);
    }
}

TEST_CASE("InitConfig rejects malformed documents") {
    CHECK_THROWS_AS(InitConfig::fromJson(json::array()), UsageError);
    CHECK_THROWS_WITH_AS(InitConfig::fromJson(json::parse(R"({"subsystems": ["video", "teleport"]})")),
                         "Unknown subsystem: teleport", UsageError);
    CHECK_THROWS_AS(InitConfig::fromJson(json::parse(R"({"subsystems": "video"})")), UsageError);
    CHECK_THROWS_AS(InitConfig::fromJson(json::parse(R"({"hints": {"A": 1}})")), UsageError);
    CHECK_THROWS_AS(InitConfig::fromJson(json::parse(R"({"app": {"name": 3}})")), UsageError);
    CHECK_THROWS_WITH_AS(InitConfig::fromJson(json::parse(R"({"logPriority": "loud"})")),
                         "Unknown log priority: loud", UsageError);
}

TEST_CASE("InitConfig from file") {
    SUBCASE("missing file is a native failure") {
        CHECK_THROWS_AS(InitConfig::fromFile("/nonexistent/sdlkit-config.json"), Error);
    }

    SUBCASE("file contents are parsed") {
        const char* path = "sdlkit_config_unittest.json";
        const char* text = R"({"subsystems": ["events"], "logPriority": "error"})";
        REQUIRE(SDL_SaveFile(path, text, SDL_strlen(text)));

        InitConfig config = InitConfig::fromFile(path);
        CHECK(config.initFlags() == SDL_INIT_EVENTS);
        CHECK(config.logPriority == log::Priority::ERROR);

        REQUIRE(SDL_SaveFile(path, "{ not json", 10));
        CHECK_THROWS_AS(InitConfig::fromFile(path), UsageError);
        CHECK(SDL_RemovePath(path));
    }
}

TEST_CASE("subsystem names") {
    CHECK(subsystemFlag("audio") == SDL_INIT_AUDIO);
    CHECK(subsystemFlag("camera") == SDL_INIT_CAMERA);
    CHECK(subsystemFlag("haptic") == SDL_INIT_HAPTIC);
    CHECK_THROWS_AS(subsystemFlag("Video"), UsageError);
}

} // namespace sdlkit
