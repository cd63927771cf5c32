#include "sdlkit/Log.h"
#include "sdlkit/Error.h"

#include "doctest/doctest.h"

#include <string>
#include <vector>

namespace sdlkit {

namespace {

struct Captured {
    int category;
    SDL_LogPriority priority;
    std::string message;
};

void SDLCALL capture(void* userdata, int category, SDL_LogPriority priority, const char* message) {
    static_cast<std::vector<Captured>*>(userdata)->push_back(Captured{category, priority, message});
}

} // namespace

TEST_CASE("log priority names") {
    for (auto priority : {log::Priority::VERBOSE, log::Priority::DEBUG, log::Priority::INFO,
                          log::Priority::WARN, log::Priority::ERROR, log::Priority::CRITICAL}) {
        CHECK(log::priorityFromName(log::priorityName(priority)) == priority);
    }
    CHECK_THROWS_AS(log::priorityFromName("DEBUG"), UsageError);
}

TEST_CASE("tagged messages go through SDL's log") {
    SDL_LogOutputFunction previousFunction = nullptr;
    void* previousUserdata = nullptr;
    SDL_GetLogOutputFunction(&previousFunction, &previousUserdata);
    log::Priority previousPriority = log::getPriority();

    std::vector<Captured> lines;
    SDL_SetLogOutputFunction(capture, &lines);
    log::setPriority(log::Priority::INFO);
    CHECK(log::getPriority() == log::Priority::INFO);

    log::debug("TEST", "filtered out");
    log::warn("TEST", "kept");

    SDL_SetLogOutputFunction(previousFunction, previousUserdata);
    log::setPriority(previousPriority);

    REQUIRE(lines.size() == 1);
    CHECK(lines[0].category == log::CATEGORY);
    CHECK(lines[0].priority == SDL_LOG_PRIORITY_WARN);
    CHECK(lines[0].message == "[TEST] kept");
}

} // namespace sdlkit
