/*******************************************************************************
 * Context.cpp
 *
 * SDL lifecycle guard. Order matters on both ends:
 * - hints and metadata must be set before SDL_Init to take effect
 * - SDL_Quit must run before the timer registry is cleared, so no trampoline
 *   can still be running against the table
 ******************************************************************************/

#include "sdlkit/Context.h"
#include "sdlkit/Error.h"
#include "sdlkit/Gamepad.h"
#include "sdlkit/Log.h"
#include "sdlkit/TimerRegistry.h"

namespace sdlkit {

Context::Context(const InitConfig& config)
    : initConfig(config) {
    log::setPriority(initConfig.logPriority);

    if (!initConfig.app.name.empty()) {
        checkSdl(SDL_SetAppMetadata(
            initConfig.app.name.c_str(),
            initConfig.app.version.empty() ? nullptr : initConfig.app.version.c_str(),
            initConfig.app.identifier.empty() ? nullptr : initConfig.app.identifier.c_str()));
    }

    for (const auto& hint : initConfig.hints) {
        if (!SDL_SetHint(hint.first.c_str(), hint.second.c_str())) {
            log::warn("CONTEXT", "Hint " + hint.first + " was not applied: " + lastError());
        }
    }

    SDL_InitFlags flags = initConfig.initFlags();
    log::info("CONTEXT", "Initializing SDL (flags " + std::to_string(flags) + ")");
    checkSdl(SDL_Init(flags));

    if (flags & SDL_INIT_GAMEPAD) {
        try {
            loadGamepadMappings();
        } catch (...) {
            SDL_Quit();
            throw;
        }
    }
}

Context::~Context() {
    log::info("CONTEXT", "Shutting down SDL");
    SDL_Quit();
    TimerRegistry::instance().clear();
}

bool Context::wasInit(SDL_InitFlags flags) {
    return (SDL_WasInit(flags) & flags) == flags;
}

void Context::loadGamepadMappings() {
    for (const auto& mapping : initConfig.gamepadMappings) {
        Gamepad::addMapping(mapping);
        ++loadedMappings;
    }

    for (const auto& path : initConfig.gamepadMappingFiles) {
        int added = Gamepad::addMappingsFromFile(path);
        log::info("CONTEXT", "Loaded " + std::to_string(added) + " gamepad mappings from " + path);
        loadedMappings += added;
    }
}

} // namespace sdlkit
