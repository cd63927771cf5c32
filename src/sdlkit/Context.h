#pragma once

#include "sdlkit/Config.h"

namespace sdlkit {

/**
 * Owns SDL's initialization for the lifetime of the object.
 *
 * Construction applies the log priority, app metadata and hints, calls
 * SDL_Init and loads gamepad mappings. Destruction calls SDL_Quit, which stops
 * SDL's timer thread, and then clears the process-wide TimerRegistry.
 */
class Context {
public:
    explicit Context(const InitConfig& config);
    ~Context();

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    const InitConfig& config() const { return initConfig; }

    // Number of mappings added from the config (strings and files).
    int mappingsLoaded() const { return loadedMappings; }

    static bool wasInit(SDL_InitFlags flags);

private:
    InitConfig initConfig;
    int loadedMappings = 0;

    void loadGamepadMappings();
};

} // namespace sdlkit
