#pragma once

#include "sdlkit/Log.h"

#include <SDL3/SDL.h>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sdlkit {

using json = nlohmann::json;

struct AppMetadata {
    std::string name;
    std::string version;
    std::string identifier;
};

/**
 * Everything needed to bring SDL up: which subsystems, which hints, and
 * which gamepad mappings to load. Usually read from a JSON file:
 *
 *   {
 *     "subsystems": ["video", "gamepad"],
 *     "hints": { "SDL_JOYSTICK_ALLOW_BACKGROUND_EVENTS": "1" },
 *     "app": { "name": "Probe", "version": "1.0", "identifier": "org.example.probe" },
 *     "gamepadMappings": ["..."],
 *     "gamepadMappingFiles": ["gamecontrollerdb.txt"],
 *     "logPriority": "debug"
 *   }
 */
struct InitConfig {
    std::vector<std::string> subsystems;
    std::map<std::string, std::string> hints;
    AppMetadata app;
    std::vector<std::string> gamepadMappings;
    std::vector<std::string> gamepadMappingFiles;
    log::Priority logPriority = log::Priority::INFO;

    // Throws UsageError on unknown names or wrongly typed fields.
    static InitConfig fromJson(const json& document);

    // Throws Error if the file cannot be read, UsageError if it is malformed.
    static InitConfig fromFile(const std::string& path);

    json toJson() const;

    // Combined SDL_InitFlags of all listed subsystems.
    SDL_InitFlags initFlags() const;
};

// Maps "video", "audio", "joystick", "haptic", "gamepad", "events", "sensor", "camera".
SDL_InitFlags subsystemFlag(const std::string& name);

} // namespace sdlkit
