/*******************************************************************************
 * Config.cpp
 *
 * JSON-backed initialization settings. Parsing errors are reported as
 * UsageError (the document is the caller's input); a file SDL cannot read is
 * reported as Error with SDL's message.
 ******************************************************************************/

#include "sdlkit/Config.h"
#include "sdlkit/Error.h"

namespace sdlkit {

namespace {

struct SubsystemName {
    const char* name;
    SDL_InitFlags flag;
};

const SubsystemName SUBSYSTEMS[] = {
    {"audio",    SDL_INIT_AUDIO},
    {"video",    SDL_INIT_VIDEO},
    {"joystick", SDL_INIT_JOYSTICK},
    {"haptic",   SDL_INIT_HAPTIC},
    {"gamepad",  SDL_INIT_GAMEPAD},
    {"events",   SDL_INIT_EVENTS},
    {"sensor",   SDL_INIT_SENSOR},
    {"camera",   SDL_INIT_CAMERA},
};

std::vector<std::string> readStringList(const json& document, const char* key) {
    std::vector<std::string> result;
    if (!document.contains(key)) {
        return result;
    }

    const json& list = document.at(key);
    if (!list.is_array()) {
        throw UsageError(std::string("'") + key + "' must be an array of strings");
    }
    for (const auto& item : list) {
        if (!item.is_string()) {
            throw UsageError(std::string("'") + key + "' must be an array of strings");
        }
        result.push_back(item.get<std::string>());
    }
    return result;
}

std::string readString(const json& object, const char* key) {
    if (!object.contains(key)) {
        return std::string();
    }
    if (!object.at(key).is_string()) {
        throw UsageError(std::string("'") + key + "' must be a string");
    }
    return object.at(key).get<std::string>();
}

} // namespace

SDL_InitFlags subsystemFlag(const std::string& name) {
    for (const auto& subsystem : SUBSYSTEMS) {
        if (name == subsystem.name) {
            return subsystem.flag;
        }
    }
    throw UsageError("Unknown subsystem: " + name);
}

SDL_InitFlags InitConfig::initFlags() const {
    SDL_InitFlags flags = 0;
    for (const auto& name : subsystems) {
        flags |= subsystemFlag(name);
    }
    return flags;
}

InitConfig InitConfig::fromJson(const json& document) {
    if (!document.is_object()) {
        throw UsageError("Configuration must be a JSON object");
    }

    InitConfig config;

    config.subsystems = readStringList(document, "subsystems");
    for (const auto& name : config.subsystems) {
        subsystemFlag(name); // validate early
    }

    if (document.contains("hints")) {
        const json& hints = document.at("hints");
        if (!hints.is_object()) {
            throw UsageError("'hints' must be an object");
        }
        for (auto it = hints.begin(); it != hints.end(); ++it) {
            if (!it.value().is_string()) {
                throw UsageError("Hint '" + it.key() + "' must be a string");
            }
            config.hints[it.key()] = it.value().get<std::string>();
        }
    }

    if (document.contains("app")) {
        const json& app = document.at("app");
        if (!app.is_object()) {
            throw UsageError("'app' must be an object");
        }
        config.app.name = readString(app, "name");
        config.app.version = readString(app, "version");
        config.app.identifier = readString(app, "identifier");
    }

    config.gamepadMappings = readStringList(document, "gamepadMappings");
    config.gamepadMappingFiles = readStringList(document, "gamepadMappingFiles");

    std::string priority = readString(document, "logPriority");
    if (!priority.empty()) {
        config.logPriority = log::priorityFromName(priority);
    }

    return config;
}

InitConfig InitConfig::fromFile(const std::string& path) {
    size_t size = 0;
    void* data = checkHandle(SDL_LoadFile(path.c_str(), &size));
    std::string text(static_cast<const char*>(data), size);
    SDL_free(data);

    try {
        return fromJson(json::parse(text));
    } catch (const json::parse_error& e) {
        throw UsageError("Invalid configuration in " + path + ": " + e.what());
    }
}

json InitConfig::toJson() const {
    json document;
    document["subsystems"] = subsystems;
    document["hints"] = hints;
    document["app"] = {
        {"name", app.name},
        {"version", app.version},
        {"identifier", app.identifier}
    };
    document["gamepadMappings"] = gamepadMappings;
    document["gamepadMappingFiles"] = gamepadMappingFiles;
    document["logPriority"] = log::priorityName(logPriority);
    return document;
}

} // namespace sdlkit
