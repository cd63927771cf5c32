#pragma once

#include <SDL3/SDL.h>
#include <string>

namespace sdlkit {
namespace log {

// SDL log category reserved for messages emitted by sdlkit itself.
constexpr int CATEGORY = SDL_LOG_CATEGORY_CUSTOM;

enum class Priority {
    VERBOSE,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

void setPriority(Priority priority);
Priority getPriority();

// Accepts "verbose", "debug", "info", "warn", "error", "critical".
Priority priorityFromName(const std::string& name);
const char* priorityName(Priority priority);

// Emits "[TAG] message" through SDL_LogMessage.
void write(Priority priority, const char* tag, const std::string& message);

inline void verbose(const char* tag, const std::string& message) { write(Priority::VERBOSE, tag, message); }
inline void debug(const char* tag, const std::string& message) { write(Priority::DEBUG, tag, message); }
inline void info(const char* tag, const std::string& message) { write(Priority::INFO, tag, message); }
inline void warn(const char* tag, const std::string& message) { write(Priority::WARN, tag, message); }
inline void error(const char* tag, const std::string& message) { write(Priority::ERROR, tag, message); }

} // namespace log
} // namespace sdlkit
