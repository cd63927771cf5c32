/*******************************************************************************
 * Log.cpp
 *
 * Tagged logging for sdlkit. Messages go through SDL's own log facility under
 * a dedicated category, so applications can filter or redirect them with the
 * regular SDL_SetLogPriority / SDL_SetLogOutputFunction calls.
 ******************************************************************************/

#include "sdlkit/Log.h"
#include "sdlkit/Error.h"

namespace sdlkit {
namespace log {

namespace {

SDL_LogPriority toSdl(Priority priority) {
    switch (priority) {
        case Priority::VERBOSE:  return SDL_LOG_PRIORITY_VERBOSE;
        case Priority::DEBUG:    return SDL_LOG_PRIORITY_DEBUG;
        case Priority::INFO:     return SDL_LOG_PRIORITY_INFO;
        case Priority::WARN:     return SDL_LOG_PRIORITY_WARN;
        case Priority::ERROR:    return SDL_LOG_PRIORITY_ERROR;
        case Priority::CRITICAL: return SDL_LOG_PRIORITY_CRITICAL;
    }
    return SDL_LOG_PRIORITY_INFO;
}

Priority fromSdl(SDL_LogPriority priority) {
    switch (priority) {
        case SDL_LOG_PRIORITY_VERBOSE:  return Priority::VERBOSE;
        case SDL_LOG_PRIORITY_DEBUG:    return Priority::DEBUG;
        case SDL_LOG_PRIORITY_WARN:     return Priority::WARN;
        case SDL_LOG_PRIORITY_ERROR:    return Priority::ERROR;
        case SDL_LOG_PRIORITY_CRITICAL: return Priority::CRITICAL;
        default:                        return Priority::INFO;
    }
}

} // namespace

void setPriority(Priority priority) {
    SDL_SetLogPriority(CATEGORY, toSdl(priority));
}

Priority getPriority() {
    return fromSdl(SDL_GetLogPriority(CATEGORY));
}

Priority priorityFromName(const std::string& name) {
    if (name == "verbose")  return Priority::VERBOSE;
    if (name == "debug")    return Priority::DEBUG;
    if (name == "info")     return Priority::INFO;
    if (name == "warn")     return Priority::WARN;
    if (name == "error")    return Priority::ERROR;
    if (name == "critical") return Priority::CRITICAL;

    throw UsageError("Unknown log priority: " + name);
}

const char* priorityName(Priority priority) {
    switch (priority) {
        case Priority::VERBOSE:  return "verbose";
        case Priority::DEBUG:    return "debug";
        case Priority::INFO:     return "info";
        case Priority::WARN:     return "warn";
        case Priority::ERROR:    return "error";
        case Priority::CRITICAL: return "critical";
    }
    return "info";
}

void write(Priority priority, const char* tag, const std::string& message) {
    SDL_LogMessage(CATEGORY, toSdl(priority), "[%s] %s", tag, message.c_str());
}

} // namespace log
} // namespace sdlkit
