/*******************************************************************************
 * Error.cpp
 *
 * Translates SDL's failure conventions (false, null handle, zero id) into
 * sdlkit::Error exceptions carrying the text of SDL_GetError().
 ******************************************************************************/

#include "sdlkit/Error.h"
#include "sdlkit/Log.h"

namespace sdlkit {

std::string lastError() {
    const char* message = SDL_GetError();
    return message ? std::string(message) : std::string();
}

void clearError() {
    SDL_ClearError();
}

void raiseLastError() {
    std::string message = lastError();
    if (message.empty()) {
        message = "Unknown SDL error";
    }

    log::debug("ERROR", "Raising: " + message);
    throw Error(message);
}

} // namespace sdlkit
