#pragma once

#include <SDL3/SDL.h>
#include <stdexcept>
#include <string>

namespace sdlkit {

// Raised when a native SDL call reports failure. Carries SDL's last-error text.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// Raised when the caller breaks a precondition. Never reaches SDL.
class UsageError : public std::logic_error {
public:
    explicit UsageError(const std::string& message) : std::logic_error(message) {}
};

std::string lastError();
void clearError();

// Throws Error built from SDL_GetError().
[[noreturn]] void raiseLastError();

inline void checkSdl(bool result) {
    if (!result) {
        raiseLastError();
    }
}

template <typename T>
T* checkHandle(T* handle) {
    if (!handle) {
        raiseLastError();
    }
    return handle;
}

template <typename Id>
Id checkId(Id id) {
    if (id == 0) {
        raiseLastError();
    }
    return id;
}

} // namespace sdlkit
