#pragma once

#include <SDL3/SDL.h>
#include <string>
#include <vector>

namespace sdlkit {

// Null-safe conversion of an SDL-owned UTF-8 string.
inline std::string toString(const char* utf8) {
    return utf8 ? std::string(utf8) : std::string();
}

// Copies an SDL-allocated array into a vector and releases it with SDL_free.
template <typename T>
std::vector<T> takeArray(T* items, int count) {
    std::vector<T> result;
    if (items) {
        if (count > 0) {
            result.assign(items, items + count);
        }
        SDL_free(items);
    }
    return result;
}

// Copies an SDL-allocated string and releases it with SDL_free.
std::string takeString(char* utf8);

std::string guidToString(const SDL_GUID& guid);
SDL_GUID guidFromString(const std::string& text);
bool guidEquals(const SDL_GUID& left, const SDL_GUID& right);

} // namespace sdlkit
