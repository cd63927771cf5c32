#include "sdlkit/Marshal.h"

namespace sdlkit {

std::string takeString(char* utf8) {
    std::string result = toString(utf8);
    SDL_free(utf8);
    return result;
}

std::string guidToString(const SDL_GUID& guid) {
    char buffer[33];
    SDL_GUIDToString(guid, buffer, sizeof(buffer));
    return std::string(buffer);
}

SDL_GUID guidFromString(const std::string& text) {
    return SDL_StringToGUID(text.c_str());
}

bool guidEquals(const SDL_GUID& left, const SDL_GUID& right) {
    return SDL_memcmp(left.data, right.data, sizeof(left.data)) == 0;
}

} // namespace sdlkit
