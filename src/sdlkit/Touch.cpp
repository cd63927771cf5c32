#include "sdlkit/Touch.h"
#include "sdlkit/Error.h"
#include "sdlkit/Marshal.h"

namespace sdlkit {

std::string Touch::name() const {
    return toString(checkHandle(SDL_GetTouchDeviceName(handle)));
}

SDL_TouchDeviceType Touch::deviceType() const {
    return SDL_GetTouchDeviceType(handle);
}

std::vector<Finger> Touch::fingers() const {
    int count = 0;
    SDL_Finger** raw = checkHandle(SDL_GetTouchFingers(handle, &count));

    // The finger records live in the same allocation as the pointer array.
    std::vector<Finger> result;
    result.reserve(count > 0 ? count : 0);
    for (int i = 0; i < count; ++i) {
        result.emplace_back(*raw[i]);
    }
    SDL_free(raw);
    return result;
}

std::vector<Touch> Touch::devices() {
    int count = 0;
    std::vector<SDL_TouchID> ids = takeArray(SDL_GetTouchDevices(&count), count);

    std::vector<Touch> result;
    result.reserve(ids.size());
    for (SDL_TouchID id : ids) {
        result.emplace_back(id);
    }
    return result;
}

} // namespace sdlkit
