#pragma once

#include <SDL3/SDL.h>
#include <cstddef>
#include <string>
#include <vector>

namespace sdlkit {

// Copy of one active finger on a touch device.
class Finger {
public:
    Finger() = default;
    explicit Finger(const SDL_Finger& finger) : finger(finger) {}

    SDL_FingerID id() const { return finger.id; }
    float x() const { return finger.x; }
    float y() const { return finger.y; }
    SDL_FPoint position() const { return SDL_FPoint{finger.x, finger.y}; }
    float pressure() const { return finger.pressure; }

private:
    SDL_Finger finger{};
};

class Touch {
public:
    Touch() = default;
    explicit Touch(SDL_TouchID id) : handle(id) {}
    Touch(std::nullptr_t) {}

    SDL_TouchID id() const { return handle; }
    explicit operator bool() const { return handle != 0; }

    bool operator==(const Touch& other) const { return handle == other.handle; }
    bool operator!=(const Touch& other) const { return handle != other.handle; }
    bool operator==(std::nullptr_t) const { return handle == 0; }
    bool operator!=(std::nullptr_t) const { return handle != 0; }

    // Throws Error if the device is unknown.
    std::string name() const;
    SDL_TouchDeviceType deviceType() const;
    std::vector<Finger> fingers() const;

    static std::vector<Touch> devices();

    // Pseudo-device used for touch events synthesized from mouse input.
    static Touch mouse() { return Touch(SDL_MOUSE_TOUCHID); }

private:
    SDL_TouchID handle = 0;
};

} // namespace sdlkit
