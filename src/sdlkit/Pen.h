#pragma once

#include <SDL3/SDL.h>

namespace sdlkit {

// Pens are only reported through SDL_EVENT_PEN_* events; there is no
// enumeration API. These types decode the fields those events carry.

using PenID = SDL_PenID;

enum class PenAxis {
    PRESSURE = SDL_PEN_AXIS_PRESSURE,
    XTILT = SDL_PEN_AXIS_XTILT,
    YTILT = SDL_PEN_AXIS_YTILT,
    DISTANCE = SDL_PEN_AXIS_DISTANCE,
    ROTATION = SDL_PEN_AXIS_ROTATION,
    SLIDER = SDL_PEN_AXIS_SLIDER,
    TANGENTIAL_PRESSURE = SDL_PEN_AXIS_TANGENTIAL_PRESSURE
};

const char* penAxisName(PenAxis axis);

// The pen_state field of pen events.
class PenInputFlags {
public:
    PenInputFlags() = default;
    explicit PenInputFlags(SDL_PenInputFlags flags) : flags(flags) {}

    SDL_PenInputFlags value() const { return flags; }

    bool isDown() const { return (flags & SDL_PEN_INPUT_DOWN) != 0; }
    bool isEraserTip() const { return (flags & SDL_PEN_INPUT_ERASER_TIP) != 0; }

    // Barrel buttons 1..5. Throws UsageError for other numbers.
    bool button(int number) const;

    bool operator==(const PenInputFlags& other) const { return flags == other.flags; }
    bool operator!=(const PenInputFlags& other) const { return flags != other.flags; }

private:
    SDL_PenInputFlags flags = 0;
};

struct Pen {
    // Pseudo-devices for mouse and touch events synthesized from pen input.
    static SDL_MouseID mouse() { return SDL_PEN_MOUSEID; }
    static SDL_TouchID touch() { return SDL_PEN_TOUCHID; }
};

} // namespace sdlkit
