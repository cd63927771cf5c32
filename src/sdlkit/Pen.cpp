#include "sdlkit/Pen.h"
#include "sdlkit/Error.h"

#include <string>

namespace sdlkit {

const char* penAxisName(PenAxis axis) {
    switch (axis) {
        case PenAxis::PRESSURE:            return "pressure";
        case PenAxis::XTILT:               return "xtilt";
        case PenAxis::YTILT:               return "ytilt";
        case PenAxis::DISTANCE:            return "distance";
        case PenAxis::ROTATION:            return "rotation";
        case PenAxis::SLIDER:              return "slider";
        case PenAxis::TANGENTIAL_PRESSURE: return "tangential_pressure";
    }
    return "unknown";
}

bool PenInputFlags::button(int number) const {
    static const SDL_PenInputFlags BUTTONS[] = {
        SDL_PEN_INPUT_BUTTON_1,
        SDL_PEN_INPUT_BUTTON_2,
        SDL_PEN_INPUT_BUTTON_3,
        SDL_PEN_INPUT_BUTTON_4,
        SDL_PEN_INPUT_BUTTON_5
    };

    if (number < 1 || number > 5) {
        throw UsageError("Pen button must be 1..5, got " + std::to_string(number));
    }
    return (flags & BUTTONS[number - 1]) != 0;
}

} // namespace sdlkit
