#include "sdlkit/Time.h"

namespace sdlkit {

Uint64 getTicks() {
    return SDL_GetTicks();
}

Uint64 getTicksNS() {
    return SDL_GetTicksNS();
}

Uint64 getPerformanceCounter() {
    return SDL_GetPerformanceCounter();
}

Uint64 getPerformanceFrequency() {
    return SDL_GetPerformanceFrequency();
}

void delay(Uint32 ms) {
    SDL_Delay(ms);
}

void delayNS(Uint64 ns) {
    SDL_DelayNS(ns);
}

void delayPrecise(Uint64 ns) {
    SDL_DelayPrecise(ns);
}

} // namespace sdlkit
