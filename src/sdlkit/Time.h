#pragma once

#include <SDL3/SDL.h>

namespace sdlkit {

// Unit conversions. All are safe to call from any thread.
inline Uint64 secondsToNS(double seconds) { return static_cast<Uint64>(seconds * static_cast<double>(SDL_NS_PER_SECOND)); }
inline double nsToSeconds(Uint64 ns) { return static_cast<double>(ns) / static_cast<double>(SDL_NS_PER_SECOND); }
inline Uint64 msToNS(Uint32 ms) { return SDL_MS_TO_NS(static_cast<Uint64>(ms)); }
inline Uint32 nsToMS(Uint64 ns) { return static_cast<Uint32>(SDL_NS_TO_MS(ns)); }
inline Uint64 usToNS(Uint64 us) { return SDL_US_TO_NS(us); }
inline Uint64 nsToUS(Uint64 ns) { return SDL_NS_TO_US(ns); }

// Milliseconds since SDL library initialization.
Uint64 getTicks();

// Nanoseconds since SDL library initialization.
Uint64 getTicksNS();

// High resolution counter, typically used for profiling.
Uint64 getPerformanceCounter();
Uint64 getPerformanceFrequency();

void delay(Uint32 ms);
void delayNS(Uint64 ns);

// Busy-waits the tail end of the delay for better precision.
void delayPrecise(Uint64 ns);

} // namespace sdlkit
