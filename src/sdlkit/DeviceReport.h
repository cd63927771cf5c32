#pragma once

#include "sdlkit/Config.h"

namespace sdlkit {

/**
 * Snapshot of the input devices SDL currently knows about, as JSON:
 *
 *   { "keyboards": [...], "mice": [...], "touch": [...],
 *     "sensors": [...], "gamepads": [...], "joysticks": [...] }
 *
 * Subsystems that are not initialized contribute empty lists.
 */
namespace DeviceReport {

json keyboards();
json mice();
json touchDevices();
json sensors();
json gamepads();
json joysticks();

json build();

} // namespace DeviceReport
} // namespace sdlkit
