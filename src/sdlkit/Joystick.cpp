/*******************************************************************************
 * Joystick.cpp
 *
 * Joystick handles, per-id queries and virtual joysticks.
 *
 * Virtual joystick hooks:
 * - SDL only takes C function pointers plus one userdata pointer
 * - attach() copies the std::function hooks into a VirtualHooks holder and
 *   passes it as userdata; fixed trampolines forward into it
 * - SDL's Cleanup callback releases the holder when the joystick is detached
 ******************************************************************************/

#include "sdlkit/Joystick.h"
#include "sdlkit/Error.h"
#include "sdlkit/Gamepad.h"
#include "sdlkit/Log.h"
#include "sdlkit/Marshal.h"

#include <exception>
#include <memory>

namespace sdlkit {

// ============================================================================
//                     JoystickID
// ============================================================================

std::string JoystickID::name() const {
    return toString(SDL_GetJoystickNameForID(handle));
}

std::string JoystickID::path() const {
    return toString(SDL_GetJoystickPathForID(handle));
}

int JoystickID::playerIndex() const {
    return SDL_GetJoystickPlayerIndexForID(handle);
}

SDL_GUID JoystickID::guid() const {
    return SDL_GetJoystickGUIDForID(handle);
}

Uint16 JoystickID::vendor() const {
    return SDL_GetJoystickVendorForID(handle);
}

Uint16 JoystickID::product() const {
    return SDL_GetJoystickProductForID(handle);
}

Uint16 JoystickID::productVersion() const {
    return SDL_GetJoystickProductVersionForID(handle);
}

SDL_JoystickType JoystickID::kind() const {
    return SDL_GetJoystickTypeForID(handle);
}

bool JoystickID::isVirtual() const {
    return SDL_IsJoystickVirtual(handle);
}

bool JoystickID::isGamepad() const {
    return SDL_IsGamepad(handle);
}

// ============================================================================
//                     Joystick
// ============================================================================

Joystick Joystick::open(JoystickID id) {
    return Joystick(checkHandle(SDL_OpenJoystick(id.value())));
}

Joystick Joystick::fromID(JoystickID id) {
    return Joystick(SDL_GetJoystickFromID(id.value()));
}

Joystick Joystick::fromPlayerIndex(int playerIndex) {
    return Joystick(SDL_GetJoystickFromPlayerIndex(playerIndex));
}

Joystick Joystick::fromGamepad(const Gamepad& gamepad) {
    return Joystick(SDL_GetGamepadJoystick(gamepad.get()));
}

void Joystick::close() {
    SDL_CloseJoystick(handle);
    handle = nullptr;
}

void Joystick::lock() {
    SDL_LockJoysticks();
}

void Joystick::unlock() {
    SDL_UnlockJoysticks();
}

void Joystick::update() {
    SDL_UpdateJoysticks();
}

bool Joystick::eventsEnabled() {
    return SDL_JoystickEventsEnabled();
}

void Joystick::setEventsEnabled(bool enabled) {
    SDL_SetJoystickEventsEnabled(enabled);
}

bool Joystick::hasJoystick() {
    return SDL_HasJoystick();
}

std::vector<JoystickID> Joystick::joysticks() {
    int count = 0;
    std::vector<SDL_JoystickID> ids = takeArray(SDL_GetJoysticks(&count), count);

    std::vector<JoystickID> result;
    result.reserve(ids.size());
    for (SDL_JoystickID id : ids) {
        result.emplace_back(id);
    }
    return result;
}

GuidInfo Joystick::guidInfo(const SDL_GUID& guid) {
    GuidInfo info;
    SDL_GetJoystickGUIDInfo(guid, &info.vendor, &info.product, &info.version, &info.crc16);
    return info;
}

std::string Joystick::name() const {
    return toString(SDL_GetJoystickName(handle));
}

std::string Joystick::path() const {
    return toString(SDL_GetJoystickPath(handle));
}

int Joystick::playerIndex() const {
    return SDL_GetJoystickPlayerIndex(handle);
}

void Joystick::setPlayerIndex(int playerIndex) {
    checkSdl(SDL_SetJoystickPlayerIndex(handle, playerIndex));
}

SDL_GUID Joystick::guid() const {
    return SDL_GetJoystickGUID(handle);
}

Uint16 Joystick::vendor() const {
    return SDL_GetJoystickVendor(handle);
}

Uint16 Joystick::product() const {
    return SDL_GetJoystickProduct(handle);
}

Uint16 Joystick::productVersion() const {
    return SDL_GetJoystickProductVersion(handle);
}

Uint16 Joystick::firmwareVersion() const {
    return SDL_GetJoystickFirmwareVersion(handle);
}

std::string Joystick::serial() const {
    return toString(SDL_GetJoystickSerial(handle));
}

SDL_JoystickType Joystick::kind() const {
    return SDL_GetJoystickType(handle);
}

bool Joystick::isConnected() const {
    return SDL_JoystickConnected(handle);
}

SDL_JoystickConnectionState Joystick::connectionState() const {
    SDL_JoystickConnectionState state = SDL_GetJoystickConnectionState(handle);
    if (state == SDL_JOYSTICK_CONNECTION_INVALID) {
        raiseLastError();
    }
    return state;
}

PowerInfo Joystick::powerInfo() const {
    PowerInfo info;
    info.state = SDL_GetJoystickPowerInfo(handle, &info.percent);
    if (info.state == SDL_POWERSTATE_ERROR) {
        raiseLastError();
    }
    return info;
}

SDL_PropertiesID Joystick::properties() const {
    return checkId(SDL_GetJoystickProperties(handle));
}

JoystickID Joystick::id() const {
    return JoystickID(checkId(SDL_GetJoystickID(handle)));
}

int Joystick::numAxes() const {
    int count = SDL_GetNumJoystickAxes(handle);
    if (count < 0) {
        raiseLastError();
    }
    return count;
}

Sint16 Joystick::axis(int axis) const {
    return SDL_GetJoystickAxis(handle, axis);
}

bool Joystick::axisInitialState(int axis, Sint16& state) const {
    return SDL_GetJoystickAxisInitialState(handle, axis, &state);
}

int Joystick::numBalls() const {
    int count = SDL_GetNumJoystickBalls(handle);
    if (count < 0) {
        raiseLastError();
    }
    return count;
}

SDL_Point Joystick::ball(int ball) const {
    SDL_Point delta{0, 0};
    checkSdl(SDL_GetJoystickBall(handle, ball, &delta.x, &delta.y));
    return delta;
}

int Joystick::numHats() const {
    int count = SDL_GetNumJoystickHats(handle);
    if (count < 0) {
        raiseLastError();
    }
    return count;
}

Uint8 Joystick::hat(int hat) const {
    return SDL_GetJoystickHat(handle, hat);
}

int Joystick::numButtons() const {
    int count = SDL_GetNumJoystickButtons(handle);
    if (count < 0) {
        raiseLastError();
    }
    return count;
}

bool Joystick::button(int button) const {
    return SDL_GetJoystickButton(handle, button);
}

void Joystick::rumble(Uint16 lowFrequency, Uint16 highFrequency, Uint32 durationMs) {
    checkSdl(SDL_RumbleJoystick(handle, lowFrequency, highFrequency, durationMs));
}

void Joystick::rumbleTriggers(Uint16 left, Uint16 right, Uint32 durationMs) {
    checkSdl(SDL_RumbleJoystickTriggers(handle, left, right, durationMs));
}

void Joystick::setLED(Uint8 red, Uint8 green, Uint8 blue) {
    checkSdl(SDL_SetJoystickLED(handle, red, green, blue));
}

void Joystick::sendEffect(const std::vector<Uint8>& data) {
    checkSdl(SDL_SendJoystickEffect(handle, data.data(), static_cast<int>(data.size())));
}

void Joystick::setVirtualAxis(int axis, Sint16 value) {
    checkSdl(SDL_SetJoystickVirtualAxis(handle, axis, value));
}

void Joystick::setVirtualBall(int ball, Sint16 xrel, Sint16 yrel) {
    checkSdl(SDL_SetJoystickVirtualBall(handle, ball, xrel, yrel));
}

void Joystick::setVirtualButton(int button, bool down) {
    checkSdl(SDL_SetJoystickVirtualButton(handle, button, down));
}

void Joystick::setVirtualHat(int hat, Uint8 value) {
    checkSdl(SDL_SetJoystickVirtualHat(handle, hat, value));
}

void Joystick::setVirtualTouchpad(int touchpad, int finger, bool down, float x, float y, float pressure) {
    checkSdl(SDL_SetJoystickVirtualTouchpad(handle, touchpad, finger, down, x, y, pressure));
}

void Joystick::sendVirtualSensorData(SDL_SensorType kind, Uint64 sensorTimestamp, const std::vector<float>& data) {
    checkSdl(SDL_SendJoystickVirtualSensorData(handle, kind, sensorTimestamp, data.data(), static_cast<int>(data.size())));
}

void Joystick::detachVirtual(JoystickID id) {
    checkSdl(SDL_DetachVirtualJoystick(id.value()));
}

// ============================================================================
//                     Virtual joystick hooks
// ============================================================================

namespace {

struct VirtualHooks {
    std::string name;
    std::vector<SDL_VirtualJoystickTouchpadDesc> touchpads;
    std::vector<SDL_VirtualJoystickSensorDesc> sensors;

    std::function<void()> update;
    std::function<void(int)> setPlayerIndex;
    std::function<bool(Uint16, Uint16)> rumble;
    std::function<bool(Uint16, Uint16)> rumbleTriggers;
    std::function<bool(Uint8, Uint8, Uint8)> setLED;
    std::function<bool(const void*, int)> sendEffect;
    std::function<bool(bool)> setSensorsEnabled;

    // Set once SDL has accepted the joystick; from then on SDL owns the holder.
    bool attached = false;
};

VirtualHooks* hooksFrom(void* userdata) {
    return static_cast<VirtualHooks*>(userdata);
}

// Bool hooks report failure to SDL instead of unwinding through it.
template <typename Hook, typename... Args>
bool callHook(const char* hookName, const Hook& hook, Args... args) {
    try {
        return hook(args...);
    } catch (const std::exception& e) {
        log::error("JOYSTICK", std::string("Virtual joystick ") + hookName + " hook threw: " + e.what());
        return SDL_SetError("%s", e.what());
    } catch (...) {
        log::error("JOYSTICK", std::string("Virtual joystick ") + hookName + " hook threw a non-standard exception");
        return SDL_SetError("Virtual joystick %s hook failed", hookName);
    }
}

void SDLCALL virtualUpdate(void* userdata) {
    try {
        hooksFrom(userdata)->update();
    } catch (const std::exception& e) {
        log::error("JOYSTICK", std::string("Virtual joystick update hook threw: ") + e.what());
    } catch (...) {
        log::error("JOYSTICK", "Virtual joystick update hook threw a non-standard exception");
    }
}

void SDLCALL virtualSetPlayerIndex(void* userdata, int playerIndex) {
    try {
        hooksFrom(userdata)->setPlayerIndex(playerIndex);
    } catch (const std::exception& e) {
        log::error("JOYSTICK", std::string("Virtual joystick setPlayerIndex hook threw: ") + e.what());
    } catch (...) {
        log::error("JOYSTICK", "Virtual joystick setPlayerIndex hook threw a non-standard exception");
    }
}

bool SDLCALL virtualRumble(void* userdata, Uint16 lowFrequency, Uint16 highFrequency) {
    return callHook("rumble", hooksFrom(userdata)->rumble, lowFrequency, highFrequency);
}

bool SDLCALL virtualRumbleTriggers(void* userdata, Uint16 left, Uint16 right) {
    return callHook("rumbleTriggers", hooksFrom(userdata)->rumbleTriggers, left, right);
}

bool SDLCALL virtualSetLED(void* userdata, Uint8 red, Uint8 green, Uint8 blue) {
    return callHook("setLED", hooksFrom(userdata)->setLED, red, green, blue);
}

bool SDLCALL virtualSendEffect(void* userdata, const void* data, int size) {
    return callHook("sendEffect", hooksFrom(userdata)->sendEffect, data, size);
}

bool SDLCALL virtualSetSensorsEnabled(void* userdata, bool enabled) {
    return callHook("setSensorsEnabled", hooksFrom(userdata)->setSensorsEnabled, enabled);
}

void SDLCALL virtualCleanup(void* userdata) {
    VirtualHooks* hooks = hooksFrom(userdata);
    if (hooks && hooks->attached) {
        delete hooks;
    }
}

} // namespace

/**
 * Attaches a virtual joystick built from this description.
 *
 * The joystick lock is held across the attach so that the holder is marked as
 * SDL-owned before any other thread can detach the new joystick.
 *
 * @return the instance id of the new joystick
 */
JoystickID VirtualJoystickDesc::attach() const {
    auto hooks = std::make_unique<VirtualHooks>();
    hooks->name = name;
    for (const auto& touchpad : touchpads) {
        SDL_VirtualJoystickTouchpadDesc desc;
        SDL_zero(desc);
        desc.nfingers = touchpad.numFingers;
        hooks->touchpads.push_back(desc);
    }
    for (const auto& sensor : sensors) {
        SDL_VirtualJoystickSensorDesc desc;
        SDL_zero(desc);
        desc.type = sensor.kind;
        desc.rate = sensor.rate;
        hooks->sensors.push_back(desc);
    }
    hooks->update = update;
    hooks->setPlayerIndex = setPlayerIndex;
    hooks->rumble = rumble;
    hooks->rumbleTriggers = rumbleTriggers;
    hooks->setLED = setLED;
    hooks->sendEffect = sendEffect;
    hooks->setSensorsEnabled = setSensorsEnabled;

    SDL_VirtualJoystickDesc desc;
    SDL_INIT_INTERFACE(&desc);
    desc.type = static_cast<Uint16>(kind);
    desc.vendor_id = vendorID;
    desc.product_id = productID;
    desc.naxes = numAxes;
    desc.nbuttons = numButtons;
    desc.nballs = numBalls;
    desc.nhats = numHats;
    desc.ntouchpads = static_cast<Uint16>(hooks->touchpads.size());
    desc.nsensors = static_cast<Uint16>(hooks->sensors.size());
    desc.button_mask = validButtons;
    desc.axis_mask = validAxes;
    desc.name = hooks->name.empty() ? nullptr : hooks->name.c_str();
    desc.touchpads = hooks->touchpads.empty() ? nullptr : hooks->touchpads.data();
    desc.sensors = hooks->sensors.empty() ? nullptr : hooks->sensors.data();
    desc.userdata = hooks.get();
    desc.Update = hooks->update ? &virtualUpdate : nullptr;
    desc.SetPlayerIndex = hooks->setPlayerIndex ? &virtualSetPlayerIndex : nullptr;
    desc.Rumble = hooks->rumble ? &virtualRumble : nullptr;
    desc.RumbleTriggers = hooks->rumbleTriggers ? &virtualRumbleTriggers : nullptr;
    desc.SetLED = hooks->setLED ? &virtualSetLED : nullptr;
    desc.SendEffect = hooks->sendEffect ? &virtualSendEffect : nullptr;
    desc.SetSensorsEnabled = hooks->setSensorsEnabled ? &virtualSetSensorsEnabled : nullptr;
    desc.Cleanup = &virtualCleanup;

    JoystickLock lock;

    SDL_JoystickID id = SDL_AttachVirtualJoystick(&desc);
    if (id == 0) {
        raiseLastError();
    }

    hooks->attached = true;
    hooks.release();

    log::debug("JOYSTICK", "Attached virtual joystick " + std::to_string(id) + " (" + name + ")");
    return JoystickID(id);
}

const char* joystickKindName(SDL_JoystickType kind) {
    switch (kind) {
        case SDL_JOYSTICK_TYPE_GAMEPAD:      return "gamepad";
        case SDL_JOYSTICK_TYPE_WHEEL:        return "wheel";
        case SDL_JOYSTICK_TYPE_ARCADE_STICK: return "arcade_stick";
        case SDL_JOYSTICK_TYPE_FLIGHT_STICK: return "flight_stick";
        case SDL_JOYSTICK_TYPE_DANCE_PAD:    return "dance_pad";
        case SDL_JOYSTICK_TYPE_GUITAR:       return "guitar";
        case SDL_JOYSTICK_TYPE_DRUM_KIT:     return "drum_kit";
        case SDL_JOYSTICK_TYPE_ARCADE_PAD:   return "arcade_pad";
        case SDL_JOYSTICK_TYPE_THROTTLE:     return "throttle";
        default:                             return "unknown";
    }
}

} // namespace sdlkit
