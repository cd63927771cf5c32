/*******************************************************************************
 * Gamepad.cpp
 *
 * Gamepad handles, per-id queries and the mapping database. Strings SDL hands
 * over with ownership (mappings) are copied and released with SDL_free.
 ******************************************************************************/

#include "sdlkit/Gamepad.h"
#include "sdlkit/Error.h"
#include "sdlkit/Log.h"
#include "sdlkit/Marshal.h"

namespace sdlkit {

// ============================================================================
//                     GamepadID
// ============================================================================

std::string GamepadID::name() const {
    return toString(SDL_GetGamepadNameForID(handle));
}

std::string GamepadID::path() const {
    return toString(SDL_GetGamepadPathForID(handle));
}

int GamepadID::playerIndex() const {
    return SDL_GetGamepadPlayerIndexForID(handle);
}

SDL_GUID GamepadID::guid() const {
    return SDL_GetGamepadGUIDForID(handle);
}

Uint16 GamepadID::vendor() const {
    return SDL_GetGamepadVendorForID(handle);
}

Uint16 GamepadID::product() const {
    return SDL_GetGamepadProductForID(handle);
}

Uint16 GamepadID::productVersion() const {
    return SDL_GetGamepadProductVersionForID(handle);
}

SDL_GamepadType GamepadID::kind() const {
    return SDL_GetGamepadTypeForID(handle);
}

SDL_GamepadType GamepadID::realKind() const {
    return SDL_GetRealGamepadTypeForID(handle);
}

std::string GamepadID::mapping() const {
    return takeString(SDL_GetGamepadMappingForID(handle));
}

// ============================================================================
//                     Gamepad: lifecycle
// ============================================================================

Gamepad Gamepad::open(GamepadID id) {
    Gamepad gamepad(checkHandle(SDL_OpenGamepad(id.value())));
    log::debug("GAMEPAD", "Opened gamepad " + std::to_string(id.value()) + " (" + gamepad.name() + ")");
    return gamepad;
}

Gamepad Gamepad::fromID(GamepadID id) {
    return Gamepad(SDL_GetGamepadFromID(id.value()));
}

Gamepad Gamepad::fromPlayerIndex(int playerIndex) {
    return Gamepad(SDL_GetGamepadFromPlayerIndex(playerIndex));
}

void Gamepad::close() {
    SDL_CloseGamepad(handle);
    handle = nullptr;
}

// ============================================================================
//                     Gamepad: mappings
// ============================================================================

bool Gamepad::addMapping(const std::string& mapping) {
    int result = SDL_AddGamepadMapping(mapping.c_str());
    if (result < 0) {
        raiseLastError();
    }
    return result == 1;
}

int Gamepad::addMappings(SDL_IOStream* src, bool closeIO) {
    int added = SDL_AddGamepadMappingsFromIO(src, closeIO);
    if (added < 0) {
        raiseLastError();
    }
    return added;
}

int Gamepad::addMappingsFromFile(const std::string& path) {
    int added = SDL_AddGamepadMappingsFromFile(path.c_str());
    if (added < 0) {
        raiseLastError();
    }
    return added;
}

void Gamepad::reloadMappings() {
    checkSdl(SDL_ReloadGamepadMappings());
}

std::vector<std::string> Gamepad::mappings() {
    int count = 0;
    char** raw = checkHandle(SDL_GetGamepadMappings(&count));

    // Strings share the allocation of the pointer array.
    std::vector<std::string> result;
    result.reserve(count > 0 ? count : 0);
    for (int i = 0; i < count; ++i) {
        result.emplace_back(toString(raw[i]));
    }
    SDL_free(raw);
    return result;
}

std::string Gamepad::mappingForGuid(const SDL_GUID& guid) {
    return takeString(SDL_GetGamepadMappingForGUID(guid));
}

void Gamepad::setMapping(GamepadID id, const std::string& mapping) {
    checkSdl(SDL_SetGamepadMapping(id.value(), mapping.empty() ? nullptr : mapping.c_str()));
}

// ============================================================================
//                     Gamepad: global state
// ============================================================================

void Gamepad::update() {
    SDL_UpdateGamepads();
}

bool Gamepad::eventsEnabled() {
    return SDL_GamepadEventsEnabled();
}

void Gamepad::setEventsEnabled(bool enabled) {
    SDL_SetGamepadEventsEnabled(enabled);
}

bool Gamepad::hasGamepad() {
    return SDL_HasGamepad();
}

std::vector<GamepadID> Gamepad::gamepads() {
    int count = 0;
    std::vector<SDL_JoystickID> ids = takeArray(SDL_GetGamepads(&count), count);

    std::vector<GamepadID> result;
    result.reserve(ids.size());
    for (SDL_JoystickID id : ids) {
        result.emplace_back(id);
    }
    return result;
}

// ============================================================================
//                     Gamepad: properties
// ============================================================================

std::string Gamepad::name() const {
    return toString(SDL_GetGamepadName(handle));
}

std::string Gamepad::path() const {
    return toString(SDL_GetGamepadPath(handle));
}

SDL_GamepadType Gamepad::kind() const {
    return SDL_GetGamepadType(handle);
}

SDL_GamepadType Gamepad::realKind() const {
    return SDL_GetRealGamepadType(handle);
}

int Gamepad::playerIndex() const {
    return SDL_GetGamepadPlayerIndex(handle);
}

void Gamepad::setPlayerIndex(int playerIndex) {
    checkSdl(SDL_SetGamepadPlayerIndex(handle, playerIndex));
}

Uint16 Gamepad::vendor() const {
    return SDL_GetGamepadVendor(handle);
}

Uint16 Gamepad::product() const {
    return SDL_GetGamepadProduct(handle);
}

Uint16 Gamepad::productVersion() const {
    return SDL_GetGamepadProductVersion(handle);
}

Uint16 Gamepad::firmwareVersion() const {
    return SDL_GetGamepadFirmwareVersion(handle);
}

std::string Gamepad::serial() const {
    return toString(SDL_GetGamepadSerial(handle));
}

Uint64 Gamepad::steamHandle() const {
    return SDL_GetGamepadSteamHandle(handle);
}

SDL_JoystickConnectionState Gamepad::connectionState() const {
    SDL_JoystickConnectionState state = SDL_GetGamepadConnectionState(handle);
    if (state == SDL_JOYSTICK_CONNECTION_INVALID) {
        raiseLastError();
    }
    return state;
}

bool Gamepad::isConnected() const {
    return SDL_GamepadConnected(handle);
}

PowerInfo Gamepad::powerInfo() const {
    PowerInfo info;
    info.state = SDL_GetGamepadPowerInfo(handle, &info.percent);
    if (info.state == SDL_POWERSTATE_ERROR) {
        raiseLastError();
    }
    return info;
}

std::string Gamepad::mapping() const {
    return takeString(SDL_GetGamepadMapping(handle));
}

GamepadID Gamepad::id() const {
    return GamepadID(checkId(SDL_GetGamepadID(handle)));
}

SDL_PropertiesID Gamepad::properties() const {
    return checkId(SDL_GetGamepadProperties(handle));
}

Joystick Gamepad::joystick() const {
    return Joystick(checkHandle(SDL_GetGamepadJoystick(handle)));
}

// ============================================================================
//                     Gamepad: input
// ============================================================================

bool Gamepad::hasAxis(SDL_GamepadAxis axis) const {
    return SDL_GamepadHasAxis(handle, axis);
}

Sint16 Gamepad::axis(SDL_GamepadAxis axis) const {
    return SDL_GetGamepadAxis(handle, axis);
}

bool Gamepad::hasButton(SDL_GamepadButton button) const {
    return SDL_GamepadHasButton(handle, button);
}

bool Gamepad::button(SDL_GamepadButton button) const {
    return SDL_GetGamepadButton(handle, button);
}

SDL_GamepadButtonLabel Gamepad::buttonLabel(SDL_GamepadButton button) const {
    return SDL_GetGamepadButtonLabel(handle, button);
}

std::vector<GamepadBinding> Gamepad::bindings() const {
    int count = 0;
    SDL_GamepadBinding** raw = checkHandle(SDL_GetGamepadBindings(handle, &count));

    // Binding records share the allocation of the pointer array.
    std::vector<GamepadBinding> result;
    result.reserve(count > 0 ? count : 0);
    for (int i = 0; i < count; ++i) {
        result.emplace_back(*raw[i]);
    }
    SDL_free(raw);
    return result;
}

int Gamepad::numTouchpads() const {
    return SDL_GetNumGamepadTouchpads(handle);
}

int Gamepad::numTouchpadFingers(int touchpad) const {
    return SDL_GetNumGamepadTouchpadFingers(handle, touchpad);
}

TouchpadFinger Gamepad::touchpadFinger(int touchpad, int finger) const {
    TouchpadFinger result;
    checkSdl(SDL_GetGamepadTouchpadFinger(handle, touchpad, finger,
                                          &result.down, &result.x, &result.y, &result.pressure));
    return result;
}

bool Gamepad::hasSensor(SDL_SensorType kind) const {
    return SDL_GamepadHasSensor(handle, kind);
}

bool Gamepad::sensorEnabled(SDL_SensorType kind) const {
    return SDL_GamepadSensorEnabled(handle, kind);
}

void Gamepad::setSensorEnabled(SDL_SensorType kind, bool enabled) {
    checkSdl(SDL_SetGamepadSensorEnabled(handle, kind, enabled));
}

float Gamepad::sensorDataRate(SDL_SensorType kind) const {
    return SDL_GetGamepadSensorDataRate(handle, kind);
}

void Gamepad::sensorData(SDL_SensorType kind, float* values, int count) const {
    checkSdl(SDL_GetGamepadSensorData(handle, kind, values, count));
}

void Gamepad::sensorData(SDL_SensorType kind, std::vector<float>& values) const {
    sensorData(kind, values.data(), static_cast<int>(values.size()));
}

// ============================================================================
//                     Gamepad: output
// ============================================================================

void Gamepad::rumble(Uint16 lowFrequency, Uint16 highFrequency, Uint32 durationMs) {
    checkSdl(SDL_RumbleGamepad(handle, lowFrequency, highFrequency, durationMs));
}

void Gamepad::rumbleTriggers(Uint16 left, Uint16 right, Uint32 durationMs) {
    checkSdl(SDL_RumbleGamepadTriggers(handle, left, right, durationMs));
}

void Gamepad::setLED(Uint8 red, Uint8 green, Uint8 blue) {
    checkSdl(SDL_SetGamepadLED(handle, red, green, blue));
}

void Gamepad::sendEffect(const std::vector<Uint8>& data) {
    checkSdl(SDL_SendGamepadEffect(handle, data.data(), static_cast<int>(data.size())));
}

std::string Gamepad::appleSFSymbolsNameFor(SDL_GamepadButton button) const {
    return toString(SDL_GetGamepadAppleSFSymbolsNameForButton(handle, button));
}

std::string Gamepad::appleSFSymbolsNameFor(SDL_GamepadAxis axis) const {
    return toString(SDL_GetGamepadAppleSFSymbolsNameForAxis(handle, axis));
}

// ============================================================================
//                     String conversions
// ============================================================================

SDL_GamepadButton gamepadButtonFromString(const std::string& text) {
    return SDL_GetGamepadButtonFromString(text.c_str());
}

std::string gamepadButtonToString(SDL_GamepadButton button) {
    return toString(SDL_GetGamepadStringForButton(button));
}

SDL_GamepadAxis gamepadAxisFromString(const std::string& text) {
    return SDL_GetGamepadAxisFromString(text.c_str());
}

std::string gamepadAxisToString(SDL_GamepadAxis axis) {
    return toString(SDL_GetGamepadStringForAxis(axis));
}

SDL_GamepadType gamepadKindFromString(const std::string& text) {
    return SDL_GetGamepadTypeFromString(text.c_str());
}

std::string gamepadKindToString(SDL_GamepadType kind) {
    return toString(SDL_GetGamepadStringForType(kind));
}

SDL_GamepadButtonLabel gamepadButtonLabelFor(SDL_GamepadType kind, SDL_GamepadButton button) {
    return SDL_GetGamepadButtonLabelForType(kind, button);
}

} // namespace sdlkit
