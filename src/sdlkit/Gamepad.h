#pragma once

#include "sdlkit/Joystick.h"

#include <SDL3/SDL.h>
#include <cstddef>
#include <string>
#include <vector>

namespace sdlkit {

// A gamepad known to SDL, not necessarily opened.
class GamepadID {
public:
    GamepadID() = default;
    explicit GamepadID(SDL_JoystickID id) : handle(id) {}

    SDL_JoystickID value() const { return handle; }
    explicit operator bool() const { return handle != 0; }

    bool operator==(const GamepadID& other) const { return handle == other.handle; }
    bool operator!=(const GamepadID& other) const { return handle != other.handle; }

    std::string name() const;
    std::string path() const;
    int playerIndex() const;
    SDL_GUID guid() const;
    Uint16 vendor() const;
    Uint16 product() const;
    Uint16 productVersion() const;
    SDL_GamepadType kind() const;
    SDL_GamepadType realKind() const;
    std::string mapping() const;

private:
    SDL_JoystickID handle = 0;
};

// How one physical input maps to a gamepad button or axis.
class GamepadBinding {
public:
    GamepadBinding() = default;
    explicit GamepadBinding(const SDL_GamepadBinding& binding) : binding(binding) {}

    SDL_GamepadBindingType inputType() const { return binding.input_type; }
    int inputButtonIndex() const { return binding.input.button; }
    int inputAxisIndex() const { return binding.input.axis.axis; }
    int inputAxisMin() const { return binding.input.axis.axis_min; }
    int inputAxisMax() const { return binding.input.axis.axis_max; }
    int inputHatIndex() const { return binding.input.hat.hat; }
    int inputHatMask() const { return binding.input.hat.hat_mask; }

    SDL_GamepadBindingType outputType() const { return binding.output_type; }
    SDL_GamepadButton outputButton() const { return binding.output.button; }
    SDL_GamepadAxis outputAxis() const { return binding.output.axis.axis; }
    int outputAxisMin() const { return binding.output.axis.axis_min; }
    int outputAxisMax() const { return binding.output.axis.axis_max; }

private:
    SDL_GamepadBinding binding{};
};

struct TouchpadFinger {
    bool down = false;
    float x = 0.0f;
    float y = 0.0f;
    float pressure = 0.0f;
};

class Gamepad {
public:
    Gamepad() = default;
    explicit Gamepad(SDL_Gamepad* gamepad) : handle(gamepad) {}
    Gamepad(std::nullptr_t) {}

    // Throws Error if the gamepad cannot be opened.
    static Gamepad open(GamepadID id);

    // Already opened gamepads, or a null Gamepad.
    static Gamepad fromID(GamepadID id);
    static Gamepad fromPlayerIndex(int playerIndex);

    void close();

    SDL_Gamepad* get() const { return handle; }
    explicit operator bool() const { return handle != nullptr; }

    bool operator==(const Gamepad& other) const { return handle == other.handle; }
    bool operator!=(const Gamepad& other) const { return handle != other.handle; }
    bool operator==(std::nullptr_t) const { return handle == nullptr; }
    bool operator!=(std::nullptr_t) const { return handle != nullptr; }

    // --- Mappings ---------------------------------------------------------

    // Returns true for a new mapping, false if an existing one was updated.
    static bool addMapping(const std::string& mapping);
    static int addMappings(SDL_IOStream* src, bool closeIO);
    static int addMappingsFromFile(const std::string& path);
    static void reloadMappings();
    static std::vector<std::string> mappings();
    static std::string mappingForGuid(const SDL_GUID& guid);
    static void setMapping(GamepadID id, const std::string& mapping);

    // --- Global state -----------------------------------------------------

    static void update();
    static bool eventsEnabled();
    static void setEventsEnabled(bool enabled);
    static bool hasGamepad();
    static std::vector<GamepadID> gamepads();

    // --- Properties -------------------------------------------------------

    std::string name() const;
    std::string path() const;
    SDL_GamepadType kind() const;
    SDL_GamepadType realKind() const;
    int playerIndex() const;
    void setPlayerIndex(int playerIndex);
    Uint16 vendor() const;
    Uint16 product() const;
    Uint16 productVersion() const;
    Uint16 firmwareVersion() const;
    std::string serial() const;
    Uint64 steamHandle() const;
    SDL_JoystickConnectionState connectionState() const;
    bool isConnected() const;
    PowerInfo powerInfo() const;
    std::string mapping() const;
    GamepadID id() const;
    SDL_PropertiesID properties() const;
    Joystick joystick() const;

    // --- Input ------------------------------------------------------------

    bool hasAxis(SDL_GamepadAxis axis) const;
    Sint16 axis(SDL_GamepadAxis axis) const;
    bool hasButton(SDL_GamepadButton button) const;
    bool button(SDL_GamepadButton button) const;
    SDL_GamepadButtonLabel buttonLabel(SDL_GamepadButton button) const;
    std::vector<GamepadBinding> bindings() const;

    int numTouchpads() const;
    int numTouchpadFingers(int touchpad) const;
    TouchpadFinger touchpadFinger(int touchpad, int finger) const;

    bool hasSensor(SDL_SensorType kind) const;
    bool sensorEnabled(SDL_SensorType kind) const;
    void setSensorEnabled(SDL_SensorType kind, bool enabled);
    float sensorDataRate(SDL_SensorType kind) const;
    void sensorData(SDL_SensorType kind, float* values, int count) const;
    void sensorData(SDL_SensorType kind, std::vector<float>& values) const;

    // --- Output -----------------------------------------------------------

    void rumble(Uint16 lowFrequency, Uint16 highFrequency, Uint32 durationMs);
    void rumbleTriggers(Uint16 left, Uint16 right, Uint32 durationMs);
    void setLED(Uint8 red, Uint8 green, Uint8 blue);
    void sendEffect(const std::vector<Uint8>& data);

    std::string appleSFSymbolsNameFor(SDL_GamepadButton button) const;
    std::string appleSFSymbolsNameFor(SDL_GamepadAxis axis) const;

private:
    SDL_Gamepad* handle = nullptr;
};

// String forms used in mapping strings ("a", "leftx", "xboxone", ...).
SDL_GamepadButton gamepadButtonFromString(const std::string& text);
std::string gamepadButtonToString(SDL_GamepadButton button);
SDL_GamepadAxis gamepadAxisFromString(const std::string& text);
std::string gamepadAxisToString(SDL_GamepadAxis axis);
SDL_GamepadType gamepadKindFromString(const std::string& text);
std::string gamepadKindToString(SDL_GamepadType kind);

SDL_GamepadButtonLabel gamepadButtonLabelFor(SDL_GamepadType kind, SDL_GamepadButton button);

} // namespace sdlkit
