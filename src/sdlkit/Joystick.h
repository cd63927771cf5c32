#pragma once

#include <SDL3/SDL.h>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace sdlkit {

class Gamepad;

struct PowerInfo {
    SDL_PowerState state = SDL_POWERSTATE_UNKNOWN;
    int percent = -1;   // -1 when unknown
};

struct GuidInfo {
    Uint16 vendor = 0;
    Uint16 product = 0;
    Uint16 version = 0;
    Uint16 crc16 = 0;
};

// A joystick known to SDL, not necessarily opened.
class JoystickID {
public:
    JoystickID() = default;
    explicit JoystickID(SDL_JoystickID id) : handle(id) {}

    SDL_JoystickID value() const { return handle; }
    explicit operator bool() const { return handle != 0; }

    bool operator==(const JoystickID& other) const { return handle == other.handle; }
    bool operator!=(const JoystickID& other) const { return handle != other.handle; }

    std::string name() const;
    std::string path() const;
    int playerIndex() const;
    SDL_GUID guid() const;
    Uint16 vendor() const;
    Uint16 product() const;
    Uint16 productVersion() const;
    SDL_JoystickType kind() const;
    bool isVirtual() const;
    bool isGamepad() const;

private:
    SDL_JoystickID handle = 0;
};

class Joystick {
public:
    Joystick() = default;
    explicit Joystick(SDL_Joystick* joystick) : handle(joystick) {}
    Joystick(std::nullptr_t) {}

    // Throws Error if the joystick cannot be opened.
    static Joystick open(JoystickID id);

    // Already opened joysticks, or a null Joystick.
    static Joystick fromID(JoystickID id);
    static Joystick fromPlayerIndex(int playerIndex);
    static Joystick fromGamepad(const Gamepad& gamepad);

    void close();

    SDL_Joystick* get() const { return handle; }
    explicit operator bool() const { return handle != nullptr; }

    bool operator==(const Joystick& other) const { return handle == other.handle; }
    bool operator!=(const Joystick& other) const { return handle != other.handle; }
    bool operator==(std::nullptr_t) const { return handle == nullptr; }
    bool operator!=(std::nullptr_t) const { return handle != nullptr; }

    // Guards the joystick API against concurrent access from several threads.
    static void lock();
    static void unlock();

    // Only needed when joystick events are disabled.
    static void update();
    static bool eventsEnabled();
    static void setEventsEnabled(bool enabled);

    static bool hasJoystick();
    static std::vector<JoystickID> joysticks();

    static GuidInfo guidInfo(const SDL_GUID& guid);

    std::string name() const;
    std::string path() const;
    int playerIndex() const;
    void setPlayerIndex(int playerIndex);
    SDL_GUID guid() const;
    Uint16 vendor() const;
    Uint16 product() const;
    Uint16 productVersion() const;
    Uint16 firmwareVersion() const;
    std::string serial() const;
    SDL_JoystickType kind() const;
    bool isConnected() const;
    SDL_JoystickConnectionState connectionState() const;
    PowerInfo powerInfo() const;
    SDL_PropertiesID properties() const;
    JoystickID id() const;

    int numAxes() const;
    Sint16 axis(int axis) const;

    // False if the axis has no initial value.
    bool axisInitialState(int axis, Sint16& state) const;

    int numBalls() const;
    SDL_Point ball(int ball) const;

    int numHats() const;
    Uint8 hat(int hat) const;

    int numButtons() const;
    bool button(int button) const;

    // Both rumble calls replace any effect already playing; 0 stops it.
    void rumble(Uint16 lowFrequency, Uint16 highFrequency, Uint32 durationMs);
    void rumbleTriggers(Uint16 left, Uint16 right, Uint32 durationMs);
    void setLED(Uint8 red, Uint8 green, Uint8 blue);
    void sendEffect(const std::vector<Uint8>& data);

    // Input injection for virtual joysticks.
    void setVirtualAxis(int axis, Sint16 value);
    void setVirtualBall(int ball, Sint16 xrel, Sint16 yrel);
    void setVirtualButton(int button, bool down);
    void setVirtualHat(int hat, Uint8 value);
    void setVirtualTouchpad(int touchpad, int finger, bool down, float x, float y, float pressure);
    void sendVirtualSensorData(SDL_SensorType kind, Uint64 sensorTimestamp, const std::vector<float>& data);

    static void detachVirtual(JoystickID id);

private:
    SDL_Joystick* handle = nullptr;
};

// Scoped Joystick::lock() / Joystick::unlock().
class JoystickLock {
public:
    JoystickLock() { Joystick::lock(); }
    ~JoystickLock() { Joystick::unlock(); }

    JoystickLock(const JoystickLock&) = delete;
    JoystickLock& operator=(const JoystickLock&) = delete;
};

struct VirtualJoystickTouchpad {
    Uint16 numFingers = 0;
};

struct VirtualJoystickSensor {
    SDL_SensorType kind = SDL_SENSOR_UNKNOWN;
    float rate = 0.0f;
};

/**
 * Describes a virtual joystick to attach.
 *
 * The hooks are optional. SDL calls them with the joystick lock held, from
 * whichever thread updates joysticks. attach() copies the hooks into a holder
 * that SDL owns; it is released through SDL's Cleanup callback when the
 * joystick is detached.
 */
struct VirtualJoystickDesc {
    SDL_JoystickType kind = SDL_JOYSTICK_TYPE_UNKNOWN;
    Uint16 vendorID = 0;
    Uint16 productID = 0;
    Uint16 numAxes = 0;
    Uint16 numButtons = 0;
    Uint16 numBalls = 0;
    Uint16 numHats = 0;

    // Bit masks of SDL_GamepadButton / SDL_GamepadAxis values, for gamepad kinds.
    Uint32 validButtons = 0;
    Uint32 validAxes = 0;

    std::string name;
    std::vector<VirtualJoystickTouchpad> touchpads;
    std::vector<VirtualJoystickSensor> sensors;

    std::function<void()> update;
    std::function<void(int playerIndex)> setPlayerIndex;
    std::function<bool(Uint16 lowFrequency, Uint16 highFrequency)> rumble;
    std::function<bool(Uint16 left, Uint16 right)> rumbleTriggers;
    std::function<bool(Uint8 red, Uint8 green, Uint8 blue)> setLED;
    std::function<bool(const void* data, int size)> sendEffect;
    std::function<bool(bool enabled)> setSensorsEnabled;

    // Throws Error if SDL rejects the description.
    JoystickID attach() const;
};

const char* joystickKindName(SDL_JoystickType kind);

} // namespace sdlkit
