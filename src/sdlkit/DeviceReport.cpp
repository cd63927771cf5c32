#include "sdlkit/DeviceReport.h"
#include "sdlkit/Error.h"
#include "sdlkit/Gamepad.h"
#include "sdlkit/Joystick.h"
#include "sdlkit/Keyboard.h"
#include "sdlkit/Log.h"
#include "sdlkit/Marshal.h"
#include "sdlkit/Mouse.h"
#include "sdlkit/Sensor.h"
#include "sdlkit/Touch.h"

namespace sdlkit {
namespace DeviceReport {

namespace {

const char* touchDeviceTypeName(SDL_TouchDeviceType type) {
    switch (type) {
        case SDL_TOUCH_DEVICE_DIRECT:            return "direct";
        case SDL_TOUCH_DEVICE_INDIRECT_ABSOLUTE: return "indirect_absolute";
        case SDL_TOUCH_DEVICE_INDIRECT_RELATIVE: return "indirect_relative";
        default:                                 return "invalid";
    }
}

} // namespace

json keyboards() {
    json list = json::array();
    for (const Keyboard& keyboard : Keyboard::keyboards()) {
        list.push_back({{"id", keyboard.id()}, {"name", keyboard.name()}});
    }
    return list;
}

json mice() {
    json list = json::array();
    for (const Mouse& mouse : Mouse::mice()) {
        list.push_back({{"id", mouse.id()}, {"name", mouse.name()}});
    }
    return list;
}

json touchDevices() {
    json list = json::array();
    for (const Touch& touch : Touch::devices()) {
        json entry = {{"id", touch.id()}, {"type", touchDeviceTypeName(touch.deviceType())}};

        // A device can disappear between enumeration and the name query.
        try {
            entry["name"] = touch.name();
        } catch (const Error& e) {
            log::warn("REPORT", std::string("Touch device name unavailable: ") + e.what());
            entry["name"] = nullptr;
        }
        list.push_back(entry);
    }
    return list;
}

json sensors() {
    if (!SDL_WasInit(SDL_INIT_SENSOR)) {
        return json::array();
    }

    json list = json::array();
    for (const SensorID& id : Sensor::sensors()) {
        list.push_back({
            {"id", id.value()},
            {"name", id.name()},
            {"type", sensorKindName(id.kind())},
            {"nonPortableType", id.nonPortableType()}
        });
    }
    return list;
}

json gamepads() {
    if (!SDL_WasInit(SDL_INIT_GAMEPAD)) {
        return json::array();
    }

    json list = json::array();
    for (const GamepadID& id : Gamepad::gamepads()) {
        list.push_back({
            {"id", id.value()},
            {"name", id.name()},
            {"path", id.path()},
            {"guid", guidToString(id.guid())},
            {"vendor", id.vendor()},
            {"product", id.product()},
            {"productVersion", id.productVersion()},
            {"type", gamepadKindToString(id.kind())},
            {"realType", gamepadKindToString(id.realKind())},
            {"playerIndex", id.playerIndex()}
        });
    }
    return list;
}

json joysticks() {
    if (!SDL_WasInit(SDL_INIT_JOYSTICK)) {
        return json::array();
    }

    json list = json::array();
    for (const JoystickID& id : Joystick::joysticks()) {
        list.push_back({
            {"id", id.value()},
            {"name", id.name()},
            {"path", id.path()},
            {"guid", guidToString(id.guid())},
            {"vendor", id.vendor()},
            {"product", id.product()},
            {"productVersion", id.productVersion()},
            {"type", joystickKindName(id.kind())},
            {"virtual", id.isVirtual()},
            {"gamepad", id.isGamepad()},
            {"playerIndex", id.playerIndex()}
        });
    }
    return list;
}

json build() {
    return {
        {"keyboards", keyboards()},
        {"mice", mice()},
        {"touch", touchDevices()},
        {"sensors", sensors()},
        {"gamepads", gamepads()},
        {"joysticks", joysticks()}
    };
}

} // namespace DeviceReport
} // namespace sdlkit
