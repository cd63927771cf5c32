#pragma once

#include <SDL3/SDL.h>
#include <cstddef>
#include <string>
#include <vector>

namespace sdlkit {

// A sensor known to SDL, not necessarily opened.
class SensorID {
public:
    SensorID() = default;
    explicit SensorID(SDL_SensorID id) : handle(id) {}

    SDL_SensorID value() const { return handle; }
    explicit operator bool() const { return handle != 0; }

    bool operator==(const SensorID& other) const { return handle == other.handle; }
    bool operator!=(const SensorID& other) const { return handle != other.handle; }

    std::string name() const;
    SDL_SensorType kind() const;
    int nonPortableType() const;

private:
    SDL_SensorID handle = 0;
};

class Sensor {
public:
    Sensor() = default;
    explicit Sensor(SDL_Sensor* sensor) : handle(sensor) {}
    Sensor(std::nullptr_t) {}

    // Throws Error if the sensor cannot be opened.
    static Sensor open(SensorID id);

    // Already opened sensor with this id, or a null Sensor.
    static Sensor fromID(SensorID id);

    void close();

    SDL_Sensor* get() const { return handle; }
    explicit operator bool() const { return handle != nullptr; }

    bool operator==(const Sensor& other) const { return handle == other.handle; }
    bool operator!=(const Sensor& other) const { return handle != other.handle; }
    bool operator==(std::nullptr_t) const { return handle == nullptr; }
    bool operator!=(std::nullptr_t) const { return handle != nullptr; }

    // Fills values with the latest reading; the count depends on the sensor kind.
    void data(float* values, int count) const;
    void data(std::vector<float>& values) const;

    std::string name() const;
    SDL_SensorType kind() const;
    int nonPortableType() const;
    SensorID id() const;
    SDL_PropertiesID properties() const;

    // Only needed when sensor events are disabled.
    static void update();
    static std::vector<SensorID> sensors();

private:
    SDL_Sensor* handle = nullptr;
};

const char* sensorKindName(SDL_SensorType kind);

} // namespace sdlkit
