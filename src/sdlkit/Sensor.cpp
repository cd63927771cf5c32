#include "sdlkit/Sensor.h"
#include "sdlkit/Error.h"
#include "sdlkit/Marshal.h"

namespace sdlkit {

// ============================================================================
//                     SensorID
// ============================================================================

std::string SensorID::name() const {
    return toString(SDL_GetSensorNameForID(handle));
}

SDL_SensorType SensorID::kind() const {
    return SDL_GetSensorTypeForID(handle);
}

int SensorID::nonPortableType() const {
    return SDL_GetSensorNonPortableTypeForID(handle);
}

// ============================================================================
//                     Sensor
// ============================================================================

Sensor Sensor::open(SensorID id) {
    return Sensor(checkHandle(SDL_OpenSensor(id.value())));
}

Sensor Sensor::fromID(SensorID id) {
    return Sensor(SDL_GetSensorFromID(id.value()));
}

void Sensor::close() {
    SDL_CloseSensor(handle);
    handle = nullptr;
}

void Sensor::data(float* values, int count) const {
    checkSdl(SDL_GetSensorData(handle, values, count));
}

void Sensor::data(std::vector<float>& values) const {
    data(values.data(), static_cast<int>(values.size()));
}

std::string Sensor::name() const {
    return toString(SDL_GetSensorName(handle));
}

SDL_SensorType Sensor::kind() const {
    return SDL_GetSensorType(handle);
}

int Sensor::nonPortableType() const {
    return SDL_GetSensorNonPortableType(handle);
}

SensorID Sensor::id() const {
    return SensorID(checkId(SDL_GetSensorID(handle)));
}

SDL_PropertiesID Sensor::properties() const {
    return checkId(SDL_GetSensorProperties(handle));
}

void Sensor::update() {
    SDL_UpdateSensors();
}

std::vector<SensorID> Sensor::sensors() {
    int count = 0;
    std::vector<SDL_SensorID> ids = takeArray(SDL_GetSensors(&count), count);

    std::vector<SensorID> result;
    result.reserve(ids.size());
    for (SDL_SensorID id : ids) {
        result.emplace_back(id);
    }
    return result;
}

const char* sensorKindName(SDL_SensorType kind) {
    switch (kind) {
        case SDL_SENSOR_UNKNOWN: return "unknown";
        case SDL_SENSOR_ACCEL:   return "accel";
        case SDL_SENSOR_GYRO:    return "gyro";
        case SDL_SENSOR_ACCEL_L: return "accel_l";
        case SDL_SENSOR_GYRO_L:  return "gyro_l";
        case SDL_SENSOR_ACCEL_R: return "accel_r";
        case SDL_SENSOR_GYRO_R:  return "gyro_r";
        default:                 return "invalid";
    }
}

} // namespace sdlkit
