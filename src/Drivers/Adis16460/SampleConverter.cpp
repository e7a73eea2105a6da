/**
 * @file SampleConverter.cpp
 * @brief Two's-complement decoding and datasheet scaling
 */

#include "Drivers/Adis16460/SampleConverter.hpp"

namespace adis {
namespace driver {

//=============================================================================
// Datasheet Constants
//=============================================================================

static constexpr double GRAVITY = 9.80665;           // m/s^2 per g
static constexpr double LSB_SPLIT = 65536.0;         // 2^16, OUT/LOW register split
static constexpr double ACCEL_MG_PER_LSB = 0.25;     // per OUT LSB
static constexpr double GYRO_DPS_PER_LSB = 0.005;    // per OUT LSB
static constexpr double TEMP_C_PER_LSB = 0.05;
static constexpr double TEMP_OFFSET_C = 25.0;

ScaleFactors ScaleFactors::datasheet() {
    ScaleFactors f;
    f.accel_scale = ACCEL_MG_PER_LSB / LSB_SPLIT * GRAVITY / 1000.0;
    f.gyro_scale = GYRO_DPS_PER_LSB / LSB_SPLIT;
    return f;
}

//=============================================================================
// SampleConverter
//=============================================================================

SampleConverter::SampleConverter(const ScaleFactors& factors)
    : factors_(factors) {}

int32_t SampleConverter::toSigned(const uint8_t* bytes, size_t length) {
    if (length == 2) {
        return static_cast<int16_t>(static_cast<uint16_t>((bytes[0] << 8) | bytes[1]));
    }
    if (length == 4) {
        const uint32_t value = (static_cast<uint32_t>(bytes[0]) << 24) |
                               (static_cast<uint32_t>(bytes[1]) << 16) |
                               (static_cast<uint32_t>(bytes[2]) << 8) |
                               static_cast<uint32_t>(bytes[3]);
        return static_cast<int32_t>(value);
    }
    return 0;
}

double SampleConverter::toTemperature(int32_t raw_temp) {
    return raw_temp * TEMP_C_PER_LSB + TEMP_OFFSET_C;
}

PhysicalSample SampleConverter::convert(const RawSample& raw) const {
    PhysicalSample s;
    s.x_gyro = scaleGyro(toSigned(raw.x_gyro));
    s.y_gyro = scaleGyro(toSigned(raw.y_gyro));
    s.z_gyro = scaleGyro(toSigned(raw.z_gyro));
    s.x_accel = scaleAccel(toSigned(raw.x_accel));
    s.y_accel = scaleAccel(toSigned(raw.y_accel));
    s.z_accel = scaleAccel(toSigned(raw.z_accel));
    s.int_temp = toTemperature(toSigned(raw.temp));
    return s;
}

} // namespace driver
} // namespace adis
