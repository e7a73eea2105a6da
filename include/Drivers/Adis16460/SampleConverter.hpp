/**
 * @file SampleConverter.hpp
 * @brief Raw register bytes to physical units
 *
 * Axis outputs are 32-bit two's-complement values split across an OUT
 * (high) and a LOW register. Temperature is a single 16-bit register at
 * 0.05 C/LSB with 0 LSB = 25 C.
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "Drivers/Adis16460/ImuTypes.hpp"

namespace adis {
namespace driver {

class SampleConverter {
public:
    explicit SampleConverter(const ScaleFactors& factors = ScaleFactors::datasheet());

    /**
     * @brief Decode big-endian two's-complement
     * @param bytes Most significant byte first
     * @param length 2 or 4; any other length yields 0
     */
    static int32_t toSigned(const uint8_t* bytes, size_t length);

    static int32_t toSigned(const RegisterWord& word) { return toSigned(word.data(), word.size()); }
    static int32_t toSigned(const AxisWord& word) { return toSigned(word.data(), word.size()); }

    /// raw * 0.05 + 25
    static double toTemperature(int32_t raw_temp);

    double scaleGyro(int32_t raw) const { return raw * factors_.gyro_scale; }
    double scaleAccel(int32_t raw) const { return raw * factors_.accel_scale; }

    PhysicalSample convert(const RawSample& raw) const;

    const ScaleFactors& factors() const { return factors_; }

private:
    ScaleFactors factors_;
};

} // namespace driver
} // namespace adis
