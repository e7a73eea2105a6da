/**
 * @file ImuTypes.hpp
 * @brief Data types shared by the ADIS16460 driver components
 */

#pragma once

#include <array>
#include <cstdint>

#include "HAL/HalTypes.hpp"
#include "HAL/IHalSpi.hpp"

namespace adis {
namespace driver {

/// One 16-bit register as received on the wire (big-endian)
using RegisterWord = std::array<uint8_t, 2>;

/// One 32-bit axis value: high register bytes followed by low register bytes
using AxisWord = std::array<uint8_t, 4>;

//=============================================================================
// Samples
//=============================================================================

/**
 * @brief Register contents of one read sequence, undecoded
 */
struct RawSample {
    RegisterWord diag{};
    AxisWord x_gyro{};
    AxisWord y_gyro{};
    AxisWord z_gyro{};
    AxisWord x_accel{};
    AxisWord y_accel{};
    AxisWord z_accel{};
    RegisterWord temp{};
};

/**
 * @brief Scaled sample
 *
 * Gyro in degrees/second, acceleration in mm/s^2, temperature in Celsius.
 */
struct PhysicalSample {
    double x_gyro = 0.0;
    double y_gyro = 0.0;
    double z_gyro = 0.0;
    double x_accel = 0.0;
    double y_accel = 0.0;
    double z_accel = 0.0;
    double int_temp = 0.0;
};

/**
 * @brief A converted sample with its status word and capture time
 */
struct ImuReading {
    PhysicalSample sample;
    uint16_t diag_stat = 0;
    hal::timestamp_us_t timestamp_us = 0;
};

//=============================================================================
// Configuration
//=============================================================================

/**
 * @brief Per-LSB conversion factors
 */
struct ScaleFactors {
    double accel_scale = 0.0;  ///< mm/s^2 per LSB
    double gyro_scale = 0.0;   ///< deg/s per LSB

    /// Factors from the datasheet: 0.25 mg and 0.005 deg/s per 2^16 LSB
    static ScaleFactors datasheet();
};

/**
 * @brief Decimation and filter settings as programmed on the device
 */
struct DecimationConfig {
    double rate_hz = 0.0;           ///< Rate requested by the caller
    uint16_t dec_factor = 0;        ///< Factor written to DEC_RATE
    uint8_t taps = 0;               ///< Bartlett FIR taps written to FILT_CTRL
    bool taps_programmed = false;   ///< False until a valid taps write went out
};

/**
 * @brief Runtime settings for ImuDriver::init()
 */
struct ImuDriverConfig {
    double sample_rate_hz = 2048.0;
    hal::gpio_pin_t data_ready_pin = 25;
    int taps = 4;
    hal::SpiConfig spi{};             ///< Defaults: bus 0, 1 MHz, mode 3
    bool verify_product_id = false;   ///< Check PROD_ID during init
    bool debug = false;               ///< Log every captured sample at DEBUG
};

} // namespace driver
} // namespace adis
