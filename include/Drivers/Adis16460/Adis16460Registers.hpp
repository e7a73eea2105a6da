/**
 * @file Adis16460Registers.hpp
 * @brief ADIS16460 register map and device constants
 *
 * Every transaction on the bus is one 16-bit big-endian word. Reads are
 * issued as the register address in the upper byte with a zero lower
 * byte; writes carry the register address (with bit 15 set) in the upper
 * byte and the value in the lower byte.
 */

#pragma once

#include <cstdint>

namespace adis {
namespace driver {
namespace reg {

//=============================================================================
// Read Addresses
//=============================================================================

constexpr uint16_t DIAG_STAT   = 0x0200;

constexpr uint16_t X_GYRO_LOW  = 0x0400;
constexpr uint16_t X_GYRO_OUT  = 0x0600;
constexpr uint16_t Y_GYRO_LOW  = 0x0800;
constexpr uint16_t Y_GYRO_OUT  = 0x0A00;
constexpr uint16_t Z_GYRO_LOW  = 0x0C00;
constexpr uint16_t Z_GYRO_OUT  = 0x0E00;

constexpr uint16_t X_ACCL_LOW  = 0x1000;
constexpr uint16_t X_ACCL_OUT  = 0x1200;
constexpr uint16_t Y_ACCL_LOW  = 0x1400;
constexpr uint16_t Y_ACCL_OUT  = 0x1600;
constexpr uint16_t Z_ACCL_LOW  = 0x1800;
constexpr uint16_t Z_ACCL_OUT  = 0x1A00;

constexpr uint16_t TEMP_OUT    = 0x1E00;
constexpr uint16_t PROD_ID     = 0x5600;

//=============================================================================
// Write Opcodes
//=============================================================================

/// DEC_RATE low byte; the factor is added to the opcode
constexpr uint16_t DEC_RATE_WRITE   = 0xB600;
/// DEC_RATE high byte, always written as zero to latch the new rate
constexpr uint16_t DEC_RATE_CONFIRM = 0xB700;
/// FILT_CTRL low byte; the tap count occupies the low 3 bits
constexpr uint16_t FILT_CTRL_WRITE  = 0xB800;

//=============================================================================
// Device Constants
//=============================================================================

/// Expected PROD_ID contents (16460 decimal)
constexpr uint16_t PROD_ID_VALUE = 0x404C;

/// Internal sample rate before decimation
constexpr double DEVICE_MAX_RATE_HZ = 2048.0;

/// Largest factor the DEC_RATE_WRITE opcode can carry in its low byte
constexpr uint16_t MAX_DEC_FACTOR = 0xFF;

constexpr int MIN_FILTER_TAPS = 0;
constexpr int MAX_FILTER_TAPS = 7;

/// Register reads per sample: DIAG_STAT, 6 axes x 2 words, TEMP_OUT
constexpr int SAMPLE_READ_COUNT = 14;

//=============================================================================
// Axis Register Pairs
//=============================================================================

/**
 * @brief Register pair forming one 32-bit axis value
 *
 * `high` supplies the most significant 16 bits, `low` the least.
 */
struct AxisRegisters {
    uint16_t high;
    uint16_t low;
};

constexpr AxisRegisters X_GYRO = {X_GYRO_OUT, X_GYRO_LOW};
constexpr AxisRegisters Y_GYRO = {Y_GYRO_OUT, Y_GYRO_LOW};
constexpr AxisRegisters Z_GYRO = {Z_GYRO_OUT, Z_GYRO_LOW};
constexpr AxisRegisters X_ACCL = {X_ACCL_OUT, X_ACCL_LOW};
constexpr AxisRegisters Y_ACCL = {Y_ACCL_OUT, Y_ACCL_LOW};
constexpr AxisRegisters Z_ACCL = {Z_ACCL_OUT, Z_ACCL_LOW};

} // namespace reg
} // namespace driver
} // namespace adis
