/**
 * @file RegisterProtocol.hpp
 * @brief ADIS16460 16-bit register transactions over an SPI channel
 *
 * The device answers each 16-bit frame with the contents of the register
 * addressed by the previous frame. A read is therefore always an address
 * write followed by a separate 2-byte read on the same channel.
 */

#pragma once

#include <cstdint>

#include "HAL/IHalLog.hpp"
#include "HAL/IHalSpi.hpp"
#include "Drivers/Adis16460/Adis16460Registers.hpp"
#include "Drivers/Adis16460/ImuTypes.hpp"

namespace adis {
namespace driver {

class RegisterProtocol {
public:
    /**
     * @param spi Open channel (not owned)
     * @param log Optional logger
     */
    explicit RegisterProtocol(hal::IHalSpi* spi, hal::IHalLog* log = nullptr);

    /**
     * @brief Write one 16-bit command word, MSB first
     */
    hal::HalResult writeCommand(uint16_t word);

    /**
     * @brief Write the register address, then read the 2-byte response
     * @param address Register address (upper byte significant)
     * @param out Response bytes in wire order
     */
    hal::HalResult readRegister(uint16_t address, RegisterWord& out);

    /**
     * @brief readRegister() decoded as an unsigned big-endian word
     */
    hal::HalResult readWord(uint16_t address, uint16_t& out);

    /**
     * @brief Read the high register, then the low register, of one axis
     * @param out high[0] high[1] low[0] low[1]
     */
    hal::HalResult readAxis(const reg::AxisRegisters& axis, AxisWord& out);

private:
    static constexpr const char* TAG = "ADIS_REG";

    hal::IHalSpi* spi_;
    hal::IHalLog* log_;
};

} // namespace driver
} // namespace adis
