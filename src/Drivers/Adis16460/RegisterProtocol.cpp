/**
 * @file RegisterProtocol.cpp
 * @brief ADIS16460 register transactions
 */

#include "Drivers/Adis16460/RegisterProtocol.hpp"

namespace adis {
namespace driver {

using hal::HalResult;

RegisterProtocol::RegisterProtocol(hal::IHalSpi* spi, hal::IHalLog* log)
    : spi_(spi), log_(log) {}

HalResult RegisterProtocol::writeCommand(uint16_t word) {
    if (!spi_ || !spi_->isInitialized()) return HalResult::NOT_INITIALIZED;

    const uint8_t frame[2] = {
        static_cast<uint8_t>(word >> 8),
        static_cast<uint8_t>(word & 0xFF)
    };

    HalResult result = spi_->write(frame, sizeof(frame));
    if (result != HalResult::OK) {
        if (log_) log_->error(TAG, "Write 0x%04X failed (%s)", word, hal::halResultToString(result));
    }
    return result;
}

HalResult RegisterProtocol::readRegister(uint16_t address, RegisterWord& out) {
    HalResult result = writeCommand(address);
    if (result != HalResult::OK) return result;

    RegisterWord rx{};
    result = spi_->read(rx.data(), rx.size());
    if (result != HalResult::OK) {
        if (log_) log_->error(TAG, "Read after 0x%04X failed (%s)", address, hal::halResultToString(result));
        return result;
    }

    out = rx;
    return HalResult::OK;
}

HalResult RegisterProtocol::readWord(uint16_t address, uint16_t& out) {
    RegisterWord rx{};
    HalResult result = readRegister(address, rx);
    if (result != HalResult::OK) return result;

    out = static_cast<uint16_t>((rx[0] << 8) | rx[1]);
    return HalResult::OK;
}

HalResult RegisterProtocol::readAxis(const reg::AxisRegisters& axis, AxisWord& out) {
    RegisterWord high{};
    RegisterWord low{};

    HalResult result = readRegister(axis.high, high);
    if (result != HalResult::OK) return result;

    result = readRegister(axis.low, low);
    if (result != HalResult::OK) return result;

    out = {high[0], high[1], low[0], low[1]};
    return HalResult::OK;
}

} // namespace driver
} // namespace adis
