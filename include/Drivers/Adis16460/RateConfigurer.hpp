/**
 * @file RateConfigurer.hpp
 * @brief Output data rate (decimation) and FIR filter programming
 *
 * The ADIS16460 samples internally at 2048 Hz and divides that rate by
 * (DEC_RATE + 1). Requested rates are therefore rounded to the nearest
 * integer division of 2048: 1024 Hz, 682.67 Hz, 512 Hz, ...
 */

#pragma once

#include <cstdint>

#include "HAL/IHalLog.hpp"
#include "Drivers/Adis16460/ImuTypes.hpp"
#include "Drivers/Adis16460/RegisterProtocol.hpp"

namespace adis {
namespace driver {

class RateConfigurer {
public:
    explicit RateConfigurer(RegisterProtocol& protocol, hal::IHalLog* log = nullptr);

    /**
     * @brief Decimation factor for a requested rate
     *
     * floor(2048 / rate_hz) - 1, never below 0 and saturated at 0xFFFF.
     * Rates that are not positive (including NaN) give 0.
     * @param rate_hz Requested rate
     */
    static uint16_t computeDecimation(double rate_hz);

    /**
     * @brief Rate the device produces for a given factor
     */
    static double effectiveRate(uint16_t dec_factor);

    /**
     * @brief Compute and program DEC_RATE
     *
     * Writes DEC_RATE_WRITE + factor, then DEC_RATE_CONFIRM. Factors above
     * MAX_DEC_FACTOR are clamped since the upper byte is always written as 0.
     * @return INVALID_PARAM for non-positive or non-finite rates (nothing written)
     */
    hal::HalResult setDecimation(double rate_hz);

    /**
     * @brief Program the Bartlett window FIR tap count
     * @param taps 0..7 inclusive
     * @return INVALID_PARAM when out of range (nothing written, previous setting kept)
     */
    hal::HalResult setTaps(int taps);

    const DecimationConfig& config() const { return config_; }

private:
    static constexpr const char* TAG = "ADIS_RATE";

    RegisterProtocol& protocol_;
    hal::IHalLog* log_;
    DecimationConfig config_{};
};

} // namespace driver
} // namespace adis
