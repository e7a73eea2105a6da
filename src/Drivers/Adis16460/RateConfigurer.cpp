/**
 * @file RateConfigurer.cpp
 * @brief Decimation and FIR filter programming
 */

#include "Drivers/Adis16460/RateConfigurer.hpp"

#include <cmath>

namespace adis {
namespace driver {

using hal::HalResult;

RateConfigurer::RateConfigurer(RegisterProtocol& protocol, hal::IHalLog* log)
    : protocol_(protocol), log_(log) {}

uint16_t RateConfigurer::computeDecimation(double rate_hz) {
    if (!(rate_hz > 0.0)) return 0;
    const double divisions = std::floor(reg::DEVICE_MAX_RATE_HZ / rate_hz);
    if (divisions < 1.0) return 0;
    if (divisions - 1.0 >= 65535.0) return 0xFFFF;
    return static_cast<uint16_t>(divisions - 1.0);
}

double RateConfigurer::effectiveRate(uint16_t dec_factor) {
    return reg::DEVICE_MAX_RATE_HZ / (static_cast<double>(dec_factor) + 1.0);
}

HalResult RateConfigurer::setDecimation(double rate_hz) {
    if (!std::isfinite(rate_hz) || rate_hz <= 0.0) {
        if (log_) log_->error(TAG, "Invalid sample rate %.3f Hz", rate_hz);
        return HalResult::INVALID_PARAM;
    }

    uint16_t dec = computeDecimation(rate_hz);
    if (dec > reg::MAX_DEC_FACTOR) {
        if (log_) log_->warn(TAG, "Rate %.3f Hz needs factor %u, clamped to %u (%.3f Hz)",
                             rate_hz, static_cast<unsigned>(dec),
                             static_cast<unsigned>(reg::MAX_DEC_FACTOR), effectiveRate(reg::MAX_DEC_FACTOR));
        dec = reg::MAX_DEC_FACTOR;
    }

    HalResult result = protocol_.writeCommand(static_cast<uint16_t>(reg::DEC_RATE_WRITE + dec));
    if (result != HalResult::OK) return result;

    result = protocol_.writeCommand(reg::DEC_RATE_CONFIRM);
    if (result != HalResult::OK) return result;

    config_.rate_hz = rate_hz;
    config_.dec_factor = dec;
    if (log_) log_->info(TAG, "Decimation %u: requested %.3f Hz, output %.3f Hz",
                         static_cast<unsigned>(dec), rate_hz, effectiveRate(dec));
    return HalResult::OK;
}

HalResult RateConfigurer::setTaps(int taps) {
    if (taps < reg::MIN_FILTER_TAPS || taps > reg::MAX_FILTER_TAPS) {
        if (log_) log_->error(TAG, "Filter taps %d outside [%d, %d]",
                              taps, reg::MIN_FILTER_TAPS, reg::MAX_FILTER_TAPS);
        return HalResult::INVALID_PARAM;
    }

    HalResult result = protocol_.writeCommand(static_cast<uint16_t>(reg::FILT_CTRL_WRITE + taps));
    if (result != HalResult::OK) return result;

    config_.taps = static_cast<uint8_t>(taps);
    config_.taps_programmed = true;
    if (log_) log_->info(TAG, "FIR filter: %d taps", taps);
    return HalResult::OK;
}

} // namespace driver
} // namespace adis
