/**
 * @file ReadyGatedReader.cpp
 * @brief Data-ready gated sample acquisition
 */

#include "Drivers/Adis16460/ReadyGatedReader.hpp"

namespace adis {
namespace driver {

using hal::HalResult;

ReadyGatedReader::ReadyGatedReader(RegisterProtocol& protocol, const SampleConverter& converter,
                                   hal::IHalSystemTimer* timer, hal::IHalLog* log)
    : protocol_(protocol), converter_(converter), timer_(timer), log_(log) {}

ReadyGatedReader::~ReadyGatedReader() {
    if (isAttached()) {
        HalResult result = detach();
        if (result != HalResult::OK && log_) {
            log_->error(TAG, "Detach on destruction failed (%s)", hal::halResultToString(result));
        }
    }
}

//=============================================================================
// Edge Subscription
//=============================================================================

HalResult ReadyGatedReader::attach(hal::IHalEdgeWatcher* watcher, hal::gpio_pin_t pin) {
    if (!watcher) return HalResult::INVALID_PARAM;
    if (isAttached()) return HalResult::ALREADY_INITIALIZED;

    hal::edge_handle_t handle = hal::INVALID_EDGE_HANDLE;
    HalResult result = watcher->subscribe(pin, hal::GpioEdge::RISING,
                                          [this]() { onReady(); }, &handle);
    if (result != HalResult::OK) {
        if (log_) log_->error(TAG, "DR subscribe on pin %d failed (%s)", pin, hal::halResultToString(result));
        return result;
    }

    watcher_ = watcher;
    handle_ = handle;
    if (log_) log_->info(TAG, "Data ready on pin %d", pin);
    return HalResult::OK;
}

HalResult ReadyGatedReader::detach() {
    if (!isAttached()) return HalResult::NOT_INITIALIZED;

    HalResult result = watcher_->unsubscribe(handle_);
    watcher_ = nullptr;
    handle_ = hal::INVALID_EDGE_HANDLE;
    return result;
}

//=============================================================================
// Sampling
//=============================================================================

HalResult ReadyGatedReader::readSample(ImuReading& out) {
    RawSample raw;

    HalResult result = protocol_.readRegister(reg::DIAG_STAT, raw.diag);
    if (result != HalResult::OK) return result;

    const struct {
        const reg::AxisRegisters& regs;
        AxisWord& dest;
    } axes[] = {
        {reg::X_GYRO, raw.x_gyro},
        {reg::Y_GYRO, raw.y_gyro},
        {reg::Z_GYRO, raw.z_gyro},
        {reg::X_ACCL, raw.x_accel},
        {reg::Y_ACCL, raw.y_accel},
        {reg::Z_ACCL, raw.z_accel},
    };
    for (const auto& axis : axes) {
        result = protocol_.readAxis(axis.regs, axis.dest);
        if (result != HalResult::OK) return result;
    }

    result = protocol_.readRegister(reg::TEMP_OUT, raw.temp);
    if (result != HalResult::OK) return result;

    ImuReading reading;
    reading.timestamp_us = timer_ ? timer_->micros() : 0;
    reading.sample = converter_.convert(raw);
    reading.diag_stat = static_cast<uint16_t>((raw.diag[0] << 8) | raw.diag[1]);

    out = reading;
    samples_++;
    return HalResult::OK;
}

HalResult ReadyGatedReader::poll(ImuReading& latest, bool* captured) {
    if (captured) *captured = false;

    if (!ready_.exchange(false, std::memory_order_acq_rel)) {
        return HalResult::OK;
    }

    HalResult result = readSample(latest);
    if (result != HalResult::OK) return result;

    if (captured) *captured = true;
    return HalResult::OK;
}

HalResult ReadyGatedReader::checkProductId(uint16_t& id) {
    HalResult result = protocol_.readWord(reg::PROD_ID, id);
    if (result != HalResult::OK) return result;

    if (id != reg::PROD_ID_VALUE) {
        if (log_) log_->error(TAG, "PROD_ID 0x%04X, expected 0x%04X", id, reg::PROD_ID_VALUE);
        return HalResult::HARDWARE_FAULT;
    }

    if (log_) log_->debug(TAG, "PROD_ID 0x%04X", id);
    return HalResult::OK;
}

} // namespace driver
} // namespace adis
