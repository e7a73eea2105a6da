/**
 * @file ReadyGatedReader.hpp
 * @brief Data-ready gated sample acquisition
 *
 * The DR line pulses high once per output sample. The edge callback only
 * raises an atomic flag; poll() takes and clears that flag and performs at
 * most one full register read per call. Edges that arrive between two
 * polls collapse into a single read of the freshest data.
 */

#pragma once

#include <atomic>
#include <cstdint>

#include "HAL/IHalGpio.hpp"
#include "HAL/IHalLog.hpp"
#include "HAL/IHalTimer.hpp"
#include "Drivers/Adis16460/ImuTypes.hpp"
#include "Drivers/Adis16460/RegisterProtocol.hpp"
#include "Drivers/Adis16460/SampleConverter.hpp"

namespace adis {
namespace driver {

class ReadyGatedReader {
public:
    ReadyGatedReader(RegisterProtocol& protocol, const SampleConverter& converter,
                     hal::IHalSystemTimer* timer, hal::IHalLog* log = nullptr);
    ~ReadyGatedReader();

    ReadyGatedReader(const ReadyGatedReader&) = delete;
    ReadyGatedReader& operator=(const ReadyGatedReader&) = delete;

    /**
     * @brief Subscribe onReady() to rising edges on the DR pin
     */
    hal::HalResult attach(hal::IHalEdgeWatcher* watcher, hal::gpio_pin_t pin);

    /**
     * @brief Cancel the subscription; no callback runs after this returns
     */
    hal::HalResult detach();

    bool isAttached() const { return handle_ != hal::INVALID_EDGE_HANDLE; }

    /// Edge callback; safe to call from an ISR or another thread
    void onReady() { ready_.store(true, std::memory_order_release); }

    bool isReady() const { return ready_.load(std::memory_order_acquire); }

    /**
     * @brief Read DIAG_STAT, the six axes and TEMP_OUT unconditionally
     *
     * `out` is only written once every transaction has succeeded.
     */
    hal::HalResult readSample(ImuReading& out);

    /**
     * @brief Read a sample if a ready edge arrived since the last poll
     * @param latest Overwritten when a sample is captured
     * @param captured Set to whether a sample was captured (optional)
     */
    hal::HalResult poll(ImuReading& latest, bool* captured = nullptr);

    /**
     * @brief Read PROD_ID and compare with the expected device ID
     * @param id Receives the value read
     * @return HARDWARE_FAULT on mismatch
     */
    hal::HalResult checkProductId(uint16_t& id);

    /// Completed read sequences since construction
    uint32_t sampleCount() const { return samples_; }

private:
    static constexpr const char* TAG = "ADIS_DR";

    RegisterProtocol& protocol_;
    const SampleConverter& converter_;
    hal::IHalSystemTimer* timer_;
    hal::IHalLog* log_;

    hal::IHalEdgeWatcher* watcher_ = nullptr;
    hal::edge_handle_t handle_ = hal::INVALID_EDGE_HANDLE;
    std::atomic<bool> ready_{false};
    uint32_t samples_ = 0;
};

} // namespace driver
} // namespace adis
