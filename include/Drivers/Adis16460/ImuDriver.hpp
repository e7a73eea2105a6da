/**
 * @file ImuDriver.hpp
 * @brief ADIS16460 IMU Driver - SPI with data-ready interrupt
 *
 * Provides 6-axis IMU data (gyroscope and accelerometer) plus internal
 * temperature from an ADIS16460.
 *
 * Features:
 * - Configurable output rate (integer divisions of 2048 Hz)
 * - Configurable Bartlett window FIR filter (0-7 taps)
 * - Data-ready gated, non-blocking updates via poll()
 * - Gyroscope in degrees/second, acceleration in mm/s^2
 *
 * Typical use:
 *
 *     ImuDriver imu(&spi, &edges, &timer, &log);
 *     if (imu.init(config) == HalResult::OK) {
 *         while (running) {
 *             bool fresh = false;
 *             imu.poll(&fresh);
 *             if (fresh) use(imu.latest());
 *         }
 *     }
 *     imu.deinit();
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>

#include "HAL/IHalGpio.hpp"
#include "HAL/IHalLog.hpp"
#include "HAL/IHalSpi.hpp"
#include "HAL/IHalTimer.hpp"
#include "Drivers/Adis16460/ImuTypes.hpp"
#include "Drivers/Adis16460/RateConfigurer.hpp"
#include "Drivers/Adis16460/ReadyGatedReader.hpp"
#include "Drivers/Adis16460/RegisterProtocol.hpp"
#include "Drivers/Adis16460/SampleConverter.hpp"

namespace adis {
namespace driver {

class ImuDriver {
public:
    /**
     * @param spi SPI channel, opened by init() and closed by deinit() (not owned)
     * @param edges Edge watcher for the DR line (not owned)
     * @param timer Monotonic clock (not owned)
     * @param log Optional logger
     */
    ImuDriver(hal::IHalSpi* spi, hal::IHalEdgeWatcher* edges,
              hal::IHalSystemTimer* timer, hal::IHalLog* log = nullptr);
    ~ImuDriver();

    ImuDriver(const ImuDriver&) = delete;
    ImuDriver& operator=(const ImuDriver&) = delete;

    //=========================================================================
    // Lifecycle
    //=========================================================================

    /**
     * @brief Open SPI, program rate and filter, arm DR, take a first sample
     * @return TRANSPORT_UNAVAILABLE if the SPI channel cannot be opened
     */
    hal::HalResult init(const ImuDriverConfig& config);

    /**
     * @brief Release the DR subscription, then close SPI
     *
     * Safe to call repeatedly and while another thread is inside poll().
     */
    hal::HalResult deinit();

    bool isInitialized() const;

    //=========================================================================
    // Sampling
    //=========================================================================

    /**
     * @brief Read a new sample if DR fired since the last call
     * @param captured Set to whether a sample was captured (optional)
     */
    hal::HalResult poll(bool* captured = nullptr);

    /// Read PROD_ID (0x404C on a healthy device)
    hal::HalResult readProductId(uint16_t& id);

    //=========================================================================
    // Accessors (non-blocking)
    //=========================================================================

    PhysicalSample latest() const;
    ImuReading latestReading() const;
    uint16_t lastDiagnostic() const;

    hal::timestamp_us_t startTime() const;
    hal::timestamp_us_t lastSampleTime() const;
    /// lastSampleTime() - startTime()
    hal::timestamp_us_t elapsedUs() const;

    DecimationConfig decimation() const;
    double effectiveSampleRate() const;
    const ScaleFactors& scaleFactors() const { return converter_.factors(); }

private:
    static constexpr const char* TAG = "ADIS16460";

    hal::HalResult initLocked(const ImuDriverConfig& config);
    hal::HalResult abortInit(hal::HalResult cause);
    hal::HalResult releaseLocked();
    void publish(const ImuReading& reading);
    void logSample(const ImuReading& reading) const;

    hal::IHalSpi* spi_;
    hal::IHalEdgeWatcher* edges_;
    hal::IHalSystemTimer* timer_;
    hal::IHalLog* log_;

    SampleConverter converter_;
    RegisterProtocol protocol_;
    RateConfigurer rate_;
    std::unique_ptr<ReadyGatedReader> reader_;

    ImuDriverConfig config_{};
    std::atomic<bool> initialized_{false};
    bool spi_open_ = false;

    /// Serializes SPI access, poll() and lifecycle changes
    mutable std::mutex bus_mutex_;
    /// Guards the published reading and timestamps; held only for copies
    mutable std::mutex state_mutex_;
    ImuReading latest_{};
    DecimationConfig decimation_{};
    hal::timestamp_us_t start_time_ = 0;
};

} // namespace driver
} // namespace adis
