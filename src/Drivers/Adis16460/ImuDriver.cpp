/**
 * @file ImuDriver.cpp
 * @brief ADIS16460 IMU Driver implementation
 */

#include "Drivers/Adis16460/ImuDriver.hpp"

namespace adis {
namespace driver {

using hal::HalResult;

ImuDriver::ImuDriver(hal::IHalSpi* spi, hal::IHalEdgeWatcher* edges,
                     hal::IHalSystemTimer* timer, hal::IHalLog* log)
    : spi_(spi),
      edges_(edges),
      timer_(timer),
      log_(log),
      converter_(ScaleFactors::datasheet()),
      protocol_(spi, log),
      rate_(protocol_, log) {}

ImuDriver::~ImuDriver() {
    std::lock_guard<std::mutex> lock(bus_mutex_);
    if (initialized_ || spi_open_) {
        HalResult result = releaseLocked();
        if (result != HalResult::OK && log_) {
            log_->error(TAG, "Release on destruction failed (%s)", hal::halResultToString(result));
        }
    }
}

//=============================================================================
// Lifecycle
//=============================================================================

HalResult ImuDriver::init(const ImuDriverConfig& config) {
    std::lock_guard<std::mutex> lock(bus_mutex_);

    HalResult result = initLocked(config);
    if (log_) log_->logResult(result, TAG, "init");
    return result;
}

HalResult ImuDriver::initLocked(const ImuDriverConfig& config) {
    if (initialized_) return HalResult::ALREADY_INITIALIZED;
    if (!spi_ || !edges_ || !timer_) return HalResult::INVALID_PARAM;

    config_ = config;

    HalResult result = spi_->init(config_.spi);
    if (result != HalResult::OK) {
        if (log_) log_->error(TAG, "SPI bus %d open failed (%s)",
                              config_.spi.bus, hal::halResultToString(result));
        return HalResult::TRANSPORT_UNAVAILABLE;
    }
    spi_open_ = true;

    const hal::timestamp_us_t start = timer_->micros();

    result = rate_.setDecimation(config_.sample_rate_hz);
    if (result != HalResult::OK) {
        return abortInit(result);
    }

    if (log_) log_->debug(TAG, "Scale factors: accel %.9g mm/s^2/LSB, gyro %.9g dps/LSB",
                          converter_.factors().accel_scale, converter_.factors().gyro_scale);

    reader_ = std::make_unique<ReadyGatedReader>(protocol_, converter_, timer_, log_);
    result = reader_->attach(edges_, config_.data_ready_pin);
    if (result != HalResult::OK) {
        return abortInit(result);
    }

    result = rate_.setTaps(config_.taps);
    if (result == HalResult::INVALID_PARAM) {
        if (log_) log_->warn(TAG, "Filter left unchanged");
    } else if (result != HalResult::OK) {
        return abortInit(result);
    }

    if (config_.verify_product_id) {
        uint16_t id = 0;
        result = reader_->checkProductId(id);
        if (result != HalResult::OK) {
            return abortInit(result);
        }
    }

    ImuReading first;
    result = reader_->readSample(first);
    if (result != HalResult::OK) {
        if (log_) log_->error(TAG, "Initial read failed (%s)", hal::halResultToString(result));
        return abortInit(result);
    }

    {
        std::lock_guard<std::mutex> state(state_mutex_);
        start_time_ = start;
        latest_ = first;
        decimation_ = rate_.config();
    }

    initialized_ = true;
    if (log_) log_->info(TAG, "Running at %.3f Hz, DR pin %d",
                         RateConfigurer::effectiveRate(rate_.config().dec_factor),
                         config_.data_ready_pin);
    return HalResult::OK;
}

HalResult ImuDriver::abortInit(HalResult cause) {
    HalResult result = releaseLocked();
    if (result != HalResult::OK && log_) {
        log_->error(TAG, "Cleanup after failed init: %s", hal::halResultToString(result));
    }
    return cause;
}

HalResult ImuDriver::deinit() {
    std::lock_guard<std::mutex> lock(bus_mutex_);
    if (!initialized_ && !spi_open_) return HalResult::NOT_INITIALIZED;

    HalResult result = releaseLocked();
    if (log_) log_->logResult(result, TAG, "deinit");
    return result;
}

HalResult ImuDriver::releaseLocked() {
    HalResult first_error = HalResult::OK;

    // DR callbacks must be gone before the state they touch is released.
    if (reader_) {
        if (reader_->isAttached()) {
            HalResult result = reader_->detach();
            if (result != HalResult::OK) first_error = result;
        }
        reader_.reset();
    }

    if (spi_open_) {
        HalResult result = spi_->deinit();
        if (result != HalResult::OK && first_error == HalResult::OK) first_error = result;
        spi_open_ = false;
    }

    initialized_ = false;
    return first_error;
}

bool ImuDriver::isInitialized() const {
    return initialized_;
}

//=============================================================================
// Sampling
//=============================================================================

HalResult ImuDriver::poll(bool* captured) {
    if (captured) *captured = false;

    std::lock_guard<std::mutex> lock(bus_mutex_);
    if (!initialized_) return HalResult::NOT_INITIALIZED;

    ImuReading reading;
    bool fresh = false;
    HalResult result = reader_->poll(reading, &fresh);
    if (result != HalResult::OK) return result;

    if (fresh) {
        publish(reading);
        if (config_.debug) logSample(reading);
    }
    if (captured) *captured = fresh;
    return HalResult::OK;
}

HalResult ImuDriver::readProductId(uint16_t& id) {
    std::lock_guard<std::mutex> lock(bus_mutex_);
    if (!initialized_) return HalResult::NOT_INITIALIZED;
    return protocol_.readWord(reg::PROD_ID, id);
}

void ImuDriver::publish(const ImuReading& reading) {
    std::lock_guard<std::mutex> state(state_mutex_);
    latest_ = reading;
}

void ImuDriver::logSample(const ImuReading& reading) const {
    if (!log_) return;
    const PhysicalSample& s = reading.sample;
    log_->debug(TAG, "Gyro %.3f %.3f %.3f dps | Accel %.3f %.3f %.3f mm/s^2 | Temp %.2f C | DIAG 0x%04X",
                s.x_gyro, s.y_gyro, s.z_gyro, s.x_accel, s.y_accel, s.z_accel, s.int_temp,
                static_cast<unsigned>(reading.diag_stat));
}

//=============================================================================
// Accessors
//=============================================================================

PhysicalSample ImuDriver::latest() const {
    std::lock_guard<std::mutex> state(state_mutex_);
    return latest_.sample;
}

ImuReading ImuDriver::latestReading() const {
    std::lock_guard<std::mutex> state(state_mutex_);
    return latest_;
}

uint16_t ImuDriver::lastDiagnostic() const {
    std::lock_guard<std::mutex> state(state_mutex_);
    return latest_.diag_stat;
}

hal::timestamp_us_t ImuDriver::startTime() const {
    std::lock_guard<std::mutex> state(state_mutex_);
    return start_time_;
}

hal::timestamp_us_t ImuDriver::lastSampleTime() const {
    std::lock_guard<std::mutex> state(state_mutex_);
    return latest_.timestamp_us;
}

hal::timestamp_us_t ImuDriver::elapsedUs() const {
    std::lock_guard<std::mutex> state(state_mutex_);
    return latest_.timestamp_us - start_time_;
}

DecimationConfig ImuDriver::decimation() const {
    std::lock_guard<std::mutex> state(state_mutex_);
    return decimation_;
}

double ImuDriver::effectiveSampleRate() const {
    return RateConfigurer::effectiveRate(decimation().dec_factor);
}

} // namespace driver
} // namespace adis
