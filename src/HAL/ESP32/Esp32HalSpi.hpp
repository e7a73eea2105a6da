/*****************************************************************
 * File:      Esp32HalSpi.hpp
 * Category:  src/HAL/ESP32
 *
 * Purpose:
 *    ESP32 implementation of SPI Hardware Abstraction interface.
 *    Uses Arduino SPI library for master mode communication.
 *    Every write() and read() is framed by its own chip-select
 *    assertion, matching the ADIS16460's 16-bit word protocol.
 *****************************************************************/

#ifndef ADIS_SRC_HAL_ESP32_HAL_SPI_HPP_
#define ADIS_SRC_HAL_ESP32_HAL_SPI_HPP_

#include "HAL/IHalSpi.hpp"
#include "HAL/IHalLog.hpp"
#include <Arduino.h>
#include <SPI.h>

namespace adis::hal::esp32{

/** ESP32 SPI Implementation using Arduino SPI library */
class Esp32HalSpi : public IHalSpi{
private:
  static constexpr const char* TAG = "SPI";
  // ADIS16460 stall time between 16-bit words
  static constexpr uint32_t STALL_US = 16;

  IHalLog* log_ = nullptr;
  SpiConfig config_;
  SPIClass* spi_ = nullptr;
  SPISettings settings_;
  bool initialized_ = false;

  uint8_t convertMode(SpiMode mode) const{
    switch(mode){
      case SpiMode::MODE_0: return SPI_MODE0;
      case SpiMode::MODE_1: return SPI_MODE1;
      case SpiMode::MODE_2: return SPI_MODE2;
      case SpiMode::MODE_3: return SPI_MODE3;
      default: return SPI_MODE3;
    }
  }

  void select(){
    spi_->beginTransaction(settings_);
    if(config_.cs_pin > 0){
      digitalWrite(config_.cs_pin, LOW);
    }
  }

  void release(){
    if(config_.cs_pin > 0){
      digitalWrite(config_.cs_pin, HIGH);
    }
    spi_->endTransaction();
    delayMicroseconds(STALL_US);
  }

public:
  explicit Esp32HalSpi(IHalLog* log = nullptr) : log_(log){}

  ~Esp32HalSpi() override{
    if(initialized_){
      deinit();
    }
  }

  HalResult init(const SpiConfig& config) override{
    if(initialized_){
      if(log_) log_->warn(TAG, "SPI already initialized");
      return HalResult::ALREADY_INITIALIZED;
    }

    if(config.bus > 1){
      if(log_) log_->error(TAG, "SPI bus %d not available", config.bus);
      return HalResult::TRANSPORT_UNAVAILABLE;
    }

    config_ = config;

    // VSPI for bus 0, HSPI otherwise
    if(config_.bus == 0){
      spi_ = &SPI;
    }else{
      spi_ = new SPIClass(HSPI);
    }

    spi_->begin(config_.sck_pin, config_.miso_pin, config_.mosi_pin, config_.cs_pin);

    uint8_t bit_order = (config_.bit_order == SpiBitOrder::MSB_FIRST) ? MSBFIRST : LSBFIRST;
    settings_ = SPISettings(config_.frequency, bit_order, convertMode(config_.mode));

    if(config_.cs_pin > 0){
      pinMode(config_.cs_pin, OUTPUT);
      digitalWrite(config_.cs_pin, HIGH);
    }

    initialized_ = true;
    if(log_) log_->info(TAG, "SPI bus %d initialized: SCK=%d, MOSI=%d, MISO=%d, CS=%d, freq=%lu Hz",
                        config_.bus, config_.sck_pin, config_.mosi_pin, config_.miso_pin,
                        config_.cs_pin, (unsigned long)config_.frequency);
    return HalResult::OK;
  }

  HalResult deinit() override{
    if(!initialized_) return HalResult::NOT_INITIALIZED;

    spi_->end();
    if(spi_ != &SPI){
      delete spi_;
    }
    spi_ = nullptr;

    initialized_ = false;
    if(log_) log_->info(TAG, "SPI deinitialized");
    return HalResult::OK;
  }

  bool isInitialized() const override{
    return initialized_;
  }

  HalResult write(const uint8_t* data, size_t length) override{
    if(!initialized_) return HalResult::NOT_INITIALIZED;
    if(!data || length == 0) return HalResult::INVALID_PARAM;

    select();
    for(size_t i = 0; i < length; i++){
      spi_->transfer(data[i]);
    }
    release();
    return HalResult::OK;
  }

  HalResult read(uint8_t* buffer, size_t length) override{
    if(!initialized_) return HalResult::NOT_INITIALIZED;
    if(!buffer || length == 0) return HalResult::INVALID_PARAM;

    select();
    for(size_t i = 0; i < length; i++){
      buffer[i] = spi_->transfer(0x00);
    }
    release();
    return HalResult::OK;
  }
};

} // namespace adis::hal::esp32

#endif // ADIS_SRC_HAL_ESP32_HAL_SPI_HPP_
