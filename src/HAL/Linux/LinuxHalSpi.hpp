/*****************************************************************
 * File:      LinuxHalSpi.hpp
 * Category:  src/HAL/Linux
 *
 * Purpose:
 *    Linux implementation of the SPI Hardware Abstraction
 *    interface using the spidev character device
 *    (/dev/spidev<bus>.<chip_select>).
 *****************************************************************/

#ifndef ADIS_SRC_HAL_LINUX_HAL_SPI_HPP_
#define ADIS_SRC_HAL_LINUX_HAL_SPI_HPP_

#include "HAL/IHalSpi.hpp"
#include "HAL/IHalLog.hpp"

#include <errno.h>
#include <fcntl.h>
#include <linux/spi/spidev.h>
#include <stdio.h>
#include <string.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace adis::hal::linux_{

/** Linux spidev SPI Implementation */
class LinuxHalSpi : public IHalSpi{
private:
  static constexpr const char* TAG = "SPI";
  static constexpr uint8_t BITS_PER_WORD = 8;

  IHalLog* log_ = nullptr;
  const char* device_prefix_;
  SpiConfig config_;
  int fd_ = -1;

  uint8_t convertMode(const SpiConfig& config) const{
    uint8_t mode = SPI_MODE_0;
    switch(config.mode){
      case SpiMode::MODE_0: mode = SPI_MODE_0; break;
      case SpiMode::MODE_1: mode = SPI_MODE_1; break;
      case SpiMode::MODE_2: mode = SPI_MODE_2; break;
      case SpiMode::MODE_3: mode = SPI_MODE_3; break;
    }
    if(config.bit_order == SpiBitOrder::LSB_FIRST){
      mode |= SPI_LSB_FIRST;
    }
    return mode;
  }

  HalResult transferHalf(const uint8_t* tx, uint8_t* rx, size_t length){
    struct spi_ioc_transfer tr;
    memset(&tr, 0, sizeof(tr));
    tr.tx_buf = reinterpret_cast<unsigned long>(tx);
    tr.rx_buf = reinterpret_cast<unsigned long>(rx);
    tr.len = static_cast<uint32_t>(length);
    tr.speed_hz = config_.frequency;
    tr.bits_per_word = BITS_PER_WORD;

    if(ioctl(fd_, SPI_IOC_MESSAGE(1), &tr) < 0){
      if(log_) log_->error(TAG, "%s of %zu bytes failed: %s",
                           tx ? "Write" : "Read", length, strerror(errno));
      return tx ? HalResult::WRITE_FAILED : HalResult::READ_FAILED;
    }
    return HalResult::OK;
  }

public:
  explicit LinuxHalSpi(IHalLog* log = nullptr, const char* device_prefix = "/dev/spidev")
    : log_(log), device_prefix_(device_prefix){}

  ~LinuxHalSpi() override{
    if(fd_ >= 0){
      ::close(fd_);
      fd_ = -1;
    }
  }

  LinuxHalSpi(const LinuxHalSpi&) = delete;
  LinuxHalSpi& operator=(const LinuxHalSpi&) = delete;

  HalResult init(const SpiConfig& config) override{
    if(fd_ >= 0){
      if(log_) log_->warn(TAG, "SPI already initialized");
      return HalResult::ALREADY_INITIALIZED;
    }

    char path[64];
    snprintf(path, sizeof(path), "%s%u.%u", device_prefix_,
             static_cast<unsigned>(config.bus), static_cast<unsigned>(config.chip_select));

    int fd = ::open(path, O_RDWR);
    if(fd < 0){
      if(log_) log_->error(TAG, "Cannot open %s: %s", path, strerror(errno));
      return HalResult::TRANSPORT_UNAVAILABLE;
    }

    uint8_t mode = convertMode(config);
    uint8_t bits = BITS_PER_WORD;
    uint32_t speed = config.frequency;

    if(ioctl(fd, SPI_IOC_WR_MODE, &mode) < 0 ||
       ioctl(fd, SPI_IOC_WR_BITS_PER_WORD, &bits) < 0 ||
       ioctl(fd, SPI_IOC_WR_MAX_SPEED_HZ, &speed) < 0){
      if(log_) log_->error(TAG, "Cannot configure %s: %s", path, strerror(errno));
      ::close(fd);
      return HalResult::TRANSPORT_UNAVAILABLE;
    }

    config_ = config;
    fd_ = fd;
    if(log_) log_->info(TAG, "%s opened: mode=%u, freq=%lu Hz",
                        path, static_cast<unsigned>(mode), static_cast<unsigned long>(speed));
    return HalResult::OK;
  }

  HalResult deinit() override{
    if(fd_ < 0) return HalResult::NOT_INITIALIZED;

    int rc = ::close(fd_);
    fd_ = -1;
    if(rc < 0){
      if(log_) log_->error(TAG, "Close failed: %s", strerror(errno));
      return HalResult::ERROR;
    }

    if(log_) log_->info(TAG, "SPI deinitialized");
    return HalResult::OK;
  }

  bool isInitialized() const override{
    return fd_ >= 0;
  }

  HalResult write(const uint8_t* data, size_t length) override{
    if(fd_ < 0) return HalResult::NOT_INITIALIZED;
    if(!data || length == 0) return HalResult::INVALID_PARAM;
    return transferHalf(data, nullptr, length);
  }

  HalResult read(uint8_t* buffer, size_t length) override{
    if(fd_ < 0) return HalResult::NOT_INITIALIZED;
    if(!buffer || length == 0) return HalResult::INVALID_PARAM;
    return transferHalf(nullptr, buffer, length);
  }
};

} // namespace adis::hal::linux_

#endif // ADIS_SRC_HAL_LINUX_HAL_SPI_HPP_
