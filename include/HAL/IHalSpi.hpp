/*****************************************************************
 * File:      IHalSpi.hpp
 * Category:  include/HAL
 *
 * Purpose:
 *    SPI Hardware Abstraction Layer interface.
 *    Provides a platform-independent half-duplex SPI master
 *    channel: open, write N bytes, read N bytes, close.
 *****************************************************************/

#ifndef ADIS_INCLUDE_HAL_IHAL_SPI_HPP_
#define ADIS_INCLUDE_HAL_IHAL_SPI_HPP_

#include "HalTypes.hpp"

namespace adis::hal{

// ============================================================
// SPI Configuration
// ============================================================

/** SPI mode (clock polarity and phase) */
enum class SpiMode : uint8_t{
  MODE_0,  // CPOL=0, CPHA=0
  MODE_1,  // CPOL=0, CPHA=1
  MODE_2,  // CPOL=1, CPHA=0
  MODE_3   // CPOL=1, CPHA=1
};

/** SPI bit order */
enum class SpiBitOrder : uint8_t{
  MSB_FIRST,
  LSB_FIRST
};

/** SPI configuration */
struct SpiConfig{
  spi_bus_t bus = 0;
  uint8_t chip_select = 0;         // Bus-relative chip select (spidevB.C on Linux)
  gpio_pin_t sck_pin = 0;          // Pin assignments are ignored where the OS owns the bus
  gpio_pin_t mosi_pin = 0;
  gpio_pin_t miso_pin = 0;
  gpio_pin_t cs_pin = 0;
  uint32_t frequency = 1000000;    // 1 MHz default
  SpiMode mode = SpiMode::MODE_3;
  SpiBitOrder bit_order = SpiBitOrder::MSB_FIRST;
};

// ============================================================
// SPI Interface
// ============================================================

/** SPI Hardware Abstraction Interface
 *
 * Each write() and read() is one chip-select framed transfer.
 * Implementations do not retry; a failed transfer is reported
 * through the returned HalResult.
 */
class IHalSpi{
public:
  virtual ~IHalSpi() = default;

  /** Open the SPI channel
   * @param config SPI configuration
   * @return HalResult::OK on success, TRANSPORT_UNAVAILABLE if the bus cannot be opened
   */
  virtual HalResult init(const SpiConfig& config) = 0;

  /** Close the SPI channel
   * @return HalResult::OK on success, NOT_INITIALIZED if already closed
   */
  virtual HalResult deinit() = 0;

  /** Check if the channel is open
   * @return true if open
   */
  virtual bool isInitialized() const = 0;

  /** Write buffer (transmit only)
   * @param data Data buffer to write
   * @param length Number of bytes to write
   * @return HalResult::OK on success
   */
  virtual HalResult write(const uint8_t* data, size_t length) = 0;

  /** Read buffer (receive only)
   * @param buffer Buffer to store read data
   * @param length Number of bytes to read
   * @return HalResult::OK on success
   */
  virtual HalResult read(uint8_t* buffer, size_t length) = 0;
};

} // namespace adis::hal

#endif // ADIS_INCLUDE_HAL_IHAL_SPI_HPP_
