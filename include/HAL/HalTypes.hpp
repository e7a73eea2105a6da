/*****************************************************************
 * File:      HalTypes.hpp
 * Category:  include/HAL
 *
 * Purpose:
 *    Common type definitions for the HAL API used by the
 *    ADIS16460 driver. These types are platform-independent and
 *    shared by every HAL interface and backend.
 *****************************************************************/

#ifndef ADIS_INCLUDE_HAL_HAL_TYPES_HPP_
#define ADIS_INCLUDE_HAL_HAL_TYPES_HPP_

#include <stdint.h>
#include <stddef.h>

namespace adis::hal{

// ============================================================
// Result Types
// ============================================================

/** HAL operation result codes */
enum class HalResult : uint8_t{
  OK = 0,                 // Operation successful
  ERROR,                  // Generic error
  TIMEOUT,                // Operation timed out
  BUSY,                   // Resource is busy
  INVALID_PARAM,          // Invalid parameter
  NOT_INITIALIZED,        // Module not initialized
  NOT_SUPPORTED,          // Feature not supported
  HARDWARE_FAULT,         // Hardware fault detected
  ALREADY_INITIALIZED,    // Already initialized
  INVALID_STATE,          // Invalid state for operation
  NO_MEMORY,              // Memory allocation failed
  DEVICE_NOT_FOUND,       // Device not found
  READ_FAILED,            // Read operation failed
  WRITE_FAILED,           // Write operation failed
  TRANSPORT_UNAVAILABLE   // Bus could not be opened
};

/** True for results raised by a failed bus transaction */
inline bool isTransportError(HalResult result){
  switch(result){
    case HalResult::ERROR:
    case HalResult::TIMEOUT:
    case HalResult::BUSY:
    case HalResult::READ_FAILED:
    case HalResult::WRITE_FAILED:
      return true;
    default:
      return false;
  }
}

// ============================================================
// Time Types
// ============================================================

/** Timestamp in milliseconds since boot */
using timestamp_ms_t = uint32_t;

/** Timestamp in microseconds since boot (monotonic) */
using timestamp_us_t = uint64_t;

// ============================================================
// GPIO Types
// ============================================================

/** GPIO pin number type */
using gpio_pin_t = uint8_t;

/** GPIO edge selection for event subscriptions */
enum class GpioEdge : uint8_t{
  RISING,
  FALLING,
  BOTH
};

// ============================================================
// Communication Types
// ============================================================

/** SPI bus number */
using spi_bus_t = uint8_t;

} // namespace adis::hal

#endif // ADIS_INCLUDE_HAL_HAL_TYPES_HPP_
