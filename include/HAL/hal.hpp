/*****************************************************************
 * File:      hal.hpp
 * Category:  include/HAL
 *
 * Purpose:
 *    Master HAL header that includes all HAL interfaces used by
 *    the ADIS16460 driver.
 *
 * Architecture:
 *    HAL Layer (this) -> Driver Layer -> Application
 *
 *    The driver layer MUST NOT use platform-specific code. Backend
 *    implementations live in src/HAL/<Platform>/ and are injected
 *    at construction time.
 *
 * Usage:
 *    #include "HAL/hal.hpp"
 *
 *    adis::driver::ImuDriver imu(&spi, &edges, &timer, &log);
 *****************************************************************/

#ifndef ADIS_INCLUDE_HAL_HAL_HPP_
#define ADIS_INCLUDE_HAL_HAL_HPP_

// ============================================================
// Core Type Definitions
// ============================================================
#include "HalTypes.hpp"

// ============================================================
// Logging
// ============================================================
#include "IHalLog.hpp"

// ============================================================
// Communication Interfaces
// ============================================================
#include "IHalSpi.hpp"       // SPI channel
#include "IHalGpio.hpp"      // GPIO edge events

// ============================================================
// System Interfaces
// ============================================================
#include "IHalTimer.hpp"     // Monotonic clock and delays

#endif // ADIS_INCLUDE_HAL_HAL_HPP_
