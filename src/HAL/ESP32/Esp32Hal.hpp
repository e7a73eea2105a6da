/*****************************************************************
 * File:      Esp32Hal.hpp
 * Category:  src/HAL/ESP32
 *
 * Purpose:
 *    Master header for the ESP32 HAL implementations used by
 *    the ADIS16460 driver.
 *****************************************************************/

#ifndef ADIS_SRC_HAL_ESP32_HAL_HPP_
#define ADIS_SRC_HAL_ESP32_HAL_HPP_

// ============================================================
// Core HAL Implementations
// ============================================================
#include "Esp32HalLog.hpp"
#include "Esp32HalTimer.hpp"
#include "Esp32HalGpio.hpp"

// ============================================================
// Communication HAL Implementations
// ============================================================
#include "Esp32HalSpi.hpp"

namespace adis::hal::esp32{

/** ESP32 HAL Factory - creates the HAL instances for an IMU node */
struct Esp32HalFactory{
  // Core
  Esp32HalLog log;
  Esp32HalSystemTimer timer;
  Esp32HalEdgeWatcher edges;

  // Communication
  Esp32HalSpi spi;

  Esp32HalFactory()
    : edges(&log)
    , spi(&log)
  {}

  /** Initialize core HAL components */
  HalResult initCore(LogLevel level = LogLevel::DEBUG){
    return log.init(level);
  }
};

/** Convenience type aliases */
using HalFactory = Esp32HalFactory;
using HalLog = Esp32HalLog;
using HalTimer = Esp32HalSystemTimer;
using HalEdgeWatcher = Esp32HalEdgeWatcher;
using HalSpi = Esp32HalSpi;

} // namespace adis::hal::esp32

#endif // ADIS_SRC_HAL_ESP32_HAL_HPP_
