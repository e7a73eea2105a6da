/*****************************************************************
 * File:      LinuxHal.hpp
 * Category:  src/HAL/Linux
 *
 * Purpose:
 *    Master header for the Linux HAL implementations used by
 *    the ADIS16460 driver (spidev SPI, GPIO chardev edges,
 *    steady_clock timer, stderr logging).
 *****************************************************************/

#ifndef ADIS_SRC_HAL_LINUX_HAL_HPP_
#define ADIS_SRC_HAL_LINUX_HAL_HPP_

// ============================================================
// Core HAL Implementations
// ============================================================
#include "LinuxHalLog.hpp"
#include "LinuxHalTimer.hpp"
#include "LinuxHalGpio.hpp"

// ============================================================
// Communication HAL Implementations
// ============================================================
#include "LinuxHalSpi.hpp"

namespace adis::hal::linux_{

/** Linux HAL Factory - creates the HAL instances for an IMU host
 *
 * Members are declared so that the logger outlives everything
 * that holds a pointer to it.
 */
struct LinuxHalFactory{
  // Core
  LinuxHalLog log;
  LinuxHalSystemTimer timer;
  LinuxHalEdgeWatcher edges;

  // Communication
  LinuxHalSpi spi;

  explicit LinuxHalFactory(const char* gpio_chip = "/dev/gpiochip0")
    : edges(&log, gpio_chip)
    , spi(&log)
  {}

  /** Initialize core HAL components */
  HalResult initCore(LogLevel level = LogLevel::INFO){
    return log.init(level);
  }
};

/** Convenience type aliases */
using HalFactory = LinuxHalFactory;
using HalLog = LinuxHalLog;
using HalTimer = LinuxHalSystemTimer;
using HalEdgeWatcher = LinuxHalEdgeWatcher;
using HalSpi = LinuxHalSpi;

} // namespace adis::hal::linux_

#endif // ADIS_SRC_HAL_LINUX_HAL_HPP_
