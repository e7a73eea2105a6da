/*****************************************************************
 * File:      IHalTimer.hpp
 * Category:  include/HAL
 *
 * Purpose:
 *    Timer Hardware Abstraction Layer interface.
 *    Provides platform-independent monotonic timestamps and
 *    blocking delays.
 *****************************************************************/

#ifndef ADIS_INCLUDE_HAL_IHAL_TIMER_HPP_
#define ADIS_INCLUDE_HAL_IHAL_TIMER_HPP_

#include "HalTypes.hpp"

namespace adis::hal{

// ============================================================
// System Timer Interface
// ============================================================

/** System Timer Hardware Abstraction Interface
 *
 * Both counters are monotonic and never go backwards.
 */
class IHalSystemTimer{
public:
  virtual ~IHalSystemTimer() = default;

  /** Get milliseconds since boot
   * @return Milliseconds since system start
   */
  virtual timestamp_ms_t millis() const = 0;

  /** Get microseconds since boot
   * @return Microseconds since system start
   */
  virtual timestamp_us_t micros() const = 0;

  /** Delay for specified milliseconds (blocking)
   * @param ms Milliseconds to delay
   */
  virtual void delayMs(uint32_t ms) = 0;

  /** Delay for specified microseconds (blocking)
   * @param us Microseconds to delay
   */
  virtual void delayUs(uint32_t us) = 0;
};

} // namespace adis::hal

#endif // ADIS_INCLUDE_HAL_IHAL_TIMER_HPP_
