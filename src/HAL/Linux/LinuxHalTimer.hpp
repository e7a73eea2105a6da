/*****************************************************************
 * File:      LinuxHalTimer.hpp
 * Category:  src/HAL/Linux
 *
 * Purpose:
 *    Linux implementation of HAL timer interface using
 *    std::chrono::steady_clock.
 *****************************************************************/

#ifndef ADIS_SRC_HAL_LINUX_HAL_TIMER_HPP_
#define ADIS_SRC_HAL_LINUX_HAL_TIMER_HPP_

#include "HAL/IHalTimer.hpp"

#include <chrono>
#include <thread>

namespace adis::hal::linux_{

/** Linux System Timer Implementation
 *
 * Counts from construction, like millis()/micros() count from boot.
 */
class LinuxHalSystemTimer : public IHalSystemTimer{
private:
  using Clock = std::chrono::steady_clock;
  Clock::time_point epoch_ = Clock::now();

public:
  LinuxHalSystemTimer() = default;

  timestamp_ms_t millis() const override{
    return static_cast<timestamp_ms_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - epoch_).count());
  }

  timestamp_us_t micros() const override{
    return static_cast<timestamp_us_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - epoch_).count());
  }

  void delayMs(uint32_t ms) override{
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
  }

  void delayUs(uint32_t us) override{
    std::this_thread::sleep_for(std::chrono::microseconds(us));
  }
};

} // namespace adis::hal::linux_

#endif // ADIS_SRC_HAL_LINUX_HAL_TIMER_HPP_
