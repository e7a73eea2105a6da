/*****************************************************************
 * File:      Esp32HalTimer.hpp
 * Category:  src/HAL/ESP32
 *
 * Purpose:
 *    ESP32 implementation of HAL timer interface using
 *    Arduino timing functions.
 *****************************************************************/

#ifndef ADIS_SRC_HAL_ESP32_HAL_TIMER_HPP_
#define ADIS_SRC_HAL_ESP32_HAL_TIMER_HPP_

#include "HAL/IHalTimer.hpp"
#include <Arduino.h>
#include <esp_timer.h>

namespace adis::hal::esp32{

/** ESP32 System Timer Implementation
 *
 * micros() uses the 64-bit esp_timer so it does not wrap
 * after ~71 minutes like Arduino's 32-bit micros().
 */
class Esp32HalSystemTimer : public IHalSystemTimer{
public:
  Esp32HalSystemTimer() = default;

  timestamp_ms_t millis() const override{
    return ::millis();
  }

  timestamp_us_t micros() const override{
    return static_cast<timestamp_us_t>(esp_timer_get_time());
  }

  void delayMs(uint32_t ms) override{
    ::delay(ms);
  }

  void delayUs(uint32_t us) override{
    ::delayMicroseconds(us);
  }
};

} // namespace adis::hal::esp32

#endif // ADIS_SRC_HAL_ESP32_HAL_TIMER_HPP_
