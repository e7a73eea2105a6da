/*****************************************************************
 * File:      Esp32HalGpio.hpp
 * Category:  src/HAL/ESP32
 *
 * Purpose:
 *    ESP32 implementation of the GPIO edge watcher using
 *    Arduino pin interrupts (attachInterruptArg).
 *****************************************************************/

#ifndef ADIS_SRC_HAL_ESP32_HAL_GPIO_HPP_
#define ADIS_SRC_HAL_ESP32_HAL_GPIO_HPP_

#include "HAL/IHalGpio.hpp"
#include "HAL/IHalLog.hpp"
#include <Arduino.h>
#include <utility>

namespace adis::hal::esp32{

/** ESP32 Edge Watcher Implementation
 *
 * Callbacks run in interrupt context; keep them to a flag store.
 * A slot is only reused after its interrupt has been detached.
 */
class Esp32HalEdgeWatcher : public IHalEdgeWatcher{
private:
  static constexpr const char* TAG = "GPIO";
  static constexpr uint8_t MAX_SUBSCRIPTIONS = 8;

  struct Slot{
    gpio_pin_t pin = 0;
    EdgeCallback callback;
    volatile bool active = false;
  };

  IHalLog* log_ = nullptr;
  Slot slots_[MAX_SUBSCRIPTIONS];

  static void IRAM_ATTR dispatch(void* arg){
    Slot* slot = static_cast<Slot*>(arg);
    if(slot->active && slot->callback){
      slot->callback();
    }
  }

  static int convertEdge(GpioEdge edge){
    switch(edge){
      case GpioEdge::RISING:  return RISING;
      case GpioEdge::FALLING: return FALLING;
      case GpioEdge::BOTH:    return CHANGE;
      default:                return RISING;
    }
  }

public:
  explicit Esp32HalEdgeWatcher(IHalLog* log = nullptr) : log_(log){}

  ~Esp32HalEdgeWatcher() override{
    for(edge_handle_t i = 0; i < MAX_SUBSCRIPTIONS; i++){
      if(slots_[i].active){
        unsubscribe(i);
      }
    }
  }

  HalResult subscribe(gpio_pin_t pin, GpioEdge edge,
                      EdgeCallback callback, edge_handle_t* handle) override{
    if(!callback || !handle) return HalResult::INVALID_PARAM;

    for(edge_handle_t i = 0; i < MAX_SUBSCRIPTIONS; i++){
      if(slots_[i].active) continue;

      slots_[i].pin = pin;
      slots_[i].callback = std::move(callback);
      slots_[i].active = true;

      ::pinMode(pin, INPUT);
      attachInterruptArg(digitalPinToInterrupt(pin), dispatch, &slots_[i], convertEdge(edge));

      *handle = i;
      if(log_) log_->debug(TAG, "Interrupt on pin %d (handle %d)", pin, i);
      return HalResult::OK;
    }

    if(log_) log_->error(TAG, "No free interrupt slots");
    return HalResult::NO_MEMORY;
  }

  HalResult unsubscribe(edge_handle_t handle) override{
    if(handle < 0 || handle >= MAX_SUBSCRIPTIONS || !slots_[handle].active){
      return HalResult::INVALID_PARAM;
    }

    Slot& slot = slots_[handle];
    detachInterrupt(digitalPinToInterrupt(slot.pin));
    slot.active = false;
    slot.callback = nullptr;

    if(log_) log_->debug(TAG, "Released pin %d (handle %d)", slot.pin, handle);
    return HalResult::OK;
  }
};

} // namespace adis::hal::esp32

#endif // ADIS_SRC_HAL_ESP32_HAL_GPIO_HPP_
