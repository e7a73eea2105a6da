/*****************************************************************
 * File:      IHalGpio.hpp
 * Category:  include/HAL
 *
 * Purpose:
 *    GPIO Hardware Abstraction Layer interface.
 *    Provides platform-independent edge-event subscriptions
 *    used for interrupt-style signals such as a sensor's
 *    data-ready line.
 *****************************************************************/

#ifndef ADIS_INCLUDE_HAL_IHAL_GPIO_HPP_
#define ADIS_INCLUDE_HAL_IHAL_GPIO_HPP_

#include "HalTypes.hpp"
#include <functional>

namespace adis::hal{

// ============================================================
// Edge Callback Type
// ============================================================

/** Edge callback function type
 *
 * Invoked from an asynchronous context (ISR or watcher thread).
 * Keep it short and non-blocking.
 */
using EdgeCallback = std::function<void()>;

/** Subscription handle returned by subscribe() */
using edge_handle_t = int32_t;

/** Handle value that never refers to a live subscription */
constexpr edge_handle_t INVALID_EDGE_HANDLE = -1;

// ============================================================
// Edge Watcher Interface
// ============================================================

/** GPIO Edge Watcher Hardware Abstraction Interface
 *
 * Delivers a callback for every matching edge on a pin.
 * After unsubscribe() returns, the callback of that
 * subscription is guaranteed not to run again.
 */
class IHalEdgeWatcher{
public:
  virtual ~IHalEdgeWatcher() = default;

  /** Subscribe to edge events on a pin
   * @param pin GPIO pin number
   * @param edge Edge(s) that trigger the callback
   * @param callback Function to call on each edge
   * @param handle Receives the subscription handle
   * @return HalResult::OK on success
   */
  virtual HalResult subscribe(gpio_pin_t pin, GpioEdge edge,
                              EdgeCallback callback, edge_handle_t* handle) = 0;

  /** Cancel a subscription
   * @param handle Handle returned by subscribe()
   * @return HalResult::OK on success, INVALID_PARAM for unknown handles
   */
  virtual HalResult unsubscribe(edge_handle_t handle) = 0;
};

} // namespace adis::hal

#endif // ADIS_INCLUDE_HAL_IHAL_GPIO_HPP_
