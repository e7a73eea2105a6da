/*****************************************************************
 * File:      LinuxHalGpio.hpp
 * Category:  src/HAL/Linux
 *
 * Purpose:
 *    Linux implementation of the GPIO edge watcher using the
 *    GPIO character device (uAPI v2). Each subscription owns a
 *    line request fd and a watcher thread that blocks in poll()
 *    until an edge event or a stop request arrives.
 *****************************************************************/

#ifndef ADIS_SRC_HAL_LINUX_HAL_GPIO_HPP_
#define ADIS_SRC_HAL_LINUX_HAL_GPIO_HPP_

#include "HAL/IHalGpio.hpp"
#include "HAL/IHalLog.hpp"

#include <errno.h>
#include <fcntl.h>
#include <linux/gpio.h>
#include <poll.h>
#include <string.h>
#include <sys/eventfd.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>

namespace adis::hal::linux_{

/** Linux GPIO chardev Edge Watcher Implementation */
class LinuxHalEdgeWatcher : public IHalEdgeWatcher{
private:
  static constexpr const char* TAG = "GPIO";
  static constexpr const char* CONSUMER = "adis16460";
  static constexpr size_t EVENT_BATCH = 16;

  struct Subscription{
    gpio_pin_t pin = 0;
    int line_fd = -1;
    int stop_fd = -1;
    EdgeCallback callback;
    std::thread worker;
  };

  IHalLog* log_ = nullptr;
  const char* chip_path_;
  std::mutex mutex_;
  std::map<edge_handle_t, std::unique_ptr<Subscription>> subs_;
  edge_handle_t next_handle_ = 0;

  static uint64_t edgeFlags(GpioEdge edge){
    switch(edge){
      case GpioEdge::RISING:  return GPIO_V2_LINE_FLAG_EDGE_RISING;
      case GpioEdge::FALLING: return GPIO_V2_LINE_FLAG_EDGE_FALLING;
      case GpioEdge::BOTH:    return GPIO_V2_LINE_FLAG_EDGE_RISING | GPIO_V2_LINE_FLAG_EDGE_FALLING;
    }
    return 0;
  }

  void watch(Subscription* sub){
    struct pollfd fds[2];
    fds[0].fd = sub->line_fd;
    fds[0].events = POLLIN;
    fds[1].fd = sub->stop_fd;
    fds[1].events = POLLIN;

    struct gpio_v2_line_event events[EVENT_BATCH];

    while(true){
      fds[0].revents = 0;
      fds[1].revents = 0;

      int rc = ::poll(fds, 2, -1);
      if(rc < 0){
        if(errno == EINTR) continue;
        if(log_) log_->error(TAG, "poll on pin %d failed: %s", sub->pin, strerror(errno));
        return;
      }

      if(fds[1].revents & POLLIN) return;

      if(fds[0].revents & (POLLERR | POLLHUP)){
        if(log_) log_->error(TAG, "Line for pin %d closed unexpectedly", sub->pin);
        return;
      }

      if(fds[0].revents & POLLIN){
        ssize_t n = ::read(sub->line_fd, events, sizeof(events));
        if(n < 0){
          if(errno == EINTR || errno == EAGAIN) continue;
          if(log_) log_->error(TAG, "Event read on pin %d failed: %s", sub->pin, strerror(errno));
          return;
        }
        size_t count = static_cast<size_t>(n) / sizeof(events[0]);
        for(size_t i = 0; i < count; i++){
          sub->callback();
        }
      }
    }
  }

  void release(Subscription& sub){
    if(sub.worker.joinable()){
      uint64_t one = 1;
      if(::write(sub.stop_fd, &one, sizeof(one)) != (ssize_t)sizeof(one)){
        if(log_) log_->error(TAG, "Stop signal for pin %d failed: %s", sub.pin, strerror(errno));
      }
      sub.worker.join();
    }
    if(sub.line_fd >= 0) ::close(sub.line_fd);
    if(sub.stop_fd >= 0) ::close(sub.stop_fd);
    sub.line_fd = -1;
    sub.stop_fd = -1;
  }

public:
  explicit LinuxHalEdgeWatcher(IHalLog* log = nullptr, const char* chip_path = "/dev/gpiochip0")
    : log_(log), chip_path_(chip_path){}

  ~LinuxHalEdgeWatcher() override{
    std::map<edge_handle_t, std::unique_ptr<Subscription>> remaining;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      remaining.swap(subs_);
    }
    for(auto& entry : remaining){
      release(*entry.second);
    }
  }

  LinuxHalEdgeWatcher(const LinuxHalEdgeWatcher&) = delete;
  LinuxHalEdgeWatcher& operator=(const LinuxHalEdgeWatcher&) = delete;

  HalResult subscribe(gpio_pin_t pin, GpioEdge edge,
                      EdgeCallback callback, edge_handle_t* handle) override{
    if(!callback || !handle) return HalResult::INVALID_PARAM;

    int chip_fd = ::open(chip_path_, O_RDONLY | O_CLOEXEC);
    if(chip_fd < 0){
      if(log_) log_->error(TAG, "Cannot open %s: %s", chip_path_, strerror(errno));
      return HalResult::DEVICE_NOT_FOUND;
    }

    struct gpio_v2_line_request req;
    memset(&req, 0, sizeof(req));
    req.offsets[0] = pin;
    strncpy(req.consumer, CONSUMER, sizeof(req.consumer) - 1);
    req.config.flags = GPIO_V2_LINE_FLAG_INPUT | edgeFlags(edge);
    req.num_lines = 1;

    int rc = ioctl(chip_fd, GPIO_V2_GET_LINE_IOCTL, &req);
    int saved_errno = errno;
    ::close(chip_fd);
    if(rc < 0){
      if(log_) log_->error(TAG, "Line request for pin %d failed: %s", pin, strerror(saved_errno));
      return saved_errno == EBUSY ? HalResult::BUSY : HalResult::HARDWARE_FAULT;
    }

    int stop_fd = eventfd(0, EFD_CLOEXEC);
    if(stop_fd < 0){
      if(log_) log_->error(TAG, "eventfd failed: %s", strerror(errno));
      ::close(req.fd);
      return HalResult::NO_MEMORY;
    }

    auto sub = std::make_unique<Subscription>();
    sub->pin = pin;
    sub->line_fd = req.fd;
    sub->stop_fd = stop_fd;
    sub->callback = std::move(callback);
    Subscription* raw = sub.get();
    sub->worker = std::thread([this, raw](){ watch(raw); });

    {
      std::lock_guard<std::mutex> lock(mutex_);
      *handle = next_handle_++;
      subs_[*handle] = std::move(sub);
    }

    if(log_) log_->debug(TAG, "Watching pin %d (handle %d)", pin, *handle);
    return HalResult::OK;
  }

  HalResult unsubscribe(edge_handle_t handle) override{
    std::unique_ptr<Subscription> sub;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = subs_.find(handle);
      if(it == subs_.end()) return HalResult::INVALID_PARAM;
      sub = std::move(it->second);
      subs_.erase(it);
    }

    release(*sub);
    if(log_) log_->debug(TAG, "Released pin %d (handle %d)", sub->pin, handle);
    return HalResult::OK;
  }
};

} // namespace adis::hal::linux_

#endif // ADIS_SRC_HAL_LINUX_HAL_GPIO_HPP_
