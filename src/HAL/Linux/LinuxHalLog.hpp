/*****************************************************************
 * File:      LinuxHalLog.hpp
 * Category:  src/HAL/Linux
 *
 * Purpose:
 *    Linux implementation of HAL logging interface writing
 *    level-tagged lines to stderr.
 *****************************************************************/

#ifndef ADIS_SRC_HAL_LINUX_HAL_LOG_HPP_
#define ADIS_SRC_HAL_LINUX_HAL_LOG_HPP_

#include "HAL/IHalLog.hpp"

#include <chrono>
#include <mutex>
#include <stdarg.h>
#include <stdio.h>

namespace adis::hal::linux_{

/** Linux stderr Logger Implementation */
class LinuxHalLog : public IHalLog{
private:
  static constexpr size_t LOG_BUFFER_SIZE = 256;

  LogLevel level_ = LogLevel::INFO;
  char buffer_[LOG_BUFFER_SIZE];
  bool initialized_ = false;
  mutable std::mutex mutex_;
  std::chrono::steady_clock::time_point epoch_ = std::chrono::steady_clock::now();

  void printLog(LogLevel lvl, const char* tag, const char* format, va_list args){
    std::lock_guard<std::mutex> lock(mutex_);
    if(lvl > level_ || !initialized_) return;

    unsigned long ms = static_cast<unsigned long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - epoch_).count());
    int len = snprintf(buffer_, LOG_BUFFER_SIZE, "[%c][%lu][%s] ",
                       logLevelChar(lvl), ms, tag);

    if(len > 0 && len < (int)LOG_BUFFER_SIZE - 1){
      vsnprintf(buffer_ + len, LOG_BUFFER_SIZE - len, format, args);
    }

    fprintf(stderr, "%s\n", buffer_);
  }

public:
  LinuxHalLog() = default;

  HalResult init(LogLevel level = LogLevel::INFO) override{
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
    initialized_ = true;
    return HalResult::OK;
  }

  void setLevel(LogLevel level) override{
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
  }

  LogLevel getLevel() const override{
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
  }

  void error(const char* tag, const char* format, ...) override{
    va_list args;
    va_start(args, format);
    printLog(LogLevel::ERROR, tag, format, args);
    va_end(args);
  }

  void warn(const char* tag, const char* format, ...) override{
    va_list args;
    va_start(args, format);
    printLog(LogLevel::WARN, tag, format, args);
    va_end(args);
  }

  void info(const char* tag, const char* format, ...) override{
    va_list args;
    va_start(args, format);
    printLog(LogLevel::INFO, tag, format, args);
    va_end(args);
  }

  void debug(const char* tag, const char* format, ...) override{
    va_list args;
    va_start(args, format);
    printLog(LogLevel::DEBUG, tag, format, args);
    va_end(args);
  }

  void verbose(const char* tag, const char* format, ...) override{
    va_list args;
    va_start(args, format);
    printLog(LogLevel::VERBOSE, tag, format, args);
    va_end(args);
  }

  void logResult(HalResult result, const char* tag, const char* operation) override{
    if(result == HalResult::OK){
      info(tag, "%s: OK", operation);
    }else{
      error(tag, "%s: FAILED (%s)", operation, halResultToString(result));
    }
  }

  void flush() override{
    fflush(stderr);
  }
};

} // namespace adis::hal::linux_

#endif // ADIS_SRC_HAL_LINUX_HAL_LOG_HPP_
