/*****************************************************************
 * File:      Esp32HalLog.hpp
 * Category:  src/HAL/ESP32
 *
 * Purpose:
 *    ESP32 implementation of HAL logging interface using
 *    Arduino Serial for output. Lines are formatted as
 *    [level][millis][tag] message; errors are flushed at once.
 *****************************************************************/

#ifndef ADIS_SRC_HAL_ESP32_HAL_LOG_HPP_
#define ADIS_SRC_HAL_ESP32_HAL_LOG_HPP_

#include "HAL/IHalLog.hpp"
#include <Arduino.h>
#include <stdarg.h>
#include <stdio.h>

namespace adis::hal::esp32{

/** ESP32 Serial Logger Implementation */
class Esp32HalLog : public IHalLog{
private:
  static constexpr size_t LOG_BUFFER_SIZE = 256;

  LogLevel level_ = LogLevel::INFO;
  char buffer_[LOG_BUFFER_SIZE];
  bool initialized_ = false;

  void printLog(LogLevel lvl, const char* tag, const char* format, va_list args){
    if(lvl > level_ || !initialized_) return;

    unsigned long ms = millis();
    int len = snprintf(buffer_, LOG_BUFFER_SIZE, "[%c][%lu][%s] ",
                       logLevelChar(lvl), ms, tag);

    if(len > 0 && len < (int)LOG_BUFFER_SIZE - 1){
      vsnprintf(buffer_ + len, LOG_BUFFER_SIZE - len, format, args);
    }

    Serial.println(buffer_);
    if(lvl == LogLevel::ERROR){
      Serial.flush();
    }
  }

public:
  Esp32HalLog() = default;

  Esp32HalLog(const Esp32HalLog&) = delete;
  Esp32HalLog& operator=(const Esp32HalLog&) = delete;

  HalResult init(LogLevel level = LogLevel::INFO) override{
    level_ = level;
    initialized_ = true;
    return HalResult::OK;
  }

  void setLevel(LogLevel level) override{
    level_ = level;
  }

  LogLevel getLevel() const override{
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
    Serial.flush();
  }
};

} // namespace adis::hal::esp32

#endif // ADIS_SRC_HAL_ESP32_HAL_LOG_HPP_
