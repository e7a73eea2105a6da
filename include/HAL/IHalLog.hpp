/*****************************************************************
 * File:      IHalLog.hpp
 * Category:  include/HAL
 *
 * Purpose:
 *    Logging Hardware Abstraction Layer interface.
 *    Provides platform-independent, level-filtered logging for
 *    the HAL backends and the driver layer.
 *****************************************************************/

#ifndef ADIS_INCLUDE_HAL_IHAL_LOG_HPP_
#define ADIS_INCLUDE_HAL_IHAL_LOG_HPP_

#include "HalTypes.hpp"

namespace adis::hal{

// ============================================================
// Log Levels
// ============================================================

/** Log severity levels */
enum class LogLevel : uint8_t{
  NONE = 0,     // No logging
  ERROR = 1,    // Errors only
  WARN = 2,     // Warnings and errors
  INFO = 3,     // Info, warnings, errors
  DEBUG = 4,    // Debug and above
  VERBOSE = 5   // All messages
};

// ============================================================
// Log Interface
// ============================================================

/** Logging Hardware Abstraction Interface
 *
 * Implementations can output to a serial port, stderr, a file, etc.
 * Components hold an optional IHalLog* and skip logging when null.
 */
class IHalLog{
public:
  virtual ~IHalLog() = default;

  /** Initialize logging system
   * @param level Minimum log level to output
   * @return HalResult::OK on success
   */
  virtual HalResult init(LogLevel level = LogLevel::INFO) = 0;

  /** Set log level
   * @param level New log level
   */
  virtual void setLevel(LogLevel level) = 0;

  /** Get current log level
   * @return Current log level
   */
  virtual LogLevel getLevel() const = 0;

  /** Log error message
   * @param tag Module tag
   * @param format Printf-style format string
   * @param ... Format arguments
   */
  virtual void error(const char* tag, const char* format, ...) = 0;

  /** Log warning message */
  virtual void warn(const char* tag, const char* format, ...) = 0;

  /** Log info message */
  virtual void info(const char* tag, const char* format, ...) = 0;

  /** Log debug message */
  virtual void debug(const char* tag, const char* format, ...) = 0;

  /** Log verbose message */
  virtual void verbose(const char* tag, const char* format, ...) = 0;

  /** Log HalResult with context
   * @param result Result code to log
   * @param tag Module tag
   * @param operation Description of operation
   */
  virtual void logResult(HalResult result, const char* tag, const char* operation) = 0;

  /** Flush log buffer (if buffered)
   */
  virtual void flush() = 0;
};

// ============================================================
// Helper Functions
// ============================================================

/** Convert HalResult to string
 * @param result HalResult code
 * @return String representation
 */
inline const char* halResultToString(HalResult result){
  switch(result){
    case HalResult::OK:                    return "OK";
    case HalResult::ERROR:                 return "ERROR";
    case HalResult::TIMEOUT:               return "TIMEOUT";
    case HalResult::BUSY:                  return "BUSY";
    case HalResult::INVALID_PARAM:         return "INVALID_PARAM";
    case HalResult::NOT_INITIALIZED:       return "NOT_INITIALIZED";
    case HalResult::NOT_SUPPORTED:         return "NOT_SUPPORTED";
    case HalResult::HARDWARE_FAULT:        return "HARDWARE_FAULT";
    case HalResult::ALREADY_INITIALIZED:   return "ALREADY_INITIALIZED";
    case HalResult::INVALID_STATE:         return "INVALID_STATE";
    case HalResult::NO_MEMORY:             return "NO_MEMORY";
    case HalResult::DEVICE_NOT_FOUND:      return "DEVICE_NOT_FOUND";
    case HalResult::READ_FAILED:           return "READ_FAILED";
    case HalResult::WRITE_FAILED:          return "WRITE_FAILED";
    case HalResult::TRANSPORT_UNAVAILABLE: return "TRANSPORT_UNAVAILABLE";
    default:                               return "UNKNOWN";
  }
}

/** Get log level prefix character
 * @param level LogLevel
 * @return Single character prefix
 */
inline char logLevelChar(LogLevel level){
  switch(level){
    case LogLevel::ERROR:   return 'E';
    case LogLevel::WARN:    return 'W';
    case LogLevel::INFO:    return 'I';
    case LogLevel::DEBUG:   return 'D';
    case LogLevel::VERBOSE: return 'V';
    default:                return '?';
  }
}

} // namespace adis::hal

#endif // ADIS_INCLUDE_HAL_IHAL_LOG_HPP_
