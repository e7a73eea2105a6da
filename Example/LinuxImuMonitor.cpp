/*****************************************************************
 * File:      LinuxImuMonitor.cpp
 * Category:  Example (Linux host)
 *
 * Purpose:
 *    Brings up an ADIS16460 on /dev/spidev0.0 with its DR line
 *    on /dev/gpiochip0 line 25, samples at ~30 Hz with a 4-tap
 *    filter for five seconds and logs every sample.
 *
 * Usage:
 *    adis_imu_monitor [gpiochip] [seconds]
 *****************************************************************/

#include <stdlib.h>

#include "HAL/hal.hpp"
#include "HAL/Linux/LinuxHal.hpp"
#include "Drivers/Adis16460/ImuDriver.hpp"

using namespace adis::hal;
using namespace adis::hal::linux_;
using adis::driver::ImuDriver;
using adis::driver::ImuDriverConfig;

static constexpr const char* TAG = "MONITOR";

int main(int argc, char** argv){
  const char* chip = argc > 1 ? argv[1] : "/dev/gpiochip0";
  uint32_t run_ms = argc > 2 ? static_cast<uint32_t>(atoi(argv[2])) * 1000u : 5000u;

  LinuxHalFactory board(chip);
  if(board.initCore(LogLevel::DEBUG) != HalResult::OK){
    return 1;
  }

  ImuDriverConfig config;
  config.sample_rate_hz = 30.0;
  config.taps = 4;
  config.data_ready_pin = 25;
  config.debug = true;

  ImuDriver imu(&board.spi, &board.edges, &board.timer, &board.log);

  HalResult result = imu.init(config);
  if(result != HalResult::OK){
    board.log.error(TAG, "IMU init failed (%s)", halResultToString(result));
    return 1;
  }

  uint16_t id = 0;
  if(imu.readProductId(id) == HalResult::OK){
    board.log.debug(TAG, "PROD_ID 0x%04X", id);
  }

  uint32_t captured = 0;
  timestamp_ms_t start = board.timer.millis();
  while(board.timer.millis() - start < run_ms){
    bool fresh = false;
    result = imu.poll(&fresh);
    if(isTransportError(result)){
      board.log.warn(TAG, "Sample dropped (%s)", halResultToString(result));
    }else if(result != HalResult::OK){
      board.log.error(TAG, "Poll failed (%s)", halResultToString(result));
      break;
    }else if(fresh){
      captured++;
    }
    board.timer.delayMs(1);
  }

  board.log.info(TAG, "%u samples in %u ms (%.2f Hz configured)",
               captured, run_ms, imu.effectiveSampleRate());

  result = imu.deinit();
  board.log.flush();
  return result == HalResult::OK ? 0 : 1;
}
