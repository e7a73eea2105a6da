/*****************************************************************
 * File:      main.cpp
 * Category:  Main Application (ADIS16460 Monitor)
 *
 * Purpose:
 *    ESP32 application that brings up an ADIS16460 over SPI,
 *    arms its data-ready interrupt and streams samples to the
 *    serial console.
 *
 * Hardware:
 *    - ESP32 (VSPI)
 *    - SPI: SCK=GPIO18, MISO=GPIO19, MOSI=GPIO23, CS=GPIO5
 *    - ADIS16460 DR: GPIO25
 *****************************************************************/

#include <Arduino.h>
#include "HAL/hal.hpp"
#include "HAL/ESP32/Esp32Hal.hpp"
#include "Drivers/Adis16460/ImuDriver.hpp"

using namespace adis::hal;
using namespace adis::hal::esp32;
using adis::driver::ImuDriver;
using adis::driver::ImuDriverConfig;
using adis::driver::PhysicalSample;

// ============================================================
// HAL Instances
// ============================================================

Esp32HalFactory board;
ImuDriver imu(&board.spi, &board.edges, &board.timer, &board.log);

// ============================================================
// Application State
// ============================================================

static constexpr const char* TAG = "MAIN";
static constexpr uint32_t REPORT_INTERVAL_MS = 1000;

bool imu_ok = false;
uint32_t last_report = 0;
uint32_t samples_since_report = 0;

// ============================================================
// Arduino Entry Points
// ============================================================

void setup(){
  Serial.begin(115200);
  delay(2000);

  if(board.initCore(LogLevel::INFO) != HalResult::OK){
    Serial.println("Logger init failed");
  }
  board.log.info(TAG, "ADIS16460 monitor starting");

  ImuDriverConfig config;
  config.sample_rate_hz = 30.0;
  config.taps = 4;
  config.data_ready_pin = 25;
  config.spi.sck_pin = 18;
  config.spi.miso_pin = 19;
  config.spi.mosi_pin = 23;
  config.spi.cs_pin = 5;
  config.verify_product_id = true;

  HalResult result = imu.init(config);
  imu_ok = (result == HalResult::OK);
  if(!imu_ok){
    board.log.error(TAG, "IMU unavailable (%s)", halResultToString(result));
    return;
  }

  board.log.info(TAG, "Output rate %.2f Hz", imu.effectiveSampleRate());
  last_report = board.timer.millis();
}

void loop(){
  if(!imu_ok){
    delay(1000);
    return;
  }

  bool fresh = false;
  HalResult result = imu.poll(&fresh);
  if(result != HalResult::OK){
    board.log.warn(TAG, "Poll failed (%s)", halResultToString(result));
  }else if(fresh){
    samples_since_report++;
  }

  uint32_t now = board.timer.millis();
  if(now - last_report >= REPORT_INTERVAL_MS){
    last_report = now;
    PhysicalSample s = imu.latest();
    board.log.info(TAG, "%lu samples | gyro %.3f %.3f %.3f | accel %.1f %.1f %.1f | %.2f C",
                 (unsigned long)samples_since_report,
                 s.x_gyro, s.y_gyro, s.z_gyro, s.x_accel, s.y_accel, s.z_accel, s.int_temp);
    samples_since_report = 0;
  }

  delay(1);
}
