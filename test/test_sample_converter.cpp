/**
 * @file test_sample_converter.cpp
 * @brief Two's-complement decoding and unit scaling
 */

#include <gtest/gtest.h>

#include "Drivers/Adis16460/SampleConverter.hpp"

using namespace adis::driver;

namespace {

constexpr double kGravity = 9.80665;

AxisWord axisFromRaw(int32_t raw) {
    const uint32_t v = static_cast<uint32_t>(raw);
    return AxisWord{static_cast<uint8_t>(v >> 24), static_cast<uint8_t>(v >> 16),
                    static_cast<uint8_t>(v >> 8), static_cast<uint8_t>(v)};
}

} // namespace

TEST(SampleConverter, SixteenBitBoundaries) {
    EXPECT_EQ(SampleConverter::toSigned(RegisterWord{0x00, 0x00}), 0);
    EXPECT_EQ(SampleConverter::toSigned(RegisterWord{0x7F, 0xFF}), 32767);
    EXPECT_EQ(SampleConverter::toSigned(RegisterWord{0x80, 0x00}), -32768);
    EXPECT_EQ(SampleConverter::toSigned(RegisterWord{0xFF, 0xFF}), -1);
}

TEST(SampleConverter, ThirtyTwoBitBoundaries) {
    EXPECT_EQ(SampleConverter::toSigned(AxisWord{0x00, 0x00, 0x00, 0x01}), 1);
    EXPECT_EQ(SampleConverter::toSigned(AxisWord{0x7F, 0xFF, 0xFF, 0xFF}), 2147483647);
    EXPECT_EQ(SampleConverter::toSigned(AxisWord{0x80, 0x00, 0x00, 0x00}), INT32_MIN);
    EXPECT_EQ(SampleConverter::toSigned(AxisWord{0xFF, 0xFF, 0xFF, 0xFF}), -1);
    EXPECT_EQ(SampleConverter::toSigned(AxisWord{0x00, 0x01, 0x00, 0x00}), 65536);
}

TEST(SampleConverter, UnsupportedLengthYieldsZero) {
    const uint8_t bytes[3] = {0x12, 0x34, 0x56};
    EXPECT_EQ(SampleConverter::toSigned(bytes, 3), 0);
    EXPECT_EQ(SampleConverter::toSigned(bytes, 1), 0);
}

TEST(SampleConverter, DatasheetScaleFactors) {
    const ScaleFactors f = ScaleFactors::datasheet();
    EXPECT_DOUBLE_EQ(f.gyro_scale * 65536.0, 0.005);
    EXPECT_DOUBLE_EQ(f.accel_scale * 65536.0, 0.25 * kGravity / 1000.0);
}

TEST(SampleConverter, OneOutLsbScalesToDatasheetResolution) {
    SampleConverter converter;
    EXPECT_DOUBLE_EQ(converter.scaleGyro(65536), 0.005);
    EXPECT_DOUBLE_EQ(converter.scaleAccel(65536), 0.25 * kGravity / 1000.0);
    EXPECT_DOUBLE_EQ(converter.scaleGyro(-65536), -0.005);
}

TEST(SampleConverter, Temperature) {
    EXPECT_DOUBLE_EQ(SampleConverter::toTemperature(0), 25.0);
    EXPECT_DOUBLE_EQ(SampleConverter::toTemperature(-500), 0.0);
    EXPECT_DOUBLE_EQ(SampleConverter::toTemperature(100), 30.0);
}

TEST(SampleConverter, ConvertFullSample) {
    RawSample raw;
    raw.x_gyro = axisFromRaw(2 * 65536);
    raw.y_gyro = axisFromRaw(-65536);
    raw.z_gyro = axisFromRaw(0);
    raw.x_accel = axisFromRaw(4 * 65536);
    raw.y_accel = axisFromRaw(-4 * 65536);
    raw.z_accel = axisFromRaw(4000 * 65536);
    raw.temp = RegisterWord{0x00, 0x14};

    SampleConverter converter;
    const PhysicalSample s = converter.convert(raw);

    EXPECT_DOUBLE_EQ(s.x_gyro, 0.010);
    EXPECT_DOUBLE_EQ(s.y_gyro, -0.005);
    EXPECT_DOUBLE_EQ(s.z_gyro, 0.0);
    EXPECT_DOUBLE_EQ(s.x_accel, 1.0 * kGravity / 1000.0);
    EXPECT_DOUBLE_EQ(s.y_accel, -1.0 * kGravity / 1000.0);
    EXPECT_NEAR(s.z_accel, kGravity, 1e-9);
    EXPECT_DOUBLE_EQ(s.int_temp, 26.0);
}

TEST(SampleConverter, CustomFactors) {
    ScaleFactors f;
    f.gyro_scale = 2.0;
    f.accel_scale = 3.0;
    SampleConverter converter(f);

    EXPECT_DOUBLE_EQ(converter.scaleGyro(5), 10.0);
    EXPECT_DOUBLE_EQ(converter.scaleAccel(5), 15.0);
}
