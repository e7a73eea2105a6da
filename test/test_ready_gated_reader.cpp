/**
 * @file test_ready_gated_reader.cpp
 * @brief Data-ready gating, read ordering and product ID check
 */

#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "MockHal.hpp"
#include "Drivers/Adis16460/ReadyGatedReader.hpp"

using namespace adis;
using namespace adis::driver;
using adis::hal::HalResult;
using adis::test::CaptureLog;
using adis::test::ManualClock;
using adis::test::ManualEdgeWatcher;
using adis::test::ScriptedSpi;

namespace {

constexpr hal::gpio_pin_t kDrPin = 25;

const std::vector<uint16_t> kSampleSequence = {
    reg::DIAG_STAT,
    reg::X_GYRO_OUT, reg::X_GYRO_LOW,
    reg::Y_GYRO_OUT, reg::Y_GYRO_LOW,
    reg::Z_GYRO_OUT, reg::Z_GYRO_LOW,
    reg::X_ACCL_OUT, reg::X_ACCL_LOW,
    reg::Y_ACCL_OUT, reg::Y_ACCL_LOW,
    reg::Z_ACCL_OUT, reg::Z_ACCL_LOW,
    reg::TEMP_OUT,
};

class ReadyGatedReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(spi.init(hal::SpiConfig{}), HalResult::OK);
        spi.registers[reg::DIAG_STAT] = 0x0040;
        spi.registers[reg::X_GYRO_OUT] = 0x0001;
        spi.registers[reg::Z_ACCL_OUT] = 0x0FA0;
        spi.registers[reg::TEMP_OUT] = 0x0014;
        spi.registers[reg::PROD_ID] = reg::PROD_ID_VALUE;
    }

    ScriptedSpi spi;
    ManualEdgeWatcher edges;
    ManualClock clock;
    CaptureLog log;
    SampleConverter converter;
    RegisterProtocol protocol{&spi, &log};
    ReadyGatedReader reader{protocol, converter, &clock, &log};
};

} // namespace

TEST_F(ReadyGatedReaderTest, SequenceCoversEveryRegister) {
    EXPECT_EQ(kSampleSequence.size(), static_cast<size_t>(reg::SAMPLE_READ_COUNT));
}

TEST_F(ReadyGatedReaderTest, AttachSubscribesToRisingEdge) {
    ASSERT_EQ(reader.attach(&edges, kDrPin), HalResult::OK);
    EXPECT_TRUE(reader.isAttached());
    EXPECT_TRUE(edges.subscribed(kDrPin, hal::GpioEdge::RISING));
}

TEST_F(ReadyGatedReaderTest, AttachTwiceIsRejected) {
    ASSERT_EQ(reader.attach(&edges, kDrPin), HalResult::OK);
    EXPECT_EQ(reader.attach(&edges, kDrPin), HalResult::ALREADY_INITIALIZED);
    EXPECT_EQ(edges.activeCount(), 1u);
}

TEST_F(ReadyGatedReaderTest, SubscribeFailurePropagates) {
    edges.subscribe_result = HalResult::BUSY;
    EXPECT_EQ(reader.attach(&edges, kDrPin), HalResult::BUSY);
    EXPECT_FALSE(reader.isAttached());
}

TEST_F(ReadyGatedReaderTest, PollWithoutEdgeDoesNothing) {
    ASSERT_EQ(reader.attach(&edges, kDrPin), HalResult::OK);

    ImuReading latest;
    bool captured = true;
    EXPECT_EQ(reader.poll(latest, &captured), HalResult::OK);
    EXPECT_FALSE(captured);
    EXPECT_TRUE(spi.words.empty());
    EXPECT_EQ(spi.read_count, 0);
}

TEST_F(ReadyGatedReaderTest, EdgeTriggersOneFullReadInOrder) {
    ASSERT_EQ(reader.attach(&edges, kDrPin), HalResult::OK);
    edges.fire(kDrPin);
    EXPECT_TRUE(reader.isReady());

    ImuReading latest;
    bool captured = false;
    ASSERT_EQ(reader.poll(latest, &captured), HalResult::OK);
    EXPECT_TRUE(captured);
    EXPECT_FALSE(reader.isReady());

    EXPECT_EQ(spi.words, kSampleSequence);
    EXPECT_EQ(spi.read_count, static_cast<int>(kSampleSequence.size()));
    EXPECT_EQ(reader.sampleCount(), 1u);
}

TEST_F(ReadyGatedReaderTest, EdgesBetweenPollsCollapse) {
    ASSERT_EQ(reader.attach(&edges, kDrPin), HalResult::OK);
    edges.fire(kDrPin);
    edges.fire(kDrPin);

    ImuReading latest;
    bool captured = false;
    ASSERT_EQ(reader.poll(latest, &captured), HalResult::OK);
    EXPECT_TRUE(captured);
    ASSERT_EQ(reader.poll(latest, &captured), HalResult::OK);
    EXPECT_FALSE(captured);

    EXPECT_EQ(spi.words.size(), kSampleSequence.size());
    EXPECT_EQ(reader.sampleCount(), 1u);
}

TEST_F(ReadyGatedReaderTest, ReadingCarriesConvertedValues) {
    clock.now_us = 123456;
    ASSERT_EQ(reader.attach(&edges, kDrPin), HalResult::OK);
    edges.fire(kDrPin);

    ImuReading latest;
    ASSERT_EQ(reader.poll(latest), HalResult::OK);

    EXPECT_EQ(latest.diag_stat, 0x0040);
    EXPECT_EQ(latest.timestamp_us, 123456u);
    EXPECT_DOUBLE_EQ(latest.sample.x_gyro, 0.005);
    EXPECT_DOUBLE_EQ(latest.sample.y_gyro, 0.0);
    EXPECT_NEAR(latest.sample.z_accel, 9.80665, 1e-9);
    EXPECT_DOUBLE_EQ(latest.sample.int_temp, 26.0);
}

TEST_F(ReadyGatedReaderTest, MidSequenceFailureLeavesLatestUntouched) {
    ASSERT_EQ(reader.attach(&edges, kDrPin), HalResult::OK);
    edges.fire(kDrPin);
    spi.fail_read_at = 5;
    spi.fail_result = HalResult::READ_FAILED;

    ImuReading latest;
    latest.diag_stat = 0xBEEF;
    latest.timestamp_us = 42;
    bool captured = true;

    EXPECT_EQ(reader.poll(latest, &captured), HalResult::READ_FAILED);
    EXPECT_FALSE(captured);
    EXPECT_EQ(latest.diag_stat, 0xBEEF);
    EXPECT_EQ(latest.timestamp_us, 42u);
    EXPECT_EQ(reader.sampleCount(), 0u);
    EXPECT_FALSE(reader.isReady());
}

TEST_F(ReadyGatedReaderTest, DetachStopsCallbacks) {
    ASSERT_EQ(reader.attach(&edges, kDrPin), HalResult::OK);
    ASSERT_EQ(reader.detach(), HalResult::OK);
    EXPECT_FALSE(reader.isAttached());
    EXPECT_EQ(edges.activeCount(), 0u);

    edges.fire(kDrPin);
    EXPECT_FALSE(reader.isReady());
    EXPECT_EQ(reader.detach(), HalResult::NOT_INITIALIZED);
}

TEST_F(ReadyGatedReaderTest, DestructorReleasesSubscription) {
    {
        ReadyGatedReader scoped(protocol, converter, &clock, &log);
        ASSERT_EQ(scoped.attach(&edges, kDrPin), HalResult::OK);
        EXPECT_EQ(edges.activeCount(), 1u);
    }
    EXPECT_EQ(edges.activeCount(), 0u);
}

TEST_F(ReadyGatedReaderTest, ReadyFlagFromAnotherThread) {
    ASSERT_EQ(reader.attach(&edges, kDrPin), HalResult::OK);
    std::thread isr([this]() { edges.fire(kDrPin); });
    isr.join();

    ImuReading latest;
    bool captured = false;
    ASSERT_EQ(reader.poll(latest, &captured), HalResult::OK);
    EXPECT_TRUE(captured);
}

TEST_F(ReadyGatedReaderTest, ProductIdMatches) {
    uint16_t id = 0;
    EXPECT_EQ(reader.checkProductId(id), HalResult::OK);
    EXPECT_EQ(id, reg::PROD_ID_VALUE);
    EXPECT_EQ(spi.words, std::vector<uint16_t>{reg::PROD_ID});
}

TEST_F(ReadyGatedReaderTest, ProductIdMismatchIsHardwareFault) {
    spi.registers[reg::PROD_ID] = 0x1234;
    uint16_t id = 0;
    EXPECT_EQ(reader.checkProductId(id), HalResult::HARDWARE_FAULT);
    EXPECT_EQ(id, 0x1234);
    EXPECT_EQ(log.count(hal::LogLevel::ERROR, "PROD_ID"), 1);
}
