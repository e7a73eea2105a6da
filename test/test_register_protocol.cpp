/**
 * @file test_register_protocol.cpp
 * @brief RegisterProtocol framing and read sequencing
 */

#include <gtest/gtest.h>

#include <vector>

#include "HAL/hal.hpp"
#include "MockHal.hpp"
#include "Drivers/Adis16460/RegisterProtocol.hpp"

using namespace adis;
using namespace adis::driver;
using adis::hal::HalResult;
using adis::test::ScriptedSpi;

namespace {

class RegisterProtocolTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(spi.init(hal::SpiConfig{}), HalResult::OK);
    }

    ScriptedSpi spi;
    RegisterProtocol protocol{&spi};
};

} // namespace

TEST_F(RegisterProtocolTest, WriteCommandSendsOneBigEndianFrame) {
    ASSERT_EQ(protocol.writeCommand(0xB604), HalResult::OK);

    ASSERT_EQ(spi.words.size(), 1u);
    EXPECT_EQ(spi.words[0], 0xB604);
    EXPECT_EQ(spi.frame_sizes[0], 2u);
    EXPECT_EQ(spi.read_count, 0);
}

TEST_F(RegisterProtocolTest, ReadRegisterWritesAddressThenReadsTwoBytes) {
    spi.registers[reg::DIAG_STAT] = 0x1234;

    RegisterWord word{};
    ASSERT_EQ(protocol.readRegister(reg::DIAG_STAT, word), HalResult::OK);

    EXPECT_EQ(spi.words, std::vector<uint16_t>{reg::DIAG_STAT});
    EXPECT_EQ(spi.read_count, 1);
    EXPECT_EQ(word[0], 0x12);
    EXPECT_EQ(word[1], 0x34);
}

TEST_F(RegisterProtocolTest, ReadWordDecodesUnsigned) {
    spi.registers[reg::PROD_ID] = 0x404C;

    uint16_t id = 0;
    ASSERT_EQ(protocol.readWord(reg::PROD_ID, id), HalResult::OK);
    EXPECT_EQ(id, 0x404C);
}

TEST_F(RegisterProtocolTest, ReadAxisReadsHighBeforeLow) {
    spi.registers[reg::Y_GYRO_OUT] = 0xAABB;
    spi.registers[reg::Y_GYRO_LOW] = 0xCCDD;

    AxisWord axis{};
    ASSERT_EQ(protocol.readAxis(reg::Y_GYRO, axis), HalResult::OK);

    EXPECT_EQ(spi.words, (std::vector<uint16_t>{reg::Y_GYRO_OUT, reg::Y_GYRO_LOW}));
    EXPECT_EQ(axis, (AxisWord{0xAA, 0xBB, 0xCC, 0xDD}));
}

TEST_F(RegisterProtocolTest, EveryAxisPairsItsOwnOutAndLow) {
    const reg::AxisRegisters axes[] = {reg::X_GYRO, reg::Y_GYRO, reg::Z_GYRO,
                                  reg::X_ACCL, reg::Y_ACCL, reg::Z_ACCL};
    const char* names[] = {"X_GYRO", "Y_GYRO", "Z_GYRO", "X_ACCL", "Y_ACCL", "Z_ACCL"};

    // Fill every axis register so a wrong pairing reads a foreign value
    for (int i = 0; i < 6; i++) {
        spi.registers[axes[i].high] = static_cast<uint16_t>(0x1100 * (i + 1) + 0x01);
        spi.registers[axes[i].low] = static_cast<uint16_t>(0x1100 * (i + 1) + 0x02);
    }

    for (int i = 0; i < 6; i++) {
        SCOPED_TRACE(names[i]);
        spi.clearTraffic();

        AxisWord axis{};
        ASSERT_EQ(protocol.readAxis(axes[i], axis), HalResult::OK);

        EXPECT_EQ(spi.words, (std::vector<uint16_t>{axes[i].high, axes[i].low}));
        EXPECT_EQ(spi.read_count, 2);
        const uint8_t tag = static_cast<uint8_t>(0x11 * (i + 1));
        EXPECT_EQ(axis, (AxisWord{tag, 0x01, tag, 0x02}));
    }
}

TEST_F(RegisterProtocolTest, FailedReadLeavesOutputUntouched) {
    spi.registers[reg::TEMP_OUT] = 0x0102;
    spi.fail_read_at = 0;
    spi.fail_result = HalResult::READ_FAILED;

    RegisterWord word{0xEE, 0xFF};
    EXPECT_EQ(protocol.readRegister(reg::TEMP_OUT, word), HalResult::READ_FAILED);
    EXPECT_EQ(word[0], 0xEE);
    EXPECT_EQ(word[1], 0xFF);
}

TEST_F(RegisterProtocolTest, FailedAddressWriteSkipsRead) {
    spi.fail_write_at = 0;
    spi.fail_result = HalResult::WRITE_FAILED;

    RegisterWord word{};
    EXPECT_EQ(protocol.readRegister(reg::DIAG_STAT, word), HalResult::WRITE_FAILED);
    EXPECT_EQ(spi.read_count, 0);
}

TEST_F(RegisterProtocolTest, AxisFailureOnLowHalfPropagates) {
    spi.fail_read_at = 1;
    spi.fail_result = HalResult::TIMEOUT;

    AxisWord axis{1, 2, 3, 4};
    EXPECT_EQ(protocol.readAxis(reg::Z_ACCL, axis), HalResult::TIMEOUT);
    EXPECT_EQ(axis, (AxisWord{1, 2, 3, 4}));
}

TEST(RegisterProtocol, ClosedChannelIsNotInitialized) {
    ScriptedSpi spi;
    RegisterProtocol protocol(&spi);

    EXPECT_EQ(protocol.writeCommand(0xB700), HalResult::NOT_INITIALIZED);
    EXPECT_TRUE(spi.words.empty());
}

TEST(RegisterProtocol, NullChannelIsNotInitialized) {
    RegisterProtocol protocol(nullptr);
    RegisterWord word{};
    EXPECT_EQ(protocol.readRegister(reg::DIAG_STAT, word), HalResult::NOT_INITIALIZED);
}

TEST(HalResultClassification, TransportErrors) {
    EXPECT_TRUE(hal::isTransportError(HalResult::READ_FAILED));
    EXPECT_TRUE(hal::isTransportError(HalResult::WRITE_FAILED));
    EXPECT_TRUE(hal::isTransportError(HalResult::TIMEOUT));
    EXPECT_FALSE(hal::isTransportError(HalResult::OK));
    EXPECT_FALSE(hal::isTransportError(HalResult::INVALID_PARAM));
    EXPECT_FALSE(hal::isTransportError(HalResult::TRANSPORT_UNAVAILABLE));
}
