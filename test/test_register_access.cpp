// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 MPU6886 Driver Project
// Register access: span decoding, write-then-read-back, argument checks.
//
// Verifies: 1/2/6-byte shapes, big-endian two's complement, argument
// errors raised before any bus traffic, single attempt on bus failure.

#include <gtest/gtest.h>
#include "hal/RegisterAccess.h"
#include "fake_bus.h"

using mpu6886::hal::BusResult;
using mpu6886::hal::ImuResult;
using mpu6886::hal::RawSample;
using mpu6886::hal::RegisterAccess;
using mpu6886::hal::RegisterSpec;
using mpu6886::hal::RegisterValue;
using mpu6886::test::DelayLog;
using mpu6886::test::FakeBus;

// ============================================================================
// Helpers
// ============================================================================

class RegisterAccessTest : public ::testing::Test {
protected:
    void SetUp() override {
        DelayLog::reset();
    }

    FakeBus bus;
    RegisterAccess regs{&bus, 0x68, DelayLog::record};
};

// ============================================================================
// Decoding
// ============================================================================

TEST(RegisterDecodeTest, UnsignedByte) {
    uint8_t bytes[1] = {0xF0};
    RegisterValue v;
    ASSERT_EQ(RegisterAccess::decode(RegisterSpec::byte(0x10), bytes, v), ImuResult::OK);
    EXPECT_TRUE(v.isByte());
    EXPECT_EQ(v.byteValue(), 240);
}

TEST(RegisterDecodeTest, SignedByte) {
    uint8_t bytes[1] = {0xF0};
    RegisterValue v;
    RegisterSpec spec{0x10, 1, true};
    ASSERT_EQ(RegisterAccess::decode(spec, bytes, v), ImuResult::OK);
    EXPECT_EQ(v.byteValue(), -16);
}

TEST(RegisterDecodeTest, WordIsBigEndianSigned) {
    uint8_t bytes[2] = {0xFF, 0xFE};
    RegisterValue v;
    ASSERT_EQ(RegisterAccess::decode(RegisterSpec::word(0x41), bytes, v), ImuResult::OK);
    EXPECT_TRUE(v.isWord());
    EXPECT_EQ(v.wordValue(), -2);
}

TEST(RegisterDecodeTest, TripleOrderAndExtremes) {
    uint8_t bytes[6] = {0x00, 0x01, 0x80, 0x00, 0x7F, 0xFF};
    RegisterValue v;
    ASSERT_EQ(RegisterAccess::decode(RegisterSpec::triple(0x3B), bytes, v), ImuResult::OK);
    ASSERT_TRUE(v.isTriple());
    RawSample s = v.tripleValue();
    EXPECT_EQ(s.x, 1);
    EXPECT_EQ(s.y, -32768);
    EXPECT_EQ(s.z, 32767);
}

TEST(RegisterDecodeTest, AccessorsOfWrongKindReturnZero) {
    RegisterValue v = RegisterValue::makeWord(1234);
    EXPECT_EQ(v.byteValue(), 0);
    EXPECT_EQ(v.tripleValue().x, 0);
    EXPECT_EQ(v.wordValue(), 1234);
}

TEST(RegisterDecodeTest, UnsupportedWidthRejected) {
    uint8_t bytes[6] = {};
    RegisterValue v;
    RegisterSpec spec{0x10, 3, true};
    EXPECT_EQ(RegisterAccess::decode(spec, bytes, v), ImuResult::ERR_ARGUMENT);
    EXPECT_FALSE(RegisterAccess::isSupportedWidth(0));
    EXPECT_FALSE(RegisterAccess::isSupportedWidth(4));
    EXPECT_TRUE(RegisterAccess::isSupportedWidth(6));
}

// ============================================================================
// Read
// ============================================================================

TEST_F(RegisterAccessTest, ReadOnlyShapes) {
    bus.regs[0x20] = 0x12;
    bus.regs[0x21] = 0x34;
    bus.regs[0x22] = 0xFF;
    bus.regs[0x23] = 0xFF;
    bus.regs[0x24] = 0x00;
    bus.regs[0x25] = 0x00;

    RegisterValue v;
    ASSERT_EQ(regs.read(RegisterSpec::byte(0x20), v), ImuResult::OK);
    EXPECT_EQ(v.byteValue(), 0x12);

    ASSERT_EQ(regs.read(RegisterSpec::word(0x20), v), ImuResult::OK);
    EXPECT_EQ(v.wordValue(), 0x1234);

    ASSERT_EQ(regs.read(RegisterSpec::triple(0x20), v), ImuResult::OK);
    RawSample s = v.tripleValue();
    EXPECT_EQ(s.x, 0x1234);
    EXPECT_EQ(s.y, -1);
    EXPECT_EQ(s.z, 0);

    // Plain reads never write and never sleep
    EXPECT_EQ(bus.write_calls, 0u);
    EXPECT_TRUE(DelayLog::calls.empty());
}

TEST_F(RegisterAccessTest, ReadsLiveDeviceEachTime) {
    bus.temp_raw = 100;
    RegisterValue v;
    ASSERT_EQ(regs.read(RegisterSpec::word(0x41), v), ImuResult::OK);
    EXPECT_EQ(v.wordValue(), 100);

    bus.temp_raw = -100;
    ASSERT_EQ(regs.read(RegisterSpec::word(0x41), v), ImuResult::OK);
    EXPECT_EQ(v.wordValue(), -100);
}

// ============================================================================
// Write then read back
// ============================================================================

TEST_F(RegisterAccessTest, WriteThenReadBack) {
    uint8_t value[1] = {0x18};
    RegisterValue v;
    ASSERT_EQ(regs.access(RegisterSpec::byte(0x1C), value, 1, v), ImuResult::OK);
    EXPECT_EQ(v.byteValue(), 0x18);
    EXPECT_EQ(bus.regs[0x1C], 0x18);
    EXPECT_EQ(bus.write_calls, 1u);
    EXPECT_EQ(bus.read_calls, 1u);
    ASSERT_EQ(DelayLog::calls.size(), 1u);
    EXPECT_EQ(DelayLog::calls[0], RegisterAccess::kWriteSettleMs);
}

TEST_F(RegisterAccessTest, MultiByteWriteGoesToConsecutiveRegisters) {
    uint8_t value[2] = {0xAB, 0xCD};
    RegisterValue v;
    RegisterSpec spec{0x30, 2, true};
    ASSERT_EQ(regs.access(spec, value, 2, v), ImuResult::OK);
    EXPECT_EQ(bus.regs[0x30], 0xAB);
    EXPECT_EQ(bus.regs[0x31], 0xCD);
    EXPECT_EQ(static_cast<uint16_t>(v.wordValue()), 0xABCD);
}

TEST_F(RegisterAccessTest, WriteByteReturnsReadback) {
    uint8_t readback = 0;
    ASSERT_EQ(regs.writeByte(0x6B, 0x01, readback), ImuResult::OK);
    EXPECT_EQ(readback, 0x01);
}

// ============================================================================
// Argument errors
// ============================================================================

TEST_F(RegisterAccessTest, UnsupportedWidthFailsBeforeIo) {
    RegisterValue v;
    RegisterSpec spec{0x3B, 3, true};
    EXPECT_EQ(regs.read(spec, v), ImuResult::ERR_ARGUMENT);
    EXPECT_EQ(bus.read_calls, 0u);
    EXPECT_EQ(bus.write_calls, 0u);
}

TEST_F(RegisterAccessTest, ValueLengthMismatchFailsBeforeIo) {
    uint8_t value[2] = {0x01, 0x02};
    RegisterValue v;
    EXPECT_EQ(regs.access(RegisterSpec::byte(0x1C), value, 2, v), ImuResult::ERR_ARGUMENT);
    EXPECT_EQ(bus.read_calls, 0u);
    EXPECT_EQ(bus.write_calls, 0u);
    EXPECT_EQ(bus.regs[0x1C], 0x00);
}

TEST(RegisterAccessNoBusTest, NullBusNotInitialized) {
    RegisterAccess regs(nullptr, 0x68, nullptr);
    RegisterValue v;
    EXPECT_EQ(regs.read(RegisterSpec::byte(0x75), v), ImuResult::ERR_NOT_INITIALIZED);
}

// ============================================================================
// Bus failures
// ============================================================================

TEST_F(RegisterAccessTest, ReadFailureNoRetry) {
    bus.failRead(0, BusResult::ERR_TIMEOUT);
    RegisterValue v;
    EXPECT_EQ(regs.read(RegisterSpec::byte(0x75), v), ImuResult::ERR_BUS);
    EXPECT_EQ(bus.read_calls, 1u);
    EXPECT_EQ(regs.lastBusResult(), BusResult::ERR_TIMEOUT);
    EXPECT_EQ(v.kind(), RegisterValue::Kind::NONE);
}

TEST_F(RegisterAccessTest, WriteFailureSkipsReadback) {
    bus.failWrite(0, BusResult::ERR_NACK);
    uint8_t value[1] = {0x08};
    RegisterValue v;
    EXPECT_EQ(regs.access(RegisterSpec::byte(0x1C), value, 1, v), ImuResult::ERR_BUS);
    EXPECT_EQ(bus.write_calls, 1u);
    EXPECT_EQ(bus.read_calls, 0u);
    EXPECT_EQ(regs.lastBusResult(), BusResult::ERR_NACK);
    EXPECT_TRUE(DelayLog::calls.empty());
}

TEST_F(RegisterAccessTest, WrongDeviceAddressNacks) {
    regs.setDeviceAddress(0x69);
    EXPECT_EQ(regs.getDeviceAddress(), 0x69);
    RegisterValue v;
    EXPECT_EQ(regs.read(RegisterSpec::byte(0x75), v), ImuResult::ERR_BUS);
    EXPECT_EQ(regs.lastBusResult(), BusResult::ERR_NACK);
}
