// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 MPU6886 Driver Project
// Self-test controller: excitation sequencing, response, range restore,
// factory-trim comparison.

#include <gtest/gtest.h>
#include "services/SelfTestController.h"
#include "fake_bus.h"

using mpu6886::hal::AccelRange;
using mpu6886::hal::BusResult;
using mpu6886::hal::GyroRange;
using mpu6886::hal::IMU_MPU6886;
using mpu6886::hal::ImuConfig;
using mpu6886::hal::ImuResult;
using mpu6886::hal::SensorKind;
using mpu6886::hal::Vector3f;
using mpu6886::hal::kStandardGravity;
using mpu6886::services::SamplingEngine;
using mpu6886::services::SelfTestController;
using mpu6886::services::SelfTestResult;
using mpu6886::services::SelfTestState;
using mpu6886::services::SelfTestVerdict;
using mpu6886::test::DelayLog;
using mpu6886::test::FakeBus;

namespace axis = mpu6886::hal::axis;

// ============================================================================
// Helpers
// ============================================================================

class SelfTestControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        DelayLog::reset();
        ImuConfig cfg;
        cfg.accel_range = AccelRange::RANGE_8G;
        cfg.gyro_range = GyroRange::RANGE_2000DPS;
        cfg.selftest_settle_ms = 20;
        ASSERT_EQ(imu.applyConfig(cfg), ImuResult::OK);
    }

    void begin() {
        ASSERT_EQ(imu.begin(), ImuResult::OK);
        bus.clearCounters();
        DelayLog::reset();
    }

    FakeBus bus;
    IMU_MPU6886 imu{&bus, DelayLog::record};
    SamplingEngine sampler{&imu, DelayLog::record};
    SelfTestController selftest{&imu, &sampler, DelayLog::record};
};

// ============================================================================
// Response
// ============================================================================

TEST_F(SelfTestControllerTest, GyroResponseOneDps) {
    begin();
    bus.gyro_st_raw[0] = 131;
    bus.gyro_st_raw[1] = 131;
    bus.gyro_st_raw[2] = 131;

    Vector3f response;
    ASSERT_EQ(selftest.selftest(SensorKind::GYRO, axis::kAll, 4, 5, 50, response), ImuResult::OK);
    EXPECT_FLOAT_EQ(response.x, 1.0f);
    EXPECT_FLOAT_EQ(response.y, 1.0f);
    EXPECT_FLOAT_EQ(response.z, 1.0f);
    EXPECT_EQ(selftest.state(), SelfTestState::IDLE);
}

TEST_F(SelfTestControllerTest, BaselineOffsetCancels) {
    begin();
    bus.gyro_raw[0] = 40;           // stationary bias
    bus.gyro_st_raw[0] = 262;

    Vector3f response;
    ASSERT_EQ(selftest.selftest(SensorKind::GYRO, axis::kX, 2, 0, 0, response), ImuResult::OK);
    EXPECT_NEAR(response.x, 2.0f, 1e-5f);
}

TEST_F(SelfTestControllerTest, AccelResponseUncorrected) {
    begin();
    bus.accel_st_raw[2] = 16384;    // 1 g at the self-test range

    Vector3f response;
    ASSERT_EQ(selftest.selftest(SensorKind::ACCEL, axis::kZ, 3, 0, 0, response), ImuResult::OK);
    EXPECT_FLOAT_EQ(response.z, kStandardGravity);
    EXPECT_FLOAT_EQ(response.x, 0.0f);
}

TEST_F(SelfTestControllerTest, UnselectedAxesReportZero) {
    begin();
    bus.gyro_st_raw[0] = 131;
    bus.gyro_st_raw[1] = 131;
    bus.gyro_st_raw[2] = 131;
    bus.gyro_raw[1] = 500;

    Vector3f response(9.0f, 9.0f, 9.0f);
    ASSERT_EQ(selftest.selftest(SensorKind::GYRO, axis::kX, 2, 0, 0, response), ImuResult::OK);
    EXPECT_FLOAT_EQ(response.x, 1.0f);
    EXPECT_FLOAT_EQ(response.y, 0.0f);
    EXPECT_FLOAT_EQ(response.z, 0.0f);
}

// ============================================================================
// Register sequencing
// ============================================================================

TEST_F(SelfTestControllerTest, ExcitationWrittenThenRangeRestored) {
    begin();
    Vector3f response;
    ASSERT_EQ(selftest.selftest(SensorKind::GYRO, axis::kAll, 1, 0, 0, response), ImuResult::OK);

    // ST bits at 250 dps, then 250 dps without ST, then configured 2000 dps
    ASSERT_EQ(bus.writes.size(), 3u);
    EXPECT_EQ(bus.writes[0].first, IMU_MPU6886::kRegGyroConfig);
    EXPECT_EQ(bus.writes[0].second, 0xE0);
    EXPECT_EQ(bus.writes[1].second, 0x00);
    EXPECT_EQ(bus.writes[2].second, 0x18);

    EXPECT_EQ(bus.regs[IMU_MPU6886::kRegGyroConfig], 0x18);
    EXPECT_EQ(imu.activeGyroRange(), GyroRange::RANGE_2000DPS);
    EXPECT_EQ(imu.selfTestAxes(SensorKind::GYRO), 0);
    EXPECT_FALSE(bus.wasWritten(IMU_MPU6886::kRegAccelConfig, 0xE0));
}

TEST_F(SelfTestControllerTest, SettleAndPauseDelays) {
    begin();
    Vector3f response;
    ASSERT_EQ(selftest.selftest(SensorKind::ACCEL, axis::kAll, 2, 5, 50, response), ImuResult::OK);
    EXPECT_EQ(DelayLog::count(20), 1u);    // after enabling
    EXPECT_EQ(DelayLog::count(50), 1u);    // after disabling, pause > settle
    EXPECT_EQ(DelayLog::count(5), 2u);     // one gap per pass
}

TEST_F(SelfTestControllerTest, SettleUsedWhenPauseShorter) {
    begin();
    Vector3f response;
    ASSERT_EQ(selftest.selftest(SensorKind::ACCEL, axis::kAll, 1, 0, 5, response), ImuResult::OK);
    EXPECT_EQ(DelayLog::count(20), 2u);
    EXPECT_EQ(DelayLog::count(5), 0u);
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(SelfTestControllerTest, ArgumentErrorsBeforeIo) {
    begin();
    Vector3f response;
    EXPECT_EQ(selftest.selftest(SensorKind::GYRO, 0, 4, 0, 0, response), ImuResult::ERR_ARGUMENT);
    EXPECT_EQ(selftest.selftest(SensorKind::GYRO, 0x08, 4, 0, 0, response),
              ImuResult::ERR_ARGUMENT);
    EXPECT_EQ(selftest.selftest(SensorKind::GYRO, axis::kAll, 0, 0, 0, response),
              ImuResult::ERR_ARGUMENT);
    EXPECT_EQ(selftest.selftest(static_cast<SensorKind>(7), axis::kAll, 1, 0, 0, response),
              ImuResult::ERR_ARGUMENT);
    EXPECT_EQ(bus.read_calls, 0u);
    EXPECT_EQ(bus.write_calls, 0u);
}

TEST_F(SelfTestControllerTest, RequiresBegin) {
    Vector3f response;
    EXPECT_EQ(selftest.selftest(SensorKind::GYRO, axis::kAll, 1, 0, 0, response),
              ImuResult::ERR_NOT_INITIALIZED);
    EXPECT_EQ(bus.write_calls, 0u);
}

TEST_F(SelfTestControllerTest, BusFailureRestoresRange) {
    begin();
    // Excitation write + read-back succeed, first sample read fails
    bus.failRead(1, BusResult::ERR_TIMEOUT);

    Vector3f response(3.0f, 3.0f, 3.0f);
    EXPECT_EQ(selftest.selftest(SensorKind::GYRO, axis::kAll, 4, 0, 0, response),
              ImuResult::ERR_BUS);
    EXPECT_EQ(imu.lastBusResult(), BusResult::ERR_TIMEOUT);
    EXPECT_EQ(selftest.state(), SelfTestState::IDLE);
    EXPECT_EQ(bus.regs[IMU_MPU6886::kRegGyroConfig], 0x18);
    EXPECT_EQ(imu.activeGyroRange(), GyroRange::RANGE_2000DPS);
    EXPECT_FLOAT_EQ(response.x, 3.0f);
}

// ============================================================================
// Manual steps
// ============================================================================

TEST_F(SelfTestControllerTest, StepwiseStates) {
    begin();
    ASSERT_EQ(selftest.enableSelfTest(SensorKind::ACCEL, axis::kY), ImuResult::OK);
    EXPECT_EQ(selftest.state(), SelfTestState::SELFTEST_ENABLED);
    EXPECT_EQ(bus.regs[IMU_MPU6886::kRegAccelConfig], 0x40);

    ASSERT_EQ(selftest.disableSelfTest(SensorKind::ACCEL, 0), ImuResult::OK);
    EXPECT_EQ(selftest.state(), SelfTestState::SELFTEST_DISABLED);
    EXPECT_EQ(bus.regs[IMU_MPU6886::kRegAccelConfig], 0x00);

    ASSERT_EQ(selftest.finish(SensorKind::ACCEL), ImuResult::OK);
    EXPECT_EQ(selftest.state(), SelfTestState::IDLE);
    EXPECT_EQ(bus.regs[IMU_MPU6886::kRegAccelConfig], 0x10);
}

// ============================================================================
// Factory reference and evaluation
// ============================================================================

TEST_F(SelfTestControllerTest, RunIncludesFactoryReference) {
    bus.regs[IMU_MPU6886::kRegSelfTestXGyro] = 131;
    bus.regs[IMU_MPU6886::kRegSelfTestYGyro] = 131;
    bus.regs[IMU_MPU6886::kRegSelfTestZGyro] = 131;
    begin();
    bus.gyro_st_raw[0] = 131;

    SelfTestResult result;
    ASSERT_EQ(selftest.run(SensorKind::GYRO, axis::kAll, 2, 0, 0, result), ImuResult::OK);
    ASSERT_TRUE(result.has_reference);
    EXPECT_FLOAT_EQ(result.factory_reference.x, 1.0f);
    EXPECT_FLOAT_EQ(result.response.x, 1.0f);
    EXPECT_FLOAT_EQ(result.response.y, 0.0f);
}

TEST_F(SelfTestControllerTest, FactoryReferenceNeedsBegin) {
    Vector3f ref;
    EXPECT_EQ(selftest.factoryReference(SensorKind::ACCEL, ref), ImuResult::ERR_NOT_INITIALIZED);
}

TEST(SelfTestEvaluateTest, WithinBandPassesAllAxes) {
    SelfTestVerdict v = SelfTestController::evaluate(Vector3f(0.5f, -0.9f, 0.2f),
                                                     Vector3f(0.0f, 0.0f, 0.0f), 0.5f);
    EXPECT_TRUE(v.within_band);
    EXPECT_TRUE(v.passed);
}

TEST(SelfTestEvaluateTest, OutsideBandComparesEachAxis) {
    SelfTestVerdict v = SelfTestController::evaluate(Vector3f(3.0f, -5.0f, 1.0f),
                                                     Vector3f(4.0f, 4.0f, 4.0f), 1.0f);
    EXPECT_FALSE(v.within_band);
    EXPECT_TRUE(v.axis_passed[0]);
    EXPECT_FALSE(v.axis_passed[1]);
    EXPECT_TRUE(v.axis_passed[2]);
    EXPECT_FALSE(v.passed);
}

TEST(SelfTestEvaluateTest, UnselectedAxesIgnored) {
    SelfTestVerdict v = SelfTestController::evaluate(Vector3f(3.0f, -50.0f, 1.0f),
                                                     Vector3f(4.0f, 4.0f, 4.0f), 1.0f,
                                                     axis::kX | axis::kZ);
    EXPECT_FALSE(v.within_band);
    EXPECT_TRUE(v.axis_passed[1]);
    EXPECT_TRUE(v.passed);
}

TEST(SelfTestEvaluateTest, NegativeReferenceNeverPasses) {
    SelfTestVerdict v = SelfTestController::evaluate(Vector3f(3.0f, 3.0f, 3.0f),
                                                     Vector3f(-4.0f, 4.0f, 4.0f), 1.0f);
    EXPECT_FALSE(v.within_band);
    EXPECT_FALSE(v.axis_passed[0]);
    EXPECT_TRUE(v.axis_passed[1]);
    EXPECT_FALSE(v.passed);
}

TEST(SelfTestEvaluateTest, StateNames) {
    EXPECT_STREQ(mpu6886::services::selfTestStateName(SelfTestState::IDLE), "IDLE");
    EXPECT_STREQ(mpu6886::services::selfTestStateName(SelfTestState::COMPARED), "COMPARED");
}
