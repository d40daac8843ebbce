// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 MPU6886 Driver Project
/**
 * @file SelfTestController.cpp
 * @brief Self-test sequencing and factory-trim comparison
 */

#include "SelfTestController.h"
#include "debug.h"

#include <cmath>

namespace mpu6886 {
namespace services {

using hal::ImuResult;
using hal::SensorKind;
using hal::Vector3f;

static bool isValidAxes(uint8_t axes) {
    return axes != 0 && (axes & ~hal::axis::kAll) == 0;
}

static bool isSampledSensor(SensorKind sensor) {
    return sensor == SensorKind::ACCEL || sensor == SensorKind::GYRO;
}

const char* selfTestStateName(SelfTestState state) {
    switch (state) {
        case SelfTestState::IDLE:               return "IDLE";
        case SelfTestState::SELFTEST_ENABLED:   return "SELFTEST_ENABLED";
        case SelfTestState::MEASURING_ENABLED:  return "MEASURING_ENABLED";
        case SelfTestState::SELFTEST_DISABLED:  return "SELFTEST_DISABLED";
        case SelfTestState::MEASURING_DISABLED: return "MEASURING_DISABLED";
        case SelfTestState::COMPARED:           return "COMPARED";
        default:                                return "UNKNOWN";
    }
}

SelfTestController::SelfTestController(hal::IMU_MPU6886* imu, SamplingEngine* sampler,
                                       hal::DelayFn delay)
    : m_imu(imu)
    , m_sampler(sampler)
    , m_delay(delay)
    , m_state(SelfTestState::IDLE)
{
}

void SelfTestController::settle(uint32_t ms)
{
    if (ms > 0 && m_delay != nullptr) {
        m_delay(ms);
    }
}

// ============================================================================
// Excitation control
// ============================================================================

ImuResult SelfTestController::enableSelfTest(SensorKind sensor, uint8_t axes)
{
    if (!isSampledSensor(sensor) || !isValidAxes(axes)) {
        return ImuResult::ERR_ARGUMENT;
    }
    if (m_imu == nullptr) {
        return ImuResult::ERR_NOT_INITIALIZED;
    }

    ImuResult rc = m_imu->setSelfTestExcitation(sensor, axes);
    if (rc != ImuResult::OK) {
        return rc;
    }
    m_state = SelfTestState::SELFTEST_ENABLED;

    // The chip needs time to apply the synthetic stimulus
    settle(m_imu->config().selftest_settle_ms);
    return ImuResult::OK;
}

ImuResult SelfTestController::disableSelfTest(SensorKind sensor, uint32_t settle_ms)
{
    if (!isSampledSensor(sensor)) {
        return ImuResult::ERR_ARGUMENT;
    }
    if (m_imu == nullptr) {
        return ImuResult::ERR_NOT_INITIALIZED;
    }

    ImuResult rc = m_imu->setSelfTestExcitation(sensor, 0);
    if (rc != ImuResult::OK) {
        return rc;
    }
    m_state = SelfTestState::SELFTEST_DISABLED;
    settle(settle_ms);
    return ImuResult::OK;
}

ImuResult SelfTestController::finish(SensorKind sensor)
{
    if (!isSampledSensor(sensor)) {
        return ImuResult::ERR_ARGUMENT;
    }
    if (m_imu == nullptr) {
        return ImuResult::ERR_NOT_INITIALIZED;
    }

    ImuResult rc = m_imu->restoreRange(sensor);
    m_state = SelfTestState::IDLE;
    return rc;
}

ImuResult SelfTestController::abort(SensorKind sensor, ImuResult cause)
{
    // Leave the sensor in its configured range; the original failure is
    // what the caller sees.
    ImuResult rc = m_imu->restoreRange(sensor);
    if (rc != ImuResult::OK) {
        DBG_ERROR("[SelfTest] %s range restore failed: %s\n", hal::sensorKindName(sensor),
                  hal::imuResultName(rc));
    }
    DBG_ERROR("[SelfTest] %s aborted in %s: %s\n", hal::sensorKindName(sensor),
              selfTestStateName(m_state), hal::imuResultName(cause));
    m_state = SelfTestState::IDLE;
    return cause;
}

// ============================================================================
// Self-test run
// ============================================================================

ImuResult SelfTestController::selftest(SensorKind sensor, uint8_t axes, uint32_t count,
                                       uint32_t delay_ms, uint32_t pause_ms, Vector3f& response)
{
    if (!isSampledSensor(sensor) || !isValidAxes(axes) || count < 1) {
        return ImuResult::ERR_ARGUMENT;
    }
    if (m_imu == nullptr || m_sampler == nullptr || !m_imu->isInitialized()) {
        return ImuResult::ERR_NOT_INITIALIZED;
    }

    const uint32_t settle_ms = m_imu->config().selftest_settle_ms;

    ImuResult rc = enableSelfTest(sensor, axes);
    if (rc != ImuResult::OK) {
        return abort(sensor, rc);
    }

    m_state = SelfTestState::MEASURING_ENABLED;
    Vector3f enabled;
    rc = m_sampler->average(sensor, count, delay_ms, enabled);
    if (rc != ImuResult::OK) {
        return abort(sensor, rc);
    }

    rc = disableSelfTest(sensor, (pause_ms > settle_ms) ? pause_ms : settle_ms);
    if (rc != ImuResult::OK) {
        return abort(sensor, rc);
    }

    m_state = SelfTestState::MEASURING_DISABLED;
    Vector3f disabled;
    rc = m_sampler->average(sensor, count, delay_ms, disabled);
    if (rc != ImuResult::OK) {
        return abort(sensor, rc);
    }

    rc = m_imu->restoreRange(sensor);
    if (rc != ImuResult::OK) {
        m_state = SelfTestState::IDLE;
        return rc;
    }

    m_state = SelfTestState::COMPARED;
    const uint8_t axis_bits[3] = {hal::axis::kX, hal::axis::kY, hal::axis::kZ};
    for (uint8_t a = 0; a < 3; a++) {
        response[a] = (axes & axis_bits[a]) ? (enabled[a] - disabled[a]) : 0.0f;
    }

    DBG_PRINT("[SelfTest] %s response x, y, z -> %.4f %.4f %.4f %s\n",
              hal::sensorKindName(sensor), static_cast<double>(response.x),
              static_cast<double>(response.y), static_cast<double>(response.z),
              (sensor == SensorKind::ACCEL) ? "m/s2" : "dps");

    m_state = SelfTestState::IDLE;
    return ImuResult::OK;
}

ImuResult SelfTestController::run(SensorKind sensor, uint8_t axes, uint32_t count,
                                  uint32_t delay_ms, uint32_t pause_ms, SelfTestResult& out)
{
    Vector3f response;
    ImuResult rc = selftest(sensor, axes, count, delay_ms, pause_ms, response);
    if (rc != ImuResult::OK) {
        return rc;
    }

    out.response = response;
    out.has_reference = (factoryReference(sensor, out.factory_reference) == ImuResult::OK);
    if (!out.has_reference) {
        out.factory_reference = Vector3f();
    }
    return ImuResult::OK;
}

ImuResult SelfTestController::factoryReference(SensorKind sensor, Vector3f& out) const
{
    if (!isSampledSensor(sensor)) {
        return ImuResult::ERR_ARGUMENT;
    }
    if (m_imu == nullptr) {
        return ImuResult::ERR_NOT_INITIALIZED;
    }
    return m_imu->factoryTrim(sensor, out);
}

// ============================================================================
// Evaluation
// ============================================================================

SelfTestVerdict SelfTestController::evaluate(const Vector3f& response, const Vector3f& reference,
                                             float tolerance, uint8_t axes)
{
    const uint8_t axis_bits[3] = {hal::axis::kX, hal::axis::kY, hal::axis::kZ};

    float max_abs = 0.0f;
    for (uint8_t a = 0; a < 3; a++) {
        if ((axes & axis_bits[a]) && std::fabs(response[a]) > max_abs) {
            max_abs = std::fabs(response[a]);
        }
    }

    SelfTestVerdict v;
    v.within_band = (max_abs <= 2.0f * tolerance);
    v.passed = true;
    for (uint8_t a = 0; a < 3; a++) {
        if (!(axes & axis_bits[a]) || v.within_band) {
            v.axis_passed[a] = true;
        } else {
            v.axis_passed[a] = (std::fabs(response[a]) <= reference[a]);
        }
        v.passed = v.passed && v.axis_passed[a];
    }
    return v;
}

} // namespace services
} // namespace mpu6886
