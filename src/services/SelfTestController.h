// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 MPU6886 Driver Project
/**
 * @file SelfTestController.h
 * @brief On-chip self-test orchestration for accelerometer and gyroscope
 *
 * Sequence: IDLE -> SELFTEST_ENABLED -> MEASURING_ENABLED ->
 * SELFTEST_DISABLED -> MEASURING_DISABLED -> COMPARED -> IDLE.
 *
 * The controller reports the response (excited minus baseline average).
 * Judging pass/fail is left to the caller; evaluate() is available for
 * callers that want the factory-trim comparison.
 *
 * The accelerometer response carries a fixed offset of roughly 450 mG
 * that the gyro response does not show. No correction is applied.
 *
 * @note Part of MPU6886 Services Layer
 */

#ifndef MPU6886_SERVICES_SELF_TEST_CONTROLLER_H
#define MPU6886_SERVICES_SELF_TEST_CONTROLLER_H

#include "hal/IMU_MPU6886.h"
#include "hal/ImuTypes.h"
#include "services/SamplingEngine.h"
#include <cstdint>

namespace mpu6886 {
namespace services {

enum class SelfTestState : uint8_t {
    IDLE = 0,
    SELFTEST_ENABLED,
    MEASURING_ENABLED,
    SELFTEST_DISABLED,
    MEASURING_DISABLED,
    COMPARED
};

const char* selfTestStateName(SelfTestState state);

/**
 * @brief Response of one self-test run with the factory reference
 */
struct SelfTestResult {
    hal::Vector3f response;            // excited - baseline, per axis
    hal::Vector3f factory_reference;   // valid only when has_reference
    bool has_reference;
};

/**
 * @brief Outcome of evaluate()
 */
struct SelfTestVerdict {
    bool axis_passed[3];
    bool within_band;   // max |response| <= 2 * tolerance
    bool passed;        // every selected axis passed
};

class SelfTestController {
public:
    /**
     * @param imu Driver providing excitation control and factory trims
     * @param sampler Engine used for the averaged measurements
     * @param delay Settle-delay capability
     */
    SelfTestController(hal::IMU_MPU6886* imu, SamplingEngine* sampler, hal::DelayFn delay);

    /**
     * @brief Turn on excitation for the selected axes and wait to settle
     *
     * The sensor is switched to its self-test range for the duration.
     */
    hal::ImuResult enableSelfTest(hal::SensorKind sensor, uint8_t axes);

    /**
     * @brief Turn excitation off (self-test range kept) and wait to settle
     */
    hal::ImuResult disableSelfTest(hal::SensorKind sensor, uint32_t settle_ms);

    /**
     * @brief Write back the configured range and return to IDLE
     */
    hal::ImuResult finish(hal::SensorKind sensor);

    /**
     * @brief Full self-test run
     *
     * Averages count readings (delay_ms apart) with excitation on, turns
     * it off, waits at least pause_ms, averages again, restores the
     * configured range. Unselected axes report 0.
     *
     * @param axes Combination of hal::axis bits, non-zero
     * @param response Output: enabled average - disabled average
     * @return ERR_ARGUMENT for a bad sensor, axes or count (no I/O),
     *         ERR_NOT_INITIALIZED before imu.begin(), ERR_BUS otherwise
     */
    hal::ImuResult selftest(hal::SensorKind sensor, uint8_t axes, uint32_t count,
                            uint32_t delay_ms, uint32_t pause_ms, hal::Vector3f& response);

    /**
     * @brief selftest() plus the factory reference in one result
     */
    hal::ImuResult run(hal::SensorKind sensor, uint8_t axes, uint32_t count,
                       uint32_t delay_ms, uint32_t pause_ms, SelfTestResult& out);

    /**
     * @brief Factory self-test reference, read once at imu.begin()
     * @return ERR_NOT_INITIALIZED when no reference was captured
     */
    hal::ImuResult factoryReference(hal::SensorKind sensor, hal::Vector3f& out) const;

    /**
     * @brief Compare a response with the factory reference
     *
     * All selected axes pass when the largest |response| is within
     * 2 * tolerance. Otherwise an axis passes only if its |response|
     * does not exceed its factory reference.
     */
    static SelfTestVerdict evaluate(const hal::Vector3f& response,
                                    const hal::Vector3f& reference,
                                    float tolerance, uint8_t axes = hal::axis::kAll);

    SelfTestState state() const { return m_state; }

private:
    hal::ImuResult abort(hal::SensorKind sensor, hal::ImuResult cause);
    void settle(uint32_t ms);

    hal::IMU_MPU6886* m_imu;
    SamplingEngine* m_sampler;
    hal::DelayFn m_delay;
    SelfTestState m_state;
};

} // namespace services
} // namespace mpu6886

#endif // MPU6886_SERVICES_SELF_TEST_CONTROLLER_H
