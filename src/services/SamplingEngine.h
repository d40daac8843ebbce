// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 MPU6886 Driver Project
/**
 * @file SamplingEngine.h
 * @brief Repeated sampling, per-axis averaging and between-pass tolerance
 *
 * @note Part of MPU6886 Services Layer
 */

#ifndef MPU6886_SERVICES_SAMPLING_ENGINE_H
#define MPU6886_SERVICES_SAMPLING_ENGINE_H

#include "hal/ImuTypes.h"
#include "hal/InertialSource.h"
#include <cstdint>

namespace mpu6886 {
namespace services {

/**
 * @brief Average of two passes and their spread
 *
 * tolerance is the absolute difference between the two pass averages,
 * |pass1 - pass2| per axis. Never negative.
 */
struct AverageResult {
    hal::Vector3f average;
    hal::Vector3f tolerance;
};

/**
 * @brief Sampling engine
 *
 * Blocking and single-threaded. A failed read aborts the whole call and
 * the partial sums are discarded; outputs are only written on success.
 *
 * @code
 * SamplingEngine sampler(&imu, Timing::delayMs);
 * AverageResult r;
 * if (sampler.averageWithTolerance(SensorKind::GYRO, r) == ImuResult::OK) {
 *     // r.tolerance near zero: stationary and stable
 * }
 * @endcode
 */
class SamplingEngine {
public:
    static constexpr uint32_t kDefaultCount   = 10;
    static constexpr uint32_t kDefaultDelayMs = 10;
    static constexpr uint32_t kDefaultPauseMs = 1000;

    SamplingEngine(hal::InertialSource* source, hal::DelayFn delay);

    /**
     * @brief Per-axis arithmetic mean of count readings
     *
     * Sleeps delay_ms between readings, not after the last one.
     *
     * @return ERR_ARGUMENT if count < 1 or sensor is not ACCEL/GYRO
     *         (no I/O performed), ERR_BUS on the first failed read
     */
    hal::ImuResult average(hal::SensorKind sensor, uint32_t count, uint32_t delay_ms,
                           hal::Vector3f& out);

    /**
     * @brief Two independent average() passes separated by pause_ms
     *
     * Comparing two batches exposes slow drift that one long batch
     * would average away.
     */
    hal::ImuResult averageWithTolerance(hal::SensorKind sensor, uint32_t count,
                                        uint32_t delay_ms, uint32_t pause_ms,
                                        AverageResult& out);

    /// averageWithTolerance with the default count, delay and pause
    hal::ImuResult averageWithTolerance(hal::SensorKind sensor, AverageResult& out) {
        return averageWithTolerance(sensor, kDefaultCount, kDefaultDelayMs, kDefaultPauseMs, out);
    }

    /**
     * @brief Combine two pass averages (no I/O)
     */
    static AverageResult combinePasses(const hal::Vector3f& first, const hal::Vector3f& second);

private:
    hal::InertialSource* m_source;
    hal::DelayFn m_delay;
};

} // namespace services
} // namespace mpu6886

#endif // MPU6886_SERVICES_SAMPLING_ENGINE_H
