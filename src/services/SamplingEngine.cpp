// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 MPU6886 Driver Project
/**
 * @file SamplingEngine.cpp
 * @brief Sampling engine implementation
 */

#include "SamplingEngine.h"
#include "debug.h"

#include <cmath>

namespace mpu6886 {
namespace services {

using hal::ImuResult;
using hal::SensorKind;
using hal::Vector3f;

static bool isSampledSensor(SensorKind sensor) {
    return sensor == SensorKind::ACCEL || sensor == SensorKind::GYRO;
}

SamplingEngine::SamplingEngine(hal::InertialSource* source, hal::DelayFn delay)
    : m_source(source)
    , m_delay(delay)
{
}

ImuResult SamplingEngine::average(SensorKind sensor, uint32_t count, uint32_t delay_ms,
                                  Vector3f& out)
{
    if (count < 1 || !isSampledSensor(sensor)) {
        return ImuResult::ERR_ARGUMENT;
    }
    if (m_source == nullptr || (delay_ms > 0 && m_delay == nullptr)) {
        return ImuResult::ERR_NOT_INITIALIZED;
    }

    double sum_x = 0.0;
    double sum_y = 0.0;
    double sum_z = 0.0;

    for (uint32_t i = 0; i < count; i++) {
        if (i > 0 && delay_ms > 0) {
            m_delay(delay_ms);
        }

        Vector3f sample;
        ImuResult rc = m_source->readSensor(sensor, sample);
        if (rc != ImuResult::OK) {
            DBG_ERROR("[Sampling] %s read %lu/%lu failed: %s\n", hal::sensorKindName(sensor),
                      static_cast<unsigned long>(i + 1), static_cast<unsigned long>(count),
                      hal::imuResultName(rc));
            return rc;
        }
        sum_x += sample.x;
        sum_y += sample.y;
        sum_z += sample.z;
    }

    const double n = static_cast<double>(count);
    out.x = static_cast<float>(sum_x / n);
    out.y = static_cast<float>(sum_y / n);
    out.z = static_cast<float>(sum_z / n);
    return ImuResult::OK;
}

ImuResult SamplingEngine::averageWithTolerance(SensorKind sensor, uint32_t count,
                                               uint32_t delay_ms, uint32_t pause_ms,
                                               AverageResult& out)
{
    if (count < 1 || !isSampledSensor(sensor)) {
        return ImuResult::ERR_ARGUMENT;
    }
    if (pause_ms > 0 && m_delay == nullptr) {
        return ImuResult::ERR_NOT_INITIALIZED;
    }

    Vector3f first;
    ImuResult rc = average(sensor, count, delay_ms, first);
    if (rc != ImuResult::OK) {
        return rc;
    }

    if (pause_ms > 0) {
        m_delay(pause_ms);
    }

    Vector3f second;
    rc = average(sensor, count, delay_ms, second);
    if (rc != ImuResult::OK) {
        return rc;
    }

    out = combinePasses(first, second);
    DBG_PRINT("[Sampling] %s avg (%.4f, %.4f, %.4f) tol (%.4f, %.4f, %.4f)\n",
              hal::sensorKindName(sensor),
              static_cast<double>(out.average.x), static_cast<double>(out.average.y),
              static_cast<double>(out.average.z), static_cast<double>(out.tolerance.x),
              static_cast<double>(out.tolerance.y), static_cast<double>(out.tolerance.z));
    return ImuResult::OK;
}

AverageResult SamplingEngine::combinePasses(const Vector3f& first, const Vector3f& second)
{
    AverageResult r;
    for (uint8_t a = 0; a < 3; a++) {
        r.average[a] = (first[a] + second[a]) * 0.5f;
        r.tolerance[a] = std::fabs(first[a] - second[a]);
    }
    return r;
}

} // namespace services
} // namespace mpu6886
