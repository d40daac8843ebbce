// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 MPU6886 Driver Project
/**
 * @file UnitConverter.cpp
 * @brief Scale-factor tables and raw-to-physical conversion
 */

#include "UnitConverter.h"

namespace mpu6886 {
namespace hal {

// ============================================================================
// Scale Factors
// ============================================================================

// Indexed by AccelRange
static const float kAccelLsbPerG[] = {
    16384.0f,  // ±2g
    8192.0f,   // ±4g
    4096.0f,   // ±8g
    2048.0f,   // ±16g
};

// Indexed by GyroRange
static const float kGyroLsbPerDps[] = {
    131.0f,    // ±250 dps
    65.5f,     // ±500 dps
    32.8f,     // ±1000 dps
    16.4f,     // ±2000 dps
};

static const uint16_t kAccelFullScaleG[]   = {2, 4, 8, 16};
static const uint16_t kGyroFullScaleDps[]  = {250, 500, 1000, 2000};

constexpr uint8_t kAccelRangeCount = sizeof(kAccelLsbPerG) / sizeof(kAccelLsbPerG[0]);
constexpr uint8_t kGyroRangeCount  = sizeof(kGyroLsbPerDps) / sizeof(kGyroLsbPerDps[0]);

// ============================================================================
// Conversion
// ============================================================================

ImuResult UnitConverter::accelDivisor(AccelRange range, float& lsb_per_g) {
    uint8_t idx = static_cast<uint8_t>(range);
    if (idx >= kAccelRangeCount) {
        return ImuResult::ERR_CONFIG;
    }
    lsb_per_g = kAccelLsbPerG[idx];
    return ImuResult::OK;
}

ImuResult UnitConverter::gyroDivisor(GyroRange range, float& lsb_per_dps) {
    uint8_t idx = static_cast<uint8_t>(range);
    if (idx >= kGyroRangeCount) {
        return ImuResult::ERR_CONFIG;
    }
    lsb_per_dps = kGyroLsbPerDps[idx];
    return ImuResult::OK;
}

ImuResult UnitConverter::toAcceleration(const RawSample& raw, AccelRange range, float gravity,
                                        Vector3f& out) {
    float divisor = 0.0f;
    ImuResult rc = accelDivisor(range, divisor);
    if (rc != ImuResult::OK) {
        return rc;
    }

    out.x = static_cast<float>(raw.x) / divisor * gravity;
    out.y = static_cast<float>(raw.y) / divisor * gravity;
    out.z = static_cast<float>(raw.z) / divisor * gravity;
    return ImuResult::OK;
}

ImuResult UnitConverter::toGyro(const RawSample& raw, GyroRange range, Vector3f& out) {
    float divisor = 0.0f;
    ImuResult rc = gyroDivisor(range, divisor);
    if (rc != ImuResult::OK) {
        return rc;
    }

    out.x = static_cast<float>(raw.x) / divisor;
    out.y = static_cast<float>(raw.y) / divisor;
    out.z = static_cast<float>(raw.z) / divisor;
    return ImuResult::OK;
}

float UnitConverter::toTemperatureC(int16_t raw) {
    return (static_cast<float>(raw) / kTempSensitivity) + kTempOffsetC;
}

float UnitConverter::toTemperatureF(int16_t raw) {
    return celsiusToFahrenheit(toTemperatureC(raw));
}

uint16_t UnitConverter::accelFullScaleG(AccelRange range) {
    uint8_t idx = static_cast<uint8_t>(range);
    return (idx < kAccelRangeCount) ? kAccelFullScaleG[idx] : 0;
}

uint16_t UnitConverter::gyroFullScaleDps(GyroRange range) {
    uint8_t idx = static_cast<uint8_t>(range);
    return (idx < kGyroRangeCount) ? kGyroFullScaleDps[idx] : 0;
}

} // namespace hal
} // namespace mpu6886
