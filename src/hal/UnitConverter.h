// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 MPU6886 Driver Project
/**
 * @file UnitConverter.h
 * @brief Raw register counts to physical units
 *
 * Pure functions of (raw value, range selector). No I/O, no hidden state.
 *
 * Sensitivity (MPU-6886 datasheet, Tables 1 and 2):
 * - Accel: 16384, 8192, 4096, 2048 LSB/g for ±2, ±4, ±8, ±16 g
 * - Gyro:  131, 65.5, 32.8, 16.4 LSB/dps for ±250, ±500, ±1000, ±2000 dps
 * - Temp:  326.8 LSB/°C, 25 °C at 0 LSB
 */

#ifndef MPU6886_HAL_UNIT_CONVERTER_H
#define MPU6886_HAL_UNIT_CONVERTER_H

#include "ImuTypes.h"
#include <cstdint>

namespace mpu6886 {
namespace hal {

constexpr float kStandardGravity = 9.80665f;   // m/s² per g

class UnitConverter {
public:
    static constexpr float kTempSensitivity = 326.8f;  // LSB/°C
    static constexpr float kTempOffsetC     = 25.0f;   // °C at 0 LSB

    /**
     * @brief Accelerometer scale divisor for a range
     * @param range Full-scale selector
     * @param lsb_per_g Output: LSB per g
     * @return ERR_CONFIG if the selector has no table entry
     */
    static ImuResult accelDivisor(AccelRange range, float& lsb_per_g);

    /**
     * @brief Gyroscope scale divisor for a range
     * @param lsb_per_dps Output: LSB per degree/second
     * @return ERR_CONFIG if the selector has no table entry
     */
    static ImuResult gyroDivisor(GyroRange range, float& lsb_per_dps);

    /**
     * @brief Raw accelerometer triple to m/s²
     *
     * raw / divisor(range) * gravity, per axis. A zero reading converts to
     * zero on every axis; any gravity offset comes from the device.
     */
    static ImuResult toAcceleration(const RawSample& raw, AccelRange range, float gravity,
                                    Vector3f& out);

    static ImuResult toAcceleration(const RawSample& raw, AccelRange range, Vector3f& out) {
        return toAcceleration(raw, range, kStandardGravity, out);
    }

    /**
     * @brief Raw gyroscope triple to degrees/second
     */
    static ImuResult toGyro(const RawSample& raw, GyroRange range, Vector3f& out);

    /// Die temperature in °C: raw / 326.8 + 25
    static float toTemperatureC(int16_t raw);

    /// Die temperature in °F: C * 9/5 + 32
    static float toTemperatureF(int16_t raw);

    static float celsiusToFahrenheit(float celsius) { return celsius * 1.8f + 32.0f; }

    /// Full-scale magnitude in g / dps, for logging
    static uint16_t accelFullScaleG(AccelRange range);
    static uint16_t gyroFullScaleDps(GyroRange range);

private:
    UnitConverter() = delete;  // Static-only class
};

} // namespace hal
} // namespace mpu6886

#endif // MPU6886_HAL_UNIT_CONVERTER_H
