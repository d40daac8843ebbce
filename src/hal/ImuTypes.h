// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 MPU6886 Driver Project
/**
 * @file ImuTypes.h
 * @brief Shared value types for the MPU6886 driver
 *
 * Pure C++, no Pico SDK dependencies. Must compile on any host.
 */

#ifndef MPU6886_HAL_IMU_TYPES_H
#define MPU6886_HAL_IMU_TYPES_H

#include <cstdint>

namespace mpu6886 {
namespace hal {

/**
 * @brief Result codes for driver and service operations
 *
 * ERR_BUS, ERR_CONFIG and ERR_ARGUMENT are the three failure kinds
 * callers must handle; the rest only occur around initialization.
 */
enum class ImuResult : uint8_t {
    OK = 0,
    ERR_BUS,              // Transport failure, see lastBusResult()
    ERR_CONFIG,           // Range selector or configuration entry invalid
    ERR_ARGUMENT,         // count, nbytes, sensor or axis selection invalid
    ERR_DEVICE_ID,        // WHO_AM_I mismatch
    ERR_NOT_INITIALIZED   // begin() not completed
};

/**
 * @brief Printable name of an ImuResult
 */
const char* imuResultName(ImuResult result);

/**
 * @brief Delay capability injected into the driver and services
 *
 * Firmware passes Timing::delayMs (yields to FreeRTOS), tests pass a
 * recorder. Blocking semantics: returns after at least ms milliseconds.
 */
typedef void (*DelayFn)(uint32_t ms);

/**
 * @brief 3D vector for sensor data
 */
struct Vector3f {
    float x;
    float y;
    float z;

    Vector3f() : x(0.0f), y(0.0f), z(0.0f) {}
    Vector3f(float x_, float y_, float z_) : x(x_), y(y_), z(z_) {}

    float operator[](uint8_t axis) const { return axis == 0 ? x : (axis == 1 ? y : z); }
    float& operator[](uint8_t axis) { return axis == 0 ? x : (axis == 1 ? y : z); }
};

/**
 * @brief Raw signed 16-bit axis triple, in register order x, y, z
 */
struct RawSample {
    int16_t x;
    int16_t y;
    int16_t z;
};

/**
 * @brief Accelerometer full-scale range (ACCEL_CONFIG FS bits [4:3])
 */
enum class AccelRange : uint8_t {
    RANGE_2G  = 0,
    RANGE_4G  = 1,
    RANGE_8G  = 2,
    RANGE_16G = 3
};

/**
 * @brief Gyroscope full-scale range (GYRO_CONFIG FS_SEL bits [4:3])
 */
enum class GyroRange : uint8_t {
    RANGE_250DPS  = 0,
    RANGE_500DPS  = 1,
    RANGE_1000DPS = 2,
    RANGE_2000DPS = 3
};

/**
 * @brief Sensors that can be sampled
 */
enum class SensorKind : uint8_t {
    ACCEL = 0,
    GYRO  = 1
};

const char* sensorKindName(SensorKind sensor);

/**
 * @brief Axis selection bits for self-test excitation
 */
namespace axis {
    constexpr uint8_t kX   = (1U << 0);
    constexpr uint8_t kY   = (1U << 1);
    constexpr uint8_t kZ   = (1U << 2);
    constexpr uint8_t kAll = kX | kY | kZ;
} // namespace axis

} // namespace hal
} // namespace mpu6886

#endif // MPU6886_HAL_IMU_TYPES_H
