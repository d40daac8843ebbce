// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 MPU6886 Driver Project
/**
 * @file ImuConfig.h
 * @brief Runtime configuration of the MPU6886 driver
 *
 * Typed record with a named-parameter view (set/get by key) for callers
 * that configure the driver from key/value data. Unknown keys and range
 * values without a scale-table entry are rejected with ERR_CONFIG.
 *
 * Register addresses and bit masks are device constants and live in
 * IMU_MPU6886, not here.
 */

#ifndef MPU6886_HAL_IMU_CONFIG_H
#define MPU6886_HAL_IMU_CONFIG_H

#include "ImuTypes.h"
#include "UnitConverter.h"
#include <cstddef>
#include <cstdint>

namespace mpu6886 {
namespace hal {

/**
 * @brief One key/value configuration entry
 */
struct ConfigEntry {
    const char* key;
    float value;
};

struct ImuConfig {
    uint8_t address = 0x68;
    AccelRange accel_range = AccelRange::RANGE_2G;
    GyroRange gyro_range = GyroRange::RANGE_250DPS;
    float standard_gravity = kStandardGravity;

    // Sampling defaults
    uint32_t sample_count = 10;
    uint32_t sample_delay_ms = 10;
    uint32_t pause_ms = 1000;

    // Self-test
    uint32_t selftest_settle_ms = 10;
    float accel_selftest_tolerance = 0.04f * kStandardGravity;  // 40 mG in m/s²
    float gyro_selftest_tolerance = 1.0f;                       // dps

    bool debug = false;

    /**
     * @brief Check every field
     * @return ERR_CONFIG on the first invalid field
     */
    ImuResult validate() const;

    /**
     * @brief Set a parameter by name
     *
     * Keys: address, accel_range_g (2/4/8/16), gyro_range_dps
     * (250/500/1000/2000), standard_gravity, sample_count,
     * sample_delay_ms, pause_ms, selftest_settle_ms,
     * accel_selftest_tolerance, gyro_selftest_tolerance, debug.
     *
     * The record is unchanged when ERR_CONFIG is returned.
     */
    ImuResult set(const char* key, float value);

    /**
     * @brief Read a parameter by name
     * @return false for an unknown key
     */
    bool get(const char* key, float& value) const;

    /**
     * @brief Build a configuration from defaults plus entries
     *
     * Fails on the first unknown key or invalid value; out is only
     * written on success.
     */
    static ImuResult fromEntries(const ConfigEntry* entries, size_t count, ImuConfig& out);

    /// Number of named parameters and their keys, in dump order
    static size_t keyCount();
    static const char* keyAt(size_t index);

    /// Print every parameter through DBG_PRINT
    void dump() const;
};

/// Range selectors from full-scale magnitudes; ERR_CONFIG when not in the table
ImuResult accelRangeFromG(float g, AccelRange& range);
ImuResult gyroRangeFromDps(float dps, GyroRange& range);

} // namespace hal
} // namespace mpu6886

#endif // MPU6886_HAL_IMU_CONFIG_H
