// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 MPU6886 Driver Project
/**
 * @file InertialSource.h
 * @brief Sampling source interface
 *
 * Decouples the sampling engine from the device driver. Every call is a
 * fresh device read; implementations must not cache.
 */

#ifndef MPU6886_HAL_INERTIAL_SOURCE_H
#define MPU6886_HAL_INERTIAL_SOURCE_H

#include "ImuTypes.h"

namespace mpu6886 {
namespace hal {

class InertialSource {
public:
    virtual ~InertialSource() = default;

    /**
     * @brief Read one sample of the named sensor in physical units
     * @param sensor ACCEL (m/s²) or GYRO (dps)
     * @param out Output sample, written only on success
     * @return ERR_ARGUMENT for an unknown sensor, ERR_BUS on transport failure
     */
    virtual ImuResult readSensor(SensorKind sensor, Vector3f& out) = 0;
};

} // namespace hal
} // namespace mpu6886

#endif // MPU6886_HAL_INERTIAL_SOURCE_H
