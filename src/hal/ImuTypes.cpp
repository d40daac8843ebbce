// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 MPU6886 Driver Project
/**
 * @file ImuTypes.cpp
 * @brief Printable names for result codes and sensor kinds
 */

#include "ImuTypes.h"
#include "Bus.h"

namespace mpu6886 {
namespace hal {

const char* imuResultName(ImuResult result) {
    switch (result) {
        case ImuResult::OK:                  return "OK";
        case ImuResult::ERR_BUS:             return "BusError";
        case ImuResult::ERR_CONFIG:          return "ConfigError";
        case ImuResult::ERR_ARGUMENT:        return "ArgumentError";
        case ImuResult::ERR_DEVICE_ID:       return "DeviceIdError";
        case ImuResult::ERR_NOT_INITIALIZED: return "NotInitialized";
        default:                             return "Unknown";
    }
}

const char* busResultName(BusResult result) {
    switch (result) {
        case BusResult::OK:                  return "OK";
        case BusResult::ERR_TIMEOUT:         return "TIMEOUT";
        case BusResult::ERR_NACK:            return "NACK";
        case BusResult::ERR_BUS_ERROR:       return "BUS_ERROR";
        case BusResult::ERR_INVALID_PARAM:   return "INVALID_PARAM";
        case BusResult::ERR_NOT_INITIALIZED: return "NOT_INITIALIZED";
        default:                             return "UNKNOWN";
    }
}

const char* sensorKindName(SensorKind sensor) {
    switch (sensor) {
        case SensorKind::ACCEL: return "accel";
        case SensorKind::GYRO:  return "gyro";
        default:                return "unknown";
    }
}

} // namespace hal
} // namespace mpu6886
