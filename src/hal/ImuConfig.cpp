// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 MPU6886 Driver Project
/**
 * @file ImuConfig.cpp
 * @brief Configuration validation and named-parameter access
 */

#include "ImuConfig.h"
#include "debug.h"

#include <cmath>
#include <cstring>

namespace mpu6886 {
namespace hal {

// ============================================================================
// Keys
// ============================================================================

static const char* const kKeys[] = {
    "address",
    "accel_range_g",
    "gyro_range_dps",
    "standard_gravity",
    "sample_count",
    "sample_delay_ms",
    "pause_ms",
    "selftest_settle_ms",
    "accel_selftest_tolerance",
    "gyro_selftest_tolerance",
    "debug",
};

constexpr size_t kKeyCount = sizeof(kKeys) / sizeof(kKeys[0]);

// 7-bit I2C address space, excluding reserved 0x00-0x07 and 0x78-0x7F
constexpr float kAddrMin = 0x08;
constexpr float kAddrMax = 0x77;

// Upper bound on any count/delay parameter (one hour in ms)
constexpr float kMaxU32Param = 3600000.0f;

static bool isWhole(float value) {
    return std::isfinite(value) && std::floor(value) == value;
}

static bool toU32(float value, float min, uint32_t& out) {
    if (!isWhole(value) || value < min || value > kMaxU32Param) {
        return false;
    }
    out = static_cast<uint32_t>(value);
    return true;
}

ImuResult accelRangeFromG(float g, AccelRange& range) {
    if (g == 2.0f)  { range = AccelRange::RANGE_2G;  return ImuResult::OK; }
    if (g == 4.0f)  { range = AccelRange::RANGE_4G;  return ImuResult::OK; }
    if (g == 8.0f)  { range = AccelRange::RANGE_8G;  return ImuResult::OK; }
    if (g == 16.0f) { range = AccelRange::RANGE_16G; return ImuResult::OK; }
    return ImuResult::ERR_CONFIG;
}

ImuResult gyroRangeFromDps(float dps, GyroRange& range) {
    if (dps == 250.0f)  { range = GyroRange::RANGE_250DPS;  return ImuResult::OK; }
    if (dps == 500.0f)  { range = GyroRange::RANGE_500DPS;  return ImuResult::OK; }
    if (dps == 1000.0f) { range = GyroRange::RANGE_1000DPS; return ImuResult::OK; }
    if (dps == 2000.0f) { range = GyroRange::RANGE_2000DPS; return ImuResult::OK; }
    return ImuResult::ERR_CONFIG;
}

// ============================================================================
// ImuConfig
// ============================================================================

ImuResult ImuConfig::validate() const {
    float divisor = 0.0f;
    if (address < kAddrMin || address > kAddrMax) {
        return ImuResult::ERR_CONFIG;
    }
    if (UnitConverter::accelDivisor(accel_range, divisor) != ImuResult::OK) {
        return ImuResult::ERR_CONFIG;
    }
    if (UnitConverter::gyroDivisor(gyro_range, divisor) != ImuResult::OK) {
        return ImuResult::ERR_CONFIG;
    }
    if (!std::isfinite(standard_gravity) || standard_gravity <= 0.0f) {
        return ImuResult::ERR_CONFIG;
    }
    if (sample_count < 1) {
        return ImuResult::ERR_CONFIG;
    }
    if (!std::isfinite(accel_selftest_tolerance) || accel_selftest_tolerance < 0.0f ||
        !std::isfinite(gyro_selftest_tolerance) || gyro_selftest_tolerance < 0.0f) {
        return ImuResult::ERR_CONFIG;
    }
    return ImuResult::OK;
}

ImuResult ImuConfig::set(const char* key, float value) {
    if (key == nullptr) {
        return ImuResult::ERR_CONFIG;
    }

    ImuConfig next = *this;

    if (strcmp(key, "address") == 0) {
        if (!isWhole(value) || value < kAddrMin || value > kAddrMax) {
            return ImuResult::ERR_CONFIG;
        }
        next.address = static_cast<uint8_t>(value);
    } else if (strcmp(key, "accel_range_g") == 0) {
        if (accelRangeFromG(value, next.accel_range) != ImuResult::OK) {
            return ImuResult::ERR_CONFIG;
        }
    } else if (strcmp(key, "gyro_range_dps") == 0) {
        if (gyroRangeFromDps(value, next.gyro_range) != ImuResult::OK) {
            return ImuResult::ERR_CONFIG;
        }
    } else if (strcmp(key, "standard_gravity") == 0) {
        next.standard_gravity = value;
    } else if (strcmp(key, "sample_count") == 0) {
        if (!toU32(value, 1.0f, next.sample_count)) {
            return ImuResult::ERR_CONFIG;
        }
    } else if (strcmp(key, "sample_delay_ms") == 0) {
        if (!toU32(value, 0.0f, next.sample_delay_ms)) {
            return ImuResult::ERR_CONFIG;
        }
    } else if (strcmp(key, "pause_ms") == 0) {
        if (!toU32(value, 0.0f, next.pause_ms)) {
            return ImuResult::ERR_CONFIG;
        }
    } else if (strcmp(key, "selftest_settle_ms") == 0) {
        if (!toU32(value, 0.0f, next.selftest_settle_ms)) {
            return ImuResult::ERR_CONFIG;
        }
    } else if (strcmp(key, "accel_selftest_tolerance") == 0) {
        next.accel_selftest_tolerance = value;
    } else if (strcmp(key, "gyro_selftest_tolerance") == 0) {
        next.gyro_selftest_tolerance = value;
    } else if (strcmp(key, "debug") == 0) {
        next.debug = (value != 0.0f);
    } else {
        DBG_ERROR("[MPU6886] unknown config key '%s'\n", key);
        return ImuResult::ERR_CONFIG;
    }

    ImuResult rc = next.validate();
    if (rc != ImuResult::OK) {
        return rc;
    }
    *this = next;
    return ImuResult::OK;
}

bool ImuConfig::get(const char* key, float& value) const {
    if (key == nullptr) {
        return false;
    }

    if (strcmp(key, "address") == 0) {
        value = static_cast<float>(address);
    } else if (strcmp(key, "accel_range_g") == 0) {
        value = static_cast<float>(UnitConverter::accelFullScaleG(accel_range));
    } else if (strcmp(key, "gyro_range_dps") == 0) {
        value = static_cast<float>(UnitConverter::gyroFullScaleDps(gyro_range));
    } else if (strcmp(key, "standard_gravity") == 0) {
        value = standard_gravity;
    } else if (strcmp(key, "sample_count") == 0) {
        value = static_cast<float>(sample_count);
    } else if (strcmp(key, "sample_delay_ms") == 0) {
        value = static_cast<float>(sample_delay_ms);
    } else if (strcmp(key, "pause_ms") == 0) {
        value = static_cast<float>(pause_ms);
    } else if (strcmp(key, "selftest_settle_ms") == 0) {
        value = static_cast<float>(selftest_settle_ms);
    } else if (strcmp(key, "accel_selftest_tolerance") == 0) {
        value = accel_selftest_tolerance;
    } else if (strcmp(key, "gyro_selftest_tolerance") == 0) {
        value = gyro_selftest_tolerance;
    } else if (strcmp(key, "debug") == 0) {
        value = debug ? 1.0f : 0.0f;
    } else {
        return false;
    }
    return true;
}

ImuResult ImuConfig::fromEntries(const ConfigEntry* entries, size_t count, ImuConfig& out) {
    if (entries == nullptr && count > 0) {
        return ImuResult::ERR_CONFIG;
    }

    ImuConfig cfg;
    for (size_t i = 0; i < count; i++) {
        ImuResult rc = cfg.set(entries[i].key, entries[i].value);
        if (rc != ImuResult::OK) {
            return rc;
        }
    }
    out = cfg;
    return ImuResult::OK;
}

size_t ImuConfig::keyCount() {
    return kKeyCount;
}

const char* ImuConfig::keyAt(size_t index) {
    return (index < kKeyCount) ? kKeys[index] : nullptr;
}

void ImuConfig::dump() const {
    for (size_t i = 0; i < kKeyCount; i++) {
        float value = 0.0f;
        if (get(kKeys[i], value)) {
            DBG_PRINT("   %s -> %g\n", kKeys[i], static_cast<double>(value));
        }
    }
}

} // namespace hal
} // namespace mpu6886
