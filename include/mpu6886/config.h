// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 MPU6886 Driver Project
/**
 * @file config.h
 * @brief MPU6886 driver build configuration and board pin definitions
 *
 * Conventions:
 * - Constants use k prefix: kSampleCount, kI2cFreqHz
 * - Global variables use g_ prefix: g_imuMutex
 */

#ifndef MPU6886_CONFIG_H
#define MPU6886_CONFIG_H

#include <cstdint>

// ============================================================================
// Version Information
// ============================================================================

constexpr uint8_t     kVersionMajor  = 1;
constexpr uint8_t     kVersionMinor  = 0;
constexpr uint8_t     kVersionPatch  = 0;
constexpr const char* kVersionString = "1.0.0";

// ============================================================================
// Feature Flags
// ============================================================================

#define MPU6886_FEATURE_BOOT_SELFTEST   1   // Run accel/gyro self-test at boot
#define MPU6886_FEATURE_MONITOR_TASK    1   // Periodic averaged readout task

// ============================================================================
// Board Definitions (Feather RP2350, STEMMA QT / Qwiic port)
// ============================================================================

namespace mpu6886 {
namespace pins {

constexpr uint8_t kI2cSda       = 2;
constexpr uint8_t kI2cScl       = 3;
constexpr uint8_t kLedRed       = 7;

} // namespace pins

namespace board {

constexpr uint32_t kI2cFreqHz         = 400000;
constexpr uint32_t kUsbSettleMs       = 2000;   // Time for a host to open the CDC port

} // namespace board
} // namespace mpu6886

#endif // MPU6886_CONFIG_H
