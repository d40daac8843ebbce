// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 MPU6886 Driver Project
/**
 * @file debug.h
 * @brief Compile-time guarded debug output macros
 *
 * DBG_PRINT and DBG_ERROR are enabled only when CONFIG_DEBUG is defined
 * (firmware debug builds). Host and release builds compile them to no-ops,
 * so format arguments are never evaluated there.
 *
 * Usage:
 *   DBG_PRINT("[MPU6886] id verified\n");
 *   DBG_ERROR("[SelfTest] restore failed: %s\n", imuResultName(rc));
 *
 * Tags in use: [MPU6886], [Sampling], [SelfTest], [Monitor].
 */

#ifndef MPU6886_DEBUG_H
#define MPU6886_DEBUG_H

#include <cstdio>

#ifdef CONFIG_DEBUG

#define DBG_PRINT(fmt, ...) printf(fmt, ##__VA_ARGS__)
#define DBG_ERROR(fmt, ...) printf("[ERROR] " fmt, ##__VA_ARGS__)

#else

#define DBG_PRINT(fmt, ...) do {} while(0)
#define DBG_ERROR(fmt, ...) do {} while(0)

#endif // CONFIG_DEBUG

#endif // MPU6886_DEBUG_H
