/**
 * @file main.cpp
 * @brief MPU6886 health monitor entry point
 *
 * Brings up stdio and I2C, begins the driver, runs the boot self-tests
 * and prints response, factory reference and verdict, then hands the
 * driver to the MonitorTask for periodic averaged readouts.
 */

#include "mpu6886/config.h"
#include "hal/Bus.h"
#include "hal/IMU_MPU6886.h"
#include "hal/Timing.h"
#include "services/MonitorTask.h"
#include "services/SamplingEngine.h"
#include "services/SelfTestController.h"
#include "debug.h"

#include "pico/stdlib.h"
#include "hardware/gpio.h"
#include "hardware/i2c.h"

#include "FreeRTOS.h"
#include "task.h"

#include <stdio.h>

using namespace mpu6886;
using namespace mpu6886::hal;
using namespace mpu6886::services;

// ============================================================================
// Global State
// ============================================================================

static I2CBus g_bus(i2c1, pins::kI2cSda, pins::kI2cScl, board::kI2cFreqHz);
static IMU_MPU6886 g_imu(&g_bus, Timing::delayMs);
static SamplingEngine g_sampler(&g_imu, Timing::delayMs);
static SelfTestController g_selftest(&g_imu, &g_sampler, Timing::delayMs);

// ============================================================================
// Boot
// ============================================================================

static void haltWithError(const char* what, ImuResult rc)
{
    printf("FATAL: %s: %s (bus %s)\n", what, imuResultName(rc),
           busResultName(g_imu.lastBusResult()));
    gpio_put(pins::kLedRed, 1);
    while (true) {
        tight_loop_contents();
    }
}

#if MPU6886_FEATURE_BOOT_SELFTEST
static void runSelfTest(SensorKind sensor, float tolerance, const char* unit)
{
    const ImuConfig& cfg = g_imu.config();

    SelfTestResult result;
    ImuResult rc = g_selftest.run(sensor, axis::kAll, cfg.sample_count, cfg.sample_delay_ms,
                                  cfg.pause_ms, result);
    if (rc != ImuResult::OK) {
        printf("[SelfTest] %s failed to run: %s\n", sensorKindName(sensor), imuResultName(rc));
        return;
    }

    printf("[SelfTest] %s response  (%.4f, %.4f, %.4f) %s\n", sensorKindName(sensor),
           static_cast<double>(result.response.x), static_cast<double>(result.response.y),
           static_cast<double>(result.response.z), unit);
    if (!result.has_reference) {
        return;
    }
    printf("[SelfTest] %s reference (%.4f, %.4f, %.4f) %s\n", sensorKindName(sensor),
           static_cast<double>(result.factory_reference.x),
           static_cast<double>(result.factory_reference.y),
           static_cast<double>(result.factory_reference.z), unit);

    SelfTestVerdict v = SelfTestController::evaluate(result.response, result.factory_reference,
                                                     tolerance);
    printf("[SelfTest] %s %s (x:%s y:%s z:%s)%s\n", sensorKindName(sensor),
           v.passed ? "PASS" : "FAIL",
           v.axis_passed[0] ? "ok" : "bad", v.axis_passed[1] ? "ok" : "bad",
           v.axis_passed[2] ? "ok" : "bad", v.within_band ? " within tolerance band" : "");
}
#endif

// ============================================================================
// Main
// ============================================================================

int main()
{
    stdio_init_all();
    sleep_ms(board::kUsbSettleMs);

    gpio_init(pins::kLedRed);
    gpio_set_dir(pins::kLedRed, GPIO_OUT);
    gpio_put(pins::kLedRed, 0);

    printf("\nMPU6886 monitor v%s\n", kVersionString);

    ImuResult rc = g_imu.begin();
    if (rc != ImuResult::OK) {
        const uint8_t addr = g_imu.config().address;
        printf("[MPU6886] %s at 0x%02X: %s\n", g_bus.getName(), addr,
               g_bus.probe(addr) ? "device acknowledges" : "no acknowledge");
        haltWithError("IMU init", rc);
    }

    printf("[MPU6886] configuration:\n");
    g_imu.config().dump();

#if MPU6886_FEATURE_BOOT_SELFTEST
    // Scheduler not started yet: Timing::delayMs busy-waits here
    runSelfTest(SensorKind::ACCEL, g_imu.config().accel_selftest_tolerance, "m/s2");
    runSelfTest(SensorKind::GYRO, g_imu.config().gyro_selftest_tolerance, "dps");
#endif

#if MPU6886_FEATURE_MONITOR_TASK
    if (!MonitorTask_Init(&g_imu, &g_sampler)) {
        haltWithError("monitor init", ImuResult::ERR_NOT_INITIALIZED);
    }
    if (!MonitorTask_Create()) {
        haltWithError("monitor task", ImuResult::ERR_NOT_INITIALIZED);
    }

    vTaskStartScheduler();
#endif

    // Only reached without the monitor task or if the scheduler fails
    while (true) {
        tight_loop_contents();
    }

    return 0;
}

// ============================================================================
// FreeRTOS Hooks
// ============================================================================

extern "C" {

void vApplicationMallocFailedHook() {
    printf("FATAL: Malloc failed!\n");
    while (true) {
        tight_loop_contents();
    }
}

void vApplicationStackOverflowHook(TaskHandle_t task, char* name) {
    (void)task;
    printf("FATAL: Stack overflow in task: %s\n", name);
    while (true) {
        tight_loop_contents();
    }
}

}  // extern "C"
