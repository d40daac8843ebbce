/**
 * @file MonitorTask.cpp
 * @brief Periodic IMU health readout FreeRTOS task implementation
 */

#include "MonitorTask.h"
#include "hal/Timing.h"
#include "debug.h"

#include "FreeRTOS.h"
#include "task.h"
#include "semphr.h"

#include <cstdio>

using namespace mpu6886::hal;

namespace mpu6886 {
namespace services {

// ============================================================================
// Global Data
// ============================================================================

SemaphoreHandle_t g_imuMutex = nullptr;

static uint32_t s_cycles = 0;
static uint32_t s_errors = 0;
static TaskHandle_t s_taskHandle = nullptr;

static IMU_MPU6886* s_imu = nullptr;
static SamplingEngine* s_sampler = nullptr;

// ============================================================================
// Task
// ============================================================================

// One full measurement. Caller holds g_imuMutex.
static ImuResult measure(MonitorData& out)
{
    const ImuConfig& cfg = s_imu->config();

    ImuResult rc = s_sampler->averageWithTolerance(SensorKind::ACCEL, cfg.sample_count,
                                                   cfg.sample_delay_ms, cfg.pause_ms,
                                                   out.accel);
    if (rc != ImuResult::OK) {
        return rc;
    }
    rc = s_sampler->averageWithTolerance(SensorKind::GYRO, cfg.sample_count,
                                         cfg.sample_delay_ms, cfg.pause_ms, out.gyro);
    if (rc != ImuResult::OK) {
        return rc;
    }
    return s_imu->readTemperatureC(out.temperature_c);
}

static void printSnapshot(const MonitorData& d, uint32_t took_ms)
{
    printf("[Monitor] cycle %lu at %lu ms (took %lu ms)\n",
           static_cast<unsigned long>(s_cycles), static_cast<unsigned long>(Timing::millis32()),
           static_cast<unsigned long>(took_ms));
    printf("[Monitor] accel (%.3f, %.3f, %.3f) +/- (%.3f, %.3f, %.3f) m/s2\n",
           static_cast<double>(d.accel.average.x), static_cast<double>(d.accel.average.y),
           static_cast<double>(d.accel.average.z), static_cast<double>(d.accel.tolerance.x),
           static_cast<double>(d.accel.tolerance.y), static_cast<double>(d.accel.tolerance.z));
    printf("[Monitor] gyro  (%.3f, %.3f, %.3f) +/- (%.3f, %.3f, %.3f) dps\n",
           static_cast<double>(d.gyro.average.x), static_cast<double>(d.gyro.average.y),
           static_cast<double>(d.gyro.average.z), static_cast<double>(d.gyro.tolerance.x),
           static_cast<double>(d.gyro.tolerance.y), static_cast<double>(d.gyro.tolerance.z));
    printf("[Monitor] temp %.2f C\n", static_cast<double>(d.temperature_c));
}

static void MonitorTask_Run(void* params)
{
    (void)params;

    TickType_t lastWakeTime = xTaskGetTickCount();
    const TickType_t period = pdMS_TO_TICKS(MonitorTaskConfig::PERIOD_MS);

    while (true) {
        MonitorData snapshot = {};
        ImuResult rc = ImuResult::OK;
        const uint32_t start_ms = Timing::millis32();

        if (xSemaphoreTake(g_imuMutex, portMAX_DELAY) == pdTRUE) {
            rc = measure(snapshot);
            xSemaphoreGive(g_imuMutex);
        }

        s_cycles++;
        if (rc != ImuResult::OK) {
            s_errors++;
            DBG_ERROR("[Monitor] cycle %lu failed: %s (bus %s), %lu errors\n",
                      static_cast<unsigned long>(s_cycles), imuResultName(rc),
                      busResultName(s_imu->lastBusResult()),
                      static_cast<unsigned long>(s_errors));
        } else {
            printSnapshot(snapshot, Timing::elapsedMs(start_ms));
        }

        vTaskDelayUntil(&lastWakeTime, period);
    }
}

// ============================================================================
// Public API
// ============================================================================

bool MonitorTask_Init(IMU_MPU6886* imu, SamplingEngine* sampler)
{
    if (imu == nullptr || sampler == nullptr) {
        return false;
    }
    s_imu = imu;
    s_sampler = sampler;

    g_imuMutex = xSemaphoreCreateMutex();
    if (g_imuMutex == nullptr) {
        return false;
    }
    return true;
}

bool MonitorTask_Create()
{
    if (g_imuMutex == nullptr) {
        return false;
    }

    BaseType_t result = xTaskCreate(
        MonitorTask_Run,
        "Monitor",
        MonitorTaskConfig::STACK_SIZE,
        nullptr,
        MonitorTaskConfig::TASK_PRIORITY,
        &s_taskHandle
    );

    return result == pdPASS;
}

} // namespace services
} // namespace mpu6886
