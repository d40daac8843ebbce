/**
 * @file MonitorTask.h
 * @brief Periodic IMU health readout FreeRTOS task
 *
 * Every period takes two-pass averages of accel and gyro and reads the
 * die temperature, all under g_imuMutex, then prints the result.
 */

#ifndef MPU6886_SERVICES_MONITOR_TASK_H
#define MPU6886_SERVICES_MONITOR_TASK_H

#include "hal/IMU_MPU6886.h"
#include "services/SamplingEngine.h"

#include "FreeRTOS.h"
#include "semphr.h"

#include <cstdint>

namespace mpu6886 {
namespace services {

/**
 * @brief One monitor cycle
 */
struct MonitorData {
    AverageResult accel;         // m/s²
    AverageResult gyro;          // dps
    float temperature_c;
};

/**
 * @brief MonitorTask configuration
 */
struct MonitorTaskConfig {
    static constexpr uint32_t PERIOD_MS     = 5000;
    static constexpr uint32_t TASK_PRIORITY = 2;
    static constexpr uint32_t STACK_SIZE    = 2048;  // words
};

extern SemaphoreHandle_t g_imuMutex;

/**
 * @brief Create the mutex guarding the driver
 *
 * Must be called before MonitorTask_Create().
 *
 * @param imu Begun driver (not owned)
 * @param sampler Sampling engine bound to imu (not owned)
 * @return true if the mutex was created
 */
bool MonitorTask_Init(hal::IMU_MPU6886* imu, SamplingEngine* sampler);

/**
 * @brief Create and start the MonitorTask
 * @return true if task created successfully
 */
bool MonitorTask_Create();

} // namespace services
} // namespace mpu6886

#endif // MPU6886_SERVICES_MONITOR_TASK_H
