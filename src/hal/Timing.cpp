/**
 * @file Timing.cpp
 * @brief Time and delay utilities implementation
 *
 * @note Part of MPU6886 HAL - Hardware Abstraction Layer
 */

#include "Timing.h"

#include "pico/stdlib.h"
#include "hardware/timer.h"
#include "FreeRTOS.h"
#include "task.h"

namespace mpu6886 {
namespace hal {

uint32_t Timing::millis32() {
    return static_cast<uint32_t>(time_us_64() / 1000ULL);
}

void Timing::delayMs(uint32_t ms) {
    if (xTaskGetSchedulerState() == taskSCHEDULER_RUNNING) {
        vTaskDelay(pdMS_TO_TICKS(ms));
    } else {
        busy_wait_us_32(ms * 1000);
    }
}

uint32_t Timing::elapsedMs(uint32_t start_ms) {
    uint32_t now = millis32();
    // Handles wrap-around correctly due to unsigned subtraction
    return now - start_ms;
}

} // namespace hal
} // namespace mpu6886
