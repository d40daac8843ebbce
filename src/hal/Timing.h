/**
 * @file Timing.h
 * @brief Time and delay utilities
 *
 * Wraps FreeRTOS and Pico SDK timing APIs. Timing::delayMs is the
 * DelayFn the firmware injects into the driver and services.
 *
 * @note Part of MPU6886 HAL - Hardware Abstraction Layer
 */

#ifndef MPU6886_HAL_TIMING_H
#define MPU6886_HAL_TIMING_H

#include <cstdint>

namespace mpu6886 {
namespace hal {

/**
 * @brief Timing utilities
 */
class Timing {
public:
    /**
     * @brief Get current time in milliseconds (32-bit)
     *
     * Wraps approximately every 49 days.
     *
     * @return Milliseconds since boot (wrapping)
     */
    static uint32_t millis32();

    /**
     * @brief Delay in milliseconds (RTOS-aware)
     *
     * Yields to the FreeRTOS scheduler when it is running, so other
     * tasks run during inter-sample delays. Busy-waits before the
     * scheduler starts (boot-time self-test).
     *
     * @param ms Milliseconds to delay
     */
    static void delayMs(uint32_t ms);

    /**
     * @brief Calculate elapsed time in milliseconds
     *
     * Handles 32-bit wrap correctly.
     *
     * @param start_ms Start timestamp from millis32()
     * @return Milliseconds elapsed since start
     */
    static uint32_t elapsedMs(uint32_t start_ms);

private:
    Timing() = delete;  // Static-only class
};

} // namespace hal
} // namespace mpu6886

#endif // MPU6886_HAL_TIMING_H
