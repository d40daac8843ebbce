/**
 * @file Bus.cpp
 * @brief I2C bus implementation over the Pico SDK
 *
 * @note Part of MPU6886 HAL - Hardware Abstraction Layer
 */

#include "Bus.h"

#include "hardware/i2c.h"
#include "hardware/gpio.h"
#include "pico/stdlib.h"

#include <cstdio>

namespace mpu6886 {
namespace hal {

// ============================================================================
// I2CBus class implementation
// ============================================================================

I2CBus::I2CBus(void* i2c_inst, uint8_t sda_pin, uint8_t scl_pin, uint32_t freq_hz)
    : m_i2c(i2c_inst)
    , m_sda_pin(sda_pin)
    , m_scl_pin(scl_pin)
    , m_freq_hz(freq_hz)
    , m_initialized(false)
{
    snprintf(m_name, sizeof(m_name), "I2C%d", (i2c_inst == i2c0) ? 0 : 1);
}

I2CBus::~I2CBus() {
    if (m_initialized) {
        i2c_deinit(static_cast<i2c_inst_t*>(m_i2c));
    }
}

bool I2CBus::begin() {
    if (m_initialized) {
        return true;
    }

    i2c_inst_t* i2c = static_cast<i2c_inst_t*>(m_i2c);

    i2c_init(i2c, m_freq_hz);

    gpio_set_function(m_sda_pin, GPIO_FUNC_I2C);
    gpio_set_function(m_scl_pin, GPIO_FUNC_I2C);

    // Enable pull-ups (required for I2C)
    gpio_pull_up(m_sda_pin);
    gpio_pull_up(m_scl_pin);

    m_initialized = true;
    return true;
}

static BusResult fromPicoError(int result) {
    if (result == PICO_ERROR_TIMEOUT) {
        return BusResult::ERR_TIMEOUT;
    }
    if (result == PICO_ERROR_GENERIC) {
        return BusResult::ERR_NACK;
    }
    return BusResult::ERR_BUS_ERROR;
}

BusResult I2CBus::readRegisters(uint8_t dev_addr, uint8_t reg,
                                uint8_t* buffer, size_t length) {
    if (!m_initialized) {
        return BusResult::ERR_NOT_INITIALIZED;
    }

    if (buffer == nullptr || length == 0) {
        return BusResult::ERR_INVALID_PARAM;
    }

    i2c_inst_t* i2c = static_cast<i2c_inst_t*>(m_i2c);

    // Register address, repeated start, then data
    int result = i2c_write_blocking(i2c, dev_addr, &reg, 1, true);
    if (result != 1) {
        return fromPicoError(result);
    }

    result = i2c_read_blocking(i2c, dev_addr, buffer, length, false);
    if (result != static_cast<int>(length)) {
        return fromPicoError(result);
    }

    return BusResult::OK;
}

BusResult I2CBus::writeRegister(uint8_t dev_addr, uint8_t reg, uint8_t value) {
    if (!m_initialized) {
        return BusResult::ERR_NOT_INITIALIZED;
    }

    i2c_inst_t* i2c = static_cast<i2c_inst_t*>(m_i2c);

    uint8_t write_buf[2] = {reg, value};
    int result = i2c_write_blocking(i2c, dev_addr, write_buf, sizeof(write_buf), false);
    if (result != static_cast<int>(sizeof(write_buf))) {
        return fromPicoError(result);
    }

    return BusResult::OK;
}

bool I2CBus::probe(uint8_t dev_addr) {
    if (!m_initialized) {
        return false;
    }

    i2c_inst_t* i2c = static_cast<i2c_inst_t*>(m_i2c);

    uint8_t dummy;
    int result = i2c_read_blocking(i2c, dev_addr, &dummy, 1, false);

    return result >= 0;
}

const char* I2CBus::getName() const {
    return m_name;
}

} // namespace hal
} // namespace mpu6886
