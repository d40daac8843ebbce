/**
 * @file Bus.h
 * @brief Abstract register bus for sensor communication
 *
 * The driver core only sees SensorBus. The device address travels with
 * every call so one bus instance can serve several devices, and so the
 * driver's configured address is the single source of truth.
 *
 * @note Part of MPU6886 HAL - Hardware Abstraction Layer
 */

#ifndef MPU6886_HAL_BUS_H
#define MPU6886_HAL_BUS_H

#include <cstdint>
#include <cstddef>

namespace mpu6886 {
namespace hal {

/**
 * @brief Result codes for bus operations
 */
enum class BusResult : uint8_t {
    OK = 0,
    ERR_TIMEOUT,
    ERR_NACK,
    ERR_BUS_ERROR,
    ERR_INVALID_PARAM,
    ERR_NOT_INITIALIZED
};

/**
 * @brief Printable name of a BusResult
 */
const char* busResultName(BusResult result);

/**
 * @brief Abstract base class for register-oriented bus transports
 *
 * Implementations do not retry. A failed transfer is reported once and
 * the caller decides what to do with it.
 *
 * @code
 * I2CBus bus(i2c0, SDA_PIN, SCL_PIN);
 * uint8_t who = 0;
 * if (bus.readRegisters(0x68, 0x75, &who, 1) != BusResult::OK) {
 *     // transport failure
 * }
 * @endcode
 */
class SensorBus {
public:
    virtual ~SensorBus() = default;

    /**
     * @brief Initialize the bus
     * @return true if initialization successful
     */
    virtual bool begin() = 0;

    /**
     * @brief Read consecutive registers starting at reg
     * @param dev_addr 7-bit device address
     * @param reg Starting register address
     * @param buffer Output buffer
     * @param length Number of bytes to read
     * @return BusResult::OK on success
     */
    virtual BusResult readRegisters(uint8_t dev_addr, uint8_t reg,
                                    uint8_t* buffer, size_t length) = 0;

    /**
     * @brief Write a single register
     * @param dev_addr 7-bit device address
     * @param reg Register address
     * @param value Value to write
     * @return BusResult::OK on success
     */
    virtual BusResult writeRegister(uint8_t dev_addr, uint8_t reg, uint8_t value) = 0;

    /**
     * @brief Check if a device acknowledges on the bus
     */
    virtual bool probe(uint8_t dev_addr) = 0;

    /**
     * @brief Get descriptive name for this bus instance (e.g. "I2C0")
     */
    virtual const char* getName() const = 0;

protected:
    SensorBus() = default;

private:
    // Non-copyable
    SensorBus(const SensorBus&) = delete;
    SensorBus& operator=(const SensorBus&) = delete;
};


/**
 * @brief I2C bus implementation
 *
 * Wraps Pico SDK blocking I2C calls. Timeouts are the SDK's; no extra
 * timeout wraps a transaction here.
 */
class I2CBus : public SensorBus {
public:
    /**
     * @brief Construct I2C bus instance
     * @param i2c_inst Pico SDK I2C instance (i2c0 or i2c1)
     * @param sda_pin SDA GPIO pin number
     * @param scl_pin SCL GPIO pin number
     * @param freq_hz Bus frequency (default 400kHz)
     */
    I2CBus(void* i2c_inst, uint8_t sda_pin, uint8_t scl_pin, uint32_t freq_hz = 400000);

    ~I2CBus() override;

    bool begin() override;
    BusResult readRegisters(uint8_t dev_addr, uint8_t reg,
                            uint8_t* buffer, size_t length) override;
    BusResult writeRegister(uint8_t dev_addr, uint8_t reg, uint8_t value) override;
    bool probe(uint8_t dev_addr) override;
    const char* getName() const override;

private:
    void* m_i2c;
    uint8_t m_sda_pin;
    uint8_t m_scl_pin;
    uint32_t m_freq_hz;
    bool m_initialized;
    char m_name[8];
};

} // namespace hal
} // namespace mpu6886

#endif // MPU6886_HAL_BUS_H
