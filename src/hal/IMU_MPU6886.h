/**
 * @file IMU_MPU6886.h
 * @brief MPU-6886 6-DoF IMU driver
 *
 * InvenSense MPU-6886:
 * - Accelerometer: ±2/4/8/16g, 16-bit
 * - Gyroscope: ±250/500/1000/2000 dps, 16-bit
 * - Die temperature sensor
 * - Factory self-test trim registers
 *
 * Reference: MPU-6886 datasheet v1.1 (DS-000193)
 */

#ifndef MPU6886_HAL_IMU_MPU6886_H
#define MPU6886_HAL_IMU_MPU6886_H

#include "Bus.h"
#include "ImuConfig.h"
#include "ImuTypes.h"
#include "InertialSource.h"
#include "RegisterAccess.h"
#include <cstddef>
#include <cstdint>

namespace mpu6886 {
namespace hal {

/**
 * @brief MPU-6886 driver
 *
 * Every reading is a live register read converted with the range the
 * device is currently set to. Range setters write the device register
 * before the conversion range changes, so the two never disagree.
 *
 * @code
 * I2CBus bus(i2c0, SDA_PIN, SCL_PIN);
 * ImuConfig cfg;
 * cfg.accel_range = AccelRange::RANGE_8G;
 * IMU_MPU6886 imu(&bus, Timing::delayMs, cfg);
 *
 * if (imu.begin() == ImuResult::OK) {
 *     Vector3f accel;
 *     float temp_f;
 *     imu.readAccel(accel);        // m/s²
 *     imu.readTemperatureF(temp_f);
 * }
 * @endcode
 */
class IMU_MPU6886 : public InertialSource {
public:
    static constexpr uint8_t I2C_ADDR_DEFAULT = 0x68;  // AD0 = 0
    static constexpr uint8_t I2C_ADDR_ALT     = 0x69;  // AD0 = 1
    static constexpr uint8_t DEVICE_ID        = 0x19;  // WHO_AM_I value

    // Registers
    static constexpr uint8_t kRegSelfTestXAccel = 0x0D;
    static constexpr uint8_t kRegSelfTestYAccel = 0x0E;
    static constexpr uint8_t kRegSelfTestZAccel = 0x0F;
    static constexpr uint8_t kRegGyroConfig     = 0x1B;
    static constexpr uint8_t kRegAccelConfig    = 0x1C;
    static constexpr uint8_t kRegAccelXOutH     = 0x3B;
    static constexpr uint8_t kRegTempOutH       = 0x41;
    static constexpr uint8_t kRegGyroXOutH      = 0x43;
    static constexpr uint8_t kRegSelfTestXGyro  = 0x50;
    static constexpr uint8_t kRegSelfTestYGyro  = 0x51;
    static constexpr uint8_t kRegSelfTestZGyro  = 0x52;
    static constexpr uint8_t kRegPwrMgmt1       = 0x6B;
    static constexpr uint8_t kRegWhoAmI         = 0x75;

    // PWR_MGMT_1 bits
    static constexpr uint8_t kBitGyroStandby    = 0x10;
    static constexpr uint8_t kBitClkAuto        = 0x01;

    // ACCEL_CONFIG / GYRO_CONFIG bits
    static constexpr uint8_t kBitSelfTestX      = 0x80;
    static constexpr uint8_t kBitSelfTestY      = 0x40;
    static constexpr uint8_t kBitSelfTestZ      = 0x20;
    static constexpr uint8_t kFsSelShift        = 3;
    static constexpr uint8_t kFsSelMask         = 0x18;

    // Self-test runs at the highest resolution
    static constexpr AccelRange kSelfTestAccelRange = AccelRange::RANGE_2G;
    static constexpr GyroRange  kSelfTestGyroRange  = GyroRange::RANGE_250DPS;

    // Timing (datasheet minimums)
    static constexpr uint32_t kStandbySettleMs = 100;
    static constexpr uint32_t kConfigStepMs    = 10;

    /**
     * @brief Construct driver instance
     * @param bus Transport (not owned)
     * @param delay Blocking or cooperative delay capability
     * @param config Initial configuration, validated by begin()
     */
    IMU_MPU6886(SensorBus* bus, DelayFn delay, const ImuConfig& config = ImuConfig());

    /**
     * @brief Initialize the sensor
     *
     * Validates the configuration before any I/O, verifies WHO_AM_I,
     * puts the gyro in low-power standby, selects the auto clock, writes
     * both full-scale ranges and captures the factory self-test trims.
     *
     * @return OK, ERR_CONFIG, ERR_BUS or ERR_DEVICE_ID
     */
    ImuResult begin();

    /**
     * @brief Check if sensor is responding
     * @return true if WHO_AM_I register returns DEVICE_ID
     */
    bool isConnected();

    bool isInitialized() const { return m_initialized; }

    // ------------------------------------------------------------------
    // Configuration
    // ------------------------------------------------------------------

    const ImuConfig& config() const { return m_config; }

    /**
     * @brief Replace the configuration
     *
     * Rejected configurations leave the driver untouched. After begin()
     * both range registers are rewritten from the new configuration; if
     * the gyro write fails the accel range is put back before returning.
     */
    ImuResult applyConfig(const ImuConfig& config);

    /**
     * @brief Set a single named parameter (see ImuConfig::set)
     */
    ImuResult setParameter(const char* key, float value);

    ImuResult setAccelRange(AccelRange range);
    ImuResult setGyroRange(GyroRange range);

    /// Range the device registers are currently set to
    AccelRange activeAccelRange() const { return m_active_accel_range; }
    GyroRange activeGyroRange() const { return m_active_gyro_range; }

    // ------------------------------------------------------------------
    // Data
    // ------------------------------------------------------------------

    /// Acceleration in m/s²
    ImuResult readAccel(Vector3f& accel);

    /// Angular rate in degrees per second
    ImuResult readGyro(Vector3f& gyro);

    ImuResult readTemperatureC(float& temp_c);
    ImuResult readTemperatureF(float& temp_f);

    ImuResult readSensor(SensorKind sensor, Vector3f& out) override;

    /**
     * @brief Raw register access, optionally writing first
     *
     * nbytes 1 returns a BYTE, 2 a WORD, 6 a TRIPLE. Passing value
     * writes value_len (== nbytes) bytes then reads back.
     */
    ImuResult registerAccess(uint8_t address, const uint8_t* value, size_t value_len,
                             uint8_t nbytes, RegisterValue& out);

    // ------------------------------------------------------------------
    // Self-test support
    // ------------------------------------------------------------------

    /**
     * @brief Switch the sensor to its self-test range with excitation on
     *        for the selected axes
     *
     * axes == 0 keeps the self-test range with excitation off, the
     * baseline for the response measurement.
     *
     * @param axes Combination of axis::kX, axis::kY, axis::kZ
     */
    ImuResult setSelfTestExcitation(SensorKind sensor, uint8_t axes);

    /**
     * @brief Clear excitation and write back the configured range
     */
    ImuResult restoreRange(SensorKind sensor);

    /// Axes currently excited on sensor
    uint8_t selfTestAxes(SensorKind sensor) const;

    /**
     * @brief Factory self-test reference captured by begin()
     * @return ERR_NOT_INITIALIZED before a successful capture
     */
    ImuResult factoryTrim(SensorKind sensor, Vector3f& out) const;

    /// Transport code of the most recent failed bus call
    BusResult lastBusResult() const { return m_regs.lastBusResult(); }

private:
    ImuResult writeConfigRegister(uint8_t reg, uint8_t value);
    ImuResult readTriple(uint8_t reg, RawSample& raw);
    ImuResult captureFactoryTrims();
    ImuResult readTrim(const uint8_t regs[3], RawSample& raw);

    SensorBus* m_bus;
    DelayFn m_delay;
    RegisterAccess m_regs;
    ImuConfig m_config;
    bool m_initialized;

    AccelRange m_active_accel_range;
    GyroRange m_active_gyro_range;
    uint8_t m_accel_st_axes;
    uint8_t m_gyro_st_axes;

    Vector3f m_accel_trim;   // m/s²
    Vector3f m_gyro_trim;    // dps
    bool m_trims_valid;
};

} // namespace hal
} // namespace mpu6886

#endif // MPU6886_HAL_IMU_MPU6886_H
