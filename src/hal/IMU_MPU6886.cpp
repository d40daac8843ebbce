/**
 * @file IMU_MPU6886.cpp
 * @brief MPU-6886 driver implementation
 */

#include "IMU_MPU6886.h"
#include "UnitConverter.h"
#include "debug.h"

namespace mpu6886 {
namespace hal {

static uint8_t axesToSelfTestBits(uint8_t axes) {
    uint8_t bits = 0;
    if (axes & axis::kX) bits |= IMU_MPU6886::kBitSelfTestX;
    if (axes & axis::kY) bits |= IMU_MPU6886::kBitSelfTestY;
    if (axes & axis::kZ) bits |= IMU_MPU6886::kBitSelfTestZ;
    return bits;
}

static uint8_t fsBits(uint8_t range_index) {
    return static_cast<uint8_t>((range_index << IMU_MPU6886::kFsSelShift) &
                                IMU_MPU6886::kFsSelMask);
}

// ============================================================================
// Constructor / Initialization
// ============================================================================

IMU_MPU6886::IMU_MPU6886(SensorBus* bus, DelayFn delay, const ImuConfig& config)
    : m_bus(bus)
    , m_delay(delay)
    , m_regs(bus, config.address, delay)
    , m_config(config)
    , m_initialized(false)
    , m_active_accel_range(config.accel_range)
    , m_active_gyro_range(config.gyro_range)
    , m_accel_st_axes(0)
    , m_gyro_st_axes(0)
    , m_trims_valid(false)
{
    m_regs.setTrace(config.debug);
}

ImuResult IMU_MPU6886::begin()
{
    // Configuration errors are reported before the bus is touched
    ImuResult rc = m_config.validate();
    if (rc != ImuResult::OK) {
        DBG_ERROR("[MPU6886] invalid configuration\n");
        return rc;
    }

    if (m_bus == nullptr || m_delay == nullptr) {
        return ImuResult::ERR_NOT_INITIALIZED;
    }
    if (!m_bus->begin()) {
        return ImuResult::ERR_BUS;
    }

    m_initialized = false;
    m_trims_valid = false;
    m_regs.setDeviceAddress(m_config.address);

    RegisterValue who;
    rc = m_regs.read(RegisterSpec::byte(kRegWhoAmI), who);
    if (rc != ImuResult::OK) {
        return rc;
    }
    if (who.byteValue() != DEVICE_ID) {
        DBG_ERROR("[MPU6886] not found on %s at 0x%02X (id 0x%02X)\n",
                  m_bus->getName(), m_config.address, who.byteValue());
        return ImuResult::ERR_DEVICE_ID;
    }
    if (m_config.debug) {
        DBG_PRINT("* IMU id verified\n");
    }

    // Gyro low-power standby
    rc = writeConfigRegister(kRegPwrMgmt1, kBitGyroStandby);
    if (rc != ImuResult::OK) {
        return rc;
    }
    m_delay(kStandbySettleMs);

    // Auto-select clock
    rc = writeConfigRegister(kRegPwrMgmt1, kBitClkAuto);
    if (rc != ImuResult::OK) {
        return rc;
    }

    rc = writeConfigRegister(kRegAccelConfig, fsBits(static_cast<uint8_t>(m_config.accel_range)));
    if (rc != ImuResult::OK) {
        return rc;
    }
    m_active_accel_range = m_config.accel_range;
    m_accel_st_axes = 0;
    if (m_config.debug) {
        DBG_PRINT("* set acceleration dial @ %u g\n",
                  UnitConverter::accelFullScaleG(m_config.accel_range));
    }

    m_delay(kConfigStepMs);
    rc = writeConfigRegister(kRegGyroConfig, fsBits(static_cast<uint8_t>(m_config.gyro_range)));
    if (rc != ImuResult::OK) {
        return rc;
    }
    m_active_gyro_range = m_config.gyro_range;
    m_gyro_st_axes = 0;
    if (m_config.debug) {
        DBG_PRINT("* set gyro dial @ %u dps\n",
                  UnitConverter::gyroFullScaleDps(m_config.gyro_range));
    }

    rc = captureFactoryTrims();
    if (rc != ImuResult::OK) {
        return rc;
    }

    m_initialized = true;
    DBG_PRINT("[MPU6886] initialized on %s at 0x%02X\n", m_bus->getName(), m_config.address);
    return ImuResult::OK;
}

bool IMU_MPU6886::isConnected()
{
    RegisterValue who;
    if (m_regs.read(RegisterSpec::byte(kRegWhoAmI), who) != ImuResult::OK) {
        return false;
    }
    return who.byteValue() == DEVICE_ID;
}

// ============================================================================
// Configuration
// ============================================================================

ImuResult IMU_MPU6886::applyConfig(const ImuConfig& config)
{
    ImuResult rc = config.validate();
    if (rc != ImuResult::OK) {
        return rc;
    }

    if (!m_initialized) {
        m_config = config;
        m_active_accel_range = config.accel_range;
        m_active_gyro_range = config.gyro_range;
        m_regs.setDeviceAddress(config.address);
        m_regs.setTrace(config.debug);
        return ImuResult::OK;
    }

    // A new address means a different device; it must be begun again
    if (config.address != m_config.address) {
        m_config = config;
        m_regs.setDeviceAddress(config.address);
        m_regs.setTrace(config.debug);
        m_initialized = false;
        m_trims_valid = false;
        return ImuResult::OK;
    }

    const AccelRange prev_accel = m_config.accel_range;
    const bool prev_trace = m_config.debug;
    m_regs.setTrace(config.debug);
    rc = setAccelRange(config.accel_range);
    if (rc != ImuResult::OK) {
        m_regs.setTrace(prev_trace);
        return rc;
    }
    rc = setGyroRange(config.gyro_range);
    if (rc != ImuResult::OK) {
        if (setAccelRange(prev_accel) != ImuResult::OK) {
            DBG_ERROR("[MPU6886] accel range rollback failed (bus %s)\n",
                      busResultName(m_regs.lastBusResult()));
        }
        m_regs.setTrace(prev_trace);
        return rc;
    }
    m_config = config;
    return ImuResult::OK;
}

ImuResult IMU_MPU6886::setParameter(const char* key, float value)
{
    ImuConfig next = m_config;
    ImuResult rc = next.set(key, value);
    if (rc != ImuResult::OK) {
        return rc;
    }
    return applyConfig(next);
}

ImuResult IMU_MPU6886::setAccelRange(AccelRange range)
{
    float divisor = 0.0f;
    if (UnitConverter::accelDivisor(range, divisor) != ImuResult::OK) {
        return ImuResult::ERR_CONFIG;
    }

    if (m_initialized) {
        ImuResult rc = writeConfigRegister(kRegAccelConfig, fsBits(static_cast<uint8_t>(range)));
        if (rc != ImuResult::OK) {
            return rc;
        }
        m_accel_st_axes = 0;
    }
    m_config.accel_range = range;
    m_active_accel_range = range;
    return ImuResult::OK;
}

ImuResult IMU_MPU6886::setGyroRange(GyroRange range)
{
    float divisor = 0.0f;
    if (UnitConverter::gyroDivisor(range, divisor) != ImuResult::OK) {
        return ImuResult::ERR_CONFIG;
    }

    if (m_initialized) {
        ImuResult rc = writeConfigRegister(kRegGyroConfig, fsBits(static_cast<uint8_t>(range)));
        if (rc != ImuResult::OK) {
            return rc;
        }
        m_gyro_st_axes = 0;
    }
    m_config.gyro_range = range;
    m_active_gyro_range = range;
    return ImuResult::OK;
}

// ============================================================================
// Data Reading
// ============================================================================

ImuResult IMU_MPU6886::readAccel(Vector3f& accel)
{
    if (!m_initialized) {
        return ImuResult::ERR_NOT_INITIALIZED;
    }

    RawSample raw;
    ImuResult rc = readTriple(kRegAccelXOutH, raw);
    if (rc != ImuResult::OK) {
        return rc;
    }

    rc = UnitConverter::toAcceleration(raw, m_active_accel_range, m_config.standard_gravity, accel);
    if (rc == ImuResult::OK && m_config.debug) {
        DBG_PRINT("  accel -> (%.3f, %.3f, %.3f) m/s2 @ fs = %u g\n",
                  static_cast<double>(accel.x), static_cast<double>(accel.y),
                  static_cast<double>(accel.z),
                  UnitConverter::accelFullScaleG(m_active_accel_range));
    }
    return rc;
}

ImuResult IMU_MPU6886::readGyro(Vector3f& gyro)
{
    if (!m_initialized) {
        return ImuResult::ERR_NOT_INITIALIZED;
    }

    RawSample raw;
    ImuResult rc = readTriple(kRegGyroXOutH, raw);
    if (rc != ImuResult::OK) {
        return rc;
    }

    rc = UnitConverter::toGyro(raw, m_active_gyro_range, gyro);
    if (rc == ImuResult::OK && m_config.debug) {
        DBG_PRINT("  gyro -> (%.3f, %.3f, %.3f) dps @ fs = %u dps\n",
                  static_cast<double>(gyro.x), static_cast<double>(gyro.y),
                  static_cast<double>(gyro.z),
                  UnitConverter::gyroFullScaleDps(m_active_gyro_range));
    }
    return rc;
}

ImuResult IMU_MPU6886::readTemperatureC(float& temp_c)
{
    if (!m_initialized) {
        return ImuResult::ERR_NOT_INITIALIZED;
    }

    RegisterValue value;
    ImuResult rc = m_regs.read(RegisterSpec::word(kRegTempOutH), value);
    if (rc != ImuResult::OK) {
        return rc;
    }
    temp_c = UnitConverter::toTemperatureC(value.wordValue());
    return ImuResult::OK;
}

ImuResult IMU_MPU6886::readTemperatureF(float& temp_f)
{
    float temp_c = 0.0f;
    ImuResult rc = readTemperatureC(temp_c);
    if (rc != ImuResult::OK) {
        return rc;
    }
    temp_f = UnitConverter::celsiusToFahrenheit(temp_c);
    if (m_config.debug) {
        DBG_PRINT("* imu temperature deg F -> %.1f\n", static_cast<double>(temp_f));
    }
    return ImuResult::OK;
}

ImuResult IMU_MPU6886::readSensor(SensorKind sensor, Vector3f& out)
{
    switch (sensor) {
        case SensorKind::ACCEL: return readAccel(out);
        case SensorKind::GYRO:  return readGyro(out);
        default:                return ImuResult::ERR_ARGUMENT;
    }
}

ImuResult IMU_MPU6886::registerAccess(uint8_t address, const uint8_t* value, size_t value_len,
                                      uint8_t nbytes, RegisterValue& out)
{
    RegisterSpec spec{address, nbytes, nbytes > 1};
    return m_regs.access(spec, value, value_len, out);
}

// ============================================================================
// Self-test support
// ============================================================================

ImuResult IMU_MPU6886::setSelfTestExcitation(SensorKind sensor, uint8_t axes)
{
    if ((axes & ~axis::kAll) != 0) {
        return ImuResult::ERR_ARGUMENT;
    }
    if (!m_initialized) {
        return ImuResult::ERR_NOT_INITIALIZED;
    }

    uint8_t st_bits = axesToSelfTestBits(axes);
    ImuResult rc;

    switch (sensor) {
        case SensorKind::ACCEL:
            rc = writeConfigRegister(kRegAccelConfig,
                                     st_bits | fsBits(static_cast<uint8_t>(kSelfTestAccelRange)));
            if (rc != ImuResult::OK) {
                return rc;
            }
            m_active_accel_range = kSelfTestAccelRange;
            m_accel_st_axes = axes;
            return ImuResult::OK;
        case SensorKind::GYRO:
            rc = writeConfigRegister(kRegGyroConfig,
                                     st_bits | fsBits(static_cast<uint8_t>(kSelfTestGyroRange)));
            if (rc != ImuResult::OK) {
                return rc;
            }
            m_active_gyro_range = kSelfTestGyroRange;
            m_gyro_st_axes = axes;
            return ImuResult::OK;
        default:
            return ImuResult::ERR_ARGUMENT;
    }
}

ImuResult IMU_MPU6886::restoreRange(SensorKind sensor)
{
    switch (sensor) {
        case SensorKind::ACCEL:
            return setAccelRange(m_config.accel_range);
        case SensorKind::GYRO:
            return setGyroRange(m_config.gyro_range);
        default:
            return ImuResult::ERR_ARGUMENT;
    }
}

uint8_t IMU_MPU6886::selfTestAxes(SensorKind sensor) const
{
    return (sensor == SensorKind::ACCEL) ? m_accel_st_axes : m_gyro_st_axes;
}

ImuResult IMU_MPU6886::factoryTrim(SensorKind sensor, Vector3f& out) const
{
    if (!m_trims_valid) {
        return ImuResult::ERR_NOT_INITIALIZED;
    }
    switch (sensor) {
        case SensorKind::ACCEL: out = m_accel_trim; return ImuResult::OK;
        case SensorKind::GYRO:  out = m_gyro_trim;  return ImuResult::OK;
        default:                return ImuResult::ERR_ARGUMENT;
    }
}

// ============================================================================
// Internal Helpers
// ============================================================================

ImuResult IMU_MPU6886::writeConfigRegister(uint8_t reg, uint8_t value)
{
    uint8_t readback = 0;
    return m_regs.writeByte(reg, value, readback);
}

ImuResult IMU_MPU6886::readTriple(uint8_t reg, RawSample& raw)
{
    RegisterValue value;
    ImuResult rc = m_regs.read(RegisterSpec::triple(reg), value);
    if (rc != ImuResult::OK) {
        return rc;
    }
    raw = value.tripleValue();
    return ImuResult::OK;
}

ImuResult IMU_MPU6886::readTrim(const uint8_t regs[3], RawSample& raw)
{
    int16_t v[3] = {0, 0, 0};
    for (uint8_t i = 0; i < 3; i++) {
        RegisterValue value;
        ImuResult rc = m_regs.read(RegisterSpec::byte(regs[i]), value);
        if (rc != ImuResult::OK) {
            return rc;
        }
        v[i] = value.byteValue();
    }
    raw = RawSample{v[0], v[1], v[2]};
    return ImuResult::OK;
}

// Trim bytes are scaled at the self-test range, the range the response
// is measured at, so reference and response share units.
ImuResult IMU_MPU6886::captureFactoryTrims()
{
    static const uint8_t kAccelTrimRegs[3] = {
        kRegSelfTestXAccel, kRegSelfTestYAccel, kRegSelfTestZAccel
    };
    static const uint8_t kGyroTrimRegs[3] = {
        kRegSelfTestXGyro, kRegSelfTestYGyro, kRegSelfTestZGyro
    };

    RawSample raw;
    ImuResult rc = readTrim(kAccelTrimRegs, raw);
    if (rc != ImuResult::OK) {
        return rc;
    }
    rc = UnitConverter::toAcceleration(raw, kSelfTestAccelRange, m_config.standard_gravity,
                                       m_accel_trim);
    if (rc != ImuResult::OK) {
        return rc;
    }

    rc = readTrim(kGyroTrimRegs, raw);
    if (rc != ImuResult::OK) {
        return rc;
    }
    rc = UnitConverter::toGyro(raw, kSelfTestGyroRange, m_gyro_trim);
    if (rc != ImuResult::OK) {
        return rc;
    }

    m_trims_valid = true;
    DBG_PRINT("[MPU6886] accel factory trims x, y, z -> %.3f %.3f %.3f m/s2\n",
              static_cast<double>(m_accel_trim.x), static_cast<double>(m_accel_trim.y),
              static_cast<double>(m_accel_trim.z));
    DBG_PRINT("[MPU6886] gyro factory trims x, y, z -> %.3f %.3f %.3f dps\n",
              static_cast<double>(m_gyro_trim.x), static_cast<double>(m_gyro_trim.y),
              static_cast<double>(m_gyro_trim.z));
    return ImuResult::OK;
}

} // namespace hal
} // namespace mpu6886
