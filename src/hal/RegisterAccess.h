// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 MPU6886 Driver Project
/**
 * @file RegisterAccess.h
 * @brief Typed read / write-then-read-back access to device registers
 *
 * Decodes 1, 2 and 6 byte register spans. Multi-byte spans are big-endian
 * (high byte at the lower address) and two's-complement signed, matching
 * the MPU-6886 data output registers.
 */

#ifndef MPU6886_HAL_REGISTER_ACCESS_H
#define MPU6886_HAL_REGISTER_ACCESS_H

#include "Bus.h"
#include "ImuTypes.h"
#include <cstddef>
#include <cstdint>

namespace mpu6886 {
namespace hal {

/**
 * @brief Address, width and signedness of one register span
 */
struct RegisterSpec {
    uint8_t address;
    uint8_t width;      // 1, 2 or 6 bytes
    bool is_signed;     // only meaningful for width 1; wider spans are always signed

    static RegisterSpec byte(uint8_t address) { return RegisterSpec{address, 1, false}; }
    static RegisterSpec word(uint8_t address) { return RegisterSpec{address, 2, true}; }
    static RegisterSpec triple(uint8_t address) { return RegisterSpec{address, 6, true}; }
};

/**
 * @brief Decoded register contents, tagged by shape
 *
 * BYTE holds one 8-bit value (0..255, or -128..127 when read signed),
 * WORD one signed 16-bit value, TRIPLE three signed 16-bit values in
 * x, y, z order.
 */
class RegisterValue {
public:
    enum class Kind : uint8_t {
        NONE = 0,
        BYTE,
        WORD,
        TRIPLE
    };

    RegisterValue() : m_kind(Kind::NONE), m_v{0, 0, 0} {}

    static RegisterValue makeByte(int16_t value);
    static RegisterValue makeWord(int16_t value);
    static RegisterValue makeTriple(int16_t x, int16_t y, int16_t z);

    Kind kind() const { return m_kind; }
    bool isByte() const { return m_kind == Kind::BYTE; }
    bool isWord() const { return m_kind == Kind::WORD; }
    bool isTriple() const { return m_kind == Kind::TRIPLE; }

    // Accessors return 0 / zero triple when the kind does not match
    int16_t byteValue() const { return isByte() ? m_v[0] : 0; }
    int16_t wordValue() const { return isWord() ? m_v[0] : 0; }
    RawSample tripleValue() const;

private:
    Kind m_kind;
    int16_t m_v[3];
};

/**
 * @brief Register read/modify/write over a SensorBus
 *
 * Every call is a single transaction sequence with no retry: register
 * writes are not idempotent, so a failed transfer is returned as
 * ImuResult::ERR_BUS and the transport code kept in lastBusResult().
 *
 * @code
 * RegisterAccess regs(&bus, 0x68, Timing::delayMs);
 * RegisterValue accel;
 * if (regs.read(RegisterSpec::triple(0x3B), accel) == ImuResult::OK) {
 *     RawSample raw = accel.tripleValue();
 * }
 * @endcode
 */
class RegisterAccess {
public:
    static constexpr size_t kMaxWidth = 6;

    /// Settle time between a register write and its read-back
    static constexpr uint32_t kWriteSettleMs = 1;

    RegisterAccess(SensorBus* bus, uint8_t dev_addr, DelayFn delay);

    /**
     * @brief Read and decode a register span
     * @return ERR_ARGUMENT for an unsupported width, ERR_BUS on transport failure
     */
    ImuResult read(const RegisterSpec& spec, RegisterValue& out);

    /**
     * @brief Optionally write, then read back and decode
     *
     * When value is nullptr this is a plain read. Otherwise value_len
     * bytes are written to consecutive registers starting at
     * spec.address, then the span is read back and returned.
     *
     * @param spec Register span
     * @param value Bytes to write (nullptr for read-only)
     * @param value_len Number of bytes in value; must equal spec.width
     * @param out Decoded read-back
     */
    ImuResult access(const RegisterSpec& spec, const uint8_t* value, size_t value_len,
                     RegisterValue& out);

    /**
     * @brief Write one byte then read it back
     */
    ImuResult writeByte(uint8_t address, uint8_t value, uint8_t& readback);

    /**
     * @brief Decode raw big-endian bytes per spec (no I/O)
     */
    static ImuResult decode(const RegisterSpec& spec, const uint8_t* bytes, RegisterValue& out);

    static bool isSupportedWidth(uint8_t width);

    void setDeviceAddress(uint8_t dev_addr) { m_dev_addr = dev_addr; }
    uint8_t getDeviceAddress() const { return m_dev_addr; }

    /// Enable per-register trace output (configuration "debug" flag)
    void setTrace(bool enable) { m_trace = enable; }

    /// Transport code of the most recent failed bus call
    BusResult lastBusResult() const { return m_last_bus_result; }

private:
    ImuResult fail(BusResult result, uint8_t address);

    SensorBus* m_bus;
    uint8_t m_dev_addr;
    DelayFn m_delay;
    bool m_trace;
    BusResult m_last_bus_result;
};

} // namespace hal
} // namespace mpu6886

#endif // MPU6886_HAL_REGISTER_ACCESS_H
