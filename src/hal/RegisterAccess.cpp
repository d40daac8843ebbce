// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 MPU6886 Driver Project
/**
 * @file RegisterAccess.cpp
 * @brief Register span decoding and write-then-read-back access
 */

#include "RegisterAccess.h"
#include "debug.h"

namespace mpu6886 {
namespace hal {

// ============================================================================
// RegisterValue
// ============================================================================

RegisterValue RegisterValue::makeByte(int16_t value) {
    RegisterValue v;
    v.m_kind = Kind::BYTE;
    v.m_v[0] = value;
    return v;
}

RegisterValue RegisterValue::makeWord(int16_t value) {
    RegisterValue v;
    v.m_kind = Kind::WORD;
    v.m_v[0] = value;
    return v;
}

RegisterValue RegisterValue::makeTriple(int16_t x, int16_t y, int16_t z) {
    RegisterValue v;
    v.m_kind = Kind::TRIPLE;
    v.m_v[0] = x;
    v.m_v[1] = y;
    v.m_v[2] = z;
    return v;
}

RawSample RegisterValue::tripleValue() const {
    if (!isTriple()) {
        return RawSample{0, 0, 0};
    }
    return RawSample{m_v[0], m_v[1], m_v[2]};
}

// ============================================================================
// Decoding
// ============================================================================

// Big-endian two's-complement 16-bit
static int16_t be16(const uint8_t* p) {
    return static_cast<int16_t>(static_cast<uint16_t>((p[0] << 8) | p[1]));
}

bool RegisterAccess::isSupportedWidth(uint8_t width) {
    return width == 1 || width == 2 || width == 6;
}

ImuResult RegisterAccess::decode(const RegisterSpec& spec, const uint8_t* bytes,
                                 RegisterValue& out) {
    if (bytes == nullptr) {
        return ImuResult::ERR_ARGUMENT;
    }

    switch (spec.width) {
        case 1:
            out = RegisterValue::makeByte(spec.is_signed
                                              ? static_cast<int16_t>(static_cast<int8_t>(bytes[0]))
                                              : static_cast<int16_t>(bytes[0]));
            return ImuResult::OK;
        case 2:
            out = RegisterValue::makeWord(be16(bytes));
            return ImuResult::OK;
        case 6:
            out = RegisterValue::makeTriple(be16(&bytes[0]), be16(&bytes[2]), be16(&bytes[4]));
            return ImuResult::OK;
        default:
            return ImuResult::ERR_ARGUMENT;
    }
}

// ============================================================================
// RegisterAccess
// ============================================================================

RegisterAccess::RegisterAccess(SensorBus* bus, uint8_t dev_addr, DelayFn delay)
    : m_bus(bus)
    , m_dev_addr(dev_addr)
    , m_delay(delay)
    , m_trace(false)
    , m_last_bus_result(BusResult::OK)
{
}

ImuResult RegisterAccess::fail(BusResult result, uint8_t address) {
    m_last_bus_result = result;
    DBG_ERROR("[MPU6886] reg 0x%02X on %s: %s\n", address,
              m_bus->getName(), busResultName(result));
    return ImuResult::ERR_BUS;
}

ImuResult RegisterAccess::read(const RegisterSpec& spec, RegisterValue& out) {
    return access(spec, nullptr, 0, out);
}

ImuResult RegisterAccess::access(const RegisterSpec& spec, const uint8_t* value,
                                 size_t value_len, RegisterValue& out) {
    // Argument checks come before any bus traffic
    if (!isSupportedWidth(spec.width)) {
        return ImuResult::ERR_ARGUMENT;
    }
    if (value != nullptr && value_len != spec.width) {
        return ImuResult::ERR_ARGUMENT;
    }
    if (m_bus == nullptr) {
        return ImuResult::ERR_NOT_INITIALIZED;
    }

    if (value != nullptr) {
        for (size_t i = 0; i < value_len; i++) {
            uint8_t reg = static_cast<uint8_t>(spec.address + i);
            BusResult result = m_bus->writeRegister(m_dev_addr, reg, value[i]);
            if (result != BusResult::OK) {
                return fail(result, reg);
            }
        }
        if (m_delay != nullptr) {
            m_delay(kWriteSettleMs);
        }
    }

    uint8_t buf[kMaxWidth] = {};
    BusResult result = m_bus->readRegisters(m_dev_addr, spec.address, buf, spec.width);
    if (result != BusResult::OK) {
        return fail(result, spec.address);
    }

    ImuResult rc = decode(spec, buf, out);
    if (rc == ImuResult::OK && m_trace) {
        if (out.isTriple()) {
            RawSample s = out.tripleValue();
            DBG_PRINT("* reg 0x%02X %u bytes -> (%d, %d, %d)\n", spec.address,
                      spec.width, s.x, s.y, s.z);
        } else {
            DBG_PRINT("* reg 0x%02X %u bytes -> %d\n", spec.address, spec.width,
                      out.isByte() ? out.byteValue() : out.wordValue());
        }
    }
    return rc;
}

ImuResult RegisterAccess::writeByte(uint8_t address, uint8_t value, uint8_t& readback) {
    RegisterValue out;
    ImuResult rc = access(RegisterSpec::byte(address), &value, 1, out);
    if (rc == ImuResult::OK) {
        readback = static_cast<uint8_t>(out.byteValue());
    }
    return rc;
}

} // namespace hal
} // namespace mpu6886
