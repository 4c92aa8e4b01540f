/**
 * @file ModbusFrame.hpp
 * @brief WizModbus::Frame class def/impl
 */

#pragma once

#include "core/ModbusCore.h"

namespace WizModbus {

// ===================================================================================
// MODBUS FRAME HEADER
// ===================================================================================

/* @brief Contains the detail of a Modbus request or response without protocol
* implementation details (MBAP header, byte count & length are computed by the codec)
*/
struct Frame {
    WizModbus::MsgType type = WizModbus::NULL_MSG;
    WizModbus::FunctionCode fc = WizModbus::NULL_FC;
    uint8_t unitId = WizModbus::DEFAULT_UNIT_ID;
    uint16_t regAddress = 0;
    uint16_t regCount = 0;
    std::array<uint16_t, FRAME_DATASIZE> data = {};
    WizModbus::ExceptionCode exceptionCode = WizModbus::NULL_EXCEPTION;

    void clear();
    void clearData();

    uint16_t getRegister(size_t index) const;
    std::vector<uint16_t> getRegisters() const;

    bool setRegisters(const std::vector<uint16_t>& src);
    bool setRegisters(const std::initializer_list<uint16_t>& src);
    bool setRegisters(const uint16_t* src, size_t len);
};

/* @brief Reset every field to its default value.
    */
inline void Frame::clear() {
    type = NULL_MSG;
    fc = NULL_FC;
    unitId = DEFAULT_UNIT_ID;
    regAddress = 0;
    regCount = 0;
    data.fill(0);
    exceptionCode = NULL_EXCEPTION;
}

inline void Frame::clearData() {
    data.fill(0);
}

// ===================================================================================
// MODBUS FRAME IMPLEMENTATION
// ===================================================================================

/* @brief Get a register value from the frame.
    * @param index Index of the register (relative to regAddress)
    * @return The register value, or 0 if the index is outside regCount
    */
inline uint16_t Frame::getRegister(size_t index) const {
    return (index < regCount && index < FRAME_DATASIZE) ? data[index] : 0;
}

/* @brief Get all the registers carried by the frame.
    * @return A vector of regCount values
    */
inline std::vector<uint16_t> Frame::getRegisters() const {
    size_t count = std::min((size_t)regCount, FRAME_DATASIZE);
    return std::vector<uint16_t>(data.begin(), data.begin() + count);
}

inline bool Frame::setRegisters(const std::vector<uint16_t>& src) {
    return setRegisters(src.data(), src.size());
}

inline bool Frame::setRegisters(const std::initializer_list<uint16_t>& src) {
    return setRegisters(src.begin(), src.size());
}

/* @brief Load register values into the frame & update regCount.
    * @param src Source buffer
    * @param len Number of registers (1 to FRAME_DATASIZE)
    * @return false if the source is empty or too large (frame left untouched)
    */
inline bool Frame::setRegisters(const uint16_t* src, size_t len) {
    if (!src || len == 0 || len > FRAME_DATASIZE) return false;
    data.fill(0);
    memcpy(data.data(), src, len * sizeof(uint16_t));
    regCount = (uint16_t)len;
    return true;
}

} // namespace WizModbus
