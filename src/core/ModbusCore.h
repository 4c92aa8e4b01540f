/**
 * @file ModbusCore.h
 * @brief Modbus core definitions
 */

#pragma once

#include "core/ModbusTypes.h"

namespace WizModbus {

// ===================================================================================
// MODBUS CONSTANTS
// ===================================================================================

    static constexpr size_t MIN_PDU_SIZE = 1;      // FC only
    static constexpr size_t MAX_PDU_SIZE = 253;    // Excludes MBAP header
    static constexpr size_t MAX_REGISTERS_READ = 125;   // Maximum registers per read request
    static constexpr size_t MAX_REGISTERS_WRITE = 123;  // Maximum registers per multi-write request
    static constexpr uint16_t MAX_REG_ADDR = 0xFFFF;
    static constexpr size_t FRAME_DATASIZE = 125; // Maximum number of registers carried by a WizModbus::Frame
    static constexpr uint16_t DEFAULT_TCP_PORT = 502;
    static constexpr uint8_t DEFAULT_UNIT_ID = 1;

// ===================================================================================
// MODBUS FUNCTION CODES
// ===================================================================================

    /* @brief The function codes supported by the client.
     */
    enum FunctionCode : uint8_t {
        NULL_FC = 0x00,
        READ_HOLDING_REGISTERS = 0x03,
        READ_INPUT_REGISTERS = 0x04,
        WRITE_REGISTER = 0x06,
        WRITE_MULTIPLE_REGISTERS = 0x10
    };
    static constexpr const char* toString(FunctionCode fc) {
        switch (fc) {
            case NULL_FC: return "null function code";
            case READ_HOLDING_REGISTERS: return "read holding registers";
            case READ_INPUT_REGISTERS: return "read input registers";
            case WRITE_REGISTER: return "write single register";
            case WRITE_MULTIPLE_REGISTERS: return "write multiple registers";
            default: return "invalid function code";
        }
    }
    static constexpr bool isValid(const FunctionCode fc) {
        switch (fc) {
            case READ_HOLDING_REGISTERS:
            case READ_INPUT_REGISTERS:
            case WRITE_REGISTER:
            case WRITE_MULTIPLE_REGISTERS:
                return true;
            default:
                return false;
        }
    }

// ===================================================================================
// MODBUS EXCEPTION CODES
// ===================================================================================

    /* @brief The type of an exception code.
     * @note Only the standard codes are named. A PLC may answer with any other
     *       non-zero byte (vendor codes), which is carried as-is.
     */
    enum ExceptionCode : uint8_t {
        NULL_EXCEPTION = 0x00,
        ILLEGAL_FUNCTION = 0x01,
        ILLEGAL_DATA_ADDRESS = 0x02,
        ILLEGAL_DATA_VALUE = 0x03,
        SLAVE_DEVICE_FAILURE = 0x04,
        ACKNOWLEDGE = 0x05,
        SLAVE_DEVICE_BUSY = 0x06,
        NEGATIVE_ACKNOWLEDGE = 0x07,
        MEMORY_PARITY_ERROR = 0x08,
        GATEWAY_PATH_UNAVAILABLE = 0x0A,
        GATEWAY_TARGET_NO_RESPONSE = 0x0B
    };
    static constexpr const char* toString(ExceptionCode ec) {
        switch (ec) {
            case NULL_EXCEPTION: return "no exception";
            case ILLEGAL_FUNCTION: return "illegal function";
            case ILLEGAL_DATA_ADDRESS: return "illegal data address";
            case ILLEGAL_DATA_VALUE: return "illegal data value";
            case SLAVE_DEVICE_FAILURE: return "slave device failure";
            case ACKNOWLEDGE: return "acknowledge";
            case SLAVE_DEVICE_BUSY: return "slave device busy";
            case NEGATIVE_ACKNOWLEDGE: return "negative acknowledge";
            case MEMORY_PARITY_ERROR: return "memory parity error";
            case GATEWAY_PATH_UNAVAILABLE: return "gateway path unavailable";
            case GATEWAY_TARGET_NO_RESPONSE: return "gateway target failed to respond";
            default: return "non-standard exception code";
        }
    }

// ===================================================================================
// MODBUS MESSAGE TYPES
// ===================================================================================

    /* @brief The type of a Modbus message.
     */
    enum MsgType {
        NULL_MSG,
        REQUEST,
        RESPONSE
    };
    static constexpr const char* toString(MsgType type) {
        switch (type) {
            case NULL_MSG: return "undefined message type";
            case REQUEST: return "request";
            case RESPONSE: return "response";
            default: return "invalid message type";
        }
    }
    static constexpr bool isValid(const MsgType type) {
        return type == REQUEST || type == RESPONSE;
    }

// ===================================================================================
// HELPER FUNCTIONS
// ===================================================================================

    /* @brief Check a register range against the bounds of a function code
     * @param fc The function code the range will be used with
     * @param startAddress First register of the range
     * @param count Number of registers
     * @return true if count is within the function code limits and the range
     *         does not run past the last register address
     */
    inline bool isValidRange(const FunctionCode fc, const uint16_t startAddress, const size_t count) {
        size_t maxCount;
        switch (fc) {
            case READ_HOLDING_REGISTERS:
            case READ_INPUT_REGISTERS:      maxCount = MAX_REGISTERS_READ; break;
            case WRITE_MULTIPLE_REGISTERS:  maxCount = MAX_REGISTERS_WRITE; break;
            case WRITE_REGISTER:            maxCount = 1; break;
            default: return false;
        }
        if (count < 1 || count > maxCount) return false;
        return (uint32_t)startAddress + (uint32_t)count - 1 <= (uint32_t)MAX_REG_ADDR;
    }

} // namespace WizModbus
