/**
 * @file ModbusCodec.hpp
 * @brief Modbus TCP codec (ADU framing & response validation)
 */

#pragma once

#include "core/ModbusCore.h"
#include "core/ModbusFrame.hpp"
#include "utils/ModbusDebug.hpp"

namespace WizModbusCodec {

    enum Result {
        SUCCESS,
        // General errors
        ERR_INVALID_TYPE,
        ERR_INVALID_LEN,
        ERR_BUFFER_OVERFLOW,
        // PDU errors
        ERR_INVALID_FC,
        ERR_INVALID_REG_ADDR,
        ERR_INVALID_REG_COUNT,
        ERR_INVALID_BYTE_COUNT,
        ERR_INVALID_DATA,
        ERR_INVALID_EXCEPTION,
        // MBAP errors
        ERR_INVALID_MBAP_LEN,
        ERR_INVALID_MBAP_PROTOCOL_ID,
        // Request/response matching errors
        ERR_TRANSACTION_MISMATCH,
        ERR_UNIT_ID_MISMATCH,
        ERR_FC_MISMATCH,
        ERR_COUNT_MISMATCH,
        ERR_ECHO_MISMATCH
    };
    static constexpr const char* toString(const Result result) {
        switch (result) {
            case SUCCESS: return "success";
            case ERR_INVALID_TYPE: return "invalid message type";
            case ERR_INVALID_LEN: return "invalid length";
            case ERR_BUFFER_OVERFLOW: return "buffer overflow";
            case ERR_INVALID_FC: return "invalid function code";
            case ERR_INVALID_REG_ADDR: return "invalid register address";
            case ERR_INVALID_REG_COUNT: return "invalid register count";
            case ERR_INVALID_BYTE_COUNT: return "invalid byte count";
            case ERR_INVALID_DATA: return "invalid data";
            case ERR_INVALID_EXCEPTION: return "invalid exception";
            case ERR_INVALID_MBAP_LEN: return "invalid MBAP length";
            case ERR_INVALID_MBAP_PROTOCOL_ID: return "invalid MBAP protocol ID";
            case ERR_TRANSACTION_MISMATCH: return "transaction ID mismatch (stale response)";
            case ERR_UNIT_ID_MISMATCH: return "unit ID mismatch";
            case ERR_FC_MISMATCH: return "function code mismatch";
            case ERR_COUNT_MISMATCH: return "register count mismatch";
            case ERR_ECHO_MISMATCH: return "write echo mismatch";
            default: return "unknown error";
        }
    }

    // Helper to cast an error
    // - Returns a Result
    // - Captures point of call context & prints a log message when debug
    // is enabled. No overhead when debug is disabled (except for
    // the desc string, if any)
    static inline Result Error(Result res, const char* desc = nullptr
                        #ifdef WIZMODBUS_DEBUG
                        , WizModbus::Debug::CallCtx ctx = WizModbus::Debug::CallCtx()
                        #endif
                        ) {
        #ifdef WIZMODBUS_DEBUG
            if (desc && *desc != '\0') {
                WizModbus::Debug::LOG_MSGF_CTX(ctx, "Error: %s (%s)", toString(res), desc);
            } else {
                WizModbus::Debug::LOG_MSGF_CTX(ctx, "Error: %s", toString(res));
            }
        #endif
        return res;
    }

    // Helper to cast a success
    // - Returns Result::SUCCESS
    // - Logs desc (if any) with the call context when debug is enabled
    static inline Result Success(const char* desc = nullptr
                          #ifdef WIZMODBUS_DEBUG
                          , WizModbus::Debug::CallCtx ctx = WizModbus::Debug::CallCtx()
                          #endif
                          ) {
        #ifdef WIZMODBUS_DEBUG
            if (desc && *desc != '\0') {
                WizModbus::Debug::LOG_MSGF_CTX(ctx, "Success: %s", desc);
            }
        #endif
        return SUCCESS;
    }


    // "Raw" validation methods - work both for encoding and decoding using
    // the raw values of the frame fields

    inline bool isValidFunctionCode(const uint8_t fc) {
        return WizModbus::isValid(static_cast<WizModbus::FunctionCode>(fc));
    }

    /* @brief Check if an exception code is valid
     * @note Requests never carry one. A response may carry any code, including
     *       non-standard ones (0x00 means "no exception").
     * @param ec The exception code to check
     * @param type The message type
     * @return true if the exception code is valid, false otherwise
     */
    inline bool isValidExceptionCode(const uint8_t ec, const WizModbus::MsgType type = WizModbus::RESPONSE) {
        return type == WizModbus::RESPONSE || ec == 0x00;
    }

    /* @brief Check a register count against the function code limits
     * @param regCount The register count to check
     * @param fc The function code
     * @return true if the register count is valid, false otherwise
     */
    inline bool isValidRegisterCount(const uint16_t regCount, const uint8_t fc) {
        switch ((WizModbus::FunctionCode)fc) {
            case WizModbus::WRITE_REGISTER:
                return regCount == 1;
            case WizModbus::READ_HOLDING_REGISTERS:
            case WizModbus::READ_INPUT_REGISTERS:
                return regCount >= 1 && regCount <= (uint32_t)WizModbus::MAX_REGISTERS_READ;
            case WizModbus::WRITE_MULTIPLE_REGISTERS:
                return regCount >= 1 && regCount <= (uint32_t)WizModbus::MAX_REGISTERS_WRITE;
            default:
                return false;
        }
    }

    /* @brief Check that a range does not run past the last register address
     * @param address First register
     * @param regCount Number of registers
     */
    inline bool isValidRegisterRange(const uint16_t address, const uint16_t regCount) {
        return (uint32_t)address + regCount - 1 <= (uint32_t)WizModbus::MAX_REG_ADDR;
    }

    /* @brief Check if a frame can be encoded
     * @param frame The frame to check
     * @return The result of the check
     */
    inline Result isValidFrame(const WizModbus::Frame& frame) {
        if (!WizModbus::isValid(frame.type)) {
            return Error(ERR_INVALID_TYPE);
        }
        if (!isValidFunctionCode((uint8_t)frame.fc)) {
            return Error(ERR_INVALID_FC);
        }
        if (!isValidExceptionCode((uint8_t)frame.exceptionCode, frame.type)) {
            return Error(ERR_INVALID_EXCEPTION);
        }
        if (frame.exceptionCode != WizModbus::NULL_EXCEPTION) return Success();
        if (!isValidRegisterCount(frame.regCount, (uint8_t)frame.fc)) {
            return Error(ERR_INVALID_REG_COUNT);
        }
        if (!isValidRegisterRange(frame.regAddress, frame.regCount)) {
            return Error(ERR_INVALID_REG_ADDR, "range past last register");
        }
        return Success();
    }

/* @brief The Modbus PDU codec.
 * @note Generates & extracts the PDU (FC + data) from a WizModbus::Frame
 */
class PDU {

    public:

    /* @brief Set the PDU of a WizModbus::Frame from a byte buffer.
     * @note If an error occurs, the whole frame is cleared.
     * @param bytes The PDU bytes (FC + data, no MBAP)
     * @param pdu The frame to fill
     * @param type The message type
     * @return The result of the operation
     */
    static Result setFromBytes(const ByteBuffer& bytes, WizModbus::Frame& pdu,
                               const WizModbus::MsgType type) {
        if (bytes.empty()) return HandleError(pdu, ERR_INVALID_LEN, "empty buffer");

        // Bit 7 of the FC flags an exception response
        uint8_t rawFc = bytes[0];
        bool isException = (rawFc & 0x80) != 0;
        rawFc &= 0x7F;
        if (!isValidFunctionCode(rawFc)) return HandleError(pdu, ERR_INVALID_FC);
        pdu.fc = static_cast<WizModbus::FunctionCode>(rawFc);
        pdu.exceptionCode = WizModbus::NULL_EXCEPTION;

        if (isException) {
            if (type == WizModbus::REQUEST) return HandleError(pdu, ERR_INVALID_EXCEPTION, "exception in request");
            if (bytes.size() != 2) return HandleError(pdu, ERR_INVALID_LEN);
            uint8_t ec = bytes[1];
            if (ec == 0x00) return HandleError(pdu, ERR_INVALID_EXCEPTION, "null exception code");
            pdu.exceptionCode = static_cast<WizModbus::ExceptionCode>(ec);
            pdu.regCount = 0;
            return Success();
        }

        switch (pdu.fc) {
            case WizModbus::READ_HOLDING_REGISTERS:
            case WizModbus::READ_INPUT_REGISTERS: {
                if (type == WizModbus::REQUEST) {
                    if (bytes.size() != 5) return HandleError(pdu, ERR_INVALID_LEN);
                    pdu.regAddress = (bytes[1] << 8) | bytes[2];
                    pdu.regCount = (bytes[3] << 8) | bytes[4];
                    if (!isValidRegisterCount(pdu.regCount, (uint8_t)pdu.fc)) {
                        return HandleError(pdu, ERR_INVALID_REG_COUNT);
                    }
                } else {
                    if (bytes.size() < 2) return HandleError(pdu, ERR_INVALID_LEN);
                    uint8_t byteCount = bytes[1];
                    if (bytes.size() != (size_t)byteCount + 2) return HandleError(pdu, ERR_INVALID_LEN);
                    if (byteCount == 0 || byteCount % 2 != 0) return HandleError(pdu, ERR_INVALID_BYTE_COUNT);
                    if (byteCount / 2 > WizModbus::FRAME_DATASIZE) return HandleError(pdu, ERR_INVALID_BYTE_COUNT);

                    pdu.clearData();
                    for (size_t i = 0; i < byteCount; i += 2) {
                        pdu.data[i / 2] = (uint16_t)((bytes[2 + i] << 8) | bytes[2 + i + 1]);
                    }
                    pdu.regCount = byteCount / 2;
                }
                break;
            }

            case WizModbus::WRITE_REGISTER: {
                // Request & response share the same layout (echo)
                if (bytes.size() != 5) return HandleError(pdu, ERR_INVALID_LEN);
                pdu.regAddress = (bytes[1] << 8) | bytes[2];
                pdu.clearData();
                pdu.data[0] = (uint16_t)((bytes[3] << 8) | bytes[4]);
                pdu.regCount = 1;
                break;
            }

            case WizModbus::WRITE_MULTIPLE_REGISTERS: {
                if (type == WizModbus::REQUEST) {
                    if (bytes.size() < 6) return HandleError(pdu, ERR_INVALID_LEN);
                    pdu.regAddress = (bytes[1] << 8) | bytes[2];
                    pdu.regCount = (bytes[3] << 8) | bytes[4];
                    uint8_t byteCount = bytes[5];
                    if (bytes.size() != (size_t)byteCount + 6) return HandleError(pdu, ERR_INVALID_LEN);
                    if (!isValidRegisterCount(pdu.regCount, (uint8_t)pdu.fc)) return HandleError(pdu, ERR_INVALID_REG_COUNT);
                    if (byteCount != pdu.regCount * 2) return HandleError(pdu, ERR_INVALID_BYTE_COUNT);

                    pdu.clearData();
                    for (size_t i = 0; i < byteCount; i += 2) {
                        pdu.data[i / 2] = (uint16_t)((bytes[6 + i] << 8) | bytes[6 + i + 1]);
                    }
                } else {
                    if (bytes.size() != 5) return HandleError(pdu, ERR_INVALID_LEN);
                    pdu.regAddress = (bytes[1] << 8) | bytes[2];
                    pdu.regCount = (bytes[3] << 8) | bytes[4];
                }
                break;
            }

            default:
                return HandleError(pdu, ERR_INVALID_FC);
        }

        return Success();
    }

    /* @brief Append the PDU of a WizModbus::Frame to a byte buffer.
     * @note The bytes are cleared if an error occurs.
     * @param pdu The frame to append
     * @param type The message type
     * @param bytes The buffer to append to
     * @param pos Index to write the PDU at, or SIZE_MAX to append at the end
     * @return The result of the operation
     */
    static Result appendToBytes(const WizModbus::Frame& pdu, const WizModbus::MsgType type,
                                ByteBuffer& bytes, size_t pos = SIZE_MAX) {
        if (pos != SIZE_MAX) {
            if (!bytes.resize(pos)) return HandleError(bytes, ERR_BUFFER_OVERFLOW);
        }
        if (bytes.free_space() < computePduLength(pdu, type)) {
            return HandleError(bytes, ERR_BUFFER_OVERFLOW);
        }

        uint8_t fc = (uint8_t)pdu.fc;
        if (pdu.exceptionCode != WizModbus::NULL_EXCEPTION) fc |= 0x80;
        bytes.push_back(fc);

        if (pdu.exceptionCode != WizModbus::NULL_EXCEPTION) {
            bytes.push_back((uint8_t)pdu.exceptionCode);
            return Success();
        }

        switch (pdu.fc) {
            case WizModbus::READ_HOLDING_REGISTERS:
            case WizModbus::READ_INPUT_REGISTERS: {
                if (type == WizModbus::REQUEST) {
                    pushWord(bytes, pdu.regAddress);
                    pushWord(bytes, pdu.regCount);
                } else {
                    bytes.push_back((uint8_t)(pdu.regCount * 2));
                    for (size_t i = 0; i < pdu.regCount; i++) {
                        pushWord(bytes, pdu.data[i]);
                    }
                }
                break;
            }

            case WizModbus::WRITE_REGISTER: {
                pushWord(bytes, pdu.regAddress);
                pushWord(bytes, pdu.data[0]);
                break;
            }

            case WizModbus::WRITE_MULTIPLE_REGISTERS: {
                pushWord(bytes, pdu.regAddress);
                pushWord(bytes, pdu.regCount);
                if (type == WizModbus::REQUEST) {
                    bytes.push_back((uint8_t)(pdu.regCount * 2));
                    for (size_t i = 0; i < pdu.regCount; i++) {
                        pushWord(bytes, pdu.data[i]);
                    }
                }
                break;
            }

            default:
                return HandleError(bytes, ERR_INVALID_FC);
        }
        return Success();
    }

    private:

    /* @brief Compute the encoded length of a PDU.
     * @param pdu The frame to measure
     * @param type The message type (request or response)
     * @return The PDU length in bytes
     */
    static size_t computePduLength(const WizModbus::Frame& pdu, WizModbus::MsgType type) {
        if (pdu.exceptionCode != WizModbus::NULL_EXCEPTION) {
            return /*FC*/1 + /*exceptionCode*/1;
        }
        switch (pdu.fc) {
            case WizModbus::READ_HOLDING_REGISTERS:
            case WizModbus::READ_INPUT_REGISTERS:
                // Request: FC + addr + count | Response: FC + byteCount + 2*regCount
                return (type == WizModbus::REQUEST) ? 1 + 2 + 2 : 1 + 1 + pdu.regCount * 2;
            case WizModbus::WRITE_REGISTER:
                return 1 + 2 + 2;
            case WizModbus::WRITE_MULTIPLE_REGISTERS:
                // Request: FC + addr + count + byteCount + 2*regCount | Response: FC + addr + count
                return (type == WizModbus::REQUEST) ? 1 + 2 + 2 + 1 + pdu.regCount * 2 : 1 + 2 + 2;
            default:
                return 1;
        }
    }

    static void pushWord(ByteBuffer& bytes, uint16_t word) {
        bytes.push_back((word >> 8) & 0xFF);
        bytes.push_back(word & 0xFF);
    }

    // Clear an object + cast an error (for appendToBytes & setFromBytes)
    template<typename T>
    static Result HandleError(T& objectToClear, Result errorCode, const char* desc = nullptr
                    #ifdef WIZMODBUS_DEBUG
                    , WizModbus::Debug::CallCtx ctx = WizModbus::Debug::CallCtx()
                    #endif
                    ) {
        objectToClear.clear();
        #ifdef WIZMODBUS_DEBUG
            return Error(errorCode, desc, ctx);
        #else
            return Error(errorCode, desc);
        #endif
    }

}; // class PDU


/* @brief The Modbus TCP codec.
 * @note Builds ADUs ([MBAP][PDU], big-endian) and validates responses
 *       against the request they answer.
 */
class TCP {
public:

    /* @brief The Modbus Application Protocol header.
     */
    struct MBAP {
        uint16_t transactionId;
        uint16_t protocolId = 0;
        uint16_t length;
        uint8_t unitId = WizModbus::DEFAULT_UNIT_ID;

        void writeToBytes(ByteBuffer& bytes, size_t offset) const {
            if (bytes.capacity() < offset + MBAP_SIZE) return;
            bytes.write_at(offset + 0, (transactionId >> 8));
            bytes.write_at(offset + 1, (transactionId & 0xFF));
            bytes.write_at(offset + 2, (protocolId >> 8));
            bytes.write_at(offset + 3, (protocolId & 0xFF));
            bytes.write_at(offset + 4, (length >> 8));
            bytes.write_at(offset + 5, (length & 0xFF));
            bytes.write_at(offset + 6, unitId);
        }

        static MBAP readFromBytes(const ByteBuffer& bytes) {
            return MBAP{
                .transactionId = (uint16_t)((bytes[0] << 8) | bytes[1]),
                .protocolId = (uint16_t)((bytes[2] << 8) | bytes[3]),
                .length = (uint16_t)((bytes[4] << 8) | bytes[5]),
                .unitId = bytes[6]
            };
        }
    };

    static constexpr uint16_t MBAP_SIZE = 7;
    static constexpr uint16_t MIN_FRAME_SIZE = MBAP_SIZE + WizModbus::MIN_PDU_SIZE;
    static constexpr uint16_t MAX_FRAME_SIZE = MBAP_SIZE + WizModbus::MAX_PDU_SIZE;

    /* @brief Check the MBAP header of a (possibly partial) stream chunk.
     * @param bytes At least MBAP_SIZE bytes starting at a frame boundary
     * @param frameLen Total ADU length announced by the header (MBAP + PDU)
     * @return SUCCESS, ERR_INVALID_LEN if the header is incomplete, or an MBAP error
     */
    static Result peekFrameLength(const ByteBuffer& bytes, size_t& frameLen) {
        frameLen = 0;
        if (bytes.size() < MBAP_SIZE) return ERR_INVALID_LEN;
        MBAP mbap = MBAP::readFromBytes(bytes);
        if (mbap.protocolId != 0) return Error(ERR_INVALID_MBAP_PROTOCOL_ID);
        // length counts the unit ID + PDU
        if (mbap.length < 1 + WizModbus::MIN_PDU_SIZE || mbap.length > 1 + WizModbus::MAX_PDU_SIZE) {
            return Error(ERR_INVALID_MBAP_LEN);
        }
        frameLen = (size_t)6 + mbap.length;
        return SUCCESS;
    }

    /* @brief Decode a Modbus frame from a byte buffer holding exactly one ADU.
     * @param bytes The byte buffer to decode.
     * @param frame The frame to decode into.
     * @param type The message type (request or response).
     * @param transactionId Output: the MBAP transaction ID
     * @return The result of the operation.
     */
    static Result decode(const ByteBuffer& bytes, WizModbus::Frame& frame,
                         const WizModbus::MsgType type, uint16_t& transactionId) {
        if (type != WizModbus::REQUEST && type != WizModbus::RESPONSE) {
            return Error(ERR_INVALID_TYPE);
        }

        if (bytes.size() < MIN_FRAME_SIZE || bytes.size() > MAX_FRAME_SIZE) {
            return Error(ERR_INVALID_LEN);
        }

        MBAP mbap = MBAP::readFromBytes(bytes);
        uint16_t pduLength = bytes.size() - MBAP_SIZE;
        if (mbap.length != pduLength + 1) return Error(ERR_INVALID_MBAP_LEN);
        if (mbap.protocolId != 0) return Error(ERR_INVALID_MBAP_PROTOCOL_ID);

        ByteBuffer pduSlice = bytes.slice(MBAP_SIZE, pduLength);

        Result pduResult = PDU::setFromBytes(pduSlice, frame, type);
        if (pduResult != SUCCESS) return Error(pduResult);

        frame.type = type;
        frame.unitId = mbap.unitId;
        transactionId = mbap.transactionId;

        return Success();
    }

    /* @brief Encode a Modbus frame into a byte buffer.
     * @param frame The frame to encode.
     * @param bytes The byte buffer to encode into.
     * @param transactionId The transaction ID written in the MBAP.
     * @return The result of the operation.
     */
    static Result encode(const WizModbus::Frame& frame, ByteBuffer& bytes, const uint16_t transactionId) {
        bytes.clear();

        Result frameResult = isValidFrame(frame);
        if (frameResult != SUCCESS) return Error(frameResult);

        if (bytes.capacity() < MBAP_SIZE) return Error(ERR_BUFFER_OVERFLOW, "buffer too small for MBAP");

        // appendToBytes clears the bytes on error
        Result pduResult = PDU::appendToBytes(frame, frame.type, bytes, MBAP_SIZE);
        if (pduResult != SUCCESS) return Error(pduResult);

        size_t pduSize = bytes.size() - MBAP_SIZE;

        MBAP mbap = {
            .transactionId = transactionId,
            .protocolId = 0,
            .length = (uint16_t)(pduSize + 1), // +1 for the unit ID
            .unitId = frame.unitId
        };
        mbap.writeToBytes(bytes, 0);

        return Success();
    }

    /* @brief Decode a response and check it answers the outstanding request.
     * @note Checks run in order: MBAP header, transaction ID, PDU structure,
     *       unit ID, function code (or its exception variant), register count
     *       for reads, echoed fields for writes.
     * @note ERR_TRANSACTION_MISMATCH marks a stale frame: the caller may discard
     *       it & keep waiting. Every other error is a framing fault.
     * @note An exception response returns SUCCESS with response.exceptionCode set.
     * @param bytes One complete ADU
     * @param request The request that was sent
     * @param expectedTid Transaction ID of the request
     * @param response Output frame
     * @return The result of the operation
     */
    static Result decodeResponse(const ByteBuffer& bytes, const WizModbus::Frame& request,
                                 const uint16_t expectedTid, WizModbus::Frame& response) {
        response.clear();

        if (bytes.size() < MIN_FRAME_SIZE || bytes.size() > MAX_FRAME_SIZE) {
            return Error(ERR_INVALID_LEN);
        }
        MBAP mbap = MBAP::readFromBytes(bytes);
        if (mbap.protocolId != 0) return Error(ERR_INVALID_MBAP_PROTOCOL_ID);
        if (mbap.length != bytes.size() - MBAP_SIZE + 1) return Error(ERR_INVALID_MBAP_LEN);
        if (mbap.transactionId != expectedTid) return ERR_TRANSACTION_MISMATCH;

        uint16_t tid = 0;
        Result res = decode(bytes, response, WizModbus::RESPONSE, tid);
        if (res != SUCCESS) return res;

        if (response.unitId != request.unitId) {
            response.clear();
            return Error(ERR_UNIT_ID_MISMATCH);
        }
        if (response.fc != request.fc) {
            response.clear();
            return Error(ERR_FC_MISMATCH);
        }
        if (response.exceptionCode != WizModbus::NULL_EXCEPTION) return Success();

        switch (request.fc) {
            case WizModbus::READ_HOLDING_REGISTERS:
            case WizModbus::READ_INPUT_REGISTERS:
                if (response.regCount != request.regCount) {
                    response.clear();
                    return Error(ERR_COUNT_MISMATCH);
                }
                // The response PDU does not carry the address
                response.regAddress = request.regAddress;
                break;

            case WizModbus::WRITE_REGISTER:
                if (response.regAddress != request.regAddress || response.data[0] != request.data[0]) {
                    response.clear();
                    return Error(ERR_ECHO_MISMATCH);
                }
                break;

            case WizModbus::WRITE_MULTIPLE_REGISTERS:
                if (response.regAddress != request.regAddress || response.regCount != request.regCount) {
                    response.clear();
                    return Error(ERR_ECHO_MISMATCH, "partial write");
                }
                break;

            default:
                response.clear();
                return Error(ERR_INVALID_FC);
        }

        return Success();
    }

}; // class TCP

} // namespace WizModbusCodec
