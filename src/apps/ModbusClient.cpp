/**
 * @file ModbusClient.cpp
 * @brief Modbus TCP client implementation
 */

#include "ModbusClient.h"

namespace WizModbus {

using Conn = WizModbusInterface::ConnectionManager;

Client::Client(Conn& conn, const Config& cfg)
    : _conn(conn), _cfg(cfg) {}

Client::Client(Conn& conn)
    : Client(conn, Config()) {}

// ===================================================================================
// SESSION
// ===================================================================================

/* @brief Open the session to the PLC
 * @return SUCCESS, ERR_CONNECT or ERR_CONNECT_TIMEOUT
 */
Client::Result Client::connect() {
    Conn::Result res = _conn.connect();
    if (res != Conn::SUCCESS) return Error(fromConnectionResult(res));
    return Success();
}

void Client::disconnect() {
    _conn.disconnect();
}

Conn::State Client::currentState() {
    return _conn.currentState();
}

Conn::Diagnostics Client::getDiagnostics() {
    return _conn.getDiagnostics();
}

// ===================================================================================
// REGISTER OPERATIONS
// ===================================================================================

/* @brief Read holding registers (FC 0x03)
 * @param startAddress First register address
 * @param count Number of registers (1-125)
 * @param out Receives exactly count values on SUCCESS, untouched otherwise
 * @return The result of the transaction
 */
Client::Result Client::readHoldingRegisters(uint16_t startAddress, uint16_t count, std::vector<uint16_t>& out) {
    return readRegisters(WizModbus::READ_HOLDING_REGISTERS, startAddress, count, out);
}

/* @brief Read input registers (FC 0x04)
 * @see readHoldingRegisters()
 */
Client::Result Client::readInputRegisters(uint16_t startAddress, uint16_t count, std::vector<uint16_t>& out) {
    return readRegisters(WizModbus::READ_INPUT_REGISTERS, startAddress, count, out);
}

/* @brief Write one holding register (FC 0x06)
 * @return SUCCESS once the PLC echoed address & value
 */
Client::Result Client::writeSingleRegister(uint16_t address, uint16_t value) {
    if (!WizModbus::isValidRange(WizModbus::WRITE_REGISTER, address, 1)) {
        return Error(ERR_INVALID_REQUEST, "register out of range");
    }

    Frame request;
    request.type = WizModbus::REQUEST;
    request.fc = WizModbus::WRITE_REGISTER;
    request.unitId = _cfg.unitId;
    request.regAddress = address;
    request.setRegisters({value});

    Frame response;
    return transaction(request, response);
}

/* @brief Write contiguous holding registers (FC 0x10)
 * @param values 1-123 values, written from startAddress on
 * @return SUCCESS once the PLC acknowledged every register
 */
Client::Result Client::writeMultipleRegisters(uint16_t startAddress, const std::vector<uint16_t>& values) {
    if (!WizModbus::isValidRange(WizModbus::WRITE_MULTIPLE_REGISTERS, startAddress, values.size())) {
        return Error(ERR_INVALID_REQUEST, "register range out of bounds");
    }

    Frame request;
    request.type = WizModbus::REQUEST;
    request.fc = WizModbus::WRITE_MULTIPLE_REGISTERS;
    request.unitId = _cfg.unitId;
    request.regAddress = startAddress;
    request.setRegisters(values);

    Frame response;
    return transaction(request, response);
}

// ===================================================================================
// PRIVATE METHODS
// ===================================================================================

Client::Result Client::readRegisters(WizModbus::FunctionCode fc, uint16_t startAddress, uint16_t count,
                                     std::vector<uint16_t>& out) {
    if (!WizModbus::isValidRange(fc, startAddress, count)) {
        return Error(ERR_INVALID_REQUEST, "register range out of bounds");
    }

    Frame request;
    request.type = WizModbus::REQUEST;
    request.fc = fc;
    request.unitId = _cfg.unitId;
    request.regAddress = startAddress;
    request.regCount = count;

    Frame response;
    Result res = transaction(request, response);
    if (res != SUCCESS) return res;

    out = response.getRegisters();
    return SUCCESS;
}

/* @brief Run one request/response exchange on the session
 * @note The whole exchange runs under the connection mutex: no reconnect,
 *       disconnect or other transaction can interleave. A fault aborts the
 *       request (it is never resent) & leaves the session DEGRADED.
 * @param request The request to send
 * @param response Output: the validated response
 * @return The result of the transaction
 */
Client::Result Client::transaction(const Frame& request, Frame& response) {
    Lock guard(_conn.transactionMutex());
    _lastException = WizModbus::NULL_EXCEPTION;

    Conn::Result cres = _conn.ensureConnected(_cfg.autoReconnect);
    if (cres != Conn::SUCCESS) return Error(fromConnectionResult(cres));

    uint16_t tid = allocateTransactionId();
    ByteBuffer tx(_txStorage, sizeof(_txStorage));
    WizModbusCodec::Result eres = WizModbusCodec::TCP::encode(request, tx, tid);
    if (eres != WizModbusCodec::SUCCESS) {
        return Error(ERR_INVALID_REQUEST, WizModbusCodec::toString(eres));
    }
    WizModbus::Debug::LOG_FRAME(request, "Request");

    cres = _conn.send(tx);
    if (cres != Conn::SUCCESS) return Error(fromConnectionResult(cres));

    ByteBuffer rx(_rxStorage, sizeof(_rxStorage));
    uint32_t t0 = TIME_MS();
    while (true) {
        uint32_t elapsed = TIME_MS() - t0;
        if (elapsed >= _cfg.requestTimeoutMs) {
            _conn.markDegraded("response timeout");
            return Error(ERR_COMMUNICATION_LOST, "response timeout");
        }

        cres = _conn.fetchFrame(rx, _cfg.requestTimeoutMs - elapsed);
        if (cres == Conn::NODATA) {
            _conn.markDegraded("response timeout");
            return Error(ERR_COMMUNICATION_LOST, "response timeout");
        }
        if (cres != Conn::SUCCESS) return Error(fromConnectionResult(cres));

        WizModbusCodec::Result dres = WizModbusCodec::TCP::decodeResponse(rx, request, tid, response);
        if (dres == WizModbusCodec::ERR_TRANSACTION_MISMATCH) {
            WizModbus::Debug::LOG_MSGF("Discarding stale response (expected TID %u)", tid);
            continue;
        }
        if (dres != WizModbusCodec::SUCCESS) {
            _conn.markDegraded("framing error");
            return Error(ERR_FRAMING, WizModbusCodec::toString(dres));
        }
        break;
    }

    WizModbus::Debug::LOG_FRAME(response, "Response");

    if (response.exceptionCode != WizModbus::NULL_EXCEPTION) {
        _lastException = (uint8_t)response.exceptionCode;
        return Error(ERR_MODBUS_EXCEPTION, WizModbus::toString(response.exceptionCode));
    }
    return Success();
}

// Wraps through 0 after 0xFFFF
uint16_t Client::allocateTransactionId() {
    return _nextTid++;
}

Client::Result Client::fromConnectionResult(Conn::Result res) {
    switch (res) {
        case Conn::SUCCESS: return SUCCESS;
        case Conn::ERR_NOT_CONNECTED: return ERR_NOT_CONNECTED;
        case Conn::ERR_CONNECT_TIMEOUT: return ERR_CONNECT_TIMEOUT;
        case Conn::ERR_RECONNECT_EXHAUSTED: return ERR_RECONNECT_EXHAUSTED;
        case Conn::ERR_INVALID_FRAME: return ERR_FRAMING;
        case Conn::NODATA:
        case Conn::ERR_COMMUNICATION_LOST: return ERR_COMMUNICATION_LOST;
        case Conn::ERR_INVALID_CONFIG:
        case Conn::ERR_CONNECT:
        default: return ERR_CONNECT;
    }
}

} // namespace WizModbus
