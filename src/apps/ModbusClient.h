/**
 * @file ModbusClient.h
 * @brief Modbus TCP client class header
 */

#pragma once

#include "core/ModbusCore.h"
#include "core/ModbusCodec.hpp"
#include "interfaces/ModbusConnection.h"
#include "utils/ModbusDebug.hpp"

#ifndef WIZMODBUS_DEFAULT_REQUEST_TIMEOUT_MS
    #define WIZMODBUS_DEFAULT_REQUEST_TIMEOUT_MS 500
#endif

namespace WizModbus {

class Client {
public:
    // ===================================================================================
    // CONSTANTS
    // ===================================================================================

    static constexpr uint32_t DEFAULT_REQUEST_TIMEOUT_MS = WIZMODBUS_DEFAULT_REQUEST_TIMEOUT_MS; // Max RTT before giving up on the current request
    static constexpr uint16_t FIRST_TRANSACTION_ID = 1;

    // ===================================================================================
    // RESULT TYPES
    // ===================================================================================

    enum Result {
        SUCCESS,
        ERR_INVALID_REQUEST,
        ERR_NOT_CONNECTED,
        ERR_CONNECT,
        ERR_CONNECT_TIMEOUT,
        ERR_COMMUNICATION_LOST,
        ERR_FRAMING,
        ERR_MODBUS_EXCEPTION,
        ERR_RECONNECT_EXHAUSTED
    };
    static constexpr const char* toString(const Result result) {
        switch (result) {
            case SUCCESS: return "success";
            case ERR_INVALID_REQUEST: return "invalid request";
            case ERR_NOT_CONNECTED: return "not connected";
            case ERR_CONNECT: return "connect failed";
            case ERR_CONNECT_TIMEOUT: return "connect timeout";
            case ERR_COMMUNICATION_LOST: return "communication lost";
            case ERR_FRAMING: return "framing error";
            case ERR_MODBUS_EXCEPTION: return "modbus exception";
            case ERR_RECONNECT_EXHAUSTED: return "reconnect attempts exhausted";
            default: return "unknown result";
        }
    }

    /* @brief Helper to cast an error
     * @return The error result
     * @note Captures point of call context & prints a log message when debug
     * is enabled. No overhead when debug is disabled (except for
     * the desc string, if any)
     */
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

    /* @brief Helper to cast a success
     * @return Result::SUCCESS
     */
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

    // ===================================================================================
    // CONFIG
    // ===================================================================================

    struct Config {
        uint8_t unitId = WizModbus::DEFAULT_UNIT_ID;
        uint32_t requestTimeoutMs = DEFAULT_REQUEST_TIMEOUT_MS;
        bool autoReconnect = true;  // Rebuild a lost session before the next request
    };

    // ===================================================================================
    // CONSTRUCTOR & PUBLIC METHODS
    // ===================================================================================

    Client(WizModbusInterface::ConnectionManager& conn, const Config& cfg);
    explicit Client(WizModbusInterface::ConnectionManager& conn);

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    Result connect();
    void disconnect();

    Result readHoldingRegisters(uint16_t startAddress, uint16_t count, std::vector<uint16_t>& out);
    Result readInputRegisters(uint16_t startAddress, uint16_t count, std::vector<uint16_t>& out);
    Result writeSingleRegister(uint16_t address, uint16_t value);
    Result writeMultipleRegisters(uint16_t startAddress, const std::vector<uint16_t>& values);

    // Raw code of the last exception response (0x00 when the last call got none)
    uint8_t lastException() const { return _lastException; }
    WizModbusInterface::ConnectionManager::State currentState();
    WizModbusInterface::ConnectionManager::Diagnostics getDiagnostics();

private:
    // ===================================================================================
    // PRIVATE MEMBERS
    // ===================================================================================

    WizModbusInterface::ConnectionManager& _conn;
    Config _cfg;
    uint16_t _nextTid = FIRST_TRANSACTION_ID;
    uint8_t _lastException = WizModbus::NULL_EXCEPTION;

    // ADU buffers (one outstanding transaction at a time)
    uint8_t _txStorage[WizModbusCodec::TCP::MAX_FRAME_SIZE];
    uint8_t _rxStorage[WizModbusCodec::TCP::MAX_FRAME_SIZE];

    // ===================================================================================
    // PRIVATE METHODS
    // ===================================================================================

    Result readRegisters(WizModbus::FunctionCode fc, uint16_t startAddress, uint16_t count,
                         std::vector<uint16_t>& out);
    Result transaction(const WizModbus::Frame& request, WizModbus::Frame& response);
    uint16_t allocateTransactionId();
    static Result fromConnectionResult(WizModbusInterface::ConnectionManager::Result res);
};

} // namespace WizModbus
