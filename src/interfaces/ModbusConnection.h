/**
 * @file ModbusConnection.h
 * @brief TCP session lifecycle towards the PLC: connect, failure detection,
 *        teardown & bounded reconnection (header)
 */

#pragma once

#include "core/ModbusCore.h"
#include "core/ModbusCodec.hpp"
#include "drivers/ModbusHAL_Socket.h"
#include "interfaces/ModbusArpResolver.h"
#include "utils/ModbusDebug.hpp"

#ifndef WIZMODBUS_RECONNECT_INTERVAL_MS
    #define WIZMODBUS_RECONNECT_INTERVAL_MS 500
#endif
#ifndef WIZMODBUS_CONNECT_POLL_MARGIN_MS
    #define WIZMODBUS_CONNECT_POLL_MARGIN_MS 1000
#endif
#ifndef WIZMODBUS_LINK_WAIT_MS
    #define WIZMODBUS_LINK_WAIT_MS 5000
#endif

namespace WizModbusInterface {

class ConnectionManager {
public:

// ===================================================================================
// CONSTANTS
// ===================================================================================

    static constexpr uint16_t DEFAULT_LOCAL_PORT = 50000;
    // Chip retransmission budget (RTR 500 ms x RCR 10) + client-side poll margin
    static constexpr uint32_t DEFAULT_CONNECT_TIMEOUT_MS = 500 * 10 + WIZMODBUS_CONNECT_POLL_MARGIN_MS;
    static constexpr uint32_t CONNECT_POLL_INTERVAL_MS = 10;
    static constexpr uint32_t LINK_POLL_INTERVAL_MS = 100;
    static constexpr uint32_t RX_POLL_INTERVAL_MS = 1;
    static constexpr size_t RX_BUFFER_SIZE = WizModbusCodec::TCP::MAX_FRAME_SIZE * 2;

// ===================================================================================
// RESULT TYPES
// ===================================================================================

    enum Result {
        SUCCESS,
        NODATA,
        ERR_INVALID_CONFIG,
        ERR_NOT_CONNECTED,
        ERR_CONNECT,
        ERR_CONNECT_TIMEOUT,
        ERR_COMMUNICATION_LOST,
        ERR_RECONNECT_EXHAUSTED,
        ERR_INVALID_FRAME
    };
    static constexpr const char* toString(const Result result) {
        switch (result) {
            case SUCCESS: return "success";
            case NODATA: return "no data";
            case ERR_INVALID_CONFIG: return "invalid configuration";
            case ERR_NOT_CONNECTED: return "not connected";
            case ERR_CONNECT: return "connect failed";
            case ERR_CONNECT_TIMEOUT: return "connect timeout";
            case ERR_COMMUNICATION_LOST: return "communication lost";
            case ERR_RECONNECT_EXHAUSTED: return "reconnect attempts exhausted";
            case ERR_INVALID_FRAME: return "invalid frame";
            default: return "unknown result";
        }
    }

    /* @brief Helper to cast an error
     * @return The error result
     * @note Captures point of call context & prints a log message when debug
     * is enabled
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
// STATE MACHINE
// ===================================================================================

    enum State {
        DISCONNECTED,
        CONNECTING,
        CONNECTED,
        DEGRADED,
        RECONNECTING
    };
    static constexpr const char* toString(const State state) {
        switch (state) {
            case DISCONNECTED: return "disconnected";
            case CONNECTING: return "connecting";
            case CONNECTED: return "connected";
            case DEGRADED: return "degraded";
            case RECONNECTING: return "reconnecting";
            default: return "unknown state";
        }
    }

    enum Backoff {
        BACKOFF_FIXED,
        BACKOFF_EXPONENTIAL
    };

// ===================================================================================
// CONFIG & DATA STRUCTS
// ===================================================================================

    struct Config {
        const char* plcIp = "192.168.123.10";
        uint16_t plcPort = WizModbus::DEFAULT_TCP_PORT;
        uint16_t localPort = DEFAULT_LOCAL_PORT;
        uint32_t connectTimeoutMs = DEFAULT_CONNECT_TIMEOUT_MS;
        uint32_t linkWaitMs = WIZMODBUS_LINK_WAIT_MS;
        uint8_t reconnectRetries = WIZMODBUS_RECONNECT_RETRIES;
        uint32_t reconnectIntervalMs = WIZMODBUS_RECONNECT_INTERVAL_MS;
        Backoff backoff = BACKOFF_FIXED;
        uint32_t maxBackoffMs = 8000;       // Cap for BACKOFF_EXPONENTIAL
    };

    /* @brief The single live TCP session to the PLC
     */
    struct Session {
        int socketHandle = WizModbusHAL::ISocket::INVALID_HANDLE;
        uint16_t localPort = 0;
        WizModbusHAL::IPv4 remoteIp;
        uint16_t remotePort = 0;
        State state = DISCONNECTED;
        uint32_t lastActivityMs = 0;
        uint32_t consecutiveFailures = 0;
    };

    /* @brief Read-only observability snapshot
     */
    struct Diagnostics {
        State state = DISCONNECTED;
        WizModbusHAL::SocketStatus socketStatus = WizModbusHAL::SOCK_CLOSED;
        WizModbusHAL::LinkState link;
        uint32_t consecutiveFailures = 0;
        uint32_t connects = 0;
        uint32_t reconnects = 0;
        uint32_t reconnectAttempts = 0;
        uint32_t communicationLosses = 0;
        uint32_t lastActivityMs = 0;
        ArpResolver::Stats arp;
    };

// ===================================================================================
// CONSTRUCTOR & PUBLIC METHODS
// ===================================================================================

    ConnectionManager(WizModbusHAL::ISocket& socket, ArpResolver& arp, const Config& cfg);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // Lifecycle (locks the manager mutex)
    Result connect();
    Result reconnect();
    void disconnect();
    Result setPlcAddress(const char* ip, uint16_t port);
    State poll();
    State currentState();
    WizModbusHAL::SocketStatus socketStatus();
    Diagnostics getDiagnostics();

    /* @brief The mutex serializing every operation on the session
     * @note A transaction (ensureConnected + send + fetchFrame) must run under
     *       a Lock on this mutex so that no lifecycle call interleaves with it.
     */
    Mutex& transactionMutex() { return _opMutex; }

    // Transaction steps (caller holds transactionMutex())
    Result ensureConnected(bool allowReconnect);
    Result send(const ByteBuffer& adu);
    Result fetchFrame(ByteBuffer& frame, uint32_t timeoutMs);
    void markDegraded(const char* reason = nullptr);

    uint32_t backoffDelayMs(uint32_t attempt) const;

private:
    WizModbusHAL::ISocket& _socket;
    ArpResolver& _arp;
    Config _cfg;
    bool _cfgValid = false;
    Session _session;
    Diagnostics _counters;
    Mutex _opMutex;

    // Persistent RX assembly buffer (bytes past a frame boundary are kept)
    uint8_t _rxStorage[RX_BUFFER_SIZE];
    ByteBuffer _rxBuf;

    Result connectUnsafe();
    Result reconnectUnsafe();
    Result openSessionUnsafe(bool refreshArp);
    void closeSessionUnsafe();
    void setState(State state);
    bool waitForLink();
};

} // namespace WizModbusInterface
