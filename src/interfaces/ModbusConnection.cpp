/**
 * @file ModbusConnection.cpp
 * @brief TCP session lifecycle towards the PLC: connect, failure detection,
 *        teardown & bounded reconnection (implementation)
 */

#include "ModbusConnection.h"

namespace WizModbusInterface {

ConnectionManager::ConnectionManager(WizModbusHAL::ISocket& socket, ArpResolver& arp, const Config& cfg)
    : _socket(socket), _arp(arp), _cfg(cfg), _rxBuf(_rxStorage, sizeof(_rxStorage)) {
    _cfgValid = WizModbusHAL::IPv4::fromString(_cfg.plcIp, _session.remoteIp);
    _session.remotePort = _cfg.plcPort;
    _session.localPort = _cfg.localPort;
    if (_cfg.reconnectRetries == 0) _cfg.reconnectRetries = 1;
    if (!_cfgValid) {
        WizModbus::Debug::LOG_MSGF("Error: invalid PLC address '%s'", _cfg.plcIp ? _cfg.plcIp : "(null)");
    }
}

ConnectionManager::~ConnectionManager() {
    Lock guard(_opMutex);
    closeSessionUnsafe();
}

// ===================================================================================
// LIFECYCLE
// ===================================================================================

/* @brief Open the session: wait for link, refresh ARP if needed, open & connect
 * @return SUCCESS once the socket is established (also if it already was),
 *         ERR_CONNECT (no link, socket open failure, connection refused),
 *         ERR_CONNECT_TIMEOUT, ERR_INVALID_CONFIG
 */
ConnectionManager::Result ConnectionManager::connect() {
    Lock guard(_opMutex);
    return connectUnsafe();
}

/* @brief Nuke & rebuild the session with bounded retries
 * @note Each attempt closes the old socket, forces an ARP refresh, re-opens
 *       & re-connects. Attempts are spaced by the backoff policy.
 * @return SUCCESS or ERR_RECONNECT_EXHAUSTED (state DISCONNECTED)
 */
ConnectionManager::Result ConnectionManager::reconnect() {
    Lock guard(_opMutex);
    return reconnectUnsafe();
}

/* @brief Close the session. Always succeeds, idempotent.
 */
void ConnectionManager::disconnect() {
    Lock guard(_opMutex);
    closeSessionUnsafe();
    setState(DISCONNECTED);
}

/* @brief Retarget the PLC. An open session to a different address is closed.
 */
ConnectionManager::Result ConnectionManager::setPlcAddress(const char* ip, uint16_t port) {
    Lock guard(_opMutex);
    WizModbusHAL::IPv4 addr;
    if (!WizModbusHAL::IPv4::fromString(ip, addr) || port == 0) {
        return Error(ERR_INVALID_CONFIG, "invalid PLC address");
    }
    if (_cfgValid && addr == _session.remoteIp && port == _session.remotePort) return Success();

    closeSessionUnsafe();
    setState(DISCONNECTED);
    _session.remoteIp = addr;
    _session.remotePort = port;
    _cfg.plcPort = port;
    _cfgValid = true;
    _arp.invalidate();
    return Success("PLC address updated");
}

/* @brief Health check of the live session (link & socket status)
 * @return The state after the check
 */
ConnectionManager::State ConnectionManager::poll() {
    Lock guard(_opMutex);
    WizModbusHAL::LinkState link = _socket.linkState();
    _arp.onLinkChange(link.up);

    if (_session.state == CONNECTED) {
        if (!link.up) {
            markDegraded("link down");
        } else if (_socket.status(_session.socketHandle) != WizModbusHAL::SOCK_ESTABLISHED) {
            markDegraded("socket left established state");
        }
    }
    return _session.state;
}

ConnectionManager::State ConnectionManager::currentState() {
    Lock guard(_opMutex);
    return _session.state;
}

WizModbusHAL::SocketStatus ConnectionManager::socketStatus() {
    Lock guard(_opMutex);
    if (_session.socketHandle == WizModbusHAL::ISocket::INVALID_HANDLE) return WizModbusHAL::SOCK_CLOSED;
    return _socket.status(_session.socketHandle);
}

ConnectionManager::Diagnostics ConnectionManager::getDiagnostics() {
    Lock guard(_opMutex);
    Diagnostics d = _counters;
    d.state = _session.state;
    d.socketStatus = (_session.socketHandle == WizModbusHAL::ISocket::INVALID_HANDLE)
                   ? WizModbusHAL::SOCK_CLOSED
                   : _socket.status(_session.socketHandle);
    d.link = _socket.linkState();
    d.consecutiveFailures = _session.consecutiveFailures;
    d.lastActivityMs = _session.lastActivityMs;
    d.arp = _arp.getStats();
    return d;
}

// ===================================================================================
// TRANSACTION STEPS
// ===================================================================================

/* @brief Make sure a live session exists before a transaction
 * @param allowReconnect Rebuild the session from DEGRADED/DISCONNECTED
 * @return SUCCESS, ERR_NOT_CONNECTED (no session & allowReconnect false)
 *         or the reconnect() result
 */
ConnectionManager::Result ConnectionManager::ensureConnected(bool allowReconnect) {
    if (_session.state == CONNECTED) {
        if (!_socket.linkState().up) {
            _arp.onLinkChange(false);
            markDegraded("link down");
        } else if (_socket.status(_session.socketHandle) != WizModbusHAL::SOCK_ESTABLISHED) {
            markDegraded("socket left established state");
        } else {
            return SUCCESS;
        }
    }
    if (!allowReconnect) return Error(ERR_NOT_CONNECTED);
    return reconnectUnsafe();
}

/* @brief Send one ADU on the session
 * @return SUCCESS, ERR_NOT_CONNECTED, or ERR_COMMUNICATION_LOST (session DEGRADED)
 */
ConnectionManager::Result ConnectionManager::send(const ByteBuffer& adu) {
    if (_session.state != CONNECTED) return Error(ERR_NOT_CONNECTED);
    if (adu.empty()) return Error(ERR_INVALID_FRAME, "empty ADU");

    size_t n = _socket.send(_session.socketHandle, adu.data(), adu.size());
    if (n == SIZE_MAX || n != adu.size()) {
        markDegraded("send failed");
        return Error(ERR_COMMUNICATION_LOST, "send failed");
    }
    _session.lastActivityMs = TIME_MS();
    WizModbus::Debug::LOG_HEXDUMP(adu);
    return SUCCESS;
}

/* @brief Wait for the next complete ADU on the session
 * @note Bytes past the returned frame stay buffered for the next call
 * @param frame Destination (capacity >= TCP::MAX_FRAME_SIZE), holds exactly one ADU on SUCCESS
 * @param timeoutMs Maximum wait
 * @return SUCCESS, NODATA on timeout, ERR_INVALID_FRAME (corrupted MBAP header),
 *         ERR_COMMUNICATION_LOST (socket error, socket closed, link down),
 *         ERR_NOT_CONNECTED. Every error leaves the session DEGRADED.
 */
ConnectionManager::Result ConnectionManager::fetchFrame(ByteBuffer& frame, uint32_t timeoutMs) {
    frame.clear();
    if (_session.state != CONNECTED) return Error(ERR_NOT_CONNECTED);
    if (frame.capacity() < WizModbusCodec::TCP::MAX_FRAME_SIZE) {
        return Error(ERR_INVALID_FRAME, "buffer too small");
    }

    uint32_t t0 = TIME_MS();
    while (true) {
        // Extract a frame if the assembly buffer holds one
        if (_rxBuf.size() >= WizModbusCodec::TCP::MBAP_SIZE) {
            size_t frameLen = 0;
            if (WizModbusCodec::TCP::peekFrameLength(_rxBuf, frameLen) != WizModbusCodec::SUCCESS) {
                _rxBuf.clear();
                markDegraded("corrupted stream");
                return Error(ERR_INVALID_FRAME, "invalid MBAP header");
            }
            if (_rxBuf.size() >= frameLen) {
                frame.push_back(_rxBuf.data(), frameLen);
                _rxBuf.pop_front(frameLen);
                _session.lastActivityMs = TIME_MS();
                WizModbus::Debug::LOG_HEXDUMP(frame);
                return SUCCESS;
            }
        }

        size_t currentSize = _rxBuf.size();
        size_t toRead = _rxBuf.free_space();
        _rxBuf.resize(currentSize + toRead);
        size_t n = _socket.receive(_session.socketHandle, _rxBuf.begin() + currentSize, toRead);
        if (n == SIZE_MAX) {
            _rxBuf.trim(currentSize);
            markDegraded("socket error/closed");
            return Error(ERR_COMMUNICATION_LOST, "socket error/closed");
        }
        _rxBuf.trim(currentSize + n);
        if (n > 0) continue;

        // Nothing pending: make sure we are still waiting on a live session
        if (!_socket.linkState().up) {
            _arp.onLinkChange(false);
            markDegraded("link down");
            return Error(ERR_COMMUNICATION_LOST, "link down");
        }
        if (_socket.status(_session.socketHandle) != WizModbusHAL::SOCK_ESTABLISHED) {
            markDegraded("socket left established state");
            return Error(ERR_COMMUNICATION_LOST, "socket not established");
        }
        if (TIME_MS() - t0 >= timeoutMs) return NODATA;
        WAIT_MS(RX_POLL_INTERVAL_MS);
    }
}

/* @brief Flag the session as unusable. The socket is torn down by the next
 *        reconnect() or disconnect().
 * @param reason Logged when debug is enabled
 */
void ConnectionManager::markDegraded(const char* reason) {
    if (_session.state != CONNECTED) return;
    _session.consecutiveFailures++;
    _counters.communicationLosses++;
    setState(DEGRADED);
    WizModbus::Debug::LOG_MSGF("Session degraded: %s", reason ? reason : "unspecified");
}

/* @brief Delay before reconnect attempt number attempt+1
 * @param attempt Number of attempts already made (>= 1)
 */
uint32_t ConnectionManager::backoffDelayMs(uint32_t attempt) const {
    if (_cfg.backoff == BACKOFF_FIXED || attempt <= 1) return _cfg.reconnectIntervalMs;
    uint32_t shift = attempt - 1;
    if (shift >= 16) return _cfg.maxBackoffMs;
    uint64_t delay = (uint64_t)_cfg.reconnectIntervalMs << shift;
    return (uint32_t)std::min<uint64_t>(delay, _cfg.maxBackoffMs);
}

// ===================================================================================
// PRIVATE METHODS
// ===================================================================================

ConnectionManager::Result ConnectionManager::connectUnsafe() {
    if (!_cfgValid) return Error(ERR_INVALID_CONFIG, "invalid PLC address");
    if (_session.state == CONNECTED &&
        _socket.status(_session.socketHandle) == WizModbusHAL::SOCK_ESTABLISHED) {
        return Success();
    }

    closeSessionUnsafe();
    setState(CONNECTING);
    Result res = openSessionUnsafe(false);
    if (res != SUCCESS) {
        _session.consecutiveFailures++;
        setState(DISCONNECTED);
        return res;
    }
    return Success("connected");
}

ConnectionManager::Result ConnectionManager::reconnectUnsafe() {
    if (!_cfgValid) return Error(ERR_INVALID_CONFIG, "invalid PLC address");

    setState(RECONNECTING);
    for (uint32_t attempt = 1; attempt <= _cfg.reconnectRetries; attempt++) {
        closeSessionUnsafe();
        _counters.reconnectAttempts++;
        WizModbus::Debug::LOG_MSGF("Reconnect attempt %u/%u", attempt, _cfg.reconnectRetries);

        if (openSessionUnsafe(true) == SUCCESS) {
            _counters.reconnects++;
            return Success("reconnected");
        }
        _session.consecutiveFailures++;

        if (attempt < _cfg.reconnectRetries) WAIT_MS(backoffDelayMs(attempt));
    }

    closeSessionUnsafe();
    setState(DISCONNECTED);
    return Error(ERR_RECONNECT_EXHAUSTED);
}

/* @brief One connection attempt (state left to the caller, except CONNECTED on success)
 * @param refreshArp Force an ARP refresh even if the resolver considers it fresh
 */
ConnectionManager::Result ConnectionManager::openSessionUnsafe(bool refreshArp) {
    if (!waitForLink()) return Error(ERR_CONNECT, "no link");

    if (refreshArp || _arp.needsRefresh()) {
        if (!_arp.refresh(_session.remoteIp)) {
            WizModbus::Debug::LOG_MSG("ARP refresh unanswered, trying to connect anyway");
        }
    }

    int handle = _socket.open(WizModbusHAL::PROTO_TCP, _cfg.localPort);
    if (handle == WizModbusHAL::ISocket::INVALID_HANDLE) {
        return Error(ERR_CONNECT, "socket open failed");
    }
    _session.socketHandle = handle;

    if (_socket.status(handle) != WizModbusHAL::SOCK_INIT) {
        closeSessionUnsafe();
        return Error(ERR_CONNECT, "socket not in INIT state");
    }
    if (!_socket.connect(handle, _session.remoteIp, _session.remotePort)) {
        closeSessionUnsafe();
        return Error(ERR_CONNECT, "connect command failed");
    }

    uint32_t t0 = TIME_MS();
    while (true) {
        WizModbusHAL::SocketStatus st = _socket.status(handle);
        if (st == WizModbusHAL::SOCK_ESTABLISHED) break;
        if (st == WizModbusHAL::SOCK_CLOSED) {
            closeSessionUnsafe();
            return Error(ERR_CONNECT, "connection refused");
        }
        if (TIME_MS() - t0 >= _cfg.connectTimeoutMs) {
            closeSessionUnsafe();
            return Error(ERR_CONNECT_TIMEOUT);
        }
        WAIT_MS(CONNECT_POLL_INTERVAL_MS);
    }

    _rxBuf.clear();
    _session.consecutiveFailures = 0;
    _session.lastActivityMs = TIME_MS();
    _counters.connects++;
    setState(CONNECTED);
    return SUCCESS;
}

void ConnectionManager::closeSessionUnsafe() {
    if (_session.socketHandle != WizModbusHAL::ISocket::INVALID_HANDLE) {
        _socket.close(_session.socketHandle);
        _session.socketHandle = WizModbusHAL::ISocket::INVALID_HANDLE;
    }
    _rxBuf.clear();
}

void ConnectionManager::setState(State state) {
    if (state == _session.state) return;
    WizModbus::Debug::LOG_MSGF("State %s -> %s", toString(_session.state), toString(state));
    _session.state = state;
}

// Poll the PHY until link is up or linkWaitMs elapses (checked at least once)
bool ConnectionManager::waitForLink() {
    uint32_t t0 = TIME_MS();
    while (true) {
        bool up = _socket.linkState().up;
        _arp.onLinkChange(up);
        if (up) return true;
        if (TIME_MS() - t0 >= _cfg.linkWaitMs) return false;
        WAIT_MS(LINK_POLL_INTERVAL_MS);
    }
}

} // namespace WizModbusInterface
