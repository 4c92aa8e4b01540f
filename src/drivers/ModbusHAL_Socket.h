/**
 * @file ModbusHAL_Socket.h
 * @brief Hardware socket abstraction (one offloaded TCP/IP socket per handle)
 */

#pragma once

#include "core/ModbusCore.h"

#include <arpa/inet.h>
#include <stdio.h>

namespace WizModbusHAL {

// ===================================================================================
// IPV4 ADDRESS
// ===================================================================================

/* @brief IPv4 address stored as 4 octets in network order
 */
struct IPv4 {
    std::array<uint8_t, 4> octets = {0, 0, 0, 0};

    /* @brief Parse a dotted-quad string
     * @param str The string to parse (ex: "192.168.123.10")
     * @param out The parsed address (untouched on failure)
     * @return true if the string is a valid IPv4 address
     */
    static bool fromString(const char* str, IPv4& out) {
        if (!str) return false;
        struct in_addr addr;
        if (inet_pton(AF_INET, str, &addr) != 1) return false;
        memcpy(out.octets.data(), &addr.s_addr, 4);
        return true;
    }

    /* @brief Format as a dotted-quad string
     * @param buf Destination (at least 16 bytes)
     * @param len Size of the destination
     * @return buf
     */
    const char* toString(char* buf, size_t len) const {
        snprintf(buf, len, "%u.%u.%u.%u", octets[0], octets[1], octets[2], octets[3]);
        return buf;
    }

    bool operator==(const IPv4& other) const { return octets == other.octets; }
    bool operator!=(const IPv4& other) const { return octets != other.octets; }
};

// ===================================================================================
// SOCKET TYPES
// ===================================================================================

    enum Protocol : uint8_t {
        PROTO_TCP = 0x01,
        PROTO_UDP = 0x02
    };

    /* @brief Socket status as reported by the chip (W5500 Sn_SR values)
     */
    enum SocketStatus : uint8_t {
        SOCK_CLOSED = 0x00,
        SOCK_INIT = 0x13,
        SOCK_LISTEN = 0x14,
        SOCK_SYNSENT = 0x15,
        SOCK_SYNRECV = 0x16,
        SOCK_ESTABLISHED = 0x17,
        SOCK_FIN_WAIT = 0x18,
        SOCK_CLOSING = 0x1A,
        SOCK_TIME_WAIT = 0x1B,
        SOCK_CLOSE_WAIT = 0x1C,
        SOCK_LAST_ACK = 0x1D,
        SOCK_UDP = 0x22,
        SOCK_MACRAW = 0x42
    };
    static constexpr const char* toString(const SocketStatus status) {
        switch (status) {
            case SOCK_CLOSED: return "closed";
            case SOCK_INIT: return "init";
            case SOCK_LISTEN: return "listen";
            case SOCK_SYNSENT: return "syn sent";
            case SOCK_SYNRECV: return "syn received";
            case SOCK_ESTABLISHED: return "established";
            case SOCK_FIN_WAIT: return "fin wait";
            case SOCK_CLOSING: return "closing";
            case SOCK_TIME_WAIT: return "time wait";
            case SOCK_CLOSE_WAIT: return "close wait";
            case SOCK_LAST_ACK: return "last ack";
            case SOCK_UDP: return "udp";
            case SOCK_MACRAW: return "macraw";
            default: return "unknown socket status";
        }
    }

    /* @brief PHY link state
     */
    struct LinkState {
        bool up = false;
        bool speed100M = false;
        bool fullDuplex = false;
    };

// ===================================================================================
// SOCKET INTERFACE
// ===================================================================================

/* @brief Single-socket transport exposed by an offload chip.
 * @note No retry or framing semantics: every call maps to one chip operation.
 */
class ISocket {
public:
    static constexpr int INVALID_HANDLE = -1;

    virtual ~ISocket() = default;

    /* @brief Open a socket
     * @param protocol PROTO_TCP or PROTO_UDP
     * @param localPort Source port
     * @return The socket handle, or INVALID_HANDLE on failure
     */
    virtual int open(Protocol protocol, uint16_t localPort) = 0;

    /* @brief Start a TCP connection (non-blocking, poll status() for the outcome)
     * @return false if the command could not be issued
     */
    virtual bool connect(int handle, const IPv4& ip, uint16_t port) = 0;

    /* @brief Send bytes on a connected socket
     * @return Number of bytes sent, or SIZE_MAX on error
     */
    virtual size_t send(int handle, const uint8_t* data, size_t len) = 0;

    /* @brief Read the bytes available on a socket
     * @return Number of bytes read, 0 if nothing is pending, SIZE_MAX on error
     *         or once the socket is closed with nothing left to read
     */
    virtual size_t receive(int handle, uint8_t* dst, size_t maxLen) = 0;

    virtual SocketStatus status(int handle) = 0;

    virtual void close(int handle) = 0;

    virtual LinkState linkState() = 0;

    /* @brief Drop any cached MAC for ip & re-resolve it
     * @return true if the peer answered
     */
    virtual bool forceArpRefresh(const IPv4& ip) = 0;

    /* @brief Toggle the chip-level "ARP before every send" mode
     * @note Default implementation is no-op for transports without this mode
     */
    virtual void setForceArpMode(bool enable) {}
};

} // namespace WizModbusHAL
