/**
 * @file ModbusArpResolver.h
 * @brief ARP cache recovery for the PLC address (header)
 */

#pragma once

#include "core/ModbusCore.h"
#include "drivers/ModbusHAL_Socket.h"
#include "utils/ModbusDebug.hpp"

#ifndef WIZMODBUS_RECONNECT_RETRIES
    #define WIZMODBUS_RECONNECT_RETRIES 10
#endif

namespace WizModbusInterface {

/* @brief Keeps the chip's MAC resolution for one target usable across link flaps.
 * @note A stale ARP entry after a switch reboot or cable swap makes every
 *       connection attempt fail even though the PLC is reachable: refresh()
 *       forces a new resolution before the next attempt.
 */
class ArpResolver {
public:
    struct Config {
        bool forceMode = false;                        // Refresh before every connection attempt + chip Force-ARP mode
        uint8_t maxProbes = WIZMODBUS_RECONNECT_RETRIES; // Probe ceiling per refresh()
    };

    struct Stats {
        uint32_t refreshes = 0;       // refresh() calls
        uint32_t probes = 0;          // Probes sent to the chip
        uint32_t failures = 0;        // refresh() calls that never got an answer
        uint32_t invalidations = 0;
    };

    ArpResolver(WizModbusHAL::ISocket& socket, const Config& cfg);
    explicit ArpResolver(WizModbusHAL::ISocket& socket);

    ArpResolver(const ArpResolver&) = delete;
    ArpResolver& operator=(const ArpResolver&) = delete;

    bool refresh(const WizModbusHAL::IPv4& targetIp);
    void setForceMode(bool enable);
    void invalidate();
    void onLinkChange(bool linkUp);

    bool needsRefresh() const;
    const Stats& getStats() const { return _stats; }

private:
    WizModbusHAL::ISocket& _socket;
    Config _cfg;
    Stats _stats;
    bool _stale = true;    // No resolution known before the first refresh
    bool _lastLinkUp = false;
};

} // namespace WizModbusInterface
