/**
 * @file ModbusArpResolver.cpp
 * @brief ARP cache recovery for the PLC address (implementation)
 */

#include "ModbusArpResolver.h"

namespace WizModbusInterface {

ArpResolver::ArpResolver(WizModbusHAL::ISocket& socket, const Config& cfg)
    : _socket(socket), _cfg(cfg) {
    if (_cfg.maxProbes == 0) _cfg.maxProbes = 1;
    if (_cfg.forceMode) _socket.setForceArpMode(true);
}

ArpResolver::ArpResolver(WizModbusHAL::ISocket& socket)
    : ArpResolver(socket, Config()) {}

/* @brief Re-resolve the MAC of targetIp (best effort)
 * @note Stops at the first answered probe, gives up after maxProbes
 * @param targetIp The address to resolve
 * @return true if the target answered
 */
bool ArpResolver::refresh(const WizModbusHAL::IPv4& targetIp) {
    _stats.refreshes++;
    for (uint8_t i = 0; i < _cfg.maxProbes; i++) {
        _stats.probes++;
        if (_socket.forceArpRefresh(targetIp)) {
            _stale = false;
            WizModbus::Debug::LOG_MSGF("ARP resolved after %d probe(s)", i + 1);
            return true;
        }
    }
    _stats.failures++;
    _stale = true;
    WizModbus::Debug::LOG_MSGF("ARP unresolved after %d probe(s)", _cfg.maxProbes);
    return false;
}

/* @brief Always re-resolve before connecting & enable the chip's own Force-ARP mode
 * @param enable The new policy
 */
void ArpResolver::setForceMode(bool enable) {
    _cfg.forceMode = enable;
    _socket.setForceArpMode(enable);
}

void ArpResolver::invalidate() {
    _stats.invalidations++;
    _stale = true;
}

/* @brief Feed the latest PHY link state; any transition invalidates the resolution
 */
void ArpResolver::onLinkChange(bool linkUp) {
    if (linkUp != _lastLinkUp) {
        WizModbus::Debug::LOG_MSGF("Link %s, ARP entry invalidated", linkUp ? "up" : "down");
        invalidate();
    }
    _lastLinkUp = linkUp;
}

bool ArpResolver::needsRefresh() const {
    return _cfg.forceMode || _stale;
}

} // namespace WizModbusInterface
