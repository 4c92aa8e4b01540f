/**
 * @file ModbusHAL_W5500.cpp
 * @brief WIZnet W5500 offload chip driver over ESP-IDF SPI master (implementation)
 */

#include "ModbusHAL_W5500.h"

namespace WizModbusHAL {

W5500::W5500(const Config& cfg) : _cfg(cfg) {
    WizModbus::Debug::LOG_MSGF("Constructor for SPI host %d, CS pin %d", (int)_cfg.spiHost, _cfg.csPin);
}

W5500::~W5500() {
    end();
}

/* @brief Bring the chip up: SPI device, reset, version check, clean socket
 *        state & network configuration
 * @return ESP_OK on success, ESP_ERR_INVALID_STATE if already initialized,
 *         ESP_ERR_INVALID_ARG for an unparsable address, ESP_ERR_NOT_FOUND if
 *         the chip does not answer with the expected version
 */
esp_err_t W5500::begin() {
    if (_initialized) {
        WizModbus::Debug::LOG_MSG("Warning: already initialized. Call end() first.");
        return ESP_ERR_INVALID_STATE;
    }

    if (!IPv4::fromString(_cfg.ip, _ip) ||
        !IPv4::fromString(_cfg.subnet, _subnet) ||
        !IPv4::fromString(_cfg.gateway, _gateway)) {
        WizModbus::Debug::LOG_MSG("Error: invalid IP/subnet/gateway string");
        return ESP_ERR_INVALID_ARG;
    }

    esp_err_t err;
    if (_cfg.initBus) {
        spi_bus_config_t busCfg = {};
        busCfg.mosi_io_num = _cfg.mosiPin;
        busCfg.miso_io_num = _cfg.misoPin;
        busCfg.sclk_io_num = _cfg.sclkPin;
        busCfg.quadwp_io_num = -1;
        busCfg.quadhd_io_num = -1;
        busCfg.max_transfer_sz = sizeof(_txFrame);
        err = spi_bus_initialize(_cfg.spiHost, &busCfg, SPI_DMA_CH_AUTO);
        if (err != ESP_OK) {
            WizModbus::Debug::LOG_MSGF("Error: spi_bus_initialize failed: %s", esp_err_to_name(err));
            return err;
        }
        _busInitialized = true;
    }

    spi_device_interface_config_t devCfg = {};
    devCfg.mode = 0;
    devCfg.clock_speed_hz = _cfg.clockHz;
    devCfg.spics_io_num = _cfg.csPin;
    devCfg.queue_size = 1;
    err = spi_bus_add_device(_cfg.spiHost, &devCfg, &_spi);
    if (err != ESP_OK) {
        WizModbus::Debug::LOG_MSGF("Error: spi_bus_add_device failed: %s", esp_err_to_name(err));
        end();
        return err;
    }

    // Hardware reset pulse (RSTn active low)
    if (_cfg.rstPin >= 0) {
        gpio_num_t rst = static_cast<gpio_num_t>(_cfg.rstPin);
        gpio_reset_pin(rst);
        gpio_set_direction(rst, GPIO_MODE_OUTPUT);
        gpio_set_level(rst, 0);
        WAIT_MS(RESET_PULSE_MS);
        gpio_set_level(rst, 1);
        WAIT_MS(RESET_SETTLE_MS);
    }

    uint8_t ver = version();
    if (ver != CHIP_VERSION) {
        WizModbus::Debug::LOG_MSGF("Error: unexpected chip version 0x%02X (expected 0x%02X)", ver, CHIP_VERSION);
        end();
        return ESP_ERR_NOT_FOUND;
    }

    _initialized = true;

    err = cleanState();
    if (err != ESP_OK) {
        end();
        return err;
    }

    char ipStr[16];
    WizModbus::Debug::LOG_MSGF("W5500 ready, IP %s, RTR %u ms x RCR %u", _ip.toString(ipStr, sizeof(ipStr)),
                               _cfg.retryTimeMs, _cfg.retryCount);
    return ESP_OK;
}

/* @brief Release the SPI device (and bus if we own it)
 */
void W5500::end() {
    if (_spi) {
        if (_initialized) {
            Lock guard(_spiMutex);
            for (int s = 0; s < MAX_SOCKETS; s++) {
                if (_inUse[s]) closeUnsafe(s);
            }
        }
        spi_bus_remove_device(_spi);
        _spi = nullptr;
    }
    if (_busInitialized) {
        spi_bus_free(_cfg.spiHost);
        _busInitialized = false;
    }
    _initialized = false;
}

/* @brief Close every socket, soft-reset the chip & reapply the network config
 * @note Flushes the chip's ARP cache along with every socket state
 * @return ESP_OK on success, ESP_ERR_TIMEOUT if the soft reset never completes
 */
esp_err_t W5500::cleanState() {
    if (!_initialized) return ESP_ERR_INVALID_STATE;
    Lock guard(_spiMutex);

    for (int s = 0; s < MAX_SOCKETS; s++) {
        writeReg8(SN_CR, socketBsb(s), CMD_CLOSE);
        _inUse[s] = false;
    }
    WAIT_MS(10);

    writeReg8(REG_MR, BSB_COMMON, MR_RST);
    uint32_t t0 = TIME_MS();
    while (readReg8(REG_MR, BSB_COMMON) & MR_RST) {
        if (TIME_MS() - t0 > RESET_SETTLE_MS) {
            WizModbus::Debug::LOG_MSG("Error: soft reset did not complete");
            return ESP_ERR_TIMEOUT;
        }
        WAIT_MS(1);
    }

    applyNetworkConfig();
    WizModbus::Debug::LOG_MSG("Clean state applied (all sockets closed, soft reset)");
    return ESP_OK;
}

/* @brief Pulse the PHY reset bit (link renegotiation)
 */
void W5500::resetPhy() {
    if (!_initialized) return;
    Lock guard(_spiMutex);
    uint8_t phy = readReg8(REG_PHYCFGR, BSB_COMMON);
    writeReg8(REG_PHYCFGR, BSB_COMMON, phy & ~PHY_RST);
    WAIT_MS(RESET_PULSE_MS);
    writeReg8(REG_PHYCFGR, BSB_COMMON, phy | PHY_RST);
    WizModbus::Debug::LOG_MSG("PHY reset");
}

uint8_t W5500::version() {
    Lock guard(_spiMutex);
    return readReg8(REG_VERSIONR, BSB_COMMON);
}

// ===================================================================================
// ISocket
// ===================================================================================

int W5500::open(Protocol protocol, uint16_t localPort) {
    if (!_initialized) return INVALID_HANDLE;
    Lock guard(_spiMutex);
    return openUnsafe(protocol, localPort);
}

bool W5500::connect(int handle, const IPv4& ip, uint16_t port) {
    Lock guard(_spiMutex);
    if (!isOpenHandle(handle)) return false;

    uint8_t bsb = socketBsb(handle);
    if (readReg8(SN_SR, bsb) != SOCK_INIT) {
        WizModbus::Debug::LOG_MSGF("Error: socket %d not in INIT state", handle);
        return false;
    }
    uint8_t ipBytes[4];
    memcpy(ipBytes, ip.octets.data(), 4);
    writeBuf(SN_DIPR, bsb, ipBytes, 4);
    writeReg16(SN_DPORT, bsb, port);
    writeReg8(SN_IR, bsb, 0xFF);
    return execCommand(handle, CMD_CONNECT);
}

/* @brief Copy data to the socket TX buffer & wait for SEND_OK
 * @return len on success, SIZE_MAX on error (socket closed, chip timeout,
 *         no TX space or no SEND_OK within sendTimeoutMs)
 */
size_t W5500::send(int handle, const uint8_t* data, size_t len) {
    Lock guard(_spiMutex);
    if (!isOpenHandle(handle) || !data) return SIZE_MAX;
    if (len == 0) return 0;
    if (len > SOCKET_BUFFER_SIZE) return SIZE_MAX;

    uint8_t bsb = socketBsb(handle);
    uint8_t st = readReg8(SN_SR, bsb);
    if (st != SOCK_ESTABLISHED && st != SOCK_CLOSE_WAIT && st != SOCK_UDP) {
        WizModbus::Debug::LOG_MSGF("Error: socket %d cannot send in state %s", handle, toString((SocketStatus)st));
        return SIZE_MAX;
    }

    uint32_t t0 = TIME_MS();
    while (readReg16Stable(SN_TX_FSR, bsb) < len) {
        if (TIME_MS() - t0 > _cfg.sendTimeoutMs) {
            WizModbus::Debug::LOG_MSGF("Error: socket %d TX buffer full", handle);
            return SIZE_MAX;
        }
        WAIT_MS(1);
    }

    // Pointers are free-running 16-bit offsets, the chip wraps them on the buffer size
    uint16_t ptr = readReg16(SN_TX_WR, bsb);
    if (!writeBuf(ptr, txBufBsb(handle), data, len)) return SIZE_MAX;
    writeReg16(SN_TX_WR, bsb, (uint16_t)(ptr + len));
    if (!execCommand(handle, CMD_SEND)) return SIZE_MAX;

    t0 = TIME_MS();
    while (true) {
        uint8_t ir = readReg8(SN_IR, bsb);
        if (ir & IR_SEND_OK) {
            writeReg8(SN_IR, bsb, IR_SEND_OK);
            return len;
        }
        if (ir & (IR_TIMEOUT | IR_DISCON)) {
            writeReg8(SN_IR, bsb, ir & (IR_TIMEOUT | IR_DISCON));
            WizModbus::Debug::LOG_MSGF("Error: socket %d send failed (IR 0x%02X)", handle, ir);
            return SIZE_MAX;
        }
        if (readReg8(SN_SR, bsb) == SOCK_CLOSED || TIME_MS() - t0 > _cfg.sendTimeoutMs) {
            WizModbus::Debug::LOG_MSGF("Error: socket %d no SEND_OK", handle);
            return SIZE_MAX;
        }
        WAIT_MS(1);
    }
}

size_t W5500::receive(int handle, uint8_t* dst, size_t maxLen) {
    Lock guard(_spiMutex);
    if (!isOpenHandle(handle) || !dst) return SIZE_MAX;

    uint8_t bsb = socketBsb(handle);
    uint16_t rsr = readReg16Stable(SN_RX_RSR, bsb);
    if (rsr == 0) {
        uint8_t st = readReg8(SN_SR, bsb);
        if (st == SOCK_ESTABLISHED || st == SOCK_UDP) return 0;
        return SIZE_MAX; // Closed (or closing) with nothing left to read
    }
    if (maxLen == 0) return 0;

    size_t n = std::min((size_t)rsr, maxLen);
    uint16_t ptr = readReg16(SN_RX_RD, bsb);
    if (!readBuf(ptr, rxBufBsb(handle), dst, n)) return SIZE_MAX;
    writeReg16(SN_RX_RD, bsb, (uint16_t)(ptr + n));
    if (!execCommand(handle, CMD_RECV)) return SIZE_MAX;
    return n;
}

SocketStatus W5500::status(int handle) {
    if (!_initialized || handle < 0 || handle >= MAX_SOCKETS) return SOCK_CLOSED;
    Lock guard(_spiMutex);
    return (SocketStatus)readReg8(SN_SR, socketBsb(handle));
}

void W5500::close(int handle) {
    Lock guard(_spiMutex);
    if (!isOpenHandle(handle)) return;
    closeUnsafe(handle);
}

LinkState W5500::linkState() {
    LinkState state;
    if (!_initialized) return state;
    Lock guard(_spiMutex);
    uint8_t phy = readReg8(REG_PHYCFGR, BSB_COMMON);
    state.up = (phy & PHY_LNK) != 0;
    state.speed100M = (phy & PHY_SPD) != 0;
    state.fullDuplex = (phy & PHY_DPX) != 0;
    return state;
}

/* @brief Force ARP resolution of ip with a 2-byte UDP datagram on a spare socket
 * @note The chip must resolve the MAC before it can send: SEND_OK means the
 *       peer answered the ARP request, TIMEOUT means it never did.
 * @return true if the peer MAC was resolved
 */
bool W5500::forceArpRefresh(const IPv4& ip) {
    if (!_initialized) return false;
    Lock guard(_spiMutex);

    int s = openUnsafe(PROTO_UDP, ARP_PROBE_LOCAL_PORT);
    if (s == INVALID_HANDLE) {
        WizModbus::Debug::LOG_MSG("Error: no free socket for ARP probe");
        return false;
    }

    uint8_t bsb = socketBsb(s);
    uint8_t ipBytes[4];
    memcpy(ipBytes, ip.octets.data(), 4);
    writeBuf(SN_DIPR, bsb, ipBytes, 4);
    writeReg16(SN_DPORT, bsb, _cfg.arpProbePort);

    static const uint8_t probe[2] = {0x00, 0x01};
    uint16_t ptr = readReg16(SN_TX_WR, bsb);
    writeBuf(ptr, txBufBsb(s), probe, sizeof(probe));
    writeReg16(SN_TX_WR, bsb, (uint16_t)(ptr + sizeof(probe)));
    writeReg8(SN_IR, bsb, 0xFF);

    bool resolved = false;
    if (execCommand(s, CMD_SEND)) {
        uint32_t t0 = TIME_MS();
        uint32_t budget = retransmitBudgetMs();
        while (TIME_MS() - t0 <= budget) {
            uint8_t ir = readReg8(SN_IR, bsb);
            if (ir & IR_SEND_OK) { resolved = true; break; }
            if (ir & IR_TIMEOUT) break;
            WAIT_MS(10);
        }
    }
    closeUnsafe(s);

    char ipStr[16];
    WizModbus::Debug::LOG_MSGF("ARP probe to %s: %s", ip.toString(ipStr, sizeof(ipStr)), resolved ? "resolved" : "no answer");
    return resolved;
}

// Before begin() the mode is only recorded, begin() applies it
void W5500::setForceArpMode(bool enable) {
    _cfg.forceArp = enable;
    if (!_initialized) return;
    Lock guard(_spiMutex);
    uint8_t mr = readReg8(REG_MR, BSB_COMMON);
    mr = enable ? (mr | MR_FARP) : (mr & ~MR_FARP);
    writeReg8(REG_MR, BSB_COMMON, mr);
    WizModbus::Debug::LOG_MSGF("Force ARP mode %s", enable ? "enabled" : "disabled");
}

// ===================================================================================
// PRIVATE METHODS
// ===================================================================================

/* @brief Run one or more VDM SPI frames (split in SPI_CHUNK_SIZE pieces)
 * @param addr Offset in the block
 * @param bsb Block select bits
 * @param write true to write data to the chip, false to read into data
 * @param data Source/destination
 * @param len Number of bytes
 * @return false if a SPI transaction failed
 */
bool W5500::transfer(uint16_t addr, uint8_t bsb, bool write, uint8_t* data, size_t len) {
    if (!_spi) return false;
    size_t done = 0;
    while (done < len) {
        size_t chunk = std::min(len - done, SPI_CHUNK_SIZE);
        uint16_t a = (uint16_t)(addr + done);
        _txFrame[0] = (uint8_t)(a >> 8);
        _txFrame[1] = (uint8_t)(a & 0xFF);
        _txFrame[2] = (uint8_t)((bsb << 3) | (write ? 0x04 : 0x00)); // VDM, RWB
        if (write) memcpy(_txFrame + 3, data + done, chunk);
        else memset(_txFrame + 3, 0, chunk);

        spi_transaction_t t = {};
        t.length = (3 + chunk) * 8;
        t.tx_buffer = _txFrame;
        t.rx_buffer = write ? nullptr : _rxFrame;
        esp_err_t err = spi_device_polling_transmit(_spi, &t);
        if (err != ESP_OK) {
            WizModbus::Debug::LOG_MSGF("Error: SPI transfer failed: %s", esp_err_to_name(err));
            return false;
        }
        if (!write) memcpy(data + done, _rxFrame + 3, chunk);
        done += chunk;
    }
    return true;
}

uint8_t W5500::readReg8(uint16_t addr, uint8_t bsb) {
    uint8_t v = 0;
    transfer(addr, bsb, false, &v, 1);
    return v;
}

void W5500::writeReg8(uint16_t addr, uint8_t bsb, uint8_t value) {
    transfer(addr, bsb, true, &value, 1);
}

uint16_t W5500::readReg16(uint16_t addr, uint8_t bsb) {
    uint8_t v[2] = {0, 0};
    transfer(addr, bsb, false, v, 2);
    return (uint16_t)((v[0] << 8) | v[1]);
}

// Sn_TX_FSR & Sn_RX_RSR may change mid-read: read until two reads agree
uint16_t W5500::readReg16Stable(uint16_t addr, uint8_t bsb) {
    uint16_t prev = readReg16(addr, bsb);
    for (int i = 0; i < 8; i++) {
        uint16_t cur = readReg16(addr, bsb);
        if (cur == prev) return cur;
        prev = cur;
    }
    return prev;
}

void W5500::writeReg16(uint16_t addr, uint8_t bsb, uint16_t value) {
    uint8_t v[2] = {(uint8_t)(value >> 8), (uint8_t)(value & 0xFF)};
    transfer(addr, bsb, true, v, 2);
}

bool W5500::readBuf(uint16_t addr, uint8_t bsb, uint8_t* dst, size_t len) {
    return transfer(addr, bsb, false, dst, len);
}

bool W5500::writeBuf(uint16_t addr, uint8_t bsb, const uint8_t* src, size_t len) {
    return transfer(addr, bsb, true, const_cast<uint8_t*>(src), len);
}

bool W5500::isOpenHandle(int handle) const {
    return _initialized && handle >= 0 && handle < MAX_SOCKETS && _inUse[handle];
}

/* @brief Issue a Sn_CR command & wait for the chip to accept it
 * @return false if Sn_CR did not clear within CMD_TIMEOUT_MS
 */
bool W5500::execCommand(int sock, uint8_t cmd) {
    uint8_t bsb = socketBsb(sock);
    writeReg8(SN_CR, bsb, cmd);
    uint32_t t0 = TIME_MS();
    while (readReg8(SN_CR, bsb) != 0x00) {
        if (TIME_MS() - t0 > CMD_TIMEOUT_MS) {
            WizModbus::Debug::LOG_MSGF("Error: command 0x%02X on socket %d not accepted", cmd, sock);
            return false;
        }
        WAIT_MS(1);
    }
    return true;
}

/* @brief Allocate the lowest free socket & open it
 * @return The socket number, or INVALID_HANDLE
 */
int W5500::openUnsafe(Protocol protocol, uint16_t localPort) {
    int s = INVALID_HANDLE;
    for (int i = 0; i < MAX_SOCKETS; i++) {
        if (!_inUse[i]) { s = i; break; }
    }
    if (s == INVALID_HANDLE) {
        WizModbus::Debug::LOG_MSG("Error: all sockets in use");
        return INVALID_HANDLE;
    }

    uint8_t bsb = socketBsb(s);
    execCommand(s, CMD_CLOSE);
    writeReg8(SN_IR, bsb, 0xFF);
    writeReg8(SN_MR, bsb, (uint8_t)protocol);
    writeReg16(SN_PORT, bsb, localPort);
    if (!execCommand(s, CMD_OPEN)) return INVALID_HANDLE;

    uint8_t expected = (protocol == PROTO_TCP) ? SOCK_INIT : SOCK_UDP;
    uint32_t t0 = TIME_MS();
    uint8_t st = readReg8(SN_SR, bsb);
    while (st != expected) {
        if (TIME_MS() - t0 > CMD_TIMEOUT_MS) {
            WizModbus::Debug::LOG_MSGF("Error: socket %d open failed (status 0x%02X)", s, st);
            execCommand(s, CMD_CLOSE);
            return INVALID_HANDLE;
        }
        WAIT_MS(1);
        st = readReg8(SN_SR, bsb);
    }

    _inUse[s] = true;
    WizModbus::Debug::LOG_MSGF("Socket %d opened (%s, port %u)", s, protocol == PROTO_TCP ? "TCP" : "UDP", localPort);
    return s;
}

void W5500::closeUnsafe(int sock) {
    uint8_t bsb = socketBsb(sock);
    if (readReg8(SN_SR, bsb) == SOCK_ESTABLISHED) {
        execCommand(sock, CMD_DISCON);
    }
    execCommand(sock, CMD_CLOSE);
    writeReg8(SN_IR, bsb, 0xFF);
    _inUse[sock] = false;
}

void W5500::applyNetworkConfig() {
    uint8_t buf[6];
    memcpy(buf, _cfg.mac.data(), 6);
    writeBuf(REG_SHAR, BSB_COMMON, buf, 6);
    memcpy(buf, _gateway.octets.data(), 4);
    writeBuf(REG_GAR, BSB_COMMON, buf, 4);
    memcpy(buf, _subnet.octets.data(), 4);
    writeBuf(REG_SUBR, BSB_COMMON, buf, 4);
    memcpy(buf, _ip.octets.data(), 4);
    writeBuf(REG_SIPR, BSB_COMMON, buf, 4);

    // RTR is in 100us units
    uint32_t rtr = std::min<uint32_t>((uint32_t)_cfg.retryTimeMs * 10, 0xFFFF);
    writeReg16(REG_RTR, BSB_COMMON, (uint16_t)rtr);
    writeReg8(REG_RCR, BSB_COMMON, _cfg.retryCount);

    if (_cfg.forceArp) {
        writeReg8(REG_MR, BSB_COMMON, readReg8(REG_MR, BSB_COMMON) | MR_FARP);
    }
}

// Worst case before the chip raises TIMEOUT: RTR x (RCR + 1)
uint32_t W5500::retransmitBudgetMs() const {
    return (uint32_t)_cfg.retryTimeMs * ((uint32_t)_cfg.retryCount + 1);
}

} // namespace WizModbusHAL
