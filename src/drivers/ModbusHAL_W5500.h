/**
 * @file ModbusHAL_W5500.h
 * @brief WIZnet W5500 offload chip driver over ESP-IDF SPI master (header)
 */

#pragma once

#include "core/ModbusCore.h"
#include "drivers/ModbusHAL_Socket.h"
#include "utils/ModbusDebug.hpp"

#include "driver/spi_master.h"
#include "driver/gpio.h"
#include "esp_err.h"

namespace WizModbusHAL {

class W5500 : public ISocket {
public:

// ===================================================================================
// CONSTANTS
// ===================================================================================

    static constexpr uint8_t CHIP_VERSION = 0x04;
    static constexpr int MAX_SOCKETS = 8;
    static constexpr size_t SOCKET_BUFFER_SIZE = 2048;   // Default 2KB TX/RX per socket
    static constexpr size_t SPI_CHUNK_SIZE = 128;        // Max data bytes per SPI transaction
    static constexpr uint32_t CMD_TIMEOUT_MS = 100;      // Sn_CR completion / Sn_SR transition wait
    static constexpr uint32_t RESET_PULSE_MS = 1;
    static constexpr uint32_t RESET_SETTLE_MS = 50;
    static constexpr uint16_t ARP_PROBE_LOCAL_PORT = 50001;

    // Common registers (block 0)
    static constexpr uint16_t REG_MR = 0x0000;
    static constexpr uint16_t REG_GAR = 0x0001;
    static constexpr uint16_t REG_SUBR = 0x0005;
    static constexpr uint16_t REG_SHAR = 0x0009;
    static constexpr uint16_t REG_SIPR = 0x000F;
    static constexpr uint16_t REG_RTR = 0x0019;
    static constexpr uint16_t REG_RCR = 0x001B;
    static constexpr uint16_t REG_PHYCFGR = 0x002E;
    static constexpr uint16_t REG_VERSIONR = 0x0039;

    static constexpr uint8_t MR_RST = 0x80;
    static constexpr uint8_t MR_FARP = 0x02;
    static constexpr uint8_t PHY_RST = 0x80;
    static constexpr uint8_t PHY_LNK = 0x01;
    static constexpr uint8_t PHY_SPD = 0x02;
    static constexpr uint8_t PHY_DPX = 0x04;

    // Socket registers (block 1 + 4n)
    static constexpr uint16_t SN_MR = 0x0000;
    static constexpr uint16_t SN_CR = 0x0001;
    static constexpr uint16_t SN_IR = 0x0002;
    static constexpr uint16_t SN_SR = 0x0003;
    static constexpr uint16_t SN_PORT = 0x0004;
    static constexpr uint16_t SN_DIPR = 0x000C;
    static constexpr uint16_t SN_DPORT = 0x0010;
    static constexpr uint16_t SN_TX_FSR = 0x0020;
    static constexpr uint16_t SN_TX_WR = 0x0024;
    static constexpr uint16_t SN_RX_RSR = 0x0026;
    static constexpr uint16_t SN_RX_RD = 0x0028;

    // Sn_CR commands
    static constexpr uint8_t CMD_OPEN = 0x01;
    static constexpr uint8_t CMD_CONNECT = 0x04;
    static constexpr uint8_t CMD_DISCON = 0x08;
    static constexpr uint8_t CMD_CLOSE = 0x10;
    static constexpr uint8_t CMD_SEND = 0x20;
    static constexpr uint8_t CMD_RECV = 0x40;

    // Sn_IR bits
    static constexpr uint8_t IR_CON = 0x01;
    static constexpr uint8_t IR_DISCON = 0x02;
    static constexpr uint8_t IR_RECV = 0x04;
    static constexpr uint8_t IR_TIMEOUT = 0x08;
    static constexpr uint8_t IR_SEND_OK = 0x10;

// ===================================================================================
// CONFIG STRUCT
// ===================================================================================

    struct Config {
        spi_host_device_t spiHost = SPI2_HOST;
        int mosiPin = GPIO_NUM_23;
        int misoPin = GPIO_NUM_19;
        int sclkPin = GPIO_NUM_18;
        int csPin = GPIO_NUM_5;
        int rstPin = -1;                    // -1: no hardware reset line
        int clockHz = 10 * 1000 * 1000;
        bool initBus = true;                // false if the SPI bus is already initialized
        std::array<uint8_t, 6> mac = {0x02, 0x08, 0xDC, 0xAB, 0xCD, 0x29};
        const char* ip = "192.168.123.29";
        const char* subnet = "255.255.255.0";
        const char* gateway = "192.168.123.1";
        uint16_t retryTimeMs = 500;         // RTR (chip retransmission interval)
        uint8_t retryCount = 10;            // RCR (chip retransmission count)
        uint32_t sendTimeoutMs = 500;       // Max wait for SEND_OK
        uint16_t arpProbePort = WizModbus::DEFAULT_TCP_PORT; // Destination port of the ARP probe datagram
        bool forceArp = false;
    };

// ===================================================================================
// CONSTRUCTOR & SETUP
// ===================================================================================

    explicit W5500(const Config& cfg);
    ~W5500();

    W5500(const W5500&) = delete;
    W5500& operator=(const W5500&) = delete;

    esp_err_t begin();
    void end();

    esp_err_t cleanState();
    void resetPhy();
    uint8_t version();

// ===================================================================================
// ISocket
// ===================================================================================

    int open(Protocol protocol, uint16_t localPort) override;
    bool connect(int handle, const IPv4& ip, uint16_t port) override;
    size_t send(int handle, const uint8_t* data, size_t len) override;
    size_t receive(int handle, uint8_t* dst, size_t maxLen) override;
    SocketStatus status(int handle) override;
    void close(int handle) override;
    LinkState linkState() override;
    bool forceArpRefresh(const IPv4& ip) override;
    void setForceArpMode(bool enable) override;

private:
    Config _cfg;
    IPv4 _ip;
    IPv4 _subnet;
    IPv4 _gateway;
    spi_device_handle_t _spi = nullptr;
    bool _busInitialized = false;
    bool _initialized = false;
    std::array<bool, MAX_SOCKETS> _inUse = {};
    Mutex _spiMutex;

    // DMA-capable scratch frames: [addr:2][control:1][data]
    alignas(4) uint8_t _txFrame[3 + SPI_CHUNK_SIZE];
    alignas(4) uint8_t _rxFrame[3 + SPI_CHUNK_SIZE];

    static constexpr uint8_t BSB_COMMON = 0x00;
    static constexpr uint8_t socketBsb(int s) { return (uint8_t)(1 + 4 * s); }
    static constexpr uint8_t txBufBsb(int s)  { return (uint8_t)(2 + 4 * s); }
    static constexpr uint8_t rxBufBsb(int s)  { return (uint8_t)(3 + 4 * s); }

    // Register access (caller holds _spiMutex)
    bool transfer(uint16_t addr, uint8_t bsb, bool write, uint8_t* data, size_t len);
    uint8_t readReg8(uint16_t addr, uint8_t bsb);
    void writeReg8(uint16_t addr, uint8_t bsb, uint8_t value);
    uint16_t readReg16(uint16_t addr, uint8_t bsb);
    uint16_t readReg16Stable(uint16_t addr, uint8_t bsb);
    void writeReg16(uint16_t addr, uint8_t bsb, uint16_t value);
    bool readBuf(uint16_t addr, uint8_t bsb, uint8_t* dst, size_t len);
    bool writeBuf(uint16_t addr, uint8_t bsb, const uint8_t* src, size_t len);

    // Socket helpers (caller holds _spiMutex)
    bool isOpenHandle(int handle) const;
    bool execCommand(int sock, uint8_t cmd);
    int openUnsafe(Protocol protocol, uint16_t localPort);
    void closeUnsafe(int sock);
    void applyNetworkConfig();
    uint32_t retransmitBudgetMs() const;
};

} // namespace WizModbusHAL
