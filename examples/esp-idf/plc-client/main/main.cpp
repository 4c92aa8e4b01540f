/**
 * @file main.cpp
 * @brief Example using WizModbus to poll a PLC through a W5500 Ethernet module
 */

#include <vector>
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "esp_log.h"

#include "WizModbus.h"

// ===================================================================================
// LOG TAGS
// ===================================================================================

static const char *TAG_APP   = "PLC_CLIENT_EX";
static const char *TAG_TASK  = "POLL_TASK";


// ===================================================================================
// WIZMODBUS ALIASES
// ===================================================================================

// Just for convenience
using W5500         = WizModbusHAL::W5500;
using ArpResolver   = WizModbusInterface::ArpResolver;
using Connection    = WizModbusInterface::ConnectionManager;
using ModbusClient  = WizModbus::Client;


// ===================================================================================
// NETWORK CONFIGURATION
// ===================================================================================

#define PLC_IP        "192.168.123.10"  // Remote PLC IP address
#define PLC_PORT      502               // Remote PLC TCP port
#define LOCAL_IP      "192.168.123.29"
#define SUBNET_MASK   "255.255.255.0"
#define GATEWAY_IP    "192.168.123.1"


// ===================================================================================
// MODBUS CONFIGURATION & INSTANCES
// ===================================================================================

// W5500 on the VSPI pins, no hardware reset line
W5500 w5500({
    .spiHost = SPI2_HOST,
    .mosiPin = GPIO_NUM_23,
    .misoPin = GPIO_NUM_19,
    .sclkPin = GPIO_NUM_18,
    .csPin = GPIO_NUM_5,
    .ip = LOCAL_IP,
    .subnet = SUBNET_MASK,
    .gateway = GATEWAY_IP
});

ArpResolver arp(w5500);

Connection conn(w5500, arp, {
    .plcIp = PLC_IP,
    .plcPort = PLC_PORT
});

ModbusClient client(conn);


// ===================================================================================
// EXAMPLE CONFIGURATION
// ===================================================================================

// Register map of the PLC program
namespace RegAddr {
    constexpr uint16_t REG_HEARTBEAT        = 0;    // Holding Register (incremented by us)
    constexpr uint16_t REG_PROCESS_START    = 10;   // Input Registers (10-19)
    constexpr uint16_t PROCESS_COUNT        = 10;
    constexpr uint16_t REG_SETPOINTS_START  = 100;  // Holding Registers (100-103)
}

static constexpr uint32_t POLL_PERIOD_MS = 1000;

static void pollTask(void* arg);


// ===================================================================================
// MAIN
// ===================================================================================

extern "C" void app_main(void)
{
    ESP_LOGI(TAG_APP, "Starting WizModbus PLC client example (ESP-IDF)");

    // Initialize W5500 (SPI, reset, clean state & network config)
    esp_err_t err = w5500.begin();
    if (err != ESP_OK) {
        ESP_LOGE(TAG_APP, "W5500 init failed: %s", esp_err_to_name(err));
        return;
    }
    ESP_LOGI(TAG_APP, "W5500 ready (version 0x%02X)", w5500.version());

    ModbusClient::Result res = client.connect();
    if (res != ModbusClient::SUCCESS) {
        // Not fatal: the first request will retry
        ESP_LOGW(TAG_APP, "Initial connection failed: %s", ModbusClient::toString(res));
    }

    xTaskCreate(pollTask, "plcPollTask", 4096, &client, 5, NULL);

    while (true) {
        vTaskDelay(pdMS_TO_TICKS(1000));
    }
}


// ===================================================================================
// EXAMPLE FUNCTIONS
// ===================================================================================

// Full recovery once the bounded reconnection gave up: reset the chip sockets & PHY
static void recoverTransport()
{
    ESP_LOGW(TAG_TASK, "Reconnection exhausted, resetting W5500");
    client.disconnect();
    esp_err_t err = w5500.cleanState();
    if (err != ESP_OK) {
        ESP_LOGE(TAG_TASK, "W5500 clean state failed: %s", esp_err_to_name(err));
        return;
    }
    w5500.resetPhy();
    arp.invalidate();
}

static void pollTask(void* arg)
{
    auto* plc = static_cast<ModbusClient*>(arg);
    uint16_t heartbeat = 0;
    std::vector<uint16_t> process;

    while (true) {
        vTaskDelay(pdMS_TO_TICKS(POLL_PERIOD_MS));

        ModbusClient::Result res = plc->readInputRegisters(RegAddr::REG_PROCESS_START,
                                                           RegAddr::PROCESS_COUNT, process);
        if (res == ModbusClient::SUCCESS) {
            ESP_LOGI(TAG_TASK, "Process values: %u %u %u ...", process[0], process[1], process[2]);
        } else if (res == ModbusClient::ERR_MODBUS_EXCEPTION) {
            uint8_t code = plc->lastException();
            ESP_LOGW(TAG_TASK, "PLC exception 0x%02X (%s)", code,
                     WizModbus::toString(static_cast<WizModbus::ExceptionCode>(code)));
        } else if (res == ModbusClient::ERR_RECONNECT_EXHAUSTED) {
            recoverTransport();
            continue;
        } else {
            ESP_LOGE(TAG_TASK, "Read failed: %s", ModbusClient::toString(res));
            continue;
        }

        res = plc->writeSingleRegister(RegAddr::REG_HEARTBEAT, ++heartbeat);
        if (res != ModbusClient::SUCCESS) {
            ESP_LOGE(TAG_TASK, "Heartbeat write failed: %s", ModbusClient::toString(res));
        }

        if (heartbeat % 60 == 0) {
            res = plc->writeMultipleRegisters(RegAddr::REG_SETPOINTS_START, {200, 450, 0, 1});
            if (res != ModbusClient::SUCCESS) {
                ESP_LOGE(TAG_TASK, "Setpoints write failed: %s", ModbusClient::toString(res));
            }

            Connection::Diagnostics d = plc->getDiagnostics();
            ESP_LOGI(TAG_TASK, "State %s, socket %s, link %s, reconnects %lu, ARP refreshes %lu",
                     Connection::toString(d.state), WizModbusHAL::toString(d.socketStatus),
                     d.link.up ? "up" : "down",
                     (unsigned long)d.reconnects, (unsigned long)d.arp.refreshes);
        }
    }
}
