#include <unity.h>
#include <memory>
#include <vector>

#include "WizModbus.h"
#include "plc_simulator.h"

using Conn = WizModbusInterface::ConnectionManager;
using WizModbusInterface::ArpResolver;
using WizModbus::Client;

// Full client stack wired on a simulated PLC
struct Fixture {
    PlcSimulator plc;
    ArpResolver arp;
    Conn conn;
    Client client;

    Fixture(const Conn::Config& connCfg = Conn::Config(),
            const Client::Config& clientCfg = Client::Config(),
            const ArpResolver::Config& arpCfg = ArpResolver::Config())
        : arp(plc, arpCfg), conn(plc, arp, connCfg), client(conn, clientCfg) {}
};

static std::unique_ptr<Fixture> fx;

void setUp() {
    WizModbusTest::clockMs() = 0;
    fx = std::make_unique<Fixture>();
}

void tearDown() {
    fx.reset();
}

// ===================================================================================
// REGISTER OPERATIONS
// ===================================================================================

void test_write_then_read_back() {
    TEST_ASSERT_EQUAL(Client::SUCCESS, fx->client.connect());
    TEST_ASSERT_EQUAL(Conn::CONNECTED, fx->client.currentState());

    TEST_ASSERT_EQUAL(Client::SUCCESS, fx->client.writeSingleRegister(100, 1234));
    TEST_ASSERT_EQUAL(1234, fx->plc.holding[100]);

    std::vector<uint16_t> out;
    TEST_ASSERT_EQUAL(Client::SUCCESS, fx->client.readHoldingRegisters(100, 1, out));
    TEST_ASSERT_EQUAL(1, out.size());
    TEST_ASSERT_EQUAL(1234, out[0]);
}

void test_read_input_registers() {
    for (uint16_t i = 0; i < 10; i++) fx->plc.input[500 + i] = 0xA000 + i;

    std::vector<uint16_t> out;
    TEST_ASSERT_EQUAL_MESSAGE(Client::SUCCESS, fx->client.readInputRegisters(500, 10, out),
                              "first call should connect transparently");
    TEST_ASSERT_EQUAL(10, out.size());
    for (uint16_t i = 0; i < 10; i++) TEST_ASSERT_EQUAL_HEX16(0xA000 + i, out[i]);
}

void test_write_multiple_registers() {
    std::vector<uint16_t> values(123);
    for (size_t i = 0; i < values.size(); i++) values[i] = (uint16_t)(i * 3);

    TEST_ASSERT_EQUAL(Client::SUCCESS, fx->client.writeMultipleRegisters(1000, values));
    for (size_t i = 0; i < values.size(); i++) TEST_ASSERT_EQUAL(values[i], fx->plc.holding[1000 + i]);

    std::vector<uint16_t> out;
    TEST_ASSERT_EQUAL(Client::SUCCESS, fx->client.readHoldingRegisters(1000, 123, out));
    TEST_ASSERT_TRUE(out == values);
}

void test_fragmented_stream() {
    fx->plc.rxChunk = 3;
    fx->plc.holding[7] = 77;
    fx->plc.holding[8] = 88;

    std::vector<uint16_t> out;
    TEST_ASSERT_EQUAL_MESSAGE(Client::SUCCESS, fx->client.readHoldingRegisters(7, 2, out),
                              "response split across receive() calls should be reassembled");
    TEST_ASSERT_EQUAL(77, out[0]);
    TEST_ASSERT_EQUAL(88, out[1]);
}

void test_invalid_requests_do_no_io() {
    std::vector<uint16_t> out = {42};

    TEST_ASSERT_EQUAL(Client::ERR_INVALID_REQUEST, fx->client.readHoldingRegisters(0, 0, out));
    TEST_ASSERT_EQUAL(Client::ERR_INVALID_REQUEST, fx->client.readHoldingRegisters(0, 126, out));
    TEST_ASSERT_EQUAL(Client::ERR_INVALID_REQUEST, fx->client.readInputRegisters(0xFFFF, 2, out));
    TEST_ASSERT_EQUAL(Client::ERR_INVALID_REQUEST, fx->client.writeMultipleRegisters(0, std::vector<uint16_t>(124, 1)));
    TEST_ASSERT_EQUAL(Client::ERR_INVALID_REQUEST, fx->client.writeMultipleRegisters(0, {}));
    TEST_ASSERT_EQUAL(Client::ERR_INVALID_REQUEST, fx->client.writeMultipleRegisters(0xFFF0, std::vector<uint16_t>(17, 1)));

    TEST_ASSERT_EQUAL_MESSAGE(0, fx->plc.opens, "no socket should be opened");
    TEST_ASSERT_EQUAL(0, fx->plc.requests);
    TEST_ASSERT_EQUAL_MESSAGE(1, out.size(), "output untouched on error");
    TEST_ASSERT_EQUAL(Conn::DISCONNECTED, fx->client.currentState());
}

// ===================================================================================
// TRANSACTION IDS
// ===================================================================================

void test_transaction_ids_unique_and_wrapping() {
    std::vector<uint16_t> out;
    const uint32_t window = 65536;

    for (uint32_t i = 0; i < window; i++) {
        TEST_ASSERT_EQUAL(Client::SUCCESS, fx->client.readHoldingRegisters(0, 1, out));
    }
    TEST_ASSERT_EQUAL(window, fx->plc.seenTids.size());
    TEST_ASSERT_EQUAL_MESSAGE(1, fx->plc.seenTids[0], "first transaction ID is 1");

    std::vector<bool> seen(window, false);
    for (uint16_t tid : fx->plc.seenTids) {
        TEST_ASSERT_FALSE_MESSAGE(seen[tid], "transaction ID reused inside the window");
        seen[tid] = true;
    }

    TEST_ASSERT_EQUAL(Client::SUCCESS, fx->client.readHoldingRegisters(0, 1, out));
    TEST_ASSERT_EQUAL_MESSAGE(1, fx->plc.seenTids.back(), "counter wraps after 65536 requests");
}

void test_stale_response_discarded() {
    fx->plc.holding[3] = 333;
    TEST_ASSERT_EQUAL(Client::SUCCESS, fx->client.connect());

    fx->plc.staleResponses = 2;
    fx->plc.holding[3] = 334;
    std::vector<uint16_t> out;
    TEST_ASSERT_EQUAL(Client::SUCCESS, fx->client.readHoldingRegisters(3, 1, out));
    TEST_ASSERT_EQUAL(334, out[0]);
    TEST_ASSERT_EQUAL_MESSAGE(Conn::CONNECTED, fx->client.currentState(), "stale frames are not faults");
}

// ===================================================================================
// PROTOCOL FAULTS
// ===================================================================================

void test_modbus_exception_keeps_session() {
    TEST_ASSERT_EQUAL(Client::SUCCESS, fx->client.connect());

    fx->plc.nextException = WizModbus::ILLEGAL_DATA_ADDRESS;
    TEST_ASSERT_EQUAL(Client::ERR_MODBUS_EXCEPTION, fx->client.writeSingleRegister(9999, 1));
    TEST_ASSERT_EQUAL_HEX8(0x02, fx->client.lastException());
    TEST_ASSERT_EQUAL(Conn::CONNECTED, fx->client.currentState());

    std::vector<uint16_t> out;
    TEST_ASSERT_EQUAL(Client::SUCCESS, fx->client.readHoldingRegisters(0, 1, out));
    TEST_ASSERT_EQUAL(WizModbus::NULL_EXCEPTION, fx->client.lastException());

    Conn::Diagnostics d = fx->client.getDiagnostics();
    TEST_ASSERT_EQUAL(1, d.connects);
    TEST_ASSERT_EQUAL_MESSAGE(0, d.reconnectAttempts, "an exception never triggers a reconnect");
}

void test_nonstandard_exception_keeps_session() {
    TEST_ASSERT_EQUAL(Client::SUCCESS, fx->client.connect());

    std::vector<uint16_t> out;
    for (uint8_t code : {0x09, 0x0C, 0x80}) {
        fx->plc.nextException = code;
        TEST_ASSERT_EQUAL(Client::ERR_MODBUS_EXCEPTION, fx->client.readHoldingRegisters(0, 1, out));
        TEST_ASSERT_EQUAL_HEX8(code, fx->client.lastException());
        TEST_ASSERT_EQUAL_MESSAGE(Conn::CONNECTED, fx->client.currentState(), "vendor codes are not framing faults");
    }

    Conn::Diagnostics d = fx->client.getDiagnostics();
    TEST_ASSERT_EQUAL(1, d.connects);
    TEST_ASSERT_EQUAL(0, d.reconnectAttempts);
    TEST_ASSERT_EQUAL(0, d.communicationLosses);
}

void test_partial_write_is_framing_error() {
    fx->plc.partialWriteAck = true;
    TEST_ASSERT_EQUAL(Client::ERR_FRAMING, fx->client.writeMultipleRegisters(10, {1, 2, 3}));
    TEST_ASSERT_EQUAL(Conn::DEGRADED, fx->client.currentState());
}

void test_corrupted_stream_is_framing_error() {
    TEST_ASSERT_EQUAL(Client::SUCCESS, fx->client.connect());
    fx->plc.corruptNextResponse = true;

    std::vector<uint16_t> out;
    TEST_ASSERT_EQUAL(Client::ERR_FRAMING, fx->client.readHoldingRegisters(0, 1, out));
    TEST_ASSERT_EQUAL(Conn::DEGRADED, fx->client.currentState());

    // Next call rebuilds the session
    TEST_ASSERT_EQUAL(Client::SUCCESS, fx->client.readHoldingRegisters(0, 1, out));
    TEST_ASSERT_EQUAL(Conn::CONNECTED, fx->client.currentState());
}

// ===================================================================================
// COMMUNICATION LOSS
// ===================================================================================

void test_link_down_during_read() {
    TEST_ASSERT_EQUAL(Client::SUCCESS, fx->client.connect());
    fx->plc.dropLinkOnNextRequest = true;

    uint32_t t0 = TIME_MS();
    std::vector<uint16_t> out;
    TEST_ASSERT_EQUAL(Client::ERR_COMMUNICATION_LOST, fx->client.readHoldingRegisters(0, 10, out));
    TEST_ASSERT_TRUE_MESSAGE(TIME_MS() - t0 <= Client::DEFAULT_REQUEST_TIMEOUT_MS, "should not hang");
    TEST_ASSERT_EQUAL(Conn::DEGRADED, fx->client.currentState());

    Conn::Diagnostics d = fx->client.getDiagnostics();
    TEST_ASSERT_FALSE(d.link.up);
    TEST_ASSERT_EQUAL(1, d.communicationLosses);
}

void test_response_timeout_then_recovery() {
    TEST_ASSERT_EQUAL(Client::SUCCESS, fx->client.connect());
    fx->plc.silent = true;

    uint32_t t0 = TIME_MS();
    std::vector<uint16_t> out;
    TEST_ASSERT_EQUAL(Client::ERR_COMMUNICATION_LOST, fx->client.readHoldingRegisters(0, 1, out));
    uint32_t elapsed = TIME_MS() - t0;
    TEST_ASSERT_TRUE(elapsed >= Client::DEFAULT_REQUEST_TIMEOUT_MS);
    TEST_ASSERT_TRUE(elapsed <= Client::DEFAULT_REQUEST_TIMEOUT_MS + 10);
    TEST_ASSERT_EQUAL(Conn::DEGRADED, fx->client.currentState());
    TEST_ASSERT_EQUAL_MESSAGE(1, fx->plc.requests, "faulted request is not resent");

    fx->plc.silent = false;
    TEST_ASSERT_EQUAL(Client::SUCCESS, fx->client.readHoldingRegisters(0, 1, out));
    TEST_ASSERT_EQUAL(Conn::CONNECTED, fx->client.currentState());
    TEST_ASSERT_EQUAL(1, fx->client.getDiagnostics().reconnects);
    TEST_ASSERT_EQUAL_MESSAGE(1, fx->plc.openSockets(), "old socket must be released");
}

void test_send_failure_degrades() {
    TEST_ASSERT_EQUAL(Client::SUCCESS, fx->client.connect());
    fx->plc.sendFails = true;
    TEST_ASSERT_EQUAL(Client::ERR_COMMUNICATION_LOST, fx->client.writeSingleRegister(1, 1));
    TEST_ASSERT_EQUAL(Conn::DEGRADED, fx->client.currentState());
}

// ===================================================================================
// CONNECTION & RECONNECTION
// ===================================================================================

void test_connect_errors() {
    // ==== 1) NO LINK ====
    fx->plc.linkUp = false;
    TEST_ASSERT_EQUAL(Client::ERR_CONNECT, fx->client.connect());
    TEST_ASSERT_EQUAL(WIZMODBUS_LINK_WAIT_MS, TIME_MS());
    TEST_ASSERT_EQUAL(0, fx->plc.opens);
    TEST_ASSERT_EQUAL(Conn::DISCONNECTED, fx->client.currentState());

    // ==== 2) REFUSED ====
    fx->plc.linkUp = true;
    fx->plc.refuseConnects = true;
    TEST_ASSERT_EQUAL(Client::ERR_CONNECT, fx->client.connect());
    TEST_ASSERT_EQUAL(0, fx->plc.openSockets());

    // ==== 3) NEVER ANSWERED ====
    fx->plc.refuseConnects = false;
    fx->plc.hangConnects = true;
    uint32_t t0 = TIME_MS();
    TEST_ASSERT_EQUAL(Client::ERR_CONNECT_TIMEOUT, fx->client.connect());
    TEST_ASSERT_TRUE(TIME_MS() - t0 >= Conn::DEFAULT_CONNECT_TIMEOUT_MS);
    TEST_ASSERT_EQUAL(0, fx->plc.openSockets());

    // ==== 4) SOCKET OPEN FAILURE ====
    fx->plc.hangConnects = false;
    fx->plc.openFails = true;
    TEST_ASSERT_EQUAL(Client::ERR_CONNECT, fx->client.connect());
    TEST_ASSERT_EQUAL(Conn::DISCONNECTED, fx->client.currentState());

    fx->plc.openFails = false;
    TEST_ASSERT_EQUAL(Client::SUCCESS, fx->client.connect());
    TEST_ASSERT_EQUAL(0, fx->client.getDiagnostics().consecutiveFailures);
}

void test_invalid_plc_address() {
    Conn::Config cfg;
    cfg.plcIp = "192.168.123";
    PlcSimulator plc;
    ArpResolver arp(plc);
    Conn conn(plc, arp, cfg);

    TEST_ASSERT_EQUAL(Conn::ERR_INVALID_CONFIG, conn.connect());
    TEST_ASSERT_EQUAL(0, plc.opens);

    TEST_ASSERT_EQUAL(Conn::ERR_INVALID_CONFIG, conn.setPlcAddress("not-an-ip", 502));
    TEST_ASSERT_EQUAL(Conn::SUCCESS, conn.setPlcAddress("192.168.123.10", 502));
    TEST_ASSERT_EQUAL(Conn::SUCCESS, conn.connect());
}

void test_set_plc_address() {
    TEST_ASSERT_EQUAL(Client::SUCCESS, fx->client.connect());
    TEST_ASSERT_EQUAL(Conn::SUCCESS, fx->conn.setPlcAddress("192.168.123.10", 502));
    TEST_ASSERT_EQUAL_MESSAGE(Conn::CONNECTED, fx->conn.currentState(), "same address keeps the session");

    TEST_ASSERT_EQUAL(Conn::SUCCESS, fx->conn.setPlcAddress("192.168.123.11", 5020));
    TEST_ASSERT_EQUAL(Conn::DISCONNECTED, fx->conn.currentState());
    TEST_ASSERT_EQUAL(0, fx->plc.openSockets());

    TEST_ASSERT_EQUAL(Client::SUCCESS, fx->client.connect());
    TEST_ASSERT_EQUAL(11, fx->plc.lastConnectIp.octets[3]);
    TEST_ASSERT_EQUAL(5020, fx->plc.lastConnectPort);
}

void test_reconnect_after_transient_failures() {
    TEST_ASSERT_EQUAL(Client::SUCCESS, fx->client.connect());
    fx->plc.peerClose();
    fx->plc.failNextConnects = WIZMODBUS_RECONNECT_RETRIES - 1;

    std::vector<uint16_t> out;
    TEST_ASSERT_EQUAL(Client::SUCCESS, fx->client.readHoldingRegisters(0, 1, out));
    TEST_ASSERT_EQUAL(Conn::CONNECTED, fx->client.currentState());

    Conn::Diagnostics d = fx->client.getDiagnostics();
    TEST_ASSERT_EQUAL(1, d.reconnects);
    TEST_ASSERT_EQUAL(WIZMODBUS_RECONNECT_RETRIES, d.reconnectAttempts);
    TEST_ASSERT_EQUAL(0, d.consecutiveFailures);
    TEST_ASSERT_EQUAL(1, fx->plc.openSockets());
}

void test_reconnect_exhausted() {
    TEST_ASSERT_EQUAL(Client::SUCCESS, fx->client.connect());
    fx->plc.peerClose();
    fx->plc.failNextConnects = WIZMODBUS_RECONNECT_RETRIES;

    uint32_t t0 = TIME_MS();
    std::vector<uint16_t> out;
    TEST_ASSERT_EQUAL(Client::ERR_RECONNECT_EXHAUSTED, fx->client.readHoldingRegisters(0, 1, out));
    TEST_ASSERT_EQUAL(Conn::DISCONNECTED, fx->client.currentState());
    TEST_ASSERT_EQUAL_MESSAGE((WIZMODBUS_RECONNECT_RETRIES - 1) * WIZMODBUS_RECONNECT_INTERVAL_MS, TIME_MS() - t0,
                              "fixed spacing between attempts");
    TEST_ASSERT_EQUAL(0, fx->plc.openSockets());
    TEST_ASSERT_EQUAL_MESSAGE(0, fx->plc.requests, "request dropped once the session is gone");
}

void test_auto_reconnect_disabled() {
    Client::Config clientCfg;
    clientCfg.autoReconnect = false;
    fx = std::make_unique<Fixture>(Conn::Config(), clientCfg);

    std::vector<uint16_t> out;
    TEST_ASSERT_EQUAL(Client::ERR_NOT_CONNECTED, fx->client.readHoldingRegisters(0, 1, out));
    TEST_ASSERT_EQUAL(0, fx->plc.opens);

    TEST_ASSERT_EQUAL(Client::SUCCESS, fx->client.connect());
    fx->plc.peerClose();
    TEST_ASSERT_EQUAL(Client::ERR_NOT_CONNECTED, fx->client.readHoldingRegisters(0, 1, out));
    TEST_ASSERT_EQUAL(Conn::DEGRADED, fx->client.currentState());
    TEST_ASSERT_EQUAL(1, fx->plc.opens);

    // Explicit rebuild still works
    TEST_ASSERT_EQUAL(Conn::SUCCESS, fx->conn.reconnect());
    TEST_ASSERT_EQUAL(Client::SUCCESS, fx->client.readHoldingRegisters(0, 1, out));
}

void test_disconnect_idempotent() {
    fx->client.disconnect();
    TEST_ASSERT_EQUAL(Conn::DISCONNECTED, fx->client.currentState());

    TEST_ASSERT_EQUAL(Client::SUCCESS, fx->client.connect());
    fx->client.disconnect();
    fx->client.disconnect();
    TEST_ASSERT_EQUAL(Conn::DISCONNECTED, fx->client.currentState());
    TEST_ASSERT_EQUAL(0, fx->plc.openSockets());
    TEST_ASSERT_EQUAL(1, fx->plc.closes);
    TEST_ASSERT_EQUAL(WizModbusHAL::SOCK_CLOSED, fx->conn.socketStatus());
}

// ===================================================================================
// ARP RECOVERY
// ===================================================================================

void test_stale_arp_needs_refresh() {
    TEST_ASSERT_EQUAL(Conn::SUCCESS, fx->conn.connect());
    fx->conn.disconnect();
    uint32_t refreshes = fx->plc.arpRefreshes;

    // Switch rebooted behind our back: cached MAC is dead
    fx->plc.staleArp = true;
    TEST_ASSERT_EQUAL_MESSAGE(Conn::ERR_CONNECT_TIMEOUT, fx->conn.connect(), "plain connect keeps the stale entry");
    TEST_ASSERT_EQUAL(refreshes, fx->plc.arpRefreshes);

    TEST_ASSERT_EQUAL_MESSAGE(Conn::SUCCESS, fx->conn.reconnect(), "reconnect refreshes ARP first");
    TEST_ASSERT_EQUAL(Conn::CONNECTED, fx->conn.currentState());
    TEST_ASSERT_TRUE(fx->plc.arpRefreshes > refreshes);
    TEST_ASSERT_EQUAL(2, fx->conn.getDiagnostics().arp.refreshes);
}

void test_force_arp_mode() {
    // Default: refresh only while the resolution is unknown
    TEST_ASSERT_EQUAL(Conn::SUCCESS, fx->conn.connect());
    fx->conn.disconnect();
    TEST_ASSERT_EQUAL(Conn::SUCCESS, fx->conn.connect());
    TEST_ASSERT_EQUAL(1, fx->plc.arpRefreshes);
    TEST_ASSERT_FALSE(fx->plc.forceArpMode);

    // Forced: refresh before every attempt, chip mode enabled
    fx->arp.setForceMode(true);
    TEST_ASSERT_TRUE(fx->plc.forceArpMode);
    fx->conn.disconnect();
    TEST_ASSERT_EQUAL(Conn::SUCCESS, fx->conn.connect());
    fx->conn.disconnect();
    TEST_ASSERT_EQUAL(Conn::SUCCESS, fx->conn.connect());
    TEST_ASSERT_EQUAL(3, fx->plc.arpRefreshes);
}

void test_force_arp_mode_from_config() {
    ArpResolver::Config arpCfg;
    arpCfg.forceMode = true;
    fx = std::make_unique<Fixture>(Conn::Config(), Client::Config(), arpCfg);
    TEST_ASSERT_TRUE_MESSAGE(fx->plc.forceArpMode, "chip mode follows the configured policy");

    TEST_ASSERT_EQUAL(Conn::SUCCESS, fx->conn.connect());
    fx->conn.disconnect();
    TEST_ASSERT_EQUAL(Conn::SUCCESS, fx->conn.connect());
    TEST_ASSERT_EQUAL(2, fx->plc.arpRefreshes);
}

void test_arp_refresh_bounded() {
    fx->plc.arpAnswers = false;
    TEST_ASSERT_FALSE(fx->arp.refresh(WizModbusHAL::IPv4()));
    TEST_ASSERT_EQUAL(WIZMODBUS_RECONNECT_RETRIES, fx->plc.arpRefreshes);
    TEST_ASSERT_EQUAL(1, fx->arp.getStats().failures);
    TEST_ASSERT_TRUE(fx->arp.needsRefresh());

    fx->plc.arpAnswers = true;
    TEST_ASSERT_TRUE(fx->arp.refresh(WizModbusHAL::IPv4()));
    TEST_ASSERT_EQUAL(WIZMODBUS_RECONNECT_RETRIES + 1, fx->plc.arpRefreshes);
    TEST_ASSERT_FALSE(fx->arp.needsRefresh());

    fx->arp.onLinkChange(true);
    fx->arp.onLinkChange(false);
    TEST_ASSERT_TRUE_MESSAGE(fx->arp.needsRefresh(), "link transition invalidates the entry");
}

// ===================================================================================
// BACKOFF & HEALTH
// ===================================================================================

void test_backoff_policy() {
    TEST_ASSERT_EQUAL(WIZMODBUS_RECONNECT_INTERVAL_MS, fx->conn.backoffDelayMs(1));
    TEST_ASSERT_EQUAL(WIZMODBUS_RECONNECT_INTERVAL_MS, fx->conn.backoffDelayMs(7));

    Conn::Config cfg;
    cfg.backoff = Conn::BACKOFF_EXPONENTIAL;
    cfg.reconnectRetries = 4;
    fx = std::make_unique<Fixture>(cfg);

    TEST_ASSERT_EQUAL(500, fx->conn.backoffDelayMs(1));
    TEST_ASSERT_EQUAL(1000, fx->conn.backoffDelayMs(2));
    TEST_ASSERT_EQUAL(2000, fx->conn.backoffDelayMs(3));
    TEST_ASSERT_EQUAL(8000, fx->conn.backoffDelayMs(5));
    TEST_ASSERT_EQUAL(8000, fx->conn.backoffDelayMs(40));

    fx->plc.refuseConnects = true;
    uint32_t t0 = TIME_MS();
    TEST_ASSERT_EQUAL(Conn::ERR_RECONNECT_EXHAUSTED, fx->conn.reconnect());
    TEST_ASSERT_EQUAL(500 + 1000 + 2000, TIME_MS() - t0);
    TEST_ASSERT_EQUAL(4, fx->conn.getDiagnostics().reconnectAttempts);
}

void test_poll_detects_faults() {
    TEST_ASSERT_EQUAL(Client::SUCCESS, fx->client.connect());
    TEST_ASSERT_EQUAL(Conn::CONNECTED, fx->conn.poll());
    TEST_ASSERT_EQUAL(WizModbusHAL::SOCK_ESTABLISHED, fx->conn.socketStatus());

    fx->plc.linkUp = false;
    TEST_ASSERT_EQUAL(Conn::DEGRADED, fx->conn.poll());

    Conn::Diagnostics d = fx->conn.getDiagnostics();
    TEST_ASSERT_EQUAL(Conn::DEGRADED, d.state);
    TEST_ASSERT_FALSE(d.link.up);
    TEST_ASSERT_EQUAL(1, d.communicationLosses);
    TEST_ASSERT_EQUAL(1, d.consecutiveFailures);
    TEST_ASSERT_EQUAL(2, d.arp.invalidations);

    // Peer-side close seen by poll()
    fx->plc.linkUp = true;
    TEST_ASSERT_EQUAL(Conn::SUCCESS, fx->conn.reconnect());
    fx->plc.peerClose();
    TEST_ASSERT_EQUAL(Conn::DEGRADED, fx->conn.poll());
}

int main(void) {
    UNITY_BEGIN();
    RUN_TEST(test_write_then_read_back);
    RUN_TEST(test_read_input_registers);
    RUN_TEST(test_write_multiple_registers);
    RUN_TEST(test_fragmented_stream);
    RUN_TEST(test_invalid_requests_do_no_io);
    RUN_TEST(test_transaction_ids_unique_and_wrapping);
    RUN_TEST(test_stale_response_discarded);
    RUN_TEST(test_modbus_exception_keeps_session);
    RUN_TEST(test_nonstandard_exception_keeps_session);
    RUN_TEST(test_partial_write_is_framing_error);
    RUN_TEST(test_corrupted_stream_is_framing_error);
    RUN_TEST(test_link_down_during_read);
    RUN_TEST(test_response_timeout_then_recovery);
    RUN_TEST(test_send_failure_degrades);
    RUN_TEST(test_connect_errors);
    RUN_TEST(test_invalid_plc_address);
    RUN_TEST(test_set_plc_address);
    RUN_TEST(test_reconnect_after_transient_failures);
    RUN_TEST(test_reconnect_exhausted);
    RUN_TEST(test_auto_reconnect_disabled);
    RUN_TEST(test_disconnect_idempotent);
    RUN_TEST(test_stale_arp_needs_refresh);
    RUN_TEST(test_force_arp_mode);
    RUN_TEST(test_force_arp_mode_from_config);
    RUN_TEST(test_arp_refresh_bounded);
    RUN_TEST(test_backoff_policy);
    RUN_TEST(test_poll_detects_faults);
    return UNITY_END();
}
