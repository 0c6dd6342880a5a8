/**
 * @file main.cpp
 * @brief Ping pong between two S2-LP boards using the basic packet format
 *
 * Flash one board with PING_INITIATOR defined and the other without it.
 */
#include <Arduino.h>
#include <RadioLib.h>

#include <memory>

#include "hardware/radiolib/radiolib_hal_adapter.hpp"
#include "s2lp.hpp"

using namespace s2lp;
using namespace s2lp::radio;

#define S2LP_CS 10
#define S2LP_SDN 9
#define S2LP_IRQ 8

#define S2LP_XTAL 50000000U
#define S2LP_FREQUENCY 868000000U
#define S2LP_DATARATE 38400U
#define S2LP_DEVIATION 20000U
#define S2LP_BANDWIDTH 100000U

#ifdef PING_INITIATOR
#define NODE_ADDRESS 0x01
#define PEER_ADDRESS 0x02
#else
#define NODE_ADDRESS 0x02
#define PEER_ADDRESS 0x01
#endif
#define RX_TIMEOUT_US 500000U

ArduinoHal* radiolib_hal = nullptr;
std::unique_ptr<S2lpRadio> radio;

uint8_t rx_buffer[64];
uint32_t counter = 0;

void halt(const Result& result) {
    LOG_ERROR("S2-LP error: %s", result.GetErrorMessage().c_str());
    LOG_FLUSH();
    while (true) {
        delay(1000);
    }
}

bool sendCounter() {
    uint8_t payload[4] = {
        static_cast<uint8_t>(counter >> 24), static_cast<uint8_t>(counter >> 16),
        static_cast<uint8_t>(counter >> 8), static_cast<uint8_t>(counter)};

    TxMetaData meta;
    meta.destination_address = PEER_ADDRESS;
    Result result = radio->SendPacket(meta, payload, sizeof(payload));
    if (!result) {
        halt(result);
    }

    TxResult tx_result = TxResult::kTxAlreadyDone;
    result = radio->Wait(tx_result);
    if (!result) {
        halt(result);
    }
    result = radio->Finish();
    if (!result) {
        halt(result);
    }

    LOG_INFO("Sent %u: %s", counter, TxResultToString(tx_result));
    return tx_result == TxResult::kOk;
}

bool receiveCounter() {
    RxTimeout timeout;
    timeout.timeout_us = RX_TIMEOUT_US;

    Result result = radio->StartReceive(rx_buffer, sizeof(rx_buffer),
                                        RxMode::Normal(timeout));
    if (!result) {
        halt(result);
    }

    RxResult rx_result;
    result = radio->Wait(rx_result);
    if (!result) {
        halt(result);
    }
    result = radio->Finish();
    if (!result) {
        halt(result);
    }

    if (!rx_result.IsOk()) {
        LOG_DEBUG("Nothing received: %s", RxResultKindToString(rx_result.kind));
        return false;
    }
    if (rx_result.packet_size < 4) {
        return false;
    }

    counter = (static_cast<uint32_t>(rx_buffer[0]) << 24) |
              (static_cast<uint32_t>(rx_buffer[1]) << 16) |
              (static_cast<uint32_t>(rx_buffer[2]) << 8) | rx_buffer[3];
    LOG_INFO("Received %u, RSSI %d dBm", counter, rx_result.rssi_value);
    return true;
}

void setup() {
    Serial.begin(115200);

    radiolib_hal = new ArduinoHal();
    radiolib_hal->init();

    radio = std::make_unique<S2lpRadio>(
        std::unique_ptr<hal::ISpiDevice>(
            std::make_unique<hal::RadioLibSpiDevice>(radiolib_hal, S2LP_CS)),
        std::make_unique<hal::RadioLibOutputPin>(radiolib_hal, S2LP_SDN),
        std::make_unique<hal::RadioLibInterruptPin>(radiolib_hal, S2LP_IRQ),
        ll::GpioNumber::kGpio0,
        std::make_unique<hal::RadioLibDelay>(radiolib_hal));

    RadioConfig config(S2LP_XTAL, S2LP_FREQUENCY, ll::ModulationType::k2Gfsk1,
                       S2LP_DATARATE, S2LP_DEVIATION, S2LP_BANDWIDTH);
    Result result = radio->Init(config);
    if (!result) {
        halt(result);
    }

    BasicConfig format;
    format.include_address = true;
    format.packet_filter.source_address = NODE_ADDRESS;
    result = radio->SetFormat<BasicFormat>(format);
    if (!result) {
        halt(result);
    }

    result =
        radio->SetCsmaCa(CsmaCaMode::Backoff(ll::CcaPeriod::kBits64, 3, 5, 32));
    if (!result) {
        halt(result);
    }

    LOG_INFO("S2-LP ready, digital frequency %u Hz",
             radio->getDigitalFrequency());

#ifdef PING_INITIATOR
    sendCounter();
#endif
}

void loop() {
    if (receiveCounter()) {
        counter++;
        sendCounter();
        return;
    }
#ifdef PING_INITIATOR
    sendCounter();
#endif
}
