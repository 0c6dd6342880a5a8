// src/types/radio/rx_mode.hpp
#pragma once

#include <cstdint>
#include <optional>

#include "hardware/s2lp/device.hpp"
#include "types/error_codes/result.hpp"

namespace s2lp {
namespace radio {

/**
 * @brief Signal quality conditions that stop the RX timer
 *
 * Bit 3 selects OR (set) or AND (clear) between the enabled conditions,
 * bits 2..0 enable RSSI, SQI and PQI.
 */
enum class RxTimeoutMask : uint8_t {
    kNoTimeout = 0b0000,   ///< Timer disabled, RX runs until a packet arrives
    kNone = 0b1000,        ///< Timer expires even during a reception
    kRssi = 0b0100,        ///< RSSI above threshold
    kSqi = 0b0010,         ///< SQI above threshold (default)
    kPqi = 0b0001,         ///< PQI above threshold
    kRssiAndSqi = 0b0110,  ///< Both RSSI and SQI above threshold
    kRssiAndPqi = 0b0101,  ///< Both RSSI and PQI above threshold
    kSqiAndPqi = 0b0011,   ///< Both SQI and PQI above threshold
    kAll = 0b0111,         ///< All above threshold
    kRssiOrSqi = 0b1110,   ///< RSSI or SQI above threshold
    kRssiOrPqi = 0b1101,   ///< RSSI or PQI above threshold
    kSqiOrPqi = 0b1011,    ///< SQI or PQI above threshold
    kAny = 0b1111,         ///< Any above threshold
};

/**
 * @brief RX timeout settings
 */
struct RxTimeout {
    uint32_t timeout_us = 0;                  ///< Time until the RX timer expires
    RxTimeoutMask mask = RxTimeoutMask::kSqi;  ///< Conditions stopping the timer

    /**
     * @brief Program the timer and its stop conditions
     *
     * Timeouts longer than the timer supports (about 3 s) saturate and a
     * warning is logged.
     */
    Result WriteToDevice(ll::Device& device, uint32_t digital_frequency) const;
};

/**
 * @brief How the receiver runs
 *
 * Only the normal mode is supported: the receiver stays on until a packet
 * arrives, the optional timeout expires or the reception is aborted.
 */
struct RxMode {
    std::optional<RxTimeout> timeout;

    static RxMode Normal() { return RxMode{}; }
    static RxMode Normal(RxTimeout timeout) { return RxMode{timeout}; }

    Result WriteToDevice(ll::Device& device, uint32_t digital_frequency) const;
};

}  // namespace radio
}  // namespace s2lp
