// src/types/radio/radio_results.hpp
#pragma once

#include <cstddef>
#include <cstdint>

#include "types/packet_formats/packet_metadata.hpp"

namespace s2lp {
namespace radio {

/**
 * @brief Reason a transmission stopped
 */
enum class TxResult {
    kOk,                 ///< The packet was sent
    kFifoError,          ///< The FIFO ran empty or overflowed, TX was aborted
    kMaxReTxReached,     ///< Sent, but no ack arrived within the retries
    kCcaBackoffReached,  ///< CSMA/CA never found a free channel, not sent
    kTxAlreadyDone       ///< Wait was called again after a final result
};

/**
 * @brief Kind of RX result
 */
enum class RxResultKind {
    kOk,               ///< A packet was received
    kRxAlreadyDone,    ///< Wait was called again after a final result
    kFifo,             ///< The RX FIFO overflowed
    kDiscarded,        ///< The packet was dropped by the packet filter
    kCrcError,         ///< The packet failed the CRC check
    kTooBigForBuffer,  ///< The packet did not fit the receive buffer
    kTimeout           ///< The RX timer expired
};

/**
 * @brief Outcome of an RX wait
 *
 * The packet fields are only meaningful for kOk.
 */
struct RxResult {
    RxResultKind kind = RxResultKind::kRxAlreadyDone;
    size_t packet_size = 0;  ///< Bytes written into the receive buffer
    int16_t rssi_value = 0;  ///< RSSI in dBm
    RxMetaData meta_data;    ///< Format specific fields

    bool IsOk() const { return kind == RxResultKind::kOk; }
};

inline const char* TxResultToString(TxResult result) {
    switch (result) {
        case TxResult::kOk:
            return "Ok";
        case TxResult::kFifoError:
            return "FifoError";
        case TxResult::kMaxReTxReached:
            return "MaxReTxReached";
        case TxResult::kCcaBackoffReached:
            return "CcaBackoffReached";
        case TxResult::kTxAlreadyDone:
            return "TxAlreadyDone";
        default:
            return "Unknown";
    }
}

inline const char* RxResultKindToString(RxResultKind kind) {
    switch (kind) {
        case RxResultKind::kOk:
            return "Ok";
        case RxResultKind::kRxAlreadyDone:
            return "RxAlreadyDone";
        case RxResultKind::kFifo:
            return "Fifo";
        case RxResultKind::kDiscarded:
            return "Discarded";
        case RxResultKind::kCrcError:
            return "CrcError";
        case RxResultKind::kTooBigForBuffer:
            return "TooBigForBuffer";
        case RxResultKind::kTimeout:
            return "Timeout";
        default:
            return "Unknown";
    }
}

}  // namespace radio
}  // namespace s2lp
