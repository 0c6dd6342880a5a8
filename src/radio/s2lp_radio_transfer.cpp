#include "s2lp_radio.hpp"

#include "utils/logger.hpp"

namespace s2lp {
namespace radio {

namespace {

constexpr uint32_t kTxIrqMask = ll::irq::kTxFifoAlmostEmpty |
                                ll::irq::kTxDataSent | ll::irq::kMaxReTxReach |
                                ll::irq::kTxFifoError |
                                ll::irq::kMaxBoCcaReach;

constexpr uint32_t kRxIrqMask =
    ll::irq::kRxDataReady | ll::irq::kRxFifoAlmostFull |
    ll::irq::kRxFifoError | ll::irq::kRxTimeout | ll::irq::kRxDataDisc |
    ll::irq::kCrcError | ll::irq::kRxSniffTimeout;

// IRQ causes that end a reception without a packet
constexpr uint32_t kRxFailureMask = ll::irq::kRxFifoError |
                                    ll::irq::kCrcError | ll::irq::kRxTimeout |
                                    ll::irq::kRxDataDisc;

// RSSI_LEVEL to dBm
constexpr int16_t kRssiOffset = 146;

}  // namespace

Result S2lpRadio::SendPacket(const TxMetaData& tx_meta_data,
                             const uint8_t* payload, size_t len) {
    Result result = CheckReadyWithFormat("SendPacket");
    if (!result) {
        return result;
    }
    if (payload == nullptr && len > 0) {
        return Result::InvalidArgument("Payload is null");
    }

    result = format_->SetupPacketSend(device_, tx_meta_data, len);
    if (!result) {
        return result;
    }

    // Carrier sense blanking must be off for CSMA/CA
    result = device_.WriteFlag(ll::field::kCsBlanking, false);
    if (!result) {
        return result;
    }

    result = device_.Dispatch(ll::Command::kFlushTxFifo);
    if (!result) {
        return result;
    }

    // Clear pending flags before arming the mask
    uint32_t irq_status = 0;
    result = device_.ReadIrqStatus(irq_status);
    if (!result) {
        return result;
    }
    result = device_.WriteIrqMask(kTxIrqMask);
    if (!result) {
        return result;
    }

    size_t initial_len = 0;
    result = device_.WriteFifo(payload, len, initial_len);
    if (!result) {
        return result;
    }

    LOG_DEBUG("Sending packet with len %u", static_cast<unsigned>(len));

    result = device_.Dispatch(ll::Command::kTx);
    if (!result) {
        return result;
    }

    ClearTransfer();
    tx_remaining_ = payload + initial_len;
    tx_remaining_len_ = len - initial_len;
    EnterState(RadioState::kTx);
    return Result::Success();
}

Result S2lpRadio::Wait(TxResult& tx_result) {
    Result result = CheckState(RadioState::kTx, "Wait");
    if (!result) {
        return result;
    }

    if (tx_done_) {
        tx_result = TxResult::kTxAlreadyDone;
        return Result::Success();
    }

    while (true) {
        bool timed_out = false;
        result = irq_pin_->WaitForLow(S2LP_TX_WAIT_TIMEOUT_MS, timed_out);
        if (!result) {
            return result;
        }

        if (timed_out) {
            uint8_t chip_state = 0;
            result = device_.ReadChipState(chip_state);
            if (!result) {
                LOG_ERROR("TX wait timed out and the chip state is unreadable");
                return Result(S2lpErrorCode::kBadState,
                              result.GetErrorMessage());
            }
            if (chip_state == static_cast<uint8_t>(ll::ChipState::kLockSt) ||
                !ll::IsKnownChipState(chip_state)) {
                LOG_ERROR("TX wait timed out in state 0x%02X", chip_state);
                return Result::Error(S2lpErrorCode::kBadState);
            }
            LOG_DEBUG("TX wait timed out in state 0x%02X", chip_state);
        }

        uint32_t irq_status = 0;
        result = device_.ReadIrqStatus(irq_status);
        if (!result) {
            return result;
        }
        LOG_DEBUG("TX wait interrupt: 0x%08X", static_cast<unsigned>(irq_status));

        if (irq_status & ll::irq::kTxFifoError) {
            result = device_.Dispatch(ll::Command::kSAbort);
            if (!result) {
                return result;
            }
            result = device_.Dispatch(ll::Command::kFlushTxFifo);
            if (!result) {
                return result;
            }
            tx_done_ = true;
            tx_result = TxResult::kFifoError;
            return Result::Success();
        }

        if (irq_status & ll::irq::kTxFifoAlmostEmpty) {
            size_t written = 0;
            result = device_.WriteFifo(tx_remaining_, tx_remaining_len_, written);
            if (!result) {
                return result;
            }
            tx_remaining_ += written;
            tx_remaining_len_ -= written;
            continue;
        }

        if (irq_status & ll::irq::kTxDataSent) {
            tx_result = TxResult::kOk;
        } else if (irq_status & ll::irq::kMaxReTxReach) {
            tx_result = TxResult::kMaxReTxReached;
        } else if (irq_status & ll::irq::kMaxBoCcaReach) {
            tx_result = TxResult::kCcaBackoffReached;
        } else {
            // Timeout or a cause outside the mask
            continue;
        }

        tx_done_ = true;
        LOG_DEBUG("TX done: %s", TxResultToString(tx_result));
        return Result::Success();
    }
}

Result S2lpRadio::StartReceive(uint8_t* buffer, size_t capacity,
                               const RxMode& mode) {
    Result result = CheckReadyWithFormat("StartReceive");
    if (!result) {
        return result;
    }
    if (buffer == nullptr && capacity > 0) {
        return Result::InvalidArgument("Receive buffer is null");
    }

    result = mode.WriteToDevice(device_, digital_frequency_);
    if (!result) {
        return result;
    }

    // Makes the FIFO more reliable
    result = device_.WriteFlag(ll::field::kCsBlanking, true);
    if (!result) {
        return result;
    }

    result = device_.Dispatch(ll::Command::kFlushRxFifo);
    if (!result) {
        return result;
    }

    // Clear pending flags before arming the mask
    uint32_t irq_status = 0;
    result = device_.ReadIrqStatus(irq_status);
    if (!result) {
        return result;
    }
    result = device_.WriteIrqMask(kRxIrqMask);
    if (!result) {
        return result;
    }

    LOG_DEBUG("Starting receiver");

    result = device_.Dispatch(ll::Command::kRx);
    if (!result) {
        return result;
    }

    ClearTransfer();
    rx_buffer_ = buffer;
    rx_capacity_ = capacity;
    EnterState(RadioState::kRx);
    return Result::Success();
}

Result S2lpRadio::Wait(RxResult& rx_result) {
    Result result = CheckState(RadioState::kRx, "Wait");
    if (!result) {
        return result;
    }

    if (rx_done_) {
        rx_result = RxResult{};
        rx_result.kind = RxResultKind::kRxAlreadyDone;
        return Result::Success();
    }

    while (true) {
        result = irq_pin_->WaitForLow();
        if (!result) {
            return result;
        }

        uint32_t irq_status = 0;
        result = device_.ReadIrqStatus(irq_status);
        if (!result) {
            return result;
        }
        LOG_DEBUG("RX wait interrupt: 0x%08X", static_cast<unsigned>(irq_status));

        // Bytes left behind a full buffer belong to a packet that does not fit
        bool too_big = false;
        if (rx_written_ == rx_capacity_) {
            result = IsRxFifoPending(too_big);
            if (!result) {
                return result;
            }
        }

        if (too_big || (irq_status & kRxFailureMask)) {
            RxResultKind kind = RxResultKind::kDiscarded;
            if (too_big) {
                kind = RxResultKind::kTooBigForBuffer;
            } else if (irq_status & ll::irq::kRxFifoError) {
                kind = RxResultKind::kFifo;
            } else if (irq_status & ll::irq::kCrcError) {
                kind = RxResultKind::kCrcError;
            } else if (irq_status & ll::irq::kRxTimeout) {
                kind = RxResultKind::kTimeout;
            }
            return StopReception(kind, rx_result);
        }

        if (irq_status &
            (ll::irq::kRxDataReady | ll::irq::kRxFifoAlmostFull)) {
            size_t received = 0;
            result = device_.ReadFifo(rx_buffer_ + rx_written_,
                                      rx_capacity_ - rx_written_, received);
            if (!result) {
                return result;
            }
            rx_written_ += received;
            LOG_DEBUG("Received %u bytes (total %u)",
                      static_cast<unsigned>(received),
                      static_cast<unsigned>(rx_written_));

            if (rx_written_ == rx_capacity_) {
                result = IsRxFifoPending(too_big);
                if (!result) {
                    return result;
                }
                if (too_big) {
                    return StopReception(RxResultKind::kTooBigForBuffer,
                                         rx_result);
                }
            }
        }

        if (irq_status & ll::irq::kRxDataReady) {
            uint8_t rssi_level = 0;
            result = device_.ReadRegister(ll::reg::kRssiLevel, rssi_level);
            if (!result) {
                return result;
            }

            RxResult received_packet;
            received_packet.kind = RxResultKind::kOk;
            received_packet.packet_size = rx_written_;
            received_packet.rssi_value =
                static_cast<int16_t>(rssi_level - kRssiOffset);
            result = format_->ReadRxMetaData(device_, received_packet.meta_data);
            if (!result) {
                return result;
            }

            rx_done_ = true;
            rx_result = received_packet;
            return Result::Success();
        }
    }
}

Result S2lpRadio::IsRxFifoPending(bool& pending) {
    uint8_t available = 0;
    Result result = device_.ReadRegister(ll::reg::kRxFifoStatus, available);
    if (!result) {
        return result;
    }
    pending = available > 0;
    return Result::Success();
}

Result S2lpRadio::StopReception(RxResultKind kind, RxResult& rx_result) {
    Result result = device_.Dispatch(ll::Command::kSAbort);
    if (!result) {
        return result;
    }
    result = device_.Dispatch(ll::Command::kFlushRxFifo);
    if (!result) {
        return result;
    }

    rx_done_ = true;
    rx_result = RxResult{};
    rx_result.kind = kind;
    LOG_DEBUG("RX stopped: %s", RxResultKindToString(kind));
    return Result::Success();
}

Result S2lpRadio::WaitForIrq() {
    Result result = CheckState(RadioState::kRx, "WaitForIrq");
    if (!result) {
        return result;
    }
    return irq_pin_->WaitForLow();
}

Result S2lpRadio::Finish() {
    if (state_ != RadioState::kTx && state_ != RadioState::kRx) {
        return CheckState(RadioState::kTx, "Finish");
    }

    const bool done = state_ == RadioState::kTx ? tx_done_ : rx_done_;
    if (!done) {
        return Result(S2lpErrorCode::kNotFinished,
                      "Wait has not produced a final result");
    }

    ClearTransfer();
    EnterState(RadioState::kReady);
    return Result::Success();
}

Result S2lpRadio::Abort() {
    if (state_ != RadioState::kTx && state_ != RadioState::kRx) {
        return CheckState(RadioState::kTx, "Abort");
    }

    Result result = device_.Dispatch(ll::Command::kSAbort);
    if (!result) {
        return result;
    }
    result = device_.Dispatch(state_ == RadioState::kTx
                                  ? ll::Command::kFlushTxFifo
                                  : ll::Command::kFlushRxFifo);
    if (!result) {
        return result;
    }

    ClearTransfer();
    EnterState(RadioState::kReady);
    return Result::Success();
}

}  // namespace radio
}  // namespace s2lp
