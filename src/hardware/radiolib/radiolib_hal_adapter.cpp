#include "radiolib_hal_adapter.hpp"

#include <cstring>

namespace s2lp {
namespace hal {

namespace {

// Time between two pin samples while waiting
constexpr uint32_t kPinPollIntervalUs = 10;

}  // namespace

RadioLibSpiDevice::RadioLibSpiDevice(RadioLibHal* hal, uint32_t cs_pin)
    : hal_(hal), cs_pin_(cs_pin) {
    if (hal_ != nullptr) {
        hal_->pinMode(cs_pin_, hal_->GpioModeOutput);
        hal_->digitalWrite(cs_pin_, hal_->GpioLevelHigh);
    }
}

Result RadioLibSpiDevice::Write(const uint8_t header[2], const uint8_t* data,
                                size_t len) {
    return Transfer(header, data, nullptr, len);
}

Result RadioLibSpiDevice::Read(const uint8_t header[2], uint8_t* data,
                               size_t len) {
    return Transfer(header, nullptr, data, len);
}

Result RadioLibSpiDevice::Transfer(const uint8_t header[2], const uint8_t* out,
                                   uint8_t* in, size_t len) {
    if (hal_ == nullptr) {
        return Result::Error(S2lpErrorCode::kBusError);
    }
    if (len + 2 > kMaxTransfer) {
        return Result(S2lpErrorCode::kBufferTooLarge,
                      "SPI transfer longer than the FIFO");
    }

    uint8_t tx[kMaxTransfer] = {0};
    uint8_t rx[kMaxTransfer] = {0};
    tx[0] = header[0];
    tx[1] = header[1];
    if (out != nullptr && len > 0) {
        std::memcpy(tx + 2, out, len);
    }

    hal_->spiBeginTransaction();
    hal_->digitalWrite(cs_pin_, hal_->GpioLevelLow);
    hal_->spiTransfer(tx, len + 2, rx);
    hal_->digitalWrite(cs_pin_, hal_->GpioLevelHigh);
    hal_->spiEndTransaction();

    if (in != nullptr && len > 0) {
        std::memcpy(in, rx + 2, len);
    }
    return Result::Success();
}

RadioLibOutputPin::RadioLibOutputPin(RadioLibHal* hal, uint32_t pin)
    : hal_(hal), pin_(pin) {
    if (hal_ != nullptr && pin_ != RADIOLIB_NC) {
        hal_->pinMode(pin_, hal_->GpioModeOutput);
    }
}

Result RadioLibOutputPin::SetHigh() {
    if (hal_ == nullptr || pin_ == RADIOLIB_NC) {
        return Result::Error(S2lpErrorCode::kShutdownPinError);
    }
    hal_->digitalWrite(pin_, hal_->GpioLevelHigh);
    return Result::Success();
}

Result RadioLibOutputPin::SetLow() {
    if (hal_ == nullptr || pin_ == RADIOLIB_NC) {
        return Result::Error(S2lpErrorCode::kShutdownPinError);
    }
    hal_->digitalWrite(pin_, hal_->GpioLevelLow);
    return Result::Success();
}

RadioLibInterruptPin::RadioLibInterruptPin(RadioLibHal* hal, uint32_t pin)
    : hal_(hal), pin_(pin) {
    if (hal_ != nullptr && pin_ != RADIOLIB_NC) {
        hal_->pinMode(pin_, hal_->GpioModeInput);
    }
}

Result RadioLibInterruptPin::WaitForHigh() {
    bool timed_out = false;
    return WaitForLevel(true, false, 0, timed_out);
}

Result RadioLibInterruptPin::WaitForLow() {
    bool timed_out = false;
    return WaitForLevel(false, false, 0, timed_out);
}

Result RadioLibInterruptPin::WaitForLow(uint32_t timeout_ms, bool& timed_out) {
    return WaitForLevel(false, true, timeout_ms, timed_out);
}

Result RadioLibInterruptPin::WaitForLevel(bool high, bool use_timeout,
                                          uint32_t timeout_ms,
                                          bool& timed_out) {
    timed_out = false;
    if (hal_ == nullptr || pin_ == RADIOLIB_NC) {
        return Result::Error(S2lpErrorCode::kGpioError);
    }

    const uint32_t level = high ? hal_->GpioLevelHigh : hal_->GpioLevelLow;
    const unsigned long start = hal_->millis();
    while (hal_->digitalRead(pin_) != level) {
        if (use_timeout && hal_->millis() - start >= timeout_ms) {
            timed_out = true;
            return Result::Success();
        }
        hal_->delayMicroseconds(kPinPollIntervalUs);
    }
    return Result::Success();
}

}  // namespace hal
}  // namespace s2lp
