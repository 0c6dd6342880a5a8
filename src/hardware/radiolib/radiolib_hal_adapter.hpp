// src/hardware/radiolib/radiolib_hal_adapter.hpp
#pragma once

#include <cstdint>

#include <RadioLib.h>

#include "hardware/hal.hpp"

namespace s2lp {
namespace hal {

/**
 * @brief SPI device on a RadioLib HAL with a manually driven chip select
 *
 * The HAL is not owned and must outlive the adapter. All adapters in this
 * file accept a null HAL; their operations then fail without touching a pin.
 */
class RadioLibSpiDevice : public ISpiDevice {
   public:
    /**
     * @brief Construct a new RadioLib SPI device
     *
     * @param hal RadioLib HAL, spiBegin() must have been called
     * @param cs_pin Chip select pin, active low
     */
    RadioLibSpiDevice(RadioLibHal* hal, uint32_t cs_pin);

    Result Write(const uint8_t header[2], const uint8_t* data,
                 size_t len) override;
    Result Read(const uint8_t header[2], uint8_t* data, size_t len) override;

   private:
    static constexpr size_t kMaxTransfer = 130;  ///< Header plus a full FIFO

    Result Transfer(const uint8_t header[2], const uint8_t* out, uint8_t* in,
                    size_t len);

    RadioLibHal* hal_;
    uint32_t cs_pin_;
};

class RadioLibOutputPin : public IOutputPin {
   public:
    RadioLibOutputPin(RadioLibHal* hal, uint32_t pin);

    Result SetHigh() override;
    Result SetLow() override;

   private:
    RadioLibHal* hal_;
    uint32_t pin_;
};

/**
 * @brief Interrupt line read by polling the pin level
 */
class RadioLibInterruptPin : public IInterruptPin {
   public:
    RadioLibInterruptPin(RadioLibHal* hal, uint32_t pin);

    Result WaitForHigh() override;
    Result WaitForLow() override;
    Result WaitForLow(uint32_t timeout_ms, bool& timed_out) override;

   private:
    Result WaitForLevel(bool high, bool use_timeout, uint32_t timeout_ms,
                        bool& timed_out);

    RadioLibHal* hal_;
    uint32_t pin_;
};

class RadioLibDelay : public IDelay {
   public:
    explicit RadioLibDelay(RadioLibHal* hal) : hal_(hal) {}

    void DelayUs(uint32_t us) override {
        if (hal_ != nullptr) {
            hal_->delayMicroseconds(us);
        }
    }
    void DelayMs(uint32_t ms) override {
        if (hal_ != nullptr) {
            hal_->delay(ms);
        }
    }
    uint32_t millis() override {
        return hal_ != nullptr ? static_cast<uint32_t>(hal_->millis()) : 0;
    }

   private:
    RadioLibHal* hal_;
};

}  // namespace hal
}  // namespace s2lp
