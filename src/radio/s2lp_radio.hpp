// src/radio/s2lp_radio.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

#include "config/system_config.hpp"
#include "hardware/hal.hpp"
#include "hardware/s2lp/device.hpp"
#include "hardware/s2lp/register_interface.hpp"
#include "hardware/s2lp/registers.hpp"
#include "types/configurations/radio_configuration.hpp"
#include "types/error_codes/result.hpp"
#include "types/packet_formats/packet_format.hpp"
#include "types/packet_formats/packet_metadata.hpp"
#include "types/radio/csma_ca.hpp"
#include "types/radio/gpio_function.hpp"
#include "types/radio/radio_results.hpp"
#include "types/radio/radio_state.hpp"
#include "types/radio/rx_mode.hpp"

namespace s2lp {
namespace radio {

/**
 * @brief Driver of one S2-LP transceiver
 *
 * The object tracks the chip state and only accepts the operations that are
 * legal in it. Any other call fails with kInvalidState before touching the
 * bus or the pins.
 *
 * Shutdown -> Init -> Ready -> SetFormat -> Ready -> SendPacket -> Tx
 *                                                 -> StartReceive -> Rx
 *                                                 -> Standby -> Standby
 * Tx and Rx return to Ready through Finish once Wait produced a final result,
 * or through Abort at any time.
 *
 * Payload and receive buffers are borrowed, they must outlive the TX or RX.
 */
class S2lpRadio {
   public:
    /**
     * @brief Construct a radio in the shutdown state
     *
     * @param registers Register transport
     * @param shutdown_pin Output wired to SDN
     * @param irq_pin Input wired to the chip GPIO selected by @p gpio_number
     * @param gpio_number Chip GPIO used as interrupt line
     * @param delay Delay source
     */
    S2lpRadio(std::unique_ptr<ll::IRegisterInterface> registers,
              std::unique_ptr<hal::IOutputPin> shutdown_pin,
              std::unique_ptr<hal::IInterruptPin> irq_pin,
              ll::GpioNumber gpio_number, std::unique_ptr<hal::IDelay> delay);

    /**
     * @brief Construct a radio over an SPI device using the standard S2-LP
     * SPI protocol
     */
    S2lpRadio(std::unique_ptr<hal::ISpiDevice> spi,
              std::unique_ptr<hal::IOutputPin> shutdown_pin,
              std::unique_ptr<hal::IInterruptPin> irq_pin,
              ll::GpioNumber gpio_number, std::unique_ptr<hal::IDelay> delay);

    ~S2lpRadio() = default;

    // Prevent copying
    S2lpRadio(const S2lpRadio&) = delete;
    S2lpRadio& operator=(const S2lpRadio&) = delete;

    /**
     * @brief Take over the chip from @p other
     *
     * @p other is left in the shutdown state without a register transport,
     * every operation on it fails with kInvalidState.
     */
    S2lpRadio(S2lpRadio&& other) noexcept;
    S2lpRadio& operator=(S2lpRadio&& other) noexcept;

    /**
     * @brief Reset the chip and apply the RF configuration
     *
     * The configuration is validated before any pin or bus access.
     *
     * @param config Physical configuration
     * @return Result kBadConfig, kInitError on a chip ID mismatch,
     *         kRcoLockError, kTimeout or a transport error
     */
    Result Init(const RadioConfig& config);

    /**
     * @brief Select the packet format, only once after Init
     *
     * @tparam Format A class implementing IPacketFormat with a nested Config
     * @param config Format configuration
     */
    template <typename Format>
    Result SetFormat(const typename Format::Config& config) {
        return ApplyFormat(std::make_unique<Format>(config));
    }

    /**
     * @brief Start sending a packet
     *
     * @param tx_meta_data Per packet fields, e.g. the destination address
     * @param payload Packet payload, borrowed until the TX is finished
     * @param len Number of payload bytes
     * @return Result kBufferTooLarge or kBadConfig when the packet does not
     *         fit the format, nothing is written in that case
     */
    Result SendPacket(const TxMetaData& tx_meta_data, const uint8_t* payload,
                      size_t len);

    /**
     * @brief Start receiving a packet
     *
     * @param buffer Destination, borrowed until the RX is finished
     * @param capacity Size of @p buffer
     * @param mode Receiver mode and optional timeout
     */
    Result StartReceive(uint8_t* buffer, size_t capacity,
                        const RxMode& mode = RxMode::Normal());

    /**
     * @brief Wait until the transmission ends
     *
     * Refills the FIFO while the packet is being sent. Once a final result
     * was produced, further calls give kTxAlreadyDone without bus access.
     *
     * @param result Set to the reason the transmission stopped
     * @return Result kBadState when the chip hangs in a lock state
     */
    Result Wait(TxResult& result);

    /**
     * @brief Wait until the reception ends
     *
     * Drains the FIFO into the receive buffer. Once a final result was
     * produced, further calls give kRxAlreadyDone without bus access.
     */
    Result Wait(RxResult& result);

    /**
     * @brief Block until the interrupt line is asserted, without reading it
     *
     * Only legal in Rx. Does not need the bus.
     */
    Result WaitForIrq();

    /**
     * @brief Return to Ready after Wait produced a final result
     *
     * @return Result kNotFinished when no final result was produced yet, the
     *         radio stays in Tx or Rx
     */
    Result Finish();

    /**
     * @brief Stop the running TX or RX and return to Ready
     */
    Result Abort();

    Result Standby();
    Result WakeUp();

    /**
     * @brief Put the chip into shutdown. The configuration is lost.
     */
    Result Shutdown();

    /**
     * @brief Configure collision avoidance for the following transmissions
     *
     * @return Result kInvalidArgument when a field is out of range
     */
    Result SetCsmaCa(const CsmaCaMode& mode);

    /**
     * @brief Assign a function to one of the chip GPIOs
     *
     * Reassigning the interrupt GPIO breaks Wait.
     */
    Result SetGpioFunction(ll::GpioNumber gpio, const GpioFunction& function);

    /**
     * @brief Raw register access
     *
     * Writes through this device bypass the driver bookkeeping. Check
     * IsLlAvailable() first, without a bus every access fails.
     */
    ll::Device& Ll() { return device_; }

    /**
     * @brief Whether Ll() can reach the chip in the current state
     */
    bool IsLlAvailable() const {
        return IsAddressable(state_) && device_.HasInterface();
    }

    /**
     * @brief Hand the register transport out during a reception
     *
     * Allows sharing the bus while waiting with WaitForIrq. Register
     * operations fail with kInvalidState until AttachSpi is called.
     */
    Result ReleaseSpi(std::unique_ptr<ll::IRegisterInterface>& registers);

    /**
     * @brief Give back the register transport taken with ReleaseSpi
     */
    Result AttachSpi(std::unique_ptr<ll::IRegisterInterface> registers);

    RadioState getState() const { return state_; }
    uint32_t getDigitalFrequency() const { return digital_frequency_; }
    PacketFormatType getFormatType() const;
    ll::GpioNumber getGpioNumber() const { return gpio_number_; }

   private:
    Result ApplyFormat(std::unique_ptr<IPacketFormat> format);

    Result CheckState(RadioState expected, const char* operation) const;
    Result CheckReadyWithFormat(const char* operation) const;
    Result CheckBus() const;

    Result ResetChip();
    Result SetClockDivider(bool enabled);
    Result WaitForChipState(ll::ChipState expected);
    Result CalibrateRco();
    Result ConfigureRf(const RadioConfig& config);

    Result IsRxFifoPending(bool& pending);
    Result StopReception(RxResultKind kind, RxResult& rx_result);

    void EnterState(RadioState state);
    void ClearTransfer();
    void TakeFrom(S2lpRadio& other);

    std::unique_ptr<ll::IRegisterInterface> registers_;
    ll::Device device_;
    std::unique_ptr<hal::IOutputPin> shutdown_pin_;
    std::unique_ptr<hal::IInterruptPin> irq_pin_;
    ll::GpioNumber gpio_number_;
    std::unique_ptr<hal::IDelay> delay_;

    RadioState state_ = RadioState::kShutdown;
    uint32_t digital_frequency_ = 0;
    std::unique_ptr<IPacketFormat> format_;

    // TX
    const uint8_t* tx_remaining_ = nullptr;
    size_t tx_remaining_len_ = 0;
    bool tx_done_ = false;

    // RX
    uint8_t* rx_buffer_ = nullptr;
    size_t rx_capacity_ = 0;
    size_t rx_written_ = 0;
    bool rx_done_ = false;
};

}  // namespace radio
}  // namespace s2lp
