#include "s2lp_radio.hpp"

#include "hardware/s2lp/spi_register_interface.hpp"
#include "radio/rf_parameters.hpp"
#include "utils/logger.hpp"

namespace s2lp {
namespace radio {

namespace {

// Default FIFO thresholds, 48 bytes
constexpr uint8_t kFifoThreshold = 0x30;
constexpr uint8_t kRssiFilterGain = 14;
// -85 dBm
constexpr uint8_t kRssiThreshold = 65;

}  // namespace

S2lpRadio::S2lpRadio(std::unique_ptr<ll::IRegisterInterface> registers,
                     std::unique_ptr<hal::IOutputPin> shutdown_pin,
                     std::unique_ptr<hal::IInterruptPin> irq_pin,
                     ll::GpioNumber gpio_number,
                     std::unique_ptr<hal::IDelay> delay)
    : registers_(std::move(registers)),
      shutdown_pin_(std::move(shutdown_pin)),
      irq_pin_(std::move(irq_pin)),
      gpio_number_(gpio_number),
      delay_(std::move(delay)) {}

S2lpRadio::S2lpRadio(std::unique_ptr<hal::ISpiDevice> spi,
                     std::unique_ptr<hal::IOutputPin> shutdown_pin,
                     std::unique_ptr<hal::IInterruptPin> irq_pin,
                     ll::GpioNumber gpio_number,
                     std::unique_ptr<hal::IDelay> delay)
    : S2lpRadio(std::make_unique<ll::SpiRegisterInterface>(std::move(spi)),
                std::move(shutdown_pin), std::move(irq_pin), gpio_number,
                std::move(delay)) {}

S2lpRadio::S2lpRadio(S2lpRadio&& other) noexcept
    : gpio_number_(other.gpio_number_) {
    TakeFrom(other);
}

S2lpRadio& S2lpRadio::operator=(S2lpRadio&& other) noexcept {
    if (this != &other) {
        TakeFrom(other);
    }
    return *this;
}

void S2lpRadio::TakeFrom(S2lpRadio& other) {
    const bool attached = other.device_.HasInterface();

    registers_ = std::move(other.registers_);
    device_.setInterface(attached ? registers_.get() : nullptr);
    shutdown_pin_ = std::move(other.shutdown_pin_);
    irq_pin_ = std::move(other.irq_pin_);
    gpio_number_ = other.gpio_number_;
    delay_ = std::move(other.delay_);

    state_ = other.state_;
    digital_frequency_ = other.digital_frequency_;
    format_ = std::move(other.format_);

    tx_remaining_ = other.tx_remaining_;
    tx_remaining_len_ = other.tx_remaining_len_;
    tx_done_ = other.tx_done_;
    rx_buffer_ = other.rx_buffer_;
    rx_capacity_ = other.rx_capacity_;
    rx_written_ = other.rx_written_;
    rx_done_ = other.rx_done_;

    // The moved-from handle must not reach the chip anymore
    other.device_.setInterface(nullptr);
    other.state_ = RadioState::kShutdown;
    other.digital_frequency_ = 0;
    other.ClearTransfer();
}

PacketFormatType S2lpRadio::getFormatType() const {
    return format_ ? format_->getType() : PacketFormatType::kUninitialized;
}

Result S2lpRadio::CheckState(RadioState expected, const char* operation) const {
    if (state_ != expected) {
        LOG_WARNING("%s not allowed in state %s", operation,
                    RadioStateToString(state_));
        return Result::Error(S2lpErrorCode::kInvalidState);
    }
    return Result::Success();
}

Result S2lpRadio::CheckReadyWithFormat(const char* operation) const {
    Result result = CheckState(RadioState::kReady, operation);
    if (!result) {
        return result;
    }
    if (!format_) {
        LOG_WARNING("%s needs a packet format", operation);
        return Result(S2lpErrorCode::kInvalidState, "No packet format set");
    }
    return Result::Success();
}

Result S2lpRadio::CheckBus() const {
    if (!device_.HasInterface()) {
        return Result(S2lpErrorCode::kInvalidState,
                      "No register interface attached");
    }
    return Result::Success();
}

void S2lpRadio::EnterState(RadioState state) {
    if (state != state_) {
        LOG_DEBUG("Radio state %s -> %s", RadioStateToString(state_),
                  RadioStateToString(state));
    }
    state_ = state;
    if (state == RadioState::kShutdown) {
        // Configuration is lost, registers are unreachable until Init
        device_.setInterface(nullptr);
        format_.reset();
        digital_frequency_ = 0;
        ClearTransfer();
    }
}

void S2lpRadio::ClearTransfer() {
    tx_remaining_ = nullptr;
    tx_remaining_len_ = 0;
    tx_done_ = false;
    rx_buffer_ = nullptr;
    rx_capacity_ = 0;
    rx_written_ = 0;
    rx_done_ = false;
}

Result S2lpRadio::Init(const RadioConfig& config) {
    Result result = CheckState(RadioState::kShutdown, "Init");
    if (!result) {
        return result;
    }

    result = config.Check();
    if (!result) {
        LOG_ERROR("Invalid radio configuration: %s",
                  result.GetErrorMessage().c_str());
        return result;
    }

    if (!registers_) {
        return Result(S2lpErrorCode::kInvalidState,
                      "No register interface attached");
    }
    device_.setInterface(registers_.get());

    result = ResetChip();
    if (result) {
        result = ConfigureRf(config);
    }
    if (!result) {
        // Nothing of a half done init stays reachable
        device_.setInterface(nullptr);
        return result;
    }

    digital_frequency_ = config.getDigitalFrequency();
    format_.reset();
    EnterState(RadioState::kReady);
    LOG_INFO("S2-LP initialized at %u Hz",
             static_cast<unsigned>(config.getBaseFrequency()));
    return Result::Success();
}

Result S2lpRadio::ResetChip() {
    LOG_DEBUG("Resetting the radio");

    Result result = shutdown_pin_->SetHigh();
    if (!result) {
        return result;
    }
    delay_->DelayUs(1);
    result = shutdown_pin_->SetLow();
    if (!result) {
        return result;
    }

    if (gpio_number_ == ll::GpioNumber::kGpio0) {
        // GPIO0 signals the end of the power on reset
        result = irq_pin_->WaitForHigh();
        if (!result) {
            return result;
        }
    } else {
        delay_->DelayMs(S2LP_BOOT_DELAY_MS);
    }

    uint8_t version = 0;
    result = device_.ReadRegister(ll::reg::kDeviceInfo0, version);
    if (!result) {
        return result;
    }
    if (version != ll::kExpectedVersion) {
        LOG_ERROR("Unexpected chip version 0x%02X", version);
        return Result(S2lpErrorCode::kInitError,
                      "Chip version does not match the S2-LP");
    }

    return device_.WriteRegister(
        ll::reg::kGpio0Conf + static_cast<uint8_t>(gpio_number_),
        GpioFunction::Output(ll::GpioSelectOutput::kIrq).Encode());
}

Result S2lpRadio::WaitForChipState(ll::ChipState expected) {
    for (uint32_t attempt = 0; attempt < S2LP_STATE_POLL_ATTEMPTS; ++attempt) {
        uint8_t state = 0;
        Result result = device_.ReadChipState(state);
        if (!result) {
            return result;
        }
        if (state == static_cast<uint8_t>(expected)) {
            return Result::Success();
        }
        delay_->DelayUs(S2LP_STATE_POLL_INTERVAL_US);
    }
    LOG_ERROR("Chip never reached state 0x%02X",
              static_cast<unsigned>(expected));
    return Result(S2lpErrorCode::kTimeout, "Chip state change timed out");
}

Result S2lpRadio::SetClockDivider(bool enabled) {
    // PD_CLKDIV powers the divider down
    const uint8_t desired = enabled ? 0 : 1;
    uint8_t current = 0;
    Result result = device_.ReadField(ll::field::kPdClkDiv, current);
    if (!result) {
        return result;
    }
    if (current == desired) {
        return Result::Success();
    }

    // The divider can only be changed in standby
    result = device_.Dispatch(ll::Command::kStandby);
    if (!result) {
        return result;
    }
    result = WaitForChipState(ll::ChipState::kStandby);
    if (!result) {
        return result;
    }

    result = device_.WriteField(ll::field::kPdClkDiv, desired);
    if (!result) {
        return result;
    }

    result = device_.Dispatch(ll::Command::kReady);
    if (!result) {
        return result;
    }
    return WaitForChipState(ll::ChipState::kReady);
}

Result S2lpRadio::CalibrateRco() {
    Result result = device_.WriteFlag(ll::field::kRcoCalibration, true);
    if (!result) {
        return result;
    }

    for (uint32_t attempt = 0; attempt < S2LP_STATE_POLL_ATTEMPTS; ++attempt) {
        uint8_t mc_state1 = 0;
        result = device_.ReadRegister(ll::reg::kMcState1, mc_state1);
        if (!result) {
            return result;
        }
        if (ll::field::kErrorLock.Decode(mc_state1)) {
            LOG_ERROR("RCO calibration failed with a lock error");
            return Result::Error(S2lpErrorCode::kRcoLockError);
        }
        if (ll::field::kRcoCalOk.Decode(mc_state1)) {
            return Result::Success();
        }
        delay_->DelayUs(S2LP_STATE_POLL_INTERVAL_US);
    }
    return Result(S2lpErrorCode::kTimeout, "RCO calibration timed out");
}

Result S2lpRadio::ConfigureRf(const RadioConfig& config) {
    const uint32_t xtal = config.getXtalFrequency();
    const uint32_t fdig = config.getDigitalFrequency();

    Result result = SetClockDivider(UsesClockDivider(xtal));
    if (!result) {
        return result;
    }

    const IfOffsets offsets = ComputeIfOffsets(xtal, fdig);
    result = device_.WriteRegister(ll::reg::kIfOffsetAna, offsets.analog);
    if (!result) {
        return result;
    }
    result = device_.WriteRegister(ll::reg::kIfOffsetDig, offsets.digital);
    if (!result) {
        return result;
    }

    const DatarateWord datarate = EncodeDatarate(config.getDatarate(), fdig);
    result = device_.WriteUint16(ll::reg::kMod4, datarate.mantissa);
    if (!result) {
        return result;
    }
    result = device_.WriteRegister(
        ll::reg::kMod2,
        ll::field::kModType.Encode(
            static_cast<uint8_t>(config.getModulation())) |
            ll::field::kDatarateExponent.Encode(datarate.exponent));
    if (!result) {
        return result;
    }

    const FrequencyDeviationWord fdev =
        EncodeFrequencyDeviation(config.getFrequencyDeviation(), xtal);
    result = device_.WriteField(ll::field::kFdevExponent, fdev.exponent);
    if (!result) {
        return result;
    }
    result = device_.WriteRegister(ll::reg::kMod0, fdev.mantissa);
    if (!result) {
        return result;
    }

    const ChannelFilterWord filter =
        EncodeChannelFilter(config.getBandwidth(), fdig);
    result = device_.WriteRegister(
        ll::reg::kChFlt, ll::field::kChFltMantissa.Encode(filter.mantissa) |
                             ll::field::kChFltExponent.Encode(filter.exponent));
    if (!result) {
        return result;
    }

    FrequencyBand band;
    if (!GetFrequencyBand(config.getBaseFrequency(), band)) {
        return Result::BadConfig("Base frequency outside the supported bands");
    }
    result = device_.WriteFlag(ll::field::kRefDiv, config.getReferenceDivider());
    if (!result) {
        return result;
    }
    const SynthesizerWord synth =
        ComputeSynthesizerWord(config.getBaseFrequency(), xtal, band,
                               config.getReferenceDivider());
    const uint32_t synt_word =
        (static_cast<uint32_t>(ll::field::kCpIsel.Encode(synth.charge_pump) |
                               ll::field::kBandSelect.Encode(
                                   synth.band_select ? 1 : 0))
         << 24) |
        (synth.synt & 0x0FFFFFFF);
    result = device_.WriteUint32(ll::reg::kSynt3, synt_word);
    if (!result) {
        return result;
    }
    result = device_.WriteFlag(ll::field::kPllPfdSplitEn, synth.pfd_split);
    if (!result) {
        return result;
    }

    result = CalibrateRco();
    if (!result) {
        return result;
    }

    // Keep the FIFO content in low power states, CSMA/CA relies on it
    return device_.WriteFlag(ll::field::kSleepModeSel, true);
}

Result S2lpRadio::ApplyFormat(std::unique_ptr<IPacketFormat> format) {
    Result result = CheckState(RadioState::kReady, "SetFormat");
    if (!result) {
        return result;
    }
    if (format_) {
        LOG_WARNING("Packet format already set");
        return Result(S2lpErrorCode::kInvalidState,
                      "Packet format already set");
    }
    result = CheckBus();
    if (!result) {
        return result;
    }

    result = format->UseConfig(device_);
    if (!result) {
        return result;
    }

    result = device_.ModifyRegister(
        ll::reg::kPcktCtrl3,
        ll::field::kRxMode.mask | ll::field::kByteSwap.mask |
            ll::field::kFsk4SymSwap.mask,
        ll::field::kRxMode.Encode(
            static_cast<uint8_t>(ll::RxModeSelect::kNormal)));
    if (!result) {
        return result;
    }

    result = device_.ModifyRegister(
        ll::reg::kPcktCtrl1,
        ll::field::kFecEn.mask | ll::field::kSecondSyncSel.mask |
            ll::field::kTxSource.mask,
        ll::field::kTxSource.Encode(static_cast<uint8_t>(ll::TxSource::kNormal)));
    if (!result) {
        return result;
    }

    result = device_.WriteRegister(ll::reg::kFifoConfig0, kFifoThreshold);
    if (!result) {
        return result;
    }
    result = device_.WriteRegister(ll::reg::kFifoConfig3, kFifoThreshold);
    if (!result) {
        return result;
    }

    result = device_.WriteFlag(ll::field::kSmpsLvlMode, true);
    if (!result) {
        return result;
    }

    result = device_.ModifyRegister(
        ll::reg::kRssiFlt, ll::field::kRssiFlt.mask | ll::field::kCsMode.mask,
        ll::field::kRssiFlt.Encode(kRssiFilterGain) |
            ll::field::kCsMode.Encode(static_cast<uint8_t>(ll::CsMode::kStatic)));
    if (!result) {
        return result;
    }

    result = device_.WriteRegister(ll::reg::kRssiTh, kRssiThreshold);
    if (!result) {
        return result;
    }

    format_ = std::move(format);
    LOG_DEBUG("Packet format configured");
    return Result::Success();
}

Result S2lpRadio::Standby() {
    Result result = CheckState(RadioState::kReady, "Standby");
    if (!result) {
        return result;
    }
    result = device_.Dispatch(ll::Command::kStandby);
    if (!result) {
        return result;
    }
    EnterState(RadioState::kStandby);
    return Result::Success();
}

Result S2lpRadio::WakeUp() {
    Result result = CheckState(RadioState::kStandby, "WakeUp");
    if (!result) {
        return result;
    }
    result = device_.Dispatch(ll::Command::kReady);
    if (!result) {
        return result;
    }
    EnterState(RadioState::kReady);
    return Result::Success();
}

Result S2lpRadio::Shutdown() {
    Result result = CheckState(RadioState::kReady, "Shutdown");
    if (!result) {
        return result;
    }
    result = shutdown_pin_->SetHigh();
    if (!result) {
        return result;
    }
    EnterState(RadioState::kShutdown);
    return Result::Success();
}

Result S2lpRadio::SetCsmaCa(const CsmaCaMode& mode) {
    Result result = CheckState(RadioState::kReady, "SetCsmaCa");
    if (!result) {
        return result;
    }
    return mode.WriteToDevice(device_);
}

Result S2lpRadio::SetGpioFunction(ll::GpioNumber gpio,
                                  const GpioFunction& function) {
    if (!IsAddressable(state_)) {
        return CheckState(RadioState::kReady, "SetGpioFunction");
    }
    return device_.WriteRegister(
        ll::reg::kGpio0Conf + static_cast<uint8_t>(gpio), function.Encode());
}

Result S2lpRadio::ReleaseSpi(
    std::unique_ptr<ll::IRegisterInterface>& registers) {
    Result result = CheckState(RadioState::kRx, "ReleaseSpi");
    if (!result) {
        return result;
    }
    result = CheckBus();
    if (!result) {
        return result;
    }
    device_.setInterface(nullptr);
    registers = std::move(registers_);
    return Result::Success();
}

Result S2lpRadio::AttachSpi(std::unique_ptr<ll::IRegisterInterface> registers) {
    if (!registers) {
        return Result::InvalidArgument("No register interface given");
    }
    if (registers_) {
        return Result(S2lpErrorCode::kInvalidState,
                      "A register interface is already attached");
    }
    registers_ = std::move(registers);
    if (IsAddressable(state_)) {
        device_.setInterface(registers_.get());
    }
    return Result::Success();
}

}  // namespace radio
}  // namespace s2lp
