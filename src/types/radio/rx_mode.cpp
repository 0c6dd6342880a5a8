#include "rx_mode.hpp"

#include "radio/rf_parameters.hpp"
#include "utils/logger.hpp"

namespace s2lp {
namespace radio {

Result RxTimeout::WriteToDevice(ll::Device& device,
                                uint32_t digital_frequency) const {
    const uint8_t mask_bits = static_cast<uint8_t>(mask);

    Result result = device.WriteFlag(ll::field::kRxTimeoutAndOrSel,
                                     (mask_bits & 0b1000) != 0);
    if (!result) {
        return result;
    }

    const uint8_t protocol2_mask = ll::field::kCsTimeoutMask.mask |
                                   ll::field::kSqiTimeoutMask.mask |
                                   ll::field::kPqiTimeoutMask.mask;
    const uint8_t protocol2_value =
        ll::field::kCsTimeoutMask.Encode((mask_bits & 0b0100) != 0) |
        ll::field::kSqiTimeoutMask.Encode((mask_bits & 0b0010) != 0) |
        ll::field::kPqiTimeoutMask.Encode((mask_bits & 0b0001) != 0);
    result = device.ModifyRegister(ll::reg::kProtocol2, protocol2_mask,
                                   protocol2_value);
    if (!result) {
        return result;
    }

    RxTimerWord timer =
        FindRxTimerPrescalerAndCounter(timeout_us, digital_frequency);
    if (mask == RxTimeoutMask::kNoTimeout) {
        // A zero counter keeps the timer from ever expiring
        timer.counter = 0;
    } else if (timer.overflow) {
        LOG_WARNING("RX timeout (%u us) is longer than supported, using ~3 s",
                    static_cast<unsigned>(timeout_us));
    }

    result = device.WriteRegister(ll::reg::kTimers5, timer.counter);
    if (!result) {
        return result;
    }
    return device.WriteRegister(ll::reg::kTimers4, timer.prescaler);
}

Result RxMode::WriteToDevice(ll::Device& device,
                             uint32_t digital_frequency) const {
    if (timeout) {
        return timeout->WriteToDevice(device, digital_frequency);
    }
    return RxTimeout{0, RxTimeoutMask::kNoTimeout}.WriteToDevice(
        device, digital_frequency);
}

}  // namespace radio
}  // namespace s2lp
