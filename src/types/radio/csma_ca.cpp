#include "csma_ca.hpp"

#include <string>

namespace s2lp {
namespace radio {

CsmaCaMode CsmaCaMode::Persistent(ll::CcaPeriod cca_period,
                                  uint8_t num_cca_periods) {
    CsmaCaMode mode;
    mode.kind_ = Kind::kPersistent;
    mode.cca_period_ = cca_period;
    mode.num_cca_periods_ = num_cca_periods;
    return mode;
}

CsmaCaMode CsmaCaMode::Backoff(ll::CcaPeriod cca_period,
                               uint8_t num_cca_periods, uint8_t max_backoffs,
                               uint8_t backoff_prescaler,
                               std::optional<uint16_t> custom_prng_seed) {
    CsmaCaMode mode;
    mode.kind_ = Kind::kBackoff;
    mode.cca_period_ = cca_period;
    mode.num_cca_periods_ = num_cca_periods;
    mode.max_backoffs_ = max_backoffs;
    mode.backoff_prescaler_ = backoff_prescaler;
    mode.custom_prng_seed_ = custom_prng_seed;
    return mode;
}

Result CsmaCaMode::Validate() const {
    if (kind_ == Kind::kOff) {
        return Result::Success();
    }

    if (num_cca_periods_ < kMinCcaPeriods || num_cca_periods_ > kMaxCcaPeriods) {
        return Result::InvalidArgument(
            "num_cca_periods must be in range 1..=15, value is " +
            std::to_string(num_cca_periods_));
    }

    if (kind_ == Kind::kBackoff) {
        if (backoff_prescaler_ < kMinBackoffPrescaler ||
            backoff_prescaler_ > kMaxBackoffPrescaler) {
            return Result::InvalidArgument(
                "backoff_prescaler must be in range 2..=64, value is " +
                std::to_string(backoff_prescaler_));
        }
        if (max_backoffs_ > kMaxBackoffs) {
            return Result::InvalidArgument(
                "max_backoffs must be in range 0..=7, value is " +
                std::to_string(max_backoffs_));
        }
    }

    return Result::Success();
}

Result CsmaCaMode::WriteToDevice(ll::Device& device) const {
    Result result = Validate();
    if (!result) {
        return result;
    }

    bool seed_reload = false;

    if (kind_ == Kind::kPersistent) {
        // NBACKOFF_MAX is kept at 1 so MAX_BO_CCA_REACH never fires
        result = device.WriteRegister(
            ll::reg::kCsmaConf0, ll::field::kCcaLen.Encode(num_cca_periods_) |
                                     ll::field::kNBackoffMax.Encode(1));
        if (!result) {
            return result;
        }
        result = device.WriteRegister(
            ll::reg::kCsmaConf1,
            ll::field::kCcaPeriod.Encode(static_cast<uint8_t>(cca_period_)));
        if (!result) {
            return result;
        }
    } else if (kind_ == Kind::kBackoff) {
        result = device.WriteRegister(
            ll::reg::kCsmaConf0, ll::field::kCcaLen.Encode(num_cca_periods_) |
                                     ll::field::kNBackoffMax.Encode(max_backoffs_));
        if (!result) {
            return result;
        }
        // The chip adds one to the prescaler
        result = device.WriteRegister(
            ll::reg::kCsmaConf1,
            ll::field::kCcaPeriod.Encode(static_cast<uint8_t>(cca_period_)) |
                ll::field::kBuPrsc.Encode(
                    static_cast<uint8_t>(backoff_prescaler_ - 1)));
        if (!result) {
            return result;
        }
        if (custom_prng_seed_) {
            // A zero seed stalls the generator
            uint16_t seed = *custom_prng_seed_ == 0 ? 1 : *custom_prng_seed_;
            result = device.WriteUint16(ll::reg::kCsmaConf3, seed);
            if (!result) {
                return result;
            }
            seed_reload = true;
        }
    }

    const uint8_t mask = ll::field::kCsmaOn.mask | ll::field::kCsmaPersOn.mask |
                         ll::field::kSeedReload.mask;
    const uint8_t value = ll::field::kCsmaOn.Encode(IsOff() ? 0 : 1) |
                          ll::field::kCsmaPersOn.Encode(IsPersistent() ? 1 : 0) |
                          ll::field::kSeedReload.Encode(seed_reload ? 1 : 0);
    return device.ModifyRegister(ll::reg::kProtocol1, mask, value);
}

}  // namespace radio
}  // namespace s2lp
