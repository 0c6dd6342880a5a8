// src/types/radio/csma_ca.hpp
#pragma once

#include <cstdint>
#include <optional>

#include "hardware/s2lp/device.hpp"
#include "hardware/s2lp/registers.hpp"
#include "types/error_codes/result.hpp"

namespace s2lp {
namespace radio {

/**
 * @brief Collision avoidance done by the chip before every transmission
 *
 * Use the factory functions to build a mode. Ranges are checked by
 * Validate(), out of range values are never clamped.
 */
class CsmaCaMode {
   public:
    enum class Kind {
        kOff,         ///< Send without listening
        kPersistent,  ///< Keep listening until the channel is free, no backoff
        kBackoff      ///< Back off a random time when the channel is busy
    };

    static constexpr uint8_t kMinCcaPeriods = 1;
    static constexpr uint8_t kMaxCcaPeriods = 15;
    static constexpr uint8_t kMaxBackoffs = 7;
    static constexpr uint8_t kMinBackoffPrescaler = 2;
    static constexpr uint8_t kMaxBackoffPrescaler = 64;

    CsmaCaMode() = default;

    static CsmaCaMode Off() { return CsmaCaMode(); }

    /**
     * @param cca_period Length of one clear channel assessment
     * @param num_cca_periods Consecutive free periods needed, 1 to 15
     */
    static CsmaCaMode Persistent(ll::CcaPeriod cca_period,
                                 uint8_t num_cca_periods);

    /**
     * @param cca_period Length of one clear channel assessment
     * @param num_cca_periods Consecutive free periods needed, 1 to 15
     * @param max_backoffs Backoffs before giving up with
     *        TxResult::kCcaBackoffReached, 0 to 7
     * @param backoff_prescaler Divider of the RCO clock for the backoff
     *        unit, 2 to 64
     * @param custom_prng_seed Seed of the backoff random generator, the chip
     *        seeds itself when empty
     */
    static CsmaCaMode Backoff(ll::CcaPeriod cca_period, uint8_t num_cca_periods,
                              uint8_t max_backoffs, uint8_t backoff_prescaler,
                              std::optional<uint16_t> custom_prng_seed = {});

    Kind getKind() const { return kind_; }
    bool IsOff() const { return kind_ == Kind::kOff; }
    bool IsPersistent() const { return kind_ == Kind::kPersistent; }

    ll::CcaPeriod getCcaPeriod() const { return cca_period_; }
    uint8_t getNumCcaPeriods() const { return num_cca_periods_; }
    uint8_t getMaxBackoffs() const { return max_backoffs_; }
    uint8_t getBackoffPrescaler() const { return backoff_prescaler_; }
    std::optional<uint16_t> getCustomPrngSeed() const {
        return custom_prng_seed_;
    }

    /**
     * @brief Check the field ranges
     * @return Result kInvalidArgument naming the field
     */
    Result Validate() const;

    /**
     * @brief Program the CSMA registers and PROTOCOL1
     */
    Result WriteToDevice(ll::Device& device) const;

   private:
    Kind kind_ = Kind::kOff;
    ll::CcaPeriod cca_period_ = ll::CcaPeriod::kBits64;
    uint8_t num_cca_periods_ = 0;
    uint8_t max_backoffs_ = 0;
    uint8_t backoff_prescaler_ = 0;
    std::optional<uint16_t> custom_prng_seed_;
};

}  // namespace radio
}  // namespace s2lp
