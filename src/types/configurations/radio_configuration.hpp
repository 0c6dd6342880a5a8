// src/types/configurations/radio_configuration.hpp
#pragma once

#include <cstdint>
#include <string>

#include "hardware/s2lp/registers.hpp"
#include "types/error_codes/result.hpp"

namespace s2lp {

/**
 * @brief Physical configuration applied by S2lpRadio::Init
 *
 * Values are plain Hz and bit/s. Nothing is checked when a value is set, the
 * whole configuration is validated at once by Validate() since several limits
 * depend on the crystal frequency.
 */
class RadioConfig {
   public:
    static constexpr uint32_t kDefaultXtalFrequency = 50000000;
    static constexpr uint32_t kDefaultBaseFrequency = 868000000;
    static constexpr uint32_t kDefaultDatarate = 38400;
    static constexpr uint32_t kDefaultFrequencyDeviation = 20000;
    static constexpr uint32_t kDefaultBandwidth = 100000;

    /**
     * @brief Construct a new Radio Config object
     *
     * @param xtal_frequency Crystal frequency in Hz (default: 50 MHz)
     * @param base_frequency Carrier frequency in Hz (default: 868 MHz)
     * @param modulation Modulation type (default: 2-GFSK BT 1)
     * @param datarate Datarate in bit/s (default: 38400)
     * @param frequency_deviation Frequency deviation in Hz (default: 20 kHz)
     * @param bandwidth Channel filter bandwidth in Hz (default: 100 kHz)
     */
    explicit RadioConfig(
        uint32_t xtal_frequency = kDefaultXtalFrequency,
        uint32_t base_frequency = kDefaultBaseFrequency,
        ll::ModulationType modulation = ll::ModulationType::k2Gfsk1,
        uint32_t datarate = kDefaultDatarate,
        uint32_t frequency_deviation = kDefaultFrequencyDeviation,
        uint32_t bandwidth = kDefaultBandwidth);

    /**
     * @brief Configuration for a 50 MHz crystal at 868 MHz
     */
    static RadioConfig CreateDefault();

    uint32_t getXtalFrequency() const { return xtal_frequency_; }
    uint32_t getBaseFrequency() const { return base_frequency_; }
    ll::ModulationType getModulation() const { return modulation_; }
    uint32_t getDatarate() const { return datarate_; }
    uint32_t getFrequencyDeviation() const { return frequency_deviation_; }
    uint32_t getBandwidth() const { return bandwidth_; }

    /**
     * @brief Whether the crystal is divided by two before the synthesizer
     */
    bool getReferenceDivider() const { return reference_divider_; }

    /**
     * @brief Digital domain clock implied by the crystal frequency
     */
    uint32_t getDigitalFrequency() const;

    void setXtalFrequency(uint32_t xtal_frequency) {
        xtal_frequency_ = xtal_frequency;
    }
    void setBaseFrequency(uint32_t base_frequency) {
        base_frequency_ = base_frequency;
    }
    void setModulation(ll::ModulationType modulation) {
        modulation_ = modulation;
    }
    void setDatarate(uint32_t datarate) { datarate_ = datarate; }
    void setFrequencyDeviation(uint32_t frequency_deviation) {
        frequency_deviation_ = frequency_deviation;
    }
    void setBandwidth(uint32_t bandwidth) { bandwidth_ = bandwidth; }
    void setReferenceDivider(bool enabled) { reference_divider_ = enabled; }

    /**
     * @brief Check if the configuration is valid
     * @return bool True if all parameters are within valid ranges
     */
    bool IsValid() const;

    /**
     * @brief Describe every invalid field
     * @return std::string Empty when the configuration is valid
     */
    std::string Validate() const;

    /**
     * @brief Result form of Validate(), kBadConfig with the reason on failure
     */
    Result Check() const;

   private:
    uint32_t xtal_frequency_;
    uint32_t base_frequency_;
    ll::ModulationType modulation_;
    uint32_t datarate_;
    uint32_t frequency_deviation_;
    uint32_t bandwidth_;
    bool reference_divider_ = false;
};

}  // namespace s2lp
