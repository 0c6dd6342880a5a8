#include "radio_configuration.hpp"

#include <sstream>

#include "radio/rf_parameters.hpp"

namespace s2lp {

namespace {

constexpr uint32_t kMinLowXtal = 24000000;
constexpr uint32_t kMaxLowXtal = 26000000;
constexpr uint32_t kMinHighXtal = 48000000;
constexpr uint32_t kMaxHighXtal = 52000000;

bool IsSupportedXtal(uint32_t xtal_frequency) {
    return (xtal_frequency >= kMinLowXtal && xtal_frequency <= kMaxLowXtal) ||
           (xtal_frequency >= kMinHighXtal && xtal_frequency <= kMaxHighXtal);
}

}  // namespace

RadioConfig::RadioConfig(uint32_t xtal_frequency, uint32_t base_frequency,
                         ll::ModulationType modulation, uint32_t datarate,
                         uint32_t frequency_deviation, uint32_t bandwidth)
    : xtal_frequency_(xtal_frequency),
      base_frequency_(base_frequency),
      modulation_(modulation),
      datarate_(datarate),
      frequency_deviation_(frequency_deviation),
      bandwidth_(bandwidth) {}

RadioConfig RadioConfig::CreateDefault() {
    return RadioConfig{};
}

uint32_t RadioConfig::getDigitalFrequency() const {
    return radio::ComputeDigitalFrequency(xtal_frequency_);
}

bool RadioConfig::IsValid() const {
    return Validate().empty();
}

std::string RadioConfig::Validate() const {
    std::stringstream errors;

    if (!IsSupportedXtal(xtal_frequency_)) {
        errors << "Crystal frequency must be 24-26 MHz or 48-52 MHz. ";
        // Every other limit is derived from the crystal
        return errors.str();
    }

    radio::FrequencyBand band;
    if (!radio::GetFrequencyBand(base_frequency_, band)) {
        errors << "Base frequency outside the high (860-940 MHz) and middle "
                  "(430-470 MHz) bands. ";
    }

    const uint32_t digital_frequency = getDigitalFrequency();
    if (datarate_ < radio::kMinDatarate ||
        datarate_ > radio::MaxDatarate(digital_frequency)) {
        errors << "Datarate out of range. ";
    }

    if (frequency_deviation_ < radio::MinFrequencyDeviation(xtal_frequency_) ||
        frequency_deviation_ > radio::MaxFrequencyDeviation(xtal_frequency_)) {
        errors << "Frequency deviation out of range. ";
    }

    if (bandwidth_ < radio::MinChannelFilterBandwidth(digital_frequency) ||
        bandwidth_ > radio::MaxChannelFilterBandwidth(digital_frequency)) {
        errors << "Bandwidth out of range. ";
    }

    return errors.str();
}

Result RadioConfig::Check() const {
    std::string errors = Validate();
    if (!errors.empty()) {
        return Result::BadConfig(errors);
    }
    return Result::Success();
}

}  // namespace s2lp
