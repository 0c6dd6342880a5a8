// src/radio/rf_parameters.hpp
#pragma once

#include <cstddef>
#include <cstdint>

namespace s2lp {
namespace radio {

/**
 * Conversions between physical RF parameters and their register encodings.
 *
 * All functions use exact integer arithmetic. Frequencies are in Hz,
 * datarates in bit/s and times in microseconds.
 */

constexpr uint32_t kDigitalDomainThresholdHz = 30000000;
constexpr uint32_t kIntermediateFrequencyHz = 300000;
constexpr uint64_t kVcoCenterFrequencyHz = 3600000000ULL;
constexpr uint32_t kMinDatarate = 100;
constexpr size_t kChannelFilterTableSize = 90;

/**
 * @brief Channel filter bandwidths in units of 100 Hz at a 26 MHz digital
 * clock. The index encodes CHFLT as exponent = index / 9 and
 * mantissa = index % 9.
 */
extern const uint16_t kChannelFilterTable[kChannelFilterTableSize];

/**
 * @brief Carrier frequency band of the synthesizer
 */
enum class FrequencyBand : uint8_t {
    kHigh,    ///< 860 MHz to 940 MHz, band factor 4
    kMiddle,  ///< 430 MHz to 470 MHz, band factor 8
};

struct DatarateWord {
    uint16_t mantissa;
    uint8_t exponent;
};

struct FrequencyDeviationWord {
    uint8_t mantissa;
    uint8_t exponent;
};

struct ChannelFilterWord {
    uint8_t mantissa;
    uint8_t exponent;
};

struct SynthesizerWord {
    uint32_t synt;        ///< 28-bit SYNT value
    uint8_t charge_pump;  ///< CP_ISEL
    bool pfd_split;       ///< PLL_PFD_SPLIT_EN
    bool band_select;     ///< BS, true for the middle band
};

struct IfOffsets {
    uint8_t analog;
    uint8_t digital;
};

struct RxTimerWord {
    uint8_t prescaler;
    uint8_t counter;
    bool overflow;  ///< Requested time was longer than the timer supports
};

/**
 * @brief Whether the internal clock divider is active for a crystal
 */
inline bool UsesClockDivider(uint32_t xtal_frequency) {
    return xtal_frequency >= kDigitalDomainThresholdHz;
}

/**
 * @brief Digital domain clock derived from the crystal
 */
inline uint32_t ComputeDigitalFrequency(uint32_t xtal_frequency) {
    return UsesClockDivider(xtal_frequency) ? xtal_frequency / 2
                                            : xtal_frequency;
}

IfOffsets ComputeIfOffsets(uint32_t xtal_frequency,
                           uint32_t digital_frequency);

/**
 * @brief Datarate represented by a mantissa and exponent
 */
uint32_t DecodeDatarate(uint16_t mantissa, uint8_t exponent,
                        uint32_t digital_frequency);

/**
 * @brief Find the register encoding of a datarate.
 *
 * The smallest exponent that can represent @p datarate is used and the
 * mantissa is rounded down, so the encoded datarate never exceeds the target.
 */
DatarateWord EncodeDatarate(uint32_t datarate, uint32_t digital_frequency);

uint32_t MaxDatarate(uint32_t digital_frequency);

uint32_t DecodeFrequencyDeviation(uint8_t mantissa, uint8_t exponent,
                                  uint32_t xtal_frequency);

/**
 * @brief Find the register encoding of a frequency deviation.
 *
 * The mantissa is found with a descending scan and the closer of the two
 * neighbouring candidates wins, the lower one on a tie.
 */
FrequencyDeviationWord EncodeFrequencyDeviation(uint32_t frequency_deviation,
                                                uint32_t xtal_frequency);

uint32_t MinFrequencyDeviation(uint32_t xtal_frequency);
uint32_t MaxFrequencyDeviation(uint32_t xtal_frequency);

/**
 * @brief Bandwidth of a channel filter table entry at a digital clock
 */
uint32_t ChannelFilterBandwidth(size_t index, uint32_t digital_frequency);

/**
 * @brief Index of the table entry closest to @p bandwidth, first one on a tie
 */
size_t FindChannelFilterIndex(uint32_t bandwidth, uint32_t digital_frequency);

ChannelFilterWord EncodeChannelFilter(uint32_t bandwidth,
                                      uint32_t digital_frequency);

uint32_t MinChannelFilterBandwidth(uint32_t digital_frequency);
uint32_t MaxChannelFilterBandwidth(uint32_t digital_frequency);

/**
 * @brief Band a carrier frequency belongs to
 *
 * @return false when the frequency is outside both bands
 */
bool GetFrequencyBand(uint32_t frequency, FrequencyBand& band);

inline uint8_t BandFactor(FrequencyBand band) {
    return band == FrequencyBand::kHigh ? 4 : 8;
}

/**
 * @brief Compute the synthesizer word and charge pump setting for a carrier
 *
 * @param frequency Carrier frequency
 * @param xtal_frequency Crystal frequency
 * @param band Band of @p frequency
 * @param reference_divider Whether the crystal is divided by 2 (REFDIV)
 */
SynthesizerWord ComputeSynthesizerWord(uint32_t frequency,
                                       uint32_t xtal_frequency,
                                       FrequencyBand band,
                                       bool reference_divider);

uint32_t DecodeCarrierFrequency(uint32_t synt, uint32_t xtal_frequency,
                                FrequencyBand band, bool reference_divider);

/**
 * @brief Find the RX timer prescaler and counter for a timeout.
 *
 * The resulting timeout is (prescaler + 1) * (counter - 1) * 1210 / fdig
 * seconds and is never shorter than requested unless overflow is set, in
 * which case both values saturate.
 */
RxTimerWord FindRxTimerPrescalerAndCounter(uint32_t timeout_us,
                                           uint32_t digital_frequency);

}  // namespace radio
}  // namespace s2lp
