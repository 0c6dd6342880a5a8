#include "rf_parameters.hpp"

namespace s2lp {
namespace radio {

namespace {

constexpr uint32_t kHighBandMin = 860000000;
constexpr uint32_t kHighBandMax = 940000000;
constexpr uint32_t kMiddleBandMin = 430000000;
constexpr uint32_t kMiddleBandMax = 470000000;

constexpr uint8_t kMaxExponent = 15;
constexpr uint16_t kMaxDatarateMantissa = 0xFFFF;
constexpr uint8_t kMaxFdevMantissa = 0xFF;

// Frequency deviation scaled by 2^23 / xtal
uint64_t FdevNumerator(uint8_t mantissa, uint8_t exponent) {
    if (exponent == 0) {
        return static_cast<uint64_t>(mantissa) * 2;
    }
    return (256ULL + mantissa) << exponent;
}

uint64_t AbsDiff(uint64_t a, uint64_t b) {
    return a > b ? a - b : b - a;
}

}  // namespace

const uint16_t kChannelFilterTable[kChannelFilterTableSize] = {
    8001, 7951, 7684, 7368, 7051, 6709, 6423, 5867, 5414,
    4509, 4259, 4032, 3808, 3621, 3417, 3254, 2945, 2703,
    2247, 2124, 2015, 1900, 1807, 1706, 1624, 1471, 1350,
    1123, 1062, 1005, 950,  903,  853,  812,  735,  675,
    561,  530,  502,  474,  451,  426,  406,  367,  337,
    280,  265,  251,  237,  226,  213,  203,  184,  169,
    140,  133,  126,  119,  113,  106,  101,  92,   84,
    70,   66,   63,   59,   56,   53,   51,   46,   42,
    35,   33,   31,   30,   28,   27,   25,   23,   21,
    17,   17,   16,   15,   14,   13,   13,   12,   11,
};

IfOffsets ComputeIfOffsets(uint32_t xtal_frequency,
                           uint32_t digital_frequency) {
    const uint64_t scaled = static_cast<uint64_t>(kIntermediateFrequencyHz) *
                            (1ULL << 13) * 3;
    IfOffsets offsets;
    offsets.analog = static_cast<uint8_t>(scaled / xtal_frequency - 100);
    offsets.digital = static_cast<uint8_t>(scaled / digital_frequency - 100);
    return offsets;
}

uint32_t DecodeDatarate(uint16_t mantissa, uint8_t exponent,
                        uint32_t digital_frequency) {
    const uint64_t fdig = digital_frequency;
    if (exponent == 0) {
        return static_cast<uint32_t>((fdig * mantissa) >> 32);
    }
    if (exponent < kMaxExponent) {
        return static_cast<uint32_t>(((fdig * (65536ULL + mantissa)) << exponent) >>
                                     33);
    }
    if (mantissa == 0) {
        return 0;
    }
    return static_cast<uint32_t>(fdig / (8ULL * mantissa));
}

DatarateWord EncodeDatarate(uint32_t datarate, uint32_t digital_frequency) {
    uint8_t exponent = 0;
    while (exponent < kMaxExponent &&
           DecodeDatarate(kMaxDatarateMantissa, exponent, digital_frequency) <
               datarate) {
        exponent++;
    }

    const uint64_t target = datarate;
    const uint64_t fdig = digital_frequency;
    DatarateWord word{0, exponent};

    if (exponent == 0) {
        word.mantissa = static_cast<uint16_t>((target << 32) / fdig);
    } else if (exponent < kMaxExponent) {
        uint64_t quotient = (target << (33 - exponent)) / fdig;
        if (quotient < 65536) {
            // Target sits between two exponents, take the top of the lower one
            word.exponent = exponent - 1;
            word.mantissa = kMaxDatarateMantissa;
        } else {
            word.mantissa = static_cast<uint16_t>(quotient - 65536);
        }
    } else {
        uint64_t divisor = 8ULL * target;
        uint64_t mantissa = (fdig + divisor - 1) / divisor;
        if (mantissa == 0) {
            mantissa = 1;
        }
        if (mantissa > kMaxDatarateMantissa) {
            mantissa = kMaxDatarateMantissa;
        }
        word.mantissa = static_cast<uint16_t>(mantissa);
    }

    return word;
}

uint32_t MaxDatarate(uint32_t digital_frequency) {
    // 500 kbps at a 26 MHz digital clock
    return digital_frequency / 52;
}

uint32_t DecodeFrequencyDeviation(uint8_t mantissa, uint8_t exponent,
                                  uint32_t xtal_frequency) {
    return static_cast<uint32_t>(
        (static_cast<uint64_t>(xtal_frequency) * FdevNumerator(mantissa, exponent)) >>
        23);
}

FrequencyDeviationWord EncodeFrequencyDeviation(uint32_t frequency_deviation,
                                                uint32_t xtal_frequency) {
    uint8_t exponent = 0;
    while (exponent < kMaxExponent &&
           DecodeFrequencyDeviation(kMaxFdevMantissa, exponent,
                                    xtal_frequency) < frequency_deviation) {
        exponent++;
    }

    const uint64_t xtal = xtal_frequency;
    const uint64_t target = static_cast<uint64_t>(frequency_deviation) << 23;

    int mantissa = kMaxFdevMantissa;
    while (mantissa > 0 &&
           xtal * FdevNumerator(static_cast<uint8_t>(mantissa), exponent) >
               target) {
        mantissa--;
    }

    if (mantissa < kMaxFdevMantissa) {
        uint64_t lower = xtal * FdevNumerator(static_cast<uint8_t>(mantissa),
                                              exponent);
        uint64_t upper = xtal * FdevNumerator(
                                    static_cast<uint8_t>(mantissa + 1), exponent);
        if (AbsDiff(upper, target) < AbsDiff(lower, target)) {
            mantissa++;
        }
    }

    if (mantissa == 0 && exponent > 0) {
        // The top of the previous exponent may be closer
        uint64_t current = xtal * FdevNumerator(0, exponent);
        uint64_t lower = xtal * FdevNumerator(kMaxFdevMantissa, exponent - 1);
        if (AbsDiff(lower, target) <= AbsDiff(current, target)) {
            return FrequencyDeviationWord{kMaxFdevMantissa,
                                          static_cast<uint8_t>(exponent - 1)};
        }
    }

    return FrequencyDeviationWord{static_cast<uint8_t>(mantissa), exponent};
}

uint32_t MinFrequencyDeviation(uint32_t xtal_frequency) {
    return xtal_frequency >> 22;
}

uint32_t MaxFrequencyDeviation(uint32_t xtal_frequency) {
    return static_cast<uint32_t>(787109ULL * xtal_frequency / 26000000ULL);
}

uint32_t ChannelFilterBandwidth(size_t index, uint32_t digital_frequency) {
    return static_cast<uint32_t>(static_cast<uint64_t>(kChannelFilterTable[index]) *
                                 digital_frequency / 260000ULL);
}

size_t FindChannelFilterIndex(uint32_t bandwidth, uint32_t digital_frequency) {
    size_t best_index = 0;
    uint64_t best_difference =
        AbsDiff(ChannelFilterBandwidth(0, digital_frequency), bandwidth);

    for (size_t i = 1; i < kChannelFilterTableSize; i++) {
        uint64_t difference =
            AbsDiff(ChannelFilterBandwidth(i, digital_frequency), bandwidth);
        if (difference < best_difference) {
            best_difference = difference;
            best_index = i;
        }
    }

    return best_index;
}

ChannelFilterWord EncodeChannelFilter(uint32_t bandwidth,
                                      uint32_t digital_frequency) {
    size_t index = FindChannelFilterIndex(bandwidth, digital_frequency);
    return ChannelFilterWord{static_cast<uint8_t>(index % 9),
                             static_cast<uint8_t>(index / 9)};
}

uint32_t MinChannelFilterBandwidth(uint32_t digital_frequency) {
    return ChannelFilterBandwidth(kChannelFilterTableSize - 1,
                                  digital_frequency);
}

uint32_t MaxChannelFilterBandwidth(uint32_t digital_frequency) {
    return ChannelFilterBandwidth(0, digital_frequency);
}

bool GetFrequencyBand(uint32_t frequency, FrequencyBand& band) {
    if (frequency >= kHighBandMin && frequency <= kHighBandMax) {
        band = FrequencyBand::kHigh;
        return true;
    }
    if (frequency >= kMiddleBandMin && frequency <= kMiddleBandMax) {
        band = FrequencyBand::kMiddle;
        return true;
    }
    return false;
}

SynthesizerWord ComputeSynthesizerWord(uint32_t frequency,
                                       uint32_t xtal_frequency,
                                       FrequencyBand band,
                                       bool reference_divider) {
    const uint64_t band_factor = BandFactor(band);
    const uint64_t divider = reference_divider ? 2 : 1;
    const uint64_t xtal = xtal_frequency;
    const uint64_t target =
        (static_cast<uint64_t>(frequency) << 19) * band_factor * divider;

    uint64_t synt = target / xtal;
    if (xtal * (synt + 1) - target < target - xtal * synt) {
        synt++;
    }

    SynthesizerWord word;
    word.synt = static_cast<uint32_t>(synt & 0x0FFFFFFF);
    word.band_select = band == FrequencyBand::kMiddle;

    const uint64_t vco_frequency = static_cast<uint64_t>(frequency) * band_factor;
    const uint64_t reference_frequency = xtal / divider;
    const bool high_reference = reference_frequency > kDigitalDomainThresholdHz;

    if (vco_frequency >= kVcoCenterFrequencyHz) {
        word.charge_pump = high_reference ? 2 : 1;
    } else {
        word.charge_pump = high_reference ? 3 : 2;
    }
    word.pfd_split = !high_reference;

    return word;
}

uint32_t DecodeCarrierFrequency(uint32_t synt, uint32_t xtal_frequency,
                                FrequencyBand band, bool reference_divider) {
    const uint64_t divider = reference_divider ? 2 : 1;
    const uint64_t numerator = static_cast<uint64_t>(synt) * xtal_frequency;
    return static_cast<uint32_t>(numerator /
                                 ((1ULL << 19) * BandFactor(band) * divider));
}

RxTimerWord FindRxTimerPrescalerAndCounter(uint32_t timeout_us,
                                           uint32_t digital_frequency) {
    constexpr uint64_t kScale = 1000000;
    constexpr uint64_t kMaxCounter = 255;

    const uint64_t scaled_time =
        static_cast<uint64_t>(timeout_us) * digital_frequency / 1210;

    uint64_t prescaler =
        (scaled_time + kMaxCounter * kScale - 1) / (kMaxCounter * kScale);
    prescaler = prescaler > 1 ? prescaler - 1 : 0;
    if (prescaler < 1) {
        prescaler = 1;
    }

    auto counter_for = [scaled_time](uint64_t presc) {
        uint64_t divisor = (presc + 1) * kScale;
        return (scaled_time + divisor - 1) / divisor + 1;
    };

    uint64_t counter = counter_for(prescaler);
    while (counter > kMaxCounter && prescaler <= kMaxCounter) {
        prescaler++;
        counter = counter_for(prescaler);
    }

    RxTimerWord word;
    word.overflow = prescaler > kMaxCounter || counter > kMaxCounter;
    word.prescaler = static_cast<uint8_t>(prescaler > kMaxCounter ? kMaxCounter
                                                                  : prescaler);
    word.counter =
        static_cast<uint8_t>(counter > kMaxCounter ? kMaxCounter : counter);
    return word;
}

}  // namespace radio
}  // namespace s2lp
