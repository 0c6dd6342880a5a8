// src/types/radio/gpio_function.hpp
#pragma once

#include <cstdint>

#include "hardware/s2lp/registers.hpp"

namespace s2lp {
namespace radio {

/**
 * @brief Function assigned to one of the chip GPIO pins
 */
struct GpioFunction {
    ll::GpioMode mode = ll::GpioMode::kHiZ;
    ll::GpioSelectInput input_select = ll::GpioSelectInput::kTxCommand;
    ll::GpioSelectOutput output_select = ll::GpioSelectOutput::kIrq;

    static GpioFunction HiZ() { return GpioFunction{}; }

    static GpioFunction Input(ll::GpioSelectInput select) {
        GpioFunction function;
        function.mode = ll::GpioMode::kInput;
        function.input_select = select;
        return function;
    }

    static GpioFunction Output(ll::GpioSelectOutput select,
                               bool high_power = false) {
        GpioFunction function;
        function.mode = high_power ? ll::GpioMode::kOutputHighPower
                                   : ll::GpioMode::kOutputLowPower;
        function.output_select = select;
        return function;
    }

    /**
     * @brief Value of the GPIOx_CONF register
     */
    uint8_t Encode() const {
        uint8_t select = 0;
        if (mode == ll::GpioMode::kInput) {
            select = static_cast<uint8_t>(input_select);
        } else if (mode != ll::GpioMode::kHiZ) {
            select = static_cast<uint8_t>(output_select);
        }
        return ll::field::kGpioSelect.Encode(select) |
               ll::field::kGpioMode.Encode(static_cast<uint8_t>(mode));
    }
};

}  // namespace radio
}  // namespace s2lp
