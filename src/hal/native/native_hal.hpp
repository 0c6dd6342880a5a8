// src/hal/native/native_hal.hpp
#pragma once

#include "config/system_config.hpp"
#include "hardware/hal.hpp"

#ifdef S2LP_BUILD_NATIVE

#include <chrono>
#include <thread>

namespace s2lp {
namespace hal {

/**
 * @brief Delay source for hosted builds, backed by the steady clock.
 */
class NativeDelay : public IDelay {
   public:
    NativeDelay();

    void DelayUs(uint32_t us) override;
    void DelayMs(uint32_t ms) override;
    uint32_t millis() override;

   private:
    std::chrono::steady_clock::time_point start_;
};

}  // namespace hal
}  // namespace s2lp

#endif
