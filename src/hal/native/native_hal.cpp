#include "native_hal.hpp"

#ifdef S2LP_BUILD_NATIVE

namespace s2lp {
namespace hal {

NativeDelay::NativeDelay() : start_(std::chrono::steady_clock::now()) {}

void NativeDelay::DelayUs(uint32_t us) {
    std::this_thread::sleep_for(std::chrono::microseconds(us));
}

void NativeDelay::DelayMs(uint32_t ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

uint32_t NativeDelay::millis() {
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_);
    return static_cast<uint32_t>(duration.count());
}

}  // namespace hal
}  // namespace s2lp

#endif
