// test/test_native/native_hal_test.cpp
#include <gtest/gtest.h>

#include "hal/native/native_hal.hpp"

namespace s2lp {
namespace hal {
namespace test {

TEST(NativeDelayTest, MillisAdvancesWithDelay) {
    NativeDelay delay;
    const uint32_t start = delay.millis();

    delay.DelayMs(5);

    EXPECT_GE(delay.millis() - start, 5u);
}

TEST(NativeDelayTest, MicrosecondDelayReturns) {
    NativeDelay delay;
    delay.DelayUs(1);
    SUCCEED();
}

}  // namespace test
}  // namespace hal
}  // namespace s2lp
