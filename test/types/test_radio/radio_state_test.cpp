// test/types/test_radio/radio_state_test.cpp
#include <gtest/gtest.h>

#include "types/radio/radio_state.hpp"

namespace s2lp {
namespace radio {
namespace test {

TEST(RadioStateTest, Addressability) {
    EXPECT_FALSE(IsAddressable(RadioState::kShutdown));
    EXPECT_TRUE(IsAddressable(RadioState::kReady));
    EXPECT_TRUE(IsAddressable(RadioState::kStandby));
    EXPECT_TRUE(IsAddressable(RadioState::kTx));
    EXPECT_TRUE(IsAddressable(RadioState::kRx));
}

TEST(RadioStateTest, Names) {
    EXPECT_STREQ(RadioStateToString(RadioState::kShutdown), "Shutdown");
    EXPECT_STREQ(RadioStateToString(RadioState::kReady), "Ready");
    EXPECT_STREQ(RadioStateToString(RadioState::kStandby), "Standby");
    EXPECT_STREQ(RadioStateToString(RadioState::kTx), "Tx");
    EXPECT_STREQ(RadioStateToString(RadioState::kRx), "Rx");
}

}  // namespace test
}  // namespace radio
}  // namespace s2lp
