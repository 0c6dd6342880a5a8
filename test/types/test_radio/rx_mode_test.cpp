// test/types/test_radio/rx_mode_test.cpp
#include <gtest/gtest.h>

#include <memory>

#include "hardware/s2lp/spi_register_interface.hpp"
#include "radio/rf_parameters.hpp"
#include "types/radio/rx_mode.hpp"

#include "../../utils/fake_s2lp_spi.hpp"

namespace s2lp {
namespace radio {
namespace test {

using s2lp::test::FakeS2lpSpi;

namespace {

constexpr uint32_t kDigitalFrequency = 25000000;

}  // namespace

class RxModeTest : public ::testing::Test {
   protected:
    void SetUp() override {
        auto spi = std::make_unique<FakeS2lpSpi>();
        chip_ = spi.get();
        interface_ = std::make_unique<ll::SpiRegisterInterface>(std::move(spi));
        device_.setInterface(interface_.get());
    }

    uint8_t Protocol2TimeoutBits() const {
        return chip_->getRegister(ll::reg::kProtocol2) &
               (ll::field::kCsTimeoutMask.mask | ll::field::kSqiTimeoutMask.mask |
                ll::field::kPqiTimeoutMask.mask);
    }

    FakeS2lpSpi* chip_ = nullptr;
    std::unique_ptr<ll::SpiRegisterInterface> interface_;
    ll::Device device_;
};

TEST_F(RxModeTest, NormalWithoutTimeoutDisablesTimer) {
    chip_->SetRegister(ll::reg::kTimers5, 0x55);

    ASSERT_TRUE(RxMode::Normal().WriteToDevice(device_, kDigitalFrequency));

    EXPECT_EQ(chip_->getRegister(ll::reg::kTimers5), 0);
    EXPECT_EQ(Protocol2TimeoutBits(), 0);
    EXPECT_FALSE(chip_->getRegister(ll::reg::kPcktFltOptions) &
                 ll::field::kRxTimeoutAndOrSel.mask);
}

TEST_F(RxModeTest, TimeoutProgramsTimer) {
    RxTimeout timeout;
    timeout.timeout_us = 50000;
    ASSERT_TRUE(RxMode::Normal(timeout).WriteToDevice(device_, kDigitalFrequency));

    const RxTimerWord word =
        FindRxTimerPrescalerAndCounter(50000, kDigitalFrequency);
    EXPECT_EQ(chip_->getRegister(ll::reg::kTimers5), word.counter);
    EXPECT_EQ(chip_->getRegister(ll::reg::kTimers4), word.prescaler);
    // Default stop condition is SQI
    EXPECT_EQ(Protocol2TimeoutBits(), ll::field::kSqiTimeoutMask.mask);
}

TEST_F(RxModeTest, StopConditionMapping) {
    struct Case {
        RxTimeoutMask mask;
        bool or_select;
        uint8_t protocol2;
    };
    const Case cases[] = {
        {RxTimeoutMask::kNone, true, 0},
        {RxTimeoutMask::kRssi, false, ll::field::kCsTimeoutMask.mask},
        {RxTimeoutMask::kPqi, false, ll::field::kPqiTimeoutMask.mask},
        {RxTimeoutMask::kAll, false,
         static_cast<uint8_t>(ll::field::kCsTimeoutMask.mask |
                              ll::field::kSqiTimeoutMask.mask |
                              ll::field::kPqiTimeoutMask.mask)},
        {RxTimeoutMask::kSqiOrPqi, true,
         static_cast<uint8_t>(ll::field::kSqiTimeoutMask.mask |
                              ll::field::kPqiTimeoutMask.mask)},
    };

    for (const Case& c : cases) {
        RxTimeout timeout{1000, c.mask};
        ASSERT_TRUE(timeout.WriteToDevice(device_, kDigitalFrequency));

        EXPECT_EQ(Protocol2TimeoutBits(), c.protocol2)
            << static_cast<int>(c.mask);
        EXPECT_EQ((chip_->getRegister(ll::reg::kPcktFltOptions) &
                   ll::field::kRxTimeoutAndOrSel.mask) != 0,
                  c.or_select)
            << static_cast<int>(c.mask);
    }
}

TEST_F(RxModeTest, Protocol2KeepsOtherBits) {
    chip_->SetRegister(ll::reg::kProtocol2, 0x1F);

    ASSERT_TRUE(RxMode::Normal().WriteToDevice(device_, kDigitalFrequency));

    EXPECT_EQ(chip_->getRegister(ll::reg::kProtocol2), 0x1F);
}

TEST_F(RxModeTest, OverlongTimeoutSaturates) {
    RxTimeout timeout{10000000, RxTimeoutMask::kNone};
    ASSERT_TRUE(timeout.WriteToDevice(device_, kDigitalFrequency));

    EXPECT_EQ(chip_->getRegister(ll::reg::kTimers5), 255);
    EXPECT_EQ(chip_->getRegister(ll::reg::kTimers4), 255);
}

TEST_F(RxModeTest, BusErrorPropagates) {
    chip_->setFailBus(true);

    EXPECT_EQ(RxMode::Normal().WriteToDevice(device_, kDigitalFrequency)
                  .getErrorCode(),
              S2lpErrorCode::kBusError);
}

}  // namespace test
}  // namespace radio
}  // namespace s2lp
