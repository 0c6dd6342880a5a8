// test/types/test_configurations/radio_configuration_test.cpp
#include <gtest/gtest.h>

#include "types/configurations/radio_configuration.hpp"

namespace s2lp {
namespace test {

class RadioConfigTest : public ::testing::Test {
   protected:
    void SetUp() override { defaultConfig = RadioConfig::CreateDefault(); }

    RadioConfig defaultConfig;
};

TEST_F(RadioConfigTest, DefaultConfigIsValid) {
    EXPECT_TRUE(defaultConfig.IsValid());
    EXPECT_TRUE(defaultConfig.Check());
    EXPECT_EQ(defaultConfig.getXtalFrequency(), 50000000u);
    EXPECT_EQ(defaultConfig.getBaseFrequency(), 868000000u);
    EXPECT_EQ(defaultConfig.getModulation(), ll::ModulationType::k2Gfsk1);
    EXPECT_EQ(defaultConfig.getDatarate(), 38400u);
    EXPECT_EQ(defaultConfig.getFrequencyDeviation(), 20000u);
    EXPECT_EQ(defaultConfig.getBandwidth(), 100000u);
    EXPECT_FALSE(defaultConfig.getReferenceDivider());
}

TEST_F(RadioConfigTest, DigitalFrequency) {
    EXPECT_EQ(defaultConfig.getDigitalFrequency(), 25000000u);

    defaultConfig.setXtalFrequency(26000000);
    EXPECT_EQ(defaultConfig.getDigitalFrequency(), 26000000u);
}

TEST_F(RadioConfigTest, CrystalValidation) {
    const uint32_t valid[] = {24000000, 26000000, 48000000, 52000000};
    for (uint32_t xtal : valid) {
        defaultConfig.setXtalFrequency(xtal);
        EXPECT_TRUE(defaultConfig.IsValid()) << xtal;
    }

    const uint32_t invalid[] = {0, 23999999, 30000000, 47999999, 52000001};
    for (uint32_t xtal : invalid) {
        defaultConfig.setXtalFrequency(xtal);
        EXPECT_NE(defaultConfig.Validate().find("Crystal"), std::string::npos)
            << xtal;
    }
}

TEST_F(RadioConfigTest, InvalidCrystalSkipsDerivedChecks) {
    defaultConfig.setXtalFrequency(10000000);
    defaultConfig.setBaseFrequency(100000000);

    const std::string errors = defaultConfig.Validate();
    EXPECT_NE(errors.find("Crystal"), std::string::npos);
    EXPECT_EQ(errors.find("Base frequency"), std::string::npos);
}

TEST_F(RadioConfigTest, BaseFrequencyValidation) {
    const uint32_t valid[] = {430000000, 433920000, 470000000, 860000000,
                              915000000, 940000000};
    for (uint32_t frequency : valid) {
        defaultConfig.setBaseFrequency(frequency);
        EXPECT_TRUE(defaultConfig.IsValid()) << frequency;
    }

    const uint32_t invalid[] = {169000000, 429999999, 470000001, 800000000,
                                940000001};
    for (uint32_t frequency : invalid) {
        defaultConfig.setBaseFrequency(frequency);
        EXPECT_NE(defaultConfig.Validate().find("Base frequency"),
                  std::string::npos)
            << frequency;
    }
}

TEST_F(RadioConfigTest, DatarateValidation) {
    defaultConfig.setDatarate(99);
    EXPECT_NE(defaultConfig.Validate().find("Datarate"), std::string::npos);

    defaultConfig.setDatarate(100);
    EXPECT_TRUE(defaultConfig.IsValid());

    // fdig / 52 at a 25 MHz digital clock
    defaultConfig.setDatarate(480769);
    EXPECT_TRUE(defaultConfig.IsValid());
    defaultConfig.setDatarate(480770);
    EXPECT_FALSE(defaultConfig.IsValid());

    defaultConfig.setXtalFrequency(26000000);
    defaultConfig.setDatarate(500000);
    EXPECT_TRUE(defaultConfig.IsValid());
}

TEST_F(RadioConfigTest, FrequencyDeviationValidation) {
    defaultConfig.setFrequencyDeviation(10);
    EXPECT_NE(defaultConfig.Validate().find("Frequency deviation"),
              std::string::npos);

    defaultConfig.setFrequencyDeviation(2000000);
    EXPECT_NE(defaultConfig.Validate().find("Frequency deviation"),
              std::string::npos);

    defaultConfig.setFrequencyDeviation(150000);
    EXPECT_TRUE(defaultConfig.IsValid());
}

TEST_F(RadioConfigTest, BandwidthValidation) {
    defaultConfig.setBandwidth(500);
    EXPECT_NE(defaultConfig.Validate().find("Bandwidth"), std::string::npos);

    defaultConfig.setBandwidth(900000);
    EXPECT_NE(defaultConfig.Validate().find("Bandwidth"), std::string::npos);

    defaultConfig.setBandwidth(12500);
    EXPECT_TRUE(defaultConfig.IsValid());
}

TEST_F(RadioConfigTest, CheckReportsEveryProblem) {
    RadioConfig config(50000000, 800000000, ll::ModulationType::k2Fsk, 1,
                       20000, 100);

    Result result = config.Check();
    EXPECT_EQ(result.getErrorCode(), S2lpErrorCode::kBadConfig);
    const std::string message = result.GetErrorMessage();
    EXPECT_NE(message.find("Base frequency"), std::string::npos);
    EXPECT_NE(message.find("Datarate"), std::string::npos);
    EXPECT_NE(message.find("Bandwidth"), std::string::npos);
    EXPECT_EQ(message.find("Frequency deviation"), std::string::npos);
}

}  // namespace test
}  // namespace s2lp
