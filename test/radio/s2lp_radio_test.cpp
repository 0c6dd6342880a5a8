/**
 * @file s2lp_radio_test.cpp
 * @brief Test suite for the S2lpRadio state machine
 *
 * Drives the radio against a register file model of the chip and checks the
 * state transitions, the register programming and the TX and RX interrupt
 * protocols.
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstring>
#include <memory>
#include <vector>

#include "radio/rf_parameters.hpp"
#include "radio/s2lp_radio.hpp"
#include "types/packet_formats/basic_format.hpp"
#include "types/packet_formats/ieee802154g_format.hpp"

#include "../mocks/mock_hal.hpp"
#include "../utils/fake_s2lp_spi.hpp"

using ::testing::_;
using ::testing::InSequence;
using ::testing::NiceMock;
using ::testing::Return;

namespace s2lp {
namespace radio {
namespace test {

using hal::test::MockDelay;
using hal::test::MockOutputPin;
using s2lp::test::FakeIrqPin;
using s2lp::test::FakeS2lpSpi;

namespace {

const uint8_t kHello[] = {'H', 'e', 'l', 'l', 'o'};

bool ContainsCommand(const std::vector<ll::Command>& commands,
                     ll::Command command) {
    for (ll::Command c : commands) {
        if (c == command) {
            return true;
        }
    }
    return false;
}

// Index of the first transaction at or after @p from with this header
size_t FindTransaction(const std::vector<FakeS2lpSpi::Transaction>& transactions,
                       size_t from, uint8_t header0, uint8_t address) {
    for (size_t i = from; i < transactions.size(); i++) {
        if (transactions[i].header0 == header0 &&
            transactions[i].address == address) {
            return i;
        }
    }
    return transactions.size();
}

}  // namespace

class S2lpRadioTest : public ::testing::Test {
   protected:
    void SetUp() override { CreateRadio(ll::GpioNumber::kGpio0); }

    void TearDown() override { radio_.reset(); }

    void CreateRadio(ll::GpioNumber gpio_number) {
        auto spi = std::make_unique<FakeS2lpSpi>();
        chip_ = spi.get();
        auto irq = std::make_unique<FakeIrqPin>(chip_);
        irq_ = irq.get();
        auto sdn = std::make_unique<NiceMock<MockOutputPin>>();
        sdn_ = sdn.get();
        auto delay = std::make_unique<NiceMock<MockDelay>>();
        delay_ = delay.get();

        radio_ = std::make_unique<S2lpRadio>(
            std::unique_ptr<hal::ISpiDevice>(std::move(spi)), std::move(sdn),
            std::move(irq), gpio_number, std::move(delay));
    }

    void InitRadio() { ASSERT_TRUE(radio_->Init(RadioConfig::CreateDefault())); }

    BasicConfig MakeBasicConfig() {
        BasicConfig config;
        config.preamble_length = 128;
        config.sync_pattern = 0x12345678;
        config.crc_mode = ll::CrcMode::kNoCrc;
        config.include_address = false;
        return config;
    }

    void InitWithBasic(const BasicConfig& config) {
        InitRadio();
        ASSERT_TRUE(radio_->SetFormat<BasicFormat>(config));
    }

    FakeS2lpSpi* chip_ = nullptr;
    FakeIrqPin* irq_ = nullptr;
    NiceMock<MockOutputPin>* sdn_ = nullptr;
    NiceMock<MockDelay>* delay_ = nullptr;
    std::unique_ptr<S2lpRadio> radio_;
};

// -------------------- Init --------------------

TEST_F(S2lpRadioTest, StartsInShutdown) {
    EXPECT_EQ(radio_->getState(), RadioState::kShutdown);
    EXPECT_EQ(radio_->getFormatType(), PacketFormatType::kUninitialized);
    EXPECT_FALSE(radio_->IsLlAvailable());
}

TEST_F(S2lpRadioTest, InitReachesReadyWithoutFormat) {
    {
        InSequence seq;
        EXPECT_CALL(*sdn_, SetHigh()).WillOnce(Return(Result::Success()));
        EXPECT_CALL(*sdn_, SetLow()).WillOnce(Return(Result::Success()));
    }

    Result result = radio_->Init(RadioConfig::CreateDefault());

    ASSERT_TRUE(result) << result.GetErrorMessage();
    EXPECT_EQ(radio_->getState(), RadioState::kReady);
    EXPECT_EQ(radio_->getFormatType(), PacketFormatType::kUninitialized);
    EXPECT_EQ(radio_->getDigitalFrequency(), 25000000u);
    EXPECT_EQ(irq_->getHighWaits(), 1u);
    EXPECT_EQ(chip_->getRegister(ll::reg::kGpio0Conf),
              GpioFunction::Output(ll::GpioSelectOutput::kIrq).Encode());
    EXPECT_TRUE(chip_->getRegister(ll::reg::kPmConf0) &
                ll::field::kSleepModeSel.mask);
    EXPECT_TRUE(radio_->IsLlAvailable());
}

TEST_F(S2lpRadioTest, InitRejectsOutOfBandFrequencyWithoutIo) {
    EXPECT_CALL(*sdn_, SetHigh()).Times(0);
    EXPECT_CALL(*sdn_, SetLow()).Times(0);

    RadioConfig config = RadioConfig::CreateDefault();
    config.setBaseFrequency(800000000);
    Result result = radio_->Init(config);

    EXPECT_EQ(result.getErrorCode(), S2lpErrorCode::kBadConfig);
    EXPECT_NE(result.GetErrorMessage().find("frequency"), std::string::npos);
    EXPECT_EQ(chip_->getTransactionCount(), 0u);
    EXPECT_EQ(irq_->getHighWaits(), 0u);
    EXPECT_EQ(radio_->getState(), RadioState::kShutdown);
}

TEST_F(S2lpRadioTest, InitFailsOnChipVersionMismatch) {
    chip_->SetRegister(ll::reg::kDeviceInfo0, 0x00);

    Result result = radio_->Init(RadioConfig::CreateDefault());

    EXPECT_EQ(result.getErrorCode(), S2lpErrorCode::kInitError);
    EXPECT_EQ(radio_->getState(), RadioState::kShutdown);
    EXPECT_FALSE(radio_->IsLlAvailable());

    uint8_t value = 0;
    EXPECT_EQ(radio_->Ll().ReadRegister(ll::reg::kDeviceInfo0, value).getErrorCode(),
              S2lpErrorCode::kInvalidState);
}

TEST_F(S2lpRadioTest, InitPropagatesShutdownPinError) {
    EXPECT_CALL(*sdn_, SetHigh())
        .WillOnce(Return(Result::Error(S2lpErrorCode::kShutdownPinError)));

    Result result = radio_->Init(RadioConfig::CreateDefault());

    EXPECT_EQ(result.getErrorCode(), S2lpErrorCode::kShutdownPinError);
    EXPECT_EQ(chip_->getTransactionCount(), 0u);
}

TEST_F(S2lpRadioTest, InitPropagatesBusError) {
    chip_->setFailBus(true);

    Result result = radio_->Init(RadioConfig::CreateDefault());

    EXPECT_EQ(result.getErrorCode(), S2lpErrorCode::kBusError);
    EXPECT_EQ(radio_->getState(), RadioState::kShutdown);
}

TEST_F(S2lpRadioTest, InitOnOtherGpioUsesBootDelay) {
    CreateRadio(ll::GpioNumber::kGpio2);
    EXPECT_CALL(*delay_, DelayMs(S2LP_BOOT_DELAY_MS)).Times(1);

    ASSERT_TRUE(radio_->Init(RadioConfig::CreateDefault()));

    EXPECT_EQ(irq_->getHighWaits(), 0u);
    EXPECT_EQ(chip_->getRegister(ll::reg::kGpio2Conf),
              GpioFunction::Output(ll::GpioSelectOutput::kIrq).Encode());
    EXPECT_FALSE(chip_->WasWritten(ll::reg::kGpio0Conf));
}

TEST_F(S2lpRadioTest, InitDisablesClockDividerForLowCrystal) {
    RadioConfig config = RadioConfig::CreateDefault();
    config.setXtalFrequency(26000000);

    Result result = radio_->Init(config);

    ASSERT_TRUE(result) << result.GetErrorMessage();
    EXPECT_EQ(radio_->getDigitalFrequency(), 26000000u);
    EXPECT_TRUE(chip_->getRegister(ll::reg::kXoRcoConf1) &
                ll::field::kPdClkDiv.mask);

    const auto& commands = chip_->getCommands();
    ASSERT_GE(commands.size(), 2u);
    EXPECT_EQ(commands[0], ll::Command::kStandby);
    EXPECT_EQ(commands[1], ll::Command::kReady);
}

TEST_F(S2lpRadioTest, InitKeepsClockDividerForHighCrystal) {
    InitRadio();

    EXPECT_FALSE(chip_->getRegister(ll::reg::kXoRcoConf1) &
                 ll::field::kPdClkDiv.mask);
    EXPECT_FALSE(ContainsCommand(chip_->getCommands(), ll::Command::kStandby));
}

TEST_F(S2lpRadioTest, InitTimesOutWhenChipIgnoresStandby) {
    chip_->setIgnoreStateCommands(true);
    RadioConfig config = RadioConfig::CreateDefault();
    config.setXtalFrequency(26000000);

    Result result = radio_->Init(config);

    EXPECT_EQ(result.getErrorCode(), S2lpErrorCode::kTimeout);
    EXPECT_EQ(radio_->getState(), RadioState::kShutdown);
}

TEST_F(S2lpRadioTest, InitReportsRcoLockError) {
    chip_->SetRegister(ll::reg::kMcState1, ll::field::kErrorLock.mask);

    Result result = radio_->Init(RadioConfig::CreateDefault());

    EXPECT_EQ(result.getErrorCode(), S2lpErrorCode::kRcoLockError);
    EXPECT_EQ(radio_->getState(), RadioState::kShutdown);
}

TEST_F(S2lpRadioTest, InitProgramsRfRegisters) {
    const RadioConfig config = RadioConfig::CreateDefault();
    InitRadio();

    const uint32_t fdig = config.getDigitalFrequency();
    const uint8_t mod2 = chip_->getRegister(ll::reg::kMod2);
    EXPECT_EQ(ll::field::kModType.Decode(mod2),
              static_cast<uint8_t>(ll::ModulationType::k2Gfsk1));

    const uint16_t mantissa = static_cast<uint16_t>(
        (chip_->getRegister(ll::reg::kMod4) << 8) |
        chip_->getRegister(ll::reg::kMod3));
    const uint32_t datarate = DecodeDatarate(
        mantissa, ll::field::kDatarateExponent.Decode(mod2), fdig);
    EXPECT_LE(datarate, config.getDatarate());
    EXPECT_GE(datarate, config.getDatarate() * 0.9999);

    const uint32_t synt3 = chip_->getRegisterUint32(ll::reg::kSynt3);
    const uint32_t carrier = DecodeCarrierFrequency(
        synt3 & 0x0FFFFFFF, config.getXtalFrequency(), FrequencyBand::kHigh,
        false);
    EXPECT_NEAR(static_cast<double>(carrier), 868000000.0, 100.0);
    EXPECT_FALSE(synt3 & (1UL << 28));

    const ChannelFilterWord filter =
        EncodeChannelFilter(config.getBandwidth(), fdig);
    EXPECT_EQ(chip_->getRegister(ll::reg::kChFlt),
              static_cast<uint8_t>((filter.mantissa << 4) | filter.exponent));
}

TEST_F(S2lpRadioTest, InitOnlyFromShutdown) {
    InitRadio();
    const size_t transactions = chip_->getTransactionCount();

    EXPECT_EQ(radio_->Init(RadioConfig::CreateDefault()).getErrorCode(),
              S2lpErrorCode::kInvalidState);
    EXPECT_EQ(chip_->getTransactionCount(), transactions);
}

// -------------------- State legality --------------------

TEST_F(S2lpRadioTest, OperationsRejectedInShutdown) {
    uint8_t buffer[16];
    TxResult tx_result;
    RxResult rx_result;

    EXPECT_EQ(radio_->SendPacket(TxMetaData{}, kHello, sizeof(kHello)).getErrorCode(),
              S2lpErrorCode::kInvalidState);
    EXPECT_EQ(radio_->StartReceive(buffer, sizeof(buffer)).getErrorCode(),
              S2lpErrorCode::kInvalidState);
    EXPECT_EQ(radio_->SetFormat<BasicFormat>(MakeBasicConfig()).getErrorCode(),
              S2lpErrorCode::kInvalidState);
    EXPECT_EQ(radio_->Standby().getErrorCode(), S2lpErrorCode::kInvalidState);
    EXPECT_EQ(radio_->WakeUp().getErrorCode(), S2lpErrorCode::kInvalidState);
    EXPECT_EQ(radio_->Shutdown().getErrorCode(), S2lpErrorCode::kInvalidState);
    EXPECT_EQ(radio_->Wait(tx_result).getErrorCode(), S2lpErrorCode::kInvalidState);
    EXPECT_EQ(radio_->Wait(rx_result).getErrorCode(), S2lpErrorCode::kInvalidState);
    EXPECT_EQ(radio_->Finish().getErrorCode(), S2lpErrorCode::kInvalidState);
    EXPECT_EQ(radio_->Abort().getErrorCode(), S2lpErrorCode::kInvalidState);
    EXPECT_EQ(radio_->SetCsmaCa(CsmaCaMode::Off()).getErrorCode(),
              S2lpErrorCode::kInvalidState);
    EXPECT_EQ(radio_->SetGpioFunction(ll::GpioNumber::kGpio1, GpioFunction::HiZ())
                  .getErrorCode(),
              S2lpErrorCode::kInvalidState);
    EXPECT_EQ(radio_->WaitForIrq().getErrorCode(), S2lpErrorCode::kInvalidState);

    EXPECT_EQ(chip_->getTransactionCount(), 0u);
    EXPECT_EQ(radio_->getState(), RadioState::kShutdown);
}

TEST_F(S2lpRadioTest, SendAndReceiveNeedFormat) {
    InitRadio();
    uint8_t buffer[16];

    EXPECT_EQ(radio_->SendPacket(TxMetaData{}, kHello, sizeof(kHello)).getErrorCode(),
              S2lpErrorCode::kInvalidState);
    EXPECT_EQ(radio_->StartReceive(buffer, sizeof(buffer)).getErrorCode(),
              S2lpErrorCode::kInvalidState);
    EXPECT_EQ(radio_->getState(), RadioState::kReady);
}

TEST_F(S2lpRadioTest, FormatCanOnlyBeSetOnce) {
    InitWithBasic(MakeBasicConfig());

    EXPECT_EQ(radio_->getFormatType(), PacketFormatType::kBasic);
    EXPECT_EQ(radio_->SetFormat<Ieee802154gFormat>(Ieee802154gConfig{})
                  .getErrorCode(),
              S2lpErrorCode::kInvalidState);
    EXPECT_EQ(radio_->getFormatType(), PacketFormatType::kBasic);
}

TEST_F(S2lpRadioTest, SendPacketRejectedDuringRx) {
    InitWithBasic(MakeBasicConfig());
    uint8_t buffer[16];
    ASSERT_TRUE(radio_->StartReceive(buffer, sizeof(buffer)));
    const size_t transactions = chip_->getTransactionCount();

    EXPECT_EQ(radio_->SendPacket(TxMetaData{}, kHello, sizeof(kHello)).getErrorCode(),
              S2lpErrorCode::kInvalidState);
    EXPECT_EQ(radio_->Standby().getErrorCode(), S2lpErrorCode::kInvalidState);
    EXPECT_EQ(chip_->getTransactionCount(), transactions);
    EXPECT_EQ(radio_->getState(), RadioState::kRx);
}

TEST_F(S2lpRadioTest, SetFormatProgramsCommonRegisters) {
    InitWithBasic(MakeBasicConfig());

    EXPECT_EQ(chip_->getRegister(ll::reg::kFifoConfig0), 0x30);
    EXPECT_EQ(chip_->getRegister(ll::reg::kFifoConfig3), 0x30);
    EXPECT_EQ(chip_->getRegister(ll::reg::kRssiTh), 65);
    EXPECT_EQ(ll::field::kRssiFlt.Decode(chip_->getRegister(ll::reg::kRssiFlt)),
              14);
    EXPECT_TRUE(chip_->getRegister(ll::reg::kPmConf1) &
                ll::field::kSmpsLvlMode.mask);

    // Format bits survive the common setup
    const uint8_t pckt_ctrl1 = chip_->getRegister(ll::reg::kPcktCtrl1);
    EXPECT_TRUE(pckt_ctrl1 & ll::field::kWhitEn.mask);
    EXPECT_EQ(ll::field::kFecEn.Decode(pckt_ctrl1), 0);
}

// -------------------- TX --------------------

TEST_F(S2lpRadioTest, SuccessfulBasicTransmission) {
    InitWithBasic(MakeBasicConfig());

    ASSERT_TRUE(radio_->SendPacket(TxMetaData{}, kHello, sizeof(kHello)));
    EXPECT_EQ(radio_->getState(), RadioState::kTx);
    EXPECT_EQ(chip_->getSentBytes(),
              std::vector<uint8_t>(kHello, kHello + sizeof(kHello)));
    EXPECT_EQ(chip_->getRegister(ll::reg::kPcktLen0), sizeof(kHello));
    EXPECT_EQ(chip_->getRegisterUint32(ll::reg::kIrqMask3),
              ll::irq::kTxFifoAlmostEmpty | ll::irq::kTxDataSent |
                  ll::irq::kMaxReTxReach | ll::irq::kTxFifoError |
                  ll::irq::kMaxBoCcaReach);
    EXPECT_FALSE(chip_->getRegister(ll::reg::kAntSelectConf) &
                 ll::field::kCsBlanking.mask);
    EXPECT_EQ(chip_->getCommands().back(), ll::Command::kTx);

    chip_->QueueIrq(ll::irq::kTxFifoAlmostEmpty);
    chip_->QueueIrq(ll::irq::kTxDataSent);

    TxResult tx_result = TxResult::kTxAlreadyDone;
    ASSERT_TRUE(radio_->Wait(tx_result));
    EXPECT_EQ(tx_result, TxResult::kOk);

    ASSERT_TRUE(radio_->Finish());
    EXPECT_EQ(radio_->getState(), RadioState::kReady);
    EXPECT_EQ(radio_->getFormatType(), PacketFormatType::kBasic);
}

TEST_F(S2lpRadioTest, LargePayloadIsRefilledFromFifoIrqs) {
    BasicConfig config = MakeBasicConfig();
    config.packet_length_encoding = ll::LenWid::kBytes2;
    InitWithBasic(config);

    std::vector<uint8_t> payload(300);
    for (size_t i = 0; i < payload.size(); i++) {
        payload[i] = static_cast<uint8_t>(i);
    }

    ASSERT_TRUE(radio_->SendPacket(TxMetaData{}, payload.data(), payload.size()));
    EXPECT_EQ(chip_->getSentBytes().size(), ll::kFifoSize);

    chip_->QueueIrq(ll::irq::kTxFifoAlmostEmpty);
    chip_->QueueIrq(ll::irq::kTxFifoAlmostEmpty);
    chip_->QueueIrq(ll::irq::kTxDataSent);

    TxResult tx_result;
    ASSERT_TRUE(radio_->Wait(tx_result));
    EXPECT_EQ(tx_result, TxResult::kOk);
    EXPECT_EQ(chip_->getSentBytes(), payload);
    EXPECT_EQ(chip_->getRegister(ll::reg::kPcktLen1), 0x01);
    EXPECT_EQ(chip_->getRegister(ll::reg::kPcktLen0), 0x2C);
}

TEST_F(S2lpRadioTest, OversizedPayloadRejectedBeforeAnyWrite) {
    InitWithBasic(MakeBasicConfig());
    const size_t writes = chip_->getRegisterWrites().size();
    const size_t commands = chip_->getCommands().size();

    std::vector<uint8_t> payload(300, 0);
    Result result =
        radio_->SendPacket(TxMetaData{}, payload.data(), payload.size());

    EXPECT_EQ(result.getErrorCode(), S2lpErrorCode::kBufferTooLarge);
    EXPECT_EQ(chip_->getRegisterWrites().size(), writes);
    EXPECT_EQ(chip_->getCommands().size(), commands);
    EXPECT_TRUE(chip_->getSentBytes().empty());
    EXPECT_EQ(radio_->getState(), RadioState::kReady);
}

TEST_F(S2lpRadioTest, MaximumPayloadForOneByteLengthIsAccepted) {
    InitWithBasic(MakeBasicConfig());
    std::vector<uint8_t> payload(255, 0xAA);

    EXPECT_TRUE(radio_->SendPacket(TxMetaData{}, payload.data(), payload.size()));
}

TEST_F(S2lpRadioTest, AddressedFormatRequiresDestination) {
    BasicConfig config = MakeBasicConfig();
    config.include_address = true;
    InitWithBasic(config);

    Result result = radio_->SendPacket(TxMetaData{}, kHello, sizeof(kHello));
    EXPECT_EQ(result.getErrorCode(), S2lpErrorCode::kBadConfig);
    EXPECT_EQ(radio_->getState(), RadioState::kReady);

    TxMetaData meta;
    meta.destination_address = 0x42;
    ASSERT_TRUE(radio_->SendPacket(meta, kHello, sizeof(kHello)));
    EXPECT_EQ(chip_->getRegister(ll::reg::kPcktFltGoals3), 0x42);
    EXPECT_EQ(chip_->getRegister(ll::reg::kPcktLen0), sizeof(kHello) + 1);
}

TEST_F(S2lpRadioTest, UnaddressedFormatRejectsDestination) {
    InitWithBasic(MakeBasicConfig());
    TxMetaData meta;
    meta.destination_address = 0x42;

    EXPECT_EQ(radio_->SendPacket(meta, kHello, sizeof(kHello)).getErrorCode(),
              S2lpErrorCode::kBadConfig);
}

TEST_F(S2lpRadioTest, TxWaitIsIdempotentAfterResult) {
    InitWithBasic(MakeBasicConfig());
    ASSERT_TRUE(radio_->SendPacket(TxMetaData{}, kHello, sizeof(kHello)));
    chip_->QueueIrq(ll::irq::kTxDataSent);

    TxResult tx_result;
    ASSERT_TRUE(radio_->Wait(tx_result));
    ASSERT_EQ(tx_result, TxResult::kOk);

    const size_t transactions = chip_->getTransactionCount();
    const uint32_t low_waits = irq_->getLowWaits();
    ASSERT_TRUE(radio_->Wait(tx_result));
    EXPECT_EQ(tx_result, TxResult::kTxAlreadyDone);
    EXPECT_EQ(chip_->getTransactionCount(), transactions);
    EXPECT_EQ(irq_->getLowWaits(), low_waits);
}

TEST_F(S2lpRadioTest, FinishBeforeResultKeepsTx) {
    InitWithBasic(MakeBasicConfig());
    ASSERT_TRUE(radio_->SendPacket(TxMetaData{}, kHello, sizeof(kHello)));

    EXPECT_EQ(radio_->Finish().getErrorCode(), S2lpErrorCode::kNotFinished);
    EXPECT_EQ(radio_->getState(), RadioState::kTx);
}

TEST_F(S2lpRadioTest, TxFifoErrorAbortsAndFlushes) {
    InitWithBasic(MakeBasicConfig());
    ASSERT_TRUE(radio_->SendPacket(TxMetaData{}, kHello, sizeof(kHello)));
    chip_->QueueIrq(ll::irq::kTxFifoError | ll::irq::kTxFifoAlmostEmpty);

    TxResult tx_result;
    ASSERT_TRUE(radio_->Wait(tx_result));
    EXPECT_EQ(tx_result, TxResult::kFifoError);

    const auto& commands = chip_->getCommands();
    ASSERT_GE(commands.size(), 2u);
    EXPECT_EQ(commands[commands.size() - 2], ll::Command::kSAbort);
    EXPECT_EQ(commands.back(), ll::Command::kFlushTxFifo);
    EXPECT_TRUE(radio_->Finish());
}

TEST_F(S2lpRadioTest, TxReportsCsmaAndRetransmissionOutcomes) {
    InitWithBasic(MakeBasicConfig());

    ASSERT_TRUE(radio_->SendPacket(TxMetaData{}, kHello, sizeof(kHello)));
    chip_->QueueIrq(ll::irq::kMaxBoCcaReach);
    TxResult tx_result;
    ASSERT_TRUE(radio_->Wait(tx_result));
    EXPECT_EQ(tx_result, TxResult::kCcaBackoffReached);
    ASSERT_TRUE(radio_->Finish());

    ASSERT_TRUE(radio_->SendPacket(TxMetaData{}, kHello, sizeof(kHello)));
    chip_->QueueIrq(ll::irq::kMaxReTxReach);
    ASSERT_TRUE(radio_->Wait(tx_result));
    EXPECT_EQ(tx_result, TxResult::kMaxReTxReached);
    ASSERT_TRUE(radio_->Finish());
}

TEST_F(S2lpRadioTest, TxIgnoresUnrelatedIrqBits) {
    InitWithBasic(MakeBasicConfig());
    ASSERT_TRUE(radio_->SendPacket(TxMetaData{}, kHello, sizeof(kHello)));
    chip_->QueueIrq(ll::irq::kValidSync);
    chip_->QueueIrq(ll::irq::kTxDataSent);

    TxResult tx_result;
    ASSERT_TRUE(radio_->Wait(tx_result));
    EXPECT_EQ(tx_result, TxResult::kOk);
}

TEST_F(S2lpRadioTest, TxTimeoutInLockStateIsBadState) {
    InitWithBasic(MakeBasicConfig());
    ASSERT_TRUE(radio_->SendPacket(TxMetaData{}, kHello, sizeof(kHello)));
    chip_->SetChipState(ll::ChipState::kLockSt);
    irq_->setTimeoutsBeforeIrq(1);

    TxResult tx_result;
    EXPECT_EQ(radio_->Wait(tx_result).getErrorCode(), S2lpErrorCode::kBadState);
}

TEST_F(S2lpRadioTest, TxTimeoutInUnknownStateIsBadState) {
    InitWithBasic(MakeBasicConfig());
    ASSERT_TRUE(radio_->SendPacket(TxMetaData{}, kHello, sizeof(kHello)));
    chip_->SetRawChipState(0x7F);
    irq_->setTimeoutsBeforeIrq(1);

    TxResult tx_result;
    EXPECT_EQ(radio_->Wait(tx_result).getErrorCode(), S2lpErrorCode::kBadState);
}

TEST_F(S2lpRadioTest, TxTimeoutInValidStateKeepsWaiting) {
    InitWithBasic(MakeBasicConfig());
    ASSERT_TRUE(radio_->SendPacket(TxMetaData{}, kHello, sizeof(kHello)));
    irq_->setTimeoutsBeforeIrq(2);
    chip_->QueueIrq(ll::irq::kTxDataSent);

    TxResult tx_result;
    ASSERT_TRUE(radio_->Wait(tx_result));
    EXPECT_EQ(tx_result, TxResult::kOk);
}

TEST_F(S2lpRadioTest, AbortTxReturnsToReady) {
    InitWithBasic(MakeBasicConfig());
    ASSERT_TRUE(radio_->SendPacket(TxMetaData{}, kHello, sizeof(kHello)));

    ASSERT_TRUE(radio_->Abort());
    EXPECT_EQ(radio_->getState(), RadioState::kReady);
    const auto& commands = chip_->getCommands();
    EXPECT_EQ(commands[commands.size() - 2], ll::Command::kSAbort);
    EXPECT_EQ(commands.back(), ll::Command::kFlushTxFifo);
}

TEST_F(S2lpRadioTest, IeeeFormatAddsCrcToFrameLength) {
    InitRadio();
    Ieee802154gConfig config;
    config.crc_mode = ll::CrcMode::kPoly04C011Bb7;
    ASSERT_TRUE(radio_->SetFormat<Ieee802154gFormat>(config));
    EXPECT_EQ(radio_->getFormatType(), PacketFormatType::kIeee802154g);

    ASSERT_TRUE(radio_->SendPacket(TxMetaData{}, kHello, sizeof(kHello)));
    EXPECT_EQ(chip_->getRegister(ll::reg::kPcktLen0), sizeof(kHello) + 4);
}

// -------------------- RX --------------------

TEST_F(S2lpRadioTest, SuccessfulReception) {
    BasicConfig config = MakeBasicConfig();
    config.include_address = true;
    InitWithBasic(config);

    uint8_t buffer[64] = {0};
    ASSERT_TRUE(radio_->StartReceive(buffer, sizeof(buffer)));
    EXPECT_EQ(radio_->getState(), RadioState::kRx);
    EXPECT_TRUE(chip_->getRegister(ll::reg::kAntSelectConf) &
                ll::field::kCsBlanking.mask);
    EXPECT_EQ(chip_->getCommands().back(), ll::Command::kRx);
    EXPECT_EQ(chip_->getRegister(ll::reg::kTimers5), 0);

    std::vector<uint8_t> first(48);
    std::vector<uint8_t> second(12);
    for (size_t i = 0; i < first.size(); i++) {
        first[i] = static_cast<uint8_t>(i);
    }
    for (size_t i = 0; i < second.size(); i++) {
        second[i] = static_cast<uint8_t>(0x80 + i);
    }
    chip_->QueueIrq(ll::irq::kRxFifoAlmostFull, first);
    chip_->QueueIrq(ll::irq::kRxDataReady, second);
    chip_->SetRegister(ll::reg::kRssiLevel, 100);
    chip_->SetRegister(ll::reg::kRxAddreField0, 0x42);

    RxResult rx_result;
    ASSERT_TRUE(radio_->Wait(rx_result));
    ASSERT_TRUE(rx_result.IsOk());
    EXPECT_EQ(rx_result.packet_size, 60u);
    EXPECT_EQ(rx_result.rssi_value, -46);
    EXPECT_EQ(rx_result.meta_data.format, PacketFormatType::kBasic);
    ASSERT_TRUE(rx_result.meta_data.destination_address.has_value());
    EXPECT_EQ(*rx_result.meta_data.destination_address, 0x42);
    EXPECT_EQ(std::memcmp(buffer, first.data(), first.size()), 0);
    EXPECT_EQ(std::memcmp(buffer + first.size(), second.data(), second.size()),
              0);

    ASSERT_TRUE(radio_->Finish());
    EXPECT_EQ(radio_->getState(), RadioState::kReady);
}

TEST_F(S2lpRadioTest, CrcErrorEndsReception) {
    InitWithBasic(MakeBasicConfig());
    uint8_t buffer[64];
    ASSERT_TRUE(radio_->StartReceive(buffer, sizeof(buffer)));
    chip_->QueueIrq(ll::irq::kRxDataReady | ll::irq::kCrcError, {1, 2, 3});

    RxResult rx_result;
    ASSERT_TRUE(radio_->Wait(rx_result));
    EXPECT_EQ(rx_result.kind, RxResultKind::kCrcError);

    const auto& commands = chip_->getCommands();
    EXPECT_EQ(commands[commands.size() - 2], ll::Command::kSAbort);
    EXPECT_EQ(commands.back(), ll::Command::kFlushRxFifo);

    ASSERT_TRUE(radio_->Finish());
    EXPECT_EQ(radio_->getState(), RadioState::kReady);
}

TEST_F(S2lpRadioTest, RxFailurePrecedence) {
    InitWithBasic(MakeBasicConfig());
    uint8_t buffer[64];
    RxResult rx_result;

    struct Case {
        uint32_t irq;
        RxResultKind expected;
    };
    const Case cases[] = {
        {ll::irq::kRxFifoError | ll::irq::kCrcError | ll::irq::kRxDataDisc,
         RxResultKind::kFifo},
        {ll::irq::kCrcError | ll::irq::kRxTimeout, RxResultKind::kCrcError},
        {ll::irq::kRxTimeout | ll::irq::kRxDataDisc, RxResultKind::kTimeout},
        {ll::irq::kRxDataDisc, RxResultKind::kDiscarded},
    };

    for (const Case& c : cases) {
        ASSERT_TRUE(radio_->StartReceive(buffer, sizeof(buffer)));
        chip_->QueueIrq(c.irq);
        ASSERT_TRUE(radio_->Wait(rx_result));
        EXPECT_EQ(rx_result.kind, c.expected)
            << RxResultKindToString(rx_result.kind);
        ASSERT_TRUE(radio_->Finish());
    }
}

TEST_F(S2lpRadioTest, PacketLargerThanBufferIsRejected) {
    InitWithBasic(MakeBasicConfig());
    uint8_t buffer[4];
    ASSERT_TRUE(radio_->StartReceive(buffer, sizeof(buffer)));
    chip_->QueueIrq(ll::irq::kRxFifoAlmostFull,
                    {1, 2, 3, 4, 5, 6, 7, 8, 9, 10});
    chip_->QueueIrq(ll::irq::kRxDataReady);

    RxResult rx_result;
    ASSERT_TRUE(radio_->Wait(rx_result));
    EXPECT_EQ(rx_result.kind, RxResultKind::kTooBigForBuffer);
    EXPECT_EQ(buffer[3], 4);
    EXPECT_TRUE(radio_->Finish());
}

TEST_F(S2lpRadioTest, PacketLargerThanBufferInOneEventIsRejected) {
    InitWithBasic(MakeBasicConfig());
    uint8_t buffer[3] = {0};
    ASSERT_TRUE(radio_->StartReceive(buffer, sizeof(buffer)));
    chip_->QueueIrq(ll::irq::kRxDataReady, {1, 2, 3, 4, 5});

    RxResult rx_result;
    ASSERT_TRUE(radio_->Wait(rx_result));
    EXPECT_EQ(rx_result.kind, RxResultKind::kTooBigForBuffer);
    EXPECT_EQ(rx_result.packet_size, 0u);

    const auto& commands = chip_->getCommands();
    EXPECT_EQ(commands[commands.size() - 2], ll::Command::kSAbort);
    EXPECT_EQ(commands.back(), ll::Command::kFlushRxFifo);
    EXPECT_TRUE(chip_->getRxFifo().empty());

    ASSERT_TRUE(radio_->Finish());
    EXPECT_EQ(radio_->getState(), RadioState::kReady);
}

TEST_F(S2lpRadioTest, PacketFillingBufferExactlyIsReceived) {
    InitWithBasic(MakeBasicConfig());
    uint8_t buffer[5] = {0};
    ASSERT_TRUE(radio_->StartReceive(buffer, sizeof(buffer)));
    chip_->QueueIrq(ll::irq::kRxDataReady, {1, 2, 3, 4, 5});

    RxResult rx_result;
    ASSERT_TRUE(radio_->Wait(rx_result));
    ASSERT_TRUE(rx_result.IsOk());
    EXPECT_EQ(rx_result.packet_size, 5u);
    EXPECT_EQ(buffer[4], 5);
}

TEST_F(S2lpRadioTest, BufferFilledBeforeDataReadyIsReceived) {
    InitWithBasic(MakeBasicConfig());
    uint8_t buffer[4] = {0};
    ASSERT_TRUE(radio_->StartReceive(buffer, sizeof(buffer)));
    chip_->QueueIrq(ll::irq::kRxFifoAlmostFull, {1, 2, 3, 4});
    chip_->QueueIrq(ll::irq::kRxDataReady);

    RxResult rx_result;
    ASSERT_TRUE(radio_->Wait(rx_result));
    ASSERT_TRUE(rx_result.IsOk());
    EXPECT_EQ(rx_result.packet_size, 4u);
}

TEST_F(S2lpRadioTest, StartReceiveClearsIrqStatusBeforeArmingMask) {
    InitWithBasic(MakeBasicConfig());
    const size_t start = chip_->getTransactionCount();

    uint8_t buffer[16];
    ASSERT_TRUE(radio_->StartReceive(buffer, sizeof(buffer)));

    const auto& transactions = chip_->getTransactions();
    const size_t status_read =
        FindTransaction(transactions, start, 0x01, ll::reg::kIrqStatus3);
    const size_t mask_write =
        FindTransaction(transactions, start, 0x00, ll::reg::kIrqMask3);
    ASSERT_LT(status_read, transactions.size());
    ASSERT_LT(mask_write, transactions.size());
    EXPECT_LT(status_read, mask_write);
}

TEST_F(S2lpRadioTest, SendPacketClearsIrqStatusBeforeArmingMask) {
    InitWithBasic(MakeBasicConfig());
    const size_t start = chip_->getTransactionCount();

    ASSERT_TRUE(radio_->SendPacket(TxMetaData{}, kHello, sizeof(kHello)));

    const auto& transactions = chip_->getTransactions();
    const size_t status_read =
        FindTransaction(transactions, start, 0x01, ll::reg::kIrqStatus3);
    const size_t mask_write =
        FindTransaction(transactions, start, 0x00, ll::reg::kIrqMask3);
    ASSERT_LT(mask_write, transactions.size());
    EXPECT_LT(status_read, mask_write);
}

TEST_F(S2lpRadioTest, RxWaitIsIdempotentAfterResult) {
    InitWithBasic(MakeBasicConfig());
    uint8_t buffer[16];
    ASSERT_TRUE(radio_->StartReceive(buffer, sizeof(buffer)));
    chip_->QueueIrq(ll::irq::kRxTimeout);

    RxResult rx_result;
    ASSERT_TRUE(radio_->Wait(rx_result));
    ASSERT_EQ(rx_result.kind, RxResultKind::kTimeout);

    const size_t transactions = chip_->getTransactionCount();
    ASSERT_TRUE(radio_->Wait(rx_result));
    EXPECT_EQ(rx_result.kind, RxResultKind::kRxAlreadyDone);
    EXPECT_EQ(chip_->getTransactionCount(), transactions);
}

TEST_F(S2lpRadioTest, FinishBeforeResultKeepsRx) {
    InitWithBasic(MakeBasicConfig());
    uint8_t buffer[16];
    ASSERT_TRUE(radio_->StartReceive(buffer, sizeof(buffer)));

    EXPECT_EQ(radio_->Finish().getErrorCode(), S2lpErrorCode::kNotFinished);
    EXPECT_EQ(radio_->getState(), RadioState::kRx);

    ASSERT_TRUE(radio_->Abort());
    EXPECT_EQ(radio_->getState(), RadioState::kReady);
    EXPECT_EQ(chip_->getCommands().back(), ll::Command::kFlushRxFifo);
}

TEST_F(S2lpRadioTest, RxTimeoutProgramsTimer) {
    InitWithBasic(MakeBasicConfig());
    uint8_t buffer[16];

    RxTimeout timeout;
    timeout.timeout_us = 10000;
    timeout.mask = RxTimeoutMask::kRssiOrSqi;
    ASSERT_TRUE(radio_->StartReceive(buffer, sizeof(buffer), RxMode::Normal(timeout)));

    const RxTimerWord timer =
        FindRxTimerPrescalerAndCounter(10000, radio_->getDigitalFrequency());
    EXPECT_EQ(chip_->getRegister(ll::reg::kTimers5), timer.counter);
    EXPECT_EQ(chip_->getRegister(ll::reg::kTimers4), timer.prescaler);
    EXPECT_TRUE(chip_->getRegister(ll::reg::kPcktFltOptions) &
                ll::field::kRxTimeoutAndOrSel.mask);
}

TEST_F(S2lpRadioTest, ReleasedBusBlocksRegisterAccess) {
    InitWithBasic(MakeBasicConfig());
    uint8_t buffer[16];
    ASSERT_TRUE(radio_->StartReceive(buffer, sizeof(buffer)));

    std::unique_ptr<ll::IRegisterInterface> bus;
    ASSERT_TRUE(radio_->ReleaseSpi(bus));
    ASSERT_NE(bus, nullptr);
    EXPECT_FALSE(radio_->IsLlAvailable());

    chip_->QueueIrq(ll::irq::kRxDataReady, {1, 2});
    EXPECT_TRUE(radio_->WaitForIrq());

    RxResult rx_result;
    chip_->QueueIrq(ll::irq::kRxDataReady);
    EXPECT_EQ(radio_->Wait(rx_result).getErrorCode(), S2lpErrorCode::kInvalidState);

    ASSERT_TRUE(radio_->AttachSpi(std::move(bus)));
    EXPECT_TRUE(radio_->IsLlAvailable());
    EXPECT_EQ(radio_->AttachSpi(nullptr).getErrorCode(),
              S2lpErrorCode::kInvalidArgument);
    EXPECT_TRUE(radio_->Abort());
}

TEST_F(S2lpRadioTest, ReleaseSpiOnlyDuringRx) {
    InitWithBasic(MakeBasicConfig());
    std::unique_ptr<ll::IRegisterInterface> bus;

    EXPECT_EQ(radio_->ReleaseSpi(bus).getErrorCode(), S2lpErrorCode::kInvalidState);
    EXPECT_EQ(bus, nullptr);
}

// -------------------- Ready operations --------------------

TEST_F(S2lpRadioTest, StandbyAndWakeUp) {
    InitWithBasic(MakeBasicConfig());

    ASSERT_TRUE(radio_->Standby());
    EXPECT_EQ(radio_->getState(), RadioState::kStandby);
    EXPECT_EQ(chip_->getCommands().back(), ll::Command::kStandby);
    EXPECT_TRUE(radio_->IsLlAvailable());

    uint8_t buffer[16];
    EXPECT_EQ(radio_->StartReceive(buffer, sizeof(buffer)).getErrorCode(),
              S2lpErrorCode::kInvalidState);

    ASSERT_TRUE(radio_->WakeUp());
    EXPECT_EQ(radio_->getState(), RadioState::kReady);
    EXPECT_EQ(chip_->getCommands().back(), ll::Command::kReady);
    EXPECT_EQ(radio_->getFormatType(), PacketFormatType::kBasic);
}

TEST_F(S2lpRadioTest, ShutdownDropsConfiguration) {
    InitWithBasic(MakeBasicConfig());
    EXPECT_CALL(*sdn_, SetHigh()).WillOnce(Return(Result::Success()));

    ASSERT_TRUE(radio_->Shutdown());

    EXPECT_EQ(radio_->getState(), RadioState::kShutdown);
    EXPECT_EQ(radio_->getFormatType(), PacketFormatType::kUninitialized);
    EXPECT_FALSE(radio_->IsLlAvailable());
}

TEST_F(S2lpRadioTest, CanInitAgainAfterShutdown) {
    InitWithBasic(MakeBasicConfig());
    ASSERT_TRUE(radio_->Shutdown());

    ASSERT_TRUE(radio_->Init(RadioConfig::CreateDefault()));
    EXPECT_TRUE(radio_->SetFormat<BasicFormat>(MakeBasicConfig()));
}

TEST_F(S2lpRadioTest, InvalidCsmaModeWritesNothing) {
    InitWithBasic(MakeBasicConfig());
    const size_t transactions = chip_->getTransactionCount();

    Result result =
        radio_->SetCsmaCa(CsmaCaMode::Persistent(ll::CcaPeriod::kBits64, 16));

    EXPECT_EQ(result.getErrorCode(), S2lpErrorCode::kInvalidArgument);
    EXPECT_EQ(chip_->getTransactionCount(), transactions);
}

TEST_F(S2lpRadioTest, CsmaModeIsProgrammed) {
    InitWithBasic(MakeBasicConfig());

    ASSERT_TRUE(radio_->SetCsmaCa(
        CsmaCaMode::Persistent(ll::CcaPeriod::kBits128, 3)));
    const uint8_t protocol1 = chip_->getRegister(ll::reg::kProtocol1);
    EXPECT_TRUE(protocol1 & ll::field::kCsmaOn.mask);
    EXPECT_TRUE(protocol1 & ll::field::kCsmaPersOn.mask);

    ASSERT_TRUE(radio_->SetCsmaCa(CsmaCaMode::Off()));
    EXPECT_FALSE(chip_->getRegister(ll::reg::kProtocol1) &
                 ll::field::kCsmaOn.mask);
}

TEST_F(S2lpRadioTest, GpioFunctionInAddressableStates) {
    InitWithBasic(MakeBasicConfig());

    ASSERT_TRUE(radio_->SetGpioFunction(
        ll::GpioNumber::kGpio3,
        GpioFunction::Output(ll::GpioSelectOutput::kRxState, true)));
    EXPECT_EQ(chip_->getRegister(ll::reg::kGpio3Conf), (10 << 3) | 0x03);

    ASSERT_TRUE(radio_->Standby());
    EXPECT_TRUE(radio_->SetGpioFunction(ll::GpioNumber::kGpio1,
                                        GpioFunction::HiZ()));
}

TEST_F(S2lpRadioTest, LowLevelAccessReadsChip) {
    InitRadio();

    uint8_t version = 0;
    ASSERT_TRUE(radio_->Ll().ReadRegister(ll::reg::kDeviceInfo0, version));
    EXPECT_EQ(version, ll::kExpectedVersion);
}

TEST_F(S2lpRadioTest, MovedRadioKeepsState) {
    InitWithBasic(MakeBasicConfig());

    S2lpRadio moved(std::move(*radio_));

    EXPECT_EQ(moved.getState(), RadioState::kReady);
    EXPECT_EQ(moved.getFormatType(), PacketFormatType::kBasic);
    ASSERT_TRUE(moved.SendPacket(TxMetaData{}, kHello, sizeof(kHello)));
    EXPECT_EQ(moved.getState(), RadioState::kTx);
}

TEST_F(S2lpRadioTest, MovedFromRadioCannotReachChip) {
    InitWithBasic(MakeBasicConfig());
    S2lpRadio moved(std::move(*radio_));
    const size_t transactions = chip_->getTransactionCount();

    EXPECT_EQ(radio_->getState(), RadioState::kShutdown);
    EXPECT_EQ(radio_->getFormatType(), PacketFormatType::kUninitialized);
    EXPECT_FALSE(radio_->IsLlAvailable());
    EXPECT_EQ(radio_->Standby().getErrorCode(), S2lpErrorCode::kInvalidState);
    EXPECT_EQ(radio_->WakeUp().getErrorCode(), S2lpErrorCode::kInvalidState);
    EXPECT_EQ(radio_->SendPacket(TxMetaData{}, kHello, sizeof(kHello))
                  .getErrorCode(),
              S2lpErrorCode::kInvalidState);
    EXPECT_EQ(radio_->Init(RadioConfig::CreateDefault()).getErrorCode(),
              S2lpErrorCode::kInvalidState);

    uint8_t version = 0;
    EXPECT_EQ(radio_->Ll().ReadRegister(ll::reg::kDeviceInfo0, version)
                  .getErrorCode(),
              S2lpErrorCode::kInvalidState);
    EXPECT_EQ(chip_->getTransactionCount(), transactions);

    // Destroying the old handle leaves the new owner working
    radio_.reset();
    ASSERT_TRUE(moved.Standby());
    EXPECT_EQ(moved.getState(), RadioState::kStandby);
}

TEST_F(S2lpRadioTest, MoveAssignmentTransfersChip) {
    InitWithBasic(MakeBasicConfig());
    S2lpRadio target(std::unique_ptr<ll::IRegisterInterface>(), nullptr,
                     nullptr, ll::GpioNumber::kGpio0, nullptr);

    target = std::move(*radio_);

    EXPECT_EQ(target.getState(), RadioState::kReady);
    EXPECT_EQ(target.getFormatType(), PacketFormatType::kBasic);
    EXPECT_EQ(radio_->getState(), RadioState::kShutdown);

    const size_t transactions = chip_->getTransactionCount();
    EXPECT_EQ(radio_->Standby().getErrorCode(), S2lpErrorCode::kInvalidState);
    EXPECT_EQ(chip_->getTransactionCount(), transactions);

    ASSERT_TRUE(target.Standby());
    EXPECT_GT(chip_->getTransactionCount(), transactions);
}

}  // namespace test
}  // namespace radio
}  // namespace s2lp
