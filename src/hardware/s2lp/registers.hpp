// src/hardware/s2lp/registers.hpp
#pragma once

#include <cstddef>
#include <cstdint>

namespace s2lp {
namespace ll {

/**
 * @brief Register addresses of the S2-LP
 */
namespace reg {

constexpr uint8_t kGpio0Conf = 0x00;
constexpr uint8_t kGpio1Conf = 0x01;
constexpr uint8_t kGpio2Conf = 0x02;
constexpr uint8_t kGpio3Conf = 0x03;
constexpr uint8_t kSynt3 = 0x05;
constexpr uint8_t kSynt2 = 0x06;
constexpr uint8_t kSynt1 = 0x07;
constexpr uint8_t kSynt0 = 0x08;
constexpr uint8_t kIfOffsetAna = 0x09;
constexpr uint8_t kIfOffsetDig = 0x0A;
constexpr uint8_t kChSpace = 0x0C;
constexpr uint8_t kChNum = 0x0D;
constexpr uint8_t kMod4 = 0x0E;
constexpr uint8_t kMod3 = 0x0F;
constexpr uint8_t kMod2 = 0x10;
constexpr uint8_t kMod1 = 0x11;
constexpr uint8_t kMod0 = 0x12;
constexpr uint8_t kChFlt = 0x13;
constexpr uint8_t kRssiFlt = 0x17;
constexpr uint8_t kRssiTh = 0x18;
constexpr uint8_t kAntSelectConf = 0x1F;
constexpr uint8_t kPcktCtrl6 = 0x2B;
constexpr uint8_t kPcktCtrl5 = 0x2C;
constexpr uint8_t kPcktCtrl4 = 0x2D;
constexpr uint8_t kPcktCtrl3 = 0x2E;
constexpr uint8_t kPcktCtrl2 = 0x2F;
constexpr uint8_t kPcktCtrl1 = 0x30;
constexpr uint8_t kPcktLen1 = 0x31;
constexpr uint8_t kPcktLen0 = 0x32;
constexpr uint8_t kSync3 = 0x33;
constexpr uint8_t kSync2 = 0x34;
constexpr uint8_t kSync1 = 0x35;
constexpr uint8_t kSync0 = 0x36;
constexpr uint8_t kPcktPstmbl = 0x38;
constexpr uint8_t kProtocol2 = 0x39;
constexpr uint8_t kProtocol1 = 0x3A;
constexpr uint8_t kProtocol0 = 0x3B;
constexpr uint8_t kFifoConfig3 = 0x3C;
constexpr uint8_t kFifoConfig2 = 0x3D;
constexpr uint8_t kFifoConfig1 = 0x3E;
constexpr uint8_t kFifoConfig0 = 0x3F;
constexpr uint8_t kPcktFltOptions = 0x40;
constexpr uint8_t kPcktFltGoals4 = 0x41;
constexpr uint8_t kPcktFltGoals3 = 0x42;
constexpr uint8_t kPcktFltGoals2 = 0x43;
constexpr uint8_t kPcktFltGoals1 = 0x44;
constexpr uint8_t kPcktFltGoals0 = 0x45;
constexpr uint8_t kTimers5 = 0x46;
constexpr uint8_t kTimers4 = 0x47;
constexpr uint8_t kCsmaConf3 = 0x4C;
constexpr uint8_t kCsmaConf2 = 0x4D;
constexpr uint8_t kCsmaConf1 = 0x4E;
constexpr uint8_t kCsmaConf0 = 0x4F;
constexpr uint8_t kIrqMask3 = 0x50;
constexpr uint8_t kIrqMask2 = 0x51;
constexpr uint8_t kIrqMask1 = 0x52;
constexpr uint8_t kIrqMask0 = 0x53;
constexpr uint8_t kSynthConfig2 = 0x65;
constexpr uint8_t kXoRcoConf1 = 0x6C;
constexpr uint8_t kXoRcoConf0 = 0x6D;
constexpr uint8_t kPmConf1 = 0x78;
constexpr uint8_t kPmConf0 = 0x79;
constexpr uint8_t kMcState1 = 0x8D;
constexpr uint8_t kMcState0 = 0x8E;
constexpr uint8_t kTxFifoStatus = 0x8F;
constexpr uint8_t kRxFifoStatus = 0x90;
constexpr uint8_t kRssiLevel = 0xA2;
constexpr uint8_t kRxPcktLen1 = 0xA4;
constexpr uint8_t kRxPcktLen0 = 0xA5;
constexpr uint8_t kRxAddreField1 = 0xAA;
constexpr uint8_t kRxAddreField0 = 0xAB;
constexpr uint8_t kDeviceInfo1 = 0xF0;
constexpr uint8_t kDeviceInfo0 = 0xF1;
constexpr uint8_t kIrqStatus3 = 0xFA;
constexpr uint8_t kIrqStatus2 = 0xFB;
constexpr uint8_t kIrqStatus1 = 0xFC;
constexpr uint8_t kIrqStatus0 = 0xFD;
constexpr uint8_t kFifo = 0xFF;

}  // namespace reg

/**
 * @brief A bit field inside a single 8-bit register
 */
struct Field {
    uint8_t address;  ///< Register holding the field
    uint8_t mask;     ///< Mask of the field, already shifted into place
    uint8_t shift;    ///< Position of the least significant bit

    constexpr uint8_t Encode(uint8_t value) const {
        return static_cast<uint8_t>((value << shift) & mask);
    }

    constexpr uint8_t Decode(uint8_t raw) const {
        return static_cast<uint8_t>((raw & mask) >> shift);
    }
};

/**
 * @brief Field definitions used by the driver
 */
namespace field {

// GPIOx_CONF, the address is the GPIO number
constexpr Field kGpioSelect{reg::kGpio0Conf, 0xF8, 3};
constexpr Field kGpioMode{reg::kGpio0Conf, 0x03, 0};

constexpr Field kCpIsel{reg::kSynt3, 0xE0, 5};
constexpr Field kBandSelect{reg::kSynt3, 0x10, 4};
constexpr Field kSyntHigh{reg::kSynt3, 0x0F, 0};

constexpr Field kModType{reg::kMod2, 0xF0, 4};
constexpr Field kDatarateExponent{reg::kMod2, 0x0F, 0};
constexpr Field kFdevExponent{reg::kMod1, 0x0F, 0};
constexpr Field kChFltMantissa{reg::kChFlt, 0xF0, 4};
constexpr Field kChFltExponent{reg::kChFlt, 0x0F, 0};

constexpr Field kRssiFlt{reg::kRssiFlt, 0xF0, 4};
constexpr Field kCsMode{reg::kRssiFlt, 0x0C, 2};

constexpr Field kCsBlanking{reg::kAntSelectConf, 0x10, 4};

constexpr Field kSyncLen{reg::kPcktCtrl6, 0xFC, 2};
constexpr Field kPreambleLenHigh{reg::kPcktCtrl6, 0x03, 0};

constexpr Field kLenWid{reg::kPcktCtrl4, 0x80, 7};
constexpr Field kAddressLen{reg::kPcktCtrl4, 0x08, 3};

constexpr Field kPcktFrmt{reg::kPcktCtrl3, 0xC0, 6};
constexpr Field kRxMode{reg::kPcktCtrl3, 0x30, 4};
constexpr Field kFsk4SymSwap{reg::kPcktCtrl3, 0x08, 3};
constexpr Field kByteSwap{reg::kPcktCtrl3, 0x04, 2};
constexpr Field kPreambleSel{reg::kPcktCtrl3, 0x03, 0};

constexpr Field kFcsType4g{reg::kPcktCtrl2, 0x20, 5};
constexpr Field kFecType4g{reg::kPcktCtrl2, 0x10, 4};
constexpr Field kIntEn4g{reg::kPcktCtrl2, 0x08, 3};
constexpr Field kMbus3of6En{reg::kPcktCtrl2, 0x04, 2};
constexpr Field kManchesterEn{reg::kPcktCtrl2, 0x02, 1};
constexpr Field kFixVarLen{reg::kPcktCtrl2, 0x01, 0};

constexpr Field kCrcMode{reg::kPcktCtrl1, 0xE0, 5};
constexpr Field kWhitEn{reg::kPcktCtrl1, 0x10, 4};
constexpr Field kTxSource{reg::kPcktCtrl1, 0x0C, 2};
constexpr Field kSecondSyncSel{reg::kPcktCtrl1, 0x02, 1};
constexpr Field kFecEn{reg::kPcktCtrl1, 0x01, 0};

constexpr Field kCsTimeoutMask{reg::kProtocol2, 0x80, 7};
constexpr Field kSqiTimeoutMask{reg::kProtocol2, 0x40, 6};
constexpr Field kPqiTimeoutMask{reg::kProtocol2, 0x20, 5};

constexpr Field kLdcMode{reg::kProtocol1, 0x80, 7};
constexpr Field kSeedReload{reg::kProtocol1, 0x08, 3};
constexpr Field kCsmaOn{reg::kProtocol1, 0x04, 2};
constexpr Field kCsmaPersOn{reg::kProtocol1, 0x02, 1};
constexpr Field kAutoPcktFlt{reg::kProtocol1, 0x01, 0};

constexpr Field kNMaxReTx{reg::kProtocol0, 0xF0, 4};
constexpr Field kNackTx{reg::kProtocol0, 0x08, 3};
constexpr Field kAutoAck{reg::kProtocol0, 0x04, 2};
constexpr Field kPersRx{reg::kProtocol0, 0x02, 1};

constexpr Field kRxTimeoutAndOrSel{reg::kPcktFltOptions, 0x40, 6};
constexpr Field kSourceAddrFlt{reg::kPcktFltOptions, 0x10, 4};
constexpr Field kDestVsBroadcastAddr{reg::kPcktFltOptions, 0x08, 3};
constexpr Field kDestVsMulticastAddr{reg::kPcktFltOptions, 0x04, 2};
constexpr Field kDestVsSourceAddr{reg::kPcktFltOptions, 0x02, 1};
constexpr Field kCrcFlt{reg::kPcktFltOptions, 0x01, 0};

constexpr Field kBuPrsc{reg::kCsmaConf1, 0xFC, 2};
constexpr Field kCcaPeriod{reg::kCsmaConf1, 0x03, 0};
constexpr Field kCcaLen{reg::kCsmaConf0, 0xF0, 4};
constexpr Field kNBackoffMax{reg::kCsmaConf0, 0x07, 0};

constexpr Field kPllPfdSplitEn{reg::kSynthConfig2, 0x04, 2};
constexpr Field kPdClkDiv{reg::kXoRcoConf1, 0x10, 4};
constexpr Field kRefDiv{reg::kXoRcoConf0, 0x08, 3};
constexpr Field kRcoCalibration{reg::kXoRcoConf0, 0x01, 0};
constexpr Field kSmpsLvlMode{reg::kPmConf1, 0x04, 2};
constexpr Field kSleepModeSel{reg::kPmConf0, 0x01, 0};

constexpr Field kRcoCalOk{reg::kMcState1, 0x10, 4};
constexpr Field kErrorLock{reg::kMcState1, 0x01, 0};
constexpr Field kState{reg::kMcState0, 0xFE, 1};

}  // namespace field

/**
 * @brief Command strobes
 */
enum class Command : uint8_t {
    kTx = 0x60,
    kRx = 0x61,
    kReady = 0x62,
    kStandby = 0x63,
    kSleep = 0x64,
    kLockRx = 0x65,
    kLockTx = 0x66,
    kSAbort = 0x67,
    kLdcReload = 0x68,
    kSRes = 0x70,
    kFlushRxFifo = 0x71,
    kFlushTxFifo = 0x72,
    kSequenceUpdate = 0x73,
};

/**
 * @brief Bits of the 32-bit IRQ status and mask words
 */
namespace irq {

constexpr uint32_t kRxDataReady = 1UL << 0;
constexpr uint32_t kRxDataDisc = 1UL << 1;
constexpr uint32_t kTxDataSent = 1UL << 2;
constexpr uint32_t kMaxReTxReach = 1UL << 3;
constexpr uint32_t kCrcError = 1UL << 4;
constexpr uint32_t kTxFifoError = 1UL << 5;
constexpr uint32_t kRxFifoError = 1UL << 6;
constexpr uint32_t kTxFifoAlmostFull = 1UL << 7;
constexpr uint32_t kTxFifoAlmostEmpty = 1UL << 8;
constexpr uint32_t kRxFifoAlmostFull = 1UL << 9;
constexpr uint32_t kRxFifoAlmostEmpty = 1UL << 10;
constexpr uint32_t kMaxBoCcaReach = 1UL << 11;
constexpr uint32_t kValidPreamble = 1UL << 12;
constexpr uint32_t kValidSync = 1UL << 13;
constexpr uint32_t kRssiAboveTh = 1UL << 14;
constexpr uint32_t kWakeUpTimeoutLdc = 1UL << 15;
constexpr uint32_t kReady = 1UL << 16;
constexpr uint32_t kStandbyDelayed = 1UL << 17;
constexpr uint32_t kLowBattLvl = 1UL << 18;
constexpr uint32_t kPor = 1UL << 19;
constexpr uint32_t kBor = 1UL << 20;
constexpr uint32_t kLockDetected = 1UL << 21;
constexpr uint32_t kVcoCalibrationEnd = 1UL << 22;
constexpr uint32_t kPaCalibrationEnd = 1UL << 23;
constexpr uint32_t kPmCountExpired = 1UL << 24;
constexpr uint32_t kXoCountExpired = 1UL << 25;
constexpr uint32_t kTxStartTime = 1UL << 26;
constexpr uint32_t kRxStartTime = 1UL << 27;
constexpr uint32_t kRxTimeout = 1UL << 28;
constexpr uint32_t kRxSniffTimeout = 1UL << 29;

}  // namespace irq

constexpr size_t kFifoSize = 128;

// DEVICE_INFO0 and DEVICE_INFO1 after reset
constexpr uint8_t kExpectedVersion = 0xC1;
constexpr uint8_t kExpectedPartNumber = 0x03;

/**
 * @brief Main controller state as reported by MC_STATE0
 */
enum class ChipState : uint8_t {
    kReady = 0x00,
    kSleepNoFifo = 0x01,
    kStandby = 0x02,
    kSleep = 0x03,
    kLockOn = 0x0C,
    kLockSt = 0x14,
    kRx = 0x30,
    kSynthSetup = 0x50,
    kTx = 0x5C,
};

/**
 * @brief Check whether a raw MC_STATE0 state value is a documented state
 */
constexpr bool IsKnownChipState(uint8_t value) {
    return value == 0x00 || value == 0x01 || value == 0x02 || value == 0x03 ||
           value == 0x0C || value == 0x14 || value == 0x30 || value == 0x50 ||
           value == 0x5C;
}

enum class ModulationType : uint8_t {
    k2Fsk = 0x0,
    k4Fsk = 0x1,
    k2Gfsk05 = 0xA,  ///< 2-GFSK with BT 0.5
    k2Gfsk1 = 0x2,   ///< 2-GFSK with BT 1
    k4Gfsk05 = 0xB,
    k4Gfsk1 = 0x3,
    kAskOok = 0x5,
    kPolar = 0x6,
    kUnmodulated = 0x7,
};

enum class CrcMode : uint8_t {
    kNoCrc = 0,
    kPoly07 = 1,         ///< 8 bit, poly 0x07
    kPoly8005 = 2,       ///< 16 bit, poly 0x8005
    kPoly1021 = 3,       ///< 16 bit, poly 0x1021
    kPoly864Cbf = 4,     ///< 24 bit, poly 0x864CFB
    kPoly04C011Bb7 = 5,  ///< 32 bit, poly 0x04C011BB7
};

/**
 * @brief Number of CRC bytes appended for a given mode
 */
constexpr size_t CrcLength(CrcMode mode) {
    switch (mode) {
        case CrcMode::kNoCrc:
            return 0;
        case CrcMode::kPoly07:
            return 1;
        case CrcMode::kPoly8005:
        case CrcMode::kPoly1021:
            return 2;
        case CrcMode::kPoly864Cbf:
            return 3;
        case CrcMode::kPoly04C011Bb7:
            return 4;
    }
    return 0;
}

/**
 * @brief Width of the length field, PCKTCTRL4.LEN_WID
 */
enum class LenWid : uint8_t {
    kBytes1 = 0,
    kBytes2 = 1,
};

enum class PacketFormatSelect : uint8_t {
    kBasic = 0,
    kIeee802154g = 1,
    kUartOta = 2,
    kStack = 3,
};

/**
 * @brief Preamble pattern, PCKTCTRL3.PREAMBLE_SEL
 */
enum class PreamblePattern : uint8_t {
    kPattern0 = 0,  ///< 0101 for 2(G)FSK and OOK/ASK, 0010 for 4(G)FSK
    kPattern1 = 1,  ///< 1010 for 2(G)FSK and OOK/ASK, 0111 for 4(G)FSK
    kPattern2 = 2,  ///< 1100 for 2(G)FSK and OOK/ASK, 1101 for 4(G)FSK
    kPattern3 = 3,  ///< 0011 for 2(G)FSK and OOK/ASK, 1000 for 4(G)FSK
};

enum class RxModeSelect : uint8_t {
    kNormal = 0,
    kDirectFifo = 1,
    kDirectGpio = 2,
};

enum class TxSource : uint8_t {
    kNormal = 0,
    kDirectFifo = 1,
    kDirectGpio = 2,
    kPn9 = 3,
};

enum class CsMode : uint8_t {
    kStatic = 0,
    kDynamic6Db = 1,
    kDynamic12Db = 2,
    kDynamic18Db = 3,
};

/**
 * @brief Length of one clear channel assessment period in bit periods
 */
enum class CcaPeriod : uint8_t {
    kBits64 = 0,
    kBits128 = 1,
    kBits256 = 2,
    kBits512 = 3,
};

enum class GpioMode : uint8_t {
    kHiZ = 0,
    kInput = 1,
    kOutputLowPower = 2,
    kOutputHighPower = 3,
};

enum class GpioSelectOutput : uint8_t {
    kIrq = 0,  ///< nIRQ, active low
    kPorInverted = 1,
    kWakeUpTimerExpiration = 2,
    kLowBatteryDetection = 3,
    kTxDataClock = 4,
    kTxState = 5,
    kTxRxFifoAlmostEmpty = 6,
    kTxRxFifoAlmostFull = 7,
    kRxData = 8,
    kRxClock = 9,
    kRxState = 10,
    kNotStandbyOrSleep = 11,
    kStandby = 12,
    kAntenna = 13,
    kValidPreamble = 14,
    kSyncDetected = 15,
    kRssiAboveThreshold = 16,
    kMcuClock = 17,
    kTxOrRxMode = 18,
    kVdd = 19,
    kGnd = 20,
    kSmpsExternal = 21,
    kSleep = 22,
    kReady = 23,
    kLock = 24,
    kWaitForLockSignal = 25,
    kTxDataOok = 26,
    kWaitForReady2Signal = 27,
    kWaitForTimerExpirationForPm = 28,
    kWaitForVcoCalibration = 29,
    kEnableSynthFullCircuit = 30,
};

enum class GpioSelectInput : uint8_t {
    kTxCommand = 0,
    kRxCommand = 1,
    kTxDataForDirectModulation = 2,
    kWakeUpFromExternalInput = 3,
    kExternalClockForLdc = 4,
};

/**
 * @brief Chip GPIO pin
 */
enum class GpioNumber : uint8_t {
    kGpio0 = 0,
    kGpio1 = 1,
    kGpio2 = 2,
    kGpio3 = 3,
};

}  // namespace ll
}  // namespace s2lp
