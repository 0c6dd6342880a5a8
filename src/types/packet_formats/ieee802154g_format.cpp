#include "ieee802154g_format.hpp"

#include <sstream>

#include "types/packet_formats/packet_filtering_options.hpp"

namespace s2lp {
namespace radio {

std::string Ieee802154gConfig::Validate() const {
    std::stringstream errors;
    if (preamble_length > kMaxPreambleLength) {
        errors << "Preamble length exceeds 2046 bits. ";
    }
    if (preamble_length % 2 != 0) {
        errors << "Preamble length must be an even number of bits. ";
    }
    if (sync_length > kMaxSyncLength) {
        errors << "Sync length exceeds 32 bits. ";
    }
    if (crc_mode != ll::CrcMode::kNoCrc && crc_mode != ll::CrcMode::kPoly1021 &&
        crc_mode != ll::CrcMode::kPoly04C011Bb7) {
        errors << "Unsupported CRC mode for IEEE 802.15.4g. ";
    }
    return errors.str();
}

Result Ieee802154gFormat::UseConfig(ll::Device& device) {
    std::string errors = config_.Validate();
    if (!errors.empty()) {
        return Result::BadConfig(errors);
    }

    Result result =
        WritePreambleAndSync(device, config_.preamble_length,
                             config_.sync_length, config_.sync_pattern);
    if (!result) {
        return result;
    }

    // Frame length is always 11 bits
    result = device.WriteRegister(
        ll::reg::kPcktCtrl4,
        ll::field::kLenWid.Encode(static_cast<uint8_t>(ll::LenWid::kBytes2)) |
            ll::field::kAddressLen.Encode(1));
    if (!result) {
        return result;
    }

    result = device.ModifyRegister(
        ll::reg::kPcktCtrl3,
        ll::field::kPcktFrmt.mask | ll::field::kPreambleSel.mask,
        ll::field::kPcktFrmt.Encode(
            static_cast<uint8_t>(ll::PacketFormatSelect::kIeee802154g)) |
            ll::field::kPreambleSel.Encode(
                static_cast<uint8_t>(config_.preamble_pattern)));
    if (!result) {
        return result;
    }

    result = device.WriteRegister(ll::reg::kPcktCtrl2,
                                  ll::field::kFixVarLen.Encode(1));
    if (!result) {
        return result;
    }

    result = device.ModifyRegister(
        ll::reg::kPcktCtrl1, ll::field::kCrcMode.mask | ll::field::kWhitEn.mask,
        ll::field::kCrcMode.Encode(static_cast<uint8_t>(config_.crc_mode)) |
            ll::field::kWhitEn.Encode(config_.data_whitening ? 1 : 0));
    if (!result) {
        return result;
    }

    return PacketFilteringOptions{}.WriteToDevice(device);
}

Result Ieee802154gFormat::SetupPacketSend(ll::Device& device,
                                          const TxMetaData& tx_meta_data,
                                          size_t payload_len) {
    if (tx_meta_data.destination_address) {
        return Result::BadConfig(
            "IEEE 802.15.4g frames carry no destination address");
    }

    uint8_t crc_mode = 0;
    Result result = device.ReadField(ll::field::kCrcMode, crc_mode);
    if (!result) {
        return result;
    }
    const size_t crc_len = ll::CrcLength(static_cast<ll::CrcMode>(crc_mode));

    if (payload_len + crc_len > kMaxFrameLength) {
        return Result::Error(S2lpErrorCode::kBufferTooLarge);
    }

    return device.WriteUint16(ll::reg::kPcktLen1,
                              static_cast<uint16_t>(payload_len + crc_len));
}

Result Ieee802154gFormat::ReadRxMetaData(ll::Device& device,
                                         RxMetaData& meta_data) {
    (void)device;
    meta_data = RxMetaData{};
    meta_data.format = PacketFormatType::kIeee802154g;
    return Result::Success();
}

}  // namespace radio
}  // namespace s2lp
