#include "basic_format.hpp"

#include <sstream>

#include "utils/logger.hpp"

namespace s2lp {
namespace radio {

std::string BasicConfig::Validate() const {
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
    return errors.str();
}

Result BasicFormat::UseConfig(ll::Device& device) {
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

    result = device.WriteRegister(
        ll::reg::kPcktCtrl4,
        ll::field::kLenWid.Encode(
            static_cast<uint8_t>(config_.packet_length_encoding)) |
            ll::field::kAddressLen.Encode(config_.include_address ? 1 : 0));
    if (!result) {
        return result;
    }

    result = device.ModifyRegister(
        ll::reg::kPcktCtrl3,
        ll::field::kPcktFrmt.mask | ll::field::kPreambleSel.mask,
        ll::field::kPcktFrmt.Encode(
            static_cast<uint8_t>(ll::PacketFormatSelect::kBasic)) |
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
            ll::field::kWhitEn.Encode(1));
    if (!result) {
        return result;
    }

    result = device.WriteRegister(ll::reg::kPcktPstmbl, config_.postamble_length);
    if (!result) {
        return result;
    }

    return config_.packet_filter.WriteToDevice(device);
}

Result BasicFormat::SetupPacketSend(ll::Device& device,
                                    const TxMetaData& tx_meta_data,
                                    size_t payload_len) {
    uint8_t pckt_ctrl4 = 0;
    Result result = device.ReadRegister(ll::reg::kPcktCtrl4, pckt_ctrl4);
    if (!result) {
        return result;
    }

    const size_t address_len = ll::field::kAddressLen.Decode(pckt_ctrl4);
    const size_t max_packet_len =
        ll::field::kLenWid.Decode(pckt_ctrl4) ==
                static_cast<uint8_t>(ll::LenWid::kBytes1)
            ? 0xFF
            : 0xFFFF;

    if (payload_len > max_packet_len - address_len) {
        LOG_WARNING("Payload of %u bytes exceeds the maximum of %u",
                    static_cast<unsigned>(payload_len),
                    static_cast<unsigned>(max_packet_len - address_len));
        return Result::Error(S2lpErrorCode::kBufferTooLarge);
    }

    if ((address_len != 0) != tx_meta_data.destination_address.has_value()) {
        return Result::BadConfig("Given address different from config");
    }

    result = device.WriteUint16(
        ll::reg::kPcktLen1, static_cast<uint16_t>(payload_len + address_len));
    if (!result) {
        return result;
    }

    if (tx_meta_data.destination_address) {
        result = device.WriteRegister(ll::reg::kPcktFltGoals3,
                                      *tx_meta_data.destination_address);
        if (!result) {
            return result;
        }
    }

    return Result::Success();
}

Result BasicFormat::ReadRxMetaData(ll::Device& device, RxMetaData& meta_data) {
    meta_data = RxMetaData{};
    meta_data.format = PacketFormatType::kBasic;

    uint8_t address_len = 0;
    Result result = device.ReadField(ll::field::kAddressLen, address_len);
    if (!result) {
        return result;
    }

    if (address_len != 0) {
        uint8_t destination = 0;
        result = device.ReadRegister(ll::reg::kRxAddreField0, destination);
        if (!result) {
            return result;
        }
        meta_data.destination_address = destination;
    }

    return Result::Success();
}

}  // namespace radio
}  // namespace s2lp
