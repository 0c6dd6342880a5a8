// src/types/packet_formats/ieee802154g_format.hpp
#pragma once

#include <cstdint>
#include <string>

#include "hardware/s2lp/registers.hpp"
#include "types/packet_formats/packet_format.hpp"

namespace s2lp {
namespace radio {

/**
 * @brief Configuration of the IEEE 802.15.4g packet format
 */
struct Ieee802154gConfig {
    uint16_t preamble_length = 64;  ///< In bits, even, 0 to 2046
    ll::PreamblePattern preamble_pattern = ll::PreamblePattern::kPattern0;
    uint8_t sync_length = 16;            ///< In bits, 0 to 32
    uint32_t sync_pattern = 0x0000904E;  ///< Right aligned
    /// Only kNoCrc, kPoly1021 and kPoly04C011Bb7 are allowed
    ll::CrcMode crc_mode = ll::CrcMode::kPoly04C011Bb7;
    /// Only used for TX, the receiver takes it from the PHR
    bool data_whitening = false;

    std::string Validate() const;
};

/**
 * @brief IEEE 802.15.4g packet format with its 11 bit frame length
 */
class Ieee802154gFormat : public IPacketFormat {
   public:
    using Config = Ieee802154gConfig;

    static constexpr size_t kMaxFrameLength = 2047;

    explicit Ieee802154gFormat(const Ieee802154gConfig& config)
        : config_(config) {}

    PacketFormatType getType() const override {
        return PacketFormatType::kIeee802154g;
    }

    Result UseConfig(ll::Device& device) override;
    Result SetupPacketSend(ll::Device& device, const TxMetaData& tx_meta_data,
                           size_t payload_len) override;
    Result ReadRxMetaData(ll::Device& device, RxMetaData& meta_data) override;

    const Ieee802154gConfig& getConfig() const { return config_; }

   private:
    Ieee802154gConfig config_;
};

}  // namespace radio
}  // namespace s2lp
