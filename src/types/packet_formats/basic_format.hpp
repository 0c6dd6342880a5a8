// src/types/packet_formats/basic_format.hpp
#pragma once

#include <cstdint>
#include <string>

#include "hardware/s2lp/registers.hpp"
#include "types/packet_formats/packet_filtering_options.hpp"
#include "types/packet_formats/packet_format.hpp"

namespace s2lp {
namespace radio {

/**
 * @brief Configuration of the basic packet format
 */
struct BasicConfig {
    uint16_t preamble_length = 64;  ///< In bits, even, 0 to 2046
    ll::PreamblePattern preamble_pattern = ll::PreamblePattern::kPattern0;
    uint8_t sync_length = 32;                 ///< In bits, 0 to 32
    uint32_t sync_pattern = 0x88888888;       ///< Right aligned
    bool include_address = false;             ///< Destination address byte
    ll::LenWid packet_length_encoding = ll::LenWid::kBytes1;
    uint8_t postamble_length = 0;             ///< In pairs of 01
    ll::CrcMode crc_mode = ll::CrcMode::kPoly1021;
    PacketFilteringOptions packet_filter;

    /**
     * @brief Describe every invalid field
     * @return std::string Empty when the configuration is valid
     */
    std::string Validate() const;
};

/**
 * @brief Basic packet format
 *
 * preamble | sync | length | [address] | payload | [crc] | [postamble]
 */
class BasicFormat : public IPacketFormat {
   public:
    using Config = BasicConfig;

    explicit BasicFormat(const BasicConfig& config) : config_(config) {}

    PacketFormatType getType() const override {
        return PacketFormatType::kBasic;
    }

    Result UseConfig(ll::Device& device) override;
    Result SetupPacketSend(ll::Device& device, const TxMetaData& tx_meta_data,
                           size_t payload_len) override;
    Result ReadRxMetaData(ll::Device& device, RxMetaData& meta_data) override;

    const BasicConfig& getConfig() const { return config_; }

   private:
    BasicConfig config_;
};

}  // namespace radio
}  // namespace s2lp
