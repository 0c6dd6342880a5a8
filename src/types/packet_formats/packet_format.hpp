// src/types/packet_formats/packet_format.hpp
#pragma once

#include <cstddef>
#include <cstdint>

#include "hardware/s2lp/device.hpp"
#include "types/error_codes/result.hpp"
#include "types/packet_formats/packet_metadata.hpp"

namespace s2lp {
namespace radio {

/**
 * @brief Framing used by the packet handler
 *
 * A format owns its configuration. It is applied once when the radio is
 * ready and then consulted for every packet sent and received.
 */
class IPacketFormat {
   public:
    virtual ~IPacketFormat() = default;

    virtual PacketFormatType getType() const = 0;

    /**
     * @brief Program the format specific registers
     *
     * @return Result kBadConfig when the configuration cannot be used
     */
    virtual Result UseConfig(ll::Device& device) = 0;

    /**
     * @brief Check a packet against the frame layout and program its length
     * and address registers
     *
     * No register is written when the checks fail.
     *
     * @param device Register access
     * @param tx_meta_data Per packet data supplied by the caller
     * @param payload_len Number of payload bytes
     * @return Result kBufferTooLarge or kBadConfig when the packet does not fit
     */
    virtual Result SetupPacketSend(ll::Device& device,
                                   const TxMetaData& tx_meta_data,
                                   size_t payload_len) = 0;

    /**
     * @brief Read the format specific fields of the last received packet
     */
    virtual Result ReadRxMetaData(ll::Device& device,
                                  RxMetaData& meta_data) = 0;
};

/**
 * @brief Write the preamble and sync word registers shared by all formats
 *
 * @param device Register access
 * @param preamble_length Preamble length in bits, even, 0 to 2046
 * @param sync_length Sync word length in bits, 0 to 32
 * @param sync_pattern Sync word, right aligned
 * @return Result kInvalidArgument for an odd preamble length
 */
Result WritePreambleAndSync(ll::Device& device, uint16_t preamble_length,
                            uint8_t sync_length, uint32_t sync_pattern);

constexpr uint16_t kMaxPreambleLength = 2046;
constexpr uint8_t kMaxSyncLength = 32;

}  // namespace radio
}  // namespace s2lp
