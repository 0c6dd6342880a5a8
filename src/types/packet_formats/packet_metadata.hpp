// src/types/packet_formats/packet_metadata.hpp
#pragma once

#include <cstdint>
#include <optional>

namespace s2lp {
namespace radio {

/**
 * @brief Active packet format
 */
enum class PacketFormatType {
    kUninitialized,  ///< No format has been chosen yet
    kBasic,
    kIeee802154g
};

/**
 * @brief Per packet data supplied by the caller when sending
 */
struct TxMetaData {
    /// Destination address, only for formats configured with an address field
    std::optional<uint8_t> destination_address;
};

/**
 * @brief Per packet data read back from the chip after a reception
 */
struct RxMetaData {
    PacketFormatType format = PacketFormatType::kUninitialized;
    /// Destination address field of the received packet, when present
    std::optional<uint8_t> destination_address;
};

}  // namespace radio
}  // namespace s2lp
