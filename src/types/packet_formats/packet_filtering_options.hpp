// src/types/packet_formats/packet_filtering_options.hpp
#pragma once

#include <cstdint>
#include <optional>

#include "hardware/s2lp/device.hpp"
#include "types/error_codes/result.hpp"

namespace s2lp {
namespace radio {

/**
 * @brief Packet filters of the receiver
 *
 * Every address that is set enables the matching destination address
 * comparison. With no address set every packet is accepted.
 */
struct PacketFilteringOptions {
    /// Drop packets with a bad CRC, ignored when no CRC is used
    bool discard_bad_crc = true;
    /// Address of this device
    std::optional<uint8_t> source_address;
    /// Multicast group this device is part of
    std::optional<uint8_t> multicast_address;
    /// Broadcast address
    std::optional<uint8_t> broadcast_address;

    bool HasAddressFilter() const {
        return source_address || multicast_address || broadcast_address;
    }

    /**
     * @brief Program the filter options and goals and enable the filter
     */
    Result WriteToDevice(ll::Device& device) const;
};

}  // namespace radio
}  // namespace s2lp
