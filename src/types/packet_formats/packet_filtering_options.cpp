#include "packet_filtering_options.hpp"

namespace s2lp {
namespace radio {

Result PacketFilteringOptions::WriteToDevice(ll::Device& device) const {
    const uint8_t mask = ll::field::kCrcFlt.mask |
                         ll::field::kDestVsBroadcastAddr.mask |
                         ll::field::kDestVsMulticastAddr.mask |
                         ll::field::kDestVsSourceAddr.mask;
    const uint8_t value =
        ll::field::kCrcFlt.Encode(discard_bad_crc ? 1 : 0) |
        ll::field::kDestVsBroadcastAddr.Encode(broadcast_address ? 1 : 0) |
        ll::field::kDestVsMulticastAddr.Encode(multicast_address ? 1 : 0) |
        ll::field::kDestVsSourceAddr.Encode(source_address ? 1 : 0);

    Result result = device.ModifyRegister(ll::reg::kPcktFltOptions, mask, value);
    if (!result) {
        return result;
    }

    // GOALS2, GOALS1 and GOALS0 are consecutive
    const uint8_t goals[3] = {broadcast_address.value_or(0),
                              multicast_address.value_or(0),
                              source_address.value_or(0)};
    result = device.WriteRegisters(ll::reg::kPcktFltGoals2, goals, sizeof(goals));
    if (!result) {
        return result;
    }

    return device.WriteFlag(ll::field::kAutoPcktFlt, true);
}

}  // namespace radio
}  // namespace s2lp
