#include "packet_format.hpp"

namespace s2lp {
namespace radio {

Result WritePreambleAndSync(ll::Device& device, uint16_t preamble_length,
                            uint8_t sync_length, uint32_t sync_pattern) {
    // The chip counts the preamble in 01 or 10 pairs
    if (preamble_length % 2 != 0) {
        return Result::InvalidArgument("Odd preamble length");
    }
    const uint16_t preamble_pairs = preamble_length / 2;

    const uint8_t pckt_ctrl[2] = {
        static_cast<uint8_t>(
            ll::field::kSyncLen.Encode(sync_length) |
            ll::field::kPreambleLenHigh.Encode(
                static_cast<uint8_t>(preamble_pairs >> 8))),
        static_cast<uint8_t>(preamble_pairs & 0xFF)};
    Result result =
        device.WriteRegisters(ll::reg::kPcktCtrl6, pckt_ctrl, sizeof(pckt_ctrl));
    if (!result) {
        return result;
    }

    return device.WriteUint32(ll::reg::kSync3, sync_pattern);
}

}  // namespace radio
}  // namespace s2lp
