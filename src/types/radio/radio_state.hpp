// src/types/radio/radio_state.hpp
#pragma once

namespace s2lp {
namespace radio {

/**
 * @brief Driver states of S2lpRadio
 *
 * Every state except kShutdown allows register access.
 */
enum class RadioState {
    kShutdown,  ///< Chip held in shutdown, configuration lost
    kReady,     ///< Chip configured and idle
    kStandby,   ///< Low power state, configuration retained
    kTx,        ///< Transmission in progress
    kRx         ///< Reception in progress
};

inline const char* RadioStateToString(RadioState state) {
    switch (state) {
        case RadioState::kShutdown:
            return "Shutdown";
        case RadioState::kReady:
            return "Ready";
        case RadioState::kStandby:
            return "Standby";
        case RadioState::kTx:
            return "Tx";
        case RadioState::kRx:
            return "Rx";
        default:
            return "Unknown";
    }
}

/**
 * @brief Whether registers may be accessed in @p state
 */
inline bool IsAddressable(RadioState state) {
    return state != RadioState::kShutdown;
}

}  // namespace radio
}  // namespace s2lp
