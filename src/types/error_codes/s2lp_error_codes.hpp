// src/types/error_codes/s2lp_error_codes.hpp
#pragma once

#include <string>
#include <system_error>

namespace s2lp {

/**
 * @brief Error codes reported by the driver
 */
enum class S2lpErrorCode {
    kSuccess = 0,       ///< Operation completed successfully
    kBusError,          ///< SPI transaction failed
    kShutdownPinError,  ///< Shutdown pin could not be driven
    kGpioError,         ///< Interrupt pin could not be read or awaited
    kInitError,         ///< Chip did not identify as an S2-LP after reset
    kBadConfig,         ///< Configuration rejected, message holds the reason
    kBufferTooLarge,    ///< Payload does not fit the current frame layout
    kBufferTooSmall,    ///< Caller buffer cannot hold the requested data
    kBadState,          ///< Chip reported an unexpected state
    kRcoLockError,      ///< RC oscillator calibration failed
    kInvalidState,      ///< Operation not legal in the current radio state
    kNotFinished,       ///< Finish called before the operation resolved
    kInvalidArgument,   ///< Argument out of its documented range
    kTimeout            ///< Chip state never converged while polling
};

/**
 * @brief Error category for driver errors
 */
class S2lpErrorCategory : public std::error_category {
   public:
    /**
     * @brief Get the singleton instance of the error category
     */
    static const S2lpErrorCategory& GetInstance() {
        static S2lpErrorCategory instance;
        return instance;
    }

    const char* name() const noexcept override { return "s2lp_error"; }

    std::string message(int condition) const override {
        switch (static_cast<S2lpErrorCode>(condition)) {
            case S2lpErrorCode::kSuccess:
                return "Success";
            case S2lpErrorCode::kBusError:
                return "SPI transaction failed";
            case S2lpErrorCode::kShutdownPinError:
                return "Shutdown pin error";
            case S2lpErrorCode::kGpioError:
                return "Interrupt pin error";
            case S2lpErrorCode::kInitError:
                return "Chip identification failed";
            case S2lpErrorCode::kBadConfig:
                return "Bad configuration";
            case S2lpErrorCode::kBufferTooLarge:
                return "Buffer too large for the packet format";
            case S2lpErrorCode::kBufferTooSmall:
                return "Buffer too small";
            case S2lpErrorCode::kBadState:
                return "Chip is in a bad state";
            case S2lpErrorCode::kRcoLockError:
                return "RCO calibration lock error";
            case S2lpErrorCode::kInvalidState:
                return "Radio in invalid state for operation";
            case S2lpErrorCode::kNotFinished:
                return "Operation has not finished yet";
            case S2lpErrorCode::kInvalidArgument:
                return "Invalid argument";
            case S2lpErrorCode::kTimeout:
                return "Operation timed out";
            default:
                return "Unknown error";
        }
    }

   private:
    S2lpErrorCategory() = default;  // Private constructor for singleton
};

inline std::error_code make_error_code(S2lpErrorCode code) {
    return {static_cast<int>(code), S2lpErrorCategory::GetInstance()};
}

}  // namespace s2lp

namespace std {
template <>
struct is_error_code_enum<s2lp::S2lpErrorCode> : true_type {};
}  // namespace std
