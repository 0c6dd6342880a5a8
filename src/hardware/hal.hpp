// src/hardware/hal.hpp
#pragma once

#include <cstddef>
#include <cstdint>

#include "types/error_codes/result.hpp"

namespace s2lp {
namespace hal {

/**
 * @brief SPI device with its own chip select.
 *
 * Every call is one chip-select framed transaction: the two header bytes are
 * clocked out first, followed by the data phase.
 */
class ISpiDevice {
   public:
    virtual ~ISpiDevice() = default;

    /**
     * @brief Send the header followed by @p len bytes from @p data.
     *
     * @param header The two header bytes
     * @param data Bytes to write after the header, may be null when len is 0
     * @param len Number of data bytes
     * @return Result kBusError on failure
     */
    virtual Result Write(const uint8_t header[2], const uint8_t* data,
                         size_t len) = 0;

    /**
     * @brief Send the header and then clock in @p len bytes into @p data.
     *
     * @param header The two header bytes
     * @param data Destination of the read bytes
     * @param len Number of bytes to read
     * @return Result kBusError on failure
     */
    virtual Result Read(const uint8_t header[2], uint8_t* data, size_t len) = 0;
};

/**
 * @brief Digital output, used for the shutdown (SDN) line.
 */
class IOutputPin {
   public:
    virtual ~IOutputPin() = default;

    virtual Result SetHigh() = 0;
    virtual Result SetLow() = 0;
};

/**
 * @brief Digital input that can block until a level is reached.
 *
 * Waits must not lose an edge that happens between two calls: if the line is
 * already at the awaited level the call returns immediately.
 */
class IInterruptPin {
   public:
    virtual ~IInterruptPin() = default;

    virtual Result WaitForHigh() = 0;
    virtual Result WaitForLow() = 0;

    /**
     * @brief Wait for the line to go low, giving up after @p timeout_ms.
     *
     * @param timeout_ms Maximum time to wait
     * @param timed_out Set to true when the timeout resolved first
     * @return Result kGpioError when the pin could not be read
     */
    virtual Result WaitForLow(uint32_t timeout_ms, bool& timed_out) = 0;
};

/**
 * @brief Delay and time source.
 */
class IDelay {
   public:
    virtual ~IDelay() = default;

    virtual void DelayUs(uint32_t us) = 0;
    virtual void DelayMs(uint32_t ms) = 0;

    /**
     * @brief Get the current time in milliseconds.
     */
    virtual uint32_t millis() = 0;
};

}  // namespace hal
}  // namespace s2lp
