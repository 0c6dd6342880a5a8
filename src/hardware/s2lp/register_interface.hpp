// src/hardware/s2lp/register_interface.hpp
#pragma once

#include <cstddef>
#include <cstdint>

#include "types/error_codes/result.hpp"

namespace s2lp {
namespace ll {

/**
 * @brief Logical access to the chip registers, commands and FIFO.
 */
class IRegisterInterface {
   public:
    virtual ~IRegisterInterface() = default;

    /**
     * @brief Read @p len consecutive registers starting at @p address
     */
    virtual Result ReadRegisters(uint8_t address, uint8_t* data,
                                 size_t len) = 0;

    /**
     * @brief Write @p len consecutive registers starting at @p address
     */
    virtual Result WriteRegisters(uint8_t address, const uint8_t* data,
                                  size_t len) = 0;

    /**
     * @brief Send a command strobe
     */
    virtual Result DispatchCommand(uint8_t command) = 0;

    /**
     * @brief Put as many bytes into the TX FIFO as currently fit.
     *
     * @param data Bytes to queue
     * @param len Number of bytes available in @p data
     * @param written Set to the number of bytes the FIFO accepted
     */
    virtual Result WriteFifo(const uint8_t* data, size_t len,
                             size_t& written) = 0;

    /**
     * @brief Take as many bytes out of the RX FIFO as are available.
     *
     * @param data Destination buffer
     * @param len Capacity of @p data
     * @param read Set to the number of bytes taken
     */
    virtual Result ReadFifo(uint8_t* data, size_t len, size_t& read) = 0;
};

}  // namespace ll
}  // namespace s2lp
