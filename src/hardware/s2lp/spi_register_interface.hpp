// src/hardware/s2lp/spi_register_interface.hpp
#pragma once

#include <memory>

#include "hardware/hal.hpp"
#include "hardware/s2lp/register_interface.hpp"

namespace s2lp {
namespace ll {

/**
 * @brief Register interface over the S2-LP SPI protocol.
 *
 * Every transaction starts with a header byte selecting the access type
 * followed by the register address or command code.
 */
class SpiRegisterInterface : public IRegisterInterface {
   public:
    static constexpr uint8_t kWriteHeader = 0x00;
    static constexpr uint8_t kReadHeader = 0x01;
    static constexpr uint8_t kCommandHeader = 0x80;

    /**
     * @brief Construct over an SPI device
     *
     * @param spi The SPI device, exclusively owned
     * @param fifo_poll_attempts How often the FIFO status is polled for
     *        space or data before a FIFO access gives up
     */
    explicit SpiRegisterInterface(std::unique_ptr<hal::ISpiDevice> spi,
                                  uint32_t fifo_poll_attempts = 1000);

    Result ReadRegisters(uint8_t address, uint8_t* data, size_t len) override;
    Result WriteRegisters(uint8_t address, const uint8_t* data,
                          size_t len) override;
    Result DispatchCommand(uint8_t command) override;
    Result WriteFifo(const uint8_t* data, size_t len, size_t& written) override;
    Result ReadFifo(uint8_t* data, size_t len, size_t& read) override;

    hal::ISpiDevice& getSpi() { return *spi_; }

   private:
    std::unique_ptr<hal::ISpiDevice> spi_;
    uint32_t fifo_poll_attempts_;
};

}  // namespace ll
}  // namespace s2lp
