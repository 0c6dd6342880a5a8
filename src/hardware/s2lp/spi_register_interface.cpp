#include "spi_register_interface.hpp"

#include <algorithm>

#include "hardware/s2lp/registers.hpp"

namespace s2lp {
namespace ll {

SpiRegisterInterface::SpiRegisterInterface(
    std::unique_ptr<hal::ISpiDevice> spi, uint32_t fifo_poll_attempts)
    : spi_(std::move(spi)), fifo_poll_attempts_(fifo_poll_attempts) {}

Result SpiRegisterInterface::ReadRegisters(uint8_t address, uint8_t* data,
                                           size_t len) {
    const uint8_t header[2] = {kReadHeader, address};
    return spi_->Read(header, data, len);
}

Result SpiRegisterInterface::WriteRegisters(uint8_t address,
                                            const uint8_t* data, size_t len) {
    const uint8_t header[2] = {kWriteHeader, address};
    return spi_->Write(header, data, len);
}

Result SpiRegisterInterface::DispatchCommand(uint8_t command) {
    const uint8_t header[2] = {kCommandHeader, command};
    return spi_->Write(header, nullptr, 0);
}

Result SpiRegisterInterface::WriteFifo(const uint8_t* data, size_t len,
                                       size_t& written) {
    written = 0;
    if (len == 0) {
        return Result::Success();
    }

    for (uint32_t attempt = 0; attempt < fifo_poll_attempts_; attempt++) {
        uint8_t queued = 0;
        Result result = ReadRegisters(reg::kTxFifoStatus, &queued, 1);
        if (!result) {
            return result;
        }

        size_t space = queued < kFifoSize ? kFifoSize - queued : 0;
        if (space == 0) {
            continue;
        }

        size_t chunk = std::min(len, space);
        result = WriteRegisters(reg::kFifo, data, chunk);
        if (!result) {
            return result;
        }
        written = chunk;
        return Result::Success();
    }

    return Result::Success();
}

Result SpiRegisterInterface::ReadFifo(uint8_t* data, size_t len, size_t& read) {
    read = 0;
    if (len == 0) {
        return Result::Success();
    }

    for (uint32_t attempt = 0; attempt < fifo_poll_attempts_; attempt++) {
        uint8_t available = 0;
        Result result = ReadRegisters(reg::kRxFifoStatus, &available, 1);
        if (!result) {
            return result;
        }

        if (available == 0) {
            continue;
        }

        size_t chunk = std::min(len, static_cast<size_t>(available));
        result = ReadRegisters(reg::kFifo, data, chunk);
        if (!result) {
            return result;
        }
        read = chunk;
        return Result::Success();
    }

    return Result::Success();
}

}  // namespace ll
}  // namespace s2lp
