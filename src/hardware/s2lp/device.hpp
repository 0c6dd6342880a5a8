// src/hardware/s2lp/device.hpp
#pragma once

#include <cstddef>
#include <cstdint>

#include "hardware/s2lp/register_interface.hpp"
#include "hardware/s2lp/registers.hpp"
#include "types/error_codes/result.hpp"

namespace s2lp {
namespace ll {

/**
 * @brief Typed access to the S2-LP register map.
 *
 * Thin layer over an IRegisterInterface. Multi-byte registers are big endian
 * on the chip, the most significant byte lives at the lowest address. The
 * interface is not owned; without one every access fails with kInvalidState.
 */
class Device {
   public:
    Device() = default;
    explicit Device(IRegisterInterface* interface) : interface_(interface) {}

    void setInterface(IRegisterInterface* interface) { interface_ = interface; }
    IRegisterInterface* getInterface() const { return interface_; }
    bool HasInterface() const { return interface_ != nullptr; }

    Result ReadRegister(uint8_t address, uint8_t& value);
    Result ReadRegisters(uint8_t address, uint8_t* data, size_t len);
    Result WriteRegister(uint8_t address, uint8_t value);
    Result WriteRegisters(uint8_t address, const uint8_t* data, size_t len);

    /**
     * @brief Read-modify-write of the bits selected by @p mask
     */
    Result ModifyRegister(uint8_t address, uint8_t mask, uint8_t value);

    Result ReadField(const Field& field, uint8_t& value);

    /**
     * @brief Read-modify-write of a single field, other bits are kept
     */
    Result WriteField(const Field& field, uint8_t value);

    Result WriteFlag(const Field& field, bool enabled) {
        return WriteField(field, enabled ? 1 : 0);
    }

    Result ReadUint16(uint8_t address, uint16_t& value);
    Result WriteUint16(uint8_t address, uint16_t value);
    Result ReadUint32(uint8_t address, uint32_t& value);
    Result WriteUint32(uint8_t address, uint32_t value);

    /**
     * @brief Read the IRQ status word. Reading clears the pending flags.
     */
    Result ReadIrqStatus(uint32_t& status) {
        return ReadUint32(reg::kIrqStatus3, status);
    }

    Result WriteIrqMask(uint32_t mask) {
        return WriteUint32(reg::kIrqMask3, mask);
    }

    /**
     * @brief Read the raw 7-bit main controller state from MC_STATE0
     */
    Result ReadChipState(uint8_t& state) { return ReadField(field::kState, state); }

    Result Dispatch(Command command);

    Result WriteFifo(const uint8_t* data, size_t len, size_t& written);
    Result ReadFifo(uint8_t* data, size_t len, size_t& read);

   private:
    IRegisterInterface* interface_ = nullptr;

    Result CheckInterface() const;
};

}  // namespace ll
}  // namespace s2lp
