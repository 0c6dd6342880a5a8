#include "device.hpp"

namespace s2lp {
namespace ll {

Result Device::CheckInterface() const {
    if (interface_ == nullptr) {
        return Result(S2lpErrorCode::kInvalidState,
                      "No register interface attached");
    }
    return Result::Success();
}

Result Device::ReadRegister(uint8_t address, uint8_t& value) {
    return ReadRegisters(address, &value, 1);
}

Result Device::ReadRegisters(uint8_t address, uint8_t* data, size_t len) {
    Result result = CheckInterface();
    if (!result) {
        return result;
    }
    return interface_->ReadRegisters(address, data, len);
}

Result Device::WriteRegister(uint8_t address, uint8_t value) {
    return WriteRegisters(address, &value, 1);
}

Result Device::WriteRegisters(uint8_t address, const uint8_t* data,
                              size_t len) {
    Result result = CheckInterface();
    if (!result) {
        return result;
    }
    return interface_->WriteRegisters(address, data, len);
}

Result Device::ModifyRegister(uint8_t address, uint8_t mask, uint8_t value) {
    uint8_t current = 0;
    Result result = ReadRegister(address, current);
    if (!result) {
        return result;
    }
    uint8_t updated = static_cast<uint8_t>((current & ~mask) | (value & mask));
    return WriteRegister(address, updated);
}

Result Device::ReadField(const Field& field, uint8_t& value) {
    uint8_t raw = 0;
    Result result = ReadRegister(field.address, raw);
    if (!result) {
        return result;
    }
    value = field.Decode(raw);
    return Result::Success();
}

Result Device::WriteField(const Field& field, uint8_t value) {
    return ModifyRegister(field.address, field.mask, field.Encode(value));
}

Result Device::ReadUint16(uint8_t address, uint16_t& value) {
    uint8_t bytes[2] = {0, 0};
    Result result = ReadRegisters(address, bytes, sizeof(bytes));
    if (!result) {
        return result;
    }
    value = static_cast<uint16_t>((bytes[0] << 8) | bytes[1]);
    return Result::Success();
}

Result Device::WriteUint16(uint8_t address, uint16_t value) {
    const uint8_t bytes[2] = {static_cast<uint8_t>(value >> 8),
                              static_cast<uint8_t>(value & 0xFF)};
    return WriteRegisters(address, bytes, sizeof(bytes));
}

Result Device::ReadUint32(uint8_t address, uint32_t& value) {
    uint8_t bytes[4] = {0, 0, 0, 0};
    Result result = ReadRegisters(address, bytes, sizeof(bytes));
    if (!result) {
        return result;
    }
    value = (static_cast<uint32_t>(bytes[0]) << 24) |
            (static_cast<uint32_t>(bytes[1]) << 16) |
            (static_cast<uint32_t>(bytes[2]) << 8) |
            static_cast<uint32_t>(bytes[3]);
    return Result::Success();
}

Result Device::WriteUint32(uint8_t address, uint32_t value) {
    const uint8_t bytes[4] = {static_cast<uint8_t>(value >> 24),
                              static_cast<uint8_t>((value >> 16) & 0xFF),
                              static_cast<uint8_t>((value >> 8) & 0xFF),
                              static_cast<uint8_t>(value & 0xFF)};
    return WriteRegisters(address, bytes, sizeof(bytes));
}

Result Device::Dispatch(Command command) {
    Result result = CheckInterface();
    if (!result) {
        return result;
    }
    return interface_->DispatchCommand(static_cast<uint8_t>(command));
}

Result Device::WriteFifo(const uint8_t* data, size_t len, size_t& written) {
    written = 0;
    Result result = CheckInterface();
    if (!result) {
        return result;
    }
    return interface_->WriteFifo(data, len, written);
}

Result Device::ReadFifo(uint8_t* data, size_t len, size_t& read) {
    read = 0;
    Result result = CheckInterface();
    if (!result) {
        return result;
    }
    return interface_->ReadFifo(data, len, read);
}

}  // namespace ll
}  // namespace s2lp
