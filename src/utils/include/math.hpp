#pragma once

#include <cstddef>
#include <cstdint>

namespace pst::utils
{
    void writeUint16LE(std::uint8_t* out, std::uint16_t value);
    void writeUint64LE(std::uint8_t* out, std::uint64_t value);

    std::uint16_t readUint16LE(const std::uint8_t* data);
    std::uint64_t readUint64LE(const std::uint8_t* data);
}
