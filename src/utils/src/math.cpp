#include "math.hpp"

namespace pst::utils
{
    void writeUint16LE(std::uint8_t* out, const std::uint16_t value)
    {
        out[0] = static_cast<std::uint8_t>(value & 0xFFu);
        out[1] = static_cast<std::uint8_t>((value >> 8) & 0xFFu);
    }

    void writeUint64LE(std::uint8_t* out, const std::uint64_t value)
    {
        for(std::size_t i = 0; i < 8; ++i)
        {
            out[i] = static_cast<std::uint8_t>((value >> (8 * i)) & 0xFFu);
        }
    }

    std::uint16_t readUint16LE(const std::uint8_t* data)
    {
        return static_cast<std::uint16_t>(data[0] | (static_cast<std::uint16_t>(data[1]) << 8));
    }

    std::uint64_t readUint64LE(const std::uint8_t* data)
    {
        std::uint64_t value = 0;
        for(std::size_t i = 0; i < 8; ++i)
        {
            value |= static_cast<std::uint64_t>(data[i]) << (8 * i);
        }
        return value;
    }
}
