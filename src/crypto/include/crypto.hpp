#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace pst::crypto
{
    using Hash256 = std::array<std::uint8_t, 32>;

    /**
     * @brief Keccak-256 (the pre-standard SHA-3 variant used by the EVM).
     */
    Hash256 keccak256(std::span<const std::uint8_t> data);

    /**
     * @brief BLAKE3 with the default 32-byte output.
     */
    Hash256 blake3(std::span<const std::uint8_t> data);
}
