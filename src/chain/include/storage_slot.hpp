#pragma once

#include <cstdint>
#include <span>

#include "address.hpp"

namespace pst::chain
{
    using StorageSlot = Word;

    /**
     * @brief Storage key of `mapping(address => ...)` entry for `holder`.
     *
     * Solidity layout: keccak256(pad32(holder) || uint256(mapping_slot)).
     */
    StorageSlot computeMappingSlot(const Address & holder, std::uint64_t mapping_slot);

    /**
     * @brief Same as above for raw input; fails with INVALID_INPUT unless `holder` is exactly 20 bytes.
     */
    Result<StorageSlot> computeMappingSlot(std::span<const std::uint8_t> holder, std::uint64_t mapping_slot);
}
