#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include <intx/intx.hpp>

#include "address.hpp"
#include "storage_slot.hpp"

/**
 * Unified binary tree (EIP-7864) key derivation.
 *
 * Every leaf of an account lives at a 32-byte tree index: the high 31 bytes
 * (stem position) select a group of 256 leaves, the low byte (subindex) the
 * leaf inside the group. The stem of a group is
 *
 *      blake3(pad32(address) || stem_pos)[0:31]
 *
 * Account stem (stem_pos == 0) layout:
 *      subindex 0          basic data (nonce, balance, code size)
 *      subindex 1          code hash
 *      subindex 64..127    storage slots 0..63
 *      subindex 128..255   code chunks 0..127
 *
 * Storage slots >= 64 are placed at MAIN_STORAGE_OFFSET + slot.
 */
namespace pst::ubt
{
    constexpr std::size_t STEM_SIZE = 31;
    constexpr std::size_t STEM_SUBTREE_WIDTH = 256;

    constexpr std::uint8_t BASIC_DATA_LEAF_KEY = 0;
    constexpr std::uint8_t CODE_HASH_LEAF_KEY = 1;
    constexpr std::uint64_t HEADER_STORAGE_OFFSET = 64;
    constexpr std::uint64_t CODE_OFFSET = 128;

    // 256^31
    inline constexpr intx::uint256 MAIN_STORAGE_OFFSET = intx::uint256{1} << 248;

    using TreeIndex = evmc::bytes32;
    using StemPos = std::array<std::uint8_t, STEM_SIZE>;
    using Stem = std::array<std::uint8_t, STEM_SIZE>;
    using TreeKey = std::array<std::uint8_t, 32>;

    /**
     * @brief Tree index of a leaf at absolute position `position`.
     *
     * stem_pos = position / 256, subindex = position % 256.
     */
    TreeIndex treeIndexFromPosition(const intx::uint256 & position);

    /**
     * @brief Tree index of storage slot `slot` of an account.
     *
     * Slots below HEADER_STORAGE_OFFSET go to the account stem at subindex 64 + slot.
     * Any other slot is placed at slot + MAIN_STORAGE_OFFSET, computed modulo 2^256.
     */
    TreeIndex computeStorageTreeIndex(const chain::StorageSlot & slot);

    TreeIndex computeBasicDataTreeIndex();

    TreeIndex computeCodeHashTreeIndex();

    TreeIndex computeCodeChunkTreeIndex(std::uint64_t chunk_id);

    std::uint8_t getSubindex(const TreeIndex & tree_index);

    StemPos getStemPos(const TreeIndex & tree_index);

    Stem computeStem(const chain::Address & address, const StemPos & stem_pos);

    Stem computeStem(const chain::Address & address, const TreeIndex & tree_index);

    /**
     * @brief stem || subindex
     */
    TreeKey computeTreeKey(const chain::Address & address, const TreeIndex & tree_index);

    TreeKey computeStorageTreeKey(const chain::Address & address, const chain::StorageSlot & slot);

    TreeKey makeTreeKey(const Stem & stem, std::uint8_t subindex);
}
