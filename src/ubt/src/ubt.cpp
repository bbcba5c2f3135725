#include "ubt.hpp"

#include <algorithm>
#include <cstring>

#include "crypto.hpp"

namespace pst::ubt
{
    TreeIndex treeIndexFromPosition(const intx::uint256 & position)
    {
        return intx::be::store<TreeIndex>(position);
    }

    TreeIndex computeStorageTreeIndex(const chain::StorageSlot & slot)
    {
        const auto slot_value = intx::be::load<intx::uint256>(slot);

        if(slot_value < intx::uint256{HEADER_STORAGE_OFFSET})
        {
            return treeIndexFromPosition(intx::uint256{HEADER_STORAGE_OFFSET} + slot_value);
        }

        // uint256 addition wraps modulo 2^256
        return treeIndexFromPosition(slot_value + MAIN_STORAGE_OFFSET);
    }

    TreeIndex computeBasicDataTreeIndex()
    {
        return treeIndexFromPosition(BASIC_DATA_LEAF_KEY);
    }

    TreeIndex computeCodeHashTreeIndex()
    {
        return treeIndexFromPosition(CODE_HASH_LEAF_KEY);
    }

    TreeIndex computeCodeChunkTreeIndex(const std::uint64_t chunk_id)
    {
        return treeIndexFromPosition(intx::uint256{CODE_OFFSET} + chunk_id);
    }

    std::uint8_t getSubindex(const TreeIndex & tree_index)
    {
        return tree_index.bytes[STEM_SIZE];
    }

    StemPos getStemPos(const TreeIndex & tree_index)
    {
        StemPos stem_pos{};
        std::copy_n(tree_index.bytes, STEM_SIZE, stem_pos.begin());
        return stem_pos;
    }

    Stem computeStem(const chain::Address & address, const StemPos & stem_pos)
    {
        const chain::Word address_word = chain::padAddressWord(address);

        std::array<std::uint8_t, 32 + STEM_SIZE> preimage{};
        std::memcpy(preimage.data(), address_word.bytes, 32);
        std::memcpy(preimage.data() + 32, stem_pos.data(), STEM_SIZE);

        const crypto::Hash256 digest = crypto::blake3(preimage);

        Stem stem{};
        std::copy_n(digest.begin(), STEM_SIZE, stem.begin());
        return stem;
    }

    Stem computeStem(const chain::Address & address, const TreeIndex & tree_index)
    {
        return computeStem(address, getStemPos(tree_index));
    }

    TreeKey computeTreeKey(const chain::Address & address, const TreeIndex & tree_index)
    {
        return makeTreeKey(computeStem(address, tree_index), getSubindex(tree_index));
    }

    TreeKey computeStorageTreeKey(const chain::Address & address, const chain::StorageSlot & slot)
    {
        return computeTreeKey(address, computeStorageTreeIndex(slot));
    }

    TreeKey makeTreeKey(const Stem & stem, const std::uint8_t subindex)
    {
        TreeKey key{};
        std::copy(stem.begin(), stem.end(), key.begin());
        key[STEM_SIZE] = subindex;
        return key;
    }
}
