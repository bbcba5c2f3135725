#include "storage_slot.hpp"

#include <array>
#include <cstring>

#include "crypto.hpp"

namespace pst::chain
{
    StorageSlot computeMappingSlot(const Address & holder, const std::uint64_t mapping_slot)
    {
        const Word key_word = padAddressWord(holder);
        const Word slot_word = encodeUint256Word(mapping_slot);

        std::array<std::uint8_t, 64> preimage{};
        std::memcpy(preimage.data(), key_word.bytes, 32);
        std::memcpy(preimage.data() + 32, slot_word.bytes, 32);

        const crypto::Hash256 digest = crypto::keccak256(preimage);

        StorageSlot slot{};
        std::memcpy(slot.bytes, digest.data(), digest.size());
        return slot;
    }

    Result<StorageSlot> computeMappingSlot(std::span<const std::uint8_t> holder, const std::uint64_t mapping_slot)
    {
        const auto address_res = addressFromBytes(holder);
        if(!address_res)
        {
            return std::unexpected(address_res.error());
        }
        return computeMappingSlot(*address_res, mapping_slot);
    }
}
