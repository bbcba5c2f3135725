#include "crypto.hpp"

#include <algorithm>

#include <ethash/keccak.hpp>
#include <blake3.h>

namespace pst::crypto
{
    Hash256 keccak256(std::span<const std::uint8_t> data)
    {
        const ethash::hash256 digest = ethash::keccak256(data.data(), data.size());

        Hash256 out{};
        std::copy(std::begin(digest.bytes), std::end(digest.bytes), out.begin());
        return out;
    }

    Hash256 blake3(std::span<const std::uint8_t> data)
    {
        blake3_hasher hasher;
        blake3_hasher_init(&hasher);
        blake3_hasher_update(&hasher, data.data(), data.size());

        Hash256 out{};
        blake3_hasher_finalize(&hasher, out.data(), out.size());
        return out;
    }
}
