#pragma once

#include <cstdint>
#include <span>
#include <string>

#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>

#include "chain_error.hpp"

namespace pst::chain
{
    using Address = evmc::address;
    using Word = evmc::bytes32;

    /**
     * @brief Parse a 20-byte address from hex ("0x" prefix optional, any case).
     *
     * Anything that does not decode to exactly 20 bytes is INVALID_INPUT.
     */
    Result<Address> parseAddress(const std::string & hex);

    Result<Address> addressFromBytes(std::span<const std::uint8_t> bytes);

    /**
     * @brief Parse a 32-byte word from hex. Shorter input is left-padded with zeros.
     */
    Result<Word> parseWord(const std::string & hex);

    /**
     * @brief ABI encoding of an address: 12 zero bytes followed by the 20 address bytes.
     */
    Word padAddressWord(const Address & address);

    /**
     * @brief ABI encoding of an unsigned integer as a 32-byte big-endian word.
     */
    Word encodeUint256Word(std::uint64_t value);

    std::string toHex(const Address & address);

    std::string toHex(const Word & word);

    bool isZero(const Word & word);
}
