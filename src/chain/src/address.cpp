#include <algorithm>
#include <cstring>

#include "address.hpp"
#include "utils.hpp"

namespace pst::chain
{
    Result<Address> parseAddress(const std::string & hex)
    {
        const auto bytes = evmc::from_hex(utils::stripHexPrefix(hex));
        if(!bytes)
        {
            return std::unexpected(Error{
                .kind = Error::Kind::INVALID_INPUT,
                .message = std::format("'{}' is not valid hex", hex)
            });
        }
        return addressFromBytes(std::span<const std::uint8_t>(bytes->data(), bytes->size()));
    }

    Result<Address> addressFromBytes(std::span<const std::uint8_t> bytes)
    {
        if(bytes.size() != sizeof(Address::bytes))
        {
            return std::unexpected(Error{
                .kind = Error::Kind::INVALID_INPUT,
                .message = std::format("address must be 20 bytes, got {}", bytes.size())
            });
        }

        Address address{};
        std::memcpy(address.bytes, bytes.data(), bytes.size());
        return address;
    }

    Result<Word> parseWord(const std::string & hex)
    {
        std::string digits = utils::stripHexPrefix(hex);
        if(digits.size() % 2 != 0)
        {
            digits.insert(digits.begin(), '0');
        }

        const auto bytes = evmc::from_hex(digits);
        if(!bytes)
        {
            return std::unexpected(Error{
                .kind = Error::Kind::INVALID_INPUT,
                .message = std::format("'{}' is not valid hex", hex)
            });
        }

        if(bytes->size() > sizeof(Word::bytes))
        {
            return std::unexpected(Error{
                .kind = Error::Kind::INVALID_INPUT,
                .message = std::format("word must be at most 32 bytes, got {}", bytes->size())
            });
        }

        Word word{};
        std::memcpy(word.bytes + (sizeof(Word::bytes) - bytes->size()), bytes->data(), bytes->size());
        return word;
    }

    Word padAddressWord(const Address & address)
    {
        Word word{};
        std::memcpy(word.bytes + 12, address.bytes, sizeof(address.bytes));
        return word;
    }

    Word encodeUint256Word(const std::uint64_t value)
    {
        Word word{};
        for(std::size_t i = 0; i < 8; ++i)
        {
            word.bytes[31 - i] = static_cast<std::uint8_t>((value >> (8 * i)) & 0xFFu);
        }
        return word;
    }

    std::string toHex(const Address & address)
    {
        return std::string("0x") + evmc::hex(address);
    }

    std::string toHex(const Word & word)
    {
        return std::string("0x") + evmc::hex(word);
    }

    bool isZero(const Word & word)
    {
        return std::ranges::all_of(word.bytes, [](const std::uint8_t b) { return b == 0; });
    }
}
