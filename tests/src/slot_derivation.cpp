#include "unit-tests.hpp"

#include <array>

using namespace pst;
using namespace pst::tests;

TEST_F(UnitTest, Chain_MappingSlot_KnownAnswer)
{
    const chain::StorageSlot slot = chain::computeMappingSlot(makeAddress(1), 9);
    EXPECT_EQ(chain::toHex(slot), "0x92e85d02570a8092d09a6e3a57665bc3815a2699a4074001bf1ccabf660f5a36");
}

TEST_F(UnitTest, Chain_MappingSlot_IsDeterministicAndDependsOnInputs)
{
    const chain::Address wallet = makeAddress(7);

    EXPECT_EQ(chain::computeMappingSlot(wallet, 9), chain::computeMappingSlot(wallet, 9));
    EXPECT_NE(chain::computeMappingSlot(wallet, 9), chain::computeMappingSlot(wallet, 10));
    EXPECT_NE(chain::computeMappingSlot(wallet, 9), chain::computeMappingSlot(makeAddress(8), 9));
}

TEST_F(UnitTest, Chain_MappingSlot_FromBytesMatchesAddressOverload)
{
    const chain::Address wallet = makeAddress(1);
    const auto slot_res = chain::computeMappingSlot(std::span<const std::uint8_t>(wallet.bytes, sizeof(wallet.bytes)), 9);

    ASSERT_TRUE(slot_res.has_value());
    EXPECT_EQ(*slot_res, chain::computeMappingSlot(wallet, 9));
}

TEST_F(UnitTest, Chain_MappingSlot_RejectsWrongWalletLength)
{
    const std::array<std::uint8_t, 19> short_wallet{};
    const auto slot_res = chain::computeMappingSlot(std::span<const std::uint8_t>(short_wallet), 9);

    ASSERT_FALSE(slot_res.has_value());
    EXPECT_EQ(slot_res.error().kind, chain::Error::Kind::INVALID_INPUT);
}

TEST_F(UnitTest, Chain_ParseAddress_AcceptsPrefixAndMixedCase)
{
    const auto with_prefix = chain::parseAddress("0x1c7D4B196Cb0C7B01d743Fbc6116a902379C7238");
    const auto without_prefix = chain::parseAddress("1C7D4B196CB0C7B01D743FBC6116A902379C7238");

    ASSERT_TRUE(with_prefix.has_value());
    ASSERT_TRUE(without_prefix.has_value());
    EXPECT_EQ(*with_prefix, *without_prefix);
    EXPECT_EQ(chain::toHex(*with_prefix), "0x1c7d4b196cb0c7b01d743fbc6116a902379c7238");
}

TEST_F(UnitTest, Chain_ParseAddress_RejectsMalformedInput)
{
    for(const std::string & input : {"", "0x", "0x1234", "0x1c7D4B196Cb0C7B01d743Fbc6116a902379C723800", "0xzz7D4B196Cb0C7B01d743Fbc6116a902379C7238"})
    {
        const auto res = chain::parseAddress(input);
        ASSERT_FALSE(res.has_value()) << input;
        EXPECT_EQ(res.error().kind, chain::Error::Kind::INVALID_INPUT) << input;
    }
}

TEST_F(UnitTest, Chain_ParseWord_LeftPadsShortValues)
{
    const auto word_res = chain::parseWord("0x7b");
    ASSERT_TRUE(word_res.has_value());
    EXPECT_EQ(*word_res, makeWord(123));

    const auto odd_res = chain::parseWord("0x123");
    ASSERT_TRUE(odd_res.has_value());
    EXPECT_EQ(*odd_res, makeWord(0x123));

    const auto empty_res = chain::parseWord("0x");
    ASSERT_TRUE(empty_res.has_value());
    EXPECT_TRUE(chain::isZero(*empty_res));
}

TEST_F(UnitTest, Chain_ParseWord_RejectsMoreThan32Bytes)
{
    const auto word_res = chain::parseWord("0x" + std::string(66, 'f'));
    ASSERT_FALSE(word_res.has_value());
    EXPECT_EQ(word_res.error().kind, chain::Error::Kind::INVALID_INPUT);
}
