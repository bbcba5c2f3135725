#include "unit-tests.hpp"

using namespace pst;
using namespace pst::tests;

namespace
{
    const chain::Address USDC = *chain::parseAddress(extract::DEFAULT_CONTRACT);

    ubt::Stem makeStem(const std::uint8_t first)
    {
        ubt::Stem stem{};
        stem[0] = first;
        return stem;
    }

    /**
     * @brief Sorted state file holding balances for wallets 1..count.
     */
    state::StateFile makeStateFile(const std::uint8_t count)
    {
        state::StateBuilder builder(state::SnapshotInfo{
            .contract = USDC,
            .mapping_slot = 9,
            .block_number = 100,
            .chain_id = 11155111,
            .block_hash = {}
        });

        for(std::uint8_t i = 1; i <= count; ++i)
        {
            const chain::Address wallet = makeAddress(i);
            builder.add(state::BalanceRecord{
                .wallet = wallet,
                .slot = chain::computeMappingSlot(wallet, 9),
                .value = makeWord(i)
            });
        }

        // account header leaves share one stem
        builder.add(state::BalanceRecord{.wallet = makeAddress(0xF0), .slot = makeWord(0), .value = makeWord(1)});
        builder.add(state::BalanceRecord{.wallet = makeAddress(0xF1), .slot = makeWord(1), .value = makeWord(1)});

        const auto artifacts = builder.build(false);
        EXPECT_TRUE(artifacts.has_value());

        auto state_res = state::StateFile::decode(artifacts->state_file);
        EXPECT_TRUE(state_res.has_value());
        return *state_res;
    }
}

TEST_F(UnitTest, State_StemIndex_KeepsFirstPositionOfEachStem)
{
    const std::vector<ubt::Stem> stems{makeStem(1), makeStem(1), makeStem(2), makeStem(5), makeStem(5), makeStem(5)};

    const auto index = state::StemIndex::fromSortedStems(stems);
    ASSERT_TRUE(index.has_value());
    ASSERT_EQ(index->size(), 3);
    EXPECT_EQ(index->findOffset(makeStem(1)), 0);
    EXPECT_EQ(index->findOffset(makeStem(2)), 2);
    EXPECT_EQ(index->findOffset(makeStem(5)), 3);
    EXPECT_FALSE(index->findOffset(makeStem(3)).has_value());
}

TEST_F(UnitTest, State_StemIndex_RejectsUnsortedStems)
{
    const std::vector<ubt::Stem> stems{makeStem(2), makeStem(1)};

    const auto index = state::StemIndex::fromSortedStems(stems);
    ASSERT_FALSE(index.has_value());
    EXPECT_EQ(index.error().kind, state::FormatError::Kind::UNSORTED);
}

TEST_F(UnitTest, State_StemIndex_EncodingLayout)
{
    const std::vector<ubt::Stem> stems{makeStem(1), makeStem(9)};
    const auto index = state::StemIndex::fromSortedStems(stems);
    ASSERT_TRUE(index.has_value());

    const std::vector<std::uint8_t> bytes = index->encode();
    ASSERT_EQ(bytes.size(), 8 + 2 * 39);
    EXPECT_EQ(bytes[0], 2);
    EXPECT_EQ(bytes[8], 1);
    EXPECT_EQ(bytes[8 + 31], 0);
    EXPECT_EQ(bytes[8 + 39], 9);
    EXPECT_EQ(bytes[8 + 39 + 31], 1);

    const auto decoded = state::StemIndex::decode(bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->findOffset(makeStem(9)), 1);
}

TEST_F(UnitTest, State_StemIndex_DecodeRejectsBadInput)
{
    const auto index = state::StemIndex::fromSortedStems(std::vector<ubt::Stem>{makeStem(1), makeStem(2)});
    ASSERT_TRUE(index.has_value());
    std::vector<std::uint8_t> bytes = index->encode();

    const auto empty = state::StemIndex::decode(std::span<const std::uint8_t>(bytes.data(), 4));
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().kind, state::FormatError::Kind::TRUNCATED);

    const auto truncated = state::StemIndex::decode(std::span<const std::uint8_t>(bytes.data(), bytes.size() - 1));
    ASSERT_FALSE(truncated.has_value());
    EXPECT_EQ(truncated.error().kind, state::FormatError::Kind::TRUNCATED);

    std::vector<std::uint8_t> overflow = bytes;
    std::fill(overflow.begin(), overflow.begin() + 8, 0xFF);
    const auto overflow_res = state::StemIndex::decode(overflow);
    ASSERT_FALSE(overflow_res.has_value());
    EXPECT_EQ(overflow_res.error().kind, state::FormatError::Kind::COUNT_OVERFLOW);

    // duplicate stem
    std::vector<std::uint8_t> duplicate = bytes;
    duplicate[8 + 39] = 1;
    const auto duplicate_res = state::StemIndex::decode(duplicate);
    ASSERT_FALSE(duplicate_res.has_value());
    EXPECT_EQ(duplicate_res.error().kind, state::FormatError::Kind::UNSORTED);
}

TEST_F(UnitTest, State_StemIndex_RebuildMatchesBuilderOutput)
{
    const state::StateFile state = makeStateFile(5);
    ASSERT_EQ(state.entries.size(), 7);

    const auto rebuilt = state::StemIndex::rebuild(state, true);
    ASSERT_TRUE(rebuilt.has_value());

    // five wallet stems plus the shared account stem
    EXPECT_EQ(rebuilt->size(), 6);
    EXPECT_TRUE(state::verifyStemIndex(state, *rebuilt).has_value());

    for(const state::StemIndexEntry & entry : rebuilt->entries())
    {
        ASSERT_LT(entry.offset, state.entries.size());
        const state::StorageEntry & first = state.entries[entry.offset];
        EXPECT_EQ(ubt::computeStem(first.address, first.tree_index), entry.stem);
    }
}

TEST_F(UnitTest, State_StemIndex_RebuildRejectsUnsortedStateFile)
{
    state::StateFile state = makeStateFile(3);
    std::reverse(state.entries.begin(), state.entries.end());

    const auto rebuilt = state::StemIndex::rebuild(state, false);
    ASSERT_FALSE(rebuilt.has_value());
    EXPECT_EQ(rebuilt.error().kind, state::FormatError::Kind::UNSORTED);
}

TEST_F(UnitTest, State_StemIndex_VerifyDetectsWrongOffset)
{
    const state::StateFile state = makeStateFile(3);
    const auto index = state::StemIndex::rebuild(state, false);
    ASSERT_TRUE(index.has_value());

    std::vector<std::uint8_t> bytes = index->encode();
    // bump the offset of the last stem
    bytes[bytes.size() - 8] += 1;

    const auto corrupted = state::StemIndex::decode(bytes);
    ASSERT_TRUE(corrupted.has_value());

    const auto verify_res = state::verifyStemIndex(state, *corrupted);
    ASSERT_FALSE(verify_res.has_value());
    EXPECT_EQ(verify_res.error().kind, state::FormatError::Kind::INDEX_MISMATCH);
}

TEST_F(UnitTest, State_Lookup_FindsEveryEntry)
{
    const state::StateFile state = makeStateFile(5);
    const auto index = state::StemIndex::rebuild(state, false);
    ASSERT_TRUE(index.has_value());

    for(std::uint8_t i = 1; i <= 5; ++i)
    {
        const ubt::TreeIndex tree_index = ubt::computeStorageTreeIndex(chain::computeMappingSlot(makeAddress(i), 9));
        const auto entry = state::findEntry(state, *index, USDC, tree_index);
        ASSERT_TRUE(entry.has_value()) << static_cast<int>(i);
        EXPECT_EQ(entry->value, makeWord(i));
    }

    // both header slots live in the account stem
    const auto slot1 = state::findEntry(state, *index, USDC, ubt::computeStorageTreeIndex(makeWord(1)));
    ASSERT_TRUE(slot1.has_value());
    EXPECT_EQ(ubt::getSubindex(slot1->tree_index), 65);
}

TEST_F(UnitTest, State_Lookup_MissesAbsentKeys)
{
    const state::StateFile state = makeStateFile(2);
    const auto index = state::StemIndex::rebuild(state, false);
    ASSERT_TRUE(index.has_value());

    const ubt::TreeIndex absent_wallet = ubt::computeStorageTreeIndex(chain::computeMappingSlot(makeAddress(3), 9));
    EXPECT_FALSE(state::findEntry(state, *index, USDC, absent_wallet).has_value());

    // stem present, subindex absent
    EXPECT_FALSE(state::findEntry(state, *index, USDC, ubt::computeStorageTreeIndex(makeWord(2))).has_value());

    // other contract
    const ubt::TreeIndex present = ubt::computeStorageTreeIndex(chain::computeMappingSlot(makeAddress(1), 9));
    EXPECT_FALSE(state::findEntry(state, *index, makeAddress(0x99), present).has_value());
}

TEST_F(UnitTest, State_Verify_DetectsUnsortedEntries)
{
    state::StateFile state = makeStateFile(4);
    EXPECT_TRUE(state::verifyStateFile(state).has_value());

    std::swap(state.entries.front(), state.entries.back());
    const auto verify_res = state::verifyStateFile(state);
    ASSERT_FALSE(verify_res.has_value());
    EXPECT_EQ(verify_res.error().kind, state::FormatError::Kind::UNSORTED);
}
