#include "lookup.hpp"

#include <format>

namespace pst::state
{
    std::optional<std::size_t> findEntryPosition(
        const StateFile & state,
        const StemIndex & index,
        const chain::Address & contract,
        const ubt::TreeIndex & tree_index)
    {
        const ubt::Stem stem = ubt::computeStem(contract, tree_index);
        const auto offset = index.findOffset(stem);
        if(!offset || *offset >= state.entries.size())
        {
            return std::nullopt;
        }

        const ubt::StemPos stem_pos = ubt::getStemPos(tree_index);
        const std::uint8_t subindex = ubt::getSubindex(tree_index);

        // entries of one stem share (address, stem_pos)
        for(std::size_t i = static_cast<std::size_t>(*offset); i < state.entries.size(); ++i)
        {
            const StorageEntry & entry = state.entries[i];
            if(entry.address != contract || ubt::getStemPos(entry.tree_index) != stem_pos)
            {
                break;
            }

            if(ubt::getSubindex(entry.tree_index) == subindex)
            {
                return i;
            }
        }
        return std::nullopt;
    }

    std::optional<StorageEntry> findEntry(
        const StateFile & state,
        const StemIndex & index,
        const chain::Address & contract,
        const ubt::TreeIndex & tree_index)
    {
        const auto position = findEntryPosition(state, index, contract, tree_index);
        if(!position)
        {
            return std::nullopt;
        }
        return state.entries[*position];
    }

    std::expected<void, FormatError> verifyStateFile(const StateFile & state)
    {
        if(state.header.entry_count != state.entries.size())
        {
            return std::unexpected(FormatError{
                .kind = FormatError::Kind::SIZE_MISMATCH,
                .message = std::format("header declares {} entries, {} present", state.header.entry_count, state.entries.size())
            });
        }

        std::optional<ubt::TreeKey> prev;
        for(std::size_t i = 0; i < state.entries.size(); ++i)
        {
            const ubt::TreeKey key = entryTreeKey(state.entries[i]);
            if(prev && key < *prev)
            {
                return std::unexpected(FormatError{
                    .kind = FormatError::Kind::UNSORTED,
                    .message = std::format("entry {} has a smaller tree key than entry {}", i, i - 1)
                });
            }
            prev = key;
        }
        return {};
    }
}
