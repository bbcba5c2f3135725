#pragma once

#include <expected>
#include <optional>

#include "address.hpp"
#include "ubt.hpp"
#include "state_format.hpp"
#include "stem_index.hpp"

namespace pst::state
{
    /**
     * @brief Find the entry of `contract` at `tree_index`.
     *
     * The stem is located with a binary search over the stem index, then the
     * stem group is scanned for the subindex.
     */
    std::optional<StorageEntry> findEntry(
        const StateFile & state,
        const StemIndex & index,
        const chain::Address & contract,
        const ubt::TreeIndex & tree_index);

    /**
     * @brief Position of the entry in `state.entries`, see findEntry.
     */
    std::optional<std::size_t> findEntryPosition(
        const StateFile & state,
        const StemIndex & index,
        const chain::Address & contract,
        const ubt::TreeIndex & tree_index);

    /**
     * @brief Check the header count and that tree keys never decrease.
     */
    std::expected<void, FormatError> verifyStateFile(const StateFile & state);
}
