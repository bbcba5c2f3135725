#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <vector>

#include "ubt.hpp"
#include "format_error.hpp"
#include "state_format.hpp"

namespace pst::state
{
    constexpr std::size_t STEM_INDEX_COUNT_SIZE = 8;
    constexpr std::size_t STEM_INDEX_ENTRY_SIZE = ubt::STEM_SIZE + 8;

    struct StemIndexEntry
    {
        ubt::Stem stem{};

        // position of the first entry with this stem in the state file
        std::uint64_t offset = 0;
    };

    /**
     * Maps every distinct stem of a sorted state file to the position of its first entry.
     *
     * Encoded as: count (u64 LE) || count x (stem (31) || offset (u64 LE)), strictly ascending by stem.
     */
    class StemIndex
    {
    public:
        StemIndex() = default;

        /**
         * @brief Build from the stems of a sorted entry sequence.
         *
         * `sorted_stems[i]` is the stem of the i-th entry. Stems must be non-decreasing.
         */
        static std::expected<StemIndex, FormatError> fromSortedStems(std::span<const ubt::Stem> sorted_stems);

        /**
         * @brief Regenerate the index of an existing state file.
         *
         * Every entry's stem is recomputed from (address, tree index).
         * With `verify` set, the encoded index is decoded again and checked against the state file.
         */
        static std::expected<StemIndex, FormatError> rebuild(const StateFile & state, bool verify = false);

        static std::expected<StemIndex, FormatError> decode(std::span<const std::uint8_t> bytes);

        static std::expected<StemIndex, FormatError> load(const std::filesystem::path & path);

        std::vector<std::uint8_t> encode() const;

        std::optional<std::uint64_t> findOffset(const ubt::Stem & stem) const;

        const std::vector<StemIndexEntry> & entries() const noexcept;

        std::size_t size() const noexcept;

    private:
        explicit StemIndex(std::vector<StemIndexEntry> entries);

        std::vector<StemIndexEntry> _entries;
    };

    /**
     * @brief Check that `index` describes `state` exactly.
     *
     * Every distinct stem of the state file appears once, pointing at its first entry.
     */
    std::expected<void, FormatError> verifyStemIndex(const StateFile & state, const StemIndex & index);
}
