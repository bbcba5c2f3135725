#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>
#include <vector>

#include "address.hpp"
#include "ubt.hpp"
#include "format_error.hpp"

/**
 * State file layout (all integers little-endian):
 *
 *      offset  size  field
 *      0       4     magic "PIR2"
 *      4       2     version
 *      6       2     entry size
 *      8       8     entry count
 *      16      8     block number
 *      24      8     chain id
 *      32      32    block hash (zero if unknown)
 *      64      ...   entries, sorted by tree key (stem || subindex)
 *
 * Entry: contract address (20) || tree index (32) || value (32)
 */
namespace pst::state
{
    inline constexpr std::array<std::uint8_t, 4> STATE_MAGIC{'P', 'I', 'R', '2'};
    constexpr std::uint16_t STATE_VERSION = 1;
    constexpr std::size_t STATE_HEADER_SIZE = 64;
    constexpr std::size_t STATE_ENTRY_SIZE = 84;

    struct StateHeader
    {
        std::uint16_t version = STATE_VERSION;
        std::uint16_t entry_size = STATE_ENTRY_SIZE;
        std::uint64_t entry_count = 0;
        std::uint64_t block_number = 0;
        std::uint64_t chain_id = 0;
        chain::Word block_hash{};
    };

    struct StorageEntry
    {
        chain::Address address{};
        ubt::TreeIndex tree_index{};
        chain::Word value{};
    };

    std::array<std::uint8_t, STATE_HEADER_SIZE> encodeStateHeader(const StateHeader & header);

    /**
     * @brief Decode and validate the fixed-size header.
     *
     * Only the size and the magic are checked here. Version and entry size are reported as found.
     */
    std::expected<StateHeader, FormatError> decodeStateHeader(std::span<const std::uint8_t> bytes);

    /**
     * @brief Append the encoded entry to `out`.
     *
     * @return number of bytes appended
     */
    std::size_t encodeStorageEntry(const StorageEntry & entry, std::vector<std::uint8_t> & out);

    StorageEntry decodeStorageEntry(const std::uint8_t* data);

    /**
     * @brief stem(address, tree_index) || subindex(tree_index)
     */
    ubt::TreeKey entryTreeKey(const StorageEntry & entry);

    struct StateFile
    {
        StateHeader header;
        std::vector<StorageEntry> entries;

        static std::expected<StateFile, FormatError> decode(std::span<const std::uint8_t> bytes);

        static std::expected<StateFile, FormatError> load(const std::filesystem::path & path);
    };
}
