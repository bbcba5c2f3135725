#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <vector>

#include "address.hpp"
#include "storage_slot.hpp"
#include "ubt.hpp"
#include "state_format.hpp"

namespace pst::state
{
    inline constexpr const char * STATE_FILE_NAME = "state.bin";
    inline constexpr const char * STEM_INDEX_FILE_NAME = "stem-index.bin";
    inline constexpr const char * WALLET_MAPPING_FILE_NAME = "wallet-mapping.json";

    struct BuildError
    {
        enum class Kind : std::uint8_t
        {
            UNKNOWN = 0,
            EMPTY_RESULT,
            ENCODING_INVARIANT,
            IO_ERROR
        } kind = Kind::UNKNOWN;

        std::string message;
    };

    /**
     * @brief One fetched mapping value: balances[wallet] stored at `slot`.
     */
    struct BalanceRecord
    {
        chain::Address wallet{};
        chain::StorageSlot slot{};
        chain::Word value{};
    };

    struct SnapshotInfo
    {
        chain::Address contract{};
        std::uint64_t mapping_slot = 0;
        std::uint64_t block_number = 0;
        std::uint64_t chain_id = 0;
        chain::Word block_hash{};
    };

    struct OutputPaths
    {
        std::filesystem::path state_file;
        std::filesystem::path stem_index_file;
        std::optional<std::filesystem::path> wallet_mapping_file;

        static OutputPaths inDirectory(const std::filesystem::path & dir, bool with_wallet_mapping);
    };

    /**
     * @brief Encoded artifacts, ready to be written.
     */
    struct Artifacts
    {
        std::vector<std::uint8_t> state_file;
        std::vector<std::uint8_t> stem_index;
        std::optional<std::string> wallet_mapping;

        std::size_t entry_count = 0;
        std::size_t stem_count = 0;
    };

    struct BuildSummary
    {
        std::size_t entry_count = 0;
        std::size_t stem_count = 0;
        OutputPaths paths;
    };

    /**
     * Collects balance records and produces the state file, the stem index and the wallet mapping.
     *
     * Records are ordered by tree key (stem || subindex). Records with equal tree keys keep
     * their insertion order.
     */
    class StateBuilder
    {
    public:
        explicit StateBuilder(SnapshotInfo info);

        /**
         * @brief Derive the tree coordinates of `record` and queue it.
         *
         * @return false if the value is zero and the record was dropped
         */
        bool add(const BalanceRecord & record);

        std::size_t size() const noexcept;

        bool empty() const noexcept;

        /**
         * @brief Sort and encode everything in memory.
         */
        std::expected<Artifacts, BuildError> build(bool with_wallet_mapping) const;

        /**
         * @brief build() followed by one atomic write per artifact.
         *
         * Nothing is written when there are no records.
         */
        std::expected<BuildSummary, BuildError> write(const OutputPaths & paths) const;

    private:
        struct Record
        {
            chain::Address wallet{};
            StorageEntry entry;
            ubt::Stem stem{};
            std::uint8_t subindex = 0;
        };

        std::vector<Record> sortedRecords() const;

        SnapshotInfo _info;
        std::vector<Record> _records;
    };
}

template <>
struct std::formatter<pst::state::BuildError::Kind> : std::formatter<std::string>
{
    auto format(const pst::state::BuildError::Kind & err, format_context & ctx) const
    {
        switch(err)
        {
            case pst::state::BuildError::Kind::EMPTY_RESULT:
                return formatter<string>::format("Empty result", ctx);
            case pst::state::BuildError::Kind::ENCODING_INVARIANT:
                return formatter<string>::format("Encoding invariant violated", ctx);
            case pst::state::BuildError::Kind::IO_ERROR:
                return formatter<string>::format("I/O error", ctx);
            default:
                return formatter<string>::format("Unknown", ctx);
        }
    }
};
