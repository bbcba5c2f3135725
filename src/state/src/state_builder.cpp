#include "state_builder.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

#include <spdlog/spdlog.h>

#include "file.hpp"
#include "stem_index.hpp"

namespace pst::state
{
    namespace
    {
        std::expected<void, BuildError> _createParentDirectory(const std::filesystem::path & path)
        {
            const std::filesystem::path parent = path.parent_path();
            if(parent.empty())
            {
                return {};
            }

            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if(ec)
            {
                return std::unexpected(BuildError{
                    .kind = BuildError::Kind::IO_ERROR,
                    .message = std::format("cannot create directory {}: {}", parent.string(), ec.message())
                });
            }
            return {};
        }
    }

    OutputPaths OutputPaths::inDirectory(const std::filesystem::path & dir, const bool with_wallet_mapping)
    {
        OutputPaths paths{
            .state_file = dir / STATE_FILE_NAME,
            .stem_index_file = dir / STEM_INDEX_FILE_NAME,
            .wallet_mapping_file = std::nullopt
        };

        if(with_wallet_mapping)
        {
            paths.wallet_mapping_file = dir / WALLET_MAPPING_FILE_NAME;
        }
        return paths;
    }

    StateBuilder::StateBuilder(SnapshotInfo info)
        : _info(std::move(info))
    {
    }

    bool StateBuilder::add(const BalanceRecord & record)
    {
        if(chain::isZero(record.value))
        {
            return false;
        }

        const ubt::TreeIndex tree_index = ubt::computeStorageTreeIndex(record.slot);

        _records.push_back(Record{
            .wallet = record.wallet,
            .entry = StorageEntry{
                .address = _info.contract,
                .tree_index = tree_index,
                .value = record.value
            },
            .stem = ubt::computeStem(_info.contract, tree_index),
            .subindex = ubt::getSubindex(tree_index)
        });
        return true;
    }

    std::size_t StateBuilder::size() const noexcept
    {
        return _records.size();
    }

    bool StateBuilder::empty() const noexcept
    {
        return _records.empty();
    }

    std::vector<StateBuilder::Record> StateBuilder::sortedRecords() const
    {
        std::vector<Record> sorted = _records;
        std::ranges::stable_sort(sorted, [](const Record & a, const Record & b)
        {
            if(a.stem != b.stem)
            {
                return a.stem < b.stem;
            }
            return a.subindex < b.subindex;
        });
        return sorted;
    }

    std::expected<Artifacts, BuildError> StateBuilder::build(const bool with_wallet_mapping) const
    {
        if(_records.empty())
        {
            return std::unexpected(BuildError{
                .kind = BuildError::Kind::EMPTY_RESULT,
                .message = "no non-zero values to write"
            });
        }

        const std::vector<Record> sorted = sortedRecords();

        Artifacts artifacts;
        artifacts.entry_count = sorted.size();

        // state file
        const StateHeader header{
            .version = STATE_VERSION,
            .entry_size = STATE_ENTRY_SIZE,
            .entry_count = static_cast<std::uint64_t>(sorted.size()),
            .block_number = _info.block_number,
            .chain_id = _info.chain_id,
            .block_hash = _info.block_hash
        };

        const auto header_bytes = encodeStateHeader(header);
        artifacts.state_file.reserve(STATE_HEADER_SIZE + sorted.size() * STATE_ENTRY_SIZE);
        artifacts.state_file.insert(artifacts.state_file.end(), header_bytes.begin(), header_bytes.end());

        for(std::size_t i = 0; i < sorted.size(); ++i)
        {
            const std::size_t written = encodeStorageEntry(sorted[i].entry, artifacts.state_file);
            if(written != STATE_ENTRY_SIZE)
            {
                return std::unexpected(BuildError{
                    .kind = BuildError::Kind::ENCODING_INVARIANT,
                    .message = std::format("entry {} encoded to {} bytes, expected {}", i, written, STATE_ENTRY_SIZE)
                });
            }
        }

        if(artifacts.state_file.size() != STATE_HEADER_SIZE + sorted.size() * STATE_ENTRY_SIZE)
        {
            return std::unexpected(BuildError{
                .kind = BuildError::Kind::ENCODING_INVARIANT,
                .message = std::format("state file encoded to {} bytes", artifacts.state_file.size())
            });
        }

        // stem index
        std::vector<ubt::Stem> stems;
        stems.reserve(sorted.size());
        for(const Record & record : sorted)
        {
            stems.push_back(record.stem);
        }

        const auto index_res = StemIndex::fromSortedStems(stems);
        if(!index_res)
        {
            return std::unexpected(BuildError{
                .kind = BuildError::Kind::ENCODING_INVARIANT,
                .message = index_res.error().message
            });
        }
        artifacts.stem_index = index_res->encode();
        artifacts.stem_count = index_res->size();

        // wallet mapping
        if(with_wallet_mapping)
        {
            nlohmann::ordered_json wallets = nlohmann::ordered_json::array();
            for(std::size_t i = 0; i < sorted.size(); ++i)
            {
                wallets.push_back({
                    {"address", chain::toHex(sorted[i].wallet)},
                    {"index", i}
                });
            }

            const nlohmann::ordered_json mapping{
                {"block", _info.block_number},
                {"contract", chain::toHex(_info.contract)},
                {"mapping_slot", _info.mapping_slot},
                {"chain_id", _info.chain_id},
                {"entries", sorted.size()},
                {"wallets", std::move(wallets)}
            };
            artifacts.wallet_mapping = mapping.dump(2);
        }

        return artifacts;
    }

    std::expected<BuildSummary, BuildError> StateBuilder::write(const OutputPaths & paths) const
    {
        auto artifacts_res = build(paths.wallet_mapping_file.has_value());
        if(!artifacts_res)
        {
            return std::unexpected(artifacts_res.error());
        }
        const Artifacts & artifacts = *artifacts_res;

        std::vector<file::PendingFile> pending{
            file::PendingFile{.path = paths.state_file, .content = artifacts.state_file},
            file::PendingFile{.path = paths.stem_index_file, .content = artifacts.stem_index}
        };

        if(paths.wallet_mapping_file && artifacts.wallet_mapping)
        {
            pending.push_back(file::PendingFile{
                .path = *paths.wallet_mapping_file,
                .content = std::span<const std::uint8_t>(
                    reinterpret_cast<const std::uint8_t*>(artifacts.wallet_mapping->data()),
                    artifacts.wallet_mapping->size())
            });
        }

        for(const file::PendingFile & item : pending)
        {
            if(auto res = _createParentDirectory(item.path); !res)
            {
                return std::unexpected(res.error());
            }
        }

        // all artifacts or none: a state file must never sit next to a stale stem index
        if(const auto res = file::writeFilesAtomic(pending); !res)
        {
            return std::unexpected(BuildError{
                .kind = BuildError::Kind::IO_ERROR,
                .message = res.error()
            });
        }

        spdlog::info("Wrote {} entries, {} stems to {}", artifacts.entry_count, artifacts.stem_count, paths.state_file.string());

        return BuildSummary{
            .entry_count = artifacts.entry_count,
            .stem_count = artifacts.stem_count,
            .paths = paths
        };
    }
}
