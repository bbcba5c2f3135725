#include "extract.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

#include <absl/container/flat_hash_set.h>

#include <asio.hpp>

#include <spdlog/spdlog.h>

#include "storage_slot.hpp"
#include "utils.hpp"
#include "lookup.hpp"
#include "stem_index.hpp"

namespace pst::extract
{
    namespace
    {
        enum class Outcome : std::uint8_t
        {
            PENDING = 0,
            VALUE,
            ZERO,
            FAILED
        };

        struct WalletResult
        {
            Outcome outcome = Outcome::PENDING;
            state::BalanceRecord record;
        };

        WalletResult _fetchWallet(
            const rpc::EthClient & client,
            const ExtractConfig & cfg,
            const std::string & block_tag,
            const chain::Address & wallet)
        {
            const chain::StorageSlot slot = chain::computeMappingSlot(wallet, cfg.mapping_slot);

            const auto value_res = client.getStorageAt(cfg.contract, slot, block_tag);
            if(!value_res)
            {
                spdlog::warn(std::format("{}: {} ({})", chain::toHex(wallet), value_res.error().kind, value_res.error().message));
                return WalletResult{.outcome = Outcome::FAILED};
            }

            if(chain::isZero(*value_res))
            {
                spdlog::debug("{}: zero", chain::toHex(wallet));
                return WalletResult{.outcome = Outcome::ZERO};
            }

            spdlog::info("{}: {}", chain::toHex(wallet), chain::toHex(*value_res));
            return WalletResult{
                .outcome = Outcome::VALUE,
                .record = state::BalanceRecord{
                    .wallet = wallet,
                    .slot = slot,
                    .value = *value_res
                }
            };
        }

        RunError::Kind _runErrorKind(const state::BuildError::Kind kind)
        {
            switch(kind)
            {
                case state::BuildError::Kind::EMPTY_RESULT:
                    return RunError::Kind::EMPTY_RESULT;
                case state::BuildError::Kind::ENCODING_INVARIANT:
                    return RunError::Kind::ENCODING_INVARIANT;
                case state::BuildError::Kind::IO_ERROR:
                    return RunError::Kind::IO_ERROR;
                default:
                    return RunError::Kind::UNKNOWN;
            }
        }

        std::expected<void, RunError> _verifyArtifacts(const state::OutputPaths & paths)
        {
            const auto state_res = state::StateFile::load(paths.state_file);
            if(!state_res)
            {
                return std::unexpected(RunError{
                    .kind = RunError::Kind::VERIFY_FAILED,
                    .message = std::format("{}: {}", state_res.error().kind, state_res.error().message)
                });
            }

            const auto index_res = state::StemIndex::load(paths.stem_index_file);
            if(!index_res)
            {
                return std::unexpected(RunError{
                    .kind = RunError::Kind::VERIFY_FAILED,
                    .message = std::format("{}: {}", index_res.error().kind, index_res.error().message)
                });
            }

            if(const auto res = state::verifyStateFile(*state_res); !res)
            {
                return std::unexpected(RunError{
                    .kind = RunError::Kind::VERIFY_FAILED,
                    .message = std::format("{}: {}", res.error().kind, res.error().message)
                });
            }

            if(const auto res = state::verifyStemIndex(*state_res, *index_res); !res)
            {
                return std::unexpected(RunError{
                    .kind = RunError::Kind::VERIFY_FAILED,
                    .message = std::format("{}: {}", res.error().kind, res.error().message)
                });
            }

            spdlog::info("Verified {} entries and {} stems", state_res->entries.size(), index_res->size());
            return {};
        }
    }

    chain::Result<std::vector<chain::Address>> parseWallets(const std::vector<std::string> & wallets)
    {
        std::vector<chain::Address> out;
        out.reserve(wallets.size());
        for(const std::string & wallet : wallets)
        {
            auto address_res = chain::parseAddress(wallet);
            if(!address_res)
            {
                return std::unexpected(address_res.error());
            }
            out.push_back(*address_res);
        }
        return out;
    }

    FetchResult fetchBalances(
        const rpc::EthClient & client,
        const ExtractConfig & cfg,
        const std::uint64_t block_number,
        const std::vector<chain::Address> & wallets)
    {
        FetchResult result;
        result.stats.requested = wallets.size();

        std::vector<chain::Address> unique;
        unique.reserve(wallets.size());
        absl::flat_hash_set<chain::Address> seen;
        for(const chain::Address & wallet : wallets)
        {
            if(seen.insert(wallet).second)
            {
                unique.push_back(wallet);
            }
            else
            {
                ++result.stats.duplicates;
            }
        }

        if(result.stats.duplicates > 0)
        {
            spdlog::info("Skipping {} duplicate wallets", result.stats.duplicates);
        }

        const std::string block_tag = utils::toHexQuantity(block_number);
        std::vector<WalletResult> results(unique.size());

        if(cfg.concurrency > 1 && unique.size() > 1)
        {
            std::mutex results_mutex;
            asio::thread_pool pool(std::min(cfg.concurrency, unique.size()));

            for(std::size_t i = 0; i < unique.size(); ++i)
            {
                asio::post(pool, [&, i]()
                {
                    WalletResult wallet_result = _fetchWallet(client, cfg, block_tag, unique[i]);
                    std::lock_guard guard{results_mutex};
                    results[i] = std::move(wallet_result);
                });
            }
            pool.join();
        }
        else
        {
            for(std::size_t i = 0; i < unique.size(); ++i)
            {
                results[i] = _fetchWallet(client, cfg, block_tag, unique[i]);
            }
        }

        for(WalletResult & wallet_result : results)
        {
            switch(wallet_result.outcome)
            {
                case Outcome::VALUE:
                    ++result.stats.fetched;
                    result.records.push_back(std::move(wallet_result.record));
                    break;
                case Outcome::ZERO:
                    ++result.stats.zero;
                    break;
                default:
                    ++result.stats.failed;
                    break;
            }
        }

        spdlog::info("Fetched {} non-zero, {} zero, {} failed out of {} wallets",
            result.stats.fetched, result.stats.zero, result.stats.failed, unique.size());
        return result;
    }

    std::expected<RunSummary, RunError> run(
        const ExtractConfig & cfg,
        const rpc::EthClient & client,
        const std::vector<chain::Address> & wallets)
    {
        RunSummary summary;

        if(cfg.check_chain_id)
        {
            const auto chain_id_res = client.chainId();
            if(!chain_id_res)
            {
                return std::unexpected(RunError{
                    .kind = RunError::Kind::RPC_FAILED,
                    .message = std::format("eth_chainId: {}", chain_id_res.error().message)
                });
            }

            if(*chain_id_res != cfg.chain_id)
            {
                return std::unexpected(RunError{
                    .kind = RunError::Kind::CHAIN_MISMATCH,
                    .message = std::format("endpoint reports chain id {}, expected {}", *chain_id_res, cfg.chain_id)
                });
            }
        }

        if(cfg.block)
        {
            summary.block_number = *cfg.block;
        }
        else
        {
            const auto block_res = client.blockNumber();
            if(!block_res)
            {
                return std::unexpected(RunError{
                    .kind = RunError::Kind::RPC_FAILED,
                    .message = std::format("eth_blockNumber: {}", block_res.error().message)
                });
            }
            summary.block_number = *block_res;
        }
        spdlog::info("Snapshot block {}", summary.block_number);

        if(cfg.fetch_block_hash)
        {
            const auto hash_res = client.getBlockHash(summary.block_number);
            if(!hash_res)
            {
                return std::unexpected(RunError{
                    .kind = RunError::Kind::RPC_FAILED,
                    .message = std::format("eth_getBlockByNumber: {}", hash_res.error().message)
                });
            }
            summary.block_hash = *hash_res;
            spdlog::info("Block hash {}", chain::toHex(summary.block_hash));
        }

        FetchResult fetched = fetchBalances(client, cfg, summary.block_number, wallets);
        summary.stats = fetched.stats;

        state::StateBuilder builder(state::SnapshotInfo{
            .contract = cfg.contract,
            .mapping_slot = cfg.mapping_slot,
            .block_number = summary.block_number,
            .chain_id = cfg.chain_id,
            .block_hash = summary.block_hash
        });

        for(const state::BalanceRecord & record : fetched.records)
        {
            if(!builder.add(record))
            {
                spdlog::debug("{}: zero value dropped", chain::toHex(record.wallet));
            }
        }

        const state::OutputPaths paths = state::OutputPaths::inDirectory(cfg.output_dir, cfg.wallet_mapping);
        auto build_res = builder.write(paths);
        if(!build_res)
        {
            return std::unexpected(RunError{
                .kind = _runErrorKind(build_res.error().kind),
                .message = build_res.error().message
            });
        }
        summary.build = std::move(*build_res);

        if(cfg.verify)
        {
            if(auto verify_res = _verifyArtifacts(paths); !verify_res)
            {
                return std::unexpected(verify_res.error());
            }
        }

        return summary;
    }
}
