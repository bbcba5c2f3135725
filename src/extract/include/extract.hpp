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
#include "chain_error.hpp"
#include "eth_client.hpp"
#include "state_builder.hpp"

namespace pst::extract
{
    // Circle USDC on Sepolia
    inline constexpr const char * DEFAULT_CONTRACT = "0x1c7D4B196Cb0C7B01d743Fbc6116a902379C7238";
    constexpr std::uint64_t DEFAULT_MAPPING_SLOT = 9;
    constexpr std::uint64_t DEFAULT_CHAIN_ID = 11155111;

    struct ExtractConfig
    {
        chain::Address contract{};
        std::uint64_t mapping_slot = DEFAULT_MAPPING_SLOT;
        std::uint64_t chain_id = DEFAULT_CHAIN_ID;

        // latest block when empty
        std::optional<std::uint64_t> block;

        bool fetch_block_hash = false;
        bool check_chain_id = false;

        std::size_t concurrency = 1;

        std::filesystem::path output_dir;
        bool wallet_mapping = true;
        bool verify = false;
    };

    struct FetchStats
    {
        std::size_t requested = 0;
        std::size_t duplicates = 0;
        std::size_t fetched = 0;
        std::size_t zero = 0;
        std::size_t failed = 0;
    };

    struct FetchResult
    {
        // in input order, zero values dropped
        std::vector<state::BalanceRecord> records;
        FetchStats stats;
    };

    struct RunError
    {
        enum class Kind : std::uint8_t
        {
            UNKNOWN = 0,
            RPC_FAILED,
            CHAIN_MISMATCH,
            EMPTY_RESULT,
            ENCODING_INVARIANT,
            IO_ERROR,
            VERIFY_FAILED
        } kind = Kind::UNKNOWN;

        std::string message;
    };

    struct RunSummary
    {
        std::uint64_t block_number = 0;
        chain::Word block_hash{};
        FetchStats stats;
        state::BuildSummary build;
    };

    /**
     * @brief Parse wallet addresses, failing on the first malformed one.
     */
    chain::Result<std::vector<chain::Address>> parseWallets(const std::vector<std::string> & wallets);

    /**
     * @brief Fetch balances[wallet] for every wallet at `block_number`.
     *
     * Duplicate wallets are fetched once. Failed fetches are logged and skipped.
     * With `cfg.concurrency > 1` fetches run on a thread pool; the result is the same as a sequential run.
     */
    FetchResult fetchBalances(
        const rpc::EthClient & client,
        const ExtractConfig & cfg,
        std::uint64_t block_number,
        const std::vector<chain::Address> & wallets);

    /**
     * @brief Resolve the block, fetch the balances and write the artifacts into `cfg.output_dir`.
     */
    std::expected<RunSummary, RunError> run(
        const ExtractConfig & cfg,
        const rpc::EthClient & client,
        const std::vector<chain::Address> & wallets);
}

template <>
struct std::formatter<pst::extract::RunError::Kind> : std::formatter<std::string>
{
    auto format(const pst::extract::RunError::Kind & err, format_context & ctx) const
    {
        switch(err)
        {
            case pst::extract::RunError::Kind::RPC_FAILED:
                return formatter<string>::format("RPC failed", ctx);
            case pst::extract::RunError::Kind::CHAIN_MISMATCH:
                return formatter<string>::format("Chain id mismatch", ctx);
            case pst::extract::RunError::Kind::EMPTY_RESULT:
                return formatter<string>::format("Empty result", ctx);
            case pst::extract::RunError::Kind::ENCODING_INVARIANT:
                return formatter<string>::format("Encoding invariant violated", ctx);
            case pst::extract::RunError::Kind::IO_ERROR:
                return formatter<string>::format("I/O error", ctx);
            case pst::extract::RunError::Kind::VERIFY_FAILED:
                return formatter<string>::format("Verification failed", ctx);
            default:
                return formatter<string>::format("Unknown", ctx);
        }
    }
};
