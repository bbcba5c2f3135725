#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <format>
#include <functional>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "address.hpp"
#include "storage_slot.hpp"

namespace pst::rpc
{
    struct FetchError
    {
        enum class Kind : std::uint8_t
        {
            UNKNOWN = 0,
            INVALID_CONFIG,
            TRANSPORT,
            TIMEOUT,
            RPC_ERROR,
            RPC_MALFORMED
        } kind = Kind::UNKNOWN;

        std::string message;
    };

    /**
     * @brief Sends one JSON-RPC request and returns the parsed response document.
     *
     * Implementations report transport level failures only. Interpretation of
     * `error` / `result` members is done by EthClient.
     */
    using RpcTransport = std::function<std::expected<nlohmann::json, FetchError>(
        const std::string & rpc_url,
        const nlohmann::json & request,
        std::chrono::milliseconds timeout)>;

    /**
     * @brief Transport that runs `curl` as a subprocess with `--max-time`.
     */
    std::expected<nlohmann::json, FetchError> curlTransport(
        const std::string & rpc_url,
        const nlohmann::json & request,
        std::chrono::milliseconds timeout);

    struct ClientConfig
    {
        std::string rpc_url;
        std::chrono::milliseconds timeout{10'000};

        // empty means curlTransport
        RpcTransport transport = {};
    };

    class EthClient
    {
    public:
        explicit EthClient(ClientConfig cfg);

        std::expected<std::uint64_t, FetchError> blockNumber() const;

        /**
         * @brief eth_getStorageAt
         *
         * Values shorter than 32 bytes are left-padded. Values longer than 32 bytes are RPC_MALFORMED.
         */
        std::expected<chain::Word, FetchError> getStorageAt(
            const chain::Address & contract,
            const chain::StorageSlot & slot,
            const std::string & block_tag) const;

        std::expected<chain::Word, FetchError> getBlockHash(std::uint64_t block_number) const;

        std::expected<std::uint64_t, FetchError> chainId() const;

    private:
        std::expected<nlohmann::json, FetchError> rpc(const std::string & method, nlohmann::json params) const;

        ClientConfig _cfg;
    };
}

template <>
struct std::formatter<pst::rpc::FetchError::Kind> : std::formatter<std::string>
{
    auto format(const pst::rpc::FetchError::Kind & err, format_context & ctx) const
    {
        switch(err)
        {
            case pst::rpc::FetchError::Kind::INVALID_CONFIG:
                return formatter<string>::format("Invalid config", ctx);
            case pst::rpc::FetchError::Kind::TRANSPORT:
                return formatter<string>::format("Transport error", ctx);
            case pst::rpc::FetchError::Kind::TIMEOUT:
                return formatter<string>::format("Timeout", ctx);
            case pst::rpc::FetchError::Kind::RPC_ERROR:
                return formatter<string>::format("RPC error", ctx);
            case pst::rpc::FetchError::Kind::RPC_MALFORMED:
                return formatter<string>::format("Malformed RPC response", ctx);
            default:
                return formatter<string>::format("Unknown", ctx);
        }
    }
};
