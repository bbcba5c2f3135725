#include "eth_client.hpp"

#include <format>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include <spdlog/spdlog.h>

#include "native.h"
#include "utils.hpp"

namespace pst::rpc
{
    using json = nlohmann::json;

    namespace
    {
        // curl: "Operation timeout"
        constexpr int CURL_EXIT_TIMEOUT = 28;

        // invalid UTF-8 from the endpoint is replaced instead of throwing
        std::string _dump(const json & value)
        {
            return value.dump(-1, ' ', false, json::error_handler_t::replace);
        }

        std::expected<std::uint64_t, FetchError> _quantityResult(const std::string & method, const json & result)
        {
            if(!result.is_string())
            {
                return std::unexpected(FetchError{
                    .kind = FetchError::Kind::RPC_MALFORMED,
                    .message = std::format("RPC '{}' result is not a string", method)
                });
            }

            const auto value = utils::parseHexQuantity(result.get<std::string>());
            if(!value)
            {
                return std::unexpected(FetchError{
                    .kind = FetchError::Kind::RPC_MALFORMED,
                    .message = std::format("RPC '{}' returned invalid quantity {}", method, _dump(result))
                });
            }
            return *value;
        }

        std::expected<chain::Word, FetchError> _wordResult(const std::string & method, const json & result)
        {
            if(!result.is_string())
            {
                return std::unexpected(FetchError{
                    .kind = FetchError::Kind::RPC_MALFORMED,
                    .message = std::format("RPC '{}' result is not a string", method)
                });
            }

            const auto word_res = chain::parseWord(result.get<std::string>());
            if(!word_res)
            {
                return std::unexpected(FetchError{
                    .kind = FetchError::Kind::RPC_MALFORMED,
                    .message = std::format("RPC '{}' returned invalid word: {}", method, word_res.error().message)
                });
            }
            return *word_res;
        }
    }

    std::expected<json, FetchError> curlTransport(
        const std::string & rpc_url,
        const json & request,
        const std::chrono::milliseconds timeout)
    {
        // curl takes fractional seconds
        const double timeout_s = static_cast<double>(timeout.count()) / 1000.0;

        std::vector<std::string> args{
            "-sS",
            "--max-time", std::format("{:.3f}", timeout_s),
            "-X", "POST",
            rpc_url,
            "-H", "Content-Type: application/json",
            "--data", _dump(request)
        };

        const auto [exit_code, output] = native::runProcess("curl", std::move(args));
        if(exit_code == CURL_EXIT_TIMEOUT)
        {
            return std::unexpected(FetchError{
                .kind = FetchError::Kind::TIMEOUT,
                .message = std::format("Request to {} timed out after {} ms", rpc_url, timeout.count())
            });
        }

        if(exit_code != 0)
        {
            return std::unexpected(FetchError{
                .kind = FetchError::Kind::TRANSPORT,
                .message = std::format("curl failed with code {}: {}", exit_code, output)
            });
        }

        json response = json::parse(output, nullptr, false);
        if(response.is_discarded())
        {
            return std::unexpected(FetchError{
                .kind = FetchError::Kind::RPC_MALFORMED,
                .message = std::format("Invalid JSON response: {}", output)
            });
        }

        return response;
    }

    EthClient::EthClient(ClientConfig cfg)
        : _cfg(std::move(cfg))
    {
        if(!_cfg.transport)
        {
            _cfg.transport = curlTransport;
        }
    }

    std::expected<std::uint64_t, FetchError> EthClient::blockNumber() const
    {
        const auto result = rpc("eth_blockNumber", json::array());
        if(!result)
        {
            return std::unexpected(result.error());
        }
        return _quantityResult("eth_blockNumber", *result);
    }

    std::expected<chain::Word, FetchError> EthClient::getStorageAt(
        const chain::Address & contract,
        const chain::StorageSlot & slot,
        const std::string & block_tag) const
    {
        const auto result = rpc("eth_getStorageAt", json::array({
            chain::toHex(contract),
            chain::toHex(slot),
            block_tag
        }));

        if(!result)
        {
            return std::unexpected(result.error());
        }
        return _wordResult("eth_getStorageAt", *result);
    }

    std::expected<chain::Word, FetchError> EthClient::getBlockHash(const std::uint64_t block_number) const
    {
        const auto result = rpc("eth_getBlockByNumber", json::array({utils::toHexQuantity(block_number), false}));
        if(!result)
        {
            return std::unexpected(result.error());
        }

        if(!result->is_object() || !result->contains("hash"))
        {
            return std::unexpected(FetchError{
                .kind = FetchError::Kind::RPC_MALFORMED,
                .message = std::format("Block {} not found", block_number)
            });
        }

        return _wordResult("eth_getBlockByNumber", (*result)["hash"]);
    }

    std::expected<std::uint64_t, FetchError> EthClient::chainId() const
    {
        const auto result = rpc("eth_chainId", json::array());
        if(!result)
        {
            return std::unexpected(result.error());
        }
        return _quantityResult("eth_chainId", *result);
    }

    std::expected<json, FetchError> EthClient::rpc(const std::string & method, json params) const
    {
        if(_cfg.rpc_url.empty())
        {
            return std::unexpected(FetchError{
                .kind = FetchError::Kind::INVALID_CONFIG,
                .message = "rpc_url is empty"
            });
        }

        const json request{
            {"jsonrpc", "2.0"},
            {"id", 1},
            {"method", method},
            {"params", std::move(params)}
        };

        spdlog::trace("RPC -> {}", _dump(request));

        auto response = _cfg.transport(_cfg.rpc_url, request, _cfg.timeout);
        if(!response)
        {
            return std::unexpected(response.error());
        }

        if(!response->is_object())
        {
            return std::unexpected(FetchError{
                .kind = FetchError::Kind::RPC_MALFORMED,
                .message = std::format("RPC '{}' response is not an object", method)
            });
        }

        if(response->contains("error"))
        {
            return std::unexpected(FetchError{
                .kind = FetchError::Kind::RPC_ERROR,
                .message = std::format("RPC '{}' error: {}", method, _dump((*response)["error"]))
            });
        }

        if(!response->contains("result"))
        {
            return std::unexpected(FetchError{
                .kind = FetchError::Kind::RPC_MALFORMED,
                .message = std::format("RPC '{}' response missing result field", method)
            });
        }

        return (*response)["result"];
    }
}
