#pragma once

#include <chrono>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <unordered_map>

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "pir_state.hpp"

#ifndef PIR_STATE_TEST_BINARY_DIR
    #error "PIR_STATE_TEST_BINARY_DIR is not defined"
#endif

namespace pst::tests
{
    class UnitTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            spdlog::set_level(spdlog::level::warn);
        }

        void TearDown() override
        {
            spdlog::set_level(spdlog::level::info);
        }
    };

    inline std::filesystem::path buildPath()
    {
        return std::filesystem::path(PIR_STATE_TEST_BINARY_DIR);
    }

    /**
     * @brief Fresh, empty directory under the test binary directory.
     */
    inline std::filesystem::path makeTempPath(const std::string & test_name)
    {
        const std::string unique_suffix = std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
        const auto path = buildPath() / "tests" / "tmp" / (test_name + "_" + unique_suffix);

        std::error_code ec;
        std::filesystem::remove_all(path, ec);
        ec.clear();
        std::filesystem::create_directories(path, ec);
        EXPECT_FALSE(ec);

        return path;
    }

    /**
     * @brief Address whose last byte is `value`, other bytes zero.
     */
    inline chain::Address makeAddress(const std::uint8_t value)
    {
        chain::Address address{};
        address.bytes[19] = value;
        return address;
    }

    inline chain::Word makeWord(const std::uint64_t value)
    {
        return chain::encodeUint256Word(value);
    }

    /**
     * @brief JSON-RPC node answering from in-memory tables.
     *
     * Storage values are keyed by lower-case hex slot. Unknown slots read as zero.
     */
    struct MockRpcNode
    {
        std::string block_number_hex = "0x64";
        std::string chain_id_hex = "0xaa36a7";
        std::string block_hash_hex;
        std::unordered_map<std::string, std::string> storage;

        // slots answered with a JSON-RPC error
        std::unordered_map<std::string, std::string> storage_errors;

        std::mutex mutex;
        std::size_t block_number_calls = 0;
        std::size_t storage_calls = 0;
        std::string last_block_tag;

        std::expected<nlohmann::json, rpc::FetchError> call(const std::string &, const nlohmann::json & request, std::chrono::milliseconds)
        {
            std::lock_guard guard{mutex};

            const std::string method = request.value("method", "");
            const nlohmann::json & params = request["params"];

            if(method == "eth_blockNumber")
            {
                ++block_number_calls;
                return result(block_number_hex);
            }

            if(method == "eth_chainId")
            {
                return result(chain_id_hex);
            }

            if(method == "eth_getBlockByNumber")
            {
                if(block_hash_hex.empty())
                {
                    return result(nullptr);
                }
                return result(nlohmann::json{{"number", params[0]}, {"hash", block_hash_hex}});
            }

            if(method == "eth_getStorageAt")
            {
                ++storage_calls;
                const std::string slot = utils::toLower(params[1].get<std::string>());
                last_block_tag = params[2].get<std::string>();

                if(const auto it = storage_errors.find(slot); it != storage_errors.end())
                {
                    return nlohmann::json{
                        {"jsonrpc", "2.0"},
                        {"id", request.value("id", 1)},
                        {"error", {{"code", -32000}, {"message", it->second}}}
                    };
                }

                const auto it = storage.find(slot);
                return result(it == storage.end() ? std::string("0x0") : it->second);
            }

            return std::unexpected(rpc::FetchError{
                .kind = rpc::FetchError::Kind::TRANSPORT,
                .message = "unsupported method " + method
            });
        }

        rpc::RpcTransport transport()
        {
            return [this](const std::string & url, const nlohmann::json & request, std::chrono::milliseconds timeout)
            {
                return call(url, request, timeout);
            };
        }

        static nlohmann::json result(nlohmann::json value)
        {
            return nlohmann::json{
                {"jsonrpc", "2.0"},
                {"id", 1},
                {"result", std::move(value)}
            };
        }
    };
}
