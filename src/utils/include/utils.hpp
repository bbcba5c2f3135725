#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <optional>
#include <string>

namespace pst::utils
{
    /**
     * @brief Local wall-clock time formatted for file names (YYYY-MM-DD-HH_MM_SS).
     */
    std::string currentTimestamp();

    std::string toLower(std::string value);

    std::string stripHexPrefix(const std::string & value);

    /**
     * @brief Encode an integer as a JSON-RPC quantity ("0x" + minimal lowercase hex).
     */
    std::string toHexQuantity(std::uint64_t value);

    /**
     * @brief Parse a JSON-RPC quantity.
     *
     * Accepts "0x"-prefixed hex or plain decimal. Values that do not fit 64 bits are rejected.
     */
    std::optional<std::uint64_t> parseHexQuantity(const std::string & value);
}
