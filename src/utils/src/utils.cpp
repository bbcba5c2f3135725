#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace pst::utils
{
    std::string currentTimestamp()
    {
        const auto zt{ std::chrono::zoned_time{
            std::chrono::current_zone(),
            std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now())}
            };
        std::string ts = std::format("{:%F-%H_%M_%S}", zt);
        return ts;
    }

    std::string toLower(std::string value)
    {
        std::ranges::transform(value, value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    std::string stripHexPrefix(const std::string & value)
    {
        if(value.rfind("0x", 0) == 0 || value.rfind("0X", 0) == 0)
        {
            return value.substr(2);
        }
        return value;
    }

    std::string toHexQuantity(const std::uint64_t value)
    {
        return std::format("0x{:x}", value);
    }

    std::optional<std::uint64_t> parseHexQuantity(const std::string & value)
    {
        if(value.empty())
        {
            return std::nullopt;
        }

        const bool is_hex = value.rfind("0x", 0) == 0 || value.rfind("0X", 0) == 0;
        const std::string digits = is_hex ? value.substr(2) : value;
        if(digits.empty())
        {
            return is_hex ? std::optional<std::uint64_t>{0} : std::nullopt;
        }

        std::uint64_t out = 0;
        const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), out, is_hex ? 16 : 10);
        if(ec != std::errc{} || ptr != digits.data() + digits.size())
        {
            return std::nullopt;
        }
        return out;
    }
}
