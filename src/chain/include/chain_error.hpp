#pragma once

#include <cstdint>
#include <expected>
#include <format>
#include <string>

namespace pst::chain
{
    struct Error
    {
        enum class Kind : std::uint8_t
        {
            UNKNOWN = 0,
            INVALID_INPUT
        } kind = Kind::UNKNOWN;

        std::string message;
    };

    template<class T>
    using Result = std::expected<T, Error>;
}

template <>
struct std::formatter<pst::chain::Error::Kind> : std::formatter<std::string>
{
    auto format(const pst::chain::Error::Kind & err, format_context & ctx) const
    {
        switch(err)
        {
            case pst::chain::Error::Kind::INVALID_INPUT:
                return formatter<string>::format("Invalid input", ctx);
            default:
                return formatter<string>::format("Unknown", ctx);
        }
    }
};
