#pragma once

#include <charconv>
#include <cstdint>
#include <expected>
#include <format>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#include <absl/container/flat_hash_map.h>

namespace pst::cmd
{
    struct CommandLineArgDef
    {
        enum class NArgs : std::uint8_t
        {
            Zero = 0,
            One,
            Many
        };

        enum class Type : std::uint8_t
        {
            Bool = 0,
            Int,
            String
        };

        std::string name;
        NArgs nargs = NArgs::Zero;
        Type type = Type::Bool;
        std::string description;
    };

    struct ArgError
    {
        enum class Kind : std::uint8_t
        {
            UNKNOWN = 0,
            UNKNOWN_ARGUMENT,
            MISSING_VALUE,
            INVALID_VALUE
        } kind = Kind::UNKNOWN;

        std::string message;
    };

    /**
     * @brief Minimal command line parser.
     *
     * Arguments are registered with addArg() and parsed once with parse().
     * Values are kept as strings and converted on access with getArg<T>(),
     * where T is bool, std::vector<std::int64_t> or std::vector<std::string>.
     */
    class ArgParser
    {
    public:
        ArgParser() = default;

        void addArg(std::string name, CommandLineArgDef::NArgs nargs, CommandLineArgDef::Type type, std::string description);

        std::expected<void, ArgError> parse(int argc, const char* const argv[]);

        bool contains(const std::string & name) const;

        template<class T>
        std::optional<T> getArg(const std::string & name) const
        {
            const auto it = _values.find(name);
            if(it == _values.end())
            {
                return std::nullopt;
            }

            if constexpr (std::is_same_v<T, bool>)
            {
                return true;
            }
            else if constexpr (std::is_same_v<T, std::vector<std::string>>)
            {
                return it->second;
            }
            else if constexpr (std::is_same_v<T, std::vector<std::int64_t>>)
            {
                std::vector<std::int64_t> out;
                out.reserve(it->second.size());
                for(const std::string & raw : it->second)
                {
                    std::int64_t value = 0;
                    const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
                    if(ec != std::errc{} || ptr != raw.data() + raw.size())
                    {
                        return std::nullopt;
                    }
                    out.push_back(value);
                }
                return out;
            }
            else
            {
                static_assert(!sizeof(T), "unsupported argument type");
            }
        }

        std::string constructHelpMessage() const;

    private:
        const CommandLineArgDef* _findDef(const std::string & name) const;

        std::vector<CommandLineArgDef> _defs;
        absl::flat_hash_map<std::string, std::vector<std::string>> _values;
    };
}

template <>
struct std::formatter<pst::cmd::ArgError::Kind> : std::formatter<std::string>
{
    auto format(const pst::cmd::ArgError::Kind & err, format_context & ctx) const
    {
        switch(err)
        {
            case pst::cmd::ArgError::Kind::UNKNOWN_ARGUMENT:
                return formatter<string>::format("Unknown argument", ctx);
            case pst::cmd::ArgError::Kind::MISSING_VALUE:
                return formatter<string>::format("Missing value", ctx);
            case pst::cmd::ArgError::Kind::INVALID_VALUE:
                return formatter<string>::format("Invalid value", ctx);
            default:
                return formatter<string>::format("Unknown", ctx);
        }
    }
};
