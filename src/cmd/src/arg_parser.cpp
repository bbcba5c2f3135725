#include "arg_parser.hpp"

#include <algorithm>

namespace pst::cmd
{
    namespace
    {
        bool _isOptionToken(const std::string & token)
        {
            if(token.size() < 2 || token[0] != '-')
            {
                return false;
            }
            // negative numbers are values, not options
            return !(token[1] >= '0' && token[1] <= '9');
        }

        bool _isInteger(const std::string & token)
        {
            std::int64_t value = 0;
            const auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
            return ec == std::errc{} && ptr == token.data() + token.size();
        }

        std::string _typeName(const CommandLineArgDef::Type type)
        {
            switch(type)
            {
                case CommandLineArgDef::Type::Int:      return "<int>";
                case CommandLineArgDef::Type::String:   return "<string>";
                default:                                return "";
            }
        }
    }

    void ArgParser::addArg(std::string name, CommandLineArgDef::NArgs nargs, CommandLineArgDef::Type type, std::string description)
    {
        _defs.push_back(CommandLineArgDef{
            .name = std::move(name),
            .nargs = nargs,
            .type = type,
            .description = std::move(description)
        });
    }

    const CommandLineArgDef* ArgParser::_findDef(const std::string & name) const
    {
        const auto it = std::ranges::find(_defs, name, &CommandLineArgDef::name);
        if(it == _defs.end())
        {
            return nullptr;
        }
        return &(*it);
    }

    std::expected<void, ArgError> ArgParser::parse(int argc, const char* const argv[])
    {
        _values.clear();

        int i = 1;
        while(i < argc)
        {
            const std::string token = argv[i];
            const CommandLineArgDef* def = _findDef(token);
            if(def == nullptr)
            {
                return std::unexpected(ArgError{
                    .kind = ArgError::Kind::UNKNOWN_ARGUMENT,
                    .message = std::format("Unknown argument '{}'", token)
                });
            }
            ++i;

            std::vector<std::string> & values = _values[def->name];

            if(def->nargs == CommandLineArgDef::NArgs::Zero)
            {
                continue;
            }

            std::size_t consumed = 0;
            while(i < argc && !_isOptionToken(argv[i]))
            {
                const std::string value = argv[i];
                if(def->type == CommandLineArgDef::Type::Int && !_isInteger(value))
                {
                    return std::unexpected(ArgError{
                        .kind = ArgError::Kind::INVALID_VALUE,
                        .message = std::format("Argument '{}' expects an integer, got '{}'", def->name, value)
                    });
                }

                values.push_back(value);
                ++consumed;
                ++i;

                if(def->nargs == CommandLineArgDef::NArgs::One)
                {
                    break;
                }
            }

            if(consumed == 0)
            {
                return std::unexpected(ArgError{
                    .kind = ArgError::Kind::MISSING_VALUE,
                    .message = std::format("Argument '{}' expects a value", def->name)
                });
            }
        }

        return {};
    }

    bool ArgParser::contains(const std::string & name) const
    {
        return _values.contains(name);
    }

    std::string ArgParser::constructHelpMessage() const
    {
        std::size_t width = 0;
        for(const CommandLineArgDef & def : _defs)
        {
            const std::string type_name = _typeName(def.type);
            width = std::max(width, def.name.size() + (type_name.empty() ? 0 : type_name.size() + 1));
        }

        std::string out = "Usage: pir-state [options]\n\nOptions:\n";
        for(const CommandLineArgDef & def : _defs)
        {
            std::string head = def.name;
            const std::string type_name = _typeName(def.type);
            if(!type_name.empty())
            {
                head += " " + type_name;
                if(def.nargs == CommandLineArgDef::NArgs::Many)
                {
                    head += "...";
                }
            }
            out += std::format("  {:<{}}  {}\n", head, width + 3, def.description);
        }
        return out;
    }
}
