#pragma once

#include <cstdint>
#include <format>
#include <string>

namespace pst::state
{
    struct FormatError
    {
        enum class Kind : std::uint8_t
        {
            UNKNOWN = 0,
            IO_ERROR,
            TRUNCATED,
            BAD_MAGIC,
            UNSUPPORTED_VERSION,
            UNSUPPORTED_ENTRY_SIZE,
            SIZE_MISMATCH,
            COUNT_OVERFLOW,
            UNSORTED,
            INDEX_MISMATCH
        } kind = Kind::UNKNOWN;

        std::string message;
    };
}

template <>
struct std::formatter<pst::state::FormatError::Kind> : std::formatter<std::string>
{
    auto format(const pst::state::FormatError::Kind & err, format_context & ctx) const
    {
        switch(err)
        {
            case pst::state::FormatError::Kind::IO_ERROR:
                return formatter<string>::format("I/O error", ctx);
            case pst::state::FormatError::Kind::TRUNCATED:
                return formatter<string>::format("Truncated data", ctx);
            case pst::state::FormatError::Kind::BAD_MAGIC:
                return formatter<string>::format("Bad magic", ctx);
            case pst::state::FormatError::Kind::UNSUPPORTED_VERSION:
                return formatter<string>::format("Unsupported version", ctx);
            case pst::state::FormatError::Kind::UNSUPPORTED_ENTRY_SIZE:
                return formatter<string>::format("Unsupported entry size", ctx);
            case pst::state::FormatError::Kind::SIZE_MISMATCH:
                return formatter<string>::format("Size mismatch", ctx);
            case pst::state::FormatError::Kind::COUNT_OVERFLOW:
                return formatter<string>::format("Count overflow", ctx);
            case pst::state::FormatError::Kind::UNSORTED:
                return formatter<string>::format("Unsorted", ctx);
            case pst::state::FormatError::Kind::INDEX_MISMATCH:
                return formatter<string>::format("Index mismatch", ctx);
            default:
                return formatter<string>::format("Unknown", ctx);
        }
    }
};
